#pragma once

#include "core/ranking/feature_schema.h"

#include <QDateTime>
#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace st {

// One logged impression: the features a trip was shown with, where it was
// shown, and whether it was clicked. Read-only for the core.
struct TrainingExample {
    QString sessionId;
    int64_t tripId = 0;
    FeatureVector features;
    int position = 0;  // 0-indexed rank shown
    bool clicked = false;
    std::optional<double> dwellSeconds;
    std::optional<bool> converted;
    QDateTime timestamp;
    bool botFlagged = false;

    double label() const { return clicked ? 1.0 : 0.0; }
    // Early positions weigh more; corrects for position bias.
    double positionWeight() const { return 1.0 / (1.0 + static_cast<double>(position)); }
};

using TrainingBatch = std::vector<TrainingExample>;

} // namespace st
