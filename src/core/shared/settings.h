#pragma once

#include <QString>
#include <cstdint>
#include <optional>

namespace st {

struct ServingSettings {
    int workerCount = 4;
    int defaultTopK = 30;
    std::optional<double> minScore;  // unset keeps every scored trip
    bool prefilterEnabled = true;
};

struct CacheSettings {
    int preferenceCacheMaxEntries = 1024;
    int preferenceCacheTtlSeconds = 6 * 3600;
    int scoreCacheMaxEntries = 20000;
    int scoreCacheTtlSeconds = 20 * 60;
};

struct ExtractionSettings {
    int themeFullMatchThreshold = 2;
    int difficultyTolerance = 1;
    int durationGoodDays = 4;
    int departingSoonDays = 30;
    double budgetGoodRatio = 1.1;
    double budgetAcceptableRatio = 1.2;
};

// Inventory hard filters and the relaxed pass that tops up short result lists.
struct FilterSettings {
    int difficultyTolerance = 1;
    double budgetMaxMultiplier = 1.3;
    int durationHardFilterDays = 7;   // days outside the requested range
    int maxYearsAhead = 1;

    bool relaxedEnabled = true;
    int minResultsThreshold = 5;      // relax when primary results <= this
    int relaxedDifficultyTolerance = 2;
    double relaxedBudgetMultiplier = 1.5;
    int relaxedDateMonths = 2;
    double relaxedPenalty = -15.0;
    double relaxedTripTypePenalty = -10.0;
};

struct TrainingSettings {
    int windowDays = 30;
    double validationFraction = 0.2;
    int epochs = 25;
    double learningRate = 0.05;
    int minExamples = 200;
    double promotionTolerance = 0.0;  // allowed validation-loss regression
    double maxDwellSeconds = 21600.0;
    int scheduleIntervalHours = 24;
};

struct StoreSettings {
    QString databasePath;
    int historyRetentionDays = 90;
};

struct EngineSettings {
    ServingSettings serving;
    CacheSettings cache;
    ExtractionSettings extraction;
    FilterSettings filters;
    TrainingSettings training;
    StoreSettings store;
};

} // namespace st
