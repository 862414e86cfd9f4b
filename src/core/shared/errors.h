#pragma once

#include <QString>

namespace st {

// Failure kinds shared by the serving and training paths.
enum class ErrorKind {
    InvalidPreferences,       // caller-fixable, never retried
    SchemaMismatch,           // extractor and weight schema disagree
    InsufficientTrainingData,
    Divergence,               // non-finite weights after an update
    CacheUnavailable,         // internal only, never surfaced by rank()
    Cancelled,
    UnknownVersion,
    Persistence,
    TrainingInProgress,
    StaleCandidate,           // active weights changed during a training run
    InventoryUnavailable,     // inventory could not be read or decoded
};

QString errorKindToString(ErrorKind kind);

struct Error {
    ErrorKind kind = ErrorKind::InvalidPreferences;
    QString message;
};

// Fills *errorOut when non-null. Always returns false so call sites can
// `return fail(...)` from bool functions.
bool fail(Error* errorOut, ErrorKind kind, const QString& message);

QString errorToString(const Error& error);

} // namespace st
