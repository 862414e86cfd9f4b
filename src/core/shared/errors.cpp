#include "core/shared/errors.h"

namespace st {

QString errorKindToString(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::InvalidPreferences:       return QStringLiteral("invalid_preferences");
    case ErrorKind::SchemaMismatch:           return QStringLiteral("schema_mismatch");
    case ErrorKind::InsufficientTrainingData: return QStringLiteral("insufficient_training_data");
    case ErrorKind::Divergence:               return QStringLiteral("divergence");
    case ErrorKind::CacheUnavailable:         return QStringLiteral("cache_unavailable");
    case ErrorKind::Cancelled:                return QStringLiteral("cancelled");
    case ErrorKind::UnknownVersion:           return QStringLiteral("unknown_version");
    case ErrorKind::Persistence:              return QStringLiteral("persistence");
    case ErrorKind::TrainingInProgress:       return QStringLiteral("training_in_progress");
    case ErrorKind::StaleCandidate:           return QStringLiteral("stale_candidate");
    case ErrorKind::InventoryUnavailable:     return QStringLiteral("inventory_unavailable");
    }
    return QStringLiteral("unknown");
}

bool fail(Error* errorOut, ErrorKind kind, const QString& message)
{
    if (errorOut) {
        errorOut->kind = kind;
        errorOut->message = message;
    }
    return false;
}

QString errorToString(const Error& error)
{
    if (error.message.isEmpty()) {
        return errorKindToString(error.kind);
    }
    return QStringLiteral("%1: %2").arg(errorKindToString(error.kind), error.message);
}

} // namespace st
