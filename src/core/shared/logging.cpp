#include "core/shared/logging.h"

Q_LOGGING_CATEGORY(stCore, "smarttrip.core")
Q_LOGGING_CATEGORY(stRanking, "smarttrip.ranking")
Q_LOGGING_CATEGORY(stCache, "smarttrip.cache")
Q_LOGGING_CATEGORY(stLearning, "smarttrip.learning")
Q_LOGGING_CATEGORY(stStore, "smarttrip.store")
