#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(stCore)
Q_DECLARE_LOGGING_CATEGORY(stRanking)
Q_DECLARE_LOGGING_CATEGORY(stCache)
Q_DECLARE_LOGGING_CATEGORY(stLearning)
Q_DECLARE_LOGGING_CATEGORY(stStore)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
