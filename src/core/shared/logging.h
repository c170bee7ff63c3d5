#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(dqCore)
Q_DECLARE_LOGGING_CATEGORY(dqIndex)
Q_DECLARE_LOGGING_CATEGORY(dqEmbedding)
Q_DECLARE_LOGGING_CATEGORY(dqExtraction)
Q_DECLARE_LOGGING_CATEGORY(dqRanking)
Q_DECLARE_LOGGING_CATEGORY(dqGeneration)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
