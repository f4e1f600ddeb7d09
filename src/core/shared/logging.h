#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(oxCore)
Q_DECLARE_LOGGING_CATEGORY(oxFs)
Q_DECLARE_LOGGING_CATEGORY(oxIndex)
Q_DECLARE_LOGGING_CATEGORY(oxEmbed)
Q_DECLARE_LOGGING_CATEGORY(oxQuery)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
