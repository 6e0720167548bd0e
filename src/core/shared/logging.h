#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(ddCore)
Q_DECLARE_LOGGING_CATEGORY(ddStore)
Q_DECLARE_LOGGING_CATEGORY(ddIndex)
Q_DECLARE_LOGGING_CATEGORY(ddSuggest)
Q_DECLARE_LOGGING_CATEGORY(ddPrivacy)
Q_DECLARE_LOGGING_CATEGORY(ddIpc)

#define LOG_DEBUG(cat, ...) qCDebug(cat, __VA_ARGS__)
#define LOG_INFO(cat, ...)  qCInfo(cat, __VA_ARGS__)
#define LOG_WARN(cat, ...)  qCWarning(cat, __VA_ARGS__)
#define LOG_ERROR(cat, ...) qCCritical(cat, __VA_ARGS__)
