#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcInput)
Q_DECLARE_LOGGING_CATEGORY(lcPath)
Q_DECLARE_LOGGING_CATEGORY(lcEncoding)
Q_DECLARE_LOGGING_CATEGORY(lcProcess)
Q_DECLARE_LOGGING_CATEGORY(lcConfig)
