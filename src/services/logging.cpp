#include "execguard/logging.hpp"

Q_LOGGING_CATEGORY(lcInput, "execguard.input")
Q_LOGGING_CATEGORY(lcPath, "execguard.path")
Q_LOGGING_CATEGORY(lcEncoding, "execguard.encoding")
Q_LOGGING_CATEGORY(lcProcess, "execguard.process")
Q_LOGGING_CATEGORY(lcConfig, "execguard.config")
