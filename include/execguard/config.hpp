#pragma once

#include <QJsonObject>
#include <QString>

#include "execguard/errors.hpp"

namespace execguard {

struct ExecguardConfig {
    QString fallbackEncoding = "UTF-8";
    // 0 means no timeout.
    qint64 defaultTimeoutMs = 0;
    bool warnOnMissingTimeout = true;
    QString loggingRules;
    QString telemetryExportPath;

    static ExecguardConfig fromJson(const QJsonObject& object);
    [[nodiscard]] QJsonObject toJson() const;
};

struct ConfigLoadResult {
    ExecguardConfig config;
    ValidationResult status;

    [[nodiscard]] bool ok() const { return status.ok(); }
};

ConfigLoadResult loadConfig(const QString& filePath);

// Installs the configured logging filter rules, if any.
void applyLoggingRules(const ExecguardConfig& config);

}  // namespace execguard
