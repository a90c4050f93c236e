#include "execguard/config.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QLoggingCategory>

#include <algorithm>
#include <limits>

#include "execguard/logging.hpp"

namespace execguard {

ExecguardConfig ExecguardConfig::fromJson(const QJsonObject& object) {
    ExecguardConfig config;
    const QJsonValue encoding = object.value("fallback_encoding");
    if (encoding.isString() && !encoding.toString().trimmed().isEmpty()) {
        config.fallbackEncoding = encoding.toString().trimmed();
    }
    const QJsonValue timeout = object.value("default_timeout_ms");
    if (timeout.isDouble()) {
        // QProcess waits take an int, so longer timeouts are capped there.
        // Any negative value stays negative for loadConfig() to reject.
        const double ms = timeout.toDouble();
        config.defaultTimeoutMs = ms < 0
            ? -1
            : static_cast<qint64>(std::min(ms, double(std::numeric_limits<int>::max())));
    }
    const QJsonValue warn = object.value("warn_on_missing_timeout");
    if (warn.isBool()) {
        config.warnOnMissingTimeout = warn.toBool();
    }
    const QJsonValue rules = object.value("logging_rules");
    if (rules.isString()) {
        config.loggingRules = rules.toString();
    }
    const QJsonValue exportPath = object.value("telemetry_export_path");
    if (exportPath.isString()) {
        config.telemetryExportPath = exportPath.toString();
    }
    return config;
}

QJsonObject ExecguardConfig::toJson() const {
    return {
        {"fallback_encoding", fallbackEncoding},
        {"default_timeout_ms", static_cast<double>(defaultTimeoutMs)},
        {"warn_on_missing_timeout", warnOnMissingTimeout},
        {"logging_rules", loggingRules},
        {"telemetry_export_path", telemetryExportPath},
    };
}

ConfigLoadResult loadConfig(const QString& filePath) {
    ConfigLoadResult result;
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        result.status = ValidationResult::failure(
            ErrorKind::NotFound,
            QString("Failed to read config file \"%1\".").arg(filePath));
        return result;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (!doc.isObject()) {
        result.status = ValidationResult::failure(
            ErrorKind::BadParametrization,
            QString("Config file \"%1\" is not a valid JSON object: %2")
                .arg(filePath, parseError.errorString()));
        return result;
    }

    result.config = ExecguardConfig::fromJson(doc.object());
    if (result.config.defaultTimeoutMs < 0) {
        result.status = ValidationResult::failure(
            ErrorKind::BadParametrization,
            QString("Config file \"%1\": default_timeout_ms must not be negative.").arg(filePath));
        return result;
    }
    qCDebug(lcConfig) << "Loaded config from" << filePath;
    return result;
}

void applyLoggingRules(const ExecguardConfig& config) {
    if (config.loggingRules.trimmed().isEmpty()) {
        return;
    }
    QLoggingCategory::setFilterRules(config.loggingRules);
}

}  // namespace execguard
