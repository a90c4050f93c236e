#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QMutex>
#include <QString>

#include "execguard/errors.hpp"

namespace execguard {

// Process-wide diagnostics sink. Nothing in the library depends on what is
// recorded here.
class Telemetry final {
public:
    static Telemetry& instance();

    void incrementCounter(const QString& key, qint64 delta = 1);
    void recordDurationMs(const QString& key, qint64 durationMs);
    void recordEvent(const QString& type, const QJsonObject& payload = {});
    void recordRejection(const QString& stage, const ValidationResult& result);

    [[nodiscard]] qint64 counter(const QString& key) const;
    [[nodiscard]] QJsonObject snapshot() const;
    QJsonObject exportToFile(const QString& filePath) const;
    void reset();

private:
    Telemetry() = default;

    void trimEventsLocked();

    mutable QMutex mutex_;
    QJsonObject counters_;
    QJsonObject durations_;
    QJsonArray events_;

    int maxEvents_ = 1000;
};

}  // namespace execguard
