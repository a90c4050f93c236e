#include <gtest/gtest.h>

#include <QFile>
#include <QJsonObject>
#include <QTemporaryDir>

#include <limits>

#include "execguard/config.hpp"

using execguard::ErrorKind;
using execguard::ExecguardConfig;

namespace {

QString writeFile(const QTemporaryDir& dir, const QString& name, const QByteArray& content) {
    const QString path = dir.filePath(name);
    QFile file(path);
    if (file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        file.write(content);
    }
    return path;
}

}  // namespace

TEST(Config, DefaultsWithoutKeys) {
    const ExecguardConfig config = ExecguardConfig::fromJson({});
    EXPECT_EQ(config.fallbackEncoding, QString("UTF-8"));
    EXPECT_EQ(config.defaultTimeoutMs, 0);
    EXPECT_TRUE(config.warnOnMissingTimeout);
    EXPECT_TRUE(config.loggingRules.isEmpty());
}

TEST(Config, ReadsKnownKeysAndIgnoresWrongTypes) {
    const ExecguardConfig config = ExecguardConfig::fromJson({
        {"fallback_encoding", "latin1"},
        {"default_timeout_ms", 2500},
        {"warn_on_missing_timeout", "no"},
        {"logging_rules", "execguard.*.debug=true"},
        {"unknown", 1},
    });
    EXPECT_EQ(config.fallbackEncoding, QString("latin1"));
    EXPECT_EQ(config.defaultTimeoutMs, 2500);
    EXPECT_TRUE(config.warnOnMissingTimeout);
    EXPECT_EQ(config.loggingRules, QString("execguard.*.debug=true"));
    EXPECT_EQ(ExecguardConfig::fromJson(config.toJson()).defaultTimeoutMs, 2500);
}

TEST(Config, OutOfRangeTimeoutsAreClamped) {
    EXPECT_EQ(ExecguardConfig::fromJson({{"default_timeout_ms", 1e30}}).defaultTimeoutMs,
              std::numeric_limits<int>::max());
    EXPECT_LT(ExecguardConfig::fromJson({{"default_timeout_ms", -1e30}}).defaultTimeoutMs, 0);
    EXPECT_LT(ExecguardConfig::fromJson({{"default_timeout_ms", -0.5}}).defaultTimeoutMs, 0);

    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const auto huge = execguard::loadConfig(writeFile(dir, "huge.json", R"({"default_timeout_ms": 1e30})"));
    ASSERT_TRUE(huge.ok()) << huge.status.message.toStdString();
    EXPECT_EQ(huge.config.defaultTimeoutMs, std::numeric_limits<int>::max());

    const auto negative = execguard::loadConfig(writeFile(dir, "negative.json", R"({"default_timeout_ms": -1e30})"));
    EXPECT_EQ(negative.status.kind, ErrorKind::BadParametrization);
}

TEST(Config, LoadsFromFile) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = writeFile(dir, "execguard.json",
        R"({"default_timeout_ms": 750, "warn_on_missing_timeout": false})");
    const auto loaded = execguard::loadConfig(path);
    ASSERT_TRUE(loaded.ok()) << loaded.status.message.toStdString();
    EXPECT_EQ(loaded.config.defaultTimeoutMs, 750);
    EXPECT_FALSE(loaded.config.warnOnMissingTimeout);
}

TEST(Config, ReportsLoadFailures) {
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    EXPECT_EQ(execguard::loadConfig(dir.filePath("missing.json")).status.kind, ErrorKind::NotFound);
    EXPECT_EQ(execguard::loadConfig(writeFile(dir, "list.json", "[1, 2]")).status.kind,
              ErrorKind::BadParametrization);
    EXPECT_EQ(execguard::loadConfig(writeFile(dir, "broken.json", "{not json")).status.kind,
              ErrorKind::BadParametrization);
    EXPECT_EQ(execguard::loadConfig(writeFile(dir, "negative.json", R"({"default_timeout_ms": -5})")).status.kind,
              ErrorKind::BadParametrization);
}
