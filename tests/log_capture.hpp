#pragma once

#include <QList>
#include <QLoggingCategory>
#include <QString>
#include <QtGlobal>

namespace execguard {
namespace test {

// Records every message logged while alive. The execguard categories are
// switched fully on so a system logging config cannot hide diagnostics.
class LogCapture {
public:
    LogCapture() {
        active() = this;
        previous_ = qInstallMessageHandler(&LogCapture::handle);
        QLoggingCategory::setFilterRules("execguard.*=true");
    }

    ~LogCapture() {
        QLoggingCategory::setFilterRules(QString());
        qInstallMessageHandler(previous_);
        active() = nullptr;
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    [[nodiscard]] bool contains(QtMsgType type, const char* category, const QString& fragment) const {
        for (const Entry& entry : entries_) {
            if (entry.type == type && entry.category == QLatin1String(category)
                && entry.message.contains(fragment)) {
                return true;
            }
        }
        return false;
    }

private:
    struct Entry {
        QtMsgType type;
        QString category;
        QString message;
    };

    static LogCapture*& active() {
        static LogCapture* capture = nullptr;
        return capture;
    }

    static void handle(QtMsgType type, const QMessageLogContext& context, const QString& message) {
        if (LogCapture* capture = active()) {
            const char* category = context.category != nullptr ? context.category : "";
            capture->entries_.append({type, QString::fromLatin1(category), message});
        }
    }

    QList<Entry> entries_;
    QtMessageHandler previous_ = nullptr;
};

}  // namespace test
}  // namespace execguard
