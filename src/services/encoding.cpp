#include "execguard/encoding.hpp"

#include <QHash>
#include <QSet>
#include <QStringDecoder>
#include <QStringEncoder>

namespace {

constexpr const char* kAscii = "US-ASCII";

QString aliasKey(const QString& name) {
    QString key = name.trimmed().toLower();
    key.remove('-');
    key.remove('_');
    return key;
}

const QHash<QString, QString>& aliasTable() {
    static const QHash<QString, QString> table = {
        {"utf8", "UTF-8"},
        {"cp65001", "UTF-8"},
        {"utf16", "UTF-16"},
        {"utf16le", "UTF-16LE"},
        {"utf16be", "UTF-16BE"},
        {"utf32", "UTF-32"},
        {"utf32le", "UTF-32LE"},
        {"utf32be", "UTF-32BE"},
        {"latin1", "ISO-8859-1"},
        {"l1", "ISO-8859-1"},
        {"iso88591", "ISO-8859-1"},
        {"iso8859.1", "ISO-8859-1"},
        {"ascii", kAscii},
        {"usascii", kAscii},
        {"646", kAscii},
        {"ansix3.41968", kAscii},
        {"ansix3.4.1968", kAscii},
    };
    return table;
}

bool isAscii(const QString& canonicalName) {
    return canonicalName == QLatin1String(kAscii);
}

}  // namespace

namespace execguard {

QString normalizeEncodingName(const QString& name) {
    const auto it = aliasTable().constFind(aliasKey(name));
    if (it != aliasTable().constEnd()) {
        return it.value();
    }
    return name.trimmed();
}

bool isEncodingSupported(const QString& name) {
    const QString canonical = normalizeEncodingName(name);
    if (canonical.isEmpty()) {
        return false;
    }
    if (isAscii(canonical)) {
        return true;
    }
    const QByteArray rawName = canonical.toLatin1();
    return QStringEncoder(rawName.constData()).isValid();
}

bool canEncode(const QString& text, const QString& name) {
    const QString canonical = normalizeEncodingName(name);
    if (isAscii(canonical)) {
        for (const QChar c : text) {
            if (c.unicode() > 0x7f) {
                return false;
            }
        }
        return true;
    }

    const QByteArray rawName = canonical.toLatin1();
    QStringEncoder encoder(rawName.constData());
    if (!encoder.isValid()) {
        return false;
    }
    const QByteArray encoded = encoder(text);
    Q_UNUSED(encoded);
    return !encoder.hasError();
}

QString decodeLossy(const QByteArray& bytes, const QString& name) {
    const QString canonical = normalizeEncodingName(name);
    if (isAscii(canonical)) {
        QString out;
        out.reserve(bytes.size());
        for (const char byte : bytes) {
            const auto value = static_cast<unsigned char>(byte);
            out.append(value > 0x7f ? QChar(QChar::ReplacementCharacter) : QChar(char16_t(value)));
        }
        return out;
    }

    const QByteArray rawName = canonical.toLatin1();
    QStringDecoder decoder(rawName.constData());
    if (!decoder.isValid()) {
        return QString::fromUtf8(bytes);
    }
    return decoder(bytes);
}

bool isLegacyConsoleCodePage(const QString& name) {
    static const QSet<QString> legacy = {
        "cp437", "cp850", "cp852", "cp866",
        "cp1250", "cp1251", "cp1252", "cp1253", "cp1254",
        "cp1255", "cp1256", "cp1257", "cp1258",
        "windows1250", "windows1251", "windows1252", "windows1253", "windows1254",
        "windows1255", "windows1256", "windows1257", "windows1258",
    };
    return legacy.contains(aliasKey(name));
}

}  // namespace execguard
