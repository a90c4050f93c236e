#include "execguard/input_sanitizer.hpp"

#include <QRegularExpression>
#include <QStringList>

#include "execguard/encoding.hpp"

namespace execguard {

namespace {

struct PatternScan {
    bool valid = true;
    QString pattern;
    QStringList matches;
};

PatternScan scan(const QString& text, const QString& pattern) {
    PatternScan out;
    out.pattern = pattern;
    const QRegularExpression regex(pattern, QRegularExpression::UseUnicodePropertiesOption);
    if (!regex.isValid()) {
        out.valid = false;
        return out;
    }
    QRegularExpressionMatchIterator it = regex.globalMatch(text);
    while (it.hasNext()) {
        out.matches.append(it.next().captured(0));
    }
    return out;
}

QString invalidCharsMessage(const QString& text, const PatternScan& result) {
    return QString("Argument \"%1\" contains invalid chars :\"['%2']\" (pattern:\"%3\")")
        .arg(text, result.matches.join("', '"), result.pattern);
}

QString badPatternMessage(const QString& pattern) {
    return QString("Wrong parametrization of function. Invalid character class pattern \"%1\".")
        .arg(pattern);
}

}  // namespace

ValidationResult sanitizeInput(
    const QString& text,
    const QString& encoding,
    const CharacterSet& whitelist,
    const CharacterSet& blacklist) {
    if (!isEncodingSupported(encoding)) {
        return ValidationResult::failure(
            ErrorKind::EncodingError,
            QString("Unknown or unsupported encoding \"%1\".").arg(encoding));
    }
    if (!canEncode(text, encoding)) {
        return ValidationResult::failure(
            ErrorKind::EncodingError,
            QString("Argument \"%1\" contains characters not representable in encoding \"%2\".")
                .arg(text, encoding));
    }

    if (!blacklist.isEmpty()) {
        const PatternScan forbidden = scan(text, "[" + blacklist.classBody() + "]+");
        if (!forbidden.valid) {
            return ValidationResult::failure(
                ErrorKind::BadParametrization, badPatternMessage(forbidden.pattern));
        }
        if (!forbidden.matches.isEmpty()) {
            return ValidationResult::failure(
                ErrorKind::ForbiddenCharacter, invalidCharsMessage(text, forbidden));
        }
    }

    if (!whitelist.isEmpty()) {
        const PatternScan disallowed = scan(text, "[^" + whitelist.classBody() + "]+");
        if (!disallowed.valid) {
            return ValidationResult::failure(
                ErrorKind::BadParametrization, badPatternMessage(disallowed.pattern));
        }
        if (!disallowed.matches.isEmpty()) {
            return ValidationResult::failure(
                ErrorKind::DisallowedCharacter, invalidCharsMessage(text, disallowed));
        }
    }

    return ValidationResult::success();
}

}  // namespace execguard
