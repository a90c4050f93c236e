#pragma once

#include <QString>

#include "execguard/errors.hpp"

namespace execguard {

// Body of a regular-expression character class, e.g. "\w\.\-_" or ";&#".
// Matched with Unicode properties, so "\w" covers non-ASCII letters too.
class CharacterSet {
public:
    CharacterSet() = default;
    explicit CharacterSet(const QString& classBody)
        : classBody_(classBody) {}

    [[nodiscard]] bool isEmpty() const { return classBody_.isEmpty(); }
    [[nodiscard]] const QString& classBody() const { return classBody_; }

private:
    QString classBody_;
};

// Checks encoding, then blacklist, then whitelist. Empty sets are skipped.
ValidationResult sanitizeInput(
    const QString& text,
    const QString& encoding,
    const CharacterSet& whitelist,
    const CharacterSet& blacklist);

}  // namespace execguard
