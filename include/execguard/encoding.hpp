#pragma once

#include <QByteArray>
#include <QString>

namespace execguard {

// Maps common aliases ("utf8", "latin1", "ANSI_X3.4-1968", ...) onto one
// canonical spelling. Unknown names are returned trimmed.
QString normalizeEncodingName(const QString& name);

[[nodiscard]] bool isEncodingSupported(const QString& name);

// Strict check: false if any character of text has no representation in
// the encoding, or if the encoding is unsupported.
[[nodiscard]] bool canEncode(const QString& text, const QString& name);

// Unmappable byte sequences become U+FFFD. Falls back to UTF-8 for an
// unsupported encoding name.
QString decodeLossy(const QByteArray& bytes, const QString& name);

// Windows/DOS console code pages that are known to mis-render output.
[[nodiscard]] bool isLegacyConsoleCodePage(const QString& name);

}  // namespace execguard
