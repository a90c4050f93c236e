#include "execguard/encoding_resolver.hpp"

#include <QtGlobal>

#include <cerrno>
#include <exception>
#include <system_error>
#include <utility>

#ifdef Q_OS_UNIX
#include <langinfo.h>
#include <locale.h>
#endif

#include "execguard/encoding.hpp"
#include "execguard/logging.hpp"

namespace execguard {

namespace {

std::optional<QString> nonEmpty(const QString& value) {
    const QString trimmed = value.trimmed();
    if (trimmed.isEmpty()) {
        return std::nullopt;
    }
    return trimmed;
}

std::optional<QString> ioEncodingOverride() {
    // "name:errors" is accepted; the error handler part is ignored.
    const QString value = qEnvironmentVariable("EXECGUARD_IO_ENCODING");
    return nonEmpty(value.section(':', 0, 0));
}

// Same lookup order as setlocale(LC_CTYPE, ""); nothing set means "C".
bool cLocaleInEffect() {
    for (const char* name : {"LC_ALL", "LC_CTYPE", "LANG"}) {
        const QString value = qEnvironmentVariable(name);
        if (!value.isEmpty()) {
            return value == "C" || value == "POSIX";
        }
    }
    return true;
}

// On by EXECGUARD_UTF8=1 and implied by the C/POSIX locale, whose ASCII
// codeset would turn all other output into replacement characters.
// EXECGUARD_UTF8=0 turns it off.
std::optional<QString> utf8ModeFlag() {
    const QString flag = qEnvironmentVariable("EXECGUARD_UTF8").trimmed();
    if (flag == "0") {
        return std::nullopt;
    }
    if (flag == "1" || cLocaleInEffect()) {
        return QString("UTF-8");
    }
    return std::nullopt;
}

std::optional<QString> environmentLocaleCodeset() {
#ifdef Q_OS_UNIX
    locale_t loc = ::newlocale(LC_CTYPE_MASK, "", static_cast<locale_t>(nullptr));
    if (loc == static_cast<locale_t>(nullptr)) {
        throw std::system_error(errno, std::generic_category(), "newlocale");
    }
    const QString codeset = QString::fromLatin1(::nl_langinfo_l(CODESET, loc));
    ::freelocale(loc);
    return nonEmpty(codeset);
#else
    return std::nullopt;
#endif
}

std::optional<QString> localeVariableCodeset() {
    for (const char* name : {"LC_ALL", "LC_CTYPE", "LANG"}) {
        const QString value = qEnvironmentVariable(name);
        if (value.isEmpty()) {
            continue;
        }
        // language_TERRITORY.codeset@modifier
        const int dot = value.indexOf('.');
        if (dot < 0) {
            return std::nullopt;
        }
        return nonEmpty(value.mid(dot + 1).section('@', 0, 0));
    }
    return std::nullopt;
}

std::optional<QString> filesystemEncoding() {
    // Qt 6 converts file names as UTF-8 on every Unix.
    return QString("UTF-8");
}

std::optional<QString> ask(const EncodingProbes::Probe& probe, const char* level) {
    if (!probe) {
        return std::nullopt;
    }
    try {
        const std::optional<QString> answer = probe();
        if (answer && !isEncodingSupported(*answer)) {
            qCDebug(lcEncoding) << "Ignoring unsupported encoding" << *answer << "from" << level;
            return std::nullopt;
        }
        return answer;
    } catch (const std::exception& error) {
        qCDebug(lcEncoding) << "Encoding probe" << level << "failed:" << error.what();
        return std::nullopt;
    }
}

}  // namespace

EncodingProbes EncodingProbes::system() {
    EncodingProbes probes;
    probes.streamOverride = ioEncodingOverride;
    probes.utf8Mode = utf8ModeFlag;
    probes.localePreferred = environmentLocaleCodeset;
    probes.localeCodeset = localeVariableCodeset;
    probes.filesystem = filesystemEncoding;
    return probes;
}

EncodingResolver::EncodingResolver(EncodingProbes probes)
    : probes_(std::move(probes)) {}

QString EncodingResolver::resolve(
    const std::optional<QString>& streamHint,
    const QString& lastResort) const {
    std::optional<QString> answer;
    if (streamHint && isEncodingSupported(*streamHint)) {
        answer = streamHint;
    }
    if (!answer) {
        answer = ask(probes_.streamOverride, "stream override");
    }
    if (!answer) {
        answer = ask(probes_.utf8Mode, "utf-8 mode");
    }
    if (!answer) {
        answer = ask(probes_.localePreferred, "locale preferred encoding");
    }
    if (!answer) {
        answer = ask(probes_.localeCodeset, "locale codeset");
    }
    if (!answer) {
        answer = ask(probes_.filesystem, "filesystem encoding");
    }

    const QString resolved = normalizeEncodingName(answer ? *answer : lastResort);
    if (isLegacyConsoleCodePage(resolved)) {
        qCWarning(lcEncoding) << "Pipe encoding" << resolved
                              << "is a legacy console code page and may mis-render output.";
    }
    qCDebug(lcEncoding) << "Resolved pipe encoding:" << resolved;
    return resolved;
}

QString resolvePipeEncoding(
    const std::optional<QString>& streamHint,
    const QString& lastResort) {
    return EncodingResolver().resolve(streamHint, lastResort);
}

}  // namespace execguard
