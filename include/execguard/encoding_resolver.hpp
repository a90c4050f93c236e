#pragma once

#include <QString>

#include <functional>
#include <optional>

namespace execguard {

// One probe per precedence level. A probe that returns nothing, throws a
// std::exception, or names an encoding Qt cannot convert is skipped.
struct EncodingProbes {
    using Probe = std::function<std::optional<QString>()>;

    Probe streamOverride;
    Probe utf8Mode;
    Probe localePreferred;
    Probe localeCodeset;
    Probe filesystem;

    // EXECGUARD_IO_ENCODING, EXECGUARD_UTF8=1 or the C/POSIX locale, nl_langinfo(CODESET),
    // the codeset suffix of LC_ALL/LC_CTYPE/LANG, and the Qt file name codec.
    static EncodingProbes system();
};

class EncodingResolver {
public:
    explicit EncodingResolver(EncodingProbes probes = EncodingProbes::system());

    // An explicit streamHint wins over every probe; lastResort is used when
    // no probe answers.
    [[nodiscard]] QString resolve(
        const std::optional<QString>& streamHint,
        const QString& lastResort) const;

private:
    EncodingProbes probes_;
};

QString resolvePipeEncoding(
    const std::optional<QString>& streamHint,
    const QString& lastResort);

}  // namespace execguard
