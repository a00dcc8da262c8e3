#include "log.hpp"

#include <array>
#include <cassert>
#include <ctime>

#include <unistd.h>

namespace slog {
std::string_view toString(Severity severity)
{
    static constexpr std::array<std::string_view, 5> strings {
        "DEBUG",
        "INFO",
        "WARNING",
        "ERROR",
        "FATAL",
    };
    const auto idx = static_cast<int>(severity);
    if (idx < 0 || static_cast<size_t>(idx) >= strings.size()) {
        return "INVALID";
    }
    return strings[idx];
}

std::optional<Severity> parseSeverity(std::string_view str)
{
    if (str == "debug") {
        return Severity::Debug;
    } else if (str == "info") {
        return Severity::Info;
    } else if (str == "warning") {
        return Severity::Warning;
    } else if (str == "error") {
        return Severity::Error;
    } else if (str == "fatal") {
        return Severity::Fatal;
    }
    return std::nullopt;
}

void setLogLevel(Severity severity)
{
    detail::getCurrentLogLevel() = severity;
}

Severity getLogLevel()
{
    return detail::getCurrentLogLevel();
}

void init(Severity severity)
{
    setLogLevel(severity);
}

namespace detail {
    StringStreamBuf::StringStreamBuf(size_t initialSize)
        : str_(initialSize, 0)
    {
        str_.resize(0);
    }

    std::streamsize StringStreamBuf::xsputn(const char* s, std::streamsize n)
    {
        str_.append(s, n);
        return n;
    }

    StringStreamBuf::int_type StringStreamBuf::overflow(int_type ch)
    {
        if (ch != traits_type::eof()) {
            str_.push_back(static_cast<char>(ch));
        }
        return ch;
    }

    void StringStreamBuf::clear()
    {
        str_.clear();
    }

    std::string& StringStreamBuf::string()
    {
        return str_;
    }

    Severity& getCurrentLogLevel()
    {
        static Severity severity = Severity::Info;
        return severity;
    }

    void replaceDateTime(char* buffer, size_t size, const char* format)
    {
        const auto t = std::time(nullptr);
        ::tm local;
        ::localtime_r(&t, &local);
        [[maybe_unused]] const auto n = std::strftime(buffer, size, format, &local);
        assert(n > 0);
    }

    void write(const std::string& str)
    {
        size_t offset = 0;
        while (offset < str.size()) {
            const auto n = ::write(STDERR_FILENO, str.data() + offset, str.size() - offset);
            if (n <= 0) {
                return;
            }
            offset += static_cast<size_t>(n);
        }
    }
}
}
