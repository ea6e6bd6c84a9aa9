#ifndef GRAFT_UTILS_TERMINAL_HPP
#define GRAFT_UTILS_TERMINAL_HPP

#include <cmath>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <string_view>

namespace Graft::Utils::Terminal {
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kYellow       = "\033[33m";
        inline constexpr std::string_view kBrightBlack  = "\033[90m";
        inline constexpr std::string_view kBrightCyan   = "\033[96m";

        inline constexpr std::string_view kTurquoise    = "\033[38;5;49m";
    }

    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }

    // Line prefix used by every console message of a run, e.g. "[Graft] ".
    inline std::string Prefix(bool colored) {
        constexpr std::string_view kTag = "[Graft]";
        return (colored ? ApplyColor(kTag, Colors::kTurquoise) : std::string(kTag)) + ' ';
    }

    // H:MM:SS.ffffff; whole seconds print without the fraction.
    inline std::string FormatDuration(double seconds) {
        if (!(seconds > 0.0)) {
            seconds = 0.0;
        }
        const auto total_micros = static_cast<std::int64_t>(std::llround(seconds * 1e6));
        const auto micros = total_micros % 1'000'000;
        const auto total_seconds = total_micros / 1'000'000;
        const auto secs = total_seconds % 60;
        const auto minutes = (total_seconds / 60) % 60;
        const auto hours = total_seconds / 3600;

        std::ostringstream stream;
        stream << hours << ':' << std::setw(2) << std::setfill('0') << minutes
               << ':' << std::setw(2) << std::setfill('0') << secs;
        if (micros != 0) {
            stream << '.' << std::setw(6) << std::setfill('0') << micros;
        }
        return stream.str();
    }
}

#endif // GRAFT_UTILS_TERMINAL_HPP
