#ifndef ODIN_UTILS_TERMINAL_HPP
#define ODIN_UTILS_TERMINAL_HPP

#include <string>
#include <string_view>

namespace Odin::Utils::Terminal {
    // ---------- Colors ----------
    namespace Colors {
        inline constexpr std::string_view kReset = "\033[0m";

        inline constexpr std::string_view kRed           = "\033[31m";
        inline constexpr std::string_view kGreen         = "\033[32m";

        // Named 256-color convenience
        inline constexpr std::string_view kCrimson      = "\033[38;5;196m";
        inline constexpr std::string_view kAzure        = "\033[38;5;33m";
        inline constexpr std::string_view kOrange       = "\033[38;5;208m";
    }

    // ---------- Symbols ----------
    namespace Symbols {
        inline constexpr std::string_view kCheck     = "✔";
        inline constexpr std::string_view kCross     = "✘";
        inline constexpr std::string_view kDot       = "•";
        inline constexpr std::string_view kWarn      = "⚠";
    }

    // ---------- Small helpers ----------
    inline std::string ApplyColor(std::string_view s, std::string_view color) {
        std::string out; out.reserve(color.size() + s.size() + Colors::kReset.size());
        out.append(color).append(s).append(Colors::kReset);
        return out;
    }
}

#endif // ODIN_UTILS_TERMINAL_HPP
