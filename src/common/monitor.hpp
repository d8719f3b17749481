#ifndef ODIN_COMMON_MONITOR_HPP
#define ODIN_COMMON_MONITOR_HPP

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "../utils/terminal.hpp"

namespace Odin {
    enum class Severity { Info, Warning, Error };

    // Diagnostics sink carried inside the options. A null stream silences everything.
    struct Monitor {
        std::ostream* stream{nullptr};
        bool verbose{false};
        bool colored{true};

        [[nodiscard]] bool enabled() const noexcept { return stream != nullptr; }

        template <class... Parts>
        void log(Severity severity, std::string_view tag, Parts&&... parts) const
        {
            if (stream == nullptr) {
                return;
            }
            if (severity == Severity::Info && !verbose) {
                return;
            }

            std::ostringstream message;
            (message << ... << std::forward<Parts>(parts));
            *stream << prefix(severity, tag) << ' ' << message.str() << '\n';
        }

        template <class... Parts>
        void info(std::string_view tag, Parts&&... parts) const
        {
            log(Severity::Info, tag, std::forward<Parts>(parts)...);
        }

        template <class... Parts>
        void warn(std::string_view tag, Parts&&... parts) const
        {
            log(Severity::Warning, tag, std::forward<Parts>(parts)...);
        }

        template <class... Parts>
        void error(std::string_view tag, Parts&&... parts) const
        {
            log(Severity::Error, tag, std::forward<Parts>(parts)...);
        }

    private:
        [[nodiscard]] std::string prefix(Severity severity, std::string_view tag) const
        {
            namespace Terminal = Utils::Terminal;
            std::string_view symbol = Terminal::Symbols::kDot;
            std::string_view color = Terminal::Colors::kAzure;
            switch (severity) {
                case Severity::Info:
                    break;
                case Severity::Warning:
                    symbol = Terminal::Symbols::kWarn;
                    color = Terminal::Colors::kOrange;
                    break;
                case Severity::Error:
                    symbol = Terminal::Symbols::kCross;
                    color = Terminal::Colors::kCrimson;
                    break;
            }

            std::string label;
            label.append(symbol).append(" [").append(tag).append("]");
            return colored ? Terminal::ApplyColor(label, color) : label;
        }
    };
}

#endif // ODIN_COMMON_MONITOR_HPP
