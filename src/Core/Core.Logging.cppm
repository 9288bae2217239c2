module;
#include <format>
#include <string_view>
#include <utility>

export module Core.Logging;

namespace Core::Log
{
    // Ordered by severity; messages below the current threshold are dropped.
    export enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    // Runtime threshold (default: Info). Safe to call from any thread.
    export void SetLevel(Level level);
    export [[nodiscard]] Level GetLevel();

    export [[nodiscard]] constexpr bool IsEnabled(Level level, Level threshold)
    {
        return static_cast<int>(level) >= static_cast<int>(threshold);
    }

    // Internal helper to print color codes
    void PrintColored(Level level, std::string_view msg);

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    export template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args) {
        if (!IsEnabled(Level::Info, GetLevel())) return;
        PrintColored(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    export template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args) {
        if (!IsEnabled(Level::Warning, GetLevel())) return;
        PrintColored(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    export template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args) {
        PrintColored(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    export template<typename... Args>
    void Debug(std::format_string<Args...> fmt, Args&&... args) {
#ifndef NDEBUG
        if (!IsEnabled(Level::Debug, GetLevel())) return;
        PrintColored(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#endif
    }
}
