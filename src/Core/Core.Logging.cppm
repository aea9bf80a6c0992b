module;
#include <format>
#include <functional>
#include <string_view>
#include <utility>

export module Core:Logging;

export namespace Core::Log
{
    enum class Level
    {
        Debug,
        Info,
        Warning,
        Error
    };

    // Receives every message that passes the level filter. When no sink is
    // installed, messages go to stdout with ANSI colors.
    using Sink = std::function<void(Level, std::string_view)>;

    void SetMinLevel(Level level);
    [[nodiscard]] Level GetMinLevel();

    // Replaces the active sink. Pass an empty function to restore console output.
    void SetSink(Sink sink);

    [[nodiscard]] bool IsEnabled(Level level);

    void Write(Level level, std::string_view msg);

    // -------------------------------------------------------------------------
    // Public API
    // -------------------------------------------------------------------------

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        if (IsEnabled(Level::Info))
            Write(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        if (IsEnabled(Level::Warning))
            Write(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        if (IsEnabled(Level::Error))
            Write(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug(std::format_string<Args...> fmt, Args&&... args)
    {
#ifndef NDEBUG
        if (IsEnabled(Level::Debug))
            Write(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#else
        ((void)args, ...);
        (void)fmt;
#endif
    }
}
