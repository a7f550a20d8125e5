module;
#include <format>
#include <string_view>
#include <utility>

export module Core:Logging;

export namespace Core::Log
{
    enum class Level
    {
        Debug = 0,
        Info,
        Warning,
        Error,
        Off
    };

    // Messages below this level are dropped. Default: Debug (everything).
    void SetMinLevel(Level level);
    [[nodiscard]] Level GetMinLevel();

    // Internal sink. Serialized by a global lock so threads never interleave lines.
    void PrintColored(Level level, std::string_view msg);

    template<typename... Args>
    void Info(std::format_string<Args...> fmt, Args&&... args)
    {
        if (GetMinLevel() > Level::Info) return;
        PrintColored(Level::Info, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Warn(std::format_string<Args...> fmt, Args&&... args)
    {
        if (GetMinLevel() > Level::Warning) return;
        PrintColored(Level::Warning, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void Error(std::format_string<Args...> fmt, Args&&... args)
    {
        if (GetMinLevel() > Level::Error) return;
        PrintColored(Level::Error, std::format(fmt, std::forward<Args>(args)...));
    }

    // Only prints in Debug builds
    template<typename... Args>
    void Debug(std::format_string<Args...> fmt, Args&&... args)
    {
#ifndef NDEBUG
        if (GetMinLevel() > Level::Debug) return;
        PrintColored(Level::Debug, std::format(fmt, std::forward<Args>(args)...));
#else
        ((void)args, ...);
        (void)fmt;
#endif
    }
}
