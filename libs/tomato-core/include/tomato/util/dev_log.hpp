#pragma once

/**
@file
@brief Developer log.

Messages are organized in groups. A group is a struct with three static members:

```cpp
struct timer {
    static constexpr bool enabled = true;
    static constexpr devlog::Level level = devlog::level::debug;
    static constexpr std::string_view name = "Timer";
};
```

Messages below the group's level or below `TOMATO_DEV_LOG_LEVEL` are compiled out.
Output goes to stdout unless a sink is installed with `devlog::SetLogSink`.
*/

#include <tomato/core/types.hpp>

#include <fmt/format.h>

#include <concepts>
#include <string_view>
#include <utility>

#ifndef TOMATO_DEV_LOG_LEVEL
    #define TOMATO_DEV_LOG_LEVEL 2
#endif

namespace devlog {

using Level = uint8;

namespace level {
    inline constexpr Level trace = 1;
    inline constexpr Level debug = 2;
    inline constexpr Level info = 3;
    inline constexpr Level warn = 4;
    inline constexpr Level error = 5;
} // namespace level

inline constexpr Level kMinLevel = TOMATO_DEV_LOG_LEVEL;

template <typename T>
concept Group = requires {
    { T::enabled } -> std::convertible_to<bool>;
    { T::level } -> std::convertible_to<Level>;
    { T::name } -> std::convertible_to<std::string_view>;
};

using LogSink = void (*)(Level level, const char *message, void *userData);

struct LogSinkState {
    LogSink sink = nullptr;
    void *user_data = nullptr;
};

// The sink is process-wide. Passing nullptr restores stdout output.
void SetLogSink(LogSink sink, void *userData);
LogSinkState GetLogSink();

namespace detail {

    void Emit(Level level, std::string_view groupName, std::string_view message);

    template <Level lvl, Group TGroup, typename... TArgs>
    void Log(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
        if constexpr (TGroup::enabled && lvl >= TGroup::level && lvl >= kMinLevel) {
            Emit(lvl, TGroup::name, fmt::format(fmt, std::forward<TArgs>(args)...));
        }
    }

} // namespace detail

template <Group TGroup, typename... TArgs>
void trace(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::Log<level::trace, TGroup>(fmt, std::forward<TArgs>(args)...);
}

template <Group TGroup, typename... TArgs>
void debug(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::Log<level::debug, TGroup>(fmt, std::forward<TArgs>(args)...);
}

template <Group TGroup, typename... TArgs>
void info(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::Log<level::info, TGroup>(fmt, std::forward<TArgs>(args)...);
}

template <Group TGroup, typename... TArgs>
void warn(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::Log<level::warn, TGroup>(fmt, std::forward<TArgs>(args)...);
}

template <Group TGroup, typename... TArgs>
void error(fmt::format_string<TArgs...> fmt, TArgs &&...args) {
    detail::Log<level::error, TGroup>(fmt, std::forward<TArgs>(args)...);
}

} // namespace devlog
