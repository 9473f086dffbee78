#include <tomato/util/dev_log.hpp>

#include <mutex>
#include <string>

namespace devlog {

namespace {

    std::mutex g_sinkMutex;
    LogSinkState g_sinkState{};

    std::string_view LevelName(Level lvl) {
        switch (lvl) {
        case level::trace: return "TRACE";
        case level::debug: return "DEBUG";
        case level::info: return "INFO";
        case level::warn: return "WARN";
        case level::error: return "ERROR";
        default: return "?";
        }
    }

} // namespace

void SetLogSink(LogSink sink, void *userData) {
    std::lock_guard lock{g_sinkMutex};
    g_sinkState.sink = sink;
    g_sinkState.user_data = userData;
}

LogSinkState GetLogSink() {
    std::lock_guard lock{g_sinkMutex};
    return g_sinkState;
}

namespace detail {

    void Emit(Level lvl, std::string_view groupName, std::string_view message) {
        const LogSinkState state = GetLogSink();
        if (state.sink != nullptr) {
            const std::string line = fmt::format("[{}] {}", groupName, message);
            state.sink(lvl, line.c_str(), state.user_data);
            return;
        }
        fmt::print("{:5} | {:12} | {}\n", LevelName(lvl), groupName, message);
    }

} // namespace detail

} // namespace devlog
