#include <tomato/session/settings.hpp>

#include <tomato/util/dev_log.hpp>

#include <fmt/format.h>
#include <fmt/std.h>

#include <toml++/toml.hpp>

#include <algorithm>
#include <cerrno>
#include <concepts>
#include <fstream>

using namespace std::literals;

namespace tomato::session {

template <typename T>
concept arithmetic_type = std::integral<T> || std::floating_point<T>;

// Increment this version when making breaking changes to the settings file structure.
// The loader should convert old file formats on a best-effort basis.
inline constexpr int kConfigVersion = 1;

namespace grp {

    // -----------------------------------------------------------------------------
    // Dev log groups

    // Hierarchy:
    //
    // settings

    struct settings {
        static constexpr bool enabled = true;
        static constexpr devlog::Level level = devlog::level::debug;
        static constexpr std::string_view name = "Settings";
    };

} // namespace grp

// -------------------------------------------------------------------------------------------------
// Enum parsers

static void Parse(toml::node_view<toml::node> &node, timer::Phase &value) {
    value = timer::Phase::Focus;
    if (auto opt = node.value<std::string>()) {
        timer::TryParse(*opt, value);
    }
}

static void Parse(toml::node_view<toml::node> &node, timer::TimerState &value) {
    value = timer::TimerState::Idle;
    if (auto opt = node.value<std::string>()) {
        timer::TryParse(*opt, value);
    }
}

// -------------------------------------------------------------------------------------------------
// Parsers

template <typename T>
static void Parse(toml::node_view<toml::node> &node, T &value) {
    if (auto opt = node.value<T>()) {
        value = *opt;
    }
}

template <typename T>
static void Parse(toml::node_view<toml::node> &node, const char *name, T &value) {
    toml::node_view view{node[name]};
    Parse(view, value);
}

template <arithmetic_type T>
static void Parse(toml::node_view<toml::node> &node, const char *name, T &value, T minValue, T maxValue) {
    toml::node_view view{node[name]};
    Parse(view, value);
    value = std::clamp<T>(value, minValue, maxValue);
}

// -------------------------------------------------------------------------------------------------
// Results

std::string SettingsLoadResult::string() const {
    switch (type) {
    case Type::Success: return "Success";
    case Type::TOMLParseError: return fmt::format("TOML parse error: {}", parseError);
    case Type::UnsupportedConfigVersion:
        return fmt::format("Unsupported configuration version: {} (expected up to {})", configVersion,
                           kConfigVersion);
    }
    return "Unknown error";
}

std::string SettingsSaveResult::string() const {
    switch (type) {
    case Type::Success: return "Success";
    case Type::FilesystemError: return fmt::format("Filesystem error: {}", error.message());
    }
    return "Unknown error";
}

// -------------------------------------------------------------------------------------------------
// Settings

void Settings::ResetToDefaults() {
    timer = {};
    session = {};
    gui = {};
}

SettingsLoadResult Settings::Load(const std::filesystem::path &path) {
    // Use defaults if configuration file does not exist
    if (!std::filesystem::is_regular_file(path)) {
        ResetToDefaults();
        this->path = path;
        devlog::info<grp::settings>("No settings file at {}, using defaults", path);
        return SettingsLoadResult::Success();
    }

    auto parseResult = toml::parse_file(path.string());
    if (parseResult.failed()) {
        ResetToDefaults();
        this->path = path;
        return SettingsLoadResult::TOMLParseError(std::string{parseResult.error().description()});
    }
    auto &data = parseResult.table();

    ResetToDefaults();
    this->path = path;

    int configVersion = 0;
    if (auto opt = data["ConfigVersion"].value<int>()) {
        configVersion = *opt;
    }
    if (configVersion > kConfigVersion) {
        return SettingsLoadResult::UnsupportedConfigVersion(configVersion);
    }

    if (auto tblTimer = data["Timer"]) {
        using core::PomodoroConfig;
        Parse(tblTimer, "FocusSeconds", timer.focusSeconds, PomodoroConfig::kMinPhaseSeconds,
              PomodoroConfig::kMaxPhaseSeconds);
        Parse(tblTimer, "ShortBreakSeconds", timer.shortBreakSeconds, PomodoroConfig::kMinPhaseSeconds,
              PomodoroConfig::kMaxPhaseSeconds);
        Parse(tblTimer, "LongBreakSeconds", timer.longBreakSeconds, PomodoroConfig::kMinPhaseSeconds,
              PomodoroConfig::kMaxPhaseSeconds);

        sint64 pomodorosBeforeLong = timer.pomodorosBeforeLong;
        Parse(tblTimer, "PomodorosBeforeLong", pomodorosBeforeLong,
              static_cast<sint64>(PomodoroConfig::kMinPomodorosBeforeLong),
              static_cast<sint64>(PomodoroConfig::kMaxPomodorosBeforeLong));
        timer.pomodorosBeforeLong = static_cast<uint32>(pomodorosBeforeLong);
    }

    if (auto tblSession = data["Session"]) {
        Parse(tblSession, "Task", session.task);
        if (auto view = tblSession["Phase"]) {
            Parse(view, session.phase);
        }
        if (auto view = tblSession["State"]) {
            Parse(view, session.state);
        }
        Parse(tblSession, "RemainingSeconds", session.remainingSeconds);
        Parse(tblSession, "PhaseTotalSeconds", session.phaseTotalSeconds);

        sint64 completedPomodoros = 0;
        Parse(tblSession, "CompletedPomodoros", completedPomodoros);
        session.completedPomodoros = static_cast<uint32>(std::max<sint64>(completedPomodoros, 0));

        // Never resume a countdown across restarts
        if (session.state == timer::TimerState::Running) {
            session.state = timer::TimerState::Paused;
        }
    }

    if (auto tblGUI = data["GUI"]) {
        Parse(tblGUI, "Pinned", gui.pinned);
        Parse(tblGUI, "Compact", gui.compact);
    }

    devlog::info<grp::settings>("Loaded settings from {}", path);
    return SettingsLoadResult::Success();
}

SettingsSaveResult Settings::Save() {
    if (path.empty()) {
        path = kSettingsFileName;
    }

    if (path.has_parent_path()) {
        std::error_code error{};
        std::filesystem::create_directories(path.parent_path(), error);
        if (error) {
            return SettingsSaveResult::FilesystemError(error);
        }
    }

    // clang-format off
    auto tbl = toml::table{{
        {"ConfigVersion", kConfigVersion},

        {"Timer", toml::table{{
            {"FocusSeconds", timer.focusSeconds},
            {"ShortBreakSeconds", timer.shortBreakSeconds},
            {"LongBreakSeconds", timer.longBreakSeconds},
            {"PomodorosBeforeLong", static_cast<sint64>(timer.pomodorosBeforeLong)},
        }}},

        {"Session", toml::table{{
            {"Task", session.task},
            {"Phase", std::string{timer::ToString(session.phase)}},
            {"State", std::string{timer::ToString(session.state)}},
            {"RemainingSeconds", session.remainingSeconds},
            {"PhaseTotalSeconds", session.phaseTotalSeconds},
            {"CompletedPomodoros", static_cast<sint64>(session.completedPomodoros)},
        }}},

        {"GUI", toml::table{{
            {"Pinned", gui.pinned},
            {"Compact", gui.compact},
        }}},
    }};
    // clang-format on

    std::ofstream out{path, std::ios::binary | std::ios::trunc};
    out << tbl;
    if (!out) {
        std::error_code error{errno, std::generic_category()};
        devlog::warn<grp::settings>("Failed to save settings to {}: {}", path, error.message());
        return SettingsSaveResult::FilesystemError(error);
    }

    return SettingsSaveResult::Success();
}

} // namespace tomato::session
