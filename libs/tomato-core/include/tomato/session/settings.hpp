#pragma once

#include "session_snapshot.hpp"

#include <tomato/core/configuration.hpp>

#include <filesystem>
#include <string>
#include <system_error>
#include <utility>

namespace tomato::session {

inline constexpr const char *kSettingsFileName = "red-tomato.toml";

struct SettingsLoadResult {
    enum class Type {
        Success,
        TOMLParseError,
        UnsupportedConfigVersion,
    };

    Type type = Type::Success;
    std::string parseError;
    int configVersion = 0;

    static SettingsLoadResult Success() {
        return {};
    }

    static SettingsLoadResult TOMLParseError(std::string description) {
        return {.type = Type::TOMLParseError, .parseError = std::move(description)};
    }

    static SettingsLoadResult UnsupportedConfigVersion(int version) {
        return {.type = Type::UnsupportedConfigVersion, .configVersion = version};
    }

    explicit operator bool() const {
        return type == Type::Success;
    }

    std::string string() const;
};

struct SettingsSaveResult {
    enum class Type {
        Success,
        FilesystemError,
    };

    Type type = Type::Success;
    std::error_code error{};

    static SettingsSaveResult Success() {
        return {};
    }

    static SettingsSaveResult FilesystemError(std::error_code error) {
        return {.type = Type::FilesystemError, .error = error};
    }

    explicit operator bool() const {
        return type == Type::Success;
    }

    std::string string() const;
};

struct Settings {
    core::PomodoroConfig timer;
    SessionSnapshot session;

    struct GUI {
        bool pinned = false;  // keep window above others
        bool compact = false; // small overlay layout
    } gui;

    std::filesystem::path path;

    void ResetToDefaults();

    // A missing file is not an error: defaults are used. On any failure the settings are left at their defaults.
    SettingsLoadResult Load(const std::filesystem::path &path);

    // Writes to the path given to the last Load, or to kSettingsFileName if none.
    SettingsSaveResult Save();
};

} // namespace tomato::session
