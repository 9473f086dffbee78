#pragma once

#include <string>
#include <system_error>
#include <utility>

namespace tomato::history {

struct HistoryResult {
    enum class Type {
        Success,
        NotOpen,
        FilesystemError,
        DatabaseError,
    };

    Type type = Type::Success;
    std::error_code errorCode{};
    int sqliteCode = 0;
    std::string message;

    static HistoryResult Success() {
        return {};
    }

    static HistoryResult NotOpen() {
        return {.type = Type::NotOpen};
    }

    static HistoryResult FilesystemError(std::error_code error) {
        return {.type = Type::FilesystemError, .errorCode = error};
    }

    static HistoryResult DatabaseError(int code, std::string message) {
        return {.type = Type::DatabaseError, .sqliteCode = code, .message = std::move(message)};
    }

    explicit operator bool() const {
        return type == Type::Success;
    }

    std::string string() const;
};

} // namespace tomato::history
