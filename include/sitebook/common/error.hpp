#pragma once

#include <datapod/datapod.hpp>
#include <string>

namespace sitebook {

    // ===========================================
    // Sitebook-specific error codes (100+)
    // ===========================================

    constexpr dp::u32 ERR_VALIDATION = 100;
    constexpr dp::u32 ERR_CONSTRAINT_VIOLATION = 101;
    constexpr dp::u32 ERR_NOT_FOUND = 102;
    constexpr dp::u32 ERR_TRANSACTION_STATE = 103;
    constexpr dp::u32 ERR_INTEGRITY = 104;
    constexpr dp::u32 ERR_STORAGE = 105;
    constexpr dp::u32 ERR_SNAPSHOT = 106;

    // ===========================================
    // Error factory functions
    // ===========================================

    inline dp::Error validation_error(const std::string &msg = "Invalid input") {
        return dp::Error{ERR_VALIDATION, dp::String(msg.c_str())};
    }

    inline dp::Error constraint_violation(const std::string &msg = "Constraint violated") {
        return dp::Error{ERR_CONSTRAINT_VIOLATION, dp::String(msg.c_str())};
    }

    inline dp::Error not_found_error(const std::string &msg = "Record not found") {
        return dp::Error{ERR_NOT_FOUND, dp::String(msg.c_str())};
    }

    inline dp::Error transaction_state_error(const std::string &msg = "Invalid transaction state") {
        return dp::Error{ERR_TRANSACTION_STATE, dp::String(msg.c_str())};
    }

    inline dp::Error integrity_error(const std::string &msg = "Integrity check failed") {
        return dp::Error{ERR_INTEGRITY, dp::String(msg.c_str())};
    }

    inline dp::Error storage_error(const std::string &msg = "Storage operation failed") {
        return dp::Error{ERR_STORAGE, dp::String(msg.c_str())};
    }

    inline dp::Error snapshot_error(const std::string &msg = "Snapshot is unreadable") {
        return dp::Error{ERR_SNAPSHOT, dp::String(msg.c_str())};
    }

    /// Error message as std::string
    inline std::string message_of(const dp::Error &err) { return std::string(err.message.c_str()); }

} // namespace sitebook
