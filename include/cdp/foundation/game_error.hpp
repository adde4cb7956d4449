#pragma once

/// @file game_error.hpp
/// @brief Pipeline error type used with Result<T, GameError>.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "cdp/foundation/error_code.hpp"
#include "cdp/foundation/types.hpp"

namespace cdp::foundation {

/// Error code and message, plus the combat context the failure
/// happened in: the entity it concerns and the pipeline tick.
///
/// Context is attached fluently where it is known:
/// @code
///   return GameResult<void>::err(
///       GameError(ErrorCode::DuplicateEntity, "already registered").withEntity(id));
/// @endcode
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    // ── Combat context ─────────────────────────────────────────────────

    GameError& withEntity(EntityId id) & noexcept {
        entity_ = id;
        return *this;
    }
    [[nodiscard]] GameError&& withEntity(EntityId id) && noexcept {
        entity_ = id;
        return std::move(*this);
    }

    GameError& withTick(uint64_t tick) & noexcept {
        tick_ = tick;
        return *this;
    }
    [[nodiscard]] GameError&& withTick(uint64_t tick) && noexcept {
        tick_ = tick;
        return std::move(*this);
    }

    /// Entity the failure concerns; the null id when none was attached.
    [[nodiscard]] EntityId entity() const noexcept { return entity_; }

    /// Pipeline tick the failure happened on, if attached.
    [[nodiscard]] std::optional<uint64_t> tick() const noexcept { return tick_; }

    [[nodiscard]] bool hasContext() const noexcept {
        return entity_.isValid() || tick_.has_value();
    }

    /// "[Subsystem] message (entity=N, tick=T)", omitting absent context.
    [[nodiscard]] std::string describe() const {
        std::string text = "[" + std::string(subsystem()) + "] " + message_;
        if (!hasContext()) {
            return text;
        }
        text += " (";
        if (entity_.isValid()) {
            text += "entity=" + std::to_string(entity_.value());
        }
        if (tick_) {
            if (entity_.isValid()) {
                text += ", ";
            }
            text += "tick=" + std::to_string(*tick_);
        }
        text += ")";
        return text;
    }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    EntityId entity_;
    std::optional<uint64_t> tick_;
};

} // namespace cdp::foundation
