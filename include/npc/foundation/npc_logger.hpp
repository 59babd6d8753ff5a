#pragma once

/// @file npc_logger.hpp
/// @brief NpcLogger wrapping kcenon common_system logging with
///        per-category filtering.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "npc/foundation/npc_result.hpp"

namespace npc::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally.
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Subsystem categories; each has its own runtime minimum level.
enum class LogCategory : uint8_t {
    Core   = 0, ///< Startup, configuration plumbing
    ECS    = 1, ///< Storage and system scheduling
    AI     = 2, ///< Behavior trees and the AI coordinator
    Memory = 3, ///< Working memory and decay sweeps
    Config = 4  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 5;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "ECS", "AI", "Memory", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Structured fields appended to a log line.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.entityId = entity.id();
///   ctx.turn = 120;
///   ctx.extra["forgotten"] = "3";
///   logger.logWithContext(LogLevel::Debug, LogCategory::Memory,
///                         "Decay sweep", ctx);
/// @endcode
struct LogContext {
    std::optional<uint32_t> entityId;
    std::optional<uint64_t> turn;
    std::unordered_map<std::string, std::string> extra;
};

/// Category-aware logger in front of kcenon's logger registry.
///
/// Each category resolves to a named logger `"npc.<Category>"` in the
/// GlobalLoggerRegistry, falling back to the registry's default logger.
///
/// Default log levels per category:
/// | Category | Default Level |
/// |----------|---------------|
/// | Core     | Info          |
/// | ECS      | Info          |
/// | AI       | Debug         |
/// | Memory   | Debug         |
/// | Config   | Info          |
class NpcLogger {
public:
    NpcLogger();
    ~NpcLogger();

    NpcLogger(const NpcLogger&) = delete;
    NpcLogger& operator=(const NpcLogger&) = delete;
    NpcLogger(NpcLogger&&) noexcept;
    NpcLogger& operator=(NpcLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message followed by `{key=value, ...}` context fields.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger.
    NpcResult<void> flush();

    /// Process-wide logger used by the NPC_LOG macros.
    static NpcLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace npc::foundation

// ---------------------------------------------------------------------------
// Convenience macros (must be outside namespace, macros are global)
// ---------------------------------------------------------------------------

/// @name NPC_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define NPC_MIN_LOG_LEVEL before including this header to compile out
/// calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef NPC_MIN_LOG_LEVEL
    #define NPC_MIN_LOG_LEVEL 0
#endif

#define NPC_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= NPC_MIN_LOG_LEVEL &&                      \
            ::npc::foundation::NpcLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::npc::foundation::NpcLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define NPC_LOG_DEBUG(cat, msg) \
    NPC_LOG(::npc::foundation::LogLevel::Debug, (cat), (msg))

#define NPC_LOG_INFO(cat, msg) \
    NPC_LOG(::npc::foundation::LogLevel::Info, (cat), (msg))

#define NPC_LOG_WARN(cat, msg) \
    NPC_LOG(::npc::foundation::LogLevel::Warning, (cat), (msg))

#define NPC_LOG_ERROR(cat, msg) \
    NPC_LOG(::npc::foundation::LogLevel::Error, (cat), (msg))

/// @}
