/// @file npc_logger.cpp
/// @brief NpcLogger implementation over kcenon common_system logging.

#include "npc/foundation/npc_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <sstream>
#include <string>

namespace npc::foundation {

namespace kci = kcenon::common::interfaces;

// ---------------------------------------------------------------------------
// Level mapping: npc -> kcenon
// ---------------------------------------------------------------------------
static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Info,   // ECS
    LogLevel::Debug,  // AI
    LogLevel::Debug,  // Memory
    LogLevel::Info    // Config
};

// ---------------------------------------------------------------------------
// Context serialization
// ---------------------------------------------------------------------------
static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.entityId) {
        append("entity_id", std::to_string(*ctx.entityId));
    }
    if (ctx.turn) {
        append("turn", std::to_string(*ctx.turn));
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

static std::string formatLine(LogCategory cat, std::string_view msg) {
    std::string formatted;
    formatted.reserve(msg.size() + 16);
    formatted += '[';
    formatted += logCategoryName(cat);
    formatted += "] ";
    formatted += msg;
    return formatted;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct NpcLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("npc.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    /// Named per-category logger when one is registered, else the default.
    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto idx = static_cast<std::size_t>(cat);
        if (idx < kLogCategoryCount) {
            // Unregistered names resolve to the shared NullLogger.
            auto named = registry.get_logger(loggerNames[idx]);
            if (named && named != kci::GlobalLoggerRegistry::null_logger()) {
                return named;
            }
        }
        return registry.get_default_logger();
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
NpcLogger::NpcLogger() : impl_(std::make_unique<Impl>()) {}

NpcLogger::~NpcLogger() = default;

NpcLogger::NpcLogger(NpcLogger&&) noexcept = default;
NpcLogger& NpcLogger::operator=(NpcLogger&&) noexcept = default;

void NpcLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }

    auto logger = impl_->getLogger(cat);
    // Format: [Category] message
    logger->log(mapLevel(level), formatLine(cat, msg));
}

void NpcLogger::logWithContext(LogLevel level, LogCategory cat,
                               std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }

    auto logger = impl_->getLogger(cat);

    // Format: [Category] message {key=val, ...}
    std::string formatted = formatLine(cat, msg);
    std::string ctxStr = formatContext(ctx);
    if (!ctxStr.empty()) {
        formatted += " {";
        formatted += ctxStr;
        formatted += '}';
    }

    logger->log(mapLevel(level), formatted);
}

// ---------------------------------------------------------------------------
// Category level control
// ---------------------------------------------------------------------------
void NpcLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel NpcLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool NpcLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

NpcResult<void> NpcLogger::flush() {
    auto logger = kci::GlobalLoggerRegistry::instance().get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return NpcResult<void>::err(
            NpcError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return NpcResult<void>::ok();
}

NpcLogger& NpcLogger::instance() {
    static NpcLogger inst;
    return inst;
}

} // namespace npc::foundation
