#include <urlbridge/detail/mem.hpp>
#include <urlbridge/log.hpp>
#include <shared_mutex>
#include <string>
#include <atomic>
#include <memory>
#include <set>

#if defined(URLBRIDGE_USE_LOG)

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

URLBRIDGE_NS_BEGIN

namespace logging {

namespace {
    using ModuleSet = std::set<std::string, mem::CaseCompare>;

    // Threshold is read on every message, the module lists rarely change
    std::atomic<LogLevel> gLevel {LogLevel::Info};
    std::shared_mutex     gModulesMutex;
    ModuleSet             gWhitelist;
    ModuleSet             gBlacklist;

    auto spdlogLevel(LogLevel level) noexcept -> spdlog::level::level_enum {
        switch (level) {
            case LogLevel::Trace: return spdlog::level::trace;
            case LogLevel::Debug: return spdlog::level::debug;
            case LogLevel::Info:  return spdlog::level::info;
            case LogLevel::Warn:  return spdlog::level::warn;
            case LogLevel::Error: return spdlog::level::err;
            case LogLevel::Off:   break;
        }
        return spdlog::level::off;
    }

    // Our own logger on stderr, reused when the application registered one with the same name
    auto logger() -> spdlog::logger & {
        static std::shared_ptr<spdlog::logger> instance = []() {
            auto existing = spdlog::get("urlbridge");
            if (existing) {
                return existing;
            }
            auto created = spdlog::stderr_color_mt("urlbridge");
            created->set_level(spdlog::level::trace); // Filtering happens in check()
            created->set_pattern("[%H:%M:%S.%e] [%^%l%$] [%t] %v (%s:%#)");
            return created;
        }();
        return *instance;
    }
}

auto check(LogLevel level, std::string_view mod) -> bool {
    if (level < gLevel.load(std::memory_order_relaxed) || level == LogLevel::Off) {
        return false;
    }
    std::shared_lock locker(gModulesMutex);
    if (gBlacklist.contains(mod)) {
        return false;
    }
    return gWhitelist.empty() || gWhitelist.contains(mod);
}

auto write(LogLevel level, std::string_view mod, std::source_location where, std::string_view content) -> void {
    spdlog::source_loc loc {where.file_name(), static_cast<int>(where.line()), where.function_name()};
    logger().log(loc, spdlogLevel(level), "{}: {}", mod, content);
}

auto setLevel(LogLevel level) -> void {
    gLevel.store(level, std::memory_order_relaxed);
}

auto addWhitelist(std::string_view mod) -> void {
    std::unique_lock locker(gModulesMutex);
    gWhitelist.emplace(mod);
}

auto addBlacklist(std::string_view mod) -> void {
    std::unique_lock locker(gModulesMutex);
    gBlacklist.emplace(mod);
}

} // namespace logging

URLBRIDGE_NS_END

#endif
