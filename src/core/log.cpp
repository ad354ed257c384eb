#include "uuidcat/core/log.hpp"

#include "log_internal.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <new>
#include <string>

namespace uuidcat::core {
namespace {

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::trace:
        return spdlog::level::trace;
    case LogLevel::debug:
        return spdlog::level::debug;
    case LogLevel::info:
        return spdlog::level::info;
    case LogLevel::warn:
        return spdlog::level::warn;
    case LogLevel::error:
        return spdlog::level::err;
    case LogLevel::critical:
        return spdlog::level::critical;
    case LogLevel::off:
        return spdlog::level::off;
    }
    return spdlog::level::off;
}

[[nodiscard]] LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
    case spdlog::level::trace:
        return LogLevel::trace;
    case spdlog::level::debug:
        return LogLevel::debug;
    case spdlog::level::info:
        return LogLevel::info;
    case spdlog::level::warn:
        return LogLevel::warn;
    case spdlog::level::err:
        return LogLevel::error;
    case spdlog::level::critical:
        return LogLevel::critical;
    case spdlog::level::off:
        return LogLevel::off;
    default:
        return LogLevel::off;
    }
}

[[nodiscard]] std::shared_ptr<spdlog::logger> make_logger() noexcept {
    try {
        const std::string name{kLoggerName};
        // 业务侧可能已提前注册同名 logger（自定义 sink），此时直接复用。
        if (auto existing = spdlog::get(name)) {
            return existing;
        }
        auto created = spdlog::stderr_color_mt(name);
        created->set_level(spdlog::level::warn);
        return created;
    } catch (const spdlog::spdlog_ex &) {
        // 并发注册同名 logger、sink 打开失败等：退回 spdlog 默认 logger。
        return spdlog::default_logger();
    } catch (const std::bad_alloc &) {
        return spdlog::default_logger();
    }
}

} // namespace

namespace detail {

const std::shared_ptr<spdlog::logger> &logger() noexcept {
    static const std::shared_ptr<spdlog::logger> instance = make_logger();
    return instance;
}

} // namespace detail

void set_log_level(LogLevel level) noexcept { detail::logger()->set_level(to_spdlog_level(level)); }

LogLevel log_level() noexcept { return from_spdlog_level(detail::logger()->level()); }

} // namespace uuidcat::core
