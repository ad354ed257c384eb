#pragma once

#include <cstdint>
#include <string_view>

namespace uuidcat::core {

/**
 * @brief 日志级别（控制库内 "uuidcat" spdlog logger）。
 *
 * 说明：
 * - 本库内部日志使用 spdlog，但不把 spdlog 类型暴露到 public headers；
 * - 库使用独立的具名 logger（kLoggerName），不修改 spdlog 默认 logger；
 *   业务侧如需替换 sink，可通过 spdlog::get(kLoggerName) 取得后自行配置；
 * - 默认级别为 warn：registry 配置/解码失配等细节只在 debug/info 下输出。
 */
enum class LogLevel : std::uint8_t {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    critical = 5,
    off = 6,
};

inline constexpr std::string_view kLoggerName = "uuidcat";

void set_log_level(LogLevel level) noexcept;
[[nodiscard]] LogLevel log_level() noexcept;

} // namespace uuidcat::core
