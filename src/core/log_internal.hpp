#pragma once

#include <spdlog/spdlog.h>

#include <memory>

namespace uuidcat::core::detail {

// 库内部共享的 spdlog logger（首次调用时创建并注册到 spdlog registry）。
// 创建失败时退回 spdlog 默认 logger，因此可在 noexcept 路径上调用。
[[nodiscard]] const std::shared_ptr<spdlog::logger> &logger() noexcept;

} // namespace uuidcat::core::detail
