#pragma once

#include <system_error>

namespace uuidcat::core {

/**
 * @brief 本库通用错误码（跨模块复用）。
 *
 * 约定：
 * - 所有接口优先返回 std::error_code，避免异常路径。
 * - entropy_unavailable 表示内核随机源不可用；属于致命的环境问题，
 *   不在正常的编解码错误分类内（见 id/category 各自的 errc）。
 */
enum class errc : int {
  ok = 0,
  invalid_argument = 1,
  entropy_unavailable = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

}  // namespace uuidcat::core

namespace std {
template <>
struct is_error_code_enum<uuidcat::core::errc> : true_type {};
}  // namespace std
