#pragma once

#include "uuidcat/id/uuid.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace uuidcat::category {

enum class errc : int {
  ok = 0,
  registry_overflow = 1,
  empty_registry = 2,
  duplicate_category = 3,
  unknown_category = 4,
  unregistered_code = 5,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

// 分类码写入 rand_a 字段，容量即该字段可表示的取值个数（2^12）。
inline constexpr std::size_t kMaxCategories = static_cast<std::size_t>(id::max_value_of(id::Field::rand_a)) + 1U;

// 未显式配置时使用的默认分类（按声明顺序编码为 0..3）。
[[nodiscard]] const std::vector<std::string>& default_categories();

/**
 * @brief 分类注册表：有序分类名集合 <-> [0, N) 分类码 的双射。
 *
 * 说明：
 * - 分类以不透明的名字标识；注册表不关心应用侧的 enum 类型（见 typed.hpp）。
 * - 生命周期：启动阶段单线程调用 set_categories 一次，之后只读；
 *   只读阶段多线程并发 code_of/category_of 无需加锁。
 * - set_categories 与读操作并发属于未定义行为，由调用方保证串行化。
 * - 已参与过编解码后再次 set_categories 是允许的，但旧配置下生成的标识符
 *   可能解码为 unregistered_code 或另一个分类，因此会输出 warn 日志。
 */
class CategoryRegistry final {
 public:
  // 以 default_categories() 初始化。
  CategoryRegistry();

  CategoryRegistry(const CategoryRegistry&) = delete;
  CategoryRegistry& operator=(const CategoryRegistry&) = delete;

  /**
   * @brief 设置分类集合，按声明顺序分配 0 起的分类码。
   *
   * @return empty_registry：集合为空；registry_overflow：超过 kMaxCategories；
   *         duplicate_category：名字重复。失败时保留原配置。
   */
  std::error_code set_categories(std::vector<std::string> categories);

  /**
   * @brief 恢复默认分类集合。
   *
   * 等同于 set_categories(default_categories())：使用后调用同样记录
   * “re-initialised after use”告警，in_use() 保持为 true。
   */
  void reset();

  std::error_code code_of(std::string_view category, std::uint16_t& out) const noexcept;
  std::error_code category_of(std::uint16_t code, std::string& out) const;

  [[nodiscard]] bool contains(std::string_view category) const noexcept;
  [[nodiscard]] std::size_t size() const noexcept { return names_.size(); }
  [[nodiscard]] const std::vector<std::string>& categories() const noexcept { return names_; }

  // 是否已参与过至少一次编解码查询（仅用于重复初始化告警）。
  [[nodiscard]] bool in_use() const noexcept { return in_use_.load(std::memory_order_relaxed); }

 private:
  void mark_used_() const noexcept { in_use_.store(true, std::memory_order_relaxed); }

  std::vector<std::string> names_{};
  std::map<std::string, std::uint16_t, std::less<>> codes_{};
  mutable std::atomic<bool> in_use_{false};
};

/**
 * @brief 进程级注册表（对应“全局配置”用法）。
 *
 * 首次访问时以默认分类初始化；业务侧应在启动阶段调用
 * global_registry().set_categories(...) 完成配置。
 */
[[nodiscard]] CategoryRegistry& global_registry();

}  // namespace uuidcat::category

namespace std {
template <>
struct is_error_code_enum<uuidcat::category::errc> : true_type {};
}  // namespace std
