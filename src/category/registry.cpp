#include "uuidcat/category/registry.hpp"

#include "../core/log_internal.hpp"

#include <utility>

namespace uuidcat::category {
namespace {

class uuidcat_category_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "uuidcat.category"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::registry_overflow:
        return "category set exceeds rand_a capacity";
      case errc::empty_registry:
        return "category set is empty";
      case errc::duplicate_category:
        return "duplicate category";
      case errc::unknown_category:
        return "unknown category";
      case errc::unregistered_code:
        return "unregistered category code";
      default:
        return "unknown uuidcat.category error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static uuidcat_category_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

const std::vector<std::string>& default_categories() {
  static const std::vector<std::string> defaults = {"UNKNOWN", "TYPE_A", "TYPE_B", "TYPE_C"};
  return defaults;
}

CategoryRegistry::CategoryRegistry() {
  // 默认集合必然合法（非空、无重复、远小于容量）。
  (void)set_categories(default_categories());
}

/*
 * set_categories 的校验顺序：
 * 1) 空集合 -> empty_registry
 * 2) 超过 2^12 -> registry_overflow
 * 3) 重名 -> duplicate_category
 * 全部通过后才替换 names_/codes_，保证失败时旧映射保持不变。
 */
std::error_code CategoryRegistry::set_categories(std::vector<std::string> categories) {
  const auto& log = uuidcat::core::detail::logger();

  if (categories.empty()) {
    log->warn("rejecting empty category set");
    return make_error_code(errc::empty_registry);
  }
  if (categories.size() > kMaxCategories) {
    log->warn("rejecting category set of size {} (capacity {})", categories.size(), kMaxCategories);
    return make_error_code(errc::registry_overflow);
  }

  std::map<std::string, std::uint16_t, std::less<>> codes;
  for (std::size_t i = 0; i < categories.size(); ++i) {
    if (!codes.emplace(categories[i], static_cast<std::uint16_t>(i)).second) {
      log->warn("rejecting category set: duplicate category '{}'", categories[i]);
      return make_error_code(errc::duplicate_category);
    }
  }

  if (in_use()) {
    log->warn("category registry re-initialised after use; identifiers from the previous set may no longer decode");
  }

  names_ = std::move(categories);
  codes_ = std::move(codes);
  log->info("category registry configured with {} categories", names_.size());
  return {};
}

void CategoryRegistry::reset() {
  (void)set_categories(default_categories());
}

std::error_code CategoryRegistry::code_of(std::string_view category, std::uint16_t& out) const noexcept {
  mark_used_();
  const auto it = codes_.find(category);
  if (it == codes_.end()) {
    return make_error_code(errc::unknown_category);
  }
  out = it->second;
  return {};
}

std::error_code CategoryRegistry::category_of(std::uint16_t code, std::string& out) const {
  mark_used_();
  if (code >= names_.size()) {
    uuidcat::core::detail::logger()->debug("category code {} not registered (size {})", code, names_.size());
    return make_error_code(errc::unregistered_code);
  }
  out = names_[code];
  return {};
}

bool CategoryRegistry::contains(std::string_view category) const noexcept {
  return codes_.find(category) != codes_.end();
}

CategoryRegistry& global_registry() {
  static CategoryRegistry registry;
  return registry;
}

}  // namespace uuidcat::category
