#pragma once

#include "uuidcat/category/categorized.hpp"
#include "uuidcat/category/registry.hpp"
#include "uuidcat/id/uuid.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace uuidcat::category {

/**
 * @brief 把应用侧 enum 绑定到 CategoryRegistry 的适配器。
 *
 * 用法：
 *   enum class Vehicle { car, truck, bus };
 *   TypedCategories<Vehicle> vehicles(global_registry());
 *   vehicles.set({{Vehicle::car, "CAR"}, {Vehicle::truck, "TRUCK"}, {Vehicle::bus, "BUS"}});
 *
 * 说明：
 * - 分类码仍由注册表按声明顺序分配，注册表只保存名字，不感知 E；
 * - 每次查询都经过注册表，注册表被其他调用方重新配置后，
 *   不在新集合中的 E 值会得到 unknown_category / unregistered_code。
 */
template <class E>
class TypedCategories final {
  static_assert(std::is_enum_v<E>, "TypedCategories requires an enum type");

 public:
  explicit TypedCategories(CategoryRegistry& registry) noexcept : registry_(registry) {}

  std::error_code set(std::initializer_list<std::pair<E, std::string_view>> entries) {
    std::vector<std::string> names;
    std::vector<std::pair<E, std::string>> bound;
    names.reserve(entries.size());
    bound.reserve(entries.size());
    for (const auto& [value, name] : entries) {
      for (const auto& existing : bound) {
        if (existing.first == value) {
          return make_error_code(errc::duplicate_category);
        }
      }
      names.emplace_back(name);
      bound.emplace_back(value, std::string(name));
    }
    auto ec = registry_.set_categories(std::move(names));
    if (ec) {
      return ec;
    }
    entries_ = std::move(bound);
    return {};
  }

  std::error_code code_of(E value, std::uint16_t& out) const noexcept {
    const auto* name = name_of_(value);
    if (name == nullptr) {
      return make_error_code(errc::unknown_category);
    }
    return registry_.code_of(*name, out);
  }

  std::error_code category_of(std::uint16_t code, E& out) const {
    std::string name;
    auto ec = registry_.category_of(code, name);
    if (ec) {
      return ec;
    }
    for (const auto& [value, bound_name] : entries_) {
      if (bound_name == name) {
        out = value;
        return {};
      }
    }
    // 注册表已被改为不含该名字的其他集合。
    return make_error_code(errc::unregistered_code);
  }

  std::error_code generate(E value, id::Uuid& out) const noexcept {
    const auto* name = name_of_(value);
    if (name == nullptr) {
      return make_error_code(errc::unknown_category);
    }
    return ::uuidcat::category::generate(registry_, *name, out);
  }

  std::error_code extract(const id::Uuid& uuid, E& out) const {
    std::uint16_t code = 0;
    auto ec = extract_code(uuid, code);
    if (ec) {
      return ec;
    }
    return category_of(code, out);
  }

  [[nodiscard]] const CategoryRegistry& registry() const noexcept { return registry_; }

 private:
  [[nodiscard]] const std::string* name_of_(E value) const noexcept {
    for (const auto& [bound_value, name] : entries_) {
      if (bound_value == value) {
        return &name;
      }
    }
    return nullptr;
  }

  CategoryRegistry& registry_;
  std::vector<std::pair<E, std::string>> entries_{};
};

}  // namespace uuidcat::category
