#include "uuidcat/category/categorized.hpp"

namespace uuidcat::category {
namespace {

// 骨架已生成后写入分类码：码来自注册表，必然 < 2^12，set_field 只在实现缺陷时失败。
std::error_code stamp_code(const CategoryRegistry& registry, std::string_view category, id::Uuid& skeleton) noexcept {
  std::uint16_t code = 0;
  auto ec = registry.code_of(category, code);
  if (ec) {
    return ec;
  }
  return id::set_field(skeleton, id::Field::rand_a, code);
}

}  // namespace

std::error_code generate(const CategoryRegistry& registry, std::string_view category, id::Uuid& out) noexcept {
  // 先解析分类，避免对未注册分类白白消耗随机源。
  if (!registry.contains(category)) {
    return make_error_code(errc::unknown_category);
  }
  id::Uuid skeleton;
  auto ec = id::generate(skeleton);
  if (ec) {
    return ec;
  }
  ec = stamp_code(registry, category, skeleton);
  if (ec) {
    return ec;
  }
  out = skeleton;
  return {};
}

std::error_code generate_at(const CategoryRegistry& registry,
                            std::string_view category,
                            std::uint64_t unix_ts_ms,
                            id::Uuid& out) noexcept {
  if (!registry.contains(category)) {
    return make_error_code(errc::unknown_category);
  }
  id::Uuid skeleton;
  auto ec = id::generate_at(unix_ts_ms, skeleton);
  if (ec) {
    return ec;
  }
  ec = stamp_code(registry, category, skeleton);
  if (ec) {
    return ec;
  }
  out = skeleton;
  return {};
}

std::error_code extract_code(const id::Uuid& uuid, std::uint16_t& out) noexcept {
  if (!id::is_conforming(uuid)) {
    return id::make_error_code(id::errc::malformed_identifier);
  }
  out = static_cast<std::uint16_t>(id::get_field(uuid, id::Field::rand_a));
  return {};
}

std::error_code extract(const CategoryRegistry& registry, const id::Uuid& uuid, std::string& out) {
  std::uint16_t code = 0;
  auto ec = extract_code(uuid, code);
  if (ec) {
    return ec;
  }
  return registry.category_of(code, out);
}

std::error_code extract_bytes(const CategoryRegistry& registry, id::bytes_view in, std::string& out) {
  id::Uuid uuid;
  auto ec = id::parse(in, uuid);
  if (ec) {
    return ec;
  }
  return extract(registry, uuid, out);
}

std::error_code extract_text(const CategoryRegistry& registry, std::string_view text, std::string& out) {
  id::Uuid uuid;
  auto ec = id::parse_string(text, uuid);
  if (ec) {
    return ec;
  }
  return extract(registry, uuid, out);
}

bool is_valid(const CategoryRegistry& registry, const id::Uuid& uuid) {
  std::string ignored;
  return !extract(registry, uuid, ignored);
}

bool is_valid_text(const CategoryRegistry& registry, std::string_view text) {
  std::string ignored;
  return !extract_text(registry, text, ignored);
}

std::error_code generate(std::string_view category, id::Uuid& out) noexcept {
  return generate(global_registry(), category, out);
}

std::error_code extract(const id::Uuid& uuid, std::string& out) { return extract(global_registry(), uuid, out); }

bool is_valid(const id::Uuid& uuid) { return is_valid(global_registry(), uuid); }

}  // namespace uuidcat::category
