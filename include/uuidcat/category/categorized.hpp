#pragma once

#include "uuidcat/category/registry.hpp"
#include "uuidcat/id/uuid.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace uuidcat::category {

/**
 * @brief 生成携带分类码的 UUIDv7。
 *
 * 以 id::generate 得到新骨架，再用 registry.code_of(category) 整体覆盖 rand_a
 * （高位补 0，不残留随机位）；unix_ts_ms/version/variant/rand_b 保持不变。
 *
 * @return unknown_category：分类未注册；core::errc::entropy_unavailable：随机源失败。
 */
std::error_code generate(const CategoryRegistry& registry, std::string_view category, id::Uuid& out) noexcept;

// 指定毫秒时间戳的版本；时间戳超过 48 位返回 id::errc::field_width_exceeded。
std::error_code generate_at(const CategoryRegistry& registry,
                            std::string_view category,
                            std::uint64_t unix_ts_ms,
                            id::Uuid& out) noexcept;

/**
 * @brief 从标识符中取回分类。
 *
 * @return id::errc::malformed_identifier：不是合法 v7；
 *         unregistered_code：rand_a 中的码在当前注册表下没有对应分类
 *         （常见于旧配置生成的标识符，或普通 v7 的随机 rand_a），调用方应视为“分类未知”。
 */
std::error_code extract(const CategoryRegistry& registry, const id::Uuid& uuid, std::string& out);

// 16 字节二进制输入；长度/版本不符返回 id::errc::malformed_identifier。
std::error_code extract_bytes(const CategoryRegistry& registry, id::bytes_view in, std::string& out);

// 文本输入（8-4-4-4-12 或 32 位 hex）。
std::error_code extract_text(const CategoryRegistry& registry, std::string_view text, std::string& out);

// 只读取 rand_a 中的原始分类码，不做注册表解析。
std::error_code extract_code(const id::Uuid& uuid, std::uint16_t& out) noexcept;

// extract 成功即为 true。
[[nodiscard]] bool is_valid(const CategoryRegistry& registry, const id::Uuid& uuid);

// 文本形式；无法解析的文本返回 false。
[[nodiscard]] bool is_valid_text(const CategoryRegistry& registry, std::string_view text);

// 以下重载使用 global_registry()。
std::error_code generate(std::string_view category, id::Uuid& out) noexcept;
std::error_code extract(const id::Uuid& uuid, std::string& out);
[[nodiscard]] bool is_valid(const id::Uuid& uuid);

}  // namespace uuidcat::category
