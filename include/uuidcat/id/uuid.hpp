#pragma once

#include "uuidcat/core/common.hpp"
#include "uuidcat/core/error.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace uuidcat::id {

using byte = uuidcat::core::byte;
using bytes_view = uuidcat::core::bytes_view;

inline constexpr std::size_t kUuidSize = 16;
inline constexpr std::uint8_t kVersion7 = 0x7;
// RFC 9562 variant：最高两位为 0b10。
inline constexpr std::uint8_t kVariantRfc = 0x2;

enum class errc : int {
  ok = 0,
  malformed_identifier = 1,
  field_width_exceeded = 2,
};

const std::error_category& error_category() noexcept;
std::error_code make_error_code(errc e) noexcept;

/**
 * @brief UUIDv7 的 5 个位域（自最高位起）。
 *
 *   | unix_ts_ms | version | rand_a | variant | rand_b |
 *   |    48      |    4    |   12   |    2    |   62   |
 */
enum class Field : std::uint8_t {
  unix_ts_ms = 0,
  version = 1,
  rand_a = 2,
  variant = 3,
  rand_b = 4,
};

struct FieldLayout final {
  std::uint8_t offset;  // 自 MSB 起的位偏移
  std::uint8_t width;
};

[[nodiscard]] constexpr FieldLayout layout_of(Field f) noexcept {
  switch (f) {
    case Field::unix_ts_ms:
      return {0, 48};
    case Field::version:
      return {48, 4};
    case Field::rand_a:
      return {52, 12};
    case Field::variant:
      return {64, 2};
    case Field::rand_b:
      return {66, 62};
  }
  return {0, 0};
}

[[nodiscard]] constexpr std::uint64_t max_value_of(Field f) noexcept {
  const auto width = layout_of(f).width;
  return width >= 64 ? ~std::uint64_t{0} : ((std::uint64_t{1} << width) - 1U);
}

/**
 * @brief 128-bit 标识符（16 字节，大端）。
 *
 * 默认构造为全 0（nil UUID，不是合法的 v7）。比较按字节字典序，
 * 与 unix_ts_ms 位于最高 48 位的布局配合，得到按毫秒时间排序的语义。
 */
struct Uuid final {
  std::array<byte, kUuidSize> bytes{};

  friend bool operator==(const Uuid&, const Uuid&) = default;
  friend bool operator<(const Uuid& lhs, const Uuid& rhs) noexcept { return lhs.bytes < rhs.bytes; }
};

/**
 * @brief 以当前系统时间生成一个 UUIDv7。
 *
 * rand_a/rand_b 来自内核 CSPRNG（getrandom）；rand_a 只是占位，
 * 分类层会整体覆盖它。随机源失败返回 core::errc::entropy_unavailable。
 */
std::error_code generate(Uuid& out) noexcept;

/**
 * @brief 以指定毫秒时间戳生成 UUIDv7。
 *
 * unix_ts_ms 超过 48 位时返回 errc::field_width_exceeded。
 */
std::error_code generate_at(std::uint64_t unix_ts_ms, Uuid& out) noexcept;

/**
 * @brief 解析 16 字节二进制形式。
 *
 * 长度不是 16，或 version/variant 不是 v7 常量时返回 errc::malformed_identifier。
 */
std::error_code parse(bytes_view in, Uuid& out) noexcept;

/**
 * @brief 解析文本形式：规范的 8-4-4-4-12，或 32 位连续 hex（大小写均可）。
 *
 * 格式错误或 version/variant 不符均返回 errc::malformed_identifier。
 */
std::error_code parse_string(std::string_view text, Uuid& out) noexcept;

[[nodiscard]] bool is_conforming(const Uuid& uuid) noexcept;

// 纯位级访问器：不校验 version/variant，也不限制可写字段（由调用方约束）。
[[nodiscard]] std::uint64_t get_field(const Uuid& uuid, Field field) noexcept;
std::error_code set_field(Uuid& uuid, Field field, std::uint64_t value) noexcept;

[[nodiscard]] inline std::uint64_t timestamp_ms(const Uuid& uuid) noexcept {
  return get_field(uuid, Field::unix_ts_ms);
}

// 规范文本：xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx（小写）。
[[nodiscard]] std::string to_string(const Uuid& uuid);

// 32 位连续小写 hex（无连字符）。
[[nodiscard]] std::string to_hex(const Uuid& uuid);

/**
 * @brief 将时间戳格式化为 ISO-8601 UTC（秒级）："YYYY-MM-DDTHH:MM:SSZ"。
 *
 * 非合法 v7 返回 errc::malformed_identifier。
 */
std::error_code format_timestamp(const Uuid& uuid, std::string& out);

}  // namespace uuidcat::id

namespace std {
template <>
struct is_error_code_enum<uuidcat::id::errc> : true_type {};
}  // namespace std
