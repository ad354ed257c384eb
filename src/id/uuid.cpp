#include "uuidcat/id/uuid.hpp"

#include "../core/log_internal.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <span>

#include <sys/random.h>

namespace uuidcat::id {
namespace {

class uuidcat_id_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "uuidcat.id"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::malformed_identifier:
        return "malformed uuidv7 identifier";
      case errc::field_width_exceeded:
        return "value exceeds field width";
      default:
        return "unknown uuidcat.id error";
    }
  }
};

/*
 * 位域访问模型：
 * - 16 字节视为两个大端 u64：hi = bytes[0..7]，lo = bytes[8..15]；
 * - v7 布局中没有字段跨越第 64 位边界（rand_a 止于 bit63，variant 起于 bit64），
 *   因此每个字段只落在 hi 或 lo 其中之一，按 (offset, width) 移位 + 掩码即可。
 */
std::uint64_t load_u64_be(const byte* p) noexcept {
  std::uint64_t v = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    v = (v << 8U) | static_cast<std::uint64_t>(p[i]);
  }
  return v;
}

void store_u64_be(byte* p, std::uint64_t v) noexcept {
  for (std::size_t i = 0; i < 8; ++i) {
    p[i] = static_cast<byte>((v >> (8U * (7U - i))) & 0xFFU);
  }
}

struct HalfSlot final {
  std::size_t byte_offset;
  unsigned shift;
  std::uint64_t mask;
};

HalfSlot slot_of(Field field) noexcept {
  const auto l = layout_of(field);
  const auto half = static_cast<std::size_t>(l.offset / 64U);
  const auto shift = static_cast<unsigned>(64U - (l.offset % 64U) - l.width);
  return {half * 8U, shift, max_value_of(field)};
}

std::error_code fill_random(std::span<byte> out) noexcept {
  std::size_t filled = 0;
  while (filled < out.size()) {
    const auto n = ::getrandom(out.data() + filled, out.size() - filled, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const int saved = errno;
      uuidcat::core::detail::logger()->error("getrandom failed: {}", std::strerror(saved));
      return uuidcat::core::make_error_code(uuidcat::core::errc::entropy_unavailable);
    }
    filled += static_cast<std::size_t>(n);
  }
  return {};
}

std::uint64_t now_unix_ms() noexcept {
  const auto now = std::chrono::time_point_cast<std::chrono::milliseconds>(std::chrono::system_clock::now());
  return static_cast<std::uint64_t>(now.time_since_epoch().count());
}

int hex_value(char c) noexcept {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

constexpr char kHexDigits[] = "0123456789abcdef";

bool is_dash_position(std::size_t i) noexcept {
  return i == 8 || i == 13 || i == 18 || i == 23;
}

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static uuidcat_id_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

std::uint64_t get_field(const Uuid& uuid, Field field) noexcept {
  const auto s = slot_of(field);
  const auto half = load_u64_be(uuid.bytes.data() + s.byte_offset);
  return (half >> s.shift) & s.mask;
}

std::error_code set_field(Uuid& uuid, Field field, std::uint64_t value) noexcept {
  const auto s = slot_of(field);
  if (value > s.mask) {
    return make_error_code(errc::field_width_exceeded);
  }
  auto half = load_u64_be(uuid.bytes.data() + s.byte_offset);
  half &= ~(s.mask << s.shift);
  half |= (value << s.shift);
  store_u64_be(uuid.bytes.data() + s.byte_offset, half);
  return {};
}

bool is_conforming(const Uuid& uuid) noexcept {
  return get_field(uuid, Field::version) == kVersion7 && get_field(uuid, Field::variant) == kVariantRfc;
}

std::error_code generate_at(std::uint64_t unix_ts_ms, Uuid& out) noexcept {
  if (unix_ts_ms > max_value_of(Field::unix_ts_ms)) {
    return make_error_code(errc::field_width_exceeded);
  }

  Uuid tmp;
  // 前 6 字节是时间戳，其余 10 字节先整体填随机，再覆盖 version/variant。
  auto ec = fill_random(std::span<byte>{tmp.bytes}.subspan(6));
  if (ec) {
    return ec;
  }

  // 以下 set_field 的取值都在字段宽度内，不会失败。
  (void)set_field(tmp, Field::unix_ts_ms, unix_ts_ms);
  (void)set_field(tmp, Field::version, kVersion7);
  (void)set_field(tmp, Field::variant, kVariantRfc);

  out = tmp;
  return {};
}

std::error_code generate(Uuid& out) noexcept { return generate_at(now_unix_ms(), out); }

std::error_code parse(bytes_view in, Uuid& out) noexcept {
  if (in.size() != kUuidSize) {
    return make_error_code(errc::malformed_identifier);
  }
  Uuid tmp;
  std::memcpy(tmp.bytes.data(), in.data(), kUuidSize);
  if (!is_conforming(tmp)) {
    return make_error_code(errc::malformed_identifier);
  }
  out = tmp;
  return {};
}

std::error_code parse_string(std::string_view text, Uuid& out) noexcept {
  const bool dashed = text.size() == 36;
  if (!dashed && text.size() != 32) {
    return make_error_code(errc::malformed_identifier);
  }

  Uuid tmp;
  std::size_t nibble = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (dashed && is_dash_position(i)) {
      if (text[i] != '-') {
        return make_error_code(errc::malformed_identifier);
      }
      continue;
    }
    const int v = hex_value(text[i]);
    if (v < 0) {
      return make_error_code(errc::malformed_identifier);
    }
    auto& b = tmp.bytes[nibble / 2];
    b = static_cast<byte>((nibble % 2 == 0) ? (v << 4) : (b | v));
    ++nibble;
  }

  if (!is_conforming(tmp)) {
    return make_error_code(errc::malformed_identifier);
  }
  out = tmp;
  return {};
}

std::string to_hex(const Uuid& uuid) {
  std::string s;
  s.reserve(kUuidSize * 2);
  for (const auto b : uuid.bytes) {
    s.push_back(kHexDigits[(b >> 4U) & 0x0FU]);
    s.push_back(kHexDigits[b & 0x0FU]);
  }
  return s;
}

std::string to_string(const Uuid& uuid) {
  std::string s;
  s.reserve(36);
  for (std::size_t i = 0; i < kUuidSize; ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      s.push_back('-');
    }
    s.push_back(kHexDigits[(uuid.bytes[i] >> 4U) & 0x0FU]);
    s.push_back(kHexDigits[uuid.bytes[i] & 0x0FU]);
  }
  return s;
}

std::error_code format_timestamp(const Uuid& uuid, std::string& out) {
  if (!is_conforming(uuid)) {
    return make_error_code(errc::malformed_identifier);
  }
  const auto seconds = static_cast<std::time_t>(timestamp_ms(uuid) / 1000U);
  std::tm tm{};
  if (::gmtime_r(&seconds, &tm) == nullptr) {
    return uuidcat::core::make_error_code(uuidcat::core::errc::invalid_argument);
  }
  char buf[32] = {};
  const auto n = std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  if (n == 0) {
    return uuidcat::core::make_error_code(uuidcat::core::errc::invalid_argument);
  }
  out.assign(buf, n);
  return {};
}

}  // namespace uuidcat::id
