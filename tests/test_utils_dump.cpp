#include "uuidcat/category/registry.hpp"
#include "uuidcat/core/error.hpp"
#include "uuidcat/id/uuid.hpp"
#include "uuidcat/utils/hex.hpp"
#include "uuidcat/utils/uuid_dump.hpp"

#include "test_main.hpp"

#include <string>
#include <vector>

namespace {

using uuidcat::category::CategoryRegistry;
using uuidcat::core::byte;
using uuidcat::core::bytes_view;
using uuidcat::id::Field;
using uuidcat::id::Uuid;
using uuidcat::utils::HexDumpOptions;
using uuidcat::utils::UuidDumpOptions;
using uuidcat::utils::describe;
using uuidcat::utils::describe_text;
using uuidcat::utils::hex_dump;
using uuidcat::utils::parse_hex;

constexpr const char* kKnownText = "019909e1-4c3b-7001-8123-456789abcdef";

bool contains(const std::string& haystack, const std::string& needle) {
  return haystack.find(needle) != std::string::npos;
}

void test_parse_hex_variants() {
  std::vector<byte> out;
  TEST_EXPECT_OK(parse_hex("01 8f:3A-ff", out));
  TEST_EXPECT_EQ(out.size(), 4u);
  TEST_EXPECT_EQ(out[0], 0x01);
  TEST_EXPECT_EQ(out[1], 0x8f);
  TEST_EXPECT_EQ(out[2], 0x3a);
  TEST_EXPECT_EQ(out[3], 0xff);

  TEST_EXPECT_OK(parse_hex("0x01 0x02", out));
  TEST_EXPECT_EQ(out.size(), 2u);

  TEST_EXPECT_OK(parse_hex(kKnownText, out));
  TEST_EXPECT_EQ(out.size(), 16u);

  TEST_EXPECT_EC(parse_hex("abc", out), uuidcat::core::errc::invalid_argument);
  TEST_EXPECT_EC(parse_hex("zz", out), uuidcat::core::errc::invalid_argument);
}

void test_hex_dump_layout() {
  Uuid u;
  TEST_EXPECT_OK(uuidcat::id::parse_string(kKnownText, u));
  const auto dump = hex_dump(bytes_view{u.bytes.data(), u.bytes.size()}, HexDumpOptions{8, true, false});
  TEST_EXPECT_EQ(dump, std::string("0000: 01 99 09 e1 4c 3b 70 01\n0008: 81 23 45 67 89 ab cd ef\n"));

  const auto no_offset = hex_dump(bytes_view{u.bytes.data(), 4}, HexDumpOptions{16, false, false});
  TEST_EXPECT_EQ(no_offset, std::string("01 99 09 e1\n"));
}

void test_describe_registered() {
  CategoryRegistry reg;
  Uuid u;
  TEST_EXPECT_OK(uuidcat::id::parse_string(kKnownText, u));
  // rand_a=1 -> 默认集合中的 TYPE_A。
  const auto s = describe(reg, u);
  TEST_EXPECT_EQ(s,
                 std::string("UUIDv7Cat(ver=7, variant=2, unix_ts_ms=1756807384123, ts=2025-09-02T10:03:04Z, "
                             "cat=TYPE_A(1))"));
}

void test_describe_invalid_and_malformed() {
  CategoryRegistry reg;
  Uuid u;
  TEST_EXPECT_OK(uuidcat::id::parse_string(kKnownText, u));
  TEST_EXPECT_OK(uuidcat::id::set_field(u, Field::rand_a, 150));
  TEST_EXPECT(contains(describe(reg, u), "cat=INVALID(150))"));

  TEST_EXPECT_OK(uuidcat::id::set_field(u, Field::version, 4));
  TEST_EXPECT_EQ(describe(reg, u), std::string("UUIDv7Cat(ver=4, variant=2, MALFORMED)"));
}

void test_describe_with_fields_and_hex() {
  CategoryRegistry reg;
  Uuid u;
  TEST_EXPECT_OK(uuidcat::id::parse_string(kKnownText, u));

  UuidDumpOptions options;
  options.include_fields = true;
  options.include_hex = true;
  const auto s = describe(reg, u, options);
  TEST_EXPECT(contains(s, "unix_ts_ms=0x019909e14c3b"));
  TEST_EXPECT(contains(s, "version=0x7"));
  TEST_EXPECT(contains(s, "rand_a=0x001"));
  TEST_EXPECT(contains(s, "variant=0x2"));
  TEST_EXPECT(contains(s, "rand_b=0x0123456789abcdef"));
  TEST_EXPECT(contains(s, "0000: 01 99 09 e1"));
  TEST_EXPECT(!contains(s, "\033["));

  options.enable_color = true;
  TEST_EXPECT(contains(describe(reg, u, options), "\033["));
}

void test_describe_text() {
  CategoryRegistry reg;
  TEST_EXPECT(contains(describe_text(reg, kKnownText), "cat=TYPE_A(1)"));
  // 非 v7 文本也能给出摘要。
  TEST_EXPECT(contains(describe_text(reg, "019909e1-4c3b-4001-8123-456789abcdef"), "MALFORMED"));
  TEST_EXPECT(contains(describe_text(reg, "not-a-uuid"), "invalid uuid text"));
  TEST_EXPECT(contains(describe_text(reg, "0102"), "expected 16 bytes, got 2"));
}

}  // namespace

int main() {
  test_parse_hex_variants();
  test_hex_dump_layout();
  test_describe_registered();
  test_describe_invalid_and_malformed();
  test_describe_with_fields_and_hex();
  test_describe_text();
  return ::uuidcat::tests::run_and_report();
}
