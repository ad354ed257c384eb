#include "uuidcat/id/uuid.hpp"

#include "test_main.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace {

using uuidcat::id::byte;
using uuidcat::id::bytes_view;
using uuidcat::id::errc;
using uuidcat::id::Field;
using uuidcat::id::Uuid;
using uuidcat::id::format_timestamp;
using uuidcat::id::generate;
using uuidcat::id::generate_at;
using uuidcat::id::get_field;
using uuidcat::id::is_conforming;
using uuidcat::id::parse;
using uuidcat::id::parse_string;
using uuidcat::id::set_field;
using uuidcat::id::timestamp_ms;
using uuidcat::id::to_hex;
using uuidcat::id::to_string;

// unix_ts_ms=0x019909e14c3b（2025-09-02T10:03:04.123Z），rand_a=0x001，
// variant=0b10，rand_b=0x0123456789abcdef。
constexpr const char* kKnownText = "019909e1-4c3b-7001-8123-456789abcdef";

bytes_view view_of(const Uuid& u) { return bytes_view{u.bytes.data(), u.bytes.size()}; }

void test_generate_is_structurally_valid() {
  for (int i = 0; i < 64; ++i) {
    Uuid u;
    TEST_EXPECT_OK(generate(u));
    TEST_EXPECT(is_conforming(u));
    TEST_EXPECT_EQ(get_field(u, Field::version), 7U);
    TEST_EXPECT_EQ(get_field(u, Field::variant), 2U);
    TEST_EXPECT_EQ(u.bytes[6] >> 4U, 0x7);
    TEST_EXPECT_EQ(u.bytes[8] >> 6U, 0x2);

    Uuid parsed;
    TEST_EXPECT_OK(parse(view_of(u), parsed));
    TEST_EXPECT(parsed == u);
  }
}

void test_generate_uses_current_time() {
  const auto before = static_cast<std::uint64_t>(
    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
  Uuid u;
  TEST_EXPECT_OK(generate(u));
  const auto after = static_cast<std::uint64_t>(
    std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
  TEST_EXPECT(timestamp_ms(u) >= before);
  TEST_EXPECT(timestamp_ms(u) <= after);
}

void test_generate_at_places_timestamp() {
  Uuid u;
  TEST_EXPECT_OK(generate_at(0x019909e14c3bULL, u));
  TEST_EXPECT_EQ(u.bytes[0], 0x01);
  TEST_EXPECT_EQ(u.bytes[1], 0x99);
  TEST_EXPECT_EQ(u.bytes[2], 0x09);
  TEST_EXPECT_EQ(u.bytes[3], 0xe1);
  TEST_EXPECT_EQ(u.bytes[4], 0x4c);
  TEST_EXPECT_EQ(u.bytes[5], 0x3b);
  TEST_EXPECT_EQ(timestamp_ms(u), 0x019909e14c3bULL);
  TEST_EXPECT(is_conforming(u));

  // 48 位上限：最大值可写入，再大一位报错。
  TEST_EXPECT_OK(generate_at(0xFFFF'FFFF'FFFFULL, u));
  TEST_EXPECT_EQ(timestamp_ms(u), 0xFFFF'FFFF'FFFFULL);
  Uuid untouched;
  TEST_EXPECT_EC(generate_at(0x1'0000'0000'0000ULL, untouched), errc::field_width_exceeded);
  TEST_EXPECT(untouched == Uuid{});
}

void test_ordering_follows_timestamp() {
  Uuid prev;
  TEST_EXPECT_OK(generate_at(1000, prev));
  for (std::uint64_t ts = 1001; ts < 1100; ++ts) {
    Uuid next;
    TEST_EXPECT_OK(generate_at(ts, next));
    TEST_EXPECT(prev < next);
    TEST_EXPECT(!(next < prev));
    prev = next;
  }
}

void test_parse_rejects_wrong_length() {
  Uuid u;
  TEST_EXPECT_OK(generate(u));

  Uuid out;
  TEST_EXPECT_EC(parse(bytes_view{u.bytes.data(), 15}, out), errc::malformed_identifier);
  TEST_EXPECT_EC(parse(bytes_view{}, out), errc::malformed_identifier);

  std::vector<byte> longer(u.bytes.begin(), u.bytes.end());
  longer.push_back(0x00);
  TEST_EXPECT_EC(parse(bytes_view{longer.data(), longer.size()}, out), errc::malformed_identifier);
}

void test_parse_rejects_wrong_version_and_variant() {
  Uuid u;
  TEST_EXPECT_OK(generate(u));

  Uuid v4 = u;
  TEST_EXPECT_OK(set_field(v4, Field::version, 4));
  TEST_EXPECT(!is_conforming(v4));
  Uuid out;
  TEST_EXPECT_EC(parse(view_of(v4), out), errc::malformed_identifier);

  Uuid ncs = u;
  TEST_EXPECT_OK(set_field(ncs, Field::variant, 0));
  TEST_EXPECT_EC(parse(view_of(ncs), out), errc::malformed_identifier);

  Uuid microsoft = u;
  TEST_EXPECT_OK(set_field(microsoft, Field::variant, 3));
  TEST_EXPECT_EC(parse(view_of(microsoft), out), errc::malformed_identifier);

  TEST_EXPECT_EC(parse(view_of(Uuid{}), out), errc::malformed_identifier);
}

void test_field_accessors_are_disjoint() {
  Uuid u;
  TEST_EXPECT_OK(generate_at(0x0123456789ABULL, u));
  const auto ts = get_field(u, Field::unix_ts_ms);
  const auto rand_b = get_field(u, Field::rand_b);

  TEST_EXPECT_OK(set_field(u, Field::rand_a, 0xABC));
  TEST_EXPECT_EQ(get_field(u, Field::rand_a), 0xABCU);
  TEST_EXPECT_EQ(get_field(u, Field::unix_ts_ms), ts);
  TEST_EXPECT_EQ(get_field(u, Field::version), 7U);
  TEST_EXPECT_EQ(get_field(u, Field::variant), 2U);
  TEST_EXPECT_EQ(get_field(u, Field::rand_b), rand_b);
  TEST_EXPECT_EQ(u.bytes[6], 0x7A);
  TEST_EXPECT_EQ(u.bytes[7], 0xBC);

  TEST_EXPECT_OK(set_field(u, Field::rand_a, 0));
  TEST_EXPECT_EQ(u.bytes[6], 0x70);
  TEST_EXPECT_EQ(u.bytes[7], 0x00);

  TEST_EXPECT_OK(set_field(u, Field::rand_b, 0x3FFF'FFFF'FFFF'FFFFULL));
  TEST_EXPECT_EQ(get_field(u, Field::variant), 2U);
  TEST_EXPECT_EQ(u.bytes[8], 0xBF);
  TEST_EXPECT_EQ(u.bytes[15], 0xFF);
}

void test_set_field_width_exceeded() {
  Uuid u;
  TEST_EXPECT_OK(generate(u));
  const Uuid before = u;

  TEST_EXPECT_EC(set_field(u, Field::rand_a, 0x1000), errc::field_width_exceeded);
  TEST_EXPECT_EC(set_field(u, Field::version, 0x10), errc::field_width_exceeded);
  TEST_EXPECT_EC(set_field(u, Field::variant, 4), errc::field_width_exceeded);
  TEST_EXPECT_EC(set_field(u, Field::rand_b, 0x4000'0000'0000'0000ULL), errc::field_width_exceeded);
  TEST_EXPECT_EC(set_field(u, Field::unix_ts_ms, 0x1'0000'0000'0000ULL), errc::field_width_exceeded);
  TEST_EXPECT(u == before);
}

void test_text_forms() {
  Uuid u;
  TEST_EXPECT_OK(parse_string(kKnownText, u));
  TEST_EXPECT_EQ(to_string(u), std::string(kKnownText));
  TEST_EXPECT_EQ(to_hex(u), std::string("019909e14c3b70018123456789abcdef"));
  TEST_EXPECT_EQ(timestamp_ms(u), 0x019909e14c3bULL);
  TEST_EXPECT_EQ(get_field(u, Field::rand_a), 0x001U);
  TEST_EXPECT_EQ(get_field(u, Field::rand_b), 0x0123456789abcdefULL);

  Uuid upper;
  TEST_EXPECT_OK(parse_string("019909E1-4C3B-7001-8123-456789ABCDEF", upper));
  TEST_EXPECT(upper == u);

  Uuid undashed;
  TEST_EXPECT_OK(parse_string("019909e14c3b70018123456789abcdef", undashed));
  TEST_EXPECT(undashed == u);
}

void test_text_rejects_malformed() {
  Uuid u;
  TEST_EXPECT_EC(parse_string("not-a-uuid", u), errc::malformed_identifier);
  TEST_EXPECT_EC(parse_string("", u), errc::malformed_identifier);
  // 连字符位置错误。
  TEST_EXPECT_EC(parse_string("019909e14-c3b-7001-8123-456789abcdef", u), errc::malformed_identifier);
  // 非 hex 字符。
  TEST_EXPECT_EC(parse_string("019909e1-4c3b-7001-8123-456789abcdeg", u), errc::malformed_identifier);
  // version 4。
  TEST_EXPECT_EC(parse_string("019909e1-4c3b-4001-8123-456789abcdef", u), errc::malformed_identifier);
  // variant 0b11。
  TEST_EXPECT_EC(parse_string("019909e1-4c3b-7001-c123-456789abcdef", u), errc::malformed_identifier);
}

void test_format_timestamp() {
  Uuid u;
  TEST_EXPECT_OK(parse_string(kKnownText, u));
  std::string ts;
  TEST_EXPECT_OK(format_timestamp(u, ts));
  TEST_EXPECT_EQ(ts, std::string("2025-09-02T10:03:04Z"));

  Uuid epoch;
  TEST_EXPECT_OK(generate_at(999, epoch));
  TEST_EXPECT_OK(format_timestamp(epoch, ts));
  TEST_EXPECT_EQ(ts, std::string("1970-01-01T00:00:00Z"));

  std::string untouched = "keep";
  TEST_EXPECT_EC(format_timestamp(Uuid{}, untouched), errc::malformed_identifier);
  TEST_EXPECT_EQ(untouched, std::string("keep"));
}

void test_random_fields_differ() {
  // 同一毫秒内 rand_b 来自 CSPRNG，两次生成几乎不可能相同。
  Uuid a;
  Uuid b;
  TEST_EXPECT_OK(generate_at(12345, a));
  TEST_EXPECT_OK(generate_at(12345, b));
  TEST_EXPECT(a != b);
  TEST_EXPECT_EQ(timestamp_ms(a), timestamp_ms(b));
}

}  // namespace

int main() {
  test_generate_is_structurally_valid();
  test_generate_uses_current_time();
  test_generate_at_places_timestamp();
  test_ordering_follows_timestamp();
  test_parse_rejects_wrong_length();
  test_parse_rejects_wrong_version_and_variant();
  test_field_accessors_are_disjoint();
  test_set_field_width_exceeded();
  test_text_forms();
  test_text_rejects_malformed();
  test_format_timestamp();
  test_random_fields_differ();
  return ::uuidcat::tests::run_and_report();
}
