#include "uuidcat/utils/uuid_dump.hpp"

#include "uuidcat/category/categorized.hpp"

#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <vector>

namespace uuidcat::utils {
namespace {

struct Ansi final {
    static constexpr const char *reset = "\033[0m";
    static constexpr const char *header = "\033[1;36m";
    static constexpr const char *key = "\033[1;32m";
    static constexpr const char *value = "\033[1;37m";
    static constexpr const char *error = "\033[1;31m";
};

[[nodiscard]] const char *ansi_(bool enable, const char *code) noexcept {
    return enable ? code : "";
}

[[nodiscard]] std::string fmt_hex_(std::uint64_t v, int digits) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setw(digits) << std::setfill('0') << v;
    return oss.str();
}

void append_summary_(std::ostringstream &oss,
                     const uuidcat::category::CategoryRegistry &registry,
                     const uuidcat::id::Uuid &uuid,
                     bool enable_color) {
    using uuidcat::id::Field;

    const auto *reset = ansi_(enable_color, Ansi::reset);
    const auto *header = ansi_(enable_color, Ansi::header);
    const auto *error = ansi_(enable_color, Ansi::error);

    oss << header << "UUIDv7Cat" << reset << "(ver=" << uuidcat::id::get_field(uuid, Field::version)
        << ", variant=" << uuidcat::id::get_field(uuid, Field::variant);

    if (!uuidcat::id::is_conforming(uuid)) {
        oss << ", " << error << "MALFORMED" << reset << ")";
        return;
    }

    oss << ", unix_ts_ms=" << uuidcat::id::timestamp_ms(uuid);
    std::string ts;
    if (!uuidcat::id::format_timestamp(uuid, ts)) {
        oss << ", ts=" << ts;
    }

    const auto code = uuidcat::id::get_field(uuid, Field::rand_a);
    std::string name;
    if (uuidcat::category::extract(registry, uuid, name)) {
        oss << ", cat=" << error << "INVALID(" << code << ")" << reset << ")";
        return;
    }
    oss << ", cat=" << name << "(" << code << "))";
}

void append_fields_(std::ostringstream &oss, const uuidcat::id::Uuid &uuid, bool enable_color) {
    using uuidcat::id::Field;

    const auto *reset = ansi_(enable_color, Ansi::reset);
    const auto *key = ansi_(enable_color, Ansi::key);
    const auto *value = ansi_(enable_color, Ansi::value);

    struct Row final {
        const char *name;
        Field field;
        int digits;
    };
    constexpr Row rows[] = {
        {"unix_ts_ms", Field::unix_ts_ms, 12},
        {"version", Field::version, 1},
        {"rand_a", Field::rand_a, 3},
        {"variant", Field::variant, 1},
        {"rand_b", Field::rand_b, 16},
    };
    for (const auto &row : rows) {
        oss << "  " << key << row.name << reset << "=" << value
            << fmt_hex_(uuidcat::id::get_field(uuid, row.field), row.digits) << reset << '\n';
    }
}

} // namespace

std::string describe(const uuidcat::category::CategoryRegistry &registry,
                     const uuidcat::id::Uuid &uuid,
                     UuidDumpOptions options) {
    std::ostringstream oss;
    append_summary_(oss, registry, uuid, options.enable_color);
    if (!options.include_fields && !options.include_hex) {
        return oss.str();
    }
    oss << '\n';
    if (options.include_fields) {
        append_fields_(oss, uuid, options.enable_color);
    }
    if (options.include_hex) {
        auto hex = options.hex;
        hex.enable_color = options.enable_color;
        oss << hex_dump(uuidcat::core::bytes_view{uuid.bytes.data(), uuid.bytes.size()}, hex);
    }
    return oss.str();
}

std::string describe_text(const uuidcat::category::CategoryRegistry &registry,
                          std::string_view text,
                          UuidDumpOptions options) {
    // 与 parse_string 不同：这里先只做文本 -> 字节转换，不校验 version/variant，
    // 以便对非 v7 输入也能输出 MALFORMED 摘要。
    std::vector<uuidcat::core::byte> raw;
    auto ec = parse_hex(text, raw);
    if (ec || raw.size() != uuidcat::id::kUuidSize) {
        const auto *reset = ansi_(options.enable_color, Ansi::reset);
        const auto *error = ansi_(options.enable_color, Ansi::error);
        std::ostringstream oss;
        oss << error << "invalid uuid text";
        if (ec) {
            oss << ": " << ec.message();
        } else {
            oss << ": expected 16 bytes, got " << raw.size();
        }
        oss << reset;
        return oss.str();
    }

    uuidcat::id::Uuid uuid;
    std::copy(raw.begin(), raw.end(), uuid.bytes.begin());
    return describe(registry, uuid, options);
}

} // namespace uuidcat::utils
