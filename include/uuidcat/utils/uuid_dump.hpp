#pragma once

#include "uuidcat/category/registry.hpp"
#include "uuidcat/id/uuid.hpp"
#include "uuidcat/utils/hex.hpp"

#include <string>
#include <string_view>

namespace uuidcat::utils {

/**
 * @brief 分类 UUID 的可视化输出（调试/日志排查用途）。
 */
struct UuidDumpOptions final {
    // 是否在摘要行后逐个输出 5 个位域的取值。
    bool include_fields{false};

    // 是否附带 16 字节 hexdump。
    bool include_hex{false};

    // hexdump 选项（include_hex=true 时生效）。
    HexDumpOptions hex{};

    // 是否输出 ANSI 颜色控制码。
    bool enable_color{false};
};

/**
 * @brief 输出一行摘要，形如：
 *   UUIDv7Cat(ver=7, variant=2, unix_ts_ms=..., ts=2025-09-02T10:00:00Z, cat=TYPE_A(1))
 *
 * 分类码未注册时为 cat=INVALID(code)；version/variant 不符时为 MALFORMED。
 */
[[nodiscard]] std::string describe(const uuidcat::category::CategoryRegistry &registry,
                                   const uuidcat::id::Uuid &uuid,
                                   UuidDumpOptions options = {});

/**
 * @brief 解析文本形式的 UUID 后输出；解析失败时返回的字符串包含错误信息。
 */
[[nodiscard]] std::string describe_text(const uuidcat::category::CategoryRegistry &registry,
                                        std::string_view text,
                                        UuidDumpOptions options = {});

} // namespace uuidcat::utils
