#pragma once

#include "uuidcat/core/common.hpp"
#include "uuidcat/core/error.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace uuidcat::utils {

/**
 * @brief 16 进制解析/格式化工具。
 *
 * 典型使用场景：
 * - 从日志/数据库导出里复制一段 “01 8f 3a ...” 的原始字节，解析为 bytes 后交给 id::parse；
 * - 将标识符的 16 字节以 hexdump 形式输出，便于对照位域排查。
 */

struct HexDumpOptions final {
    // 每行字节数（UUID 场景下 8 或 16 最直观）。
    std::size_t bytes_per_line{16};

    // 是否输出行首偏移（0000:）。
    bool show_offset{true};

    // 是否输出 ANSI 颜色控制码（写入日志/文件时建议关闭）。
    bool enable_color{false};
};

[[nodiscard]] std::string hex_dump(uuidcat::core::bytes_view bytes,
                                   HexDumpOptions options = {});

/**
 * @brief 解析 16 进制字符串为 bytes。
 *
 * 支持大小写 hex、常见分隔符（空白、逗号、冒号、连字符等）以及 0x/0X 前缀。
 * 失败返回 core::errc::invalid_argument。
 */
std::error_code parse_hex(std::string_view text,
                          std::vector<uuidcat::core::byte> &out) noexcept;

} // namespace uuidcat::utils
