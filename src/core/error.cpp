#include "uuidcat/core/error.hpp"

#include <string>

namespace uuidcat::core {
namespace {

// core::errc 的 std::error_category 实现：
// - name() 用于区分错误域
// - message() 返回可读的英文描述（便于调试与日志）
class uuidcat_error_category final : public std::error_category {
 public:
  const char* name() const noexcept override { return "uuidcat.core"; }

  std::string message(int ev) const override {
    switch (static_cast<errc>(ev)) {
      case errc::ok:
        return "ok";
      case errc::invalid_argument:
        return "invalid argument";
      case errc::entropy_unavailable:
        return "entropy source unavailable";
      default:
        return "unknown uuidcat.core error";
    }
  }
};

}  // 匿名命名空间

const std::error_category& error_category() noexcept {
  static uuidcat_error_category category;
  return category;
}

std::error_code make_error_code(errc e) noexcept {
  return {static_cast<int>(e), error_category()};
}

}  // 命名空间 uuidcat::core
