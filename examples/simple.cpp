/**
 * @file simple.cpp
 * @brief 演示分类 UUIDv7 的基本用法
 *
 * 本示例展示如何：
 * 1. 在启动阶段用 TypedCategories 绑定应用自己的 enum
 * 2. 生成携带分类的 UUID，并输出文本形式
 * 3. 从 UUID 中取回分类与时间戳
 */

#include <uuidcat/category/registry.hpp>
#include <uuidcat/category/typed.hpp>
#include <uuidcat/core/log.hpp>
#include <uuidcat/id/uuid.hpp>
#include <uuidcat/utils/uuid_dump.hpp>

#include <iostream>
#include <string>

using namespace uuidcat;

namespace {

enum class Vehicle {
    car,
    truck,
    bus,
};

[[nodiscard]] const char *vehicle_name(Vehicle v) noexcept {
    switch (v) {
    case Vehicle::car:
        return "car";
    case Vehicle::truck:
        return "truck";
    case Vehicle::bus:
        return "bus";
    }
    return "?";
}

} // namespace

int main() {
    core::set_log_level(core::LogLevel::info);

    // 启动阶段（单线程）完成一次性配置。
    category::TypedCategories<Vehicle> vehicles(category::global_registry());
    auto ec = vehicles.set(
        {{Vehicle::car, "CAR"}, {Vehicle::truck, "TRUCK"}, {Vehicle::bus, "BUS"}});
    if (ec) {
        std::cerr << "配置分类失败: " << ec.message() << "\n";
        return 1;
    }

    id::Uuid uuid;
    ec = vehicles.generate(Vehicle::truck, uuid);
    if (ec) {
        std::cerr << "生成失败: " << ec.message() << "\n";
        return 1;
    }
    std::cout << id::to_string(uuid) << "\n";

    Vehicle decoded = Vehicle::car;
    ec = vehicles.extract(uuid, decoded);
    if (ec) {
        std::cerr << "解析分类失败: " << ec.message() << "\n";
        return 1;
    }
    std::cout << "分类: " << vehicle_name(decoded) << "\n";

    std::string ts;
    ec = id::format_timestamp(uuid, ts);
    if (!ec) {
        std::cout << "时间: " << ts << "\n";
    }

    std::cout << utils::describe(category::global_registry(), uuid) << "\n";
    return 0;
}
