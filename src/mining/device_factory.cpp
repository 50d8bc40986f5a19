/**
 * @file device_factory.cpp
 * @brief Реализация фабрики устройств
 */

#include "device_factory.hpp"
#include "simulated_device.hpp"

#include <format>

namespace strata::mining {

DeviceFactory DeviceFactory::with_builtin_devices() {
    DeviceFactory factory;
    for (auto family : {SIMULATED_CPU, SIMULATED_GPU}) {
        factory.register_family(std::string(family),
            [family](const DeviceDescriptor&) -> std::unique_ptr<DeviceAdapter> {
                return std::make_unique<SimulatedDevice>(std::string(family));
            });
    }
    return factory;
}

void DeviceFactory::register_family(std::string type_filter, Creator creator) {
    creators_[std::move(type_filter)] = std::move(creator);
}

Result<std::unique_ptr<DeviceAdapter>> DeviceFactory::create(
    const DeviceDescriptor& descriptor) const {
    auto it = creators_.find(descriptor.type_filter);
    if (it == creators_.end()) {
        return Err<std::unique_ptr<DeviceAdapter>>(ErrorCode::ConfigUnknownDevice,
            std::format("Неизвестный type_filter '{}' ({})",
                        descriptor.type_filter, descriptor.name()));
    }

    auto device = it->second(descriptor);
    if (!device) {
        return Err<std::unique_ptr<DeviceAdapter>>(ErrorCode::DeviceStartFailed,
            std::format("Не удалось создать устройство {}", descriptor.name()));
    }
    return device;
}

bool DeviceFactory::knows(std::string_view type_filter) const {
    return creators_.find(type_filter) != creators_.end();
}

std::vector<std::string> DeviceFactory::families() const {
    std::vector<std::string> result;
    for (const auto& [name, creator] : creators_) {
        result.push_back(name);
    }
    return result;
}

} // namespace strata::mining
