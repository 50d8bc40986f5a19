/**
 * @file device_factory.hpp
 * @brief Фабрика устройств по type_filter
 *
 * Семейства устройств регистрируются при старте; конкретный класс
 * выбирается по type_filter из конфигурации.
 */

#pragma once

#include "device.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace strata::mining {

/**
 * @brief Фабрика устройств
 */
class DeviceFactory {
public:
    using Creator = std::function<std::unique_ptr<DeviceAdapter>(const DeviceDescriptor&)>;

    /**
     * @brief Фабрика со встроенными семействами (simulated_cpu, simulated_gpu)
     */
    [[nodiscard]] static DeviceFactory with_builtin_devices();

    /**
     * @brief Зарегистрировать семейство (перезаписывает существующее)
     */
    void register_family(std::string type_filter, Creator creator);

    /**
     * @brief Создать устройство по описанию
     *
     * @return Устройство или ConfigUnknownDevice
     */
    [[nodiscard]] Result<std::unique_ptr<DeviceAdapter>> create(
        const DeviceDescriptor& descriptor) const;

    [[nodiscard]] bool knows(std::string_view type_filter) const;

    /// @brief Зарегистрированные семейства
    [[nodiscard]] std::vector<std::string> families() const;

private:
    std::map<std::string, Creator, std::less<>> creators_;
};

} // namespace strata::mining
