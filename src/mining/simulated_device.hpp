/**
 * @file simulated_device.hpp
 * @brief Симулируемое устройство-решатель
 *
 * Семейства "simulated_cpu" и "simulated_gpu". Цикл поиска расходует
 * время на попытки и с заданной вероятностью выдаёт синтетические
 * решения корректного формата. Используется вместо реальных плагинов
 * при разработке и в тестах.
 *
 * Параметры устройства (device_parameters):
 * - ATTEMPTS_PER_SEC  - попыток (графов) в секунду
 * - SOLUTION_RATE     - вероятность решения на попытку (0..1)
 * - FAIL_AFTER_MS     - смоделировать сбой через N мс работы (0 = никогда)
 */

#pragma once

#include "device.hpp"

#include <memory>
#include <string>

namespace strata::mining {

/// @brief Семейство симулируемых CPU решателей
inline constexpr std::string_view SIMULATED_CPU = "simulated_cpu";

/// @brief Семейство симулируемых GPU решателей
inline constexpr std::string_view SIMULATED_GPU = "simulated_gpu";

/**
 * @brief Симулируемое устройство
 */
class SimulatedDevice : public DeviceAdapter {
public:
    /**
     * @param family Семейство (SIMULATED_CPU или SIMULATED_GPU)
     */
    explicit SimulatedDevice(std::string family);

    ~SimulatedDevice() override;

    // Запрещаем копирование
    SimulatedDevice(const SimulatedDevice&) = delete;
    SimulatedDevice& operator=(const SimulatedDevice&) = delete;

    [[nodiscard]] Result<void> start(const DeviceDescriptor& descriptor) override;
    void stop() override;
    void set_job(const Job& job) override;
    [[nodiscard]] std::vector<Solution> poll_solutions() override;
    [[nodiscard]] DeviceStats stats() const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace strata::mining
