/**
 * @file device.hpp
 * @brief Контракт устройства-решателя
 *
 * Любое семейство устройств (CPU, GPU, симулятор) реализует DeviceAdapter.
 * Пул решателей работает только через этот интерфейс и не знает
 * внутреннего устройства алгоритма поиска.
 */

#pragma once

#include "job.hpp"
#include "../core/config.hpp"
#include "../core/types.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace strata::mining {

// =============================================================================
// Состояние устройства
// =============================================================================

/**
 * @brief Статус устройства в пуле
 */
enum class DeviceStatus {
    Stopped,
    Starting,
    Running,
    Errored
};

[[nodiscard]] constexpr std::string_view to_string(DeviceStatus status) noexcept {
    switch (status) {
        case DeviceStatus::Stopped:  return "Stopped";
        case DeviceStatus::Starting: return "Starting";
        case DeviceStatus::Running:  return "Running";
        case DeviceStatus::Errored:  return "Errored";
        default: return "Unknown";
    }
}

/**
 * @brief Статистика, сообщаемая самим устройством
 */
struct DeviceStats {
    /// @brief Имя устройства, как его видит плагин
    std::string device_name;

    /// @brief Накопленное число попыток (графов)
    uint64_t attempts = 0;

    /// @brief Длительность последней попытки
    std::chrono::nanoseconds last_attempt_time{0};

    /// @brief Задание, над которым сейчас работает цикл поиска
    std::string active_job_id;

    /// @brief Занято ли устройство поиском
    bool in_use = false;

    /// @brief Устройство сообщило об ошибке
    bool has_errored = false;

    /// @brief Текст ошибки устройства
    std::string error;
};

/**
 * @brief Запись об устройстве (снимок, принадлежит пулу)
 */
struct DeviceRecord {
    uint32_t device_id = 0;
    DeviceDescriptor descriptor;
    DeviceStatus status = DeviceStatus::Stopped;

    /// @brief Накопленное число попыток за всё время (через перезапуски)
    uint64_t attempts = 0;

    std::string last_error;

    /// @brief Перезапусков подряд с последнего стабильного периода
    uint32_t restart_count = 0;

    /// @brief Исключено из работы до явного restart_device()
    bool permanently_errored = false;

    /// @brief Последняя статистика устройства
    DeviceStats stats;
};

// =============================================================================
// CancellationToken
// =============================================================================

/**
 * @brief Токен кооперативной отмены
 *
 * Счётчик поколений: каждое новое задание увеличивает поколение, цикл
 * поиска запоминает своё поколение и регулярно сверяет его с текущим.
 */
class CancellationToken {
public:
    /**
     * @brief Начать новое поколение (отменяет текущий поиск)
     *
     * @return uint64_t Новое поколение
     */
    uint64_t advance() noexcept {
        return generation_.fetch_add(1, std::memory_order_acq_rel) + 1;
    }

    [[nodiscard]] uint64_t current() const noexcept {
        return generation_.load(std::memory_order_acquire);
    }

    /**
     * @brief Отменено ли поколение generation
     */
    [[nodiscard]] bool cancelled(uint64_t generation) const noexcept {
        return current() != generation;
    }

private:
    std::atomic<uint64_t> generation_{0};
};

// =============================================================================
// DeviceAdapter
// =============================================================================

/**
 * @brief Интерфейс устройства-решателя
 *
 * Поиск выполняется в собственном потоке устройства. Все методы
 * вызываются потоком-супервизором пула и должны возвращаться быстро.
 */
class DeviceAdapter {
public:
    virtual ~DeviceAdapter() = default;

    /**
     * @brief Запустить устройство
     *
     * @param descriptor Параметры из конфигурации (передаются без интерпретации)
     * @return Result<void> Успех или DeviceStartFailed
     */
    [[nodiscard]] virtual Result<void> start(const DeviceDescriptor& descriptor) = 0;

    /**
     * @brief Остановить устройство и освободить ресурсы (идемпотентно)
     */
    virtual void stop() = 0;

    /**
     * @brief Передать новое задание
     *
     * Безопасно во время поиска по предыдущему заданию: текущий поиск
     * отменяется через CancellationToken.
     */
    virtual void set_job(const Job& job) = 0;

    /**
     * @brief Забрать найденные решения
     */
    [[nodiscard]] virtual std::vector<Solution> poll_solutions() = 0;

    /**
     * @brief Текущая статистика устройства
     */
    [[nodiscard]] virtual DeviceStats stats() const = 0;
};

} // namespace strata::mining
