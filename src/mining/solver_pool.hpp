/**
 * @file solver_pool.hpp
 * @brief Пул устройств-решателей
 *
 * Пул единолично владеет записями устройств. Поток-супервизор:
 * - применяет свежее задание из слота (ёмкость 1, новое вытесняет старое)
 * - собирает решения устройств в ограниченную очередь (без потерь)
 * - следит за сроком кооперативной отмены и ошибками устройств
 * - перезапускает упавшие устройства с удваивающейся задержкой
 *
 * Ошибка одного устройства не влияет на остальные.
 */

#pragma once

#include "device.hpp"
#include "device_factory.hpp"
#include "../core/channel.hpp"
#include "../core/config.hpp"
#include "../log/logger.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace strata::mining {

/**
 * @brief Параметры пула
 */
struct SolverPoolConfig {
    /// @brief Срок подтверждения нового задания устройством
    std::chrono::milliseconds cancel_deadline{constants::DEFAULT_CANCEL_DEADLINE_MS};

    /// @brief Перезапусков подряд до постоянного Errored
    uint32_t max_restarts = constants::DEFAULT_DEVICE_MAX_RESTARTS;

    /// @brief Базовая задержка перезапуска (удваивается)
    std::chrono::milliseconds restart_backoff{constants::DEFAULT_DEVICE_RESTART_BACKOFF_MS};

    /// @brief Стабильная работа, сбрасывающая счётчик перезапусков
    std::chrono::milliseconds stable_period{constants::DEVICE_STABLE_PERIOD_MS};

    /// @brief Ёмкость очереди решений
    std::size_t solution_queue_size = constants::DEFAULT_SOLUTION_QUEUE_SIZE;

    /// @brief Период опроса устройств
    std::chrono::milliseconds supervise_interval{constants::POOL_SUPERVISE_INTERVAL_MS};

    [[nodiscard]] static SolverPoolConfig from(const MiningConfig& mining);
};

/**
 * @brief Уведомление об изменении состояния устройства (ошибка, перезапуск)
 */
using DeviceEventHandler = std::function<void(const DeviceRecord& record)>;

/**
 * @brief Пул устройств-решателей
 */
class SolverPool {
public:
    /**
     * @param config Параметры пула
     * @param factory Фабрика устройств
     * @param logger Журнал
     * @param solution_signal Сигнал, который дёргается при появлении решений
     */
    SolverPool(SolverPoolConfig config,
               DeviceFactory factory,
               log::Logger& logger,
               std::shared_ptr<EventSignal> solution_signal = nullptr);

    ~SolverPool();

    // Запрещаем копирование
    SolverPool(const SolverPool&) = delete;
    SolverPool& operator=(const SolverPool&) = delete;

    // =========================================================================
    // Устройства
    // =========================================================================

    /**
     * @brief Зарегистрировать устройство в состоянии Stopped
     *
     * @return device_id или ConfigUnknownDevice
     */
    [[nodiscard]] Result<uint32_t> add_device(const DeviceDescriptor& descriptor);

    /**
     * @brief Зарегистрировать готовый адаптер
     */
    uint32_t add_device(const DeviceDescriptor& descriptor,
                        std::unique_ptr<DeviceAdapter> adapter);

    /**
     * @brief Снимок записей устройств
     */
    [[nodiscard]] std::vector<DeviceRecord> records() const;

    [[nodiscard]] std::size_t device_count() const;

    /**
     * @brief Снять с устройства постоянный Errored и запустить его снова
     */
    [[nodiscard]] Result<void> restart_device(uint32_t device_id);

    /**
     * @brief Заменить набор устройств
     *
     * Все новые устройства создаются до остановки старых: при ошибке
     * текущий набор не меняется. Если пул работал, новые устройства
     * запускаются и получают текущее задание.
     */
    [[nodiscard]] Result<void> reload(const std::vector<DeviceDescriptor>& descriptors);

    /**
     * @brief Установить обработчик событий устройств
     */
    void set_device_event_handler(DeviceEventHandler handler);

    // =========================================================================
    // Управление
    // =========================================================================

    /**
     * @brief Запустить все устройства и супервизор (идемпотентно)
     *
     * Ошибка запуска отдельного устройства фиксируется в его записи.
     */
    void start_all();

    /**
     * @brief Остановить супервизор и все устройства (идемпотентно)
     */
    void stop_all();

    [[nodiscard]] bool is_running() const noexcept;

    // =========================================================================
    // Задания и решения
    // =========================================================================

    /**
     * @brief Передать задание всем устройствам (не ждёт подтверждения)
     */
    void dispatch_job(const Job& job);

    /**
     * @brief Забрать накопленные решения всех устройств в порядке поступления
     */
    [[nodiscard]] std::vector<Solution> drain_solutions();

    /// @brief Последнее применённое задание
    [[nodiscard]] std::optional<Job> current_job() const;

    /// @brief Сколько заданий было вытеснено в слоте до применения
    [[nodiscard]] uint64_t superseded_jobs() const;

    /**
     * @brief Один проход супервизора
     *
     * Вызывается потоком-супервизором; открыт для детерминированных тестов.
     */
    void supervise_once();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace strata::mining
