/**
 * @file orchestrator.hpp
 * @brief Координатор майнинга
 *
 * Единственный владелец "текущего задания". Поток координатора ждёт на
 * общем EventSignal и по очереди опрашивает:
 * 1. события сессии (задания, ответы, обрывы) в порядке поступления
 * 2. решения пула
 *
 * Задание передаётся пулу только при строго большей высоте. Решения
 * проверяются (формат, задание, сложность) и отправляются через сессию
 * ровно один раз; ответы сопоставляются по RequestHandle.
 */

#pragma once

#include "job_tracker.hpp"
#include "solver_pool.hpp"
#include "../core/channel.hpp"
#include "../log/logger.hpp"
#include "../log/status_reporter.hpp"
#include "../monitoring/stats.hpp"
#include "../stratum/stratum_session.hpp"

#include <chrono>
#include <memory>
#include <vector>

namespace strata::mining {

/**
 * @brief Координатор: сессия -> пул -> сессия
 */
class Orchestrator {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param grace_window Окно приёма решений для вытесненного задания
     * @param pool Пул устройств
     * @param session Stratum сессия
     * @param signal Общий сигнал пробуждения (тот же, что у пула и сессии)
     * @param logger Журнал
     * @param reporter Лента событий (может быть nullptr)
     */
    Orchestrator(std::chrono::milliseconds grace_window,
                 SolverPool& pool,
                 stratum::StratumSession& session,
                 std::shared_ptr<EventSignal> signal,
                 log::Logger& logger,
                 log::StatusReporter* reporter = nullptr);

    ~Orchestrator();

    // Запрещаем копирование
    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // =========================================================================
    // Управление
    // =========================================================================

    /**
     * @brief Запустить устройства, сессию и поток координатора
     *
     * Идемпотентно.
     */
    void start_mining();

    /**
     * @brief Остановить майнинг
     *
     * Останавливает пул, отправляет уже найденные решения, ждёт ответов
     * не дольше SHUTDOWN_RESPONSE_WAIT_MS и закрывает сессию последней.
     * Повторный вызов ничего не делает.
     */
    void stop_mining();

    [[nodiscard]] bool is_mining() const noexcept;

    /**
     * @brief Заменить набор устройств
     */
    [[nodiscard]] Result<void> reload_device_config(const std::vector<DeviceDescriptor>& descriptors);

    /**
     * @brief Перезапустить устройства, исключённые после серии сбоев
     *
     * @return std::size_t Число перезапущенных устройств
     */
    std::size_t restart_errored_devices();

    // =========================================================================
    // Состояние
    // =========================================================================

    /**
     * @brief Копия состояния и счётчиков
     */
    [[nodiscard]] monitoring::MiningProgress status() const;

    [[nodiscard]] TrackerState state() const;

    /**
     * @brief Один проход координатора: события сессии, затем решения пула
     *
     * Вызывается потоком координатора; открыт для детерминированных тестов.
     */
    void process_once(Clock::time_point now = Clock::now());

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace strata::mining
