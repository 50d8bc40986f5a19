/**
 * @file job_tracker.hpp
 * @brief Учёт текущего задания и окна приёма поздних решений
 *
 * Чистая логика без потоков: время передаётся явно.
 *
 * - Задание принимается только при строго большей высоте.
 * - Вытесненное задание остаётся в окне приёма (grace window):
 *   решения по нему ещё принимаются, пока окно не истекло.
 * - Решения по более старым заданиям считаются устаревшими.
 */

#pragma once

#include "job.hpp"

#include <chrono>
#include <optional>
#include <string_view>

namespace strata::mining {

/**
 * @brief Состояние оркестратора по отношению к заданиям
 */
enum class TrackerState {
    Idle,           ///< Заданий ещё не было
    Dispatching,    ///< Текущее задание передано устройствам
    Draining,       ///< Предыдущее задание в окне приёма
    ShuttingDown    ///< Остановка, задания не принимаются
};

[[nodiscard]] constexpr std::string_view to_string(TrackerState state) noexcept {
    switch (state) {
        case TrackerState::Idle:         return "Idle";
        case TrackerState::Dispatching:  return "Dispatching";
        case TrackerState::Draining:     return "Draining";
        case TrackerState::ShuttingDown: return "ShuttingDown";
        default: return "Unknown";
    }
}

/**
 * @brief Решение по пришедшему заданию
 */
enum class JobDecision {
    Dispatch,           ///< Новое задание, передать устройствам
    IgnoredDuplicate,   ///< Та же высота или тот же job_id
    IgnoredStale,       ///< Высота меньше текущей
    IgnoredShutdown     ///< Оркестратор останавливается
};

/**
 * @brief Вердикт по решению
 */
enum class SolutionVerdict {
    Current,        ///< Текущее задание
    Grace,          ///< Предыдущее задание, окно приёма открыто
    Stale,          ///< Устаревшее задание или окно истекло
    LowDifficulty,  ///< Сложность ниже цели задания
    Malformed       ///< Неверный формат решения
};

[[nodiscard]] constexpr std::string_view to_string(SolutionVerdict verdict) noexcept {
    switch (verdict) {
        case SolutionVerdict::Current:       return "current";
        case SolutionVerdict::Grace:         return "grace";
        case SolutionVerdict::Stale:         return "stale";
        case SolutionVerdict::LowDifficulty: return "low difficulty";
        case SolutionVerdict::Malformed:     return "malformed";
        default: return "unknown";
    }
}

/**
 * @brief Учёт заданий оркестратора
 */
class JobTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit JobTracker(std::chrono::milliseconds grace_window);

    /**
     * @brief Обработать пришедшее задание
     */
    JobDecision accept(const Job& job, Clock::time_point now);

    /**
     * @brief Классифицировать решение
     *
     * Формат проверяется первым, затем принадлежность заданию, затем
     * сложность относительно цели этого задания.
     */
    [[nodiscard]] SolutionVerdict classify(const Solution& solution, Clock::time_point now);

    /**
     * @brief Закрыть окно приёма, если оно истекло
     */
    void expire(Clock::time_point now);

    /**
     * @brief Перейти в ShuttingDown
     */
    void shut_down() noexcept;

    /**
     * @brief Снова принимать задания после остановки
     *
     * Высота последнего задания сохраняется: более старые задания
     * по-прежнему игнорируются.
     */
    void resume() noexcept;

    [[nodiscard]] TrackerState state() const noexcept { return state_; }
    [[nodiscard]] const std::optional<Job>& current() const noexcept { return current_; }
    [[nodiscard]] const std::optional<Job>& previous() const noexcept { return previous_; }

    /// @brief Задание по job_id среди текущего и предыдущего
    [[nodiscard]] const Job* find(std::string_view job_id) const noexcept;

    [[nodiscard]] std::chrono::milliseconds grace_window() const noexcept { return grace_window_; }

private:
    std::chrono::milliseconds grace_window_;
    TrackerState state_ = TrackerState::Idle;
    std::optional<Job> current_;
    std::optional<Job> previous_;
    Clock::time_point grace_deadline_;
};

} // namespace strata::mining
