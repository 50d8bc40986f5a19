/**
 * @file stats.hpp
 * @brief Агрегатор статистики майнинга
 *
 * С фиксированным интервалом опрашивает провайдеров (устройства пула,
 * состояние сессии, счётчики оркестратора) и публикует неизменяемый
 * снимок StatsSnapshot. Каждый тик создаёт новый снимок, старый
 * не изменяется. Пропущенные тики не навёрстываются.
 */

#pragma once

#include "../core/types.hpp"
#include "../mining/device.hpp"
#include "../stratum/stratum_session.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace strata::monitoring {

// =============================================================================
// Данные провайдеров
// =============================================================================

/**
 * @brief Счётчики решений оркестратора
 */
struct ShareCounters {
    uint64_t found = 0;           ///< Получено от устройств
    uint64_t submitted = 0;       ///< Отправлено серверу
    uint64_t accepted = 0;        ///< Принято сервером
    uint64_t rejected = 0;        ///< Отклонено сервером
    uint64_t stale = 0;           ///< Отброшено как устаревшие
    uint64_t low_difficulty = 0;  ///< Отброшено: сложность ниже цели
    uint64_t malformed = 0;       ///< Отброшено: неверный формат
    uint64_t unanswered = 0;      ///< Без ответа (обрыв, таймаут, вытеснение)
};

/**
 * @brief Состояние оркестратора
 */
struct MiningProgress {
    std::string state = "Idle";
    bool mining = false;
    std::string job_id;
    uint64_t height = 0;
    uint64_t difficulty = 0;
    uint64_t jobs_dispatched = 0;
    uint64_t jobs_ignored = 0;
    std::size_t pending_submissions = 0;
    ShareCounters shares;
};

/**
 * @brief Источники данных для агрегатора
 *
 * Каждый провайдер возвращает копию: агрегатор не видит внутреннего
 * состояния компонентов. Отсутствующий провайдер пропускается.
 */
struct StatsProviders {
    std::function<std::vector<mining::DeviceRecord>()> devices;
    std::function<stratum::SessionInfo()> session;
    std::function<MiningProgress()> mining;
};

// =============================================================================
// Снимок
// =============================================================================

/**
 * @brief Статистика одного устройства
 */
struct DeviceSample {
    uint32_t device_id = 0;
    std::string plugin;
    std::string device_name;
    uint32_t edge_bits = 0;
    mining::DeviceStatus status = mining::DeviceStatus::Stopped;
    bool in_use = false;
    bool has_errored = false;
    std::string last_error;
    uint64_t attempts = 0;

    /// @brief Попыток (графов) в секунду между двумя последними тиками
    double attempts_per_sec = 0.0;

    std::chrono::nanoseconds last_attempt_time{0};
};

/**
 * @brief Неизменяемый снимок статистики
 */
struct StatsSnapshot {
    std::chrono::steady_clock::time_point taken_at;
    std::chrono::seconds uptime{0};

    // Сессия
    std::string session_state = "Disconnected";
    bool connected = false;
    std::string endpoint;
    uint64_t reconnects = 0;

    /// @brief Время текущего подключения (ноль без подключения)
    std::chrono::seconds session_uptime{0};

    std::size_t queued_submissions = 0;
    uint64_t dropped_submissions = 0;
    std::optional<std::chrono::system_clock::time_point> last_message_sent;
    std::optional<std::chrono::system_clock::time_point> last_message_received;

    // Майнинг
    std::string orchestrator_state = "Idle";
    std::string job_id;
    uint64_t current_height = 0;
    uint64_t target_difficulty = 0;
    ShareCounters shares;

    // Устройства
    std::vector<DeviceSample> devices;
    double global_attempts_per_sec = 0.0;

    /**
     * @brief Строка статуса "Mining at height H at X GPS"
     */
    [[nodiscard]] std::string mining_status() const;
};

using SnapshotPtr = std::shared_ptr<const StatsSnapshot>;

// =============================================================================
// Stats Aggregator
// =============================================================================

/**
 * @brief Периодический сборщик статистики
 */
class StatsAggregator {
public:
    using Clock = std::chrono::steady_clock;

    /**
     * @param interval Интервал тиков
     * @param providers Источники данных
     */
    StatsAggregator(std::chrono::milliseconds interval, StatsProviders providers);

    ~StatsAggregator();

    // Запрещаем копирование
    StatsAggregator(const StatsAggregator&) = delete;
    StatsAggregator& operator=(const StatsAggregator&) = delete;

    /**
     * @brief Запустить периодический сбор (идемпотентно)
     */
    void start();

    /**
     * @brief Остановить периодический сбор (идемпотентно)
     */
    void stop();

    [[nodiscard]] bool is_running() const noexcept;

    /**
     * @brief Снять снимок немедленно
     *
     * @param now Момент снимка (скорости считаются по нему)
     */
    SnapshotPtr sample(Clock::time_point now = Clock::now());

    /**
     * @brief Последний опубликованный снимок (никогда не nullptr)
     */
    [[nodiscard]] SnapshotPtr snapshot() const;

    /// @brief Число снятых снимков
    [[nodiscard]] uint64_t samples_taken() const;

    /// @brief Число пропущенных тиков
    [[nodiscard]] uint64_t ticks_skipped() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// =============================================================================
// Форматирование
// =============================================================================

/**
 * @brief Форматировать скорость поиска
 *
 * @param graphs_per_sec Графов в секунду
 * @return std::string Например "3.25 GPS" или "1.20 KGPS"
 */
[[nodiscard]] std::string format_rate(double graphs_per_sec);

/**
 * @brief Форматировать время для отображения
 *
 * @param seconds Время в секундах
 * @return std::string Форматированная строка (например, "1d 2h 30m")
 */
[[nodiscard]] std::string format_duration(std::chrono::seconds seconds);

} // namespace strata::monitoring
