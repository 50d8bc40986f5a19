/**
 * @file status_reporter.hpp
 * @brief Терминальный репортёр статуса майнера
 *
 * Периодически выводит в терминал текущий снимок статистики с ANSI
 * форматированием:
 * - Uptime и состояние подключения к stratum серверу
 * - Строка "Mining at height H at X GPS" и целевая сложность
 * - Счётчики принятых, отклонённых и устаревших решений
 * - Таблица устройств
 * - Кольцевой буфер событий
 *
 * Репортёр только читает: на работу майнера он не влияет.
 */

#pragma once

#include "logger.hpp"
#include "../core/constants.hpp"
#include "../core/types.hpp"
#include "../monitoring/stats.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace strata::log {

// =============================================================================
// Типы событий
// =============================================================================

/**
 * @brief Тип события ленты
 */
enum class EventType {
    NewJob,            ///< Задание передано устройствам
    JobIgnored,        ///< Задание проигнорировано (старое)
    SubmitOk,          ///< Решение принято сервером
    SubmitFail,        ///< Решение отклонено или осталось без ответа
    StaleShare,        ///< Решение отброшено как устаревшее
    ConnectionLost,    ///< Подключение потеряно
    Reconnected,       ///< Подключение восстановлено
    DeviceError,       ///< Ошибка устройства
    DeviceRestart,     ///< Устройство перезапущено
    Info,              ///< Строка журнала уровня Info
    Warning,           ///< Строка журнала уровня Warning
    Error              ///< Ошибка
};

/**
 * @brief Преобразование типа события в строку
 */
[[nodiscard]] constexpr std::string_view event_type_to_string(EventType type) noexcept {
    switch (type) {
        case EventType::NewJob:         return "NEW_JOB";
        case EventType::JobIgnored:     return "JOB_IGNORED";
        case EventType::SubmitOk:       return "SUBMIT_OK";
        case EventType::SubmitFail:     return "SUBMIT_FAIL";
        case EventType::StaleShare:     return "STALE";
        case EventType::ConnectionLost: return "CONN_LOST";
        case EventType::Reconnected:    return "RECONNECTED";
        case EventType::DeviceError:    return "DEV_ERROR";
        case EventType::DeviceRestart:  return "DEV_RESTART";
        case EventType::Info:           return "INFO";
        case EventType::Warning:        return "WARN";
        case EventType::Error:          return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Запись события
 */
struct EventRecord {
    EventType type;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::string source;  ///< Компонент-источник ("pool", "stratum", ...)
};

/**
 * @brief Подписчик на ленту событий
 */
using EventSubscriber = std::function<void(const EventRecord&)>;

// =============================================================================
// Конфигурация
// =============================================================================

/**
 * @brief Настройки репортёра
 */
struct ReporterConfig {
    /// @brief Интервал обновления экрана (мс)
    uint32_t refresh_interval_ms = 1000;

    /// @brief Размер истории событий
    std::size_t event_history = constants::DEFAULT_EVENT_HISTORY;

    /// @brief Использовать ANSI форматирование
    bool color = true;

    /// @brief Сколько последних событий показывать на экране
    std::size_t events_on_screen = 10;
};

/**
 * @brief Источник текущего снимка статистики
 */
using SnapshotSource = std::function<monitoring::SnapshotPtr()>;

// =============================================================================
// Status Reporter
// =============================================================================

/**
 * @brief Терминальный репортёр статуса
 */
class StatusReporter {
public:
    /**
     * @brief Создать репортёр
     *
     * @param config Настройки
     * @param source Источник снимков (может быть пустым)
     */
    StatusReporter(const ReporterConfig& config, SnapshotSource source);

    ~StatusReporter();

    // Запрещаем копирование
    StatusReporter(const StatusReporter&) = delete;
    StatusReporter& operator=(const StatusReporter&) = delete;

    // ==========================================================================
    // Управление
    // ==========================================================================

    /**
     * @brief Запустить периодический вывод статуса
     */
    void start();

    /**
     * @brief Остановить вывод статуса
     */
    void stop();

    /**
     * @brief Проверить, запущен ли репортёр
     */
    [[nodiscard]] bool is_running() const noexcept;

    // ==========================================================================
    // События
    // ==========================================================================

    /**
     * @brief Записать событие
     */
    void log_event(EventType type, const std::string& message,
                   const std::string& source = "");

    /**
     * @brief Принять строку журнала (подписчик Logger)
     *
     * Info, Warning и Error/Critical становятся событиями INFO, WARNING, ERROR.
     */
    void log_line(Level level, std::string_view component, std::string_view message);

    /**
     * @brief Подписчик, который получает каждое новое событие
     */
    void set_subscriber(EventSubscriber subscriber);

    /**
     * @brief Последние события, от старых к новым
     *
     * @param max Не больше max событий (0 = все)
     */
    [[nodiscard]] std::vector<EventRecord> recent_events(std::size_t max = 0) const;

    // ==========================================================================
    // Рендеринг
    // ==========================================================================

    /**
     * @brief Получить текущий вывод статуса (без ANSI кодов)
     *
     * Используется для тестирования.
     */
    [[nodiscard]] std::string render_plain() const;

    /**
     * @brief Получить текущий вывод статуса (с ANSI кодами)
     */
    [[nodiscard]] std::string render() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace strata::log
