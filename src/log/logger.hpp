/**
 * @file logger.hpp
 * @brief Журнал Strata Miner
 *
 * Строки вида "2026-01-01 12:00:00 INFO  [session] сообщение" пишутся
 * в stdout и/или файл, у каждого приёмника свой порог уровня.
 * Каждая принятая строка дополнительно передаётся подписчику (лента
 * событий StatusReporter).
 */

#pragma once

#include "../core/types.hpp"
#include "../core/config.hpp"

#include <format>
#include <fstream>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace strata::log {

/**
 * @brief Уровень сообщения (по возрастанию подробности)
 */
enum class Level {
    Critical = 0,
    Error,
    Warning,
    Info,
    Debug,
    Trace
};

/**
 * @brief Преобразовать уровень в строку
 */
[[nodiscard]] constexpr std::string_view to_string(Level level) noexcept {
    switch (level) {
        case Level::Critical: return "CRIT";
        case Level::Error:    return "ERROR";
        case Level::Warning:  return "WARN";
        case Level::Info:     return "INFO";
        case Level::Debug:    return "DEBUG";
        case Level::Trace:    return "TRACE";
        default: return "?";
    }
}

/**
 * @brief Разобрать имя уровня из конфигурации ("Info", "Debug", ...)
 */
[[nodiscard]] std::optional<Level> parse_level(std::string_view name) noexcept;

/**
 * @brief Подписчик на ленту строк журнала
 */
using LineSink = std::function<void(Level level, std::string_view component,
                                    std::string_view message)>;

/**
 * @brief Журнал с приёмниками stdout и файл
 *
 * Потокобезопасен. Создаётся в main и передаётся компонентам по ссылке.
 */
class Logger {
public:
    /**
     * @brief Журнал по умолчанию: только stdout, уровень Info
     */
    Logger();

    /**
     * @brief Журнал по настройкам [logging]
     */
    explicit Logger(const LoggingConfig& config);

    ~Logger();

    // Запрещаем копирование
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    /**
     * @brief Открыть файл журнала (если включён)
     *
     * @return Result<void> Успех или ConfigInvalidValue
     */
    [[nodiscard]] Result<void> open();

    /**
     * @brief Журнал без вывода (для тестов)
     */
    [[nodiscard]] static Logger silent();

    /**
     * @brief Установить подписчика ленты
     */
    void set_sink(LineSink sink);

    /**
     * @brief Записать сообщение
     */
    void write(Level level, std::string_view component, std::string_view message);

    /**
     * @brief Будет ли сообщение уровня level куда-либо записано
     */
    [[nodiscard]] bool enabled(Level level) const noexcept;

    template<typename... Args>
    void error(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        write(Level::Error, component, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void warn(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        write(Level::Warning, component, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void info(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        write(Level::Info, component, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void debug(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        if (!enabled(Level::Debug)) return;
        write(Level::Debug, component, std::format(fmt, std::forward<Args>(args)...));
    }

    template<typename... Args>
    void trace(std::string_view component, std::format_string<Args...> fmt, Args&&... args) {
        if (!enabled(Level::Trace)) return;
        write(Level::Trace, component, std::format(fmt, std::forward<Args>(args)...));
    }

private:
    Logger(bool to_stdout, Level stdout_level);

    LoggingConfig config_;
    bool to_stdout_{true};
    Level stdout_level_{Level::Info};
    bool to_file_{false};
    Level file_level_{Level::Debug};

    std::ofstream file_;
    LineSink sink_;
    mutable std::mutex mutex_;
};

} // namespace strata::log
