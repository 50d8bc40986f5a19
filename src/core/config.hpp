/**
 * @file config.hpp
 * @brief Конфигурация Strata Miner
 *
 * Загрузка и парсинг конфигурации из TOML файла.
 *
 * Пример конфигурации (strata-miner.toml):
 * @code
 * [logging]
 * log_to_stdout = true
 * stdout_log_level = "Info"
 * log_to_file = true
 * file_log_level = "Debug"
 * log_file_path = "strata-miner.log"
 * log_file_append = true
 *
 * [mining]
 * run_tui = true
 * stratum_server_addr = "127.0.0.1:13416"
 * stratum_server_login = "user"
 * stratum_server_password = "x"
 * grace_window_ms = 2000
 *
 * [[mining.miner_plugin_config]]
 * type_filter = "simulated_cpu"
 * edge_bits = 29
 * [mining.miner_plugin_config.device_parameters.0]
 * NUM_THREADS = 4
 * @endcode
 */

#pragma once

#include "types.hpp"
#include "constants.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace strata {

// =============================================================================
// Структуры конфигурации
// =============================================================================

/**
 * @brief Настройки логирования
 */
struct LoggingConfig {
    /// @brief Писать ли лог в stdout
    bool log_to_stdout = true;

    /// @brief Уровень для stdout: Critical, Error, Warning, Info, Debug, Trace
    std::string stdout_log_level = "Info";

    /// @brief Писать ли лог в файл
    bool log_to_file = true;

    /// @brief Уровень для файла
    std::string file_log_level = "Debug";

    /// @brief Путь к файлу лога
    std::string log_file_path = "strata-miner.log";

    /// @brief Дописывать в файл (true) или перезаписывать при запуске (false)
    bool log_file_append = true;

    /// @brief Размер истории событий
    std::size_t event_history = constants::DEFAULT_EVENT_HISTORY;
};

/**
 * @brief Конфигурация одного плагина (семейства устройств)
 *
 * Параметры устройств не интерпретируются ядром и передаются
 * устройству при старте как есть.
 */
struct PluginConfig {
    /// @brief Фильтр типа решателя (например, "simulated_cpu")
    std::string type_filter;

    /// @brief Размер графа
    uint32_t edge_bits = 29;

    /// @brief Индекс устройства -> параметры ключ/значение
    std::map<uint32_t, std::map<std::string, std::string>> device_parameters;
};

/**
 * @brief Описание одного устройства, полученное из конфигурации
 */
struct DeviceDescriptor {
    /// @brief Тип решателя (ключ фабрики устройств)
    std::string type_filter;

    /// @brief Размер графа
    uint32_t edge_bits = 29;

    /// @brief Индекс устройства внутри плагина
    uint32_t device_index = 0;

    /// @brief Параметры для start()
    std::map<std::string, std::string> parameters;

    /**
     * @brief Человекочитаемое имя ("simulated_cpu#0")
     */
    [[nodiscard]] std::string name() const;

    bool operator==(const DeviceDescriptor&) const = default;
};

/**
 * @brief Настройки майнинга и сессии
 */
struct MiningConfig {
    /// @brief Выводить ли периодический статус в терминал
    bool run_tui = true;

    /// @brief Адрес stratum сервера ("host:port" или "stratum+tcp://host:port")
    std::string stratum_server_addr = "127.0.0.1:13416";

    /// @brief Логин (опционально)
    std::optional<std::string> stratum_server_login;

    /// @brief Пароль (опционально)
    std::optional<std::string> stratum_server_password;

    /// @brief Окно приёма решений для вытесненного задания (мс)
    uint32_t grace_window_ms = constants::DEFAULT_GRACE_WINDOW_MS;

    /// @brief Срок кооперативной отмены на устройстве (мс)
    uint32_t cancel_deadline_ms = constants::DEFAULT_CANCEL_DEADLINE_MS;

    /// @brief Начальная задержка переподключения (мс)
    uint32_t reconnect_initial_ms = constants::DEFAULT_RECONNECT_INITIAL_MS;

    /// @brief Максимальная задержка переподключения (мс)
    uint32_t reconnect_max_ms = constants::DEFAULT_RECONNECT_MAX_MS;

    /// @brief Таймаут TCP подключения (мс)
    uint32_t connect_timeout_ms = constants::DEFAULT_CONNECT_TIMEOUT_MS;

    /// @brief Интервал keepalive (мс)
    uint32_t keepalive_interval_ms = constants::DEFAULT_KEEPALIVE_INTERVAL_MS;

    /// @brief Таймаут ответа на запрос (мс)
    uint32_t request_timeout_ms = constants::DEFAULT_REQUEST_TIMEOUT_MS;

    /// @brief Ёмкость очереди отправки во время переподключения
    std::size_t submit_queue_size = constants::DEFAULT_SUBMIT_QUEUE_SIZE;

    /// @brief Ёмкость канала решений
    std::size_t solution_queue_size = constants::DEFAULT_SOLUTION_QUEUE_SIZE;

    /// @brief Интервал сбора статистики (мс)
    uint32_t stats_interval_ms = constants::DEFAULT_STATS_INTERVAL_MS;

    /// @brief Перезапусков устройства до перевода в постоянный Errored
    uint32_t device_max_restarts = constants::DEFAULT_DEVICE_MAX_RESTARTS;

    /// @brief Базовая задержка перезапуска устройства (мс)
    uint32_t device_restart_backoff_ms = constants::DEFAULT_DEVICE_RESTART_BACKOFF_MS;

    /// @brief Плагины
    std::vector<PluginConfig> miner_plugin_config;
};

/**
 * @brief Полная конфигурация Strata Miner
 */
struct Config {
    LoggingConfig logging;
    MiningConfig mining;

    /**
     * @brief Загрузить конфигурацию из TOML файла
     *
     * @param path Путь к файлу конфигурации
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load(const std::filesystem::path& path);

    /**
     * @brief Загрузить конфигурацию из TOML текста
     */
    [[nodiscard]] static Result<Config> parse(std::string_view toml_text);

    /**
     * @brief Загрузить конфигурацию с поиском файла
     *
     * Ищет файл в следующем порядке:
     * 1. Указанный путь
     * 2. ./strata-miner.toml
     * 3. Каталог исполняемого файла
     *
     * @param path Опциональный путь к файлу
     * @param exe_dir Каталог исполняемого файла
     * @return Result<Config> Конфигурация или ошибка
     */
    [[nodiscard]] static Result<Config> load_with_search(
        const std::optional<std::filesystem::path>& path,
        const std::filesystem::path& exe_dir
    );

    /**
     * @brief Валидация конфигурации
     *
     * @return Result<void> Успех или ConfigInvalidValue
     */
    [[nodiscard]] Result<void> validate() const;

    /**
     * @brief Развернуть плагины в список устройств
     *
     * Одно устройство на каждый индекс из device_parameters,
     * либо устройство 0, если таблица параметров не задана.
     */
    [[nodiscard]] std::vector<DeviceDescriptor> device_descriptors() const;
};

/**
 * @brief Проверить, известен ли уровень логирования
 */
[[nodiscard]] bool is_known_log_level(std::string_view level) noexcept;

} // namespace strata
