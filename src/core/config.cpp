/**
 * @file config.cpp
 * @brief Реализация загрузки конфигурации
 *
 * Использует библиотеку toml++ для парсинга TOML файлов.
 */

#include "config.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <format>

namespace strata {

namespace {

/// @brief Известные уровни логирования (как в grin-miner.toml)
constexpr std::array<std::string_view, 6> LOG_LEVELS = {
    "Critical", "Error", "Warning", "Info", "Debug", "Trace"
};

/**
 * @brief Преобразовать скалярное значение TOML в строку
 */
std::optional<std::string> scalar_to_string(const toml::node& node) {
    if (auto val = node.value<std::string>()) {
        return *val;
    }
    if (node.is_integer()) {
        return std::format("{}", *node.value<int64_t>());
    }
    if (node.is_floating_point()) {
        return std::format("{}", *node.value<double>());
    }
    if (node.is_boolean()) {
        return *node.value<bool>() ? std::string("true") : std::string("false");
    }
    return std::nullopt;
}

template<typename T>
void read_uint(const toml::table& table, std::string_view key, T& target) {
    if (auto val = table[key].value<int64_t>()) {
        target = static_cast<T>(std::max<int64_t>(*val, 0));
    }
}

/**
 * @brief Разобрать одну запись [[mining.miner_plugin_config]]
 */
Result<PluginConfig> parse_plugin(const toml::table& table) {
    PluginConfig plugin;

    if (auto val = table["type_filter"].value<std::string>()) {
        plugin.type_filter = *val;
    }
    if (auto val = table["edge_bits"].value<int64_t>()) {
        plugin.edge_bits = static_cast<uint32_t>(std::max<int64_t>(*val, 0));
    }

    if (auto params = table["device_parameters"].as_table()) {
        for (auto&& [key, node] : *params) {
            uint32_t index = 0;
            const std::string_view key_str = key.str();
            auto [ptr, ec] = std::from_chars(key_str.data(), key_str.data() + key_str.size(), index);
            if (ec != std::errc{} || ptr != key_str.data() + key_str.size()) {
                return Err<PluginConfig>(ErrorCode::ConfigInvalidValue,
                    std::format("Индекс устройства должен быть числом: '{}'", key_str));
            }

            auto device_table = node.as_table();
            if (!device_table) {
                return Err<PluginConfig>(ErrorCode::ConfigInvalidValue,
                    std::format("device_parameters.{} должен быть таблицей", key_str));
            }

            auto& device_params = plugin.device_parameters[index];
            for (auto&& [param_key, param_node] : *device_table) {
                auto value = scalar_to_string(param_node);
                if (!value) {
                    return Err<PluginConfig>(ErrorCode::ConfigInvalidValue,
                        std::format("Параметр {} устройства {} должен быть скаляром",
                                    param_key.str(), key_str));
                }
                device_params[std::string(param_key.str())] = std::move(*value);
            }
        }
    }

    return plugin;
}

/**
 * @brief Заполнить Config из распарсенной TOML таблицы
 */
Result<Config> from_table(const toml::table& table) {
    Config config;

    // === Секция [logging] ===
    if (auto logging = table["logging"].as_table()) {
        if (auto val = (*logging)["log_to_stdout"].value<bool>()) {
            config.logging.log_to_stdout = *val;
        }
        if (auto val = (*logging)["stdout_log_level"].value<std::string>()) {
            config.logging.stdout_log_level = *val;
        }
        if (auto val = (*logging)["log_to_file"].value<bool>()) {
            config.logging.log_to_file = *val;
        }
        if (auto val = (*logging)["file_log_level"].value<std::string>()) {
            config.logging.file_log_level = *val;
        }
        if (auto val = (*logging)["log_file_path"].value<std::string>()) {
            config.logging.log_file_path = *val;
        }
        if (auto val = (*logging)["log_file_append"].value<bool>()) {
            config.logging.log_file_append = *val;
        }
        read_uint(*logging, "event_history", config.logging.event_history);
    }

    // === Секция [mining] ===
    if (auto mining = table["mining"].as_table()) {
        auto& m = config.mining;

        if (auto val = (*mining)["run_tui"].value<bool>()) {
            m.run_tui = *val;
        }
        if (auto val = (*mining)["stratum_server_addr"].value<std::string>()) {
            m.stratum_server_addr = *val;
        }
        if (auto val = (*mining)["stratum_server_login"].value<std::string>()) {
            m.stratum_server_login = *val;
        }
        if (auto val = (*mining)["stratum_server_password"].value<std::string>()) {
            m.stratum_server_password = *val;
        }

        read_uint(*mining, "grace_window_ms", m.grace_window_ms);
        read_uint(*mining, "cancel_deadline_ms", m.cancel_deadline_ms);
        read_uint(*mining, "reconnect_initial_ms", m.reconnect_initial_ms);
        read_uint(*mining, "reconnect_max_ms", m.reconnect_max_ms);
        read_uint(*mining, "connect_timeout_ms", m.connect_timeout_ms);
        read_uint(*mining, "keepalive_interval_ms", m.keepalive_interval_ms);
        read_uint(*mining, "request_timeout_ms", m.request_timeout_ms);
        read_uint(*mining, "submit_queue_size", m.submit_queue_size);
        read_uint(*mining, "solution_queue_size", m.solution_queue_size);
        read_uint(*mining, "stats_interval_ms", m.stats_interval_ms);
        read_uint(*mining, "device_max_restarts", m.device_max_restarts);
        read_uint(*mining, "device_restart_backoff_ms", m.device_restart_backoff_ms);

        // Парсим плагины из [[mining.miner_plugin_config]]
        if (auto plugins = (*mining)["miner_plugin_config"].as_array()) {
            for (const auto& plugin_node : *plugins) {
                auto plugin_table = plugin_node.as_table();
                if (!plugin_table) {
                    return Err<Config>(ErrorCode::ConfigInvalidValue,
                        "miner_plugin_config должен быть массивом таблиц");
                }
                auto plugin = parse_plugin(*plugin_table);
                if (!plugin) {
                    return std::unexpected(plugin.error());
                }
                m.miner_plugin_config.push_back(std::move(*plugin));
            }
        }
    }

    return config;
}

/**
 * @brief Проверить адрес вида [stratum+tcp://]host:port
 */
bool is_valid_address(std::string_view addr) {
    if (auto scheme = addr.find("://"); scheme != std::string_view::npos) {
        addr.remove_prefix(scheme + 3);
    }
    auto colon = addr.rfind(':');
    if (colon == std::string_view::npos || colon == 0) {
        return false;
    }
    auto port_str = addr.substr(colon + 1);
    uint32_t port = 0;
    auto [ptr, ec] = std::from_chars(port_str.data(), port_str.data() + port_str.size(), port);
    return ec == std::errc{} && ptr == port_str.data() + port_str.size() &&
           port > 0 && port <= 65535;
}

} // namespace

// =============================================================================
// DeviceDescriptor
// =============================================================================

std::string DeviceDescriptor::name() const {
    return std::format("{}#{}", type_filter, device_index);
}

bool is_known_log_level(std::string_view level) noexcept {
    return std::find(LOG_LEVELS.begin(), LOG_LEVELS.end(), level) != LOG_LEVELS.end();
}

// =============================================================================
// Config - Загрузка
// =============================================================================

Result<Config> Config::load(const std::filesystem::path& path) {
    // Проверяем существование файла
    if (!std::filesystem::exists(path)) {
        return Err<Config>(
            ErrorCode::ConfigNotFound,
            std::format("Файл конфигурации не найден: {}", path.string())
        );
    }

    try {
        auto table = toml::parse_file(path.string());
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга {}: {}", path.string(), e.description())
        );
    }
}

Result<Config> Config::parse(std::string_view toml_text) {
    try {
        auto table = toml::parse(toml_text);
        return from_table(table);
    } catch (const toml::parse_error& e) {
        return Err<Config>(
            ErrorCode::ConfigParseError,
            std::format("Ошибка парсинга конфигурации: {}", e.description())
        );
    }
}

Result<Config> Config::load_with_search(
    const std::optional<std::filesystem::path>& path,
    const std::filesystem::path& exe_dir
) {
    if (path) {
        return load(*path);
    }

    const std::filesystem::path candidates[] = {
        std::filesystem::current_path() / constants::CONFIG_FILE_NAME,
        exe_dir / constants::CONFIG_FILE_NAME,
    };

    for (const auto& candidate : candidates) {
        if (std::filesystem::exists(candidate)) {
            return load(candidate);
        }
    }

    return Err<Config>(
        ErrorCode::ConfigNotFound,
        std::format("{} не найден ни в рабочем каталоге, ни рядом с исполняемым файлом",
                    constants::CONFIG_FILE_NAME)
    );
}

// =============================================================================
// Config - Валидация
// =============================================================================

Result<void> Config::validate() const {
    if (!is_valid_address(mining.stratum_server_addr)) {
        return Err<void>(ErrorCode::ConfigInvalidValue,
            std::format("Некорректный stratum_server_addr: '{}'", mining.stratum_server_addr));
    }

    if (mining.miner_plugin_config.empty()) {
        return Err<void>(ErrorCode::ConfigInvalidValue,
            "Не задан ни один miner_plugin_config");
    }

    for (const auto& plugin : mining.miner_plugin_config) {
        if (plugin.type_filter.empty()) {
            return Err<void>(ErrorCode::ConfigInvalidValue,
                "type_filter плагина не может быть пустым");
        }
        if (plugin.edge_bits < constants::MIN_EDGE_BITS ||
            plugin.edge_bits > constants::MAX_EDGE_BITS) {
            return Err<void>(ErrorCode::ConfigInvalidValue,
                std::format("edge_bits={} вне диапазона {}..{} ({})",
                            plugin.edge_bits, constants::MIN_EDGE_BITS,
                            constants::MAX_EDGE_BITS, plugin.type_filter));
        }
    }

    if (mining.submit_queue_size == 0 || mining.solution_queue_size == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue,
            "Размеры очередей должны быть больше нуля");
    }

    if (mining.reconnect_initial_ms == 0 ||
        mining.reconnect_initial_ms > mining.reconnect_max_ms) {
        return Err<void>(ErrorCode::ConfigInvalidValue,
            "Требуется 0 < reconnect_initial_ms <= reconnect_max_ms");
    }

    if (mining.cancel_deadline_ms == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue,
            "cancel_deadline_ms должен быть больше нуля");
    }

    if (mining.stats_interval_ms == 0) {
        return Err<void>(ErrorCode::ConfigInvalidValue,
            "stats_interval_ms должен быть больше нуля");
    }

    if (!is_known_log_level(logging.stdout_log_level) ||
        !is_known_log_level(logging.file_log_level)) {
        return Err<void>(ErrorCode::ConfigInvalidValue,
            "Неизвестный уровень логирования (Critical, Error, Warning, Info, Debug, Trace)");
    }

    if (logging.log_to_file && logging.log_file_path.empty()) {
        return Err<void>(ErrorCode::ConfigInvalidValue,
            "log_file_path не может быть пустым при log_to_file = true");
    }

    return {};
}

std::vector<DeviceDescriptor> Config::device_descriptors() const {
    std::vector<DeviceDescriptor> result;

    for (const auto& plugin : mining.miner_plugin_config) {
        if (plugin.device_parameters.empty()) {
            DeviceDescriptor descriptor;
            descriptor.type_filter = plugin.type_filter;
            descriptor.edge_bits = plugin.edge_bits;
            descriptor.device_index = 0;
            result.push_back(std::move(descriptor));
            continue;
        }

        for (const auto& [index, params] : plugin.device_parameters) {
            DeviceDescriptor descriptor;
            descriptor.type_filter = plugin.type_filter;
            descriptor.edge_bits = plugin.edge_bits;
            descriptor.device_index = index;
            descriptor.parameters = params;
            result.push_back(std::move(descriptor));
        }
    }

    return result;
}

} // namespace strata
