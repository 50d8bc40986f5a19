/**
 * @file main.cpp
 * @brief Точка входа Strata Miner
 *
 * Strata Miner - клиент майнинга для Grin stratum серверов
 * с подключаемыми устройствами-решателями.
 *
 * Основные компоненты:
 * 1. Stratum Session - связь с сервером, переподключение
 * 2. Solver Pool - устройства и их перезапуск
 * 3. Orchestrator - задания и отправка решений
 * 4. Stats Aggregator - снимки статистики
 * 5. Status Reporter - терминальный вывод и лента событий
 *
 * Использование:
 *   strata-miner [options]
 *
 * Опции:
 *   -c, --config PATH    Путь к файлу конфигурации
 *   --test-config        Проверить конфигурацию и выйти
 *   -h, --help           Показать справку
 *   -v, --version        Показать версию
 *
 * SIGHUP перечитывает набор устройств из конфигурации и перезапускает
 * устройства, исключённые после серии сбоев.
 */

#include "core/types.hpp"
#include "core/config.hpp"
#include "core/constants.hpp"
#include "core/channel.hpp"
#include "log/logger.hpp"
#include "log/status_reporter.hpp"
#include "mining/device_factory.hpp"
#include "mining/orchestrator.hpp"
#include "mining/solver_pool.hpp"
#include "monitoring/stats.hpp"
#include "stratum/stratum_session.hpp"

#include <atomic>
#include <csignal>
#include <filesystem>
#include <format>
#include <iostream>
#include <thread>

namespace {

constexpr std::string_view COMPONENT = "main";

/// @brief Флаг для graceful shutdown
std::atomic<bool> g_running{true};

/// @brief Запрошена перезагрузка устройств
std::atomic<bool> g_reload{false};

/**
 * @brief Обработчик сигналов
 */
void signal_handler(int signum) {
    if (signum == SIGINT || signum == SIGTERM) {
        g_running.store(false, std::memory_order_relaxed);
    } else if (signum == SIGHUP) {
        g_reload.store(true, std::memory_order_relaxed);
    }
}

/**
 * @brief Вывести справку
 */
void print_help() {
    std::cout << R"(
Strata Miner v)" << strata::constants::VERSION << R"(
Клиент майнинга для Grin stratum серверов

ИСПОЛЬЗОВАНИЕ:
    strata-miner [ОПЦИИ]

ОПЦИИ:
    -c, --config PATH    Путь к файлу конфигурации (strata-miner.toml)
    -h, --help           Показать эту справку
    -v, --version        Показать версию программы
    --test-config        Проверить конфигурацию и выйти

СИГНАЛЫ:
    SIGHUP               Перечитать устройства, перезапустить исключённые

ПРИМЕРЫ:
    strata-miner -c /etc/strata/strata-miner.toml
    strata-miner --test-config

)";
}

/**
 * @brief Вывести версию
 */
void print_version() {
    std::cout << "Strata Miner v" << strata::constants::VERSION << std::endl;
}

/**
 * @brief Парсинг аргументов командной строки
 */
struct Args {
    std::optional<std::string> config_path;
    bool show_help = false;
    bool show_version = false;
    bool test_config = false;
    std::optional<std::string> unknown;
};

Args parse_args(int argc, char* argv[]) {
    Args args;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            args.show_help = true;
        } else if (arg == "-v" || arg == "--version") {
            args.show_version = true;
        } else if (arg == "--test-config") {
            args.test_config = true;
        } else if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (!args.unknown) {
            args.unknown = std::string(arg);
        }
    }

    return args;
}

/**
 * @brief Каталог исполняемого файла
 */
std::filesystem::path executable_dir(const char* argv0) {
    std::error_code ec;
    auto self = std::filesystem::read_symlink("/proc/self/exe", ec);
    if (ec) {
        self = std::filesystem::absolute(argv0, ec);
    }
    return self.parent_path();
}

/**
 * @brief Применить SIGHUP: новый набор устройств или перезапуск исключённых
 *
 * Если конфигурация не читается или набор устройств в ней не изменился,
 * перезапускаются только исключённые устройства.
 */
void handle_reload(strata::mining::Orchestrator& orchestrator, strata::Config& current,
                   const std::optional<std::filesystem::path>& path,
                   const std::filesystem::path& exe_dir, strata::log::Logger& logger) {
    auto reloaded = strata::Config::load_with_search(path, exe_dir);
    if (reloaded) {
        if (auto valid = reloaded->validate(); !valid) {
            reloaded = std::unexpected(valid.error());
        }
    }

    if (!reloaded) {
        logger.error(COMPONENT, "Конфигурация не перечитана: {}", reloaded.error().message);
    } else {
        auto descriptors = reloaded->device_descriptors();
        if (descriptors != current.device_descriptors()) {
            if (orchestrator.reload_device_config(descriptors)) {
                current.mining.miner_plugin_config = reloaded->mining.miner_plugin_config;
                return;
            }
        }
    }

    auto restarted = orchestrator.restart_errored_devices();
    logger.info(COMPONENT, "Перезапущено исключённых устройств: {}", restarted);
}

} // anonymous namespace

/**
 * @brief Главная функция
 */
int main(int argc, char* argv[]) {
    using namespace strata;

    // Парсим аргументы
    auto args = parse_args(argc, argv);

    if (args.unknown) {
        std::cerr << "Неизвестный аргумент: " << *args.unknown << std::endl;
        print_help();
        return 1;
    }

    if (args.show_help) {
        print_help();
        return 0;
    }

    if (args.show_version) {
        print_version();
        return 0;
    }

    // Загружаем конфигурацию
    const auto config_path = args.config_path
        ? std::optional<std::filesystem::path>(*args.config_path) : std::nullopt;
    const auto exe_dir = executable_dir(argv[0]);
    auto config_result = Config::load_with_search(config_path, exe_dir);

    if (!config_result) {
        std::cerr << "[ERROR] " << config_result.error().message << std::endl;
        return 1;
    }

    Config config = std::move(*config_result);

    // Валидируем конфигурацию
    auto validation = config.validate();
    if (!validation) {
        std::cerr << "[ERROR] Ошибка валидации конфигурации: "
                  << validation.error().message << std::endl;
        return 1;
    }

    auto session_config = stratum::SessionConfig::from(config.mining);
    if (!session_config) {
        std::cerr << "[ERROR] " << session_config.error().message << std::endl;
        return 1;
    }

    if (args.test_config) {
        std::cout << "[INFO] Конфигурация валидна" << std::endl;
        return 0;
    }

    // Журнал: при терминальном выводе stdout занят экраном статуса
    LoggingConfig logging = config.logging;
    if (config.mining.run_tui) {
        logging.log_to_stdout = false;
    }
    log::Logger logger(logging);
    if (auto opened = logger.open(); !opened) {
        std::cerr << "[ERROR] " << opened.error().message << std::endl;
        return 1;
    }

    logger.info(COMPONENT, "Strata Miner v{} запускается", constants::VERSION);

    // Устройства
    auto signal = std::make_shared<EventSignal>();
    mining::SolverPool pool(mining::SolverPoolConfig::from(config.mining),
                            mining::DeviceFactory::with_builtin_devices(),
                            logger, signal);

    std::size_t devices_added = 0;
    for (const auto& descriptor : config.device_descriptors()) {
        auto device_id = pool.add_device(descriptor);
        if (!device_id) {
            logger.error(COMPONENT, "Устройство {} не создано: {}",
                         descriptor.name(), device_id.error().message);
            continue;
        }
        logger.info(COMPONENT, "Устройство {}: {} edge_bits={}",
                    *device_id, descriptor.name(), descriptor.edge_bits);
        ++devices_added;
    }

    if (devices_added == 0) {
        logger.error(COMPONENT, "Нет ни одного устройства, завершение");
        return 1;
    }

    // Сессия и координатор
    stratum::StratumSession session(std::move(*session_config), logger, signal);

    std::unique_ptr<log::StatusReporter> reporter;
    std::unique_ptr<monitoring::StatsAggregator> stats;

    log::ReporterConfig reporter_config;
    reporter_config.event_history = config.logging.event_history;
    reporter_config.refresh_interval_ms = config.mining.stats_interval_ms;

    // Лента событий ведётся всегда, экран только при run_tui
    reporter = std::make_unique<log::StatusReporter>(reporter_config, [&stats]() {
        return stats ? stats->snapshot() : monitoring::SnapshotPtr{};
    });
    logger.set_sink([&reporter](log::Level level, std::string_view component,
                                std::string_view message) {
        reporter->log_line(level, component, message);
    });

    mining::Orchestrator orchestrator(
        std::chrono::milliseconds(config.mining.grace_window_ms),
        pool, session, signal, logger, reporter.get());

    monitoring::StatsProviders providers;
    providers.devices = [&pool]() { return pool.records(); };
    providers.session = [&session]() { return session.info(); };
    providers.mining = [&orchestrator]() { return orchestrator.status(); };
    stats = std::make_unique<monitoring::StatsAggregator>(
        std::chrono::milliseconds(config.mining.stats_interval_ms), std::move(providers));

    // Устанавливаем обработчики сигналов
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    std::signal(SIGHUP, signal_handler);

    logger.info(COMPONENT, "Подключение к {}", config.mining.stratum_server_addr);

    stats->start();
    orchestrator.start_mining();
    if (config.mining.run_tui) {
        reporter->start();
    }

    // Основной цикл
    auto last_status = std::chrono::steady_clock::now();
    while (g_running.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        if (g_reload.exchange(false, std::memory_order_relaxed)) {
            logger.info(COMPONENT, "Получен SIGHUP, перечитываем устройства");
            handle_reload(orchestrator, config, config_path, exe_dir, logger);
        }

        // Без терминала статус периодически пишется в журнал
        if (!config.mining.run_tui) {
            auto now = std::chrono::steady_clock::now();
            if (now - last_status >= std::chrono::seconds(30)) {
                last_status = now;
                logger.info(COMPONENT, "{}", stats->snapshot()->mining_status());
            }
        }
    }

    // Graceful shutdown
    logger.info(COMPONENT, "Получен сигнал завершения, останавливаем...");

    reporter->stop();
    orchestrator.stop_mining();
    stats->stop();
    logger.set_sink(nullptr);

    // Итоговая статистика
    const auto progress = orchestrator.status();
    const auto snapshot = stats->sample();
    std::cout << "\n=== Итоговая статистика ===" << std::endl;
    std::cout << "Время работы: " << monitoring::format_duration(snapshot->uptime) << std::endl;
    std::cout << "Заданий получено: " << progress.jobs_dispatched << std::endl;
    std::cout << "Решений найдено: " << progress.shares.found << std::endl;
    std::cout << "Принято: " << progress.shares.accepted
              << ", отклонено: " << progress.shares.rejected
              << ", устаревших: " << progress.shares.stale << std::endl;

    return 0;
}
