/**
 * @file logger.cpp
 * @brief Реализация журнала
 */

#include "logger.hpp"

#include <chrono>
#include <iostream>

namespace strata::log {

namespace {

/**
 * @brief Уровень из конфигурации, по умолчанию fallback
 */
Level level_or(std::string_view name, Level fallback) {
    auto level = parse_level(name);
    return level ? *level : fallback;
}

std::string format_line(Level level, std::string_view component, std::string_view message) {
    auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    return std::format("{:%Y-%m-%d %H:%M:%S} {:<5} [{}] {}",
                       now, to_string(level), component, message);
}

} // namespace

std::optional<Level> parse_level(std::string_view name) noexcept {
    if (name == "Critical") return Level::Critical;
    if (name == "Error") return Level::Error;
    if (name == "Warning") return Level::Warning;
    if (name == "Info") return Level::Info;
    if (name == "Debug") return Level::Debug;
    if (name == "Trace") return Level::Trace;
    return std::nullopt;
}

// =============================================================================
// Logger
// =============================================================================

Logger::Logger() : Logger(true, Level::Info) {}

Logger::Logger(bool to_stdout, Level stdout_level)
    : to_stdout_(to_stdout)
    , stdout_level_(stdout_level)
    , to_file_(false) {
    config_.log_to_stdout = to_stdout;
    config_.log_to_file = false;
}

Logger::Logger(const LoggingConfig& config)
    : config_(config)
    , to_stdout_(config.log_to_stdout)
    , stdout_level_(level_or(config.stdout_log_level, Level::Info))
    , to_file_(config.log_to_file)
    , file_level_(level_or(config.file_log_level, Level::Debug)) {}

Logger::~Logger() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

Logger Logger::silent() {
    return Logger(false, Level::Critical);
}

Result<void> Logger::open() {
    if (!to_file_) {
        return {};
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto mode = std::ios::out | (config_.log_file_append ? std::ios::app : std::ios::trunc);
    file_.open(config_.log_file_path, mode);
    if (!file_.is_open()) {
        to_file_ = false;
        return Err<void>(ErrorCode::ConfigInvalidValue,
            std::format("Не удалось открыть файл журнала: {}", config_.log_file_path));
    }
    return {};
}

void Logger::set_sink(LineSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

bool Logger::enabled(Level level) const noexcept {
    if (to_stdout_ && level <= stdout_level_) return true;
    if (to_file_ && level <= file_level_) return true;
    return false;
}

void Logger::write(Level level, std::string_view component, std::string_view message) {
    LineSink sink;
    {
        std::lock_guard<std::mutex> lock(mutex_);

        const bool to_stdout = to_stdout_ && level <= stdout_level_;
        const bool to_file = to_file_ && file_.is_open() && level <= file_level_;

        if (to_stdout || to_file) {
            auto line = format_line(level, component, message);
            if (to_stdout) {
                auto& out = level <= Level::Warning ? std::cerr : std::cout;
                out << line << std::endl;
            }
            if (to_file) {
                file_ << line << '\n';
                if (level <= Level::Warning) {
                    file_.flush();
                }
            }
        }
        sink = sink_;
    }

    // Подписчик вызывается вне блокировки журнала
    if (sink && level <= Level::Info) {
        sink(level, component, message);
    }
}

} // namespace strata::log
