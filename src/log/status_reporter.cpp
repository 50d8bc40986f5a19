/**
 * @file status_reporter.cpp
 * @brief Реализация терминального репортёра статуса
 */

#include "status_reporter.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <format>
#include <iostream>
#include <mutex>
#include <thread>

namespace strata::log {

// =============================================================================
// ANSI коды цветов
// =============================================================================

namespace ansi {
    constexpr const char* RESET = "\033[0m";
    constexpr const char* BOLD = "\033[1m";
    constexpr const char* DIM = "\033[2m";

    // Цвета текста
    constexpr const char* RED = "\033[31m";
    constexpr const char* GREEN = "\033[32m";
    constexpr const char* YELLOW = "\033[33m";
    constexpr const char* CYAN = "\033[36m";

    // Управление курсором
    constexpr const char* CLEAR_SCREEN = "\033[2J";
    constexpr const char* HOME = "\033[H";
}

namespace {

std::string format_clock(const std::optional<std::chrono::system_clock::time_point>& time) {
    if (!time) {
        return "-";
    }
    return std::format("{:%H:%M:%S}", std::chrono::floor<std::chrono::seconds>(*time));
}

std::string format_graph_time(std::chrono::nanoseconds time) {
    if (time.count() == 0) {
        return "-";
    }
    return std::format("{:.3f}s", std::chrono::duration<double>(time).count());
}

} // namespace

// =============================================================================
// Реализация
// =============================================================================

struct StatusReporter::Impl {
    ReporterConfig config;
    SnapshotSource source;

    // Состояние
    std::atomic<bool> running{false};
    std::thread render_thread;
    std::mutex wait_mutex;
    std::condition_variable wait_cv;

    // События
    std::deque<EventRecord> events;
    EventSubscriber subscriber;
    mutable std::mutex events_mutex;

    Impl(const ReporterConfig& cfg, SnapshotSource src)
        : config(cfg)
        , source(std::move(src)) {}

    void render_loop() {
        while (running) {
            const std::string output = render_impl(config.color);
            if (config.color) {
                std::cout << ansi::CLEAR_SCREEN << ansi::HOME << output << std::flush;
            } else {
                std::cout << output << std::flush;
            }

            std::unique_lock<std::mutex> lock(wait_mutex);
            wait_cv.wait_for(lock, std::chrono::milliseconds(config.refresh_interval_ms),
                             [this] { return !running.load(); });
        }
    }

    std::string render_impl(bool use_color) const {
        const char* bold = use_color ? ansi::BOLD : "";
        const char* reset = use_color ? ansi::RESET : "";
        const char* green = use_color ? ansi::GREEN : "";
        const char* yellow = use_color ? ansi::YELLOW : "";
        const char* red = use_color ? ansi::RED : "";
        const char* cyan = use_color ? ansi::CYAN : "";
        const char* dim = use_color ? ansi::DIM : "";

        monitoring::SnapshotPtr snapshot = source ? source() : nullptr;
        if (!snapshot) {
            snapshot = std::make_shared<const monitoring::StatsSnapshot>();
        }
        const auto& s = *snapshot;

        std::string out;

        // === Заголовок ===
        out += std::format("{}==================================================================\n"
                           "                    STRATA MINER v{}\n"
                           "=================================================================={}\n\n",
                           bold, constants::VERSION, reset);

        out += std::format("{}Uptime:{} {}\n\n", bold, reset, monitoring::format_duration(s.uptime));

        // === Подключение ===
        out += std::format("{}Connection:{} ", bold, reset);
        if (s.connected) {
            out += std::format("{}CONNECTED{}", green, reset);
        } else if (s.session_state == "Reconnecting" || s.session_state == "Connecting" ||
                   s.session_state == "Authenticating") {
            out += std::format("{}{}{}", yellow, s.session_state, reset);
        } else {
            out += std::format("{}DISCONNECTED{}", red, reset);
        }
        if (!s.endpoint.empty()) {
            out += std::format(" ({})", s.endpoint);
        }
        if (s.connected) {
            out += std::format("  Session: {}", monitoring::format_duration(s.session_uptime));
        }
        out += "\n";
        out += std::format("  Last message sent: {}  received: {}\n",
                           format_clock(s.last_message_sent), format_clock(s.last_message_received));
        if (s.reconnects > 0 || s.queued_submissions > 0 || s.dropped_submissions > 0) {
            out += std::format("  Reconnects: {}  Queued: {}  Dropped: {}\n",
                               s.reconnects, s.queued_submissions, s.dropped_submissions);
        }
        out += "\n";

        // === Майнинг ===
        out += std::format("{}Mining:{} {}\n", bold, reset, s.mining_status());
        out += std::format("  Target difficulty: {}\n", s.target_difficulty);
        out += std::format("  Shares: {}{} accepted{}, {}{} rejected{}, {} stale, "
                           "{} low difficulty, {} unanswered\n\n",
                           green, s.shares.accepted, reset,
                           s.shares.rejected > 0 ? red : "", s.shares.rejected, reset,
                           s.shares.stale, s.shares.low_difficulty, s.shares.unanswered);

        // === Устройства ===
        out += std::format("{}Devices:{}\n", bold, reset);
        out += std::format("  {:<14} {:>3}  {:<20} {:>4}  {:<5}  {:<8}  {:>10}  {:>12}\n",
                           "Plugin", "ID", "Device", "Bits", "InUse", "Status", "Last graph", "Rate");
        if (s.devices.empty()) {
            out += std::format("  {}(no devices){}\n", dim, reset);
        }
        for (const auto& device : s.devices) {
            const char* status_color = device.status == mining::DeviceStatus::Running ? green
                : device.status == mining::DeviceStatus::Errored ? red : yellow;
            out += std::format("  {:<14} {:>3}  {:<20} {:>4}  {:<5}  {}{:<8}{}  {:>10}  {:>12}\n",
                               device.plugin, device.device_id, device.device_name,
                               device.edge_bits, device.in_use ? "yes" : "no",
                               status_color, mining::to_string(device.status), reset,
                               format_graph_time(device.last_attempt_time),
                               monitoring::format_rate(device.attempts_per_sec));
            if (device.has_errored && !device.last_error.empty()) {
                out += std::format("      {}{}{}\n", red, device.last_error, reset);
            }
        }
        out += "\n";

        // === Recent Events ===
        out += std::format("{}Recent Events:{}\n", bold, reset);
        {
            std::lock_guard<std::mutex> events_lock(events_mutex);
            if (events.empty()) {
                out += std::format("  {}(no events){}\n", dim, reset);
            } else {
                std::size_t start = events.size() > config.events_on_screen
                    ? events.size() - config.events_on_screen : 0;
                for (std::size_t i = start; i < events.size(); ++i) {
                    const auto& event = events[i];

                    const char* color = "";
                    switch (event.type) {
                        case EventType::NewJob:
                        case EventType::Reconnected:
                            color = cyan;
                            break;
                        case EventType::SubmitOk:
                            color = green;
                            break;
                        case EventType::JobIgnored:
                        case EventType::StaleShare:
                        case EventType::Warning:
                        case EventType::DeviceRestart:
                            color = yellow;
                            break;
                        case EventType::SubmitFail:
                        case EventType::ConnectionLost:
                        case EventType::DeviceError:
                        case EventType::Error:
                            color = red;
                            break;
                        case EventType::Info:
                            break;
                    }

                    out += std::format("  {:%H:%M:%S} {}[{}]{} {}",
                        std::chrono::floor<std::chrono::seconds>(event.timestamp),
                        color, event_type_to_string(event.type), reset, event.message);
                    if (!event.source.empty()) {
                        out += std::format("{} ({}){}", dim, event.source, reset);
                    }
                    out += "\n";
                }
            }
        }

        out += std::format("\n{}------------------------------------------------------------------{}\n",
                           bold, reset);
        return out;
    }
};

// =============================================================================
// Публичный API
// =============================================================================

StatusReporter::StatusReporter(const ReporterConfig& config, SnapshotSource source)
    : impl_(std::make_unique<Impl>(config, std::move(source))) {}

StatusReporter::~StatusReporter() {
    stop();
}

void StatusReporter::start() {
    if (impl_->running.exchange(true)) {
        return;
    }

    impl_->render_thread = std::thread([this]() {
        impl_->render_loop();
    });
}

void StatusReporter::stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->wait_mutex);
        impl_->running = false;
    }
    impl_->wait_cv.notify_all();

    if (impl_->render_thread.joinable()) {
        impl_->render_thread.join();
    }
}

bool StatusReporter::is_running() const noexcept {
    return impl_->running;
}

void StatusReporter::log_event(EventType type, const std::string& message,
                               const std::string& source) {
    EventRecord record;
    record.type = type;
    record.timestamp = std::chrono::system_clock::now();
    record.message = message;
    record.source = source;

    EventSubscriber subscriber;
    {
        std::lock_guard<std::mutex> lock(impl_->events_mutex);
        impl_->events.push_back(record);

        // Ограничиваем размер истории
        while (impl_->events.size() > impl_->config.event_history) {
            impl_->events.pop_front();
        }
        subscriber = impl_->subscriber;
    }

    if (subscriber) {
        subscriber(record);
    }
}

void StatusReporter::log_line(Level level, std::string_view component, std::string_view message) {
    EventType type = EventType::Info;
    switch (level) {
        case Level::Critical:
        case Level::Error:
            type = EventType::Error;
            break;
        case Level::Warning:
            type = EventType::Warning;
            break;
        case Level::Info:
            type = EventType::Info;
            break;
        default:
            return;
    }
    log_event(type, std::string(message), std::string(component));
}

void StatusReporter::set_subscriber(EventSubscriber subscriber) {
    std::lock_guard<std::mutex> lock(impl_->events_mutex);
    impl_->subscriber = std::move(subscriber);
}

std::vector<EventRecord> StatusReporter::recent_events(std::size_t max) const {
    std::lock_guard<std::mutex> lock(impl_->events_mutex);
    std::size_t start = (max > 0 && impl_->events.size() > max) ? impl_->events.size() - max : 0;
    return {impl_->events.begin() + static_cast<std::ptrdiff_t>(start), impl_->events.end()};
}

std::string StatusReporter::render_plain() const {
    return impl_->render_impl(false);
}

std::string StatusReporter::render() const {
    return impl_->render_impl(impl_->config.color);
}

} // namespace strata::log
