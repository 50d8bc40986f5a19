/**
 * @file stats.cpp
 * @brief Реализация агрегатора статистики
 */

#include "stats.hpp"

#include <atomic>
#include <condition_variable>
#include <format>
#include <map>
#include <mutex>
#include <thread>

namespace strata::monitoring {

// =============================================================================
// Форматирование
// =============================================================================

std::string format_rate(double graphs_per_sec) {
    const char* suffixes[] = {"GPS", "KGPS", "MGPS", "GGPS"};
    int suffix_idx = 0;

    while (graphs_per_sec >= 1000.0 && suffix_idx < 3) {
        graphs_per_sec /= 1000.0;
        ++suffix_idx;
    }

    return std::format("{:.2f} {}", graphs_per_sec, suffixes[suffix_idx]);
}

std::string format_duration(std::chrono::seconds seconds) {
    auto count = seconds.count();

    if (count < 60) {
        return std::format("{}s", count);
    }

    auto minutes = count / 60;
    auto secs = count % 60;

    if (minutes < 60) {
        return std::format("{}m {}s", minutes, secs);
    }

    auto hours = minutes / 60;
    minutes %= 60;

    if (hours < 24) {
        return std::format("{}h {}m", hours, minutes);
    }

    auto days = hours / 24;
    hours %= 24;

    return std::format("{}d {}h {}m", days, hours, minutes);
}

std::string StatsSnapshot::mining_status() const {
    if (current_height == 0) {
        return "Waiting for job";
    }
    return std::format("Mining at height {} at {}", current_height,
                       format_rate(global_attempts_per_sec));
}

// =============================================================================
// StatsAggregator реализация
// =============================================================================

struct StatsAggregator::Impl {
    std::chrono::milliseconds interval;
    StatsProviders providers;
    Clock::time_point start_time = Clock::now();

    // Предыдущие значения для расчёта скорости (только поток сбора и sample())
    struct PreviousSample {
        uint64_t attempts = 0;
        Clock::time_point at;
    };
    std::mutex sample_mutex;
    std::map<uint32_t, PreviousSample> previous;

    // Опубликованный снимок
    mutable std::mutex publish_mutex;
    SnapshotPtr latest = std::make_shared<const StatsSnapshot>();
    uint64_t samples = 0;
    uint64_t skipped = 0;

    std::atomic<bool> running{false};
    std::thread worker;
    std::mutex wait_mutex;
    std::condition_variable wait_cv;

    Impl(std::chrono::milliseconds i, StatsProviders p)
        : interval(i), providers(std::move(p)) {}

    SnapshotPtr take(Clock::time_point now) {
        auto snapshot = std::make_shared<StatsSnapshot>();
        snapshot->taken_at = now;
        snapshot->uptime = std::chrono::duration_cast<std::chrono::seconds>(now - start_time);

        if (providers.session) {
            const auto info = providers.session();
            snapshot->session_state = std::string(stratum::to_string(info.state));
            snapshot->connected = info.state == stratum::SessionState::Ready;
            snapshot->endpoint = info.endpoint;
            snapshot->reconnects = info.reconnects;
            if (snapshot->connected && info.connected_since && now > *info.connected_since) {
                snapshot->session_uptime = std::chrono::duration_cast<std::chrono::seconds>(
                    now - *info.connected_since);
            }
            snapshot->queued_submissions = info.queued_submissions;
            snapshot->dropped_submissions = info.dropped_submissions;
            snapshot->last_message_sent = info.last_message_sent;
            snapshot->last_message_received = info.last_message_received;
        }

        if (providers.mining) {
            const auto progress = providers.mining();
            snapshot->orchestrator_state = progress.state;
            snapshot->job_id = progress.job_id;
            snapshot->current_height = progress.height;
            snapshot->target_difficulty = progress.difficulty;
            snapshot->shares = progress.shares;
        }

        if (providers.devices) {
            std::lock_guard<std::mutex> lock(sample_mutex);
            for (const auto& record : providers.devices()) {
                DeviceSample device;
                device.device_id = record.device_id;
                device.plugin = record.descriptor.type_filter;
                device.device_name = record.stats.device_name.empty()
                    ? record.descriptor.name()
                    : record.stats.device_name;
                device.edge_bits = record.descriptor.edge_bits;
                device.status = record.status;
                device.in_use = record.stats.in_use;
                device.has_errored = record.status == mining::DeviceStatus::Errored;
                device.last_error = record.last_error;
                device.attempts = record.attempts;
                device.last_attempt_time = record.stats.last_attempt_time;

                // Скорость по приращению между двумя тиками
                auto it = previous.find(record.device_id);
                if (it != previous.end() && now > it->second.at &&
                    record.attempts >= it->second.attempts) {
                    const double dt = std::chrono::duration<double>(now - it->second.at).count();
                    device.attempts_per_sec =
                        static_cast<double>(record.attempts - it->second.attempts) / dt;
                }
                previous[record.device_id] = PreviousSample{record.attempts, now};

                if (device.status == mining::DeviceStatus::Running) {
                    snapshot->global_attempts_per_sec += device.attempts_per_sec;
                }
                snapshot->devices.push_back(std::move(device));
            }
        }

        SnapshotPtr published = std::move(snapshot);
        std::lock_guard<std::mutex> lock(publish_mutex);
        latest = published;
        ++samples;
        return published;
    }

    void run_loop() {
        auto next = Clock::now() + interval;

        while (running) {
            {
                std::unique_lock<std::mutex> lock(wait_mutex);
                wait_cv.wait_until(lock, next, [this] { return !running.load(); });
            }
            if (!running) break;

            take(Clock::now());
            next += interval;

            // Пропущенные тики не навёрстываются
            const auto now = Clock::now();
            while (next <= now) {
                next += interval;
                std::lock_guard<std::mutex> lock(publish_mutex);
                ++skipped;
            }
        }
    }
};

StatsAggregator::StatsAggregator(std::chrono::milliseconds interval, StatsProviders providers)
    : impl_(std::make_unique<Impl>(interval, std::move(providers))) {}

StatsAggregator::~StatsAggregator() {
    stop();
}

void StatsAggregator::start() {
    if (impl_->running.exchange(true)) {
        return;
    }
    impl_->worker = std::thread([this] { impl_->run_loop(); });
}

void StatsAggregator::stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->wait_mutex);
        if (!impl_->running.exchange(false)) {
            return;
        }
    }
    impl_->wait_cv.notify_all();
    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }
}

bool StatsAggregator::is_running() const noexcept {
    return impl_->running;
}

SnapshotPtr StatsAggregator::sample(Clock::time_point now) {
    return impl_->take(now);
}

SnapshotPtr StatsAggregator::snapshot() const {
    std::lock_guard<std::mutex> lock(impl_->publish_mutex);
    return impl_->latest;
}

uint64_t StatsAggregator::samples_taken() const {
    std::lock_guard<std::mutex> lock(impl_->publish_mutex);
    return impl_->samples;
}

uint64_t StatsAggregator::ticks_skipped() const {
    std::lock_guard<std::mutex> lock(impl_->publish_mutex);
    return impl_->skipped;
}

} // namespace strata::monitoring
