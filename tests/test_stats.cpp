/**
 * @file test_stats.cpp
 * @brief Тесты агрегатора статистики
 */

#include <gtest/gtest.h>

#include "monitoring/stats.hpp"

#include <mutex>
#include <thread>

namespace strata::tests {

using mining::DeviceRecord;
using mining::DeviceStatus;
using monitoring::StatsAggregator;
using namespace std::chrono_literals;

/**
 * @brief Класс тестов статистики
 *
 * Провайдеры отдают данные, изменяемые тестом.
 */
class StatsTest : public ::testing::Test {
protected:
    monitoring::StatsProviders providers() {
        monitoring::StatsProviders p;
        p.devices = [this] {
            std::lock_guard<std::mutex> lock(mutex);
            return devices;
        };
        p.session = [this] {
            std::lock_guard<std::mutex> lock(mutex);
            return session;
        };
        p.mining = [this] {
            std::lock_guard<std::mutex> lock(mutex);
            return progress;
        };
        return p;
    }

    static DeviceRecord device(uint32_t id, DeviceStatus status, uint64_t attempts) {
        DeviceRecord record;
        record.device_id = id;
        record.descriptor.type_filter = "simulated_cpu";
        record.descriptor.device_index = id;
        record.descriptor.edge_bits = 29;
        record.status = status;
        record.attempts = attempts;
        return record;
    }

    std::mutex mutex;
    std::vector<DeviceRecord> devices;
    stratum::SessionInfo session;
    monitoring::MiningProgress progress;
};

// =============================================================================
// Снимки
// =============================================================================

/**
 * @brief Тест: скорость считается по приращению попыток
 */
TEST_F(StatsTest, RateFromDeltas) {
    devices = {device(0, DeviceStatus::Running, 100)};
    StatsAggregator stats(1000ms, providers());

    const auto t0 = StatsAggregator::Clock::now();
    auto first = stats.sample(t0);
    ASSERT_EQ(first->devices.size(), 1u);
    EXPECT_DOUBLE_EQ(first->devices[0].attempts_per_sec, 0.0);

    devices[0].attempts = 300;
    auto second = stats.sample(t0 + 2s);
    EXPECT_DOUBLE_EQ(second->devices[0].attempts_per_sec, 100.0);
    EXPECT_DOUBLE_EQ(second->global_attempts_per_sec, 100.0);
    EXPECT_EQ(second->devices[0].device_name, "simulated_cpu#0");
    EXPECT_EQ(second->devices[0].edge_bits, 29u);
}

/**
 * @brief Тест: в общую скорость входят только работающие устройства
 */
TEST_F(StatsTest, GlobalRateCountsRunningOnly) {
    devices = {device(0, DeviceStatus::Running, 0),
               device(1, DeviceStatus::Errored, 0),
               device(2, DeviceStatus::Running, 0)};
    StatsAggregator stats(1000ms, providers());

    const auto t0 = StatsAggregator::Clock::now();
    (void)stats.sample(t0);

    devices[0].attempts = 10;
    devices[1].attempts = 50;
    devices[1].last_error = "cancel timeout";
    devices[2].attempts = 30;
    auto snapshot = stats.sample(t0 + 1s);

    EXPECT_DOUBLE_EQ(snapshot->global_attempts_per_sec, 40.0);
    EXPECT_DOUBLE_EQ(snapshot->devices[1].attempts_per_sec, 50.0);
    EXPECT_TRUE(snapshot->devices[1].has_errored);
    EXPECT_EQ(snapshot->devices[1].last_error, "cancel timeout");
}

/**
 * @brief Тест: уменьшение счётчика (новое устройство) не даёт отрицательной скорости
 */
TEST_F(StatsTest, CounterResetGivesZeroRate) {
    devices = {device(0, DeviceStatus::Running, 500)};
    StatsAggregator stats(1000ms, providers());

    const auto t0 = StatsAggregator::Clock::now();
    (void)stats.sample(t0);
    devices[0].attempts = 20;
    auto snapshot = stats.sample(t0 + 1s);

    EXPECT_DOUBLE_EQ(snapshot->devices[0].attempts_per_sec, 0.0);
}

/**
 * @brief Тест: снимки неизменяемы, каждый тик публикует новый
 */
TEST_F(StatsTest, SnapshotsAreImmutable) {
    devices = {device(0, DeviceStatus::Running, 1)};
    progress.height = 10;
    StatsAggregator stats(1000ms, providers());

    auto initial = stats.snapshot();
    ASSERT_NE(initial, nullptr);
    EXPECT_EQ(initial->current_height, 0u);

    auto first = stats.sample();
    progress.height = 11;
    auto second = stats.sample();

    EXPECT_NE(first, second);
    EXPECT_EQ(first->current_height, 10u);
    EXPECT_EQ(second->current_height, 11u);
    EXPECT_EQ(stats.snapshot(), second);
    EXPECT_EQ(stats.samples_taken(), 2u);
}

/**
 * @brief Тест: данные сессии и оркестратора попадают в снимок
 */
TEST_F(StatsTest, CopiesSessionAndProgress) {
    session.state = stratum::SessionState::Ready;
    session.endpoint = "127.0.0.1:3416";
    session.reconnects = 2;
    const auto now = StatsAggregator::Clock::now();
    session.connected_since = now - 90s;
    progress.state = "Dispatching";
    progress.job_id = "77";
    progress.height = 1234;
    progress.difficulty = 8;
    progress.shares.accepted = 5;
    progress.shares.rejected = 1;
    StatsAggregator stats(1000ms, providers());

    auto snapshot = stats.sample(now);
    EXPECT_TRUE(snapshot->connected);
    EXPECT_EQ(snapshot->session_state, "Ready");
    EXPECT_EQ(snapshot->endpoint, "127.0.0.1:3416");
    EXPECT_EQ(snapshot->reconnects, 2u);
    EXPECT_EQ(snapshot->session_uptime, 90s);
    EXPECT_EQ(snapshot->orchestrator_state, "Dispatching");
    EXPECT_EQ(snapshot->job_id, "77");
    EXPECT_EQ(snapshot->target_difficulty, 8u);
    EXPECT_EQ(snapshot->shares.accepted, 5u);
    EXPECT_EQ(snapshot->shares.rejected, 1u);

    // После обрыва время сессии обнуляется
    {
        std::lock_guard<std::mutex> lock(mutex);
        session.state = stratum::SessionState::Reconnecting;
        session.connected_since.reset();
    }
    auto dropped = stats.sample(now + 1s);
    EXPECT_FALSE(dropped->connected);
    EXPECT_EQ(dropped->session_uptime, 0s);
}

/**
 * @brief Тест: медленный провайдер пропускает тики без навёрстывания
 */
TEST_F(StatsTest, SlowProviderSkipsTicks) {
    auto p = providers();
    p.devices = [] {
        std::this_thread::sleep_for(35ms);
        return std::vector<DeviceRecord>{};
    };
    StatsAggregator stats(10ms, std::move(p));

    const auto started = StatsAggregator::Clock::now();
    stats.start();
    std::this_thread::sleep_for(300ms);
    stats.stop();
    const auto elapsed = StatsAggregator::Clock::now() - started;

    const auto ticks = static_cast<uint64_t>(elapsed / 10ms);
    EXPECT_GT(stats.ticks_skipped(), 0u);
    EXPECT_GT(stats.samples_taken(), 0u);
    // Каждый снимок занимает не меньше 35 мс, поэтому снимков
    // заметно меньше, чем интервалов
    EXPECT_LE(stats.samples_taken(), ticks / 3 + 1);
}

/**
 * @brief Тест: отсутствующие провайдеры пропускаются
 */
TEST_F(StatsTest, MissingProvidersSkipped) {
    StatsAggregator stats(1000ms, monitoring::StatsProviders{});
    auto snapshot = stats.sample();
    EXPECT_FALSE(snapshot->connected);
    EXPECT_TRUE(snapshot->devices.empty());
    EXPECT_EQ(snapshot->mining_status(), "Waiting for job");
}

/**
 * @brief Тест: периодический сбор и идемпотентная остановка
 */
TEST_F(StatsTest, PeriodicSampling) {
    StatsAggregator stats(10ms, providers());
    stats.start();
    stats.start();
    EXPECT_TRUE(stats.is_running());

    const auto deadline = std::chrono::steady_clock::now() + 3s;
    while (stats.samples_taken() < 3 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(5ms);
    }
    EXPECT_GE(stats.samples_taken(), 3u);

    stats.stop();
    stats.stop();
    EXPECT_FALSE(stats.is_running());
}

// =============================================================================
// Форматирование
// =============================================================================

/**
 * @brief Тест: форматирование скорости
 */
TEST_F(StatsTest, FormatRate) {
    EXPECT_EQ(monitoring::format_rate(0.0), "0.00 GPS");
    EXPECT_EQ(monitoring::format_rate(3.254), "3.25 GPS");
    EXPECT_EQ(monitoring::format_rate(1500.0), "1.50 KGPS");
    EXPECT_EQ(monitoring::format_rate(2.5e6), "2.50 MGPS");
}

/**
 * @brief Тест: форматирование длительности
 */
TEST_F(StatsTest, FormatDuration) {
    EXPECT_EQ(monitoring::format_duration(45s), "45s");
    EXPECT_EQ(monitoring::format_duration(125s), "2m 5s");
    EXPECT_EQ(monitoring::format_duration(3h + 7min), "3h 7m");
    EXPECT_EQ(monitoring::format_duration(std::chrono::seconds(26 * 3600 + 30 * 60)), "1d 2h 30m");
}

/**
 * @brief Тест: строка статуса майнинга
 */
TEST_F(StatsTest, MiningStatus) {
    monitoring::StatsSnapshot snapshot;
    snapshot.current_height = 1200;
    snapshot.global_attempts_per_sec = 1500.0;
    EXPECT_EQ(snapshot.mining_status(), "Mining at height 1200 at 1.50 KGPS");
}

} // namespace strata::tests
