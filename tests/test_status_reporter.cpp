/**
 * @file test_status_reporter.cpp
 * @brief Тесты для терминального вывода статуса
 */

#include <gtest/gtest.h>

#include "log/status_reporter.hpp"

#include <thread>
#include <chrono>

namespace strata::tests {

// =============================================================================
// Тесты конфигурации
// =============================================================================

TEST(ReporterConfigTest, DefaultValues) {
    log::ReporterConfig config;

    EXPECT_EQ(config.refresh_interval_ms, 1000u);
    EXPECT_EQ(config.event_history, 200u);
    EXPECT_TRUE(config.color);
    EXPECT_EQ(config.events_on_screen, 10u);
}

// =============================================================================
// Тесты EventType
// =============================================================================

TEST(EventTypeTest, ToString) {
    EXPECT_EQ(log::event_type_to_string(log::EventType::NewJob), "NEW_JOB");
    EXPECT_EQ(log::event_type_to_string(log::EventType::JobIgnored), "JOB_IGNORED");
    EXPECT_EQ(log::event_type_to_string(log::EventType::SubmitOk), "SUBMIT_OK");
    EXPECT_EQ(log::event_type_to_string(log::EventType::SubmitFail), "SUBMIT_FAIL");
    EXPECT_EQ(log::event_type_to_string(log::EventType::StaleShare), "STALE");
    EXPECT_EQ(log::event_type_to_string(log::EventType::ConnectionLost), "CONN_LOST");
    EXPECT_EQ(log::event_type_to_string(log::EventType::DeviceError), "DEV_ERROR");
    EXPECT_EQ(log::event_type_to_string(log::EventType::Error), "ERROR");
}

// =============================================================================
// Тесты StatusReporter
// =============================================================================

class StatusReporterTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.color = false;  // Отключаем цвета для тестов
        config_.refresh_interval_ms = 100;
        config_.event_history = 10;
    }

    /// @brief Репортёр, показывающий snapshot_
    log::StatusReporter make_reporter() {
        return log::StatusReporter(config_, [this] { return snapshot_; });
    }

    log::ReporterConfig config_;
    monitoring::SnapshotPtr snapshot_;
};

/**
 * @brief Тест: создание репортера
 */
TEST_F(StatusReporterTest, Creation) {
    log::StatusReporter reporter = make_reporter();

    EXPECT_FALSE(reporter.is_running());
    EXPECT_TRUE(reporter.recent_events().empty());
}

/**
 * @brief Тест: добавление событий
 */
TEST_F(StatusReporterTest, AddEvents) {
    log::StatusReporter reporter = make_reporter();

    reporter.log_event(log::EventType::NewJob, "Job 1 at height 100", "stratum");
    reporter.log_event(log::EventType::SubmitOk, "Share accepted");

    auto events = reporter.recent_events();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].type, log::EventType::NewJob);
    EXPECT_EQ(events[0].source, "stratum");
    EXPECT_EQ(events[1].message, "Share accepted");
}

/**
 * @brief Тест: ограничение истории событий
 */
TEST_F(StatusReporterTest, EventHistoryLimit) {
    config_.event_history = 5;
    log::StatusReporter reporter = make_reporter();

    // Добавляем 10 событий
    for (int i = 0; i < 10; ++i) {
        reporter.log_event(log::EventType::NewJob, "Job " + std::to_string(i));
    }

    auto events = reporter.recent_events();
    EXPECT_EQ(events.size(), 5u);

    // Проверяем что остались последние 5
    EXPECT_EQ(events[0].message, "Job 5");
    EXPECT_EQ(events[4].message, "Job 9");
}

/**
 * @brief Тест: получение N последних событий
 */
TEST_F(StatusReporterTest, GetLastNEvents) {
    log::StatusReporter reporter = make_reporter();

    for (int i = 0; i < 5; ++i) {
        reporter.log_event(log::EventType::NewJob, "Job " + std::to_string(i));
    }

    auto events = reporter.recent_events(3);
    ASSERT_EQ(events.size(), 3u);
    EXPECT_EQ(events[0].message, "Job 2");
}

/**
 * @brief Тест: строки журнала становятся событиями по уровню
 */
TEST_F(StatusReporterTest, LogLinesMappedByLevel) {
    log::StatusReporter reporter = make_reporter();

    reporter.log_line(log::Level::Critical, "main", "fatal");
    reporter.log_line(log::Level::Error, "pool", "device failed");
    reporter.log_line(log::Level::Warning, "stratum", "slow server");
    reporter.log_line(log::Level::Info, "miner", "started");
    reporter.log_line(log::Level::Debug, "miner", "noise");
    reporter.log_line(log::Level::Trace, "stratum", "-> {}");

    auto events = reporter.recent_events();
    ASSERT_EQ(events.size(), 4u);
    EXPECT_EQ(events[0].type, log::EventType::Error);
    EXPECT_EQ(events[1].type, log::EventType::Error);
    EXPECT_EQ(events[1].source, "pool");
    EXPECT_EQ(events[2].type, log::EventType::Warning);
    EXPECT_EQ(events[3].type, log::EventType::Info);
    EXPECT_EQ(events[3].message, "started");
}

/**
 * @brief Тест: подписчик получает каждое событие
 */
TEST_F(StatusReporterTest, SubscriberNotified) {
    log::StatusReporter reporter = make_reporter();

    std::vector<log::EventType> seen;
    reporter.set_subscriber([&seen](const log::EventRecord& record) {
        seen.push_back(record.type);
    });

    reporter.log_event(log::EventType::ConnectionLost, "connection reset");
    reporter.log_event(log::EventType::Reconnected, "Connection restored");

    EXPECT_EQ(seen, (std::vector<log::EventType>{log::EventType::ConnectionLost,
                                                 log::EventType::Reconnected}));
}

/**
 * @brief Тест: рендеринг без снимка
 */
TEST_F(StatusReporterTest, RenderWithoutSnapshot) {
    log::StatusReporter reporter = make_reporter();

    std::string output = reporter.render_plain();

    EXPECT_NE(output.find("STRATA MINER"), std::string::npos);
    EXPECT_NE(output.find("Connection: DISCONNECTED"), std::string::npos);
    EXPECT_NE(output.find("Waiting for job"), std::string::npos);
    EXPECT_NE(output.find("(no devices)"), std::string::npos);
    EXPECT_NE(output.find("(no events)"), std::string::npos);
}

/**
 * @brief Тест: рендеринг статуса без цветов
 */
TEST_F(StatusReporterTest, RenderStatusPlain) {
    auto snapshot = std::make_shared<monitoring::StatsSnapshot>();
    snapshot->uptime = std::chrono::seconds(3661);  // 1h 1m 1s
    snapshot->connected = true;
    snapshot->session_state = "Ready";
    snapshot->endpoint = "127.0.0.1:3416";
    snapshot->session_uptime = std::chrono::seconds(125);
    snapshot->current_height = 800000;
    snapshot->target_difficulty = 4;
    snapshot->global_attempts_per_sec = 2.5;
    snapshot->shares.accepted = 7;
    snapshot->shares.rejected = 1;
    snapshot->shares.stale = 2;

    monitoring::DeviceSample device;
    device.device_id = 0;
    device.plugin = "simulated_cpu";
    device.device_name = "Simulated CPU";
    device.edge_bits = 29;
    device.status = mining::DeviceStatus::Running;
    device.in_use = true;
    device.attempts_per_sec = 2.5;
    snapshot->devices.push_back(device);

    monitoring::DeviceSample broken;
    broken.device_id = 1;
    broken.plugin = "simulated_gpu";
    broken.device_name = "Simulated GPU";
    broken.status = mining::DeviceStatus::Errored;
    broken.has_errored = true;
    broken.last_error = "cancel deadline exceeded";
    snapshot->devices.push_back(broken);

    snapshot_ = snapshot;
    log::StatusReporter reporter = make_reporter();
    reporter.log_event(log::EventType::SubmitOk, "Share accepted for height 800000", "stratum");

    std::string output = reporter.render_plain();

    // Проверяем наличие ключевых элементов
    EXPECT_NE(output.find("Uptime: 1h 1m"), std::string::npos);
    EXPECT_NE(output.find("Connection: CONNECTED (127.0.0.1:3416)  Session: 2m 5s"),
              std::string::npos);
    EXPECT_NE(output.find("Mining at height 800000 at 2.50 GPS"), std::string::npos);
    EXPECT_NE(output.find("Target difficulty: 4"), std::string::npos);
    EXPECT_NE(output.find("7 accepted, 1 rejected, 2 stale"), std::string::npos);
    EXPECT_NE(output.find("simulated_cpu"), std::string::npos);
    EXPECT_NE(output.find("Running"), std::string::npos);
    EXPECT_NE(output.find("Errored"), std::string::npos);
    EXPECT_NE(output.find("cancel deadline exceeded"), std::string::npos);
    EXPECT_NE(output.find("[SUBMIT_OK] Share accepted for height 800000 (stratum)"),
              std::string::npos);

    // Без ANSI последовательностей
    EXPECT_EQ(output.find('\033'), std::string::npos);
}

/**
 * @brief Тест: на экране только последние события
 */
TEST_F(StatusReporterTest, RenderShowsLastEvents) {
    config_.events_on_screen = 2;
    log::StatusReporter reporter = make_reporter();

    reporter.log_event(log::EventType::NewJob, "first");
    reporter.log_event(log::EventType::NewJob, "second");
    reporter.log_event(log::EventType::NewJob, "third");

    std::string output = reporter.render_plain();
    EXPECT_EQ(output.find("first"), std::string::npos);
    EXPECT_NE(output.find("second"), std::string::npos);
    EXPECT_NE(output.find("third"), std::string::npos);
}

/**
 * @brief Тест: запуск и остановка
 */
TEST_F(StatusReporterTest, StartStop) {
    config_.refresh_interval_ms = 10;
    log::StatusReporter reporter = make_reporter();

    reporter.start();
    EXPECT_TRUE(reporter.is_running());

    std::this_thread::sleep_for(std::chrono::milliseconds(30));

    reporter.stop();
    EXPECT_FALSE(reporter.is_running());
    reporter.stop();
}

} // namespace strata::tests
