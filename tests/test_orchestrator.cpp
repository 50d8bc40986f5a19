/**
 * @file test_orchestrator.cpp
 * @brief Тесты координатора майнинга
 *
 * Полная связка: FakeStratumServer -> сессия -> координатор -> пул
 * с FakeDevice и обратно.
 */

#include <gtest/gtest.h>

#include "mining/orchestrator.hpp"
#include "support/fake_device.hpp"
#include "support/fake_stratum_server.hpp"

#include <algorithm>

namespace strata::tests {

using mining::Orchestrator;
using mining::TrackerState;
using namespace std::chrono_literals;

/**
 * @brief Класс тестов координатора
 */
class OrchestratorTest : public ::testing::Test {
protected:
    void SetUp() override {
        server.set_template("1", 100, 1);
        pool_config.supervise_interval = 2ms;
        pool_config.restart_backoff = 10s;
    }

    void build(std::chrono::milliseconds grace_window = 2000ms) {
        mining::DeviceFactory factory;
        factory.register_family("fake", [this](const DeviceDescriptor&) {
            return std::make_unique<FakeDevice>(device);
        });

        pool = std::make_unique<mining::SolverPool>(pool_config, std::move(factory), logger, signal);
        DeviceDescriptor descriptor;
        descriptor.type_filter = "fake";
        ASSERT_TRUE(pool->add_device(descriptor).has_value());

        stratum::SessionConfig session_config;
        session_config.endpoint = *stratum::Endpoint::parse(server.address());
        session_config.reconnect_initial = 20ms;
        session_config.reconnect_max = 100ms;
        session = std::make_unique<stratum::StratumSession>(session_config, logger, signal);

        orchestrator = std::make_unique<Orchestrator>(grace_window, *pool, *session, signal,
                                                      logger, &reporter);
    }

    /// @brief Запустить и дождаться первого задания на устройстве
    void start_and_wait_first_job() {
        orchestrator->start_mining();
        ASSERT_TRUE(wait_until([&] { return device->job_heights() == std::vector<uint64_t>{100}; }));
    }

    bool has_event(log::EventType type) const {
        auto events = reporter.recent_events();
        return std::any_of(events.begin(), events.end(),
                           [type](const log::EventRecord& e) { return e.type == type; });
    }

    FakeStratumServer server;
    mining::SolverPoolConfig pool_config;
    log::Logger logger = log::Logger::silent();
    std::shared_ptr<EventSignal> signal = std::make_shared<EventSignal>();
    std::shared_ptr<FakeDeviceControl> device = std::make_shared<FakeDeviceControl>();
    log::StatusReporter reporter{log::ReporterConfig{}, nullptr};

    std::unique_ptr<mining::SolverPool> pool;
    std::unique_ptr<stratum::StratumSession> session;
    std::unique_ptr<Orchestrator> orchestrator;
};

// =============================================================================
// Задания и решения
// =============================================================================

/**
 * @brief Тест: задание доходит до устройства, решение принимается
 */
TEST_F(OrchestratorTest, DispatchAndAcceptedShare) {
    build();
    start_and_wait_first_job();
    EXPECT_TRUE(orchestrator->is_mining());

    device->add_solution(make_solution("1", 100));
    ASSERT_TRUE(wait_until([&] { return orchestrator->status().shares.accepted == 1; }));

    auto status = orchestrator->status();
    EXPECT_EQ(status.shares.found, 1u);
    EXPECT_EQ(status.shares.submitted, 1u);
    EXPECT_EQ(status.pending_submissions, 0u);
    EXPECT_EQ(status.height, 100u);
    EXPECT_EQ(status.job_id, "1");
    EXPECT_EQ(server.count("submit"), 1u);
    EXPECT_TRUE(has_event(log::EventType::NewJob));
    EXPECT_TRUE(has_event(log::EventType::SubmitOk));
}

/**
 * @brief Тест: отказ сервера по сложности не останавливает майнинг
 */
TEST_F(OrchestratorTest, RejectedShareKeepsMining) {
    server.set_handler([&](const JsonValue& request) -> std::optional<std::string> {
        if (FakeStratumServer::method_of(request) == "submit") {
            return FakeStratumServer::reply_error(request, -32501,
                                                  "Share rejected due to low difficulty");
        }
        return server.default_reply(request);
    });
    build();
    start_and_wait_first_job();

    device->add_solution(make_solution("1", 100));
    ASSERT_TRUE(wait_until([&] { return orchestrator->status().shares.rejected == 1; }));
    EXPECT_EQ(orchestrator->status().shares.accepted, 0u);
    EXPECT_TRUE(has_event(log::EventType::SubmitFail));

    server.send_line(FakeStratumServer::job_push("2", 101));
    EXPECT_TRUE(wait_until([&] {
        return device->job_heights() == std::vector<uint64_t>{100, 101};
    }));
    EXPECT_TRUE(orchestrator->is_mining());
}

/**
 * @brief Тест: решение по вытесненному заданию после окна приёма не отправляется
 */
TEST_F(OrchestratorTest, StaleShareCounted) {
    build(0ms);
    start_and_wait_first_job();

    server.send_line(FakeStratumServer::job_push("2", 101));
    ASSERT_TRUE(wait_until([&] { return device->job_heights().size() == 2; }));

    device->add_solution(make_solution("1", 100));
    ASSERT_TRUE(wait_until([&] { return orchestrator->status().shares.stale == 1; }));
    EXPECT_EQ(orchestrator->status().shares.submitted, 0u);
    EXPECT_EQ(server.count("submit"), 0u);
    EXPECT_TRUE(has_event(log::EventType::StaleShare));
}

/**
 * @brief Тест: решение в окне приёма отправляется
 */
TEST_F(OrchestratorTest, GraceShareSubmitted) {
    build(5000ms);
    start_and_wait_first_job();

    server.send_line(FakeStratumServer::job_push("2", 101));
    ASSERT_TRUE(wait_until([&] { return device->job_heights().size() == 2; }));
    EXPECT_EQ(orchestrator->state(), TrackerState::Draining);

    device->add_solution(make_solution("1", 100));
    ASSERT_TRUE(wait_until([&] { return orchestrator->status().shares.accepted == 1; }));
    EXPECT_EQ(orchestrator->status().shares.stale, 0u);
}

/**
 * @brief Тест: решения с низкой сложностью и неверного формата отбрасываются
 */
TEST_F(OrchestratorTest, LocalRejections) {
    server.set_template("1", 100, 8);
    build();
    orchestrator->start_mining();
    ASSERT_TRUE(wait_until([&] { return device->job_heights().size() == 1; }));

    auto malformed = make_solution("1", 100, 8);
    malformed.proof.resize(10);
    device->add_solution(make_solution("1", 100, 2));
    device->add_solution(malformed);

    ASSERT_TRUE(wait_until([&] {
        auto shares = orchestrator->status().shares;
        return shares.low_difficulty == 1 && shares.malformed == 1;
    }));
    EXPECT_EQ(server.count("submit"), 0u);
}

/**
 * @brief Тест: высота заданий на устройстве строго растёт
 */
TEST_F(OrchestratorTest, HeightMonotonicity) {
    build();
    start_and_wait_first_job();

    server.send_line(FakeStratumServer::job_push("2", 101));
    ASSERT_TRUE(wait_until([&] { return orchestrator->status().height == 101; }));

    server.send_line(FakeStratumServer::job_push("2b", 101));
    server.send_line(FakeStratumServer::job_push("0", 99));
    server.send_line(FakeStratumServer::job_push("3", 102));
    ASSERT_TRUE(wait_until([&] { return orchestrator->status().height == 102; }));
    ASSERT_TRUE(wait_until([&] {
        auto heights = device->job_heights();
        return !heights.empty() && heights.back() == 102;
    }));

    auto heights = device->job_heights();
    EXPECT_TRUE(std::is_sorted(heights.begin(), heights.end()));
    EXPECT_EQ(std::adjacent_find(heights.begin(), heights.end()), heights.end());
    EXPECT_EQ(std::count(heights.begin(), heights.end(), 99u), 0);
    EXPECT_EQ(orchestrator->status().jobs_ignored, 2u);
    EXPECT_TRUE(has_event(log::EventType::JobIgnored));
}

// =============================================================================
// Сбои
// =============================================================================

/**
 * @brief Тест: ошибка устройства попадает в ленту событий
 */
TEST_F(OrchestratorTest, DeviceErrorReported) {
    build();
    start_and_wait_first_job();

    device->set_errored(true);
    EXPECT_TRUE(wait_until([&] { return has_event(log::EventType::DeviceError); }));
    EXPECT_TRUE(orchestrator->is_mining());
}

/**
 * @brief Тест: обрыв связи и переподключение
 */
TEST_F(OrchestratorTest, ConnectionLostAndRestored) {
    build();
    start_and_wait_first_job();

    server.drop_client();
    ASSERT_TRUE(wait_until([&] { return has_event(log::EventType::ConnectionLost); }));
    ASSERT_TRUE(wait_until([&] { return has_event(log::EventType::Reconnected); }, 5000ms));
    EXPECT_EQ(server.connections(), 2u);

    // Устройство продолжает работу над прежним заданием
    EXPECT_EQ(device->job_heights(), (std::vector<uint64_t>{100}));
}

/**
 * @brief Тест: исключённое устройство перезапускается вручную
 */
TEST_F(OrchestratorTest, RestartErroredDevices) {
    pool_config.max_restarts = 0;
    build();
    start_and_wait_first_job();
    EXPECT_EQ(orchestrator->restart_errored_devices(), 0u);

    device->set_errored(true);
    ASSERT_TRUE(wait_until([&] { return pool->records().front().permanently_errored; }));
    ASSERT_TRUE(wait_until([&] { return device->stop_count() == 1; }));

    EXPECT_EQ(orchestrator->restart_errored_devices(), 1u);
    ASSERT_TRUE(wait_until([&] {
        return pool->records().front().status == mining::DeviceStatus::Running;
    }));
    EXPECT_FALSE(pool->records().front().permanently_errored);
    EXPECT_EQ(device->start_count(), 2);

    // Перезапущенное устройство получает текущее задание
    EXPECT_TRUE(wait_until([&] { return device->job_heights().size() >= 2; }));
    EXPECT_EQ(device->job_heights().back(), 100u);
}

/**
 * @brief Тест: перезагрузка набора устройств во время майнинга
 */
TEST_F(OrchestratorTest, ReloadDeviceConfigWhileMining) {
    build();
    start_and_wait_first_job();

    DeviceDescriptor fake;
    fake.type_filter = "fake";
    DeviceDescriptor unknown;
    unknown.type_filter = "cuckatoo_cuda";

    auto rejected = orchestrator->reload_device_config({fake, unknown});
    ASSERT_FALSE(rejected.has_value());
    EXPECT_EQ(rejected.error().code, ErrorCode::ConfigUnknownDevice);
    EXPECT_EQ(pool->device_count(), 1u);

    ASSERT_TRUE(orchestrator->reload_device_config({fake, fake}).has_value());
    EXPECT_EQ(pool->device_count(), 2u);
    EXPECT_TRUE(orchestrator->is_mining());
}

// =============================================================================
// Остановка
// =============================================================================

/**
 * @brief Тест: stop_mining идемпотентен
 */
TEST_F(OrchestratorTest, StopMiningIdempotent) {
    build();
    start_and_wait_first_job();

    orchestrator->stop_mining();
    orchestrator->stop_mining();

    EXPECT_FALSE(orchestrator->is_mining());
    EXPECT_FALSE(pool->is_running());
    EXPECT_EQ(session->state(), stratum::SessionState::Disconnected);
    EXPECT_EQ(orchestrator->state(), TrackerState::ShuttingDown);
    EXPECT_EQ(device->stops, 1);
}

/**
 * @brief Тест: решение, найденное перед остановкой, отправляется и получает ответ
 */
TEST_F(OrchestratorTest, StopMiningFlushesFoundSolutions) {
    build();
    start_and_wait_first_job();

    device->add_solution(make_solution("1", 100));
    orchestrator->stop_mining();

    auto shares = orchestrator->status().shares;
    EXPECT_EQ(shares.submitted, 1u);
    EXPECT_EQ(shares.accepted + shares.unanswered, 1u);
    EXPECT_EQ(orchestrator->status().pending_submissions, 0u);
}

/**
 * @brief Тест: майнинг можно запустить снова после остановки
 */
TEST_F(OrchestratorTest, RestartAfterStop) {
    build();
    start_and_wait_first_job();
    orchestrator->stop_mining();

    server.set_template("5", 105, 1);
    orchestrator->start_mining();
    EXPECT_TRUE(wait_until([&] {
        auto heights = device->job_heights();
        return !heights.empty() && heights.back() == 105;
    }));
    orchestrator->stop_mining();
}

} // namespace strata::tests
