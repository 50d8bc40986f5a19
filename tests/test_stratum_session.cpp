/**
 * @file test_stratum_session.cpp
 * @brief Тесты сессии с stratum сервером
 *
 * Сервер поднимается в тесте на 127.0.0.1 (FakeStratumServer).
 */

#include <gtest/gtest.h>

#include "stratum/stratum_session.hpp"
#include "support/fake_device.hpp"
#include "support/fake_stratum_server.hpp"

namespace strata::tests {

using stratum::Connected;
using stratum::ConnectionLost;
using stratum::Heartbeat;
using stratum::JobReceived;
using stratum::ResponseReceived;
using stratum::SessionEvent;
using stratum::SessionState;
using stratum::StratumSession;
using namespace std::chrono_literals;

/**
 * @brief Класс тестов сессии
 */
class StratumSessionTest : public ::testing::Test {
protected:
    stratum::SessionConfig config() {
        stratum::SessionConfig cfg;
        auto endpoint = stratum::Endpoint::parse(server.address());
        EXPECT_TRUE(endpoint.has_value());
        cfg.endpoint = *endpoint;
        cfg.connect_timeout = 1000ms;
        cfg.reconnect_initial = 20ms;
        cfg.reconnect_max = 100ms;
        return cfg;
    }

    /// @brief Забрать новые события сессии в events
    void collect(StratumSession& session) {
        for (auto& event : session.poll_events()) {
            events.push_back(std::move(event));
        }
    }

    template<typename T>
    std::vector<T> events_of() const {
        std::vector<T> result;
        for (const auto& event : events) {
            if (const auto* typed = std::get_if<T>(&event)) {
                result.push_back(*typed);
            }
        }
        return result;
    }

    /// @brief Дождаться события типа T
    template<typename T>
    bool wait_for_event(StratumSession& session, std::size_t count = 1) {
        return wait_until([&] {
            collect(session);
            return events_of<T>().size() >= count;
        });
    }

    std::optional<ResponseReceived> response_for(stratum::RequestHandle handle) const {
        for (const auto& response : events_of<ResponseReceived>()) {
            if (response.handle == handle) {
                return response;
            }
        }
        return std::nullopt;
    }

    /// @brief id отправленных серверу submit
    std::vector<uint64_t> submit_ids() const {
        std::vector<uint64_t> ids;
        for (const auto& request : server.requests()) {
            if (FakeStratumServer::method_of(request) == "submit") {
                ids.push_back(request.find("id")->as_uint64().value_or(0));
            }
        }
        return ids;
    }

    FakeStratumServer server;
    log::Logger logger = log::Logger::silent();
    std::vector<SessionEvent> events;
};

// =============================================================================
// Подключение
// =============================================================================

/**
 * @brief Тест: login, затем запрос задания
 */
TEST_F(StratumSessionTest, LoginThenJobTemplate) {
    server.set_template("5", 100, 2);
    auto cfg = config();
    cfg.login = "wallet";
    cfg.password = "x";
    StratumSession session(cfg, logger);

    auto result = session.connect();
    ASSERT_TRUE(result.has_value()) << result.error().message;
    EXPECT_EQ(session.state(), SessionState::Ready);

    ASSERT_TRUE(wait_for_event<JobReceived>(session));
    auto jobs = events_of<JobReceived>();
    EXPECT_EQ(jobs[0].job.job_id, "5");
    EXPECT_EQ(jobs[0].job.height, 100u);
    EXPECT_EQ(jobs[0].job.difficulty, 2u);

    auto connected = events_of<Connected>();
    ASSERT_EQ(connected.size(), 1u);
    EXPECT_FALSE(connected[0].reconnect);

    auto requests = server.requests();
    ASSERT_GE(requests.size(), 2u);
    EXPECT_EQ(FakeStratumServer::method_of(requests[0]), "login");
    EXPECT_EQ(*requests[0].find("params")->find("login")->as_string(), "wallet");
    EXPECT_EQ(*requests[0].find("params")->find("agent")->as_string(), constants::USER_AGENT);
    EXPECT_EQ(FakeStratumServer::method_of(requests[1]), "getjobtemplate");

    EXPECT_EQ(session.info().endpoint, server.address());
    EXPECT_TRUE(session.info().connected_since.has_value());
}

/**
 * @brief Тест: без логина login не отправляется
 */
TEST_F(StratumSessionTest, NoLoginWithoutCredentials) {
    StratumSession session(config(), logger);
    ASSERT_TRUE(session.connect().has_value());
    ASSERT_TRUE(wait_for_event<JobReceived>(session));
    EXPECT_EQ(server.count("login"), 0u);
}

/**
 * @brief Тест: отклонённый login
 */
TEST_F(StratumSessionTest, LoginRejected) {
    server.set_handler([](const JsonValue& request) -> std::optional<std::string> {
        if (FakeStratumServer::method_of(request) == "login") {
            return FakeStratumServer::reply_error(request, -32500, "invalid login");
        }
        return FakeStratumServer::reply_ok(request);
    });
    auto cfg = config();
    cfg.login = "nobody";
    StratumSession session(cfg, logger);

    auto result = session.connect();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::LoginRejected);
    EXPECT_NE(result.error().message.find("invalid login"), std::string::npos);
    EXPECT_EQ(session.state(), SessionState::Disconnected);
}

/**
 * @brief Тест: отказ в подключении
 */
TEST_F(StratumSessionTest, ConnectionRefused) {
    server.stop_listening();
    StratumSession session(config(), logger);

    auto result = session.connect();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().category(), ErrorCategory::Connection);
    EXPECT_EQ(session.state(), SessionState::Disconnected);
    EXPECT_FALSE(session.info().last_error.empty());
}

// =============================================================================
// Сообщения
// =============================================================================

/**
 * @brief Тест: push задания от сервера
 */
TEST_F(StratumSessionTest, JobPush) {
    StratumSession session(config(), logger);
    ASSERT_TRUE(session.connect().has_value());
    ASSERT_TRUE(wait_for_event<JobReceived>(session));
    ASSERT_TRUE(wait_until([&] { return server.count("getjobtemplate") == 1; }));

    ASSERT_TRUE(server.send_line(FakeStratumServer::job_push("9", 200, 3)));
    ASSERT_TRUE(wait_for_event<JobReceived>(session, 2));

    auto jobs = events_of<JobReceived>();
    EXPECT_EQ(jobs[1].job.job_id, "9");
    EXPECT_EQ(jobs[1].job.height, 200u);
    EXPECT_EQ(jobs[1].job.pre_pow, (Bytes{0x00, 0xaa, 0x11, 0xbb, 0x22, 0xcc}));
}

/**
 * @brief Тест: испорченные строки пропускаются, сессия продолжает работу
 */
TEST_F(StratumSessionTest, MalformedLinesSkipped) {
    StratumSession session(config(), logger);
    ASSERT_TRUE(session.connect().has_value());
    ASSERT_TRUE(wait_for_event<JobReceived>(session));
    ASSERT_TRUE(wait_until([&] { return server.count("getjobtemplate") == 1; }));

    server.send_line("this is not json");
    server.send_line(R"({"jsonrpc":"2.0","method":"mining.set_difficulty","params":[8]})");
    server.send_line(FakeStratumServer::job_push("10", 300));

    ASSERT_TRUE(wait_for_event<JobReceived>(session, 2));
    EXPECT_EQ(session.info().malformed_lines, 2u);
    EXPECT_EQ(session.state(), SessionState::Ready);
}

/**
 * @brief Тест: ответы на submit сопоставляются по handle
 */
TEST_F(StratumSessionTest, SubmitResponsesCorrelated) {
    server.set_handler([&](const JsonValue& request) -> std::optional<std::string> {
        const auto* params = request.find("params");
        if (FakeStratumServer::method_of(request) == "submit" &&
            *params->find("job_id")->as_string() == "bad") {
            return FakeStratumServer::reply_error(request, -32501,
                                                  "Share rejected due to low difficulty");
        }
        return server.default_reply(request);
    });
    StratumSession session(config(), logger);
    ASSERT_TRUE(session.connect().has_value());

    auto good = session.submit_solution(make_solution("good", 1));
    auto bad = session.submit_solution(make_solution("bad", 1));
    EXPECT_NE(good, bad);

    ASSERT_TRUE(wait_for_event<ResponseReceived>(session, 2));

    auto accepted = response_for(good);
    ASSERT_TRUE(accepted.has_value());
    EXPECT_EQ(accepted->method, "submit");
    ASSERT_TRUE(accepted->result.has_value());
    EXPECT_EQ(*accepted->result->as_string(), "ok");

    auto rejected = response_for(bad);
    ASSERT_TRUE(rejected.has_value());
    ASSERT_FALSE(rejected->result.has_value());
    EXPECT_EQ(rejected->result.error().code, ErrorCode::SubmissionRejected);
    EXPECT_EQ(rejected->result.error().message, "Share rejected due to low difficulty");

    EXPECT_EQ(submit_ids(), (std::vector<uint64_t>{good, bad}));
}

/**
 * @brief Тест: произвольный запрос вне Ready получает ConnectionClosed
 */
TEST_F(StratumSessionTest, SendRequestWhenNotReady) {
    StratumSession session(config(), logger);

    auto handle = session.send_request("status", JsonValue());
    collect(session);

    auto response = response_for(handle);
    ASSERT_TRUE(response.has_value());
    ASSERT_FALSE(response->result.has_value());
    EXPECT_EQ(response->result.error().code, ErrorCode::ConnectionClosed);
    EXPECT_EQ(server.requests().size(), 0u);
}

/**
 * @brief Тест: keepalive по таймеру даёт Heartbeat
 */
TEST_F(StratumSessionTest, KeepaliveHeartbeat) {
    auto cfg = config();
    cfg.keepalive_interval = 50ms;
    StratumSession session(cfg, logger);
    ASSERT_TRUE(session.connect().has_value());

    ASSERT_TRUE(wait_for_event<Heartbeat>(session));
    EXPECT_GE(server.count("keepalive"), 1u);
}

/**
 * @brief Тест: запрос без ответа завершается по таймауту
 */
TEST_F(StratumSessionTest, RequestTimeout) {
    server.set_handler([&](const JsonValue& request) -> std::optional<std::string> {
        if (FakeStratumServer::method_of(request) == "submit") {
            return std::nullopt;
        }
        return server.default_reply(request);
    });
    auto cfg = config();
    cfg.request_timeout = 100ms;
    StratumSession session(cfg, logger);
    ASSERT_TRUE(session.connect().has_value());

    auto handle = session.submit_solution(make_solution("1", 1));
    ASSERT_TRUE(wait_for_event<ResponseReceived>(session));

    auto response = response_for(handle);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->result.error().code, ErrorCode::RequestTimeout);
    EXPECT_EQ(session.state(), SessionState::Ready);
}

// =============================================================================
// Обрыв и переподключение
// =============================================================================

/**
 * @brief Тест: решение без ответа при обрыве не переотправляется
 */
TEST_F(StratumSessionTest, OutstandingSubmitUnansweredOnDrop) {
    server.set_handler([&](const JsonValue& request) -> std::optional<std::string> {
        if (FakeStratumServer::method_of(request) == "submit") {
            return std::nullopt;
        }
        return server.default_reply(request);
    });
    StratumSession session(config(), logger);
    ASSERT_TRUE(session.connect().has_value());

    auto handle = session.submit_solution(make_solution("1", 1));
    ASSERT_TRUE(wait_until([&] { return server.count("submit") == 1; }));

    server.drop_client();
    ASSERT_TRUE(wait_for_event<ConnectionLost>(session));

    auto response = response_for(handle);
    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->result.error().code, ErrorCode::SubmissionUnanswered);
    EXPECT_EQ(session.state(), SessionState::Disconnected);
    EXPECT_EQ(session.info().outstanding_requests, 0u);
}

/**
 * @brief Тест: решения без связи отправляются после переподключения ровно один раз
 */
TEST_F(StratumSessionTest, QueuedSubmissionsFlushedOnceAfterReconnect) {
    StratumSession session(config(), logger);
    session.start();
    ASSERT_TRUE(wait_until([&] { return session.state() == SessionState::Ready; }));

    server.stop_listening();
    server.drop_client();
    ASSERT_TRUE(wait_for_event<ConnectionLost>(session));
    EXPECT_NE(session.state(), SessionState::Ready);

    auto first = session.submit_solution(make_solution("1", 1));
    auto second = session.submit_solution(make_solution("1", 1));
    EXPECT_EQ(session.info().queued_submissions, 2u);
    EXPECT_EQ(server.count("submit"), 0u);

    server.resume_listening();
    ASSERT_TRUE(wait_until([&] { return session.state() == SessionState::Ready; }, 5000ms));
    ASSERT_TRUE(wait_until([&] { return server.count("submit") == 2; }));
    ASSERT_TRUE(wait_for_event<ResponseReceived>(session, 2));

    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(submit_ids(), (std::vector<uint64_t>{first, second}));
    EXPECT_EQ(session.info().queued_submissions, 0u);
    EXPECT_EQ(session.info().reconnects, 1u);
    EXPECT_EQ(server.connections(), 2u);

    auto connected = events_of<Connected>();
    ASSERT_EQ(connected.size(), 2u);
    EXPECT_FALSE(connected[0].reconnect);
    EXPECT_TRUE(connected[1].reconnect);

    session.shutdown();
}

/**
 * @brief Тест: после каждой потери связи пауза перед переподключением растёт
 */
TEST_F(StratumSessionTest, BackoffGrowsAfterRepeatedDrops) {
    server.set_drop_on_accept(true);
    auto cfg = config();
    cfg.reconnect_initial = 40ms;
    cfg.reconnect_max = 1000ms;
    StratumSession session(cfg, logger);
    session.start();

    ASSERT_TRUE(wait_until([&] { return server.accept_times().size() >= 4; }, 5000ms));
    EXPECT_TRUE(wait_until([&] { return session.info().current_backoff > 0ms; }));
    session.shutdown();

    auto accepted = server.accept_times();
    std::vector<std::chrono::milliseconds> gaps;
    for (std::size_t i = 1; i < 4; ++i) {
        gaps.push_back(std::chrono::duration_cast<std::chrono::milliseconds>(
            accepted[i] - accepted[i - 1]));
    }

    // 40, 80, 160 мс с разбросом +-20%
    for (auto gap : gaps) {
        EXPECT_GE(gap, 30ms);
    }
    EXPECT_GT(gaps[2], gaps[0]);
    EXPECT_GE(gaps[2], 120ms);
}

/**
 * @brief Тест: разброс не выводит задержку за reconnect_max
 */
TEST_F(StratumSessionTest, BackoffCappedAtMaximum) {
    server.set_drop_on_accept(true);
    auto cfg = config();
    cfg.reconnect_initial = 40ms;
    cfg.reconnect_max = 40ms;
    StratumSession session(cfg, logger);
    session.start();

    for (int i = 0; i < 20; ++i) {
        EXPECT_LE(session.info().current_backoff, 40ms);
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_GE(server.connections(), 2u);
    session.shutdown();
}

/**
 * @brief Тест: next_event выдаёт события по одному в порядке прихода
 */
TEST_F(StratumSessionTest, NextEventInArrivalOrder) {
    server.set_template("1", 100, 1);
    StratumSession session(config(), logger);
    ASSERT_TRUE(session.connect().has_value());
    ASSERT_TRUE(wait_until([&] { return server.count("getjobtemplate") == 1; }));

    ASSERT_TRUE(server.send_line(FakeStratumServer::job_push("2", 101)));
    ASSERT_TRUE(server.send_line(FakeStratumServer::job_push("3", 102)));

    std::vector<uint64_t> heights;
    ASSERT_TRUE(wait_until([&] {
        while (auto event = session.next_event()) {
            if (const auto* job = std::get_if<JobReceived>(&*event)) {
                heights.push_back(job->job.height);
            }
        }
        return heights.size() >= 3;
    }));

    EXPECT_EQ(heights, (std::vector<uint64_t>{100, 101, 102}));
    EXPECT_FALSE(session.next_event().has_value());
}

/**
 * @brief Тест: переполнение очереди вытесняет самое старое решение
 */
TEST_F(StratumSessionTest, QueueOverflowDropsOldest) {
    auto cfg = config();
    cfg.submit_queue_size = 2;
    StratumSession session(cfg, logger);

    auto oldest = session.submit_solution(make_solution("1", 1));
    auto middle = session.submit_solution(make_solution("2", 2));
    auto newest = session.submit_solution(make_solution("3", 3));

    collect(session);
    auto dropped = response_for(oldest);
    ASSERT_TRUE(dropped.has_value());
    EXPECT_EQ(dropped->result.error().code, ErrorCode::SubmissionUnanswered);
    EXPECT_EQ(session.info().dropped_submissions, 1u);
    EXPECT_EQ(session.info().queued_submissions, 2u);

    ASSERT_TRUE(session.connect().has_value());
    ASSERT_TRUE(wait_until([&] { return server.count("submit") == 2; }));
    EXPECT_EQ(submit_ids(), (std::vector<uint64_t>{middle, newest}));
}

/**
 * @brief Тест: shutdown идемпотентен
 */
TEST_F(StratumSessionTest, ShutdownIdempotent) {
    StratumSession session(config(), logger);
    session.start();
    ASSERT_TRUE(wait_until([&] { return session.state() == SessionState::Ready; }));

    session.shutdown();
    EXPECT_EQ(session.state(), SessionState::Disconnected);
    session.shutdown();
    EXPECT_EQ(session.state(), SessionState::Disconnected);

    // После остановки переподключения не выполняются
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(server.connections(), 1u);
}

} // namespace strata::tests
