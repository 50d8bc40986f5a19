/**
 * @file orchestrator.cpp
 * @brief Реализация координатора майнинга
 */

#include "orchestrator.hpp"

#include <atomic>
#include <format>
#include <mutex>
#include <thread>
#include <unordered_map>

namespace strata::mining {

namespace {

constexpr std::string_view COMPONENT = "miner";

/**
 * @brief Решение, ожидающее ответа сервера
 */
struct PendingSubmission {
    std::string job_id;
    uint64_t height = 0;
    uint32_t device_id = 0;
    std::chrono::steady_clock::time_point submitted_at;
};

} // namespace

// =============================================================================
// Реализация
// =============================================================================

struct Orchestrator::Impl {
    SolverPool& pool;
    stratum::StratumSession& session;
    std::shared_ptr<EventSignal> signal;
    log::Logger& logger;
    log::StatusReporter* reporter;

    mutable std::mutex mutex;
    JobTracker tracker;
    std::unordered_map<stratum::RequestHandle, PendingSubmission> pending;
    monitoring::ShareCounters shares;
    uint64_t jobs_dispatched = 0;
    uint64_t jobs_ignored = 0;

    std::atomic<bool> mining{false};
    std::atomic<bool> loop_running{false};
    std::thread loop_thread;

    // Сериализует start_mining/stop_mining
    std::mutex control_mutex;

    Impl(std::chrono::milliseconds grace, SolverPool& p, stratum::StratumSession& s,
         std::shared_ptr<EventSignal> sig, log::Logger& l, log::StatusReporter* r)
        : pool(p)
        , session(s)
        , signal(sig ? std::move(sig) : std::make_shared<EventSignal>())
        , logger(l)
        , reporter(r)
        , tracker(grace) {}

    void report(log::EventType type, const std::string& message, std::string_view source) {
        if (reporter) {
            reporter->log_event(type, message, std::string(source));
        }
    }

    // =========================================================================
    // События сессии
    // =========================================================================

    void on_job(const Job& job, Clock::time_point now) {
        const auto decision = tracker.accept(job, now);
        switch (decision) {
            case JobDecision::Dispatch:
                ++jobs_dispatched;
                pool.dispatch_job(job);
                logger.info(COMPONENT, "Новое задание {} height={} difficulty={}",
                            job.job_id, job.height, job.difficulty);
                report(log::EventType::NewJob,
                       std::format("Job {} at height {}", job.job_id, job.height), "stratum");
                break;

            case JobDecision::IgnoredDuplicate:
                ++jobs_ignored;
                logger.debug(COMPONENT, "Повтор задания {} height={}", job.job_id, job.height);
                break;

            case JobDecision::IgnoredStale: {
                ++jobs_ignored;
                const uint64_t current = tracker.current() ? tracker.current()->height : 0;
                logger.warn(COMPONENT, "Задание {} height={} старее текущего height={}",
                            job.job_id, job.height, current);
                report(log::EventType::JobIgnored,
                       std::format("Out-of-order job at height {} (current {})", job.height, current),
                       "stratum");
                break;
            }

            case JobDecision::IgnoredShutdown:
                ++jobs_ignored;
                logger.debug(COMPONENT, "Задание {} пропущено: остановка", job.job_id);
                break;
        }
    }

    void on_response(const stratum::ResponseReceived& response) {
        auto it = pending.find(response.handle);
        if (it == pending.end()) {
            if (!response.result) {
                logger.debug(COMPONENT, "Запрос {} ({}) завершился ошибкой: {}",
                             response.handle, response.method, response.result.error().message);
            }
            return;
        }
        const PendingSubmission submission = std::move(it->second);
        pending.erase(it);

        if (response.result) {
            ++shares.accepted;
            logger.info(COMPONENT, "Решение принято: job {} height={} устройство {}",
                        submission.job_id, submission.height, submission.device_id);
            report(log::EventType::SubmitOk,
                   std::format("Share accepted for height {} (device {})",
                               submission.height, submission.device_id), "stratum");
            return;
        }

        const auto& error = response.result.error();
        if (error.code == ErrorCode::SubmissionRejected) {
            ++shares.rejected;
            logger.warn(COMPONENT, "Решение отклонено: job {} height={}: {}",
                        submission.job_id, submission.height, error.message);
            report(log::EventType::SubmitFail,
                   std::format("Share rejected: {}", error.message), "stratum");
        } else {
            ++shares.unanswered;
            logger.warn(COMPONENT, "Нет ответа на решение: job {} height={}: {}",
                        submission.job_id, submission.height, error.message);
            report(log::EventType::SubmitFail,
                   std::format("Share unanswered: {}", error.message), "stratum");
        }
    }

    void on_event(const stratum::SessionEvent& event, Clock::time_point now) {
        if (const auto* job = std::get_if<stratum::JobReceived>(&event)) {
            on_job(job->job, now);
        } else if (const auto* response = std::get_if<stratum::ResponseReceived>(&event)) {
            on_response(*response);
        } else if (const auto* lost = std::get_if<stratum::ConnectionLost>(&event)) {
            logger.warn(COMPONENT, "Подключение потеряно ({}), устройства продолжают работу",
                        lost->reason);
            report(log::EventType::ConnectionLost, lost->reason, "stratum");
        } else if (const auto* connected = std::get_if<stratum::Connected>(&event)) {
            if (connected->reconnect) {
                report(log::EventType::Reconnected, "Connection restored", "stratum");
            }
        } else if (std::holds_alternative<stratum::Heartbeat>(event)) {
            logger.trace(COMPONENT, "keepalive");
        }
    }

    // =========================================================================
    // Решения пула
    // =========================================================================

    void on_solution(const Solution& solution, Clock::time_point now) {
        ++shares.found;
        const auto verdict = tracker.classify(solution, now);

        switch (verdict) {
            case SolutionVerdict::Current:
            case SolutionVerdict::Grace: {
                const auto handle = session.submit_solution(solution);
                pending[handle] = PendingSubmission{solution.job_id, solution.height,
                                                    solution.device_id, now};
                ++shares.submitted;
                logger.debug(COMPONENT, "Решение устройства {} для job {} отправлено ({})",
                             solution.device_id, solution.job_id, to_string(verdict));
                break;
            }

            case SolutionVerdict::Stale:
                ++shares.stale;
                logger.info(COMPONENT, "Устаревшее решение устройства {} для job {} отброшено",
                            solution.device_id, solution.job_id);
                report(log::EventType::StaleShare,
                       std::format("Stale share for job {} (device {})",
                                   solution.job_id, solution.device_id), "miner");
                break;

            case SolutionVerdict::LowDifficulty:
                ++shares.low_difficulty;
                logger.debug(COMPONENT, "Решение устройства {} ниже целевой сложности ({})",
                             solution.device_id, solution.difficulty);
                break;

            case SolutionVerdict::Malformed:
                ++shares.malformed;
                logger.warn(COMPONENT, "Некорректное решение от устройства {}: {}",
                            solution.device_id, solution.validate_format().error().message);
                break;
        }
    }

    void process(Clock::time_point now) {
        auto events = session.poll_events();
        auto solutions = pool.drain_solutions();

        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& event : events) {
            on_event(event, now);
        }
        for (const auto& solution : solutions) {
            on_solution(solution, now);
        }
        tracker.expire(now);
    }

    void run_loop() {
        const auto wait = std::chrono::milliseconds(constants::ORCHESTRATOR_WAIT_MS);
        while (loop_running) {
            signal->wait_for(wait);
            process(Clock::now());
        }
    }

    // =========================================================================
    // События устройств
    // =========================================================================

    void on_device_event(const DeviceRecord& record) {
        if (record.status == DeviceStatus::Errored) {
            const auto message = record.permanently_errored
                ? std::format("Device {} disabled: {}", record.device_id, record.last_error)
                : std::format("Device {} failed: {}", record.device_id, record.last_error);
            report(log::EventType::DeviceError, message, "pool");
        } else if (record.status == DeviceStatus::Running && record.restart_count > 0) {
            report(log::EventType::DeviceRestart,
                   std::format("Device {} restarted (attempt {})",
                               record.device_id, record.restart_count), "pool");
        }
    }

    [[nodiscard]] std::size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex);
        return pending.size();
    }
};

// =============================================================================
// Публичный API
// =============================================================================

Orchestrator::Orchestrator(std::chrono::milliseconds grace_window,
                           SolverPool& pool,
                           stratum::StratumSession& session,
                           std::shared_ptr<EventSignal> signal,
                           log::Logger& logger,
                           log::StatusReporter* reporter)
    : impl_(std::make_unique<Impl>(grace_window, pool, session, std::move(signal),
                                   logger, reporter)) {
    pool.set_device_event_handler([impl = impl_.get()](const DeviceRecord& record) {
        impl->on_device_event(record);
    });
}

Orchestrator::~Orchestrator() {
    stop_mining();
    impl_->pool.set_device_event_handler(nullptr);
}

void Orchestrator::start_mining() {
    std::lock_guard<std::mutex> control(impl_->control_mutex);
    if (impl_->mining) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->tracker.resume();
    }

    impl_->logger.info(COMPONENT, "Запуск майнинга: устройств {}", impl_->pool.device_count());
    impl_->pool.start_all();
    impl_->session.start();

    impl_->loop_running = true;
    impl_->loop_thread = std::thread([this] { impl_->run_loop(); });
    impl_->mining = true;
}

void Orchestrator::stop_mining() {
    std::lock_guard<std::mutex> control(impl_->control_mutex);
    if (!impl_->mining) {
        return;
    }
    impl_->mining = false;

    impl_->logger.info(COMPONENT, "Остановка майнинга");
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->tracker.shut_down();
    }

    // 1. Поток координатора
    impl_->loop_running = false;
    impl_->signal->notify();
    if (impl_->loop_thread.joinable()) {
        impl_->loop_thread.join();
    }

    // 2. Устройства: найденные до остановки решения ещё отправляются
    impl_->pool.stop_all();
    impl_->process(Clock::now());

    // 3. Ответы на отправленные решения
    const auto deadline = Clock::now() +
        std::chrono::milliseconds(constants::SHUTDOWN_RESPONSE_WAIT_MS);
    while (impl_->pending_count() > 0 &&
           impl_->session.state() == stratum::SessionState::Ready &&
           Clock::now() < deadline) {
        impl_->signal->wait_for(std::chrono::milliseconds(constants::ORCHESTRATOR_WAIT_MS));
        impl_->process(Clock::now());
    }

    // 4. Сессия закрывается последней
    impl_->session.shutdown();
    impl_->process(Clock::now());

    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (!impl_->pending.empty()) {
        impl_->logger.warn(COMPONENT, "Остановка: {} решений осталось без ответа",
                           impl_->pending.size());
        impl_->shares.unanswered += impl_->pending.size();
        impl_->pending.clear();
    }
    impl_->logger.info(COMPONENT, "Майнинг остановлен: принято {}, отклонено {}, устаревших {}",
                       impl_->shares.accepted, impl_->shares.rejected, impl_->shares.stale);
}

bool Orchestrator::is_mining() const noexcept {
    return impl_->mining;
}

Result<void> Orchestrator::reload_device_config(const std::vector<DeviceDescriptor>& descriptors) {
    auto result = impl_->pool.reload(descriptors);
    if (!result) {
        impl_->logger.error(COMPONENT, "Перезагрузка устройств отклонена: {}",
                            result.error().message);
        return result;
    }
    impl_->logger.info(COMPONENT, "Набор устройств обновлён: {}", impl_->pool.device_count());
    return {};
}

std::size_t Orchestrator::restart_errored_devices() {
    std::size_t restarted = 0;
    for (const auto& record : impl_->pool.records()) {
        if (!record.permanently_errored) {
            continue;
        }
        if (auto result = impl_->pool.restart_device(record.device_id); !result) {
            impl_->logger.warn(COMPONENT, "Устройство {} не перезапущено: {}",
                               record.device_id, result.error().message);
            continue;
        }
        impl_->logger.info(COMPONENT, "Устройство {} ({}) перезапущено вручную",
                           record.device_id, record.descriptor.name());
        ++restarted;
    }
    return restarted;
}

monitoring::MiningProgress Orchestrator::status() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    monitoring::MiningProgress progress;
    progress.state = std::string(to_string(impl_->tracker.state()));
    progress.mining = impl_->mining;
    if (const auto& job = impl_->tracker.current()) {
        progress.job_id = job->job_id;
        progress.height = job->height;
        progress.difficulty = job->difficulty;
    }
    progress.jobs_dispatched = impl_->jobs_dispatched;
    progress.jobs_ignored = impl_->jobs_ignored;
    progress.pending_submissions = impl_->pending.size();
    progress.shares = impl_->shares;
    return progress;
}

TrackerState Orchestrator::state() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->tracker.state();
}

void Orchestrator::process_once(Clock::time_point now) {
    impl_->process(now);
}

} // namespace strata::mining
