/**
 * @file solver_pool.cpp
 * @brief Реализация пула устройств-решателей
 */

#include "solver_pool.hpp"

#include <algorithm>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <format>
#include <mutex>
#include <thread>

namespace strata::mining {

namespace {

constexpr std::string_view COMPONENT = "pool";

using Clock = std::chrono::steady_clock;

} // namespace

SolverPoolConfig SolverPoolConfig::from(const MiningConfig& mining) {
    SolverPoolConfig config;
    config.cancel_deadline = std::chrono::milliseconds(mining.cancel_deadline_ms);
    config.max_restarts = mining.device_max_restarts;
    config.restart_backoff = std::chrono::milliseconds(mining.device_restart_backoff_ms);
    config.solution_queue_size = mining.solution_queue_size;
    return config;
}

// =============================================================================
// Реализация
// =============================================================================

struct SolverPool::Impl {
    /**
     * @brief Устройство под управлением пула
     */
    struct Slot {
        DeviceRecord record;

        /// @brief Пуст, пока сбойное устройство останавливается потоком остановки
        std::unique_ptr<DeviceAdapter> adapter;

        /// @brief Попытки, накопленные до последнего перезапуска
        uint64_t attempts_base = 0;

        /// @brief Задание, ожидающее подтверждения
        std::string dispatched_job_id;
        Clock::time_point dispatched_at;
        bool awaiting_ack = false;

        Clock::time_point running_since;
        Clock::time_point next_restart_at;
        bool restart_pending = false;
    };

    SolverPoolConfig config;
    DeviceFactory factory;
    log::Logger& logger;

    std::shared_ptr<EventSignal> wake_signal = std::make_shared<EventSignal>();
    LatestSlot<Job> job_slot{wake_signal};
    BoundedQueue<Solution> solutions;

    // Защищено mutex
    mutable std::mutex mutex;
    std::vector<Slot> slots;
    std::optional<Job> latest_job;
    uint32_t next_device_id = 0;
    DeviceEventHandler event_handler;

    /// @brief Решения, не принятые закрытой очередью; отдаются drain_solutions()
    std::vector<Solution> undelivered;

    std::atomic<bool> running{false};
    std::thread supervisor;

    /**
     * @brief Сбойный адаптер, ожидающий stop()
     */
    struct Retired {
        uint32_t device_id = 0;
        std::unique_ptr<DeviceAdapter> adapter;
    };

    // Поток остановки: stop() зависшего устройства не блокирует пул
    std::mutex reaper_mutex;
    std::condition_variable reaper_cv;
    std::deque<Retired> retired;
    bool reaper_busy = false;
    bool reaper_exit = false;
    std::thread reaper;

    Impl(SolverPoolConfig cfg, DeviceFactory f, log::Logger& log,
         std::shared_ptr<EventSignal> solution_signal)
        : config(cfg)
        , factory(std::move(f))
        , logger(log)
        , solutions(cfg.solution_queue_size, std::move(solution_signal)) {
        reaper = std::thread([this] { reap_loop(); });
    }

    ~Impl() {
        {
            std::lock_guard<std::mutex> lock(reaper_mutex);
            reaper_exit = true;
        }
        reaper_cv.notify_all();
        if (reaper.joinable()) {
            reaper.join();
        }
    }

    // =========================================================================
    // Остановка сбойных устройств
    // =========================================================================

    void retire_locked(Slot& slot) {
        {
            std::lock_guard<std::mutex> lock(reaper_mutex);
            retired.push_back({slot.record.device_id, std::move(slot.adapter)});
        }
        reaper_cv.notify_all();
    }

    void reap_loop() {
        std::unique_lock<std::mutex> lock(reaper_mutex);
        while (true) {
            reaper_cv.wait(lock, [this] { return reaper_exit || !retired.empty(); });
            if (retired.empty()) {
                break;
            }

            Retired item = std::move(retired.front());
            retired.pop_front();
            reaper_busy = true;
            lock.unlock();

            item.adapter->stop();

            // Адаптер возвращается в слот для перезапуска; после reload слота может не быть
            {
                std::lock_guard<std::mutex> pool_lock(mutex);
                if (auto* slot = find_locked(item.device_id); slot && !slot->adapter) {
                    slot->adapter = std::move(item.adapter);
                }
            }
            item.adapter.reset();

            lock.lock();
            reaper_busy = false;
            reaper_cv.notify_all();
        }
    }

    /**
     * @brief Дождаться остановки всех сбойных адаптеров
     */
    void wait_reaper_idle() {
        std::unique_lock<std::mutex> lock(reaper_mutex);
        reaper_cv.wait(lock, [this] { return retired.empty() && !reaper_busy; });
    }

    uint32_t add_locked(const DeviceDescriptor& descriptor, std::unique_ptr<DeviceAdapter> adapter) {
        Slot slot;
        slot.record.device_id = next_device_id++;
        slot.record.descriptor = descriptor;
        slot.record.status = DeviceStatus::Stopped;
        slot.adapter = std::move(adapter);
        slots.push_back(std::move(slot));
        return slots.back().record.device_id;
    }

    Slot* find_locked(uint32_t device_id) {
        auto it = std::find_if(slots.begin(), slots.end(),
            [device_id](const Slot& s) { return s.record.device_id == device_id; });
        return it == slots.end() ? nullptr : &*it;
    }

    void apply_job(Slot& slot, const Job& job, Clock::time_point now) {
        slot.adapter->set_job(job);
        slot.dispatched_job_id = job.job_id;
        slot.dispatched_at = now;
        slot.awaiting_ack = true;
    }

    /**
     * @brief Остановить устройство с ошибкой и запланировать перезапуск
     */
    void fault(Slot& slot, const Error& error, Clock::time_point now,
               std::vector<DeviceRecord>& notify) {
        retire_locked(slot);
        slot.attempts_base = slot.record.attempts;
        slot.awaiting_ack = false;

        auto& record = slot.record;
        record.status = DeviceStatus::Errored;
        record.last_error = error.message;
        record.stats.in_use = false;
        ++record.restart_count;

        if (record.restart_count > config.max_restarts) {
            record.permanently_errored = true;
            slot.restart_pending = false;
            logger.error(COMPONENT, "Устройство {} ({}) исключено после {} сбоев подряд: {}",
                         record.device_id, record.descriptor.name(),
                         record.restart_count, error.message);
        } else {
            auto backoff = config.restart_backoff * (1u << std::min(record.restart_count - 1, 16u));
            slot.restart_pending = true;
            slot.next_restart_at = now + backoff;
            logger.warn(COMPONENT, "Устройство {} ({}): {}. Перезапуск через {} мс",
                        record.device_id, record.descriptor.name(), error.message,
                        backoff.count());
        }
        notify.push_back(record);
    }

    void start_slot(Slot& slot, Clock::time_point now, std::vector<DeviceRecord>& notify) {
        slot.record.status = DeviceStatus::Starting;
        slot.restart_pending = false;

        auto result = slot.adapter->start(slot.record.descriptor);
        if (!result) {
            fault(slot, result.error(), now, notify);
            return;
        }

        const bool restarted = slot.record.restart_count > 0;
        slot.record.status = DeviceStatus::Running;
        slot.record.last_error.clear();
        slot.running_since = now;

        logger.info(COMPONENT, "Устройство {} ({}) запущено",
                    slot.record.device_id, slot.record.descriptor.name());

        // Устройство, стартовавшее позже, получает последнее задание
        if (latest_job) {
            apply_job(slot, *latest_job, now);
        }
        if (restarted) {
            notify.push_back(slot.record);
        }
    }

    void stop_slot(Slot& slot) {
        if (slot.adapter && (slot.record.status == DeviceStatus::Running ||
                             slot.record.status == DeviceStatus::Starting)) {
            slot.adapter->stop();
            slot.attempts_base = slot.record.attempts;
        }
        if (!slot.record.permanently_errored) {
            slot.record.status = DeviceStatus::Stopped;
        }
        slot.record.stats.in_use = false;
        slot.restart_pending = false;
        slot.awaiting_ack = false;
    }

    void notify_all(const std::vector<DeviceRecord>& notify) {
        DeviceEventHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex);
            handler = event_handler;
        }
        if (!handler) return;
        for (const auto& record : notify) {
            handler(record);
        }
    }

    void supervise_loop() {
        while (running) {
            wake_signal->wait_for(config.supervise_interval);
            if (!running) break;
            supervise();
        }
    }

    void supervise() {
        std::vector<Solution> collected;
        std::vector<DeviceRecord> notify;
        const auto now = Clock::now();

        {
            std::lock_guard<std::mutex> lock(mutex);

            // Свежее задание из слота
            if (auto job = job_slot.take()) {
                latest_job = std::move(*job);
                logger.debug(COMPONENT, "Задание {} (высота {}) передано устройствам",
                             latest_job->job_id, latest_job->height);
                for (auto& slot : slots) {
                    if (slot.record.status == DeviceStatus::Running) {
                        apply_job(slot, *latest_job, now);
                    }
                }
            }

            for (auto& slot : slots) {
                auto& record = slot.record;

                if (record.status == DeviceStatus::Errored) {
                    if (running && slot.restart_pending && slot.adapter &&
                        now >= slot.next_restart_at) {
                        logger.info(COMPONENT, "Перезапуск устройства {} (попытка {})",
                                    record.device_id, record.restart_count);
                        start_slot(slot, now, notify);
                    }
                    continue;
                }
                if (record.status != DeviceStatus::Running) {
                    continue;
                }

                for (auto& solution : slot.adapter->poll_solutions()) {
                    solution.device_id = record.device_id;
                    collected.push_back(std::move(solution));
                }

                record.stats = slot.adapter->stats();
                record.attempts = slot.attempts_base + record.stats.attempts;

                if (record.stats.has_errored) {
                    fault(slot, Error(ErrorCode::DeviceFault, record.stats.error), now, notify);
                    continue;
                }

                if (slot.awaiting_ack) {
                    if (record.stats.active_job_id == slot.dispatched_job_id) {
                        slot.awaiting_ack = false;
                    } else if (now - slot.dispatched_at > config.cancel_deadline) {
                        fault(slot, Error(ErrorCode::DeviceCancelTimeout,
                            std::format("задание {} не подтверждено за {} мс",
                                        slot.dispatched_job_id, config.cancel_deadline.count())),
                            now, notify);
                        continue;
                    }
                }

                if (record.restart_count > 0 && now - slot.running_since >= config.stable_period) {
                    record.restart_count = 0;
                }
            }
        }

        // Блокирующая передача решений выполняется без блокировки пула
        std::vector<Solution> rejected;
        for (auto& solution : collected) {
            if (!solutions.push(solution)) {
                rejected.push_back(std::move(solution));
            }
        }
        if (!rejected.empty()) {
            std::lock_guard<std::mutex> lock(mutex);
            for (auto& solution : rejected) {
                undelivered.push_back(std::move(solution));
            }
        }

        notify_all(notify);
    }
};

// =============================================================================
// SolverPool
// =============================================================================

SolverPool::SolverPool(SolverPoolConfig config,
                       DeviceFactory factory,
                       log::Logger& logger,
                       std::shared_ptr<EventSignal> solution_signal)
    : impl_(std::make_unique<Impl>(config, std::move(factory), logger,
                                   std::move(solution_signal))) {}

SolverPool::~SolverPool() {
    stop_all();
}

Result<uint32_t> SolverPool::add_device(const DeviceDescriptor& descriptor) {
    auto adapter = impl_->factory.create(descriptor);
    if (!adapter) {
        return std::unexpected(adapter.error());
    }
    return add_device(descriptor, std::move(*adapter));
}

uint32_t SolverPool::add_device(const DeviceDescriptor& descriptor,
                                std::unique_ptr<DeviceAdapter> adapter) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->add_locked(descriptor, std::move(adapter));
}

std::vector<DeviceRecord> SolverPool::records() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<DeviceRecord> result;
    result.reserve(impl_->slots.size());
    for (const auto& slot : impl_->slots) {
        result.push_back(slot.record);
    }
    return result;
}

std::size_t SolverPool::device_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->slots.size();
}

Result<void> SolverPool::restart_device(uint32_t device_id) {
    std::vector<DeviceRecord> notify;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        auto* slot = impl_->find_locked(device_id);
        if (!slot) {
            return Err<void>(ErrorCode::DeviceNotFound,
                std::format("Устройство {} не найдено", device_id));
        }

        impl_->stop_slot(*slot);
        slot->record.permanently_errored = false;
        slot->record.restart_count = 0;
        slot->record.status = DeviceStatus::Stopped;

        if (impl_->running) {
            if (slot->adapter) {
                impl_->start_slot(*slot, Clock::now(), notify);
            } else {
                // Адаптер ещё останавливается: запуск выполнит супервизор
                slot->record.status = DeviceStatus::Errored;
                slot->restart_pending = true;
                slot->next_restart_at = Clock::now();
            }
        }
    }
    impl_->notify_all(notify);
    return {};
}

Result<void> SolverPool::reload(const std::vector<DeviceDescriptor>& descriptors) {
    std::vector<std::unique_ptr<DeviceAdapter>> adapters;
    adapters.reserve(descriptors.size());
    for (const auto& descriptor : descriptors) {
        auto adapter = impl_->factory.create(descriptor);
        if (!adapter) {
            return std::unexpected(adapter.error());
        }
        adapters.push_back(std::move(*adapter));
    }

    const bool was_running = is_running();
    stop_all();

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->slots.clear();
        for (std::size_t i = 0; i < descriptors.size(); ++i) {
            impl_->add_locked(descriptors[i], std::move(adapters[i]));
        }
    }
    impl_->logger.info(COMPONENT, "Конфигурация устройств перезагружена: {} устройств",
                       descriptors.size());

    if (was_running) {
        start_all();
    }
    return {};
}

void SolverPool::set_device_event_handler(DeviceEventHandler handler) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->event_handler = std::move(handler);
}

void SolverPool::start_all() {
    if (impl_->running.exchange(true)) {
        return;
    }

    impl_->solutions.reopen();
    std::vector<DeviceRecord> notify;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        if (auto job = impl_->job_slot.take()) {
            impl_->latest_job = std::move(*job);
        }

        const auto now = Clock::now();
        for (auto& slot : impl_->slots) {
            if (slot.record.permanently_errored || !slot.adapter) {
                continue;
            }
            slot.record.restart_count = 0;
            impl_->start_slot(slot, now, notify);
        }
    }
    impl_->notify_all(notify);

    impl_->supervisor = std::thread([this] { impl_->supervise_loop(); });
}

void SolverPool::stop_all() {
    if (!impl_->running.exchange(false)) {
        return;
    }

    // Супервизор может ждать места в очереди решений
    impl_->solutions.close();
    impl_->wake_signal->notify();
    if (impl_->supervisor.joinable()) {
        impl_->supervisor.join();
    }
    impl_->wait_reaper_idle();

    std::vector<Solution> leftover;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        leftover.swap(impl_->undelivered);
        for (auto& slot : impl_->slots) {
            if (slot.record.status == DeviceStatus::Running) {
                for (auto& solution : slot.adapter->poll_solutions()) {
                    solution.device_id = slot.record.device_id;
                    leftover.push_back(std::move(solution));
                }
            }
            impl_->stop_slot(slot);
        }
    }

    // Решения, найденные до остановки, остаются доступны drain_solutions()
    impl_->solutions.reopen();
    std::vector<Solution> overflow;
    for (auto& solution : leftover) {
        if (!impl_->solutions.try_push(solution)) {
            overflow.push_back(std::move(solution));
        }
    }
    if (!overflow.empty()) {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->undelivered = std::move(overflow);
    }
    impl_->logger.info(COMPONENT, "Все устройства остановлены");
}

bool SolverPool::is_running() const noexcept {
    return impl_->running;
}

void SolverPool::dispatch_job(const Job& job) {
    if (impl_->job_slot.put(job)) {
        impl_->logger.debug(COMPONENT, "Неприменённое задание вытеснено заданием {}", job.job_id);
    }
}

std::vector<Solution> SolverPool::drain_solutions() {
    auto result = impl_->solutions.drain();

    std::lock_guard<std::mutex> lock(impl_->mutex);
    for (auto& solution : impl_->undelivered) {
        result.push_back(std::move(solution));
    }
    impl_->undelivered.clear();
    return result;
}

std::optional<Job> SolverPool::current_job() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->latest_job;
}

uint64_t SolverPool::superseded_jobs() const {
    return impl_->job_slot.overwritten_count();
}

void SolverPool::supervise_once() {
    impl_->supervise();
}

} // namespace strata::mining
