/**
 * @file simulated_device.cpp
 * @brief Реализация симулируемого устройства
 */

#include "simulated_device.hpp"

#include <algorithm>
#include <charconv>
#include <condition_variable>
#include <format>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <thread>

namespace strata::mining {

namespace {

/// @brief Шаг проверки токена отмены внутри попытки
constexpr auto CANCEL_CHECK_STEP = std::chrono::milliseconds(5);

/**
 * @brief Прочитать числовой параметр устройства
 */
template<typename T>
Result<T> read_param(const DeviceDescriptor& descriptor, const std::string& key, T fallback) {
    auto it = descriptor.parameters.find(key);
    if (it == descriptor.parameters.end()) {
        return fallback;
    }

    const std::string& text = it->second;
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return Err<T>(ErrorCode::DeviceStartFailed,
            std::format("{}: параметр {}='{}' не является числом",
                        descriptor.name(), key, text));
    }
    return value;
}

} // namespace

// =============================================================================
// Реализация
// =============================================================================

struct SimulatedDevice::Impl {
    std::string family;
    DeviceDescriptor descriptor;

    double attempts_per_sec = 1.0;
    double solution_rate = 0.1;
    uint32_t fail_after_ms = 0;

    std::thread worker;
    std::atomic<bool> running{false};
    CancellationToken token;

    std::atomic<uint64_t> attempts{0};
    std::atomic<int64_t> last_attempt_ns{0};

    // Защищено mutex
    mutable std::mutex mutex;
    std::condition_variable job_cv;
    std::optional<Job> job;
    std::vector<Solution> found;
    std::string active_job_id;
    bool in_use = false;
    bool has_errored = false;
    std::string error;

    std::mt19937_64 rng{std::random_device{}()};

    explicit Impl(std::string f) : family(std::move(f)) {}

    /**
     * @brief Подождать duration, прерываясь при отмене поколения
     *
     * @return false если поиск отменён или устройство остановлено
     */
    bool sleep_interruptible(std::chrono::nanoseconds duration, uint64_t generation) {
        while (duration.count() > 0) {
            if (!running || token.cancelled(generation)) {
                return false;
            }
            auto step = std::min<std::chrono::nanoseconds>(duration, CANCEL_CHECK_STEP);
            std::this_thread::sleep_for(step);
            duration -= step;
        }
        return running && !token.cancelled(generation);
    }

    Solution make_solution(const Job& current) {
        Solution solution;
        solution.job_id = current.job_id;
        solution.height = current.height;
        solution.edge_bits = descriptor.edge_bits;
        solution.nonce = rng();

        // 42 различных ребра внутри графа 2^edge_bits, по возрастанию
        const uint64_t edge_mask = (uint64_t{1} << descriptor.edge_bits) - 1;
        std::set<uint64_t> edges;
        while (edges.size() < constants::PROOF_SIZE) {
            edges.insert(rng() & edge_mask);
        }
        solution.proof.assign(edges.begin(), edges.end());

        const uint64_t target = std::max<uint64_t>(current.difficulty, 1);
        solution.difficulty = target + rng() % target;
        solution.found_at = std::chrono::steady_clock::now();
        return solution;
    }

    void search_loop() {
        const auto started = std::chrono::steady_clock::now();
        const auto attempt_period = std::chrono::nanoseconds(
            static_cast<int64_t>(1e9 / std::max(attempts_per_sec, 0.001)));
        std::uniform_real_distribution<double> chance(0.0, 1.0);

        while (running) {
            Job current;
            uint64_t generation = 0;
            {
                std::unique_lock<std::mutex> lock(mutex);
                job_cv.wait(lock, [this] { return !running || job.has_value(); });
                if (!running) {
                    break;
                }
                current = *job;
                generation = token.current();
                active_job_id = current.job_id;
                in_use = true;
            }

            // Поиск по заданию до отмены поколения
            while (running && !token.cancelled(generation)) {
                if (fail_after_ms > 0 &&
                    std::chrono::steady_clock::now() - started >=
                        std::chrono::milliseconds(fail_after_ms)) {
                    std::lock_guard<std::mutex> lock(mutex);
                    has_errored = true;
                    in_use = false;
                    error = std::format("{}: симулированный сбой после {} мс",
                                        descriptor.name(), fail_after_ms);
                    return;
                }

                auto attempt_start = std::chrono::steady_clock::now();
                if (!sleep_interruptible(attempt_period, generation)) {
                    break;
                }
                attempts.fetch_add(1, std::memory_order_relaxed);
                last_attempt_ns = (std::chrono::steady_clock::now() - attempt_start).count();

                if (chance(rng) < solution_rate) {
                    auto solution = make_solution(current);
                    std::lock_guard<std::mutex> lock(mutex);
                    found.push_back(std::move(solution));
                }
            }
        }

        std::lock_guard<std::mutex> lock(mutex);
        in_use = false;
    }
};

// =============================================================================
// SimulatedDevice
// =============================================================================

SimulatedDevice::SimulatedDevice(std::string family)
    : impl_(std::make_unique<Impl>(std::move(family))) {}

SimulatedDevice::~SimulatedDevice() {
    stop();
}

Result<void> SimulatedDevice::start(const DeviceDescriptor& descriptor) {
    if (impl_->running) {
        return {};
    }

    const double default_rate = impl_->family == SIMULATED_GPU ? 8.0 : 2.0;

    auto rate = read_param<double>(descriptor, "ATTEMPTS_PER_SEC", default_rate);
    if (!rate) return std::unexpected(rate.error());
    auto chance = read_param<double>(descriptor, "SOLUTION_RATE", 0.1);
    if (!chance) return std::unexpected(chance.error());
    auto fail_after = read_param<uint32_t>(descriptor, "FAIL_AFTER_MS", 0);
    if (!fail_after) return std::unexpected(fail_after.error());

    if (*rate <= 0.0 || *chance < 0.0 || *chance > 1.0) {
        return Err<void>(ErrorCode::DeviceStartFailed,
            std::format("{}: ATTEMPTS_PER_SEC > 0 и SOLUTION_RATE в 0..1", descriptor.name()));
    }
    if (descriptor.edge_bits < constants::MIN_EDGE_BITS ||
        descriptor.edge_bits > constants::MAX_EDGE_BITS) {
        return Err<void>(ErrorCode::DeviceStartFailed,
            std::format("{}: edge_bits={} не поддерживается", descriptor.name(),
                        descriptor.edge_bits));
    }

    impl_->descriptor = descriptor;
    impl_->attempts_per_sec = *rate;
    impl_->solution_rate = *chance;
    impl_->fail_after_ms = *fail_after;

    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->has_errored = false;
        impl_->error.clear();
    }
    impl_->attempts = 0;

    impl_->running = true;
    impl_->worker = std::thread([this] { impl_->search_loop(); });
    return {};
}

void SimulatedDevice::stop() {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->running = false;
        impl_->token.advance();
    }
    impl_->job_cv.notify_all();

    if (impl_->worker.joinable()) {
        impl_->worker.join();
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->in_use = false;
    impl_->active_job_id.clear();
}

void SimulatedDevice::set_job(const Job& job) {
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        impl_->job = job;
        impl_->token.advance();
    }
    impl_->job_cv.notify_all();
}

std::vector<Solution> SimulatedDevice::poll_solutions() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    std::vector<Solution> result;
    result.swap(impl_->found);
    return result;
}

DeviceStats SimulatedDevice::stats() const {
    DeviceStats stats;
    stats.device_name = std::format("Simulated {} {}",
        impl_->family == SIMULATED_GPU ? "GPU" : "CPU", impl_->descriptor.device_index);
    stats.attempts = impl_->attempts.load(std::memory_order_relaxed);
    stats.last_attempt_time = std::chrono::nanoseconds(impl_->last_attempt_ns.load());

    std::lock_guard<std::mutex> lock(impl_->mutex);
    stats.active_job_id = impl_->active_job_id;
    stats.in_use = impl_->in_use;
    stats.has_errored = impl_->has_errored;
    stats.error = impl_->error;
    return stats;
}

} // namespace strata::mining
