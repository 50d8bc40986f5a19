/**
 * @file fake_device.hpp
 * @brief Управляемое из теста устройство для пула и оркестратора
 */

#pragma once

#include "mining/device.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace strata::tests {

/**
 * @brief Состояние фейкового устройства, общее с тестом
 */
struct FakeDeviceControl {
    std::mutex mutex;

    // Поведение
    bool fail_start = false;
    bool acknowledge_jobs = true;
    bool errored = false;
    std::string error = "simulated fault";
    std::chrono::milliseconds stop_delay{0};

    // Наблюдаемое состояние
    int starts = 0;
    int stops = 0;
    bool running = false;
    std::vector<mining::Job> jobs;
    std::string active_job_id;
    uint64_t attempts = 0;
    std::vector<mining::Solution> pending;

    void add_solution(mining::Solution solution) {
        std::lock_guard<std::mutex> lock(mutex);
        pending.push_back(std::move(solution));
    }

    void add_attempts(uint64_t n) {
        std::lock_guard<std::mutex> lock(mutex);
        attempts += n;
    }

    void set_errored(bool value) {
        std::lock_guard<std::mutex> lock(mutex);
        errored = value;
    }

    std::vector<uint64_t> job_heights() {
        std::lock_guard<std::mutex> lock(mutex);
        std::vector<uint64_t> heights;
        for (const auto& job : jobs) {
            heights.push_back(job.height);
        }
        return heights;
    }

    int start_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return starts;
    }

    int stop_count() {
        std::lock_guard<std::mutex> lock(mutex);
        return stops;
    }
};

class FakeDevice : public mining::DeviceAdapter {
public:
    explicit FakeDevice(std::shared_ptr<FakeDeviceControl> control)
        : control_(std::move(control)) {}

    Result<void> start(const DeviceDescriptor& descriptor) override {
        std::lock_guard<std::mutex> lock(control_->mutex);
        ++control_->starts;
        if (control_->fail_start) {
            return Err<void>(ErrorCode::DeviceStartFailed,
                             "fake device refused to start: " + descriptor.name());
        }
        control_->running = true;
        control_->errored = false;
        control_->attempts = 0;
        return {};
    }

    void stop() override {
        std::chrono::milliseconds delay{0};
        {
            std::lock_guard<std::mutex> lock(control_->mutex);
            ++control_->stops;
            delay = control_->stop_delay;
        }

        // Зависший поиск: stop() возвращается не сразу
        std::this_thread::sleep_for(delay);

        std::lock_guard<std::mutex> lock(control_->mutex);
        control_->running = false;
    }

    void set_job(const mining::Job& job) override {
        std::lock_guard<std::mutex> lock(control_->mutex);
        control_->jobs.push_back(job);
        if (control_->acknowledge_jobs) {
            control_->active_job_id = job.job_id;
        }
    }

    std::vector<mining::Solution> poll_solutions() override {
        std::lock_guard<std::mutex> lock(control_->mutex);
        std::vector<mining::Solution> result;
        result.swap(control_->pending);
        return result;
    }

    mining::DeviceStats stats() const override {
        std::lock_guard<std::mutex> lock(control_->mutex);
        mining::DeviceStats stats;
        stats.device_name = "Fake";
        stats.attempts = control_->attempts;
        stats.active_job_id = control_->active_job_id;
        stats.in_use = control_->running;
        stats.has_errored = control_->errored;
        stats.error = control_->errored ? control_->error : std::string();
        return stats;
    }

private:
    std::shared_ptr<FakeDeviceControl> control_;
};

/**
 * @brief Решение правильного формата
 */
inline mining::Solution make_solution(const std::string& job_id, uint64_t height,
                                      uint64_t difficulty = 1, uint32_t edge_bits = 29) {
    mining::Solution solution;
    solution.job_id = job_id;
    solution.height = height;
    solution.edge_bits = edge_bits;
    solution.nonce = 12345;
    solution.difficulty = difficulty;
    solution.found_at = std::chrono::steady_clock::now();
    for (uint64_t i = 0; i < constants::PROOF_SIZE; ++i) {
        solution.proof.push_back(i * 7 + 3);
    }
    return solution;
}

/**
 * @brief Задание для тестов
 */
inline mining::Job make_job(const std::string& job_id, uint64_t height, uint64_t difficulty = 1) {
    mining::Job job;
    job.job_id = job_id;
    job.height = height;
    job.difficulty = difficulty;
    job.pre_pow = {0x00, 0xaa, 0x11, 0xbb};
    job.received_at = std::chrono::steady_clock::now();
    return job;
}

} // namespace strata::tests
