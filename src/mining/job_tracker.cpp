/**
 * @file job_tracker.cpp
 * @brief Реализация учёта заданий
 */

#include "job_tracker.hpp"

namespace strata::mining {

JobTracker::JobTracker(std::chrono::milliseconds grace_window)
    : grace_window_(grace_window) {}

JobDecision JobTracker::accept(const Job& job, Clock::time_point now) {
    if (state_ == TrackerState::ShuttingDown) {
        return JobDecision::IgnoredShutdown;
    }

    expire(now);

    if (current_) {
        if (job.job_id == current_->job_id || job.height == current_->height) {
            return JobDecision::IgnoredDuplicate;
        }
        if (job.height < current_->height) {
            return JobDecision::IgnoredStale;
        }

        previous_ = std::move(current_);
        grace_deadline_ = now + grace_window_;
        state_ = grace_window_.count() > 0 ? TrackerState::Draining : TrackerState::Dispatching;
        if (state_ == TrackerState::Dispatching) {
            previous_.reset();
        }
    } else {
        state_ = TrackerState::Dispatching;
    }

    current_ = job;
    return JobDecision::Dispatch;
}

SolutionVerdict JobTracker::classify(const Solution& solution, Clock::time_point now) {
    if (!solution.validate_format()) {
        return SolutionVerdict::Malformed;
    }

    expire(now);

    const Job* job = nullptr;
    SolutionVerdict verdict = SolutionVerdict::Stale;

    if (current_ && solution.job_id == current_->job_id) {
        job = &*current_;
        verdict = SolutionVerdict::Current;
    } else if (previous_ && solution.job_id == previous_->job_id) {
        job = &*previous_;
        verdict = SolutionVerdict::Grace;
    }

    if (!job) {
        return SolutionVerdict::Stale;
    }
    if (solution.difficulty < job->difficulty) {
        return SolutionVerdict::LowDifficulty;
    }
    return verdict;
}

void JobTracker::expire(Clock::time_point now) {
    if (previous_ && now >= grace_deadline_) {
        previous_.reset();
        if (state_ == TrackerState::Draining) {
            state_ = TrackerState::Dispatching;
        }
    }
}

void JobTracker::shut_down() noexcept {
    state_ = TrackerState::ShuttingDown;
}

void JobTracker::resume() noexcept {
    if (state_ != TrackerState::ShuttingDown) {
        return;
    }
    state_ = current_ ? TrackerState::Dispatching : TrackerState::Idle;
    previous_.reset();
}

const Job* JobTracker::find(std::string_view job_id) const noexcept {
    if (current_ && current_->job_id == job_id) return &*current_;
    if (previous_ && previous_->job_id == job_id) return &*previous_;
    return nullptr;
}

} // namespace strata::mining
