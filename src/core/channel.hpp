/**
 * @file channel.hpp
 * @brief Каналы передачи сообщений между потоками
 *
 * - EventSignal: общий сигнал пробуждения для select по нескольким каналам
 * - LatestSlot<T>: канал ёмкостью 1, новое значение вытесняет непрочитанное
 * - BoundedQueue<T>: ограниченная FIFO очередь, производитель ждёт места
 *
 * Каналы не разделяют состояние компонентов: значения передаются по копии.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace strata {

// =============================================================================
// EventSignal
// =============================================================================

/**
 * @brief Сигнал пробуждения потребителя
 *
 * Несколько каналов сигналят в один EventSignal, потребитель ждёт на нём,
 * а затем опрашивает каждый канал. Сигнал "защёлкивается": notify() до
 * wait_for() не теряется.
 */
class EventSignal {
public:
    void notify() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_ = true;
        }
        cv_.notify_all();
    }

    /**
     * @brief Ждать сигнала не дольше timeout
     *
     * @return true если сигнал был получен
     */
    bool wait_for(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        bool signalled = cv_.wait_for(lock, timeout, [this] { return pending_; });
        pending_ = false;
        return signalled;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool pending_{false};
};

// =============================================================================
// LatestSlot
// =============================================================================

/**
 * @brief Канал ёмкостью 1 (latest-value-wins)
 *
 * Непрочитанное значение перезаписывается новым: значение имеет только
 * самое свежее задание.
 */
template<typename T>
class LatestSlot {
public:
    explicit LatestSlot(std::shared_ptr<EventSignal> signal = nullptr)
        : signal_(std::move(signal)) {}

    /**
     * @brief Записать значение
     *
     * @return true если было перезаписано непрочитанное значение
     */
    bool put(T value) {
        bool overwritten = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            overwritten = value_.has_value();
            value_ = std::move(value);
            if (overwritten) {
                ++overwritten_count_;
            }
        }
        if (signal_) {
            signal_->notify();
        }
        return overwritten;
    }

    /**
     * @brief Забрать значение, если оно есть
     */
    [[nodiscard]] std::optional<T> take() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::optional<T> result = std::move(value_);
        value_.reset();
        return result;
    }

    /// @brief Сколько значений было вытеснено непрочитанными
    [[nodiscard]] uint64_t overwritten_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return overwritten_count_;
    }

private:
    mutable std::mutex mutex_;
    std::optional<T> value_;
    uint64_t overwritten_count_{0};
    std::shared_ptr<EventSignal> signal_;
};

// =============================================================================
// BoundedQueue
// =============================================================================

/**
 * @brief Ограниченная FIFO очередь
 *
 * push() блокирует производителя, пока не освободится место, поэтому
 * элементы никогда не теряются молча. После close() push() возвращает
 * false, а оставшиеся элементы можно дочитать.
 */
template<typename T>
class BoundedQueue {
public:
    explicit BoundedQueue(std::size_t capacity,
                          std::shared_ptr<EventSignal> signal = nullptr)
        : capacity_(capacity == 0 ? 1 : capacity)
        , signal_(std::move(signal)) {}

    /**
     * @brief Добавить элемент, ожидая свободного места
     *
     * @return false если очередь закрыта
     */
    bool push(T value) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            not_full_.wait(lock, [this] { return closed_ || items_.size() < capacity_; });
            if (closed_) {
                return false;
            }
            items_.push_back(std::move(value));
        }
        if (signal_) {
            signal_->notify();
        }
        return true;
    }

    /**
     * @brief Добавить элемент без ожидания
     *
     * @return false если очередь заполнена или закрыта
     */
    bool try_push(T value) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || items_.size() >= capacity_) {
                return false;
            }
            items_.push_back(std::move(value));
        }
        if (signal_) {
            signal_->notify();
        }
        return true;
    }

    /**
     * @brief Забрать все накопленные элементы в порядке поступления
     */
    [[nodiscard]] std::vector<T> drain() {
        std::vector<T> result;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            result.reserve(items_.size());
            while (!items_.empty()) {
                result.push_back(std::move(items_.front()));
                items_.pop_front();
            }
        }
        not_full_.notify_all();
        return result;
    }

    /**
     * @brief Закрыть очередь и разбудить ждущих производителей
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
    }

    /**
     * @brief Снова открыть очередь после close()
     */
    void reopen() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
    }

    [[nodiscard]] std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::deque<T> items_;
    std::size_t capacity_;
    bool closed_{false};
    std::shared_ptr<EventSignal> signal_;
};

} // namespace strata
