/**
 * @file job.hpp
 * @brief Задание и решение (share) для майнинга
 *
 * Задание (job) - единица работы, выданная сервером: pre_pow заголовок,
 * высота и целевая сложность. Решение - найденный устройством цикл
 * (proof) для конкретного задания.
 *
 * Ядро не интерпретирует pre_pow и proof, кроме проверки формата.
 */

#pragma once

#include "../core/types.hpp"
#include "../core/constants.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace strata::mining {

// =============================================================================
// Структура задания
// =============================================================================

/**
 * @brief Задание от stratum сервера
 */
struct Job {
    /// @brief Идентификатор задания (уникален в пределах сессии)
    std::string job_id;

    /// @brief Высота блока (порядок "свежести" заданий)
    uint64_t height = 0;

    /// @brief Заголовок до nonce, непрозрачен для ядра
    Bytes pre_pow;

    /// @brief Целевая сложность share
    uint64_t difficulty = 1;

    /// @brief Время получения задания
    std::chrono::steady_clock::time_point received_at;
};

// =============================================================================
// Структура решения
// =============================================================================

/**
 * @brief Решение (share), найденное устройством
 */
struct Solution {
    /// @brief Задание, для которого найдено решение
    std::string job_id;

    /// @brief Высота задания (передаётся в submit)
    uint64_t height = 0;

    /// @brief Устройство, нашедшее решение
    uint32_t device_id = 0;

    /// @brief Размер графа
    uint32_t edge_bits = 0;

    /// @brief Nonce, при котором найден цикл
    uint64_t nonce = 0;

    /// @brief Индексы рёбер цикла
    std::vector<uint64_t> proof;

    /// @brief Сложность, достигнутая решением (сообщается устройством)
    uint64_t difficulty = 0;

    /// @brief Время нахождения
    std::chrono::steady_clock::time_point found_at;

    /**
     * @brief Проверить формат решения
     *
     * - непустой job_id
     * - ровно PROOF_SIZE рёбер
     * - индексы строго возрастают и укладываются в 2^edge_bits
     *
     * @return Result<void> Успех или SubmissionMalformed
     */
    [[nodiscard]] Result<void> validate_format() const;
};

} // namespace strata::mining
