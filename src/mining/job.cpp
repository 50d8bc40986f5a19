/**
 * @file job.cpp
 * @brief Проверка формата решения
 */

#include "job.hpp"

#include <format>

namespace strata::mining {

Result<void> Solution::validate_format() const {
    if (job_id.empty()) {
        return Err<void>(ErrorCode::SubmissionMalformed, "Решение без job_id");
    }

    if (proof.size() != constants::PROOF_SIZE) {
        return Err<void>(ErrorCode::SubmissionMalformed,
            std::format("Размер proof {} вместо {}", proof.size(), constants::PROOF_SIZE));
    }

    const uint64_t edge_limit = (edge_bits > 0 && edge_bits < 64)
        ? (uint64_t{1} << edge_bits)
        : 0;

    for (std::size_t i = 0; i < proof.size(); ++i) {
        if (i > 0 && proof[i] <= proof[i - 1]) {
            return Err<void>(ErrorCode::SubmissionMalformed,
                std::format("Рёбра proof не возрастают (позиция {})", i));
        }
        if (edge_limit != 0 && proof[i] >= edge_limit) {
            return Err<void>(ErrorCode::SubmissionMalformed,
                std::format("Ребро {} вне графа 2^{}", proof[i], edge_bits));
        }
    }

    return {};
}

} // namespace strata::mining
