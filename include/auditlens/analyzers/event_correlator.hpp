/**
 * @file event_correlator.hpp
 * @brief Cross-event correlation pass over a complete batch
 *
 * Runs once after every per-event rule has seen the batch:
 * - **high_activity_user** (medium): one user with more events than the
 *   per-user limit (default 1000)
 * - **shared_ip_access** (high): one known IP address with more events than
 *   the per-IP limit (default 500) and more distinct users than the user
 *   limit (default 10)
 *
 * Findings are emitted for users first, then IP addresses, each in order of
 * first appearance in the batch.
 *
 * @date 2025
 */

#pragma once

#include <vector>

#include "auditlens/analyzers/run_context.hpp"

namespace auditlens {
namespace analyzers {

class EventCorrelator {
public:
    /**
     * @brief Correlate a normalized batch and append findings to the context
     * @param events Complete batch, in input order
     * @param context Run state
     * @return Number of findings appended
     */
    std::size_t Correlate(const std::vector<NormalizedEvent>& events, RunContext& context) const;
};

} // namespace analyzers
} // namespace auditlens
