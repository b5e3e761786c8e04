#pragma once

#include "roles/run_context.hpp"

/**
 * @brief Producer task: admits customers in arrival order.
 */
class ArrivalGenerator {
public:
    ArrivalGenerator() = default;

    /**
     * @brief Sleep until each arrival, hand its id to the windows, then
     *        record the Arrival. Stops at max time, on a closed channel or
     *        clock shutdown; closes the admission channel on exit.
     * @param ctx shared run context.
     * @return number of customers admitted.
     */
    int run(RunContext& ctx);
};
