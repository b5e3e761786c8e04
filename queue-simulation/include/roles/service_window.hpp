#pragma once

#include "roles/run_context.hpp"

/**
 * @brief One service window consuming customer ids from the admission channel.
 */
class ServiceWindow {
public:
    ServiceWindow() = default;

    /**
     * @brief Serve customers until the channel is closed and drained or the
     *        clock shuts down mid-service.
     * @param ctx shared run context.
     * @return number of customers this window completed.
     */
    int run(RunContext& ctx);
};
