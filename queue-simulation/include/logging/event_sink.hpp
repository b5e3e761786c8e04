#pragma once

#include "model/events.hpp"

/**
 * @brief Ordered receiver of simulation event notifications.
 *
 * onEvent() is invoked inside the shared-state critical section, in the
 * order transitions happen; implementations must not block on simulation
 * tasks and must not call back into the shared state.
 */
class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void onEvent(const EventRecord& record) = 0;
};
