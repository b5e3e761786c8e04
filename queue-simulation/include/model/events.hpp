#pragma once

#include "types.hpp"

// One notification per customer state transition, in simulation order.
struct EventRecord {
    double    time{0.0};
    EventType type{EventType::Arrival};
    int       customerId{0};
    int       queueLen{0};      // waiting customers after the transition
    int       busyServers{0};   // busy windows after the transition
    int       numWindows{0};
};
