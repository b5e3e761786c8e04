#pragma once

#include "types.hpp"

struct Customer {
    double arrivalTime{0.0};        // >= 0, fixed at construction
    double serviceDuration{0.0};    // > 0, fixed at construction
    CustomerState state{CustomerState::Arrived};
    bool hasStarted{false};
    bool hasEnded{false};
    double serviceStartTime{0.0};   // valid when hasStarted
    double serviceEndTime{0.0};     // valid when hasEnded
};
