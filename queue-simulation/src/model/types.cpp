#include "model/types.hpp"

const char* eventTypeName(EventType type) {
    switch (type) {
        case EventType::Arrival: return "Arrival";
        case EventType::ServiceStart: return "ServiceStart";
        case EventType::ServiceEnd: return "ServiceEnd";
        default: return "Unknown";
    }
}

bool eventTypeFromName(const std::string& name, EventType& out) {
    if (name == "Arrival") {
        out = EventType::Arrival;
    } else if (name == "ServiceStart") {
        out = EventType::ServiceStart;
    } else if (name == "ServiceEnd") {
        out = EventType::ServiceEnd;
    } else {
        return false;
    }
    return true;
}

const char* runOutcomeName(RunOutcome outcome) {
    switch (outcome) {
        case RunOutcome::Completed: return "completed";
        case RunOutcome::ReachedMaxTime: return "max time reached";
        case RunOutcome::Deadlock: return "deadlock";
        case RunOutcome::Stopped: return "stopped";
        default: return "unknown";
    }
}
