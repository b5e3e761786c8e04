#pragma once

#include <string>

enum class EventType {
    Arrival,
    ServiceStart,
    ServiceEnd
};

enum class CustomerState {
    Arrived,    // known to the run, not yet admitted
    Waiting,
    InService,
    Completed
};

enum class RunOutcome {
    Completed,
    ReachedMaxTime,
    Deadlock,
    Stopped
};

/** @brief Event name as written to logs ("Arrival", "ServiceStart", "ServiceEnd"). */
const char* eventTypeName(EventType type);

/** @brief Inverse of eventTypeName; false for unknown names. */
bool eventTypeFromName(const std::string& name, EventType& out);

/** @brief Short label for a run outcome. */
const char* runOutcomeName(RunOutcome outcome);
