#include "roles/arrival_generator.hpp"

#include "util/duration.hpp"
#include "util/error.hpp"

#include <string>

// Arrival producer loop (see header for details).
int ArrivalGenerator::run(RunContext& ctx) {
    int admitted = 0;
    int total = ctx.state.customerCount();

    for (int id = 0; id < total; ++id) {
        double arrival = 0.0;
        if (!ctx.state.arrivalTime(id, arrival)) {
            logWarning("Arrival lookup failed for customer " + std::to_string(id));
            continue;
        }
        // Customers are sorted, so nothing later can arrive in time either.
        if (ctx.hasMaxTime && arrival > ctx.maxTime) {
            break;
        }
        if (!ctx.clock.sleepUntil(arrival)) {
            break;
        }

        // Send first so the channel sees ids in arrival order.
        if (!ctx.admissions.send(id)) {
            logWarning("All service windows shut down prematurely at T=" + formatDuration(arrival));
            break;
        }
        if (ctx.state.recordArrival(id, arrival)) {
            ++admitted;
        }
    }

    ctx.admissions.close();
    return admitted;
}
