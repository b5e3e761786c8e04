#include "roles/service_window.hpp"

// Service window loop (see header for details).
int ServiceWindow::run(RunContext& ctx) {
    int served = 0;
    int customerId = 0;

    while (ctx.admissions.receive(customerId)) {
        double duration = 0.0;
        if (!ctx.state.recordServiceStart(customerId, ctx.clock.now(), duration)) {
            continue;
        }
        if (!ctx.clock.sleep(duration)) {
            // Run halted while this customer was in service.
            break;
        }
        if (ctx.state.recordServiceEnd(customerId, ctx.clock.now())) {
            ++served;
        }
    }

    ctx.activeWindows -= 1;
    if (ctx.activeWindows == 0) {
        ctx.admissions.close();
    }
    return served;
}
