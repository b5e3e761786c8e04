#include "model/statistics.hpp"

void Statistics::updateIntegrals(double now, int queueLen, int busyServers) {
    double elapsed = now - lastEvent;
    if (elapsed <= 0.0) {
        return;
    }
    queueIntegral += elapsed * queueLen;
    busyIntegral += elapsed * busyServers;
    lastEvent = now;
}

void Statistics::recordCompletion(double waitTime, double serviceTime) {
    totalWait += waitTime;
    totalService += serviceTime;
    completed += 1;
    if (waitTime > maxWait) {
        maxWait = waitTime;
    }
}

void Statistics::updateMaxQueue(int queueLen) {
    if (queueLen > maxQueue) {
        maxQueue = queueLen;
    }
}

double Statistics::averageWaitTime() const {
    return completed > 0 ? totalWait / completed : 0.0;
}

double Statistics::averageServiceTime() const {
    return completed > 0 ? totalService / completed : 0.0;
}

double Statistics::averageQueueLength(double currentTime) const {
    return currentTime > 0.0 ? queueIntegral / currentTime : 0.0;
}

double Statistics::averageBusyServers(double currentTime) const {
    return currentTime > 0.0 ? busyIntegral / currentTime : 0.0;
}

double Statistics::utilization(double currentTime, int numWindows) const {
    if (currentTime <= 0.0 || numWindows <= 0) return 0.0;
    return busyIntegral / (currentTime * numWindows);
}

double Statistics::throughputPerHour(double currentTime) const {
    double hours = currentTime / 3600.0;
    return hours > 0.0 ? completed / hours : 0.0;
}
