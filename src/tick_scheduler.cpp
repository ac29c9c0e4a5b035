#include "tick_scheduler.hpp"

#include "errors.hpp"

#include <algorithm>
#include <string>

TickScheduler::TickScheduler(int t, double maxPendingMs) : tps(t), intervalMs(0), maxAccum(0) {
    if (tps <= 0) throw InvalidConfiguration("tps must be positive, got " + std::to_string(tps));
    if (maxPendingMs <= 0) throw InvalidConfiguration("max pending time must be positive, got " + std::to_string(maxPendingMs));
    intervalMs = 1000.0 / tps;
    // Slow rates still need room for one full interval.
    maxAccum = std::max(maxPendingMs, intervalMs);
}

bool TickScheduler::advance(double elapsedMs) {
    if (elapsedMs > 0) accumulated += elapsedMs;
    if (accumulated > maxAccum) accumulated = maxAccum;
    if (accumulated < intervalMs) return false;
    accumulated -= intervalMs;
    return true;
}
