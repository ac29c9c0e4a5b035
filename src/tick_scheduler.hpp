#pragma once

// Decides per frame whether a simulation tick happens. At most one tick
// per frame; leftover time carries into the next frame, capped at
// maxPendingMs so a stall is dropped instead of paid back.
class TickScheduler {
public:
    explicit TickScheduler(int tps=60, double maxPendingMs=250.0);

    bool advance(double elapsedMs);

    double interval() const { return intervalMs; }
    double pending() const { return accumulated; }
    double maxPending() const { return maxAccum; }
    int ticksPerSecond() const { return tps; }

private:
    int tps;
    double intervalMs;
    double maxAccum;
    double accumulated = 0;
};
