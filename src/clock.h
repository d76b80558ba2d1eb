#ifndef CLOCK_H
#define CLOCK_H

#include <chrono>

// Wall-clock seconds since the Unix epoch. Every component that ages state
// (anti-replay windows, quarantine, peer liveness, pheromones) reads time
// through this so tests can drive it by hand.
class Clock {
public:
    virtual ~Clock() = default;
    virtual double now() const = 0;
};

class SystemClock : public Clock {
public:
    double now() const override {
        return std::chrono::duration<double>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    static SystemClock& instance() {
        static SystemClock clock;
        return clock;
    }
};

class ManualClock : public Clock {
public:
    explicit ManualClock(double start = 1700000000.0) : t_(start) {}
    double now() const override { return t_; }
    void set(double t) { t_ = t; }
    void advance(double seconds) { t_ += seconds; }

private:
    double t_;
};

#endif // CLOCK_H
