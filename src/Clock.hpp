#pragma once
#include "utils.hpp"
#include <chrono>
#include <mutex>

// Time source shared by every agent of one simulation.
class Clock
{
public:
    virtual ~Clock() = default;

    virtual SimTime now() const = 0;

    // Upper bound of a real wait standing for a simulated delay.
    virtual Millis wallWaitFor(Millis simulated) const = 0;
};

class SystemClock : public Clock
{
public:
    SimTime now() const override;
    Millis wallWaitFor(Millis simulated) const override;
};

// Virtual time, moved only by advance() or set(). Never goes backwards.
class ManualClock : public Clock
{
public:
    explicit ManualClock(SimTime start = SimTime{} + std::chrono::hours(24));

    SimTime now() const override;
    Millis wallWaitFor(Millis simulated) const override;

    void advance(Millis delta);
    void set(SimTime t);

private:
    mutable std::mutex mutex;
    SimTime current;
    static constexpr int WAIT_TICK_MS = 5;
};
