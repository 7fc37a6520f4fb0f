#include "Clock.hpp"
#include <algorithm>
#include <stdexcept>

SimTime SystemClock::now() const
{
    return std::chrono::system_clock::now();
}

Millis SystemClock::wallWaitFor(Millis simulated) const
{
    return std::max(Millis(0), simulated);
}

ManualClock::ManualClock(SimTime start) : current(start) {}

SimTime ManualClock::now() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return current;
}

Millis ManualClock::wallWaitFor(Millis simulated) const
{
    // Virtual time only moves when someone advances it, so waits are kept
    // short and the loop re-reads now() instead.
    return std::min(std::max(Millis(0), simulated), Millis(WAIT_TICK_MS));
}

void ManualClock::advance(Millis delta)
{
    if (delta.count() < 0)
    {
        throw std::invalid_argument("ManualClock cannot move backwards");
    }
    std::lock_guard<std::mutex> lock(mutex);
    current += delta;
}

void ManualClock::set(SimTime t)
{
    std::lock_guard<std::mutex> lock(mutex);
    if (t < current)
    {
        throw std::invalid_argument("ManualClock cannot move backwards");
    }
    current = t;
}
