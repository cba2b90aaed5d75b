#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>

namespace page_recorder {

// A steady clock used for timepoints inside the app
using Clock = std::chrono::steady_clock;
using Millis = std::chrono::milliseconds;

// --------- Time source ---------
// Every wait in the recorder goes through a TimeSource so tests can run the
// polling loops without wall-clock delays.
class TimeSource {
public:
    virtual ~TimeSource() = default;
    virtual Clock::time_point now() const = 0;
    virtual void sleepFor(Clock::duration d) = 0;
};

class SteadyTimeSource : public TimeSource {
public:
    Clock::time_point now() const override;
    void sleepFor(Clock::duration d) override;
};

// --------- Bounded polling ---------
struct RetryPolicy {
    unsigned max_attempts = 60;
    Millis   interval{1000};
};

enum class PollStep { Done, Continue };

// Calls probe(attempt) up to max_attempts times (attempt is 1-based), sleeping
// `interval` before each call. Returns the attempt that reported Done, or
// nullopt once the attempts are exhausted. Exceptions from probe propagate.
std::optional<unsigned> pollUntil(TimeSource& clock, const RetryPolicy& policy,
                                  const std::function<PollStep(unsigned)>& probe);

} // namespace page_recorder
