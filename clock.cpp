#include "clock.hpp"

#include <thread>

namespace page_recorder {

Clock::time_point SteadyTimeSource::now() const { return Clock::now(); }

void SteadyTimeSource::sleepFor(Clock::duration d) {
    if (d > Clock::duration::zero()) std::this_thread::sleep_for(d);
}

std::optional<unsigned> pollUntil(TimeSource& clock, const RetryPolicy& policy,
                                  const std::function<PollStep(unsigned)>& probe) {
    for (unsigned attempt = 1; attempt <= policy.max_attempts; ++attempt) {
        clock.sleepFor(policy.interval);
        if (probe(attempt) == PollStep::Done) return attempt;
    }
    return std::nullopt;
}

} // namespace page_recorder
