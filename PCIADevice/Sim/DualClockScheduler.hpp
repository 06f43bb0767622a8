// DualClockScheduler.hpp
// PCIA - deterministic interleaving of the transport and audio clocks
//
// Both domains advance on a shared integer timeline: a transport period is
// audioHz units and an audio period is transportHz units, both reduced by
// their gcd. Step() fires whichever domain(s) are due next; on a tie the
// transport edge goes first.

#pragma once

#include <cstdint>
#include <functional>

#include "../Common/Error.hpp"

namespace PCIA::Sim {

struct SchedulerStats {
    uint64_t transportTicks{0};
    uint64_t audioTicks{0};
    uint64_t steps{0};
    uint64_t coincidentEdges{0};
};

class DualClockScheduler {
public:
    using TickFn = std::function<void()>;

    DualClockScheduler(TickFn transportTick, TickFn audioTick);

    /// Both frequencies must be non-zero. Resets the timeline.
    [[nodiscard]] Result<void> SetFrequencies(uint64_t transportHz, uint64_t audioHz);

    /// Fire the next due edge(s).
    void Step();

    void RunSteps(uint64_t steps);
    void RunTransportTicks(uint64_t ticks);
    void RunAudioTicks(uint64_t ticks);

    /// Step until `done` returns true, checking before every step.
    /// @return false when `maxSteps` ran out first
    [[nodiscard]] bool RunUntil(const std::function<bool()>& done, uint64_t maxSteps);

    void Reset() noexcept;

    [[nodiscard]] const SchedulerStats& Stats() const noexcept { return stats_; }
    [[nodiscard]] uint64_t TransportHz() const noexcept { return transportHz_ * gcd_; }
    [[nodiscard]] uint64_t AudioHz() const noexcept { return audioHz_ * gcd_; }

    /// Elapsed simulated time in nanoseconds.
    [[nodiscard]] uint64_t ElapsedNs() const noexcept;

private:
    TickFn transportTick_;
    TickFn audioTick_;

    uint64_t transportHz_{1};
    uint64_t audioHz_{1};
    uint64_t gcd_{1};

    unsigned __int128 now_{0};
    unsigned __int128 nextTransport_{0};
    unsigned __int128 nextAudio_{0};

    SchedulerStats stats_{};
};

} // namespace PCIA::Sim
