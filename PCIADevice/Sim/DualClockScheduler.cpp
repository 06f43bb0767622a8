#include "DualClockScheduler.hpp"

#include <numeric>
#include <utility>

#include "../Logging/LogConfig.hpp"
#include "../Logging/Logging.hpp"

namespace PCIA::Sim {

DualClockScheduler::DualClockScheduler(TickFn transportTick, TickFn audioTick)
    : transportTick_(std::move(transportTick)),
      audioTick_(std::move(audioTick)) {}

Result<void> DualClockScheduler::SetFrequencies(uint64_t transportHz, uint64_t audioHz) {
    if (transportHz == 0 || audioHz == 0) {
        return PCIA_ERROR_INVALID("Clock frequencies must be non-zero");
    }

    // Reduce so the timeline units stay small.
    const uint64_t gcd = std::gcd(transportHz, audioHz);
    gcd_ = gcd;
    transportHz_ = transportHz / gcd;
    audioHz_ = audioHz / gcd;
    Reset();

    PCIA_LOG_V1(Sim, "Clocks: transport %llu Hz, audio %llu Hz (ratio %llu:%llu)",
                (unsigned long long)transportHz, (unsigned long long)audioHz,
                (unsigned long long)transportHz_, (unsigned long long)audioHz_);
    return {};
}

void DualClockScheduler::Reset() noexcept {
    now_ = 0;
    nextTransport_ = 0;
    nextAudio_ = 0;
    stats_ = {};
}

void DualClockScheduler::Step() {
    now_ = nextTransport_ < nextAudio_ ? nextTransport_ : nextAudio_;

    const bool transportDue = nextTransport_ == now_;
    const bool audioDue = nextAudio_ == now_;

    if (transportDue) {
        if (transportTick_) {
            transportTick_();
        }
        nextTransport_ += audioHz_;
        ++stats_.transportTicks;
    }
    if (audioDue) {
        if (audioTick_) {
            audioTick_();
        }
        nextAudio_ += transportHz_;
        ++stats_.audioTicks;
    }
    if (transportDue && audioDue) {
        ++stats_.coincidentEdges;
    }
    ++stats_.steps;
}

void DualClockScheduler::RunSteps(uint64_t steps) {
    for (uint64_t i = 0; i < steps; ++i) {
        Step();
    }
}

void DualClockScheduler::RunTransportTicks(uint64_t ticks) {
    const uint64_t target = stats_.transportTicks + ticks;
    while (stats_.transportTicks < target) {
        Step();
    }
}

void DualClockScheduler::RunAudioTicks(uint64_t ticks) {
    const uint64_t target = stats_.audioTicks + ticks;
    while (stats_.audioTicks < target) {
        Step();
    }
}

bool DualClockScheduler::RunUntil(const std::function<bool()>& done, uint64_t maxSteps) {
    for (uint64_t i = 0; i < maxSteps; ++i) {
        if (done()) {
            return true;
        }
        Step();
    }
    if (done()) {
        return true;
    }
    PCIA_LOG_V2(Sim, "RunUntil gave up after %llu steps (transport=%llu audio=%llu)",
                (unsigned long long)maxSteps, (unsigned long long)stats_.transportTicks,
                (unsigned long long)stats_.audioTicks);
    return false;
}

uint64_t DualClockScheduler::ElapsedNs() const noexcept {
    const unsigned __int128 unitsPerSecond =
        static_cast<unsigned __int128>(transportHz_) * audioHz_ * gcd_;
    return static_cast<uint64_t>(now_ * 1'000'000'000u / unitsPerSecond);
}

} // namespace PCIA::Sim
