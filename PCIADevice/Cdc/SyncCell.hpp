// SyncCell.hpp
// PCIA - multi-stage synchronizer for one scalar crossing clock domains
//
// Source domain: Write() publishes a value.
// Destination domain: Clock() shifts the delay line once per destination
// clock; Read() returns the last stage. A written value becomes visible to
// Read() after exactly kLatency destination clocks.
//
// Multi-bit values are sampled whole. Like a flop chain without a handshake,
// a value that changes again before it settles may skip intermediate values.

#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <type_traits>

#include "../Config/EngineConstants.hpp"

namespace PCIA::Cdc {

template <typename T, uint32_t Stages = Config::kSyncStages>
class SyncCell {
public:
    static_assert(Stages >= 2, "A synchronizer needs at least two stages");
    static_assert(std::is_trivially_copyable_v<T>, "Synchronized values must be trivially copyable");

    static constexpr uint32_t kLatency = Stages;

    explicit SyncCell(T resetValue = T{}) noexcept
        : resetValue_(resetValue), source_(resetValue) {
        stages_.fill(resetValue);
    }

    SyncCell(const SyncCell&) = delete;
    SyncCell& operator=(const SyncCell&) = delete;

    /// Source domain.
    void Write(T value) noexcept { source_.store(value, std::memory_order_release); }

    /// Source domain readback of the last written value.
    [[nodiscard]] T Source() const noexcept { return source_.load(std::memory_order_acquire); }

    /// Destination domain, once per destination clock.
    void Clock() noexcept {
        for (uint32_t i = Stages - 1; i > 0; --i) {
            stages_[i] = stages_[i - 1];
        }
        stages_[0] = source_.load(std::memory_order_acquire);
    }

    /// Destination domain.
    [[nodiscard]] T Read() const noexcept { return stages_[Stages - 1]; }

    /// Both domains quiescent.
    void Reset() noexcept {
        source_.store(resetValue_, std::memory_order_release);
        stages_.fill(resetValue_);
    }

    [[nodiscard]] T ResetValue() const noexcept { return resetValue_; }

private:
    const T resetValue_;
    std::atomic<T> source_;
    std::array<T, Stages> stages_{};
};

} // namespace PCIA::Cdc
