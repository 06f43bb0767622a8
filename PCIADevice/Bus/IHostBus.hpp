#pragma once

#include <cstdint>
#include <span>

namespace PCIA::Bus {

enum class BurstDirection : uint8_t {
    kRead,   // host memory -> device (playback)
    kWrite,  // device -> host memory (capture)
};

struct BurstRequest {
    BurstDirection direction{BurstDirection::kRead};
    uint64_t address{0};
    uint32_t beatCount{0};
    uint32_t beatBytes{0};
};

struct BeatStatus {
    bool valid{false};   ///< a beat moved this tick
    bool last{false};    ///< it was the final beat of the burst
};

/**
 * Transport-side burst handshake.
 *
 * Read and write channels are independent: one read burst and one write
 * burst may be outstanding at the same time. A call that returns
 * "not accepted" / "not valid" is a stall; the caller retries on a later
 * tick. Faults are reported through ErrorPending() and stay pending until
 * ClearError().
 */
class IHostBus {
public:
    virtual ~IHostBus() = default;

    /// @return true when the request was accepted this tick
    [[nodiscard]] virtual bool RequestBurst(const BurstRequest& request) noexcept = 0;

    /// Deliver the next read beat of the outstanding read burst into `out`.
    [[nodiscard]] virtual BeatStatus ReadBeat(std::span<uint8_t> out) noexcept = 0;

    /// Offer the next write beat of the outstanding write burst.
    [[nodiscard]] virtual BeatStatus WriteBeat(std::span<const uint8_t> data) noexcept = 0;

    /// Posted 32-bit write (descriptor status write-back). A fault latches on
    /// the channel of the engine that posted it.
    virtual void PostWrite32(BurstDirection direction, uint64_t address, uint32_t value) noexcept = 0;

    [[nodiscard]] virtual bool ErrorPending(BurstDirection direction) const noexcept = 0;
    virtual void ClearError(BurstDirection direction) noexcept = 0;
};

} // namespace PCIA::Bus
