#pragma once
#include <cstddef>
#include <cstdint>
#include <optional>

namespace PCIA::Shared {

/**
 * @brief Host memory region with CPU virtual and device-visible addresses.
 *
 * Holds descriptor rings and sample buffers shared between software and the
 * transfer engines.
 */
struct HostRegion {
    uint8_t* virtualBase;   ///< CPU-accessible virtual address
    uint64_t deviceBase;    ///< Device-visible bus address
    size_t size;            ///< Region size (16-byte aligned)
};

/**
 * @brief Host-visible memory as seen by the device.
 *
 * Allocation comes from a preallocated slab and is never freed. Device-side
 * reads and writes are range-checked; the host bus and the descriptor ring
 * loader go through them.
 */
class IHostMemory {
public:
    virtual ~IHostMemory() = default;

    // -------------------------------------------------------------------------
    // Allocation
    // -------------------------------------------------------------------------

    /**
     * @brief Allocate a region.
     *
     * @param size Bytes to allocate (rounded up to 16)
     * @param alignment Start alignment (power of 2, min 16)
     * @return HostRegion on success, std::nullopt if the slab is exhausted
     */
    virtual std::optional<HostRegion> AllocateRegion(
        size_t size,
        size_t alignment = 16) = 0;

    /// CPU view of a device address; nullptr for addresses outside the slab.
    virtual void* DeviceToVirt(uint64_t deviceAddress) const noexcept = 0;

    // -------------------------------------------------------------------------
    // Device-side access
    // -------------------------------------------------------------------------

    /**
     * @brief Copy [deviceAddress, deviceAddress + length) into dst.
     * @return false if any byte of the range lies outside the slab
     */
    [[nodiscard]] virtual bool Read(uint64_t deviceAddress, void* dst, size_t length) const noexcept = 0;

    /**
     * @brief Copy src into [deviceAddress, deviceAddress + length).
     * @return false if any byte of the range lies outside the slab
     */
    [[nodiscard]] virtual bool Write(uint64_t deviceAddress, const void* src, size_t length) noexcept = 0;
};

} // namespace PCIA::Shared
