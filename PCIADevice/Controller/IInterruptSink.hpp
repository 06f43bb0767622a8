#pragma once

#include "../Dma/TransferEngine.hpp"

namespace PCIA::Controller {

/// Receives the edge-triggered "complete" interrupt of each direction.
/// Called from the transport-domain tick; must not block.
class IInterruptSink {
public:
    virtual ~IInterruptSink() = default;
    virtual void OnTransferComplete(Dma::Direction direction) noexcept = 0;
};

} // namespace PCIA::Controller
