/**
 * @file ring_queue.cpp
 * @brief Explicit template instantiations for RingQueue to reduce code bloat.
*/

#include "relay/mem/ring_queue.hpp"
#include "relay/mem/raw_frame.hpp"
namespace relay::mem {

    /// Explicit instantiations of RingQueue for commonly used types.
    /// This ensures one compiled instance instead of every TU instantiating its own.

    template class RingQueue<int>;      // For unit tests and benchmarks
    template class RingQueue<RawFrame>; // Per-path frame queues
} // namespace relay::mem
