#pragma once

#include <cstddef>
#include <cstdint>

/**
 * Framing for the writer channel. Every message a producer sends is one
 * FrameHeader followed by `length` bytes of a serialized ChannelMessage.
 * Header and body are written back to back by a single producer, so frames
 * never interleave within one connection.
 */

namespace Rxcache {
namespace wire {

// ============================================================================
// Frame limits
// ============================================================================

static constexpr uint32_t FRAME_MAGIC = 0x52584331;             // "RXC1"
static constexpr size_t MAX_FRAME_BODY_SIZE = 64UL * 1024 * 1024; // allrelated payloads stay well below this

// ============================================================================
// FrameHeader: fixed 8 byte prefix
// ============================================================================

struct FrameHeader {
    uint32_t magic;   // FRAME_MAGIC
    uint32_t length;  // body bytes following the header
};

static_assert(sizeof(FrameHeader) == 8, "FrameHeader must be exactly 8 bytes");

inline constexpr bool ValidateFrameHeader(const FrameHeader& header) {
    return header.magic == FRAME_MAGIC && header.length <= MAX_FRAME_BODY_SIZE;
}

inline constexpr size_t FrameSize(size_t body_size) {
    return sizeof(FrameHeader) + body_size;
}

}  // namespace wire
}  // namespace Rxcache
