#pragma once
#include <chrono>
#include <cstdint>
#include <cstddef>

namespace rtmpingest {
struct Config {
    uint32_t initialReadChunkSize{ 128 };
    uint32_t initialWriteChunkSize{ 4096 };
    uint32_t windowAckSize{ 2500000 };
    uint32_t peerBandwidth{ 2500000 };
    uint8_t peerBandwidthLimit{ 2 }; // dynamic
    std::size_t maxChunkStreams{ 1024 };
    std::chrono::milliseconds handshakeTimeout{ 10000 };
    std::chrono::milliseconds idleTimeout{ 30000 };
    std::chrono::milliseconds flushTimeout{ 1000 };
    std::size_t outboundChannelCapacity{ 256 };
    uint32_t readBufferSize{ 8192 };
    uint32_t maxReadBufferSize{ 1024 * 1024 };
};
}
