#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <boost/system/error_code.hpp>
#include "Buffer.hpp"

namespace rtmpingest::rtmp {
constexpr uint32_t DEFAULT_CHUNK_SIZE = 128;
constexpr uint32_t MAX_CHUNK_SIZE = 0x7FFFFFFF;
constexpr std::size_t DEFAULT_MAX_CHUNK_STREAMS = 1024;

constexpr uint8_t CHUNK_TYPE_0 = 0; // 11-bytes: timestamp(3) + length(3) + stream type(1) + stream id(4)
constexpr uint8_t CHUNK_TYPE_1 = 1; // 7-bytes: delta(3) + length(3) + stream type(1)
constexpr uint8_t CHUNK_TYPE_2 = 2; // 3-bytes: delta(3)
constexpr uint8_t CHUNK_TYPE_3 = 3; // 0-byte

constexpr uint32_t ChunkHeaderSize[] = { 11, 7, 3, 0 };

constexpr uint32_t EXTENDED_TIMESTAMP = 0xFFFFFF;

struct RtmpMessageHeader {
    uint32_t cid{ 0 };
    uint8_t type{ 0 };
    uint32_t timestamp{ 0 };
    uint32_t sid{ 0 };
    uint32_t length{ 0 };
};

struct RtmpMessage {
    RtmpMessageHeader h;
    std::string payload;
};

enum class ChunkResult {
    NEED_MORE, // nothing consumed, wait for more bytes
    CHUNK,     // a header or a payload fragment was consumed
    MESSAGE,   // a message completed and was moved to the output
    ERROR,
};

// Reassembles messages from the chunk stream held in a Buffer. Headers are
// consumed only once complete, payload bytes as soon as they arrive.
class ChunkDecoder
{
public:
    explicit ChunkDecoder(uint32_t chunkSize = DEFAULT_CHUNK_SIZE,
                          std::size_t maxChunkStreams = DEFAULT_MAX_CHUNK_STREAMS);

    ChunkResult readChunk(Buffer &in, RtmpMessage &message, boost::system::error_code &ec);

    // Rejects 0 and sizes with bit 31 set.
    bool setChunkSize(uint32_t size, boost::system::error_code &ec);

    uint32_t chunkSize() const
    {
        return chunkSize_;
    }

    // Drops the partial message of a chunk stream, the header cache stays.
    void abort(uint32_t cid);

    std::size_t chunkStreams() const
    {
        return streams_.size();
    }

    // False while part of a chunk or of a message is buffered.
    bool idle() const;

    // Timestamp cached for a chunk stream, false when it was never seen.
    bool timestamp(uint32_t cid, uint32_t &ts) const;

private:
    struct ChunkStream {
        RtmpMessageHeader h;
        uint32_t delta{ 0 };
        bool extended{ false };
        uint32_t extendedValue{ 0 };
        std::string payload;
    };

    ChunkResult decodeChunkHeader(Buffer &in, boost::system::error_code &ec);
    ChunkResult decodeChunkPayload(Buffer &in, RtmpMessage &message);
    ChunkResult complete(ChunkStream &stream, RtmpMessage &message);

private:
    uint32_t chunkSize_;
    std::size_t maxChunkStreams_;
    std::unordered_map<uint32_t, ChunkStream> streams_;
    bool readingChunkHeader_{ true };
    ChunkStream *current_{ nullptr };
    uint32_t chunkRemaining_{ 0 };
};

// Splits messages into one Fmt 0 chunk followed by Fmt 3 continuations.
class ChunkEncoder
{
public:
    explicit ChunkEncoder(uint32_t chunkSize = DEFAULT_CHUNK_SIZE);

    void setChunkSize(uint32_t size)
    {
        chunkSize_ = size;
    }

    uint32_t chunkSize() const
    {
        return chunkSize_;
    }

    // Returns the number of chunks written.
    uint32_t encode(Buffer &output, const RtmpMessageHeader &h, std::string_view payload);

private:
    void encodeBasicHeader(Buffer &output, uint8_t fmt, uint32_t cid);

private:
    uint32_t chunkSize_;
};
}
