#include <algorithm>
#include <spdlog/spdlog.h>
#include "Chunk.hpp"
#include "Error.hpp"

namespace rtmpingest::rtmp {
ChunkDecoder::ChunkDecoder(uint32_t chunkSize, std::size_t maxChunkStreams)
    : chunkSize_(chunkSize),
      maxChunkStreams_(maxChunkStreams)
{
}

bool ChunkDecoder::setChunkSize(uint32_t size, boost::system::error_code &ec)
{
    if(size == 0 || size > MAX_CHUNK_SIZE) {
        SPDLOG_ERROR("RTMP chunk decoder {}, invalid chunk size {:#x}", (void *)this, size);
        ec = Error::invalid_chunk_size;
        return false;
    }
    chunkSize_ = size;
    return true;
}

void ChunkDecoder::abort(uint32_t cid)
{
    auto it = streams_.find(cid);
    if(it != streams_.end()) {
        SPDLOG_DEBUG("RTMP chunk decoder {}, abort cid={}, dropped {} bytes", (void *)this, cid, it->second.payload.size());
        it->second.payload.clear();
    }
}

bool ChunkDecoder::idle() const
{
    if(!readingChunkHeader_) {
        return false;
    }
    for(const auto &s : streams_) {
        if(!s.second.payload.empty()) {
            return false;
        }
    }
    return true;
}

bool ChunkDecoder::timestamp(uint32_t cid, uint32_t &ts) const
{
    auto it = streams_.find(cid);
    if(it == streams_.end()) {
        return false;
    }
    ts = it->second.h.timestamp;
    return true;
}

ChunkResult ChunkDecoder::readChunk(Buffer &in, RtmpMessage &message, boost::system::error_code &ec)
{
    if(!readingChunkHeader_) {
        return decodeChunkPayload(in, message);
    }
    ChunkResult result = decodeChunkHeader(in, ec);
    if(result != ChunkResult::CHUNK) {
        return result;
    }
    if(chunkRemaining_ == 0) {
        // zero length message
        readingChunkHeader_ = true;
        return complete(*current_, message);
    }
    return ChunkResult::CHUNK;
}

ChunkResult ChunkDecoder::decodeChunkHeader(Buffer &in, boost::system::error_code &ec)
{
    const uint8_t *data = in.readBuffer();
    uint32_t offset = 0, readableSize = in.readableSize();
    // chunk flags
    if(readableSize < 1) {
        return ChunkResult::NEED_MORE;
    }
    uint8_t fmt = *data >> 6;
    uint32_t cid = *data & 0x3f;
    offset += 1;
    // possible cid >= 64
    if(cid == 0) {
        if(readableSize < offset + 1) {
            return ChunkResult::NEED_MORE;
        }
        cid = 64 + (uint32_t) * (data + offset);
        offset += 1;
    } else if(cid == 1) {
        if(readableSize < offset + 2) {
            return ChunkResult::NEED_MORE;
        }
        uint16_t id;
        loadLE<uint16_t, 16>(data + offset, id);
        cid = 64 + (uint32_t)id;
        offset += 2;
    }
    auto it = streams_.find(cid);
    ChunkStream *stream = (it == streams_.end()) ? nullptr : &it->second;
    if(!stream) {
        if(fmt != CHUNK_TYPE_0) {
            SPDLOG_ERROR("RTMP chunk decoder {}, fmt {} on cid={} without a previous header", (void *)this, fmt, cid);
            ec = Error::chunk_malformed;
            return ChunkResult::ERROR;
        }
        if(streams_.size() >= maxChunkStreams_) {
            SPDLOG_ERROR("RTMP chunk decoder {}, too many chunk streams, cid={}", (void *)this, cid);
            ec = Error::too_many_chunk_streams;
            return ChunkResult::ERROR;
        }
    }
    // chunk header: 11/7/3/0 bytes
    if(readableSize < offset + ChunkHeaderSize[fmt]) {
        return ChunkResult::NEED_MORE;
    }
    uint32_t ts = 0, length = 0, sid = 0;
    uint8_t type = 0;
    if(fmt <= CHUNK_TYPE_2) {
        loadBE<uint32_t, 24>(data + offset, ts);
    }
    if(fmt <= CHUNK_TYPE_1) {
        loadBE<uint32_t, 24>(data + offset + 3, length);
        loadBE<uint8_t, 8>(data + offset + 6, type);
    }
    if(fmt == CHUNK_TYPE_0) {
        loadLE<uint32_t, 32>(data + offset + 7, sid);
    }
    offset += ChunkHeaderSize[fmt];

    bool continuation = stream && !stream->payload.empty();
    bool extended = false;
    uint32_t extendedValue = 0;
    if(fmt <= CHUNK_TYPE_2) {
        extended = (ts == EXTENDED_TIMESTAMP);
        if(extended) {
            if(readableSize < offset + 4) {
                return ChunkResult::NEED_MORE;
            }
            loadBE<uint32_t, 32>(data + offset, extendedValue);
            offset += 4;
        }
    } else if(stream->extended) {
        extended = true;
        if(readableSize < offset + 4) {
            return ChunkResult::NEED_MORE;
        }
        uint32_t value;
        loadBE<uint32_t, 32>(data + offset, value);
        if(!continuation || value == stream->extendedValue) {
            extendedValue = value;
            offset += 4;
        } else {
            // some encoders omit it on continuations, the bytes are payload
            extendedValue = stream->extendedValue;
        }
    }
    in.erase(offset);

    if(!stream) {
        stream = &streams_[cid];
        stream->h.cid = cid;
    }
    if(fmt != CHUNK_TYPE_3 && continuation) {
        SPDLOG_WARN("RTMP chunk decoder {}, new header on cid={} drops a partial message of {}/{} bytes",
                    (void *)this, cid, stream->payload.size(), stream->h.length);
        stream->payload.clear();
        continuation = false;
    }
    uint32_t value = extended ? extendedValue : ts;
    switch(fmt) {
    case CHUNK_TYPE_0:
        stream->h.timestamp = value;
        stream->delta = value;
        stream->h.length = length;
        stream->h.type = type;
        stream->h.sid = sid;
        break;
    case CHUNK_TYPE_1:
        stream->delta = value;
        stream->h.timestamp += value;
        stream->h.length = length;
        stream->h.type = type;
        break;
    case CHUNK_TYPE_2:
        stream->delta = value;
        stream->h.timestamp += value;
        break;
    default:
        if(!continuation) {
            if(extended) {
                stream->delta = extendedValue;
            }
            stream->h.timestamp += stream->delta;
        }
        break;
    }
    stream->extended = extended;
    stream->extendedValue = extendedValue;
    if(!continuation) {
        stream->payload.reserve(stream->h.length);
    }
    current_ = stream;
    chunkRemaining_ = std::min<uint32_t>(chunkSize_, stream->h.length - stream->payload.size());
    readingChunkHeader_ = false;
    SPDLOG_TRACE("RTMP chunk decoder {}, fmt={}, cid={}, type={}, ts={}, length={}, sid={}",
                 (void *)this, fmt, cid, stream->h.type, stream->h.timestamp, stream->h.length, stream->h.sid);
    return ChunkResult::CHUNK;
}

ChunkResult ChunkDecoder::decodeChunkPayload(Buffer &in, RtmpMessage &message)
{
    uint32_t size = std::min(in.readableSize(), chunkRemaining_);
    if(size == 0) {
        return ChunkResult::NEED_MORE;
    }
    current_->payload.append((const char *)in.readBuffer(), size);
    in.erase(size);
    chunkRemaining_ -= size;
    if(chunkRemaining_ > 0) {
        // incomplete chunk body, keep state
        return ChunkResult::CHUNK;
    }
    readingChunkHeader_ = true;
    if(current_->payload.size() >= current_->h.length) {
        return complete(*current_, message);
    }
    return ChunkResult::CHUNK;
}

ChunkResult ChunkDecoder::complete(ChunkStream &stream, RtmpMessage &message)
{
    message.h = stream.h;
    message.payload = std::move(stream.payload);
    stream.payload.clear();
    return ChunkResult::MESSAGE;
}

ChunkEncoder::ChunkEncoder(uint32_t chunkSize) : chunkSize_(chunkSize)
{
}

void ChunkEncoder::encodeBasicHeader(Buffer &output, uint8_t fmt, uint32_t cid)
{
    if(cid < 64) {
        output.putBE<uint8_t, 8>((fmt << 6) | cid);
    } else if(cid < 64 + 256) {
        output.putBE<uint8_t, 8>(fmt << 6);
        output.putBE<uint8_t, 8>(cid - 64);
    } else {
        output.putBE<uint8_t, 8>((fmt << 6) | 1);
        output.putLE<uint16_t, 16>(cid - 64);
    }
}

uint32_t ChunkEncoder::encode(Buffer &output, const RtmpMessageHeader &h, std::string_view payload)
{
    bool extended = h.timestamp >= EXTENDED_TIMESTAMP;
    encodeBasicHeader(output, CHUNK_TYPE_0, h.cid);
    output.putBE<uint32_t, 24>(extended ? EXTENDED_TIMESTAMP : h.timestamp);
    output.putBE<uint32_t, 24>(payload.size());
    output.putBE<uint8_t, 8>(h.type);
    output.putLE<uint32_t, 32>(h.sid);
    if(extended) {
        output.putBE<uint32_t, 32>(h.timestamp);
    }
    std::size_t size = std::min<std::size_t>(chunkSize_, payload.size());
    output.append(payload.substr(0, size));
    std::size_t offset = size;
    uint32_t chunks = 1;
    while(offset < payload.size()) {
        encodeBasicHeader(output, CHUNK_TYPE_3, h.cid);
        if(extended) {
            output.putBE<uint32_t, 32>(h.timestamp);
        }
        size = std::min<std::size_t>(chunkSize_, payload.size() - offset);
        output.append(payload.substr(offset, size));
        offset += size;
        chunks++;
    }
    return chunks;
}
}
