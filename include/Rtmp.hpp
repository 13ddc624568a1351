#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include "Buffer.hpp"
#include "Chunk.hpp"

namespace rtmpingest::rtmp {
constexpr uint8_t TYPE_SET_CHUNK_SIZE = 1;
constexpr uint8_t TYPE_ABORT = 2;
constexpr uint8_t TYPE_ACKNOWLEDGEMENT = 3;
constexpr uint8_t TYPE_EVENT = 4;
constexpr uint8_t TYPE_WINDOW_ACKNOWLEDGEMENT_SIZE = 5;
constexpr uint8_t TYPE_SET_PEER_BANDWIDTH = 6;
constexpr uint8_t TYPE_AUDIO = 8;
constexpr uint8_t TYPE_VIDEO = 9;
constexpr uint8_t TYPE_FLEX_STREAM = 15;
constexpr uint8_t TYPE_FLEX_MESSAGE = 17;
constexpr uint8_t TYPE_DATA = 18;
constexpr uint8_t TYPE_SHARED_OBJECT = 19;
constexpr uint8_t TYPE_INVOKE = 20;
constexpr uint8_t TYPE_AGGREGATE = 22;

constexpr uint16_t EVENT_STREAM_BEGIN = 0;
constexpr uint16_t EVENT_PING_REQUEST = 6;
constexpr uint16_t EVENT_PING_RESPONSE = 7;

constexpr uint8_t PEER_BANDWITH_LIMIT_TYPE_DYNAMIC = 2;

constexpr uint32_t MSID_PROTOCOL_CONTROL_MESSAGE = 0;

constexpr uint32_t CID_PROTOCOL_CONTROL = 2;
constexpr uint32_t CID_OVER_CONNECTION = 3;
constexpr uint32_t CID_OVER_STREAM = 5;

// capsEx bit announced by clients that understand ReconnectRequest
constexpr uint32_t CAPS_EX_RECONNECT = 0x01;

// Serializes the server side protocol control and command messages into
// chunks. Control messages go out on csid 2, connection level commands on
// csid 3 and stream level commands on csid 5.
class MessageEncoder
{
public:
    MessageEncoder(Buffer &output, ChunkEncoder &chunkEncoder);

    void encodeWindowAck(uint32_t size);
    void encodeAck(uint32_t sequence);
    void encodePeerBandwidth(uint32_t size, uint8_t type);
    void encodeSetChunkSize(uint32_t size);
    void encodePingResponse(uint32_t timestamp);
    void encodeStreamBegin(uint32_t sid);
    void encodeConnectResult(double tid);
    void encodeConnectRejected(double tid, std::string_view description);
    void encodeCreateStreamResult(double tid, uint32_t sid);
    void encodeNullResult(double tid);
    void encodeError(double tid, std::string_view code, std::string_view description);
    void encodeOnStatus(uint32_t sid, double tid, std::string_view level, std::string_view code, std::string_view description);
    void encodeReconnectRequest(std::string_view description);
    void encodeMessage(std::string_view payload, uint8_t type, uint32_t cid, uint32_t sid, uint32_t timestamp);

private:
    void encodeControl(uint8_t type);

private:
    Buffer &output_;
    ChunkEncoder &chunkEncoder_;
    Buffer body_;
};
}
