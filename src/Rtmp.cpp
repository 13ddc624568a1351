#include "Rtmp.hpp"
#include "Amf0.hpp"

namespace rtmpingest::rtmp {
MessageEncoder::MessageEncoder(Buffer &output, ChunkEncoder &chunkEncoder)
    : output_(output),
      chunkEncoder_(chunkEncoder),
      body_(256)
{
}

void MessageEncoder::encodeControl(uint8_t type)
{
    encodeMessage(body_.stringView(), type, CID_PROTOCOL_CONTROL, MSID_PROTOCOL_CONTROL_MESSAGE, 0);
}

void MessageEncoder::encodeWindowAck(uint32_t size)
{
    body_.clear();
    body_.putBE<uint32_t, 32>(size);
    encodeControl(TYPE_WINDOW_ACKNOWLEDGEMENT_SIZE);
}

void MessageEncoder::encodeAck(uint32_t sequence)
{
    body_.clear();
    body_.putBE<uint32_t, 32>(sequence);
    encodeControl(TYPE_ACKNOWLEDGEMENT);
}

void MessageEncoder::encodePeerBandwidth(uint32_t size, uint8_t type)
{
    body_.clear();
    body_.putBE<uint32_t, 32>(size);
    body_.putBE<uint8_t, 8>(type);
    encodeControl(TYPE_SET_PEER_BANDWIDTH);
}

void MessageEncoder::encodeSetChunkSize(uint32_t size)
{
    body_.clear();
    body_.putBE<uint32_t, 32>(size);
    encodeControl(TYPE_SET_CHUNK_SIZE);
}

void MessageEncoder::encodePingResponse(uint32_t timestamp)
{
    body_.clear();
    body_.putBE<uint16_t, 16>(EVENT_PING_RESPONSE);
    body_.putBE<uint32_t, 32>(timestamp);
    encodeControl(TYPE_EVENT);
}

void MessageEncoder::encodeStreamBegin(uint32_t sid)
{
    body_.clear();
    body_.putBE<uint16_t, 16>(EVENT_STREAM_BEGIN);
    body_.putBE<uint32_t, 32>(sid);
    encodeControl(TYPE_EVENT);
}

void MessageEncoder::encodeConnectResult(double tid)
{
    body_.clear();
    AmfEncoder enc(body_);
    enc.putString("_result");
    enc.putNumber(tid);
    enc.putObjectBegin();
    enc.putObjectValue("fmsVer", "FMS/3,0,1,123");
    enc.putObjectValue("capabilities", 31.0);
    enc.putObjectEnd();
    enc.putObjectBegin();
    enc.putObjectValue("level", "status");
    enc.putObjectValue("code", "NetConnection.Connect.Success");
    enc.putObjectValue("description", "Connection succeeded.");
    enc.putObjectValue("objectEncoding", 0.0);
    enc.putObjectEnd();
    encodeMessage(body_.stringView(), TYPE_INVOKE, CID_OVER_CONNECTION, 0, 0);
}

void MessageEncoder::encodeConnectRejected(double tid, std::string_view description)
{
    encodeError(tid, "NetConnection.Connect.Rejected", description);
}

void MessageEncoder::encodeCreateStreamResult(double tid, uint32_t sid)
{
    body_.clear();
    AmfEncoder enc(body_);
    enc.putString("_result");
    enc.putNumber(tid);
    enc.putNull();
    enc.putNumber(sid);
    encodeMessage(body_.stringView(), TYPE_INVOKE, CID_OVER_CONNECTION, 0, 0);
}

void MessageEncoder::encodeNullResult(double tid)
{
    body_.clear();
    AmfEncoder enc(body_);
    enc.putString("_result");
    enc.putNumber(tid);
    enc.putNull();
    enc.putNull();
    encodeMessage(body_.stringView(), TYPE_INVOKE, CID_OVER_CONNECTION, 0, 0);
}

void MessageEncoder::encodeError(double tid, std::string_view code, std::string_view description)
{
    body_.clear();
    AmfEncoder enc(body_);
    enc.putString("_error");
    enc.putNumber(tid);
    enc.putNull();
    enc.putObjectBegin();
    enc.putObjectValue("level", "error");
    enc.putObjectValue("code", code);
    enc.putObjectValue("description", description);
    enc.putObjectEnd();
    encodeMessage(body_.stringView(), TYPE_INVOKE, CID_OVER_CONNECTION, 0, 0);
}

void MessageEncoder::encodeOnStatus(uint32_t sid, double tid, std::string_view level, std::string_view code, std::string_view description)
{
    body_.clear();
    AmfEncoder enc(body_);
    enc.putString("onStatus");
    enc.putNumber(tid);
    enc.putNull();
    enc.putObjectBegin();
    enc.putObjectValue("level", level);
    enc.putObjectValue("code", code);
    enc.putObjectValue("description", description);
    enc.putObjectEnd();
    encodeMessage(body_.stringView(), TYPE_INVOKE, CID_OVER_STREAM, sid, 0);
}

void MessageEncoder::encodeReconnectRequest(std::string_view description)
{
    body_.clear();
    AmfEncoder enc(body_);
    enc.putString("onStatus");
    enc.putNumber(0);
    enc.putNull();
    enc.putObjectBegin();
    enc.putObjectValue("level", "status");
    enc.putObjectValue("code", "NetConnection.Connect.ReconnectRequest");
    enc.putObjectValue("description", description);
    enc.putObjectEnd();
    encodeMessage(body_.stringView(), TYPE_INVOKE, CID_OVER_CONNECTION, 0, 0);
}

void MessageEncoder::encodeMessage(std::string_view payload, uint8_t type, uint32_t cid, uint32_t sid, uint32_t timestamp)
{
    RtmpMessageHeader h;
    h.cid = cid;
    h.type = type;
    h.sid = sid;
    h.timestamp = timestamp;
    h.length = payload.size();
    chunkEncoder_.encode(output_, h, payload);
}
}
