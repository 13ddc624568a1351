#include <boost/asio/error.hpp>
#include "Error.hpp"

namespace rtmpingest {
namespace {
class RtmpErrorCategory : public boost::system::error_category
{
public:
    const char *name() const noexcept override
    {
        return "rtmpingest";
    }

    std::string message(int ev) const override
    {
        switch(static_cast<Error>(ev)) {
        case Error::io:
            return "transport failure";
        case Error::unexpected_eof:
            return "peer closed the connection mid-frame";
        case Error::handshake_malformed:
            return "malformed handshake";
        case Error::chunk_malformed:
            return "malformed chunk";
        case Error::too_many_chunk_streams:
            return "too many chunk streams";
        case Error::invalid_chunk_size:
            return "invalid chunk size";
        case Error::amf0_decode:
            return "AMF0 decode error";
        case Error::unexpected_message:
            return "unexpected message for session state";
        case Error::hook_rejected:
            return "rejected by hook";
        case Error::timeout:
            return "timeout";
        }
        return "unknown error";
    }
};
}

const boost::system::error_category &errorCategory()
{
    static RtmpErrorCategory category;
    return category;
}

boost::system::error_code make_error_code(Error e)
{
    return boost::system::error_code(static_cast<int>(e), errorCategory());
}

bool isRecoverable(const boost::system::error_code &ec)
{
    if(ec.category() != errorCategory()) {
        return false;
    }
    switch(static_cast<Error>(ec.value())) {
    case Error::amf0_decode:
    case Error::unexpected_message:
    case Error::hook_rejected:
        return true;
    default:
        return false;
    }
}

std::string errorKind(const boost::system::error_code &ec)
{
    if(!ec) {
        return "None";
    }
    if(ec.category() != errorCategory()) {
        return "Io";
    }
    switch(static_cast<Error>(ec.value())) {
    case Error::io:
        return "Io";
    case Error::unexpected_eof:
        return "UnexpectedEof";
    case Error::handshake_malformed:
        return "HandshakeMalformed";
    case Error::chunk_malformed:
        return "ChunkMalformed";
    case Error::too_many_chunk_streams:
        return "TooManyChunkStreams";
    case Error::invalid_chunk_size:
        return "InvalidChunkSize";
    case Error::amf0_decode:
        return "Amf0Decode";
    case Error::unexpected_message:
        return "UnexpectedMessage";
    case Error::hook_rejected:
        return "HookRejected";
    case Error::timeout:
        return "Timeout";
    }
    return "Io";
}

boost::system::error_code fromTransport(const boost::system::error_code &ec)
{
    if(ec == boost::asio::error::eof
            || ec == boost::asio::error::connection_reset
            || ec == boost::asio::error::connection_aborted) {
        return make_error_code(Error::unexpected_eof);
    }
    return ec;
}
}
