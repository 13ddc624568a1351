#pragma once
#include <string>
#include <type_traits>
#include <boost/system/error_code.hpp>

namespace rtmpingest {
// Protocol level failures. Transport failures keep the error_code produced
// by Boost.Asio and are reported as Io.
enum class Error {
    io = 1,
    unexpected_eof,
    handshake_malformed,
    chunk_malformed,
    too_many_chunk_streams,
    invalid_chunk_size,
    amf0_decode,
    unexpected_message,
    hook_rejected,
    timeout,
};

const boost::system::error_category &errorCategory();

boost::system::error_code make_error_code(Error e);

// Recoverable errors are answered on the wire and the session goes on;
// everything else closes the connection.
bool isRecoverable(const boost::system::error_code &ec);

// Maps any error_code to the name of its kind, e.g. "InvalidChunkSize" or
// "Io" for transport errors and "None" for a clean close.
std::string errorKind(const boost::system::error_code &ec);

// eof and connection resets from the transport become unexpected_eof.
boost::system::error_code fromTransport(const boost::system::error_code &ec);
}

namespace boost {
namespace system {
template<>
struct is_error_code_enum<rtmpingest::Error> : std::true_type {
};
}
}
