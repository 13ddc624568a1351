#pragma once
#include <array>
#include <cstdint>
#include <boost/system/error_code.hpp>
#include "Buffer.hpp"

namespace rtmpingest::rtmp {
constexpr uint8_t HANDSHAKE_VERSION = 3;
constexpr std::size_t HANDSHAKE_SIZE = 1536;
constexpr std::size_t HANDSHAKE_DIGEST_SIZE = 32;
constexpr uint32_t HANDSHAKE_SERVER_VERSION = 0x04050001;

// "Genuine Adobe Flash Media Server 001" followed by 32 random bytes
extern const uint8_t FMS_KEY[68];
// "Genuine Adobe Flash Player 001" followed by the same 32 bytes
extern const uint8_t FP_KEY[62];
constexpr std::size_t FMS_KEY_PUBLIC_SIZE = 36;
constexpr std::size_t FP_KEY_PUBLIC_SIZE = 30;

// Position of the digest inside C1/S1. Schema 0 takes the offset from
// bytes 8..12, schema 1 from bytes 772..776.
enum class HandshakeSchema {
    SCHEMA0, SCHEMA1
};

uint32_t digestPosition(const uint8_t *block, HandshakeSchema schema);

// HMAC-SHA256 of the 1536 byte block with the 32 digest bytes at pos left out.
bool blockDigest(const uint8_t *block, uint32_t pos, const uint8_t *key, std::size_t keyLength,
                 uint8_t *digest);

bool hmacSha256(const uint8_t *key, std::size_t keyLength, const uint8_t *data, std::size_t length,
                uint8_t *digest);

enum class HandshakeState {
    READ_C0C1, READ_C2, FINISH
};

// Server side of the RTMP handshake. The complex (digest) variant is tried
// first, C1 is validated against both schemas and on failure the same C1 is
// answered with the simple variant.
class HandshakeServer
{
public:
    HandshakeServer();

    // Bytes the current step waits for.
    std::size_t needed() const;

    // Consumes C0C1 or C2 from in once enough bytes are buffered and appends
    // S0S1S2 to out. Returns true when a step was processed.
    bool handshake(Buffer &in, Buffer &out, boost::system::error_code &ec);

    HandshakeState state() const
    {
        return state_;
    }

    bool finished() const
    {
        return state_ == HandshakeState::FINISH;
    }

    bool complex() const
    {
        return complex_;
    }

    uint8_t requestedVersion() const
    {
        return requestedVersion_;
    }

private:
    bool complexResponse(const uint8_t *c1, Buffer &out);
    bool simpleResponse(const uint8_t *c1, Buffer &out);

private:
    HandshakeState state_;
    bool complex_;
    uint8_t requestedVersion_;
    HandshakeSchema schema_;
    std::array<uint8_t, HANDSHAKE_DIGEST_SIZE> c1Digest_;
};
}
