#include <chrono>
#include <initializer_list>
#include <cstring>
#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>
#include <spdlog/spdlog.h>
#include "Handshake.hpp"
#include "Error.hpp"

namespace rtmpingest::rtmp {
const uint8_t FMS_KEY[68] = {
    0x47, 0x65, 0x6e, 0x75, 0x69, 0x6e, 0x65, 0x20,
    0x41, 0x64, 0x6f, 0x62, 0x65, 0x20, 0x46, 0x6c,
    0x61, 0x73, 0x68, 0x20, 0x4d, 0x65, 0x64, 0x69,
    0x61, 0x20, 0x53, 0x65, 0x72, 0x76, 0x65, 0x72,
    0x20, 0x30, 0x30, 0x31, // Genuine Adobe Flash Media Server 001
    0xf0, 0xee, 0xc2, 0x4a, 0x80, 0x68, 0xbe, 0xe8,
    0x2e, 0x00, 0xd0, 0xd1, 0x02, 0x9e, 0x7e, 0x57,
    0x6e, 0xec, 0x5d, 0x2d, 0x29, 0x80, 0x6f, 0xab,
    0x93, 0xb8, 0xe6, 0x36, 0xcf, 0xeb, 0x31, 0xae
};

const uint8_t FP_KEY[62] = {
    0x47, 0x65, 0x6e, 0x75, 0x69, 0x6e, 0x65, 0x20,
    0x41, 0x64, 0x6f, 0x62, 0x65, 0x20, 0x46, 0x6c,
    0x61, 0x73, 0x68, 0x20, 0x50, 0x6c, 0x61, 0x79,
    0x65, 0x72, 0x20, 0x30, 0x30, 0x31, // Genuine Adobe Flash Player 001
    0xf0, 0xee, 0xc2, 0x4a, 0x80, 0x68, 0xbe, 0xe8,
    0x2e, 0x00, 0xd0, 0xd1, 0x02, 0x9e, 0x7e, 0x57,
    0x6e, 0xec, 0x5d, 0x2d, 0x29, 0x80, 0x6f, 0xab,
    0x93, 0xb8, 0xe6, 0x36, 0xcf, 0xeb, 0x31, 0xae
};

static inline uint32_t timeNow()
{
    return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>
                                 (std::chrono::steady_clock::now().time_since_epoch()).count());
}

uint32_t digestPosition(const uint8_t *block, HandshakeSchema schema)
{
    // 764 byte digest block minus 32 digest bytes minus 4 offset bytes
    uint32_t base = (schema == HandshakeSchema::SCHEMA0) ? 8 : 772;
    uint32_t sum = block[base] + block[base + 1] + block[base + 2] + block[base + 3];
    return base + 4 + (sum % 728);
}

bool hmacSha256(const uint8_t *key, std::size_t keyLength, const uint8_t *data, std::size_t length,
                uint8_t *digest)
{
    unsigned int digestLength = 0;
    if(!HMAC(EVP_sha256(), key, static_cast<int>(keyLength), data, length, digest, &digestLength)) {
        return false;
    }
    return digestLength == HANDSHAKE_DIGEST_SIZE;
}

bool blockDigest(const uint8_t *block, uint32_t pos, const uint8_t *key, std::size_t keyLength,
                 uint8_t *digest)
{
    uint8_t joined[HANDSHAKE_SIZE - HANDSHAKE_DIGEST_SIZE];
    memcpy(joined, block, pos);
    memcpy(joined + pos, block + pos + HANDSHAKE_DIGEST_SIZE, HANDSHAKE_SIZE - pos - HANDSHAKE_DIGEST_SIZE);
    return hmacSha256(key, keyLength, joined, sizeof(joined), digest);
}

HandshakeServer::HandshakeServer()
    : state_(HandshakeState::READ_C0C1),
      complex_(false),
      requestedVersion_(0),
      schema_(HandshakeSchema::SCHEMA0),
      c1Digest_{}
{
}

std::size_t HandshakeServer::needed() const
{
    switch(state_) {
    case HandshakeState::READ_C0C1:
        return 1 + HANDSHAKE_SIZE;
    case HandshakeState::READ_C2:
        return HANDSHAKE_SIZE;
    default:
        return 0;
    }
}

bool HandshakeServer::handshake(Buffer &in, Buffer &out, boost::system::error_code &ec)
{
    if(state_ == HandshakeState::READ_C0C1) {
        if(in.readableSize() < 1 + HANDSHAKE_SIZE) {
            return false;
        }
        requestedVersion_ = *in.readBuffer();
        if(requestedVersion_ != HANDSHAKE_VERSION) {
            SPDLOG_WARN("RTMP handshake {}, client requested version {}, answering with {}",
                        (void *)this, (int)requestedVersion_, (int)HANDSHAKE_VERSION);
        }
        const uint8_t *c1 = in.readBuffer() + 1;
        if(complexResponse(c1, out)) {
            complex_ = true;
            SPDLOG_DEBUG("RTMP handshake {}, complex handshake, schema {}", (void *)this, (int)schema_);
        } else if(simpleResponse(c1, out)) {
            SPDLOG_DEBUG("RTMP handshake {}, simple handshake", (void *)this);
        } else {
            SPDLOG_ERROR("RTMP handshake {}, fail to build the handshake response", (void *)this);
            ec = Error::handshake_malformed;
            return false;
        }
        in.erase(1 + HANDSHAKE_SIZE);
        state_ = HandshakeState::READ_C2;
        return true;
    } else if(state_ == HandshakeState::READ_C2) {
        if(in.readableSize() < HANDSHAKE_SIZE) {
            return false;
        }
        // c2 is not validated, several encoders send arbitrary bytes
        in.erase(HANDSHAKE_SIZE);
        state_ = HandshakeState::FINISH;
        return true;
    }
    return false;
}

bool HandshakeServer::complexResponse(const uint8_t *c1, Buffer &out)
{
    uint8_t digest[HANDSHAKE_DIGEST_SIZE];
    bool valid = false;
    for(HandshakeSchema schema : { HandshakeSchema::SCHEMA0, HandshakeSchema::SCHEMA1 }) {
        uint32_t pos = digestPosition(c1, schema);
        if(blockDigest(c1, pos, FP_KEY, FP_KEY_PUBLIC_SIZE, digest)
                && memcmp(digest, c1 + pos, HANDSHAKE_DIGEST_SIZE) == 0) {
            schema_ = schema;
            memcpy(c1Digest_.data(), digest, HANDSHAKE_DIGEST_SIZE);
            valid = true;
            break;
        }
    }
    if(!valid) {
        SPDLOG_INFO("RTMP handshake {}, no valid c1 digest, try simple handshake", (void *)this);
        return false;
    }

    uint8_t s1[HANDSHAKE_SIZE];
    storeBE<uint32_t, 32>(s1, timeNow());
    storeBE<uint32_t, 32>(s1 + 4, HANDSHAKE_SERVER_VERSION);
    if(RAND_bytes(s1 + 8, HANDSHAKE_SIZE - 8) != 1) {
        return false;
    }
    // s1 is signed with the schema the client used
    uint32_t pos = digestPosition(s1, schema_);
    if(!blockDigest(s1, pos, FMS_KEY, FMS_KEY_PUBLIC_SIZE, s1 + pos)) {
        return false;
    }

    uint8_t s2[HANDSHAKE_SIZE];
    if(RAND_bytes(s2, HANDSHAKE_SIZE - HANDSHAKE_DIGEST_SIZE) != 1) {
        return false;
    }
    uint8_t key[HANDSHAKE_DIGEST_SIZE];
    if(!hmacSha256(FMS_KEY, sizeof(FMS_KEY), c1Digest_.data(), HANDSHAKE_DIGEST_SIZE, key)
            || !hmacSha256(key, sizeof(key), s2, HANDSHAKE_SIZE - HANDSHAKE_DIGEST_SIZE,
                           s2 + HANDSHAKE_SIZE - HANDSHAKE_DIGEST_SIZE)) {
        return false;
    }

    out.putBE<uint8_t, 8>(HANDSHAKE_VERSION);
    out.append(s1, HANDSHAKE_SIZE);
    out.append(s2, HANDSHAKE_SIZE);
    return true;
}

bool HandshakeServer::simpleResponse(const uint8_t *c1, Buffer &out)
{
    uint8_t s1[HANDSHAKE_SIZE];
    storeBE<uint32_t, 32>(s1, timeNow());
    storeBE<uint32_t, 32>(s1 + 4, 0);
    if(RAND_bytes(s1 + 8, HANDSHAKE_SIZE - 8) != 1) {
        return false;
    }
    out.putBE<uint8_t, 8>(HANDSHAKE_VERSION);
    out.append(s1, HANDSHAKE_SIZE);
    // echo c1
    out.append(c1, HANDSHAKE_SIZE);
    return true;
}
}
