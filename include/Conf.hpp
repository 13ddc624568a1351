#pragma once
#define STRIP_FLAG_HELP 1
#include <gflags/gflags.h>
#include "Config.hpp"

DECLARE_string(log_level);

DECLARE_string(rtmp_server_ip);
DECLARE_int32(rtmp_server_port);
DECLARE_uint32(rtmp_read_buffer_size);
DECLARE_uint32(rtmp_max_read_buffer_size);
DECLARE_uint32(rtmp_read_chunk_size);
DECLARE_uint32(rtmp_chunk_size);
DECLARE_uint32(rtmp_window_ack_size);
DECLARE_uint32(rtmp_peer_bandwidth);
DECLARE_uint32(rtmp_peer_bandwidth_limit);
DECLARE_uint32(rtmp_max_chunk_streams);
DECLARE_uint32(rtmp_handshake_timeout_ms);
DECLARE_uint32(rtmp_idle_timeout_ms);
DECLARE_uint32(rtmp_flush_timeout_ms);
DECLARE_uint32(rtmp_event_channel_capacity);

namespace rtmpingest {
// Builds the session configuration from the command line flags.
Config configFromFlags();
}
