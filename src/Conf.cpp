#include "Conf.hpp"

DEFINE_string(log_level, "info", "log level (trace, debug, info, warn, error, critical, off)");

DEFINE_string(rtmp_server_ip, "0.0.0.0", "rtmp server ip address");
DEFINE_int32(rtmp_server_port, 1935, "rtmp server port");
DEFINE_uint32(rtmp_read_buffer_size, 8192, "rtmp socket read size");
DEFINE_uint32(rtmp_max_read_buffer_size, 1024 * 1024, "rtmp read buffer cap");
DEFINE_uint32(rtmp_read_chunk_size, 128, "rtmp initial inbound chunk size");
DEFINE_uint32(rtmp_chunk_size, 4096, "rtmp outbound chunk size announced on connect");
DEFINE_uint32(rtmp_window_ack_size, 2500000, "rtmp window acknowledgement size");
DEFINE_uint32(rtmp_peer_bandwidth, 2500000, "rtmp peer bandwidth");
DEFINE_uint32(rtmp_peer_bandwidth_limit, 2, "rtmp peer bandwidth limit type (0 hard, 1 soft, 2 dynamic)");
DEFINE_uint32(rtmp_max_chunk_streams, 1024, "rtmp chunk streams per connection");
DEFINE_uint32(rtmp_handshake_timeout_ms, 10000, "rtmp handshake timeout");
DEFINE_uint32(rtmp_idle_timeout_ms, 30000, "rtmp idle timeout before publishing");
DEFINE_uint32(rtmp_flush_timeout_ms, 1000, "rtmp best effort flush on close");
DEFINE_uint32(rtmp_event_channel_capacity, 256, "rtmp events buffered per session");

namespace rtmpingest {
Config configFromFlags()
{
    Config config;
    config.readBufferSize = FLAGS_rtmp_read_buffer_size;
    config.maxReadBufferSize = FLAGS_rtmp_max_read_buffer_size;
    config.initialReadChunkSize = FLAGS_rtmp_read_chunk_size;
    config.initialWriteChunkSize = FLAGS_rtmp_chunk_size;
    config.windowAckSize = FLAGS_rtmp_window_ack_size;
    config.peerBandwidth = FLAGS_rtmp_peer_bandwidth;
    config.peerBandwidthLimit = static_cast<uint8_t>(FLAGS_rtmp_peer_bandwidth_limit);
    config.maxChunkStreams = FLAGS_rtmp_max_chunk_streams;
    config.handshakeTimeout = std::chrono::milliseconds(FLAGS_rtmp_handshake_timeout_ms);
    config.idleTimeout = std::chrono::milliseconds(FLAGS_rtmp_idle_timeout_ms);
    config.flushTimeout = std::chrono::milliseconds(FLAGS_rtmp_flush_timeout_ms);
    config.outboundChannelCapacity = FLAGS_rtmp_event_channel_capacity;
    return config;
}
}
