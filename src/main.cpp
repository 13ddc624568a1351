#include <spdlog/spdlog.h>
#include "Server.hpp"
#include "Conf.hpp"
#include "Chunk.hpp"

static spdlog::level::level_enum logLevel(const std::string &name)
{
    spdlog::level::level_enum level = spdlog::level::from_str(name);
    // from_str maps unknown names to off
    if(level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

static bool validChunkSize(uint32_t size)
{
    return size > 0 && size <= rtmpingest::rtmp::MAX_CHUNK_SIZE;
}

int main(int argc, char **argv)
{
    gflags::SetUsageMessage("Usage: rtmpingest_server --flagfile=rtmpingest.conf\n");
    gflags::SetVersionString("1.0");
    google::ParseCommandLineFlags(&argc, &argv, true);
    spdlog::set_level(logLevel(FLAGS_log_level));

    int ret = 0;
    rtmpingest::Config config = rtmpingest::configFromFlags();
    if(!validChunkSize(config.initialReadChunkSize) || !validChunkSize(config.initialWriteChunkSize)) {
        SPDLOG_ERROR("Chunk sizes must be within 1..{}", rtmpingest::rtmp::MAX_CHUNK_SIZE);
        ret = 1;
    } else {
        try {
            rtmpingest::Server(config).run(FLAGS_rtmp_server_ip, static_cast<uint16_t>(FLAGS_rtmp_server_port));
        } catch(std::exception &e) {
            SPDLOG_ERROR("Server exception: {}", e.what());
            ret = 1;
        }
    }
    google::ShutDownCommandLineFlags();
    SPDLOG_INFO("Bye");
    spdlog::shutdown();
    return ret;
}
