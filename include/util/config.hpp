#pragma once
#include <chrono>
#include <cstddef>
#include <string>

#include "util/constants.hpp"

namespace util
{

struct Config
{
    std::size_t               chunk_size            = constants::DEFAULT_CHUNK_SIZE;
    std::chrono::milliseconds stall_timeout         = std::chrono::seconds(5);
    unsigned                  grab_fps              = 20;  // over-samples a 10 fps broadcast
    std::size_t               frame_queue_capacity  = 1000;
    std::size_t               result_queue_capacity = 1000;
    unsigned                  decoder_count         = 1;  // see default_decoder_count()
    std::chrono::milliseconds poll_interval         = std::chrono::milliseconds(50);
    std::chrono::milliseconds frame_push_timeout    = std::chrono::milliseconds(500);
    std::chrono::milliseconds capture_retry_delay   = std::chrono::seconds(1);
    std::chrono::milliseconds display_interval      = std::chrono::milliseconds(100);
    std::string               output_dir            = ".";
    bool                      keep_awake            = false;
};

// hardware_concurrency(), at least 1
unsigned default_decoder_count();

// Defaults with the GAPCAST_* environment overlaid. Invalid values are
// reported and ignored.
Config config_from_env();

}  // namespace util
