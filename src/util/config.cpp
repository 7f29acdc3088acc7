#include <cstdlib>
#include <cstring>
#include <string>
#include <thread>

#include "util/config.hpp"
#include "util/log.hpp"

namespace util
{

static bool parse_ulong(const char *s, unsigned long lo, unsigned long hi, unsigned long &out)
{
    if (!s || !*s)
        return false;
    char         *p = nullptr;
    unsigned long v = std::strtoul(s, &p, 10);
    if (!p || *p != '\0' || v < lo || v > hi)
        return false;
    out = v;
    return true;
}

// read env var `key` as an integer in [lo, hi]; leaves `out` untouched otherwise
static void env_ulong(const char *key, unsigned long lo, unsigned long hi, unsigned long &out)
{
    const char *e = std::getenv(key);
    if (!e)
        return;
    unsigned long v = 0;
    if (parse_ulong(e, lo, hi, v))
    {
        out = v;
        LOG_INFO("Using %s=%lu", key, v);
    }
    else
    {
        LOG_WARN("Ignoring invalid %s='%s' (expect %lu..%lu)", key, e, lo, hi);
    }
}

unsigned default_decoder_count()
{
    const unsigned n = std::thread::hardware_concurrency();
    return n ? n : 1;
}

Config config_from_env()
{
    Config cfg;
    cfg.decoder_count = default_decoder_count();

    if (const char *lv = std::getenv("GAPCAST_LOG_LEVEL"))
        gapcast::set_log_level_by_name(lv);

    unsigned long v = cfg.chunk_size;
    env_ulong("GAPCAST_CHUNK_SIZE", 1, 1u << 20, v);
    cfg.chunk_size = static_cast<std::size_t>(v);

    v = static_cast<unsigned long>(cfg.stall_timeout.count());
    env_ulong("GAPCAST_STALL_TIMEOUT_MS", 100, 3600UL * 1000UL, v);
    cfg.stall_timeout = std::chrono::milliseconds(v);

    v = cfg.grab_fps;
    env_ulong("GAPCAST_GRAB_FPS", 1, 240, v);
    cfg.grab_fps = static_cast<unsigned>(v);

    v = cfg.decoder_count;
    env_ulong("GAPCAST_DECODERS", 1, 256, v);
    cfg.decoder_count = static_cast<unsigned>(v);

    v = cfg.frame_queue_capacity;
    env_ulong("GAPCAST_FRAME_QUEUE", 1, 100000, v);
    cfg.frame_queue_capacity = static_cast<std::size_t>(v);

    v = cfg.result_queue_capacity;
    env_ulong("GAPCAST_RESULT_QUEUE", 1, 100000, v);
    cfg.result_queue_capacity = static_cast<std::size_t>(v);

    v = static_cast<unsigned long>(cfg.display_interval.count());
    env_ulong("GAPCAST_DISPLAY_INTERVAL_MS", 1, 60UL * 1000UL, v);
    cfg.display_interval = std::chrono::milliseconds(v);

    if (const char *d = std::getenv("GAPCAST_OUTPUT_DIR"); d && *d)
        cfg.output_dir = d;

    if (const char *k = std::getenv("GAPCAST_KEEP_AWAKE"))
        cfg.keep_awake = (std::strcmp(k, "1") == 0);

    return cfg;
}

}  // namespace util
