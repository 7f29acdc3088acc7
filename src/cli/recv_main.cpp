#include <atomic>
#include <csignal>
#include <cstdio>
#include <memory>
#include <string>
#include <unistd.h>

#include "channel/line_channel.hpp"
#include "power/idle_inhibitor.hpp"
#include "receiver/receiver_service.hpp"
#include "store/draft_store.hpp"
#include "util/config.hpp"
#include "util/exitcodes.hpp"
#include "util/log.hpp"

namespace
{

std::atomic_bool g_cancel{false};

void on_signal(int)
{
    g_cancel.store(true);
}

void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  gapcast-recv [--keep-awake]\n"
                         "\n"
                         "Reads symbols (one per line) from stdin and rebuilds the file.\n"
                         "Ctrl+C, or no new part within the stall timeout, saves a draft\n"
                         "and a missing-parts manifest for a remediation run.\n");
}

}  // namespace

int main(int argc, char **argv)
{
    util::Config cfg = util::config_from_env();

    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--keep-awake")
        {
            cfg.keep_awake = true;
            continue;
        }
        std::fprintf(stderr, "error: unexpected argument: %s\n", a.c_str());
        print_usage();
        return exitc::bad_args;
    }

    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    power::IdleInhibitor keep_awake("scanning for a file");
    if (cfg.keep_awake && !keep_awake.start())
        LOG_WARN("Keep-awake feature requested but could not be started.");

    channel::LineFrameSource source(STDIN_FILENO, cfg.poll_interval);
    store::DraftStore        drafts(cfg.output_dir, cfg.chunk_size);
    receiver::ReceiverService svc(
        cfg, source, [] { return std::make_unique<channel::LineDecoder>(); }, drafts);

    const receiver::Outcome out = svc.run(g_cancel);

    keep_awake.stop();
    LOG_INFO("Receiver terminated (%s).", receiver::outcome_name(out));

    switch (out)
    {
        case receiver::Outcome::Restored:
            return exitc::ok;
        case receiver::Outcome::DraftSaved:
            return exitc::partial;
        case receiver::Outcome::NothingReceived:
            return exitc::nothing;
        case receiver::Outcome::WriteFailed:
            return exitc::write_failed;
    }
    return exitc::ok;
}
