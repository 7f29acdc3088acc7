#include <atomic>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <set>
#include <string>
#include <unistd.h>
#include <utility>
#include <vector>

#include "channel/line_channel.hpp"
#include "power/idle_inhibitor.hpp"
#include "sender/sender_service.hpp"
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

void install_signals()
{
    struct sigaction sa{};
    sa.sa_handler = on_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    // a closed reader shows up as a write error instead
    std::signal(SIGPIPE, SIG_IGN);
}

void print_usage()
{
    std::fprintf(stderr, "Usage:\n"
                         "  gapcast-send <file> [--remediate <missing_parts.json>] [--keep-awake]\n"
                         "\n"
                         "Broadcasts <file> as a series of symbols, one per line on stdout.\n"
                         "  --remediate <path>  only send the parts listed as missing\n"
                         "  --keep-awake        hold an idle inhibitor while broadcasting\n");
}

std::string join(const std::vector<std::uint32_t> &v)
{
    std::string out;
    for (std::size_t i = 0; i < v.size(); ++i)
    {
        if (i)
            out += ", ";
        out += std::to_string(v[i]);
    }
    return out;
}

}  // namespace

int main(int argc, char **argv)
{
    util::Config cfg = util::config_from_env();

    std::string file;
    std::string remediate;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--help" || a == "-h")
        {
            print_usage();
            return exitc::ok;
        }
        if (a == "--remediate" && i + 1 < argc)
            remediate = argv[++i];
        else if (a == "--keep-awake")
            cfg.keep_awake = true;
        else if (file.empty() && a.rfind("--", 0) != 0)
            file = std::move(a);
        else
        {
            std::fprintf(stderr, "error: unexpected argument: %s\n", a.c_str());
            print_usage();
            return exitc::bad_args;
        }
    }
    if (file.empty())
    {
        print_usage();
        return exitc::bad_args;
    }

    std::set<std::uint32_t> selector;
    if (!remediate.empty())
    {
        auto m = store::read_manifest(remediate);
        if (!m || m->missing.empty())
        {
            LOG_ERROR("Remediation file '%s' is empty or invalid.", remediate.c_str());
            return exitc::source_error;
        }
        const std::string base = std::filesystem::path(file).filename().string();
        if (!m->file_name.empty() && m->file_name != base)
            LOG_WARN("Manifest was written for '%s', sending '%s'", m->file_name.c_str(),
                     base.c_str());
        selector.insert(m->missing.begin(), m->missing.end());
        LOG_SYSTEM("--- REMEDIATION MODE ---");
        LOG_SYSTEM("Only sending %zu missing parts: [%s]", m->missing.size(),
                   join(m->missing).c_str());
    }

    install_signals();

    power::IdleInhibitor keep_awake("broadcasting a file");
    if (cfg.keep_awake && !keep_awake.start())
        LOG_WARN("Keep-awake feature requested but could not be started.");

    channel::LineRenderer  renderer;
    channel::LinePresenter presenter(STDOUT_FILENO);
    sender::SenderService  svc(cfg, renderer, presenter);
    const sender::SendOutcome out =
        svc.run(file, selector.empty() ? nullptr : &selector, g_cancel);

    keep_awake.stop();
    LOG_INFO("Closing application (%s).", sender::send_outcome_name(out));

    switch (out)
    {
        case sender::SendOutcome::Completed:
        case sender::SendOutcome::Cancelled:
            return exitc::ok;
        case sender::SendOutcome::SourceError:
            return exitc::source_error;
        case sender::SendOutcome::PresentFailed:
            return exitc::write_failed;
    }
    return exitc::ok;
}
