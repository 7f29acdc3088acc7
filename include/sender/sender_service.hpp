#pragma once
#include <atomic>
#include <cstdint>
#include <set>
#include <string>
#include <thread>

#include "channel/ichannel.hpp"
#include "sender/scheduler.hpp"
#include "util/config.hpp"

namespace sender
{

enum class SendOutcome
{
    Completed,      // every selected part shown, end message displayed
    SourceError,    // cannot open, empty file, or read fault
    Cancelled,      // stop requested
    PresentFailed,  // presenter or encoder refused a unit
};

const char *send_outcome_name(SendOutcome o);

class SenderService
{
  public:
    SenderService(const util::Config       &cfg,
                  channel::ISymbolRenderer &renderer,
                  channel::IPresenter      &presenter);
    ~SenderService() { stop(); }

    SenderService(const SenderService &)            = delete;
    SenderService &operator=(const SenderService &) = delete;

    // Broadcast `path`; only parts in `selector` when one is given (remediation).
    // Blocks until done or until `cancel` becomes true.
    SendOutcome run(const std::string                &path,
                    const std::set<std::uint32_t>    *selector,
                    const std::atomic_bool           &cancel);

    // presenter-side count of units actually displayed
    std::size_t shown() const { return shown_; }

  private:
    void stop();

    util::Config              cfg_;
    channel::ISymbolRenderer &renderer_;
    channel::IPresenter      &presenter_;
    Handoff                   handoff_{1};
    std::thread               gen_thr_;
    ScheduleResult            result_{};
    std::size_t               shown_{0};
};

}  // namespace sender
