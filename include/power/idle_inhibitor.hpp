#pragma once
#include <string>
#include <utility>

namespace power
{

// Keeps the display from blanking while a broadcast or a scan is running, by
// holding a logind "idle:sleep" inhibitor lock for the lifetime of start()..stop().
class IdleInhibitor
{
  public:
    explicit IdleInhibitor(std::string why = "file transfer in progress")
        : why_(std::move(why))
    {
    }
    ~IdleInhibitor() { stop(); }

    IdleInhibitor(const IdleInhibitor &)            = delete;
    IdleInhibitor &operator=(const IdleInhibitor &) = delete;

    // false (and a warning) when logind or sd-bus is unavailable
    bool start();
    void stop();
    bool active() const { return fd_ >= 0; }

  private:
    std::string why_;
    int         fd_{-1};  // the lock lives as long as this descriptor
};

}  // namespace power
