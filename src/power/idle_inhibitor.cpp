#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include "power/idle_inhibitor.hpp"
#include "util/log.hpp"

#if GAPCAST_HAVE_SDBUS
#include <systemd/sd-bus.h>
#endif

namespace power
{

bool IdleInhibitor::start()
{
    if (active())
        return true;
#if !GAPCAST_HAVE_SDBUS
    LOG_WARN("Keep-awake requested but sd-bus is not available (GAPCAST_HAVE_SDBUS=0)");
    return false;
#else
    sd_bus *bus = nullptr;
    int     r   = sd_bus_open_system(&bus);
    if (r < 0 || !bus)
    {
        LOG_WARN("Keep-awake unavailable: cannot connect system bus: %s", std::strerror(-r));
        return false;
    }

    sd_bus_error    err{};
    sd_bus_message *rep = nullptr;
    r = sd_bus_call_method(bus, "org.freedesktop.login1", "/org/freedesktop/login1",
                           "org.freedesktop.login1.Manager", "Inhibit", &err, &rep, "ssss",
                           "idle:sleep", "gapcast", why_.c_str(), "block");
    if (r < 0)
    {
        LOG_WARN("Keep-awake unavailable: Inhibit failed: %s",
                 err.message ? err.message : std::strerror(-r));
        sd_bus_error_free(&err);
        sd_bus_unref(bus);
        return false;
    }
    sd_bus_error_free(&err);

    int fd = -1;
    r      = sd_bus_message_read(rep, "h", &fd);
    if (r >= 0 && fd >= 0)
    {
        // the message owns `fd`; keep our own copy past its unref
        fd_ = ::fcntl(fd, F_DUPFD_CLOEXEC, 3);
    }
    sd_bus_message_unref(rep);
    sd_bus_unref(bus);

    if (fd_ < 0)
    {
        LOG_WARN("Keep-awake unavailable: no inhibitor descriptor returned");
        return false;
    }
    LOG_INFO("Keep-awake enabled (logind idle:sleep inhibitor held).");
    return true;
#endif
}

void IdleInhibitor::stop()
{
    if (fd_ < 0)
        return;
    ::close(fd_);
    fd_ = -1;
    LOG_INFO("Keep-awake released.");
}

}  // namespace power
