#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

#include "channel/line_channel.hpp"
#include "util/log.hpp"

namespace channel
{

// LineRenderer/LinePresenter: stand-ins for a symbol generator and a window,
// so the protocol can run over a pipe or a file.
bool LineRenderer::render(const std::string &text, Frame &out)
{
    if (text.empty() || text.find('\n') != std::string::npos)
        return false;
    out.assign(text.begin(), text.end());
    return true;
}

static bool write_all(int fd, const std::uint8_t *p, std::size_t n)
{
    while (n > 0)
    {
        ssize_t w = ::write(fd, p, n);
        if (w < 0)
        {
            if (errno == EINTR)
                continue;
            LOG_ERROR("write(fd=%d) failed: %s", fd, std::strerror(errno));
            return false;
        }
        p += w;
        n -= static_cast<std::size_t>(w);
    }
    return true;
}

bool LinePresenter::show(const RenderedUnit &unit)
{
    Frame line = unit.symbol;
    line.push_back('\n');
    return write_all(fd_, line.data(), line.size());
}

void LinePresenter::finish()
{
    LOG_SYSTEM("All parts sent.");
}

bool LineFrameSource::take_line(Frame &out)
{
    auto nl = buf_.find('\n');
    if (nl == std::string::npos)
        return false;
    std::string line = buf_.substr(0, nl);
    buf_.erase(0, nl + 1);
    if (!line.empty() && line.back() == '\r')
        line.pop_back();
    out.assign(line.begin(), line.end());
    return true;
}

CaptureStatus LineFrameSource::capture(Frame &out)
{
    if (take_line(out))
        return CaptureStatus::Ok;
    if (eof_)
    {
        // unterminated last line
        if (!buf_.empty())
        {
            out.assign(buf_.begin(), buf_.end());
            buf_.clear();
            return CaptureStatus::Ok;
        }
        return CaptureStatus::Closed;
    }

    pollfd pfd{};
    pfd.fd     = fd_;
    pfd.events = POLLIN;
    int r      = ::poll(&pfd, 1, static_cast<int>(wait_.count()));
    if (r == 0)
        return CaptureStatus::NoFrame;
    if (r < 0)
    {
        if (errno == EINTR)
            return CaptureStatus::NoFrame;
        LOG_WARN("poll(fd=%d) failed: %s", fd_, std::strerror(errno));
        return CaptureStatus::Fault;
    }

    char    tmp[4096];
    ssize_t n = ::read(fd_, tmp, sizeof(tmp));
    if (n < 0)
    {
        if (errno == EINTR || errno == EAGAIN)
            return CaptureStatus::NoFrame;
        LOG_WARN("read(fd=%d) failed: %s", fd_, std::strerror(errno));
        return CaptureStatus::Fault;
    }
    if (n == 0)
        eof_ = true;
    else
        buf_.append(tmp, static_cast<std::size_t>(n));

    if (take_line(out))
        return CaptureStatus::Ok;
    if (eof_ && !buf_.empty())
    {
        out.assign(buf_.begin(), buf_.end());
        buf_.clear();
        return CaptureStatus::Ok;
    }
    return eof_ ? CaptureStatus::Closed : CaptureStatus::NoFrame;
}

std::vector<std::string> LineDecoder::decode(const Frame &frame)
{
    if (frame.empty())
        return {};
    return {std::string(frame.begin(), frame.end())};
}

}  // namespace channel
