#pragma once
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace util
{

// Fixed-capacity MPMC queue. close() wakes every waiter: pushes fail from then
// on, pops drain what is left and then return nullopt.
template <typename T>
class BoundedQueue
{
  public:
    explicit BoundedQueue(std::size_t capacity) : cap_(capacity ? capacity : 1) {}

    BoundedQueue(const BoundedQueue &)            = delete;
    BoundedQueue &operator=(const BoundedQueue &) = delete;

    // blocks while full; false if the queue was closed
    bool push(T v)
    {
        std::unique_lock<std::mutex> lk(mu_);
        not_full_.wait(lk, [&] { return closed_ || q_.size() < cap_; });
        if (closed_)
            return false;
        q_.push_back(std::move(v));
        lk.unlock();
        not_empty_.notify_one();
        return true;
    }

    // false on timeout or close; `v` is dropped either way
    template <typename Rep, typename Period>
    bool push_for(T v, std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lk(mu_);
        if (!not_full_.wait_for(lk, timeout, [&] { return closed_ || q_.size() < cap_; }))
            return false;
        if (closed_)
            return false;
        q_.push_back(std::move(v));
        lk.unlock();
        not_empty_.notify_one();
        return true;
    }

    std::optional<T> pop()
    {
        std::unique_lock<std::mutex> lk(mu_);
        not_empty_.wait(lk, [&] { return closed_ || !q_.empty(); });
        return take_locked(lk);
    }

    template <typename Rep, typename Period>
    std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout)
    {
        std::unique_lock<std::mutex> lk(mu_);
        not_empty_.wait_for(lk, timeout, [&] { return closed_ || !q_.empty(); });
        return take_locked(lk);
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lk(mu_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    bool closed() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return closed_;
    }

    std::size_t size() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return q_.size();
    }

    std::size_t capacity() const { return cap_; }

  private:
    std::optional<T> take_locked(std::unique_lock<std::mutex> &lk)
    {
        if (q_.empty())
            return std::nullopt;
        std::optional<T> v(std::move(q_.front()));
        q_.pop_front();
        lk.unlock();
        not_full_.notify_one();
        return v;
    }

    const std::size_t       cap_;
    mutable std::mutex      mu_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<T>           q_;
    bool                    closed_{false};
};

}  // namespace util
