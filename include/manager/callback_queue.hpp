#pragma once
#include <cstddef>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace manager
{

// Many producers (scanner, monitor, workers), one consumer draining on its own tick.
class CallbackQueue
{
  public:
    using Callback = std::function<void()>;

    void push(Callback cb)
    {
        std::lock_guard<std::mutex> lk(mu_);
        queue_.push_back(std::move(cb));
    }

    // Runs everything queued so far, in enqueue order, on the calling thread.
    // Callbacks queued while draining wait for the next drain.
    std::size_t drain()
    {
        std::vector<Callback> to_run;
        {
            std::lock_guard<std::mutex> lk(mu_);
            to_run.swap(queue_);
        }
        for (auto &cb : to_run)
        {
            if (cb)
                cb();
        }
        return to_run.size();
    }

    std::size_t pending() const
    {
        std::lock_guard<std::mutex> lk(mu_);
        return queue_.size();
    }

  private:
    mutable std::mutex    mu_;
    std::vector<Callback> queue_;
};

}  // namespace manager
