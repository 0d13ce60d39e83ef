#include "raopd/concurrency.hpp"

#include <thread>

namespace raopd {

void Cancellation::cancel()
{
    {
        std::lock_guard<std::mutex> lk(mtx_);
        flag_.store(true, std::memory_order_relaxed);
    }
    cv_.notify_all();
}

bool Cancellation::sleep_for(std::chrono::milliseconds d) const
{
    std::unique_lock<std::mutex> lk(mtx_);
    return !cv_.wait_for(lk, d, [&]{ return flag_.load(std::memory_order_relaxed); });
}

bool sleep_or_cancel(std::chrono::milliseconds d, const Cancellation *cancel)
{
    if (cancel) return cancel->sleep_for(d);
    std::this_thread::sleep_for(d);
    return true;
}

} // namespace raopd
