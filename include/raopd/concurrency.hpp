#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace raopd {

// Cancellation handle shared by the polling loops.
// sleep_for() wakes up early when cancel() is called.
class Cancellation {
public:
  void cancel();
  bool is_cancelled() const { return flag_.load(std::memory_order_relaxed); }

  // Returns true when the full duration elapsed, false when cancelled.
  bool sleep_for(std::chrono::milliseconds d) const;

private:
  std::atomic<bool> flag_{false};
  mutable std::mutex mtx_;
  mutable std::condition_variable cv_;
};

// Sleep helper for loops that may run without a cancellation handle.
bool sleep_or_cancel(std::chrono::milliseconds d, const Cancellation *cancel);

template <typename T>
struct ChannelState {
  std::mutex mtx;
  std::deque<T> q;
  bool sender_alive = true;
  bool receiver_alive = true;
};

// Producer end of an unbounded single-producer/single-consumer FIFO.
template <typename T>
class Sender {
public:
  explicit Sender(std::shared_ptr<ChannelState<T>> st) : st_(std::move(st)) {}
  Sender(Sender &&) noexcept = default;
  Sender &operator=(Sender &&) noexcept = default;
  ~Sender()
  {
    if (!st_) return;
    std::lock_guard<std::mutex> lk(st_->mtx);
    st_->sender_alive = false;
  }

  // false when the receiver has been dropped; the value is discarded
  bool send(T value)
  {
    std::lock_guard<std::mutex> lk(st_->mtx);
    if (!st_->receiver_alive) return false;
    st_->q.push_back(std::move(value));
    return true;
  }

private:
  std::shared_ptr<ChannelState<T>> st_;
};

// Consumer end. Never blocks.
template <typename T>
class Receiver {
public:
  explicit Receiver(std::shared_ptr<ChannelState<T>> st) : st_(std::move(st)) {}
  Receiver(Receiver &&) noexcept = default;
  Receiver &operator=(Receiver &&) noexcept = default;
  ~Receiver()
  {
    if (!st_) return;
    std::lock_guard<std::mutex> lk(st_->mtx);
    st_->receiver_alive = false;
    st_->q.clear();
  }

  std::optional<T> try_recv()
  {
    std::lock_guard<std::mutex> lk(st_->mtx);
    if (st_->q.empty()) return std::nullopt;
    T v = std::move(st_->q.front());
    st_->q.pop_front();
    return v;
  }

  std::size_t pending() const
  {
    std::lock_guard<std::mutex> lk(st_->mtx);
    return st_->q.size();
  }

  // Producer gone and nothing left to take
  bool disconnected() const
  {
    std::lock_guard<std::mutex> lk(st_->mtx);
    return !st_->sender_alive && st_->q.empty();
  }

private:
  std::shared_ptr<ChannelState<T>> st_;
};

template <typename T>
std::pair<Sender<T>, Receiver<T>> make_channel()
{
  auto st = std::make_shared<ChannelState<T>>();
  return {Sender<T>(st), Receiver<T>(st)};
}

} // namespace raopd
