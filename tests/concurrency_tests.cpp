#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>

#include "raopd/concurrency.hpp"

using namespace raopd;

static void assert_true(bool cond, std::string_view msg)
{
    if (!cond)
    {
        std::cerr << "ASSERT FAILED: " << msg << std::endl;
        std::exit(1);
    }
}

static void test_channel_fifo()
{
    auto [tx, rx] = make_channel<int>();
    assert_true(!rx.try_recv().has_value(), "empty channel yields nothing");
    for (int i = 0; i < 5; ++i) assert_true(tx.send(i), "send while receiver alive");
    assert_true(rx.pending() == 5, "five pending");
    for (int i = 0; i < 5; ++i)
    {
        auto v = rx.try_recv();
        assert_true(v && *v == i, "FIFO order");
    }
    assert_true(!rx.try_recv().has_value(), "drained");
}

static void test_send_fails_after_receiver_dropped()
{
    auto channel = make_channel<std::string>();
    Sender<std::string> tx = std::move(channel.first);
    assert_true(tx.send("queued"), "first send ok");
    {
        Receiver<std::string> rx = std::move(channel.second);
    }
    assert_true(!tx.send("late"), "send reports closed channel");
}

static void test_disconnected_after_drain()
{
    auto channel = make_channel<int>();
    Receiver<int> rx = std::move(channel.second);
    {
        Sender<int> tx = std::move(channel.first);
        (void) tx.send(1);
    }
    assert_true(!rx.disconnected(), "item still pending");
    assert_true(rx.try_recv().has_value(), "pending item survives the sender");
    assert_true(rx.disconnected(), "disconnected once drained");
}

static void test_threaded_producer()
{
    auto channel = make_channel<int>();
    Receiver<int> rx = std::move(channel.second);
    std::thread producer([tx = std::move(channel.first)]() mutable
    {
        for (int i = 0; i < 1000; ++i) (void) tx.send(i);
    });

    int expected = 0;
    bool ordered = true;
    while (!rx.disconnected())
    {
        auto v = rx.try_recv();
        if (!v)
        {
            std::this_thread::yield();
            continue;
        }
        if (*v != expected) ordered = false;
        ++expected;
    }
    producer.join();
    assert_true(ordered, "values arrive in send order");
    assert_true(expected == 1000, "all values received");
}

static void test_cancellation_wakes_sleeper()
{
    using namespace std::chrono;
    Cancellation cancel;
    std::atomic<bool> full{true};
    auto t0 = steady_clock::now();
    std::thread sleeper([&] { full = cancel.sleep_for(seconds(10)); });
    std::this_thread::sleep_for(milliseconds(20));
    cancel.cancel();
    sleeper.join();
    auto dt = duration_cast<milliseconds>(steady_clock::now() - t0);
    assert_true(!full.load(), "sleep reports cancellation");
    assert_true(dt.count() < 5000, "woken well before the timeout");
    assert_true(cancel.is_cancelled(), "flag set");
    assert_true(!cancel.sleep_for(milliseconds(100)), "already cancelled returns at once");
}

static void test_sleep_or_cancel()
{
    using namespace std::chrono;
    assert_true(sleep_or_cancel(milliseconds(1), nullptr), "no handle sleeps fully");
    Cancellation live;
    assert_true(sleep_or_cancel(milliseconds(1), &live), "live handle sleeps fully");
    Cancellation done;
    done.cancel();
    assert_true(!sleep_or_cancel(milliseconds(1000), &done), "cancelled handle returns false");
}

int main()
{
    test_channel_fifo();
    test_send_fails_after_receiver_dropped();
    test_disconnected_after_drain();
    test_threaded_producer();
    test_cancellation_wakes_sleeper();
    test_sleep_or_cancel();

    std::cout << "concurrency tests: OK" << std::endl;
    return 0;
}
