#ifndef MCPVISOR_EVENT_LOOP_HPP
#define MCPVISOR_EVENT_LOOP_HPP

// Single-threaded event loop built on poll(2).
// All I/O readiness and timers of the runtime are delivered from here; callbacks run to
// completion one at a time, so state shared between callbacks needs no locking.

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>

namespace event_loop {

using Clock = std::chrono::steady_clock;
using TimerId = std::uint64_t;
using TimerCallback = std::function<void()>;

// Receives the poll(2) revents bits for the watched descriptor.
using IoCallback = std::function<void(short revents)>;

// Timer ids start at 1; zero marks "no timer".
constexpr TimerId INVALID_TIMER = 0;

class EventLoop {
public:
    EventLoop() = default;
    EventLoop(const EventLoop &) = delete;
    EventLoop &operator=(const EventLoop &) = delete;

    // One-shot timer. A zero delay fires on the next iteration.
    TimerId schedule_timer(std::chrono::milliseconds delay, TimerCallback callback);

    // Repeating timer, first firing after one period.
    TimerId schedule_interval(std::chrono::milliseconds period, TimerCallback callback);

    // Returns false if the timer already fired (one-shot) or was cancelled.
    bool cancel_timer(TimerId timer_id);

    bool has_timer(TimerId timer_id) const;

    // Watch a descriptor for the given poll events (POLLIN, POLLOUT). Replaces any previous
    // watch on the same descriptor. Error and hang-up conditions are always reported.
    void watch_fd(int fd, short events, IoCallback callback);

    void unwatch_fd(int fd);

    bool is_watched(int fd) const;

    // Waits at most max_wait for I/O or the next timer, then dispatches what is ready.
    // Returns false without waiting when there is nothing to wait for.
    bool run_once(std::chrono::milliseconds max_wait = std::chrono::milliseconds(1000));

    // Runs until done() returns true. Throws std::logic_error if the loop runs out of
    // timers and descriptors before that, since done() could then never change.
    void run_until(const std::function<bool()> &done);

    // Runs for the given duration (or until stop()).
    void run_for(std::chrono::milliseconds duration);

    // Runs until stop() is called or no work remains.
    void run();

    // Makes run() / run_for() return after the current callback.
    void stop();

    bool has_pending_work() const;

    std::size_t timer_count() const { return timers_.size(); }
    std::size_t watch_count() const { return watches_.size(); }

    static Clock::time_point now() { return Clock::now(); }

private:
    struct Timer {
        Clock::time_point due;
        std::chrono::milliseconds period{0};
        bool repeating = false;
        TimerCallback callback;
    };

    struct Watch {
        short events = 0;
        IoCallback callback;
    };

    TimerId add_timer(std::chrono::milliseconds delay, std::chrono::milliseconds period,
                      bool repeating, TimerCallback callback);
    void fire_due_timers();

    TimerId next_timer_id_ = 1;
    std::map<TimerId, Timer> timers_;
    std::map<int, Watch> watches_;
    bool stop_requested_ = false;
};

} // namespace event_loop

#endif // MCPVISOR_EVENT_LOOP_HPP
