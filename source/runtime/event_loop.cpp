#include "runtime/event_loop.hpp"
#include "utils/debug_log.hpp"

#include <poll.h>
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace event_loop {

TimerId EventLoop::schedule_timer(std::chrono::milliseconds delay, TimerCallback callback) {
    return add_timer(delay, std::chrono::milliseconds(0), false, std::move(callback));
}

TimerId EventLoop::schedule_interval(std::chrono::milliseconds period, TimerCallback callback) {
    if (period.count() <= 0) {
        throw std::invalid_argument("Interval period must be positive");
    }
    return add_timer(period, period, true, std::move(callback));
}

TimerId EventLoop::add_timer(std::chrono::milliseconds delay, std::chrono::milliseconds period,
                             bool repeating, TimerCallback callback) {
    if (delay.count() < 0) {
        delay = std::chrono::milliseconds(0);
    }
    TimerId timer_id = next_timer_id_++;
    Timer timer;
    timer.due = now() + delay;
    timer.period = period;
    timer.repeating = repeating;
    timer.callback = std::move(callback);
    timers_.emplace(timer_id, std::move(timer));
    return timer_id;
}

bool EventLoop::cancel_timer(TimerId timer_id) {
    return timers_.erase(timer_id) > 0;
}

bool EventLoop::has_timer(TimerId timer_id) const {
    return timers_.count(timer_id) > 0;
}

void EventLoop::watch_fd(int fd, short events, IoCallback callback) {
    Watch watch;
    watch.events = events;
    watch.callback = std::move(callback);
    watches_[fd] = std::move(watch);
}

void EventLoop::unwatch_fd(int fd) {
    watches_.erase(fd);
}

bool EventLoop::is_watched(int fd) const {
    return watches_.count(fd) > 0;
}

bool EventLoop::has_pending_work() const {
    return !timers_.empty() || !watches_.empty();
}

void EventLoop::stop() {
    stop_requested_ = true;
}

// Fires every timer whose due time has passed, earliest first. Timers scheduled by these
// callbacks wait for the next iteration, even with a zero delay.
void EventLoop::fire_due_timers() {
    Clock::time_point current = now();
    std::vector<std::pair<Clock::time_point, TimerId>> due;
    for (const auto &entry : timers_) {
        if (entry.second.due <= current) {
            due.emplace_back(entry.second.due, entry.first);
        }
    }
    std::sort(due.begin(), due.end());

    for (const auto &item : due) {
        auto it = timers_.find(item.second);
        if (it == timers_.end()) {
            continue; // Cancelled by an earlier callback.
        }
        TimerCallback callback = it->second.callback;
        if (it->second.repeating) {
            it->second.due = current + it->second.period;
        } else {
            timers_.erase(it);
        }
        callback();
    }
}

bool EventLoop::run_once(std::chrono::milliseconds max_wait) {
    if (!has_pending_work()) {
        return false;
    }

    auto wait = max_wait;
    if (!timers_.empty()) {
        Clock::time_point earliest = Clock::time_point::max();
        for (const auto &entry : timers_) {
            earliest = std::min(earliest, entry.second.due);
        }
        auto until_due = std::chrono::duration_cast<std::chrono::milliseconds>(earliest - now());
        // Round up so a timer is not polled for a few microseconds early.
        if (earliest > now() + until_due) {
            until_due += std::chrono::milliseconds(1);
        }
        wait = std::max(std::chrono::milliseconds(0), std::min(wait, until_due));
    }

    std::vector<pollfd> descriptors;
    descriptors.reserve(watches_.size());
    for (const auto &entry : watches_) {
        pollfd descriptor{};
        descriptor.fd = entry.first;
        descriptor.events = entry.second.events;
        descriptors.push_back(descriptor);
    }

    int ready = ::poll(descriptors.empty() ? nullptr : descriptors.data(),
                       static_cast<nfds_t>(descriptors.size()), static_cast<int>(wait.count()));
    if (ready < 0) {
        if (errno != EINTR) {
            debug_log::warn(std::string("poll failed: ") + std::strerror(errno));
        }
        return true;
    }

    for (const auto &descriptor : descriptors) {
        if (descriptor.revents == 0) {
            continue;
        }
        // An earlier callback may have removed or replaced this watch.
        auto it = watches_.find(descriptor.fd);
        if (it == watches_.end()) {
            continue;
        }
        IoCallback callback = it->second.callback;
        callback(descriptor.revents);
    }

    fire_due_timers();
    return true;
}

void EventLoop::run_until(const std::function<bool()> &done) {
    while (!done()) {
        if (!run_once()) {
            throw std::logic_error("Event loop ran out of work before the awaited condition was met");
        }
    }
}

void EventLoop::run_for(std::chrono::milliseconds duration) {
    stop_requested_ = false;
    Clock::time_point deadline = now() + duration;
    while (!stop_requested_) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now());
        if (remaining.count() <= 0) {
            break;
        }
        if (!run_once(remaining)) {
            std::this_thread::sleep_for(remaining);
            break;
        }
    }
}

void EventLoop::run() {
    stop_requested_ = false;
    while (!stop_requested_ && run_once()) {
    }
}

} // namespace event_loop
