#include "host/process_supervisor.hpp"
#include "platform/platform_abi.hpp"
#include "protocol/json_rpc.hpp"
#include "utils/debug_log.hpp"
#include "utils/text_excerpt.hpp"

#include <poll.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <regex>
#include <utility>

namespace process_supervisor {

static constexpr std::size_t READ_CHUNK_BYTES = 65536;
static constexpr std::chrono::milliseconds REAP_POLL_INTERVAL{10};

static const std::regex METHOD_NOT_FOUND_PATTERN("method\\s+not\\s+found", std::regex::icase);
static const std::regex NOT_INITIALIZED_PATTERN("initializ", std::regex::icase);

const char *state_name(State state) {
    switch (state) {
    case State::stopped:
        return "stopped";
    case State::starting:
        return "starting";
    case State::awaiting_handshake:
        return "awaiting_handshake";
    case State::ready:
        return "ready";
    case State::crashed:
        return "crashed";
    }
    return "unknown";
}

json RpcError::to_json() const {
    json result;
    result["code"] = code.has_value() ? json(*code) : json(nullptr);
    result["message"] = message;
    if (!data.is_null()) {
        result["data"] = data;
    }
    return result;
}

RpcOutcome RpcOutcome::ok(json result) {
    RpcOutcome outcome;
    outcome.success = true;
    outcome.result = std::move(result);
    return outcome;
}

RpcOutcome RpcOutcome::failure(RpcError error) {
    RpcOutcome outcome;
    outcome.success = false;
    outcome.error = std::move(error);
    return outcome;
}

RpcException::RpcException(RpcError error) : std::runtime_error(error.message), error_(std::move(error)) {}

static RpcError local_error(const std::string &message) {
    RpcError error;
    error.message = message;
    return error;
}

Supervisor::Supervisor(event_loop::EventLoop &loop, server_config::ServerConfig config,
                       server_config::SupervisorOptions options)
    : loop_(loop), config_(std::move(config)), options_(std::move(options)) {}

Supervisor::~Supervisor() {
    // Nothing may outlive the supervisor on the loop, so the child is reaped in place.
    reap_in_place_ = true;
    stop();
}

std::string Supervisor::label() const {
    return "MCP \"" + config_.name + "\"";
}

void Supervisor::start() {
    if (is_running()) {
        return;
    }

    state_ = State::starting;
    platform::SpawnOptions spawn_options;
    spawn_options.executable = config_.command;
    spawn_options.arguments = config_.args;
    spawn_options.working_directory = config_.cwd;
    spawn_options.environment = config_.env;

    platform::PipedSpawnResult spawned = platform::spawn_piped_process(spawn_options);
    if (!spawned.success) {
        state_ = State::crashed;
        debug_log::error(label() + " " + spawned.error_message);
        throw SupervisorError(label() + " " + spawned.error_message);
    }

    process_id_ = spawned.process_id;
    stdin_fd_ = spawned.stdin_fd;
    stdout_fd_ = spawned.stdout_fd;
    platform::set_nonblocking(stdin_fd_);
    platform::set_nonblocking(stdout_fd_);

    ++spawn_count_;
    ++generation_;
    next_id_ = 1;
    decoder_ = framing::FrameDecoder();
    write_buffer_.clear();
    handshaken_ = false;
    state_ = State::awaiting_handshake;

    loop_.watch_fd(stdout_fd_, POLLIN, [this](short revents) { on_stdout_readable(revents); });
    touch();

    std::string command_text = config_.command;
    for (const auto &argument : config_.args) {
        command_text += " " + argument;
    }
    debug_log::info("Spawned " + label() + " pid=" + std::to_string(process_id_) + ": " + command_text);
}

void Supervisor::stop() {
    if (!is_running() && pending_.empty() && !barrier_) {
        state_ = State::stopped;
        return;
    }
    debug_log::info("Stopping " + label() + " (" + state_name(state_) + ")");
    teardown(State::stopped, "stopped");
}

// Releases the process and everything tied to it, then fails the handshake waiters and
// pending requests. Callbacks run last, from local copies, so they may restart the
// supervisor or destroy it.
void Supervisor::teardown(State next_state, const std::string &reason) {
    int process_id = process_id_;

    if (stdout_fd_ >= 0 && loop_.is_watched(stdout_fd_)) {
        loop_.unwatch_fd(stdout_fd_);
    }
    if (stdin_fd_ >= 0 && loop_.is_watched(stdin_fd_)) {
        loop_.unwatch_fd(stdin_fd_);
    }
    platform::close_descriptor(stdin_fd_);
    platform::close_descriptor(stdout_fd_);
    process_id_ = -1;

    if (process_id > 0) {
        release_process(process_id, next_state == State::crashed, reason);
    }

    if (idle_timer_ != event_loop::INVALID_TIMER) {
        loop_.cancel_timer(idle_timer_);
        idle_timer_ = event_loop::INVALID_TIMER;
    }
    if (probe_timer_ != event_loop::INVALID_TIMER) {
        loop_.cancel_timer(probe_timer_);
        probe_timer_ = event_loop::INVALID_TIMER;
    }

    std::map<std::uint64_t, PendingRequest> pending = std::move(pending_);
    pending_.clear();
    std::shared_ptr<Barrier> barrier = std::move(barrier_);
    barrier_.reset();
    for (auto &entry : pending) {
        loop_.cancel_timer(entry.second.timer);
    }

    ++generation_;
    handshaken_ = false;
    decoder_ = framing::FrameDecoder();
    write_buffer_.clear();
    state_ = next_state;

    RpcError error = local_error(label() + " process exited");
    if (barrier) {
        for (auto &waiter : barrier->waiters) {
            waiter(&error);
        }
    }
    for (auto &entry : pending) {
        if (entry.second.callback) {
            entry.second.callback(RpcOutcome::failure(error));
        }
    }
}

// Reaps the child from loop timers: SIGTERM now, SIGKILL once the grace period has passed.
void Supervisor::release_process(int process_id, bool crashed, const std::string &reason) {
    std::string prefix = crashed ? label() + " exited (" + reason + ")" : label() + " " + reason;
    auto report_exit = [crashed, prefix](const platform::ExitStatus &status) {
        if (crashed) {
            debug_log::warn(prefix + " " + status.describe());
        } else {
            debug_log::log(prefix + " " + status.describe());
        }
    };

    platform::ExitStatus status;
    if (platform::try_reap_process(process_id, status)) {
        report_exit(status);
        return;
    }
    if (reap_in_place_) {
        report_exit(platform::terminate_process(process_id, options_.stop_grace));
        return;
    }

    platform::request_termination(process_id);
    struct Reaper {
        event_loop::TimerId timer = event_loop::INVALID_TIMER;
        event_loop::Clock::time_point kill_at;
        bool killed = false;
    };
    auto reaper = std::make_shared<Reaper>();
    reaper->kill_at = event_loop::EventLoop::now() + options_.stop_grace;
    event_loop::EventLoop &loop = loop_;
    reaper->timer = loop.schedule_interval(REAP_POLL_INTERVAL, [&loop, reaper, process_id, report_exit]() {
        platform::ExitStatus exit_status;
        if (platform::try_reap_process(process_id, exit_status)) {
            loop.cancel_timer(reaper->timer);
            report_exit(exit_status);
            return;
        }
        if (!reaper->killed && event_loop::EventLoop::now() >= reaper->kill_at) {
            reaper->killed = true;
            platform::force_termination(process_id);
        }
    });
}

void Supervisor::touch() {
    last_used_ = event_loop::EventLoop::now();
    arm_idle_timer(options_.idle_ttl + std::chrono::milliseconds(1));
}

// One-shot check, re-armed on every use, so shutdown follows the last use by idle_ttl.
void Supervisor::arm_idle_timer(std::chrono::milliseconds delay) {
    if (idle_timer_ != event_loop::INVALID_TIMER) {
        loop_.cancel_timer(idle_timer_);
        idle_timer_ = event_loop::INVALID_TIMER;
    }
    if (options_.idle_ttl.count() <= 0 || !is_running()) {
        return;
    }
    idle_timer_ = loop_.schedule_timer(delay, [this]() {
        idle_timer_ = event_loop::INVALID_TIMER;
        check_idle();
    });
}

void Supervisor::check_idle() {
    if (!is_running()) {
        return;
    }
    // Pending requests and a handshake still waiting on its probes count as use.
    if (!pending_.empty() || barrier_) {
        arm_idle_timer(options_.idle_ttl);
        return;
    }
    auto idle_for = std::chrono::duration_cast<std::chrono::milliseconds>(event_loop::EventLoop::now() - last_used_);
    if (idle_for <= options_.idle_ttl) {
        arm_idle_timer(options_.idle_ttl - idle_for + std::chrono::milliseconds(1));
        return;
    }
    debug_log::info(label() + " idle for more than " + std::to_string(options_.idle_ttl.count()) +
                    " ms; stopping");
    teardown(State::stopped, "idle shutdown");
}

void Supervisor::rpc(const std::string &method, const json &params, RpcCallback callback) {
    rpc(method, params, options_.request_timeout, std::move(callback));
}

void Supervisor::rpc(const std::string &method, const json &params, std::chrono::milliseconds timeout,
                     RpcCallback callback) {
    try {
        start();
    } catch (const SupervisorError &error) {
        callback(RpcOutcome::failure(local_error(error.what())));
        return;
    }
    touch();

    if (method == "initialize" || handshaken_) {
        send_request(method, params, timeout, std::move(callback));
        return;
    }

    await_handshake([this, method, params, timeout, callback](const RpcError *failure) {
        if (failure != nullptr) {
            callback(RpcOutcome::failure(*failure));
            return;
        }
        send_request(method, params, timeout, callback);
    });
}

void Supervisor::notify(const std::string &method, const json &params) {
    start();
    touch();
    write_message(json_rpc::build_notification(method, params));
}

void Supervisor::ensure_ready(RpcCallback callback) {
    try {
        start();
    } catch (const SupervisorError &error) {
        callback(RpcOutcome::failure(local_error(error.what())));
        return;
    }
    touch();

    await_handshake([this, callback](const RpcError *failure) {
        if (failure != nullptr) {
            callback(RpcOutcome::failure(*failure));
            return;
        }
        send_request("tools/list", json::object(), options_.ensure_ready_probe_timeout,
                     [this, callback](const RpcOutcome &outcome) {
                         if (!outcome.success) {
                             debug_log::log(label() + " readiness probe failed (ignored): " + outcome.error.message);
                             callback(RpcOutcome::ok(nullptr));
                             return;
                         }
                         callback(RpcOutcome::ok(outcome.result));
                     });
    });
}

void Supervisor::await_handshake(BarrierWaiter waiter) {
    if (handshaken_) {
        waiter(nullptr);
        return;
    }
    if (barrier_ && barrier_->generation == generation_) {
        barrier_->waiters.push_back(std::move(waiter));
        return;
    }
    barrier_ = std::make_shared<Barrier>();
    barrier_->generation = generation_;
    barrier_->waiters.push_back(std::move(waiter));
    begin_handshake();
}

// initialize -> notifications/initialized -> tools/list probes.
void Supervisor::begin_handshake() {
    std::uint64_t generation = generation_;
    debug_log::log(label() + " handshake starting");

    json client_info;
    client_info["name"] = options_.client_name;
    client_info["version"] = options_.client_version;

    json params;
    params["protocolVersion"] = options_.protocol_version;
    params["capabilities"] = json::object();
    params["clientInfo"] = client_info;

    send_request("initialize", params, options_.initialize_timeout, [this, generation](const RpcOutcome &outcome) {
        if (generation != generation_) {
            return;
        }
        if (!outcome.success) {
            bool method_missing = outcome.error.code.has_value() && *outcome.error.code == json_rpc::METHOD_NOT_FOUND;
            if (!method_missing && !std::regex_search(outcome.error.message, METHOD_NOT_FOUND_PATTERN)) {
                debug_log::warn(label() + " initialize failed: " + outcome.error.message);
                complete_handshake(generation, &outcome.error);
                return;
            }
            debug_log::log(label() + " has no initialize method; continuing without it");
        }

        notify("notifications/initialized", json::object());
        probe_tools_list(generation, 1, options_.probe_initial_delay);
    });
}

// Each probe waits its delay first. A failure mentioning initialization retries with a
// longer delay; any other outcome, or running out of attempts, completes the handshake.
void Supervisor::probe_tools_list(std::uint64_t generation, int attempt, std::chrono::milliseconds delay) {
    if (generation != generation_) {
        return;
    }
    probe_timer_ = loop_.schedule_timer(delay, [this, generation, attempt, delay]() {
        probe_timer_ = event_loop::INVALID_TIMER;
        if (generation != generation_) {
            return;
        }
        send_request("tools/list", json::object(), options_.probe_timeout,
                     [this, generation, attempt, delay](const RpcOutcome &outcome) {
                         if (generation != generation_) {
                             return;
                         }
                         ++probe_count_;
                         if (outcome.success) {
                             complete_handshake(generation, nullptr);
                             return;
                         }
                         bool retryable = std::regex_search(outcome.error.message, NOT_INITIALIZED_PATTERN);
                         if (!retryable || attempt >= options_.probe_attempts) {
                             debug_log::log(label() + " tools/list probe gave up (attempt " +
                                            std::to_string(attempt) + "): " + outcome.error.message);
                             complete_handshake(generation, nullptr);
                             return;
                         }
                         auto next_delay = std::chrono::milliseconds(std::llround(
                             static_cast<double>(delay.count()) * options_.probe_backoff_factor));
                         next_delay = std::min(next_delay, options_.probe_max_delay);
                         debug_log::log(label() + " not initialized yet; retrying tools/list in " +
                                        std::to_string(next_delay.count()) + " ms");
                         probe_tools_list(generation, attempt + 1, next_delay);
                     });
    });
}

void Supervisor::complete_handshake(std::uint64_t generation, const RpcError *failure) {
    if (!barrier_ || barrier_->generation != generation) {
        return;
    }
    std::shared_ptr<Barrier> barrier = std::move(barrier_);
    barrier_.reset();

    if (failure == nullptr) {
        handshaken_ = true;
        state_ = State::ready;
        debug_log::log(label() + " ready");
    }
    // On failure the process stays un-handshaken so the next call retries the handshake.
    RpcError error_copy;
    if (failure != nullptr) {
        error_copy = *failure;
    }
    for (auto &waiter : barrier->waiters) {
        waiter(failure != nullptr ? &error_copy : nullptr);
    }
}

void Supervisor::send_request(const std::string &method, const json &params, std::chrono::milliseconds timeout,
                              RpcCallback callback) {
    if (!is_running()) {
        callback(RpcOutcome::failure(local_error(label() + " process exited")));
        return;
    }

    std::uint64_t request_id = next_id_++;
    PendingRequest pending;
    pending.method = method;
    pending.callback = std::move(callback);
    if (timeout.count() > 0) {
        long long timeout_ms = static_cast<long long>(timeout.count());
        pending.timer = loop_.schedule_timer(timeout, [this, request_id, method, timeout_ms]() {
            auto it = pending_.find(request_id);
            if (it == pending_.end()) {
                return;
            }
            RpcCallback expired = std::move(it->second.callback);
            pending_.erase(it);
            debug_log::warn(label() + " request " + std::to_string(request_id) + " (" + method + ") timed out");
            expired(RpcOutcome::failure(local_error(label() + " request timeout (" + std::to_string(timeout_ms) +
                                                    "ms): " + method)));
        });
    }
    pending_.emplace(request_id, std::move(pending));

    write_message(json_rpc::build_request(request_id, method, params));
}

void Supervisor::write_message(const json &message) {
    if (stdin_fd_ < 0) {
        return;
    }
    std::string encoded = framing::encode_message(message, config_.framing);
    if (debug_log::is_debug_enabled()) {
        debug_log::log("[tx " + config_.name + "] " + text_excerpt::excerpt(encoded));
    }
    write_buffer_ += encoded;
    flush_writes();
}

void Supervisor::flush_writes() {
    while (!write_buffer_.empty() && stdin_fd_ >= 0) {
        ssize_t written = ::write(stdin_fd_, write_buffer_.data(), write_buffer_.size());
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                if (!loop_.is_watched(stdin_fd_)) {
                    loop_.watch_fd(stdin_fd_, POLLOUT, [this](short revents) { on_stdin_writable(revents); });
                }
                return;
            }
            // The child closed its stdin; its stdout EOF reports the exit.
            debug_log::warn(label() + " stdin write failed: " + std::strerror(errno));
            write_buffer_.clear();
            break;
        }
        write_buffer_.erase(0, static_cast<std::size_t>(written));
    }
    if (stdin_fd_ >= 0 && loop_.is_watched(stdin_fd_)) {
        loop_.unwatch_fd(stdin_fd_);
    }
}

void Supervisor::on_stdin_writable(short revents) {
    if ((revents & (POLLERR | POLLHUP)) != 0 && (revents & POLLOUT) == 0) {
        write_buffer_.clear();
        if (loop_.is_watched(stdin_fd_)) {
            loop_.unwatch_fd(stdin_fd_);
        }
        return;
    }
    flush_writes();
}

void Supervisor::on_stdout_readable(short revents) {
    (void)revents;
    char buffer[READ_CHUNK_BYTES];
    ssize_t received = ::read(stdout_fd_, buffer, sizeof(buffer));
    if (received < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) {
            return;
        }
        teardown(State::crashed, std::string("read error: ") + std::strerror(errno));
        return;
    }
    if (received == 0) {
        std::vector<json> tail = decoder_.finish();
        std::weak_ptr<bool> alive = alive_;
        for (const auto &message : tail) {
            handle_message(message);
            if (alive.expired()) {
                return;
            }
        }
        if (is_running()) {
            teardown(State::crashed, "stdout closed");
        }
        return;
    }

    std::uint64_t generation = generation_;
    std::vector<json> messages = decoder_.feed(std::string(buffer, static_cast<std::size_t>(received)));
    std::weak_ptr<bool> alive = alive_;
    for (const auto &message : messages) {
        handle_message(message);
        // A callback may have stopped or destroyed the supervisor.
        if (alive.expired() || generation != generation_) {
            return;
        }
    }
}

void Supervisor::handle_message(const json &message) {
    if (debug_log::is_debug_enabled()) {
        debug_log::log("[rx " + config_.name + "] " +
                       text_excerpt::excerpt(message.dump(-1, ' ', false, json::error_handler_t::replace)));
    }
    switch (json_rpc::classify(message)) {
    case json_rpc::MessageKind::response:
        handle_response(message);
        break;
    case json_rpc::MessageKind::notification:
        debug_log::log(label() + " notification ignored: " + json_rpc::get_method(message));
        break;
    case json_rpc::MessageKind::request:
        write_message(json_rpc::build_error_response(json_rpc::get_id(message), json_rpc::METHOD_NOT_FOUND,
                                                     "Method not found: " + json_rpc::get_method(message)));
        break;
    case json_rpc::MessageKind::invalid:
        debug_log::warn(label() + " sent an invalid message");
        break;
    }
}

void Supervisor::handle_response(const json &message) {
    const json &id = message["id"];
    if (!id.is_number_unsigned() && !id.is_number_integer()) {
        debug_log::log(label() + " response with non-numeric id ignored");
        return;
    }
    if (id.is_number_integer() && id.get<long long>() <= 0) {
        return;
    }
    auto it = pending_.find(id.get<std::uint64_t>());
    if (it == pending_.end()) {
        debug_log::log(label() + " response for unknown id " + id.dump() + " ignored");
        return;
    }

    PendingRequest pending = std::move(it->second);
    pending_.erase(it);
    loop_.cancel_timer(pending.timer);
    touch();

    if (message.contains("error")) {
        const json &error = message["error"];
        RpcError rpc_error;
        if (error.is_object()) {
            if (error.contains("code") && error["code"].is_number_integer()) {
                rpc_error.code = error["code"].get<int>();
            }
            rpc_error.message = error.contains("message") && error["message"].is_string()
                                    ? error["message"].get<std::string>()
                                    : std::string("Unknown error");
            if (error.contains("data")) {
                rpc_error.data = error["data"];
            }
        } else {
            rpc_error.message = error.is_string() ? error.get<std::string>() : std::string("Unknown error");
        }
        pending.callback(RpcOutcome::failure(std::move(rpc_error)));
        return;
    }
    pending.callback(RpcOutcome::ok(message.contains("result") ? message["result"] : json(nullptr)));
}

} // namespace process_supervisor
