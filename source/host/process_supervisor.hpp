#ifndef MCPVISOR_PROCESS_SUPERVISOR_HPP
#define MCPVISOR_PROCESS_SUPERVISOR_HPP

// Supervises one tool-server child process: spawn, MCP handshake, request/response
// correlation by id, per-request timeouts, idle shutdown and crash recovery.
//
// Everything runs on the caller's event loop. Callbacks are invoked from loop callbacks
// (or synchronously for immediate failures) and may call back into the supervisor.

#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "host/server_config.hpp"
#include "protocol/framing.hpp"
#include "runtime/event_loop.hpp"

namespace process_supervisor {

using json = nlohmann::json;

enum class State {
    stopped,
    starting,
    awaiting_handshake,
    ready,
    crashed,
};

const char *state_name(State state);

// Failure of a request: a JSON-RPC error from the server, or a local one (timeout,
// process exit, spawn failure) without a code.
struct RpcError {
    std::optional<int> code;
    std::string message;
    json data;

    json to_json() const;
};

struct RpcOutcome {
    bool success = false;
    json result;
    RpcError error;

    static RpcOutcome ok(json result);
    static RpcOutcome failure(RpcError error);
};

using RpcCallback = std::function<void(const RpcOutcome &outcome)>;

// Blocking-API form of RpcError.
class RpcException : public std::runtime_error {
public:
    explicit RpcException(RpcError error);

    const RpcError &error() const { return error_; }
    std::optional<int> code() const { return error_.code; }
    const json &data() const { return error_.data; }

private:
    RpcError error_;
};

// The child process could not be started.
class SupervisorError : public std::runtime_error {
public:
    explicit SupervisorError(const std::string &message) : std::runtime_error(message) {}
};

class Supervisor {
public:
    Supervisor(event_loop::EventLoop &loop, server_config::ServerConfig config,
               server_config::SupervisorOptions options = server_config::SupervisorOptions());
    ~Supervisor();

    Supervisor(const Supervisor &) = delete;
    Supervisor &operator=(const Supervisor &) = delete;

    // Spawn the child unless it is already running. Throws SupervisorError.
    void start();

    // Terminate the child (SIGTERM, then SIGKILL after the grace period) and reject every
    // pending request with "process exited". Safe to call when nothing runs. Returns at once;
    // the child is reaped from loop timers, or in place when the supervisor is destroyed.
    void stop();

    // Send a request once the handshake is done ("initialize" itself skips the wait),
    // starting the child if needed. The callback runs exactly once.
    void rpc(const std::string &method, const json &params, RpcCallback callback);

    // Same with an explicit timeout; zero or negative waits forever.
    void rpc(const std::string &method, const json &params, std::chrono::milliseconds timeout,
             RpcCallback callback);

    // Fire-and-forget notification. Starts the child if needed (throws SupervisorError).
    void notify(const std::string &method, const json &params);

    // Handshake barrier plus a soft tools/list probe whose failure is ignored. Fails only
    // when the child cannot be started or the handshake is rejected.
    void ensure_ready(RpcCallback callback);

    State state() const { return state_; }
    bool is_running() const { return process_id_ > 0; }
    bool is_handshaken() const { return handshaken_; }
    int process_id() const { return process_id_; }
    std::size_t pending_count() const { return pending_.size(); }
    std::size_t spawn_count() const { return spawn_count_; }
    // tools/list handshake probes completed over the supervisor's lifetime.
    std::size_t probe_count() const { return probe_count_; }
    framing::Framing inbound_framing() const { return decoder_.framing(); }
    const server_config::ServerConfig &config() const { return config_; }

private:
    using BarrierWaiter = std::function<void(const RpcError *failure)>;

    struct PendingRequest {
        std::string method;
        RpcCallback callback;
        event_loop::TimerId timer = event_loop::INVALID_TIMER;
    };

    // Memoized handshake of one process generation.
    struct Barrier {
        std::uint64_t generation = 0;
        std::vector<BarrierWaiter> waiters;
    };

    void await_handshake(BarrierWaiter waiter);
    void begin_handshake();
    void probe_tools_list(std::uint64_t generation, int attempt, std::chrono::milliseconds delay);
    void complete_handshake(std::uint64_t generation, const RpcError *failure);

    void send_request(const std::string &method, const json &params, std::chrono::milliseconds timeout,
                      RpcCallback callback);
    void write_message(const json &message);
    void flush_writes();
    void on_stdout_readable(short revents);
    void on_stdin_writable(short revents);
    void handle_message(const json &message);
    void handle_response(const json &message);
    void touch();
    void arm_idle_timer(std::chrono::milliseconds delay);
    void check_idle();
    void teardown(State next_state, const std::string &reason);
    void release_process(int process_id, bool crashed, const std::string &reason);
    std::string label() const;

    event_loop::EventLoop &loop_;
    server_config::ServerConfig config_;
    server_config::SupervisorOptions options_;

    State state_ = State::stopped;
    int process_id_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    framing::FrameDecoder decoder_;
    std::string write_buffer_;

    std::uint64_t next_id_ = 1;
    std::map<std::uint64_t, PendingRequest> pending_;

    std::uint64_t generation_ = 0;
    std::shared_ptr<Barrier> barrier_;
    bool handshaken_ = false;
    event_loop::TimerId probe_timer_ = event_loop::INVALID_TIMER;

    event_loop::TimerId idle_timer_ = event_loop::INVALID_TIMER;
    event_loop::Clock::time_point last_used_;
    std::size_t spawn_count_ = 0;
    std::size_t probe_count_ = 0;
    bool reap_in_place_ = false;

    // Lets I/O handlers notice that a callback destroyed the supervisor.
    std::shared_ptr<bool> alive_ = std::make_shared<bool>(true);
};

} // namespace process_supervisor

#endif // MCPVISOR_PROCESS_SUPERVISOR_HPP
