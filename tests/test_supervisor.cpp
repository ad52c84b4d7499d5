// Integration tests for the process supervisor against the real mcpvisor-server binary
// running the test manifest.

#include <signal.h>
#include <sys/types.h>
#include <nlohmann/json.hpp>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "host/process_supervisor.hpp"
#include "host/server_config.hpp"
#include "runtime/event_loop.hpp"
#include "test_support.hpp"

using json = nlohmann::json;
using process_supervisor::RpcOutcome;
using process_supervisor::Supervisor;
using test_support::report;

namespace test_supervisor {

static RpcOutcome await_rpc(event_loop::EventLoop &loop, Supervisor &supervisor, const std::string &method,
                            const json &params) {
    bool done = false;
    RpcOutcome result;
    supervisor.rpc(method, params, [&done, &result](const RpcOutcome &outcome) {
        result = outcome;
        done = true;
    });
    loop.run_until([&done]() { return done; });
    return result;
}

static RpcOutcome await_tool(event_loop::EventLoop &loop, Supervisor &supervisor, const std::string &tool_name,
                             const json &arguments) {
    return await_rpc(loop, supervisor, "tools/call", json{{"name", tool_name}, {"arguments", arguments}});
}

// Test: the first request spawns the child and performs the handshake.
static bool test_first_call_handshakes() {
    event_loop::EventLoop loop;
    Supervisor supervisor(loop, test_support::test_server_config("sup"));
    bool idle_before = supervisor.state() == process_supervisor::State::stopped && !supervisor.is_running();
    RpcOutcome outcome = await_tool(loop, supervisor, "echo", json{{"message", "hi"}});
    bool success = idle_before && outcome.success && outcome.result["name"] == "echo" &&
                   outcome.result["result"] == json{{"message", "hi"}} && supervisor.is_handshaken() &&
                   supervisor.state() == process_supervisor::State::ready && supervisor.spawn_count() == 1 &&
                   supervisor.inbound_framing() == framing::Framing::ndjson && supervisor.pending_count() == 0;
    supervisor.stop();
    bool stopped = supervisor.state() == process_supervisor::State::stopped && !supervisor.is_running();
    return report(success && stopped, "First request spawns, handshakes and returns the result",
                  outcome.success ? outcome.result.dump() : outcome.error.message);
}

// Test: ensure_ready returns the probe's tools/list result.
static bool test_ensure_ready() {
    event_loop::EventLoop loop;
    Supervisor supervisor(loop, test_support::test_server_config("ready"));
    bool done = false;
    RpcOutcome result;
    supervisor.ensure_ready([&done, &result](const RpcOutcome &outcome) {
        result = outcome;
        done = true;
    });
    loop.run_until([&done]() { return done; });
    std::vector<std::string> names;
    for (const auto &tool : result.result["tools"]) {
        names.push_back(tool["name"].get<std::string>());
    }
    bool success = result.success && names == std::vector<std::string>{"echo", "sleep", "fail", "unbound"} &&
                   supervisor.is_handshaken();
    return report(success, "ensure_ready completes the handshake and lists tools", result.result.dump());
}

// Test: pipelined requests are matched to their responses by id.
static bool test_pipelined_requests() {
    event_loop::EventLoop loop;
    Supervisor supervisor(loop, test_support::test_server_config("pipe"));
    std::vector<int> delays = {120, 10, 60, 0, 30};
    std::vector<json> results(delays.size());
    std::vector<int> completion_order;
    for (std::size_t index = 0; index < delays.size(); ++index) {
        supervisor.rpc("tools/call", json{{"name", "sleep"}, {"arguments", {{"ms", delays[index]}}}},
                       [&results, &completion_order, index](const RpcOutcome &outcome) {
                           results[index] = outcome.success ? outcome.result["result"] : json(nullptr);
                           completion_order.push_back(static_cast<int>(index));
                       });
    }
    loop.run_until([&completion_order, &delays]() { return completion_order.size() == delays.size(); });

    bool matched = true;
    for (std::size_t index = 0; index < delays.size(); ++index) {
        matched = matched && results[index] == json{{"slept_ms", delays[index]}};
    }
    bool success = matched && completion_order.back() == 0 && supervisor.spawn_count() == 1;
    return report(success, "Concurrent requests are correlated by id");
}

// Test: errors from the server keep their code, message and data.
static bool test_server_errors_pass_through() {
    event_loop::EventLoop loop;
    Supervisor supervisor(loop, test_support::test_server_config("errors"));
    RpcOutcome failed = await_tool(loop, supervisor, "fail", json{{"code", -32099}, {"message", "boom"}, {"data", 5}});
    RpcOutcome invalid = await_tool(loop, supervisor, "echo", json{{"message", 1}});
    RpcOutcome deadline = await_tool(loop, supervisor, "sleep", json{{"ms", 2000}});
    RpcOutcome unknown = await_rpc(loop, supervisor, "prompts/list", json::object());
    bool success = !failed.success && failed.error.code == -32099 && failed.error.message == "boom" &&
                   failed.error.data == 5 && invalid.error.code == -32602 &&
                   invalid.error.message == "Invalid input for `echo`" && deadline.error.code == -32000 &&
                   deadline.error.message == "Tool `sleep` timed out after 300 ms" &&
                   unknown.error.code == -32601 && supervisor.spawn_count() == 1;
    return report(success, "Server errors pass through with their codes", deadline.error.message);
}

// Test: a local timeout fails the request; the late response is dropped and the child lives on.
static bool test_request_timeout() {
    event_loop::EventLoop loop;
    Supervisor supervisor(loop, test_support::test_server_config("slow"));
    await_tool(loop, supervisor, "echo", json{{"message", "warm-up"}});

    bool done = false;
    RpcOutcome result;
    supervisor.rpc("tools/call", json{{"name", "sleep"}, {"arguments", {{"ms", 200}}}}, std::chrono::milliseconds(50),
                   [&done, &result](const RpcOutcome &outcome) {
                       result = outcome;
                       done = true;
                   });
    loop.run_until([&done]() { return done; });
    bool timed_out = !result.success && !result.error.code.has_value() &&
                     result.error.message == "MCP \"slow\" request timeout (50ms): tools/call" &&
                     supervisor.pending_count() == 0;

    loop.run_for(std::chrono::milliseconds(300));
    RpcOutcome after = await_tool(loop, supervisor, "echo", json{{"message", "still here"}});
    bool success = timed_out && after.success && supervisor.spawn_count() == 1;
    return report(success, "Request timeout fails only that request", result.error.message);
}

// Test: a crash rejects every pending request; the next request respawns and handshakes again.
static bool test_crash_rejects_pending_and_respawns() {
    event_loop::EventLoop loop;
    Supervisor supervisor(loop, test_support::test_server_config("crashy"));
    await_tool(loop, supervisor, "echo", json{{"message", "up"}});
    int first_pid = supervisor.process_id();

    std::vector<std::string> failures;
    for (int index = 0; index < 2; ++index) {
        supervisor.rpc("tools/call", json{{"name", "sleep"}, {"arguments", {{"ms", 250}}}},
                       [&failures](const RpcOutcome &outcome) {
                           failures.push_back(outcome.success ? std::string("success") : outcome.error.message);
                       });
    }
    bool both_pending = supervisor.pending_count() == 2;
    ::kill(static_cast<pid_t>(first_pid), SIGKILL);
    loop.run_until([&failures]() { return failures.size() == 2; });

    bool rejected = both_pending && failures[0] == "MCP \"crashy\" process exited" &&
                    failures[1] == "MCP \"crashy\" process exited" &&
                    supervisor.state() == process_supervisor::State::crashed && !supervisor.is_handshaken();

    RpcOutcome again = await_tool(loop, supervisor, "echo", json{{"message", "back"}});
    bool success = rejected && again.success && supervisor.spawn_count() == 2 &&
                   supervisor.process_id() != first_pid && supervisor.is_handshaken();
    return report(success, "Crash rejects pending requests, then the next request respawns",
                  failures.empty() ? "" : failures[0]);
}

// Test: stop() rejects pending requests immediately.
static bool test_stop_rejects_pending() {
    event_loop::EventLoop loop;
    Supervisor supervisor(loop, test_support::test_server_config("stopper"));
    await_tool(loop, supervisor, "echo", json{{"message", "up"}});

    std::string failure;
    supervisor.rpc("tools/call", json{{"name", "sleep"}, {"arguments", {{"ms", 250}}}},
                   [&failure](const RpcOutcome &outcome) { failure = outcome.success ? "success" : outcome.error.message; });
    int process_id = supervisor.process_id();
    supervisor.stop();
    bool rejected = failure == "MCP \"stopper\" process exited" && supervisor.pending_count() == 0 &&
                    supervisor.state() == process_supervisor::State::stopped && loop.watch_count() == 0;
    loop.run();
    bool success = rejected && loop.timer_count() == 0 && ::kill(static_cast<pid_t>(process_id), 0) != 0;
    return report(success, "stop() rejects pending requests and releases the loop", failure);
}

// Test: an idle child is shut down and comes back on the next request.
static bool test_idle_shutdown() {
    event_loop::EventLoop loop;
    server_config::SupervisorOptions options;
    options.idle_ttl = std::chrono::milliseconds(100);
    Supervisor supervisor(loop, test_support::test_server_config("idle"), options);
    await_tool(loop, supervisor, "echo", json{{"message", "up"}});

    loop.run_for(std::chrono::milliseconds(150));
    bool shut_down = !supervisor.is_running() && supervisor.state() == process_supervisor::State::stopped;

    RpcOutcome again = await_tool(loop, supervisor, "echo", json{{"message", "again"}});
    bool success = shut_down && again.success && supervisor.spawn_count() == 2;
    return report(success, "Idle child is stopped and respawned on demand");
}

// Test: the idle check leaves a busy child alone.
static bool test_idle_waits_for_pending() {
    event_loop::EventLoop loop;
    server_config::SupervisorOptions options;
    options.idle_ttl = std::chrono::milliseconds(40);
    Supervisor supervisor(loop, test_support::test_server_config("busy"), options);
    // The handshake's first probe waits longer than the TTL.
    RpcOutcome first = await_tool(loop, supervisor, "echo", json{{"message", "up"}});

    // The request is sent while idle time is still short, then runs past several checks.
    RpcOutcome slow = await_tool(loop, supervisor, "sleep", json{{"ms", 200}});
    bool success = first.success && slow.success && slow.result["result"]["slept_ms"] == 200 &&
                   supervisor.spawn_count() == 1;
    return report(success, "Idle check does not stop a child that is handshaking or has pending requests");
}

// Test: a server without initialize is still handshaken and probed once, after the delay.
static bool test_handshake_without_initialize() {
    event_loop::EventLoop loop;
    server_config::SupervisorOptions options;
    options.probe_initial_delay = std::chrono::milliseconds(80);
    Supervisor supervisor(loop, test_support::scripted_server_config("bare", {"--no-initialize"}), options);

    auto started = event_loop::EventLoop::now();
    RpcOutcome echoed = await_tool(loop, supervisor, "echo", json{{"message", "hi"}});
    auto elapsed = event_loop::EventLoop::now() - started;
    RpcOutcome stats = await_rpc(loop, supervisor, "fixture/stats", json::object());

    bool success = echoed.success && echoed.result["result"] == json{{"message", "hi"}} &&
                   supervisor.is_handshaken() && supervisor.probe_count() == 1 &&
                   elapsed >= std::chrono::milliseconds(80) && stats.result["initialize"] == 1 &&
                   stats.result["initialized_notifications"] == 1 && stats.result["tools_list"] == 1;
    return report(success, "initialize answered with -32601 is tolerated", stats.result.dump());
}

// Test: "not initialized" probes are retried with growing delays until one succeeds.
static bool test_tools_list_retries_until_ready() {
    event_loop::EventLoop loop;
    server_config::SupervisorOptions options;
    options.probe_initial_delay = std::chrono::milliseconds(30);
    options.probe_backoff_factor = 2.0;
    Supervisor supervisor(loop, test_support::scripted_server_config("warming", {"--not-ready-probes", "2"}),
                          options);

    auto started = event_loop::EventLoop::now();
    RpcOutcome echoed = await_tool(loop, supervisor, "echo", json{{"message", "late"}});
    auto elapsed = event_loop::EventLoop::now() - started;
    RpcOutcome stats = await_rpc(loop, supervisor, "fixture/stats", json::object());

    // Probes wait 30, 60 and 120 ms.
    bool success = echoed.success && echoed.result["result"] == json{{"message", "late"}} &&
                   supervisor.probe_count() == 3 && elapsed >= std::chrono::milliseconds(210) &&
                   stats.result["tools_list"] == 3 && stats.result["tools_call"] == 1;
    return report(success, "Not-initialized probes are retried with backoff", stats.result.dump());
}

// Test: after the last attempt the handshake completes anyway.
static bool test_tools_list_attempts_exhausted() {
    event_loop::EventLoop loop;
    server_config::SupervisorOptions options;
    options.probe_initial_delay = std::chrono::milliseconds(5);
    options.probe_attempts = 3;
    Supervisor supervisor(loop, test_support::scripted_server_config("stubborn", {"--not-ready-probes", "10"}),
                          options);

    RpcOutcome echoed = await_tool(loop, supervisor, "echo", json{{"message", "anyway"}});
    RpcOutcome stats = await_rpc(loop, supervisor, "fixture/stats", json::object());
    bool success = echoed.success && supervisor.is_handshaken() && supervisor.probe_count() == 3 &&
                   stats.result["tools_list"] == 3;
    return report(success, "Handshake completes once probe attempts run out", stats.result.dump());
}

// Test: notify() writes a notification and expects no answer.
static bool test_notify() {
    event_loop::EventLoop loop;
    Supervisor supervisor(loop, test_support::scripted_server_config("notified", {}));
    await_tool(loop, supervisor, "echo", json::object());
    supervisor.notify("notifications/initialized", json::object());
    RpcOutcome stats = await_rpc(loop, supervisor, "fixture/stats", json::object());
    bool success = stats.success && stats.result["initialized_notifications"] == 2 && supervisor.pending_count() == 0;
    return report(success, "notify() sends a notification", stats.result.dump());
}

// Test: stop() returns at once; a child ignoring SIGTERM is killed after the grace period.
static bool test_stop_escalates_without_blocking() {
    event_loop::EventLoop loop;
    server_config::SupervisorOptions options;
    options.stop_grace = std::chrono::milliseconds(300);
    Supervisor supervisor(loop, test_support::scripted_server_config("stubborn-exit", {"--ignore-sigterm"}),
                          options);
    await_tool(loop, supervisor, "echo", json::object());
    int process_id = supervisor.process_id();

    auto started = event_loop::EventLoop::now();
    supervisor.stop();
    auto stop_took = event_loop::EventLoop::now() - started;
    bool still_alive = ::kill(static_cast<pid_t>(process_id), 0) == 0;

    loop.run();
    auto reaped_after = event_loop::EventLoop::now() - started;
    bool success = stop_took < std::chrono::milliseconds(100) && still_alive && !supervisor.is_running() &&
                   reaped_after >= std::chrono::milliseconds(300) && ::kill(static_cast<pid_t>(process_id), 0) != 0;
    return report(success, "stop() does not wait on the loop thread; SIGKILL follows the grace period");
}

// Test: states have printable names.
static bool test_state_names() {
    using process_supervisor::State;
    using process_supervisor::state_name;
    bool success = std::string(state_name(State::stopped)) == "stopped" &&
                   std::string(state_name(State::awaiting_handshake)) == "awaiting_handshake" &&
                   std::string(state_name(State::ready)) == "ready" &&
                   std::string(state_name(State::crashed)) == "crashed";
    return report(success, "State names");
}

// Test: a missing executable fails the request and the start() call.
static bool test_spawn_failure() {
    event_loop::EventLoop loop;
    server_config::ServerConfig config = test_support::test_server_config("missing");
    config.command = "/nonexistent/mcpvisor-server-missing";
    Supervisor supervisor(loop, config);

    bool done = false;
    RpcOutcome result;
    supervisor.rpc("ping", json::object(), [&done, &result](const RpcOutcome &outcome) {
        result = outcome;
        done = true;
    });
    bool threw = false;
    try {
        supervisor.start();
    } catch (const process_supervisor::SupervisorError &) {
        threw = true;
    }
    bool success = done && !result.success && result.error.message.rfind("MCP \"missing\"", 0) == 0 && threw &&
                   supervisor.state() == process_supervisor::State::crashed && loop.watch_count() == 0;
    return report(success, "Spawn failure is reported to the caller", result.error.message);
}

// Test: LSP framing toward the child is answered in LSP framing.
static bool test_lsp_framing() {
    event_loop::EventLoop loop;
    server_config::ServerConfig config = test_support::test_server_config("lsp");
    config.framing = framing::Framing::lsp;
    Supervisor supervisor(loop, config);
    RpcOutcome manifest = await_rpc(loop, supervisor, "manifest/get", json::object());
    bool success = manifest.success && manifest.result["name"] == "test-tools" &&
                   manifest.result["vendor"] == "mcpvisor-tests" && manifest.result["limits"]["custom_limit"] == 7 &&
                   supervisor.inbound_framing() == framing::Framing::lsp;
    return report(success, "LSP framing works end to end", manifest.result.dump());
}

bool run_all_tests() {
    bool all_passed = true;
    all_passed &= test_first_call_handshakes();
    all_passed &= test_ensure_ready();
    all_passed &= test_pipelined_requests();
    all_passed &= test_server_errors_pass_through();
    all_passed &= test_request_timeout();
    all_passed &= test_crash_rejects_pending_and_respawns();
    all_passed &= test_stop_rejects_pending();
    all_passed &= test_idle_shutdown();
    all_passed &= test_idle_waits_for_pending();
    all_passed &= test_spawn_failure();
    all_passed &= test_handshake_without_initialize();
    all_passed &= test_tools_list_retries_until_ready();
    all_passed &= test_tools_list_attempts_exhausted();
    all_passed &= test_notify();
    all_passed &= test_stop_escalates_without_blocking();
    all_passed &= test_state_names();
    all_passed &= test_lsp_framing();
    return all_passed;
}

} // namespace test_supervisor
