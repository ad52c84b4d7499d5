#ifndef MCPVISOR_PLATFORM_ABI_HPP
#define MCPVISOR_PLATFORM_ABI_HPP

// Platform abstraction interface.
// Each OS-specific implementation lives under platform/<os>/ and provides
// definitions for the functions declared here.

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace platform {

// How to launch a child process whose stdin/stdout are connected to the caller.
struct SpawnOptions {
    std::string executable;              // Looked up on PATH when it holds no '/'.
    std::vector<std::string> arguments;  // argv[1..].
    std::string working_directory;       // Empty: inherit the caller's.
    std::map<std::string, std::string> environment; // Merged over the caller's environment.
};

// Result of spawning a child process with piped stdin/stdout.
// stderr is inherited from the caller.
struct PipedSpawnResult {
    bool success = false;
    int process_id = -1;
    int stdin_fd = -1;   // Write end, connected to the child's stdin.
    int stdout_fd = -1;  // Read end, connected to the child's stdout.
    std::string error_message;
};

// How a child process ended.
struct ExitStatus {
    bool exited = false;      // Reaped (by exit or by signal).
    int exit_code = -1;       // Valid when the child called exit().
    int signal_number = 0;    // Non-zero when a signal ended the child.

    // "code=0 signal=none", "code=none signal=SIGTERM".
    std::string describe() const;
};

// Spawn a child process with piped stdin/stdout. Exec failures (missing binary, bad
// working directory) are reported here rather than as an immediate child exit.
// Both returned descriptors are close-on-exec.
PipedSpawnResult spawn_piped_process(const SpawnOptions &options);

// Reap the child if it has ended, without blocking. Returns true once reaped.
bool try_reap_process(int process_id, ExitStatus &status);

// Ask the child to exit (SIGTERM). Does not wait.
void request_termination(int process_id);

// End the child unconditionally (SIGKILL). Does not wait.
void force_termination(int process_id);

// Send SIGTERM, wait up to grace for the child to exit, then SIGKILL, and reap it.
// Blocks the caller; event-loop code polls try_reap_process instead.
ExitStatus terminate_process(int process_id, std::chrono::milliseconds grace);

// Put a descriptor in non-blocking mode.
bool set_nonblocking(int fd);

// Close a descriptor if it is open and mark it closed (-1).
void close_descriptor(int &fd);

// Writes to a pipe whose reader has gone report EPIPE instead of killing the process.
void ignore_broken_pipe();

// Read the entire contents of a text file into a string.
// Returns true on success, false on failure (file not found, permission, etc.).
bool read_file_contents(const std::string &file_path, std::string &output_contents);

// Absolute path of the running executable, or empty if it cannot be determined.
std::string current_executable_path();

} // namespace platform

#endif // MCPVISOR_PLATFORM_ABI_HPP
