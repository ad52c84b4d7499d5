#include "platform/platform_abi.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>
#include <filesystem>

extern char **environ;

namespace platform {

// Reported by the child through the status pipe when it cannot exec.
struct ChildFailure {
    int stage = 0; // 1 = chdir, 2 = exec
    int error_number = 0;
};

static std::vector<std::string> build_environment(const std::map<std::string, std::string> &overrides) {
    std::map<std::string, std::string> merged;
    for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string text(*entry);
        std::size_t separator = text.find('=');
        if (separator == std::string::npos) {
            continue;
        }
        merged[text.substr(0, separator)] = text.substr(separator + 1);
    }
    for (const auto &entry : overrides) {
        merged[entry.first] = entry.second;
    }

    std::vector<std::string> flattened;
    flattened.reserve(merged.size());
    for (const auto &entry : merged) {
        flattened.push_back(entry.first + "=" + entry.second);
    }
    return flattened;
}

std::string ExitStatus::describe() const {
    std::string code_text = (signal_number == 0 && exit_code >= 0) ? std::to_string(exit_code) : "none";
    std::string signal_text = "none";
    if (signal_number != 0) {
        const char *name = sigabbrev_np(signal_number);
        signal_text = name != nullptr ? std::string("SIG") + name : std::to_string(signal_number);
    }
    return "code=" + code_text + " signal=" + signal_text;
}

PipedSpawnResult spawn_piped_process(const SpawnOptions &options) {
    PipedSpawnResult result;

    if (options.executable.empty()) {
        result.error_message = "spawn failed: empty executable";
        return result;
    }

    // Everything the child needs is prepared before fork(); after it the child may only
    // call async-signal-safe functions.
    std::vector<std::string> argv_strings;
    argv_strings.push_back(options.executable);
    for (const auto &argument : options.arguments) {
        argv_strings.push_back(argument);
    }
    std::vector<char *> argv_pointers;
    for (auto &argument_string : argv_strings) {
        argv_pointers.push_back(argument_string.data());
    }
    argv_pointers.push_back(nullptr);

    std::vector<std::string> environment_strings = build_environment(options.environment);
    std::vector<char *> environment_pointers;
    for (auto &entry : environment_strings) {
        environment_pointers.push_back(entry.data());
    }
    environment_pointers.push_back(nullptr);

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};
    if (pipe2(stdin_pipe, O_CLOEXEC) != 0 || pipe2(stdout_pipe, O_CLOEXEC) != 0 ||
        pipe2(status_pipe, O_CLOEXEC) != 0) {
        result.error_message = "pipe failed: " + std::string(strerror(errno));
        for (int *descriptor : {&stdin_pipe[0], &stdin_pipe[1], &stdout_pipe[0], &stdout_pipe[1],
                                &status_pipe[0], &status_pipe[1]}) {
            close_descriptor(*descriptor);
        }
        return result;
    }

    const char *working_directory = options.working_directory.empty() ? nullptr : options.working_directory.c_str();

    pid_t child_pid = fork();
    if (child_pid < 0) {
        result.error_message = "fork failed: " + std::string(strerror(errno));
        for (int *descriptor : {&stdin_pipe[0], &stdin_pipe[1], &stdout_pipe[0], &stdout_pipe[1],
                                &status_pipe[0], &status_pipe[1]}) {
            close_descriptor(*descriptor);
        }
        return result;
    }

    if (child_pid == 0) {
        // dup2 clears close-on-exec on the targets; every other pipe end closes at exec.
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        signal(SIGPIPE, SIG_DFL);

        ChildFailure failure;
        if (working_directory != nullptr && chdir(working_directory) != 0) {
            failure.stage = 1;
            failure.error_number = errno;
        } else {
            execvpe(argv_pointers[0], argv_pointers.data(), environment_pointers.data());
            failure.stage = 2;
            failure.error_number = errno;
        }
        ssize_t ignored = write(status_pipe[1], &failure, sizeof(failure));
        (void)ignored;
        _exit(127);
    }

    close_descriptor(stdin_pipe[0]);
    close_descriptor(stdout_pipe[1]);
    close_descriptor(status_pipe[1]);

    // The status pipe closes without data when exec succeeds.
    ChildFailure failure;
    ssize_t received = 0;
    do {
        received = read(status_pipe[0], &failure, sizeof(failure));
    } while (received < 0 && errno == EINTR);
    close_descriptor(status_pipe[0]);

    if (received == static_cast<ssize_t>(sizeof(failure))) {
        int wait_status = 0;
        waitpid(child_pid, &wait_status, 0);
        close_descriptor(stdin_pipe[1]);
        close_descriptor(stdout_pipe[0]);
        if (failure.stage == 1) {
            result.error_message = "spawn " + options.executable + " failed: cannot enter working directory " +
                                   options.working_directory + ": " + strerror(failure.error_number);
        } else {
            result.error_message = "spawn " + options.executable + " failed: " + strerror(failure.error_number);
        }
        return result;
    }

    result.success = true;
    result.process_id = static_cast<int>(child_pid);
    result.stdin_fd = stdin_pipe[1];
    result.stdout_fd = stdout_pipe[0];
    return result;
}

static void fill_exit_status(int wait_status, ExitStatus &status) {
    status.exited = true;
    if (WIFEXITED(wait_status)) {
        status.exit_code = WEXITSTATUS(wait_status);
        status.signal_number = 0;
    } else if (WIFSIGNALED(wait_status)) {
        status.exit_code = -1;
        status.signal_number = WTERMSIG(wait_status);
    }
}

bool try_reap_process(int process_id, ExitStatus &status) {
    if (process_id <= 0) {
        return false;
    }
    int wait_status = 0;
    pid_t reaped = waitpid(static_cast<pid_t>(process_id), &wait_status, WNOHANG);
    if (reaped == static_cast<pid_t>(process_id)) {
        fill_exit_status(wait_status, status);
        return true;
    }
    if (reaped < 0 && errno == ECHILD) {
        // Already reaped elsewhere; nothing left to wait for.
        status.exited = true;
        return true;
    }
    return false;
}

void request_termination(int process_id) {
    if (process_id > 0) {
        kill(static_cast<pid_t>(process_id), SIGTERM);
    }
}

void force_termination(int process_id) {
    if (process_id > 0) {
        kill(static_cast<pid_t>(process_id), SIGKILL);
    }
}

ExitStatus terminate_process(int process_id, std::chrono::milliseconds grace) {
    ExitStatus status;
    if (process_id <= 0) {
        return status;
    }
    if (try_reap_process(process_id, status)) {
        return status;
    }

    request_termination(process_id);

    auto deadline = std::chrono::steady_clock::now() + grace;
    const auto poll_interval = std::chrono::milliseconds(10);
    while (std::chrono::steady_clock::now() < deadline) {
        if (try_reap_process(process_id, status)) {
            return status;
        }
        std::this_thread::sleep_for(poll_interval);
    }

    force_termination(process_id);
    int wait_status = 0;
    pid_t reaped = 0;
    do {
        reaped = waitpid(static_cast<pid_t>(process_id), &wait_status, 0);
    } while (reaped < 0 && errno == EINTR);
    if (reaped == static_cast<pid_t>(process_id)) {
        fill_exit_status(wait_status, status);
    } else {
        status.exited = true;
    }
    return status;
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        return false;
    }
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

void close_descriptor(int &fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

void ignore_broken_pipe() {
    signal(SIGPIPE, SIG_IGN);
}

bool read_file_contents(const std::string &file_path, std::string &output_contents) {
    std::ifstream file_stream(file_path, std::ios::binary);
    if (!file_stream.is_open()) {
        return false;
    }
    std::ostringstream string_stream;
    string_stream << file_stream.rdbuf();
    output_contents = string_stream.str();
    return true;
}

std::string current_executable_path() {
    std::error_code error;
    std::filesystem::path resolved = std::filesystem::read_symlink("/proc/self/exe", error);
    if (error) {
        return "";
    }
    return resolved.string();
}

} // namespace platform
