#include "mcp/mcp_stdio.hpp"
#include "mcp/mcp_dispatch.hpp"
#include "runtime/event_loop.hpp"
#include "utils/debug_log.hpp"
#include "utils/text_excerpt.hpp"

#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace mcp_stdio {

static constexpr std::size_t READ_CHUNK_BYTES = 65536;

OutputSink descriptor_sink(int fd) {
    return [fd](const std::string &bytes) {
        std::size_t written = 0;
        while (written < bytes.size()) {
            ssize_t result = ::write(fd, bytes.data() + written, bytes.size() - written);
            if (result < 0) {
                if (errno == EINTR) {
                    continue;
                }
                debug_log::error(std::string("Write to output failed: ") + std::strerror(errno));
                return;
            }
            written += static_cast<std::size_t>(result);
        }
    };
}

StdioServer::StdioServer(event_loop::EventLoop &loop, mcp_dispatch::Dispatcher &dispatcher, int input_fd,
                         OutputSink sink)
    : loop_(loop), dispatcher_(dispatcher), input_fd_(input_fd), sink_(std::move(sink)) {}

StdioServer::~StdioServer() {
    if (loop_.is_watched(input_fd_)) {
        loop_.unwatch_fd(input_fd_);
    }
}

void StdioServer::start() {
    loop_.watch_fd(input_fd_, POLLIN, [this](short revents) { on_readable(revents); });
}

void StdioServer::on_readable(short revents) {
    (void)revents;
    char buffer[READ_CHUNK_BYTES];
    ssize_t received = ::read(input_fd_, buffer, sizeof(buffer));
    if (received < 0) {
        if (errno == EINTR || errno == EAGAIN) {
            return;
        }
        debug_log::error(std::string("Read from input failed: ") + std::strerror(errno));
        end_of_input();
        return;
    }
    if (received == 0) {
        debug_log::log("EOF on input");
        end_of_input();
        return;
    }
    feed(std::string(buffer, static_cast<std::size_t>(received)));
}

void StdioServer::feed(const std::string &bytes) {
    for (const auto &message : decoder_.feed(bytes)) {
        dispatch(message);
    }
}

void StdioServer::end_of_input() {
    if (input_closed_) {
        return;
    }
    input_closed_ = true;
    if (loop_.is_watched(input_fd_)) {
        loop_.unwatch_fd(input_fd_);
    }
    for (const auto &message : decoder_.finish()) {
        dispatch(message);
    }
    check_drained();
}

void StdioServer::dispatch(const json &message) {
    if (debug_log::is_debug_enabled()) {
        debug_log::log(std::string("[rx ") + framing::framing_name(decoder_.framing()) + "] " +
                       text_excerpt::excerpt(message.dump(-1, ' ', false, json::error_handler_t::replace)));
    }
    dispatcher_.handle_message(message, [this](const json &response) {
        write_message(response);
        if (input_closed_) {
            check_drained();
        }
    });
}

void StdioServer::write_message(const json &message) {
    std::string encoded = framing::encode_message(message, decoder_.framing());
    if (debug_log::is_debug_enabled()) {
        debug_log::log(std::string("[tx ") + framing::framing_name(decoder_.framing()) + "] " +
                       text_excerpt::excerpt(encoded));
    }
    sink_(encoded);
}

void StdioServer::check_drained() {
    if (finished_ || !input_closed_) {
        return;
    }
    if (dispatcher_.in_flight() == 0) {
        debug_log::log("Input closed and all requests answered");
        finished_ = true;
    }
}

} // namespace mcp_stdio
