#ifndef MCPVISOR_MCP_STDIO_HPP
#define MCPVISOR_MCP_STDIO_HPP

// MCP stdio transport: reads framed JSON-RPC messages from an input descriptor, hands
// them to the dispatcher and writes responses with the framing the peer used.

#include <nlohmann/json.hpp>
#include <functional>
#include <string>

#include "protocol/framing.hpp"

namespace event_loop {
class EventLoop;
}

namespace mcp_dispatch {
class Dispatcher;
}

namespace mcp_stdio {

using json = nlohmann::json;

// Receives encoded bytes for the peer.
using OutputSink = std::function<void(const std::string &bytes)>;

// Blocking writer for a descriptor (normally stdout). Write errors are logged.
OutputSink descriptor_sink(int fd);

class StdioServer {
public:
    StdioServer(event_loop::EventLoop &loop, mcp_dispatch::Dispatcher &dispatcher, int input_fd, OutputSink sink);
    ~StdioServer();

    StdioServer(const StdioServer &) = delete;
    StdioServer &operator=(const StdioServer &) = delete;

    // Start watching the input descriptor.
    void start();

    // Decode and dispatch bytes as if read from the input.
    void feed(const std::string &bytes);

    // End of input: flush a trailing NDJSON line, then finish once in-flight calls settle.
    void end_of_input();

    // True after end of input with every dispatched request answered.
    bool finished() const { return finished_; }

    framing::Framing framing() const { return decoder_.framing(); }

private:
    void on_readable(short revents);
    void dispatch(const json &message);
    void write_message(const json &message);
    void check_drained();

    event_loop::EventLoop &loop_;
    mcp_dispatch::Dispatcher &dispatcher_;
    int input_fd_;
    OutputSink sink_;
    framing::FrameDecoder decoder_;
    bool input_closed_ = false;
    bool finished_ = false;
};

} // namespace mcp_stdio

#endif // MCPVISOR_MCP_STDIO_HPP
