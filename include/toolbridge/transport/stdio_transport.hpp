#pragma once

#include <toolbridge/protocol/dispatcher.hpp>

#include <condition_variable>
#include <cstddef>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace toolbridge {

struct StdioOptions {
    // Dispatch every line on its own worker; responses may then leave in a
    // different order than the requests arrived.
    bool pipelined = false;
    // Upper bound on lines dispatched concurrently in pipelined mode. Reading
    // pauses while this many are in flight.
    size_t max_in_flight = 64;
};

// ---------------------------------------------------------------------------
// StdioTransport: newline-delimited envelopes over a pair of streams.
//
// One request per input line, one response per output line. Blank lines
// are skipped. Lines that are not JSON get an InternalTransportError
// response with a null id. Run() returns when the input stream ends.
// ---------------------------------------------------------------------------
class StdioTransport {
public:
    explicit StdioTransport(ProtocolDispatcher& dispatcher,
                            std::istream& in = std::cin,
                            std::ostream& out = std::cout,
                            StdioOptions options = {});

    // Serve until EOF. Returns the number of responses written.
    size_t Run();

    /// Handle one input line and return the serialized response line
    /// (without the trailing newline), or nullopt for a blank line.
    [[nodiscard]] std::optional<std::string> HandleLine(const std::string& line);

private:
    void WriteLine(const std::string& text);
    void WaitForSlot();
    void ReleaseSlot();


    ProtocolDispatcher& dispatcher_;
    std::istream& in_;
    std::ostream& out_;
    StdioOptions options_;
    std::mutex write_mutex_;

    std::mutex slots_mutex_;
    std::condition_variable slot_freed_;
    size_t in_flight_ = 0;
};

} // namespace toolbridge
