#include <toolbridge/transport/stdio_transport.hpp>

#include <toolbridge/core/log.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <list>
#include <memory>
#include <system_error>
#include <thread>

namespace toolbridge {

namespace {

bool IsBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

struct Worker {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
};

// Joins every worker still in the list, on every exit path of Run().
struct WorkerJoiner {
    std::list<Worker>& workers;

    void JoinAll() {
        for (auto& worker : workers) {
            if (worker.thread.joinable()) {
                worker.thread.join();
            }
        }
        workers.clear();
    }

    ~WorkerJoiner() { JoinAll(); }
};

void ReapFinished(std::list<Worker>& workers) {
    for (auto it = workers.begin(); it != workers.end();) {
        if (it->done && it->done->load()) {
            it->thread.join();
            it = workers.erase(it);
        } else {
            ++it;
        }
    }
}

} // anonymous namespace

StdioTransport::StdioTransport(ProtocolDispatcher& dispatcher,
                               std::istream& in,
                               std::ostream& out,
                               StdioOptions options)
    : dispatcher_(dispatcher), in_(in), out_(out), options_(options) {}

std::optional<std::string> StdioTransport::HandleLine(const std::string& line) {
    if (IsBlank(line)) {
        return std::nullopt;
    }
    auto response = dispatcher_.DispatchText(line);
    return ToJson(response).dump(-1, ' ', false,
                                 nlohmann::json::error_handler_t::replace);
}

size_t StdioTransport::Run() {
    LogInfo("stdio", options_.pipelined ? "serving envelopes on stdin (pipelined)"
                                        : "serving envelopes on stdin");
    std::atomic<size_t> written{0};
    auto respond = [this, &written](const std::string& request) {
        if (auto response = HandleLine(request)) {
            WriteLine(*response);
            ++written;
        }
    };

    std::list<Worker> workers;
    WorkerJoiner joiner{workers};

    std::string line;
    while (std::getline(in_, line)) {
        if (!options_.pipelined) {
            respond(line);
            continue;
        }
        if (IsBlank(line)) continue;

        ReapFinished(workers);
        WaitForSlot();

        auto done = std::make_shared<std::atomic<bool>>(false);
        workers.emplace_back();
        workers.back().done = done;
        try {
            workers.back().thread = std::thread([this, respond, done, request = line] {
                respond(request);
                done->store(true);
                ReleaseSlot();
            });
        } catch (const std::system_error& e) {
            workers.pop_back();
            ReleaseSlot();
            LogWarn("stdio", std::string("cannot start worker, answering inline: ") +
                                 e.what());
            respond(line);
        }
    }

    joiner.JoinAll();
    LogInfo("stdio", "input closed after " + std::to_string(written.load()) +
                         " response(s)");
    return written.load();
}

void StdioTransport::WaitForSlot() {
    const size_t limit = options_.max_in_flight == 0 ? 1 : options_.max_in_flight;
    std::unique_lock<std::mutex> lock(slots_mutex_);
    slot_freed_.wait(lock, [this, limit] { return in_flight_ < limit; });
    ++in_flight_;
}

void StdioTransport::ReleaseSlot() {
    {
        std::lock_guard<std::mutex> lock(slots_mutex_);
        --in_flight_;
    }
    slot_freed_.notify_one();
}

void StdioTransport::WriteLine(const std::string& text) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    out_ << text << '\n';
    out_.flush();
}

} // namespace toolbridge
