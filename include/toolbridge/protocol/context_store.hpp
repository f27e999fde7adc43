#pragma once

#include <toolbridge/core/result.hpp>

#include <chrono>
#include <condition_variable>
#include <deque>
#include <fstream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <nlohmann/json.hpp>

namespace toolbridge {

enum class InteractionOutcome {
    Success,
    Failure,
};

// ---------------------------------------------------------------------------
// InteractionRecord: what the dispatcher reports about one handled request.
// ---------------------------------------------------------------------------
struct InteractionRecord {
    std::string method;
    InteractionOutcome outcome = InteractionOutcome::Success;
    std::optional<ErrorCode> error_code;
    std::chrono::milliseconds latency{0};
    std::chrono::system_clock::time_point timestamp;
};

[[nodiscard]] nlohmann::json ToJson(const InteractionRecord& record);

// ---------------------------------------------------------------------------
// IContextStore: persistence sink for interaction records.
// Implementations may block; callers that must not block go through
// AsyncContextRecorder.
// ---------------------------------------------------------------------------
class IContextStore {
public:
    virtual ~IContextStore() = default;

    [[nodiscard]] virtual Result<void, Error> Record(
        const InteractionRecord& record) = 0;
};

// ---------------------------------------------------------------------------
// JsonlContextStore: appends one JSON object per record to a file.
// ---------------------------------------------------------------------------
class JsonlContextStore : public IContextStore {
public:
    explicit JsonlContextStore(const std::string& path);

    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }
    [[nodiscard]] const std::string& Path() const noexcept { return path_; }

    [[nodiscard]] Result<void, Error> Record(const InteractionRecord& record) override;

private:
    std::string path_;
    std::mutex mutex_;
    std::ofstream file_;
};

// ---------------------------------------------------------------------------
// AsyncContextRecorder: fire-and-forget front for an IContextStore.
//
// Submit() only enqueues. A single worker thread writes records in
// submission order; store failures are logged as warnings and dropped.
// The destructor drains the queue before joining the worker.
// ---------------------------------------------------------------------------
class AsyncContextRecorder {
public:
    explicit AsyncContextRecorder(std::shared_ptr<IContextStore> store);
    ~AsyncContextRecorder();

    AsyncContextRecorder(const AsyncContextRecorder&) = delete;
    AsyncContextRecorder& operator=(const AsyncContextRecorder&) = delete;

    void Submit(InteractionRecord record);

    /// Block until every record submitted so far has been handed to the store.
    void Flush();

private:
    void WorkerLoop();

    std::shared_ptr<IContextStore> store_;
    std::mutex mutex_;
    std::condition_variable work_available_;
    std::condition_variable idle_;
    std::deque<InteractionRecord> queue_;
    bool busy_ = false;
    bool stopping_ = false;
    std::thread worker_;
};

} // namespace toolbridge
