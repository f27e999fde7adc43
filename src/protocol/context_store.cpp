#include <toolbridge/protocol/context_store.hpp>

#include <toolbridge/core/log.hpp>

#include <ctime>
#include <exception>
#include <iomanip>
#include <sstream>

namespace toolbridge {

namespace {

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;
    const auto t = std::chrono::system_clock::to_time_t(tp);
    std::tm utc{};
    gmtime_r(&t, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

} // anonymous namespace

nlohmann::json ToJson(const InteractionRecord& record) {
    nlohmann::json out = {
        {"timestamp", FormatTimestamp(record.timestamp)},
        {"method", record.method},
        {"outcome", record.outcome == InteractionOutcome::Success ? "success"
                                                                   : "failure"},
        {"latency_ms", record.latency.count()}
    };
    if (record.error_code) {
        out["error_code"] = WireCode(*record.error_code);
        out["error_kind"] = ErrorCodeName(*record.error_code);
    }
    return out;
}

// ---------------------------------------------------------------------------
// JsonlContextStore
// ---------------------------------------------------------------------------
JsonlContextStore::JsonlContextStore(const std::string& path)
    : path_(path), file_(path, std::ios::out | std::ios::app) {}

Result<void, Error> JsonlContextStore::Record(const InteractionRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return Result<void, Error>::Err(Error{
            "Record", "context store file is not open",
            ErrorCode::ExecutionFailed, path_, {}});
    }
    file_ << ToJson(record).dump(-1, ' ', false,
                                 nlohmann::json::error_handler_t::replace)
          << '\n';
    file_.flush();
    if (!file_) {
        file_.clear();
        return Result<void, Error>::Err(Error{
            "Record", "failed to append to context store",
            ErrorCode::ExecutionFailed, path_, {}});
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// AsyncContextRecorder
// ---------------------------------------------------------------------------
AsyncContextRecorder::AsyncContextRecorder(std::shared_ptr<IContextStore> store)
    : store_(std::move(store)), worker_([this] { WorkerLoop(); }) {}

AsyncContextRecorder::~AsyncContextRecorder() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    work_available_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void AsyncContextRecorder::Submit(InteractionRecord record) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push_back(std::move(record));
    }
    work_available_.notify_one();
}

void AsyncContextRecorder::Flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return queue_.empty() && !busy_; });
}

void AsyncContextRecorder::WorkerLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        work_available_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            // stopping_ with nothing left to write
            break;
        }

        auto record = std::move(queue_.front());
        queue_.pop_front();
        busy_ = true;
        lock.unlock();

        try {
            auto written = store_->Record(record);
            if (written.IsErr()) {
                LogWarn("context", "dropped record for '" + record.method +
                                       "': " + written.Error().ToString());
            }
        } catch (const std::exception& e) {
            LogWarn("context", "dropped record for '" + record.method +
                                   "': store threw: " + e.what());
        } catch (...) {
            LogWarn("context", "dropped record for '" + record.method +
                                   "': store threw a non-standard exception");
        }

        lock.lock();
        busy_ = false;
        if (queue_.empty()) {
            idle_.notify_all();
        }
    }
    idle_.notify_all();
}

} // namespace toolbridge
