#ifndef TRANSFERD_TRANSFER_WORKER_H
#define TRANSFERD_TRANSFER_WORKER_H

#include "transferd/base/config.h"
#include "transferd/base/error_code.h"
#include "transferd/core/cancellation.h"
#include "transferd/core/retry_policy.h"
#include "transferd/core/transfer.h"
#include "transferd/net/http.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace transferd {

// Periodic report from a running worker
struct WorkerProgress {
    uint64_t downloaded_bytes = 0;
    uint64_t total_bytes = 0;
    double speed_bytes_per_sec = 0.0;
    int64_t eta_seconds = -1;
    uint32_t retry_count = 0;

    // Set when the report announces a retry wait
    bool retrying = false;
    std::chrono::milliseconds retry_delay{0};
    std::string last_error;
};

using WorkerProgressCallback = std::function<void(const WorkerProgress&)>;

enum class WorkerOutcome {
    Completed,
    Cancelled,
    Failed
};

std::string to_string(WorkerOutcome outcome);

struct WorkerResult {
    WorkerOutcome outcome = WorkerOutcome::Failed;
    uint64_t downloaded_bytes = 0;
    uint64_t total_bytes = 0;
    uint32_t retry_count = 0;
    ErrorCode error_code = ErrorCode::Success;
    std::string error_message;
    std::string final_path;    // Completed only
};

// Executes one transfer's network I/O: range requests, partial file,
// progress sampling and the in-worker retry loop.
class TransferWorker {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    struct Options {
        std::string download_dir = "./downloads";
        uint32_t max_attempts = 3;
        size_t chunk_size = 64 * 1024;
        std::chrono::milliseconds request_timeout{30000};
        std::chrono::milliseconds sample_interval{1000};
        uint32_t max_redirects = 5;
        std::string auth_token;
        std::string user_agent = "transferd/0.1.0";

        static Options from_config(const TransferConfig& config);
    };

    TransferWorker(Options options, std::shared_ptr<HttpSource> source,
                   std::shared_ptr<RetryPolicy> retry_policy, Clock clock = nullptr);

    // Run to completion, cancellation or final failure. Thread-safe; one call per transfer.
    WorkerResult run(const Transfer& snapshot, CancellationToken& token,
                     const WorkerProgressCallback& on_progress) const;

    const Options& options() const { return options_; }

    // <download_dir>/<category>/<destination_name>
    std::string final_path(const Transfer& transfer) const;
    // Final path plus ".<id>.part", so transfers sharing a destination never share bytes
    std::string partial_path(const Transfer& transfer) const;

private:
    struct Attempt;

    Attempt attempt_once(const Transfer& snapshot, CancellationToken& token,
                         uint64_t& downloaded, uint64_t& total, uint32_t retry_count,
                         const WorkerProgressCallback& on_progress) const;

    Options options_;
    std::shared_ptr<HttpSource> source_;
    std::shared_ptr<RetryPolicy> retry_policy_;
    Clock clock_;
};

} // namespace transferd

#endif // TRANSFERD_TRANSFER_WORKER_H
