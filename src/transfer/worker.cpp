#include "transferd/transfer/worker.h"
#include "transferd/base/logger.h"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <vector>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace transferd {

namespace fs = std::filesystem;

namespace {

constexpr const char* kPartialSuffix = ".part";

// The .part file a worker appends to. Closed on destruction.
class PartialFile {
public:
    ~PartialFile() { close(); }

    bool open(const std::string& path) {
        fd_ = ::open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
        if (fd_ < 0) {
            error_ = "Failed to open " + path + ": " + std::strerror(errno);
            return false;
        }
        return true;
    }

    uint64_t size() const {
        struct stat st;
        if (::fstat(fd_, &st) != 0) {
            return 0;
        }
        return static_cast<uint64_t>(st.st_size);
    }

    // Drop everything past `length` and append from there
    bool truncate(uint64_t length) {
        if (::ftruncate(fd_, static_cast<off_t>(length)) != 0 ||
            ::lseek(fd_, static_cast<off_t>(length), SEEK_SET) < 0) {
            error_ = std::string("Failed to truncate partial file: ") + std::strerror(errno);
            return false;
        }
        return true;
    }

    bool write(const char* data, size_t len) {
        size_t written = 0;
        while (written < len) {
            ssize_t n = ::write(fd_, data + written, len - written);
            if (n < 0) {
                if (errno == EINTR) continue;
                error_ = std::string("Failed to write partial file: ") + std::strerror(errno);
                return false;
            }
            written += static_cast<size_t>(n);
        }
        return true;
    }

    bool sync() {
        if (::fdatasync(fd_) != 0) {
            error_ = std::string("Failed to flush partial file: ") + std::strerror(errno);
            return false;
        }
        return true;
    }

    void close() {
        if (fd_ >= 0) {
            ::close(fd_);
            fd_ = -1;
        }
    }

    const std::string& error() const { return error_; }

private:
    int fd_ = -1;
    std::string error_;
};

} // anonymous namespace

std::string to_string(WorkerOutcome outcome) {
    switch (outcome) {
        case WorkerOutcome::Completed: return "completed";
        case WorkerOutcome::Cancelled: return "cancelled";
        case WorkerOutcome::Failed: return "failed";
    }
    return "failed";
}

struct TransferWorker::Attempt {
    WorkerOutcome outcome = WorkerOutcome::Failed;
    FailureKind kind = FailureKind::TransientNetwork;
    // Local failures (disk, bad input) are never retried and carry their own code
    bool local = false;
    ErrorCode local_code = ErrorCode::Success;
    std::string message;
    std::string final_path;

    static Attempt done(WorkerOutcome outcome) {
        Attempt a;
        a.outcome = outcome;
        return a;
    }

    static Attempt failure(FailureKind kind, std::string message) {
        Attempt a;
        a.kind = kind;
        a.message = std::move(message);
        return a;
    }

    static Attempt local_failure(ErrorCode code, std::string message) {
        Attempt a;
        a.local = true;
        a.local_code = code;
        a.message = std::move(message);
        return a;
    }

    ErrorCode error_code() const { return local ? local_code : error_code_for(kind); }
};

TransferWorker::Options TransferWorker::Options::from_config(const TransferConfig& config) {
    Options options;
    options.download_dir = config.download_dir;
    options.max_attempts = config.max_attempts;
    options.chunk_size = static_cast<size_t>(config.chunk_size_kb == 0 ? 64 : config.chunk_size_kb) * 1024;
    options.request_timeout = std::chrono::seconds(config.request_timeout_sec);
    options.auth_token = config.auth_token;
    options.user_agent = config.user_agent;
    return options;
}

TransferWorker::TransferWorker(Options options, std::shared_ptr<HttpSource> source,
                               std::shared_ptr<RetryPolicy> retry_policy, Clock clock)
    : options_(std::move(options)),
      source_(std::move(source)),
      retry_policy_(std::move(retry_policy)),
      clock_(std::move(clock)) {
    if (!retry_policy_) {
        retry_policy_ = std::make_shared<RetryPolicy>();
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
    if (options_.chunk_size == 0) {
        options_.chunk_size = 64 * 1024;
    }
}

std::string TransferWorker::final_path(const Transfer& transfer) const {
    return (fs::path(options_.download_dir) / transfer.category / transfer.destination_name).string();
}

std::string TransferWorker::partial_path(const Transfer& transfer) const {
    return final_path(transfer) + "." + transfer.id + kPartialSuffix;
}

WorkerResult TransferWorker::run(const Transfer& snapshot, CancellationToken& token,
                                 const WorkerProgressCallback& on_progress) const {
    WorkerResult result;
    uint64_t downloaded = snapshot.downloaded_bytes;
    uint64_t total = snapshot.total_bytes;
    uint32_t retry_count = 0;

    auto finish = [&](WorkerOutcome outcome) {
        result.outcome = outcome;
        result.downloaded_bytes = downloaded;
        result.total_bytes = total;
        result.retry_count = retry_count;
        return result;
    };

    if (!is_safe_path_component(snapshot.destination_name) || !is_safe_path_component(snapshot.category) ||
        !is_safe_path_component(snapshot.id)) {
        result.error_code = ErrorCode::InvalidRequest;
        result.error_message = "Unsafe destination for transfer " + snapshot.id;
        return finish(WorkerOutcome::Failed);
    }

    std::error_code ec;
    fs::create_directories(fs::path(final_path(snapshot)).parent_path(), ec);
    if (ec) {
        result.error_code = ErrorCode::StorageError;
        result.error_message = "Failed to create download directory: " + ec.message();
        return finish(WorkerOutcome::Failed);
    }

    while (true) {
        Attempt attempt = attempt_once(snapshot, token, downloaded, total, retry_count, on_progress);

        if (attempt.outcome == WorkerOutcome::Completed) {
            result.final_path = attempt.final_path;
            Logger::instance().info("Transfer {} completed: {} bytes", snapshot.id, downloaded);
            return finish(WorkerOutcome::Completed);
        }
        if (attempt.outcome == WorkerOutcome::Cancelled) {
            Logger::instance().debug("Transfer {} stopped at {} bytes", snapshot.id, downloaded);
            return finish(WorkerOutcome::Cancelled);
        }

        result.error_code = attempt.error_code();
        result.error_message = attempt.message;

        if (attempt.local ||
            !RetryPolicy::should_retry(attempt.kind, retry_count, options_.max_attempts)) {
            Logger::instance().error("Transfer {} failed after {} retries: {}",
                                     snapshot.id, retry_count, attempt.message);
            return finish(WorkerOutcome::Failed);
        }

        auto delay = retry_policy_->jittered_delay(retry_count);
        ++retry_count;
        Logger::instance().warning("Transfer {} attempt failed ({}), retry {}/{} in {}ms",
                                   snapshot.id, attempt.message, retry_count,
                                   options_.max_attempts, delay.count());

        if (on_progress) {
            WorkerProgress progress;
            progress.downloaded_bytes = downloaded;
            progress.total_bytes = total;
            progress.retry_count = retry_count;
            progress.retrying = true;
            progress.retry_delay = delay;
            progress.last_error = attempt.message;
            on_progress(progress);
        }

        if (token.wait_for(delay)) {
            return finish(WorkerOutcome::Cancelled);
        }
    }
}

TransferWorker::Attempt TransferWorker::attempt_once(const Transfer& snapshot, CancellationToken& token,
                                                     uint64_t& downloaded, uint64_t& total,
                                                     uint32_t retry_count,
                                                     const WorkerProgressCallback& on_progress) const {
    if (token.is_cancelled()) {
        return Attempt::done(WorkerOutcome::Cancelled);
    }

    const std::string part_path = partial_path(snapshot);
    const std::string done_path = final_path(snapshot);

    PartialFile file;
    if (!file.open(part_path)) {
        return Attempt::local_failure(ErrorCode::StorageError, file.error());
    }

    // The record may claim more than reached the disk before a crash
    uint64_t on_disk = file.size();
    if (downloaded > on_disk) {
        Logger::instance().warning("Transfer {}: record claims {} bytes, partial file has {}",
                                   snapshot.id, downloaded, on_disk);
        downloaded = on_disk;
    }
    if (!file.truncate(downloaded)) {
        return Attempt::local_failure(ErrorCode::StorageError, file.error());
    }

    auto report = [&](double speed, int64_t eta) {
        if (on_progress) {
            WorkerProgress progress;
            progress.downloaded_bytes = downloaded;
            progress.total_bytes = total;
            progress.speed_bytes_per_sec = speed;
            progress.eta_seconds = eta;
            progress.retry_count = retry_count;
            on_progress(progress);
        }
    };

    // Exit paths that keep the partial file still flush what was written
    auto flush = [&]() {
        if (!file.sync()) {
            Logger::instance().warning("Transfer {}: {}", snapshot.id, file.error());
        }
    };

    auto complete = [&]() -> Attempt {
        if (!file.sync()) {
            return Attempt::local_failure(ErrorCode::StorageError, file.error());
        }
        file.close();
        if (token.is_cancelled()) {
            return Attempt::done(WorkerOutcome::Cancelled);
        }
        if (total == 0) {
            total = downloaded;
        }
        std::error_code ec;
        fs::rename(part_path, done_path, ec);
        if (ec) {
            return Attempt::local_failure(ErrorCode::StorageError,
                                          "Failed to move " + part_path + " into place: " + ec.message());
        }
        Attempt a = Attempt::done(WorkerOutcome::Completed);
        a.final_path = done_path;
        return a;
    };

    bool restarted = false;
    HttpResult fetched;

    // One restart is allowed after an unsatisfiable range
    while (true) {
        if (token.is_cancelled()) {
            return Attempt::done(WorkerOutcome::Cancelled);
        }

        HttpRequest request;
        request.url = snapshot.source;
        request.max_redirects = options_.max_redirects;
        request.timeout = options_.request_timeout;
        request.token = &token;
        request.set_header("User-Agent", options_.user_agent);
        request.set_header("Accept", "*/*");
        if (!options_.auth_token.empty()) {
            request.set_header("Authorization", "Bearer " + options_.auth_token);
        }
        if (downloaded > 0) {
            request.set_header("Range", "bytes=" + std::to_string(downloaded) + "-");
        }

        fetched = source_->fetch(request);
        if (!fetched.ok()) {
            if (fetched.error == ErrorCode::Cancelled) {
                return Attempt::done(WorkerOutcome::Cancelled);
            }
            if (fetched.error == ErrorCode::InvalidRequest) {
                return Attempt::local_failure(ErrorCode::InvalidRequest, fetched.message);
            }
            if (fetched.error == ErrorCode::PermanentTransferError) {
                return Attempt::failure(FailureKind::ClientError, fetched.message);
            }
            return Attempt::failure(FailureKind::TransientNetwork, fetched.message);
        }

        int status = fetched.response.status_code();

        if (status == 416 && downloaded > 0) {
            if (total > 0 && downloaded >= total) {
                return complete();
            }
            if (!restarted) {
                Logger::instance().warning("Transfer {}: range {} not satisfiable, restarting",
                                           snapshot.id, downloaded);
                restarted = true;
                downloaded = 0;
                if (!file.truncate(0)) {
                    return Attempt::local_failure(ErrorCode::StorageError, file.error());
                }
                continue;
            }
        }

        if (status >= 400) {
            return Attempt::failure(classify_http_status(status),
                                    "HTTP " + std::to_string(status) +
                                    (fetched.response.head.reason.empty() ? "" : " " + fetched.response.head.reason));
        }
        // A 3xx here is one the source did not follow, e.g. without a Location
        if (status < 200 || status >= 300) {
            return Attempt::failure(FailureKind::ClientError, "Unexpected HTTP status " + std::to_string(status));
        }
        break;
    }

    const auto& head = fetched.response.head;
    auto content_length = head.content_length();

    if (fetched.response.status_code() == 206) {
        auto range = parse_content_range(head.get_header("content-range"));
        if (range && range->first != downloaded) {
            return Attempt::failure(FailureKind::ClientError,
                                    "Server resumed at offset " + std::to_string(range->first) +
                                    ", expected " + std::to_string(downloaded));
        }
        if (range && range->total) {
            total = *range->total;
        } else if (content_length) {
            total = downloaded + *content_length;
        }
        Logger::instance().debug("Transfer {} resuming at {} of {}", snapshot.id, downloaded, total);
    } else {
        // Full body: any previous bytes are discarded
        if (downloaded > 0) {
            Logger::instance().info("Transfer {}: server ignored range, restarting from 0", snapshot.id);
        }
        downloaded = 0;
        if (!file.truncate(0)) {
            return Attempt::local_failure(ErrorCode::StorageError, file.error());
        }
        total = content_length.value_or(0);
        report(0.0, -1);
    }

    std::vector<char> buffer(options_.chunk_size);
    auto sample_time = clock_();
    uint64_t sample_bytes = downloaded;
    double speed = 0.0;

    while (true) {
        if (token.is_cancelled()) {
            flush();
            return Attempt::done(WorkerOutcome::Cancelled);
        }

        size_t received = 0;
        IoStatus io = fetched.response.body->read(buffer.data(), buffer.size(), received);

        if (io == IoStatus::Closed) {
            break;
        }
        if (io == IoStatus::Interrupted) {
            flush();
            return Attempt::done(WorkerOutcome::Cancelled);
        }
        if (io != IoStatus::Ok) {
            flush();
            std::string reason = fetched.response.body->last_error();
            return Attempt::failure(FailureKind::TransientNetwork,
                                    "Read failed at " + std::to_string(downloaded) + " bytes: " +
                                    (reason.empty() ? to_string(io) : reason));
        }

        if (!file.write(buffer.data(), received)) {
            return Attempt::local_failure(ErrorCode::StorageError, file.error());
        }
        downloaded += received;
        if (total > 0 && downloaded > total) {
            total = downloaded;
        }

        auto now = clock_();
        auto elapsed = std::chrono::duration<double>(now - sample_time);
        if (elapsed >= options_.sample_interval) {
            speed = static_cast<double>(downloaded - sample_bytes) / elapsed.count();
            int64_t eta = -1;
            if (total > 0 && speed > 0.0) {
                eta = static_cast<int64_t>(static_cast<double>(total - downloaded) / speed);
            }
            if (!file.sync()) {
                return Attempt::local_failure(ErrorCode::StorageError, file.error());
            }
            report(speed, eta);
            sample_time = now;
            sample_bytes = downloaded;
        }
    }

    if (total > 0 && downloaded < total) {
        flush();
        return Attempt::failure(FailureKind::TransientNetwork,
                                "Truncated body: got " + std::to_string(downloaded) +
                                " of " + std::to_string(total) + " bytes");
    }

    return complete();
}

} // namespace transferd
