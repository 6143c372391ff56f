#include "transferd/transfer/scheduler.h"
#include "transferd/base/logger.h"
#include "transferd/core/cancellation.h"
#include "transferd/core/slot_pool.h"
#include "transferd/net/url.h"
#include <algorithm>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <system_error>
#include <thread>

namespace transferd {

namespace fs = std::filesystem;

namespace {

constexpr const char* kDefaultCategory = "other";

// FIFO admission order
bool admitted_before(const Transfer& a, const Transfer& b) {
    if (a.created_at != b.created_at) {
        return a.created_at < b.created_at;
    }
    return a.sequence < b.sequence;
}

} // anonymous namespace

Scheduler::Options Scheduler::Options::from_config(const TransferConfig& config) {
    Options options;
    options.max_concurrent = config.max_concurrent;
    return options;
}

// One worker thread bound to one record
struct WorkerRun {
    uint64_t run_id = 0;
    CancellationTokenPtr token;
    std::thread thread;
    Transfer snapshot;
    // Set by cancel: the partial file goes once the thread lets go of it
    bool remove_partial = false;
};

struct Scheduler::Impl {
    Options options;
    std::shared_ptr<TransferStore> store;
    std::shared_ptr<TransferWorker> worker;
    EventBus& bus;
    std::shared_ptr<PlacementNotifier> notifier;
    AuthEscalationHook auth_hook;

    mutable std::mutex mutex;
    std::condition_variable exit_cv;
    std::map<std::string, Transfer> records;
    std::map<std::string, WorkerRun> runs;      // current run of each downloading record
    std::map<std::string, WorkerRun> draining;  // paused or canceled runs not yet exited
    std::vector<std::thread> finished;          // exited threads waiting to be joined
    uint32_t exiting = 0;
    SlotPool slots;
    uint64_t next_sequence = 1;
    uint64_t next_run_id = 1;
    bool started = false;
    bool stopping = false;

    Impl(Options opts, std::shared_ptr<TransferStore> s, std::shared_ptr<TransferWorker> w,
         EventBus& b, std::shared_ptr<PlacementNotifier> n)
        : options(opts), store(std::move(s)), worker(std::move(w)), bus(b),
          notifier(std::move(n)), slots(opts.max_concurrent) {}

    void persist(const Transfer& transfer) {
        if (!store->put(transfer)) {
            Logger::instance().error("Failed to persist transfer {} ({})", transfer.id, to_string(transfer.status));
        }
    }

    void publish(TransferEventKind kind, const Transfer& transfer) {
        TransferEvent event;
        event.kind = kind;
        event.transfer = transfer;
        bus.publish(std::move(event));
    }

    Transfer& find_or_throw(const std::string& id) {
        auto it = records.find(id);
        if (it == records.end()) {
            throw TransferdError(ErrorCode::NotFound, "Transfer not found: " + id);
        }
        return it->second;
    }

    std::string unique_id() const {
        while (true) {
            std::string id = generate_transfer_id();
            if (records.count(id) == 0 && !store->get(id)) {
                return id;
            }
        }
    }

    void remove_partial_file(const Transfer& transfer) {
        std::error_code ec;
        fs::remove(worker->partial_path(transfer), ec);
        if (ec) {
            Logger::instance().warning("Failed to delete partial file of {}: {}", transfer.id, ec.message());
        }
    }

    // Move a running worker out of the way; its slot is free immediately
    void retire_run_locked(const std::string& id, bool remove_partial) {
        auto it = runs.find(id);
        if (it == runs.end()) {
            return;
        }
        it->second.token->cancel();
        it->second.remove_partial = remove_partial;
        draining[id] = std::move(it->second);
        runs.erase(it);
        slots.release();
    }

    void admit_locked() {
        if (!started || stopping) {
            return;
        }

        std::vector<const Transfer*> candidates;
        for (const auto& [id, transfer] : records) {
            if (transfer.status == TransferStatus::Queued &&
                runs.count(id) == 0 && draining.count(id) == 0) {
                candidates.push_back(&transfer);
            }
        }
        std::sort(candidates.begin(), candidates.end(),
                  [](const Transfer* a, const Transfer* b) { return admitted_before(*a, *b); });

        for (const Transfer* candidate : candidates) {
            if (!slots.try_acquire()) {
                break;
            }
            start_locked(records[candidate->id]);
        }
    }

    void start_locked(Transfer& transfer) {
        uint64_t now = now_ms();
        transfer.status = TransferStatus::Downloading;
        if (transfer.started_at == 0) {
            transfer.started_at = now;
        }
        transfer.note = "Downloading";
        transfer.retry_count = 0;
        transfer.speed_bytes_per_sec = 0.0;
        transfer.eta_seconds = -1;
        transfer.updated_at = now;

        auto& run = runs[transfer.id];
        run.run_id = next_run_id++;
        run.token = std::make_shared<CancellationToken>();
        run.snapshot = transfer;

        try {
            run.thread = std::thread(&Impl::worker_main, this, transfer.id, run.run_id,
                                     transfer, run.token);
        } catch (const std::system_error& e) {
            runs.erase(transfer.id);
            slots.release();
            transfer.status = TransferStatus::Error;
            transfer.last_error = std::string("Failed to start worker: ") + e.what();
            transfer.error_code = ErrorCode::InternalError;
            transfer.note = "Error";
            persist(transfer);
            publish(TransferEventKind::Failed, transfer);
            Logger::instance().error("Transfer {}: {}", transfer.id, transfer.last_error);
            return;
        }

        persist(transfer);
        publish(TransferEventKind::Started, transfer);
        Logger::instance().info("Transfer {} started ({} of {} slots)", transfer.id,
                                slots.in_use(), slots.capacity());
    }

    void worker_main(std::string id, uint64_t run_id, Transfer snapshot, CancellationTokenPtr token) {
        WorkerResult result;
        try {
            result = worker->run(snapshot, *token, [this, &id, run_id](const WorkerProgress& progress) {
                on_progress(id, run_id, progress);
            });
        } catch (const std::exception& e) {
            result.outcome = WorkerOutcome::Failed;
            result.downloaded_bytes = snapshot.downloaded_bytes;
            result.total_bytes = snapshot.total_bytes;
            result.error_code = ErrorCode::InternalError;
            result.error_message = e.what();
        }
        on_finished(id, run_id, result);
    }

    void on_progress(const std::string& id, uint64_t run_id, const WorkerProgress& progress) {
        std::lock_guard<std::mutex> lock(mutex);
        auto run = runs.find(id);
        if (run == runs.end() || run->second.run_id != run_id) {
            return;
        }
        auto it = records.find(id);
        if (it == records.end() || it->second.status != TransferStatus::Downloading) {
            return;
        }

        Transfer& transfer = it->second;
        transfer.downloaded_bytes = progress.downloaded_bytes;
        transfer.total_bytes = progress.total_bytes;
        transfer.retry_count = progress.retry_count;
        if (progress.retrying) {
            transfer.speed_bytes_per_sec = 0.0;
            transfer.eta_seconds = -1;
            transfer.last_error = progress.last_error;
            transfer.note = fmt::format("Retrying ({}/{}) in {}ms", progress.retry_count,
                                        worker->options().max_attempts, progress.retry_delay.count());
        } else {
            transfer.speed_bytes_per_sec = progress.speed_bytes_per_sec;
            transfer.eta_seconds = progress.eta_seconds;
            transfer.note = "Downloading";
        }
        transfer.updated_at = now_ms();

        persist(transfer);
        publish(TransferEventKind::Progress, transfer);
    }

    void on_finished(const std::string& id, uint64_t run_id, const WorkerResult& result) {
        std::thread self;
        std::optional<Transfer> completed;
        std::optional<Transfer> auth_failed;
        std::shared_ptr<PlacementNotifier> placement;
        AuthEscalationHook hook;

        {
            std::lock_guard<std::mutex> lock(mutex);

            auto run = runs.find(id);
            auto drained = draining.find(id);
            if (run != runs.end() && run->second.run_id == run_id) {
                self = std::move(run->second.thread);
                runs.erase(run);
                slots.release();
                if (!stopping) {
                    finish_current_locked(id, result, completed, auth_failed);
                }
            } else if (drained != draining.end() && drained->second.run_id == run_id) {
                self = std::move(drained->second.thread);
                WorkerRun retired = std::move(drained->second);
                draining.erase(drained);
                finish_retired_locked(id, retired, result);
            } else {
                // stop() already took this thread
                return;
            }

            ++exiting;
            placement = notifier;
            hook = auth_hook;
            admit_locked();
        }

        if (completed && placement) {
            try {
                placement->on_completed(*completed, result.final_path);
            } catch (const std::exception& e) {
                Logger::instance().error("Placement notifier failed for {}: {}", id, e.what());
            }
        }
        if (auth_failed && hook) {
            try {
                hook(*auth_failed);
            } catch (const std::exception& e) {
                Logger::instance().error("Auth escalation failed for {}: {}", id, e.what());
            }
        }

        std::lock_guard<std::mutex> lock(mutex);
        finished.push_back(std::move(self));
        --exiting;
        exit_cv.notify_all();
    }

    void finish_current_locked(const std::string& id, const WorkerResult& result,
                               std::optional<Transfer>& completed,
                               std::optional<Transfer>& auth_failed) {
        auto it = records.find(id);
        if (it == records.end()) {
            return;
        }

        Transfer& transfer = it->second;
        transfer.downloaded_bytes = result.downloaded_bytes;
        transfer.total_bytes = result.total_bytes;
        transfer.retry_count = result.retry_count;
        transfer.speed_bytes_per_sec = 0.0;
        transfer.updated_at = now_ms();

        switch (result.outcome) {
            case WorkerOutcome::Completed:
                transfer.status = TransferStatus::Completed;
                transfer.completed_at = transfer.updated_at;
                transfer.eta_seconds = 0;
                transfer.last_error.clear();
                transfer.error_code = ErrorCode::Success;
                transfer.note = "Completed";
                persist(transfer);
                publish(TransferEventKind::Completed, transfer);
                completed = transfer;
                break;

            case WorkerOutcome::Failed:
                transfer.status = TransferStatus::Error;
                transfer.eta_seconds = -1;
                transfer.last_error = result.error_message;
                transfer.error_code = result.error_code;
                transfer.note = "Error: " + result.error_message;
                persist(transfer);
                publish(TransferEventKind::Failed, transfer);
                if (result.error_code == ErrorCode::AuthenticationFailed) {
                    auth_failed = transfer;
                }
                break;

            case WorkerOutcome::Cancelled:
                // Token fired without a pause or cancel command
                transfer.status = TransferStatus::Paused;
                transfer.eta_seconds = -1;
                transfer.note = "Paused";
                persist(transfer);
                publish(TransferEventKind::Paused, transfer);
                break;
        }
    }

    void finish_retired_locked(const std::string& id, const WorkerRun& retired, const WorkerResult& result) {
        if (retired.remove_partial) {
            remove_partial_file(retired.snapshot);
            return;
        }

        auto it = records.find(id);
        if (it == records.end()) {
            return;
        }

        // Publish the bytes the worker confirmed after the pause took effect
        Transfer& transfer = it->second;
        bool idle = transfer.status == TransferStatus::Paused || transfer.status == TransferStatus::Queued;
        if (!idle || stopping) {
            return;
        }
        if (transfer.downloaded_bytes == result.downloaded_bytes &&
            transfer.total_bytes == result.total_bytes) {
            return;
        }
        transfer.downloaded_bytes = result.downloaded_bytes;
        transfer.total_bytes = result.total_bytes;
        transfer.updated_at = now_ms();
        persist(transfer);
        publish(TransferEventKind::Progress, transfer);
    }

    void reap_finished() {
        std::vector<std::thread> threads;
        {
            std::lock_guard<std::mutex> lock(mutex);
            threads.swap(finished);
        }
        for (auto& thread : threads) {
            if (thread.joinable() && thread.get_id() != std::this_thread::get_id()) {
                thread.join();
            } else if (thread.joinable()) {
                thread.detach();
            }
        }
    }
};

Scheduler::Scheduler(Options options,
                     std::shared_ptr<TransferStore> store,
                     std::shared_ptr<TransferWorker> worker,
                     EventBus& bus,
                     std::shared_ptr<PlacementNotifier> notifier)
    : impl_(std::make_unique<Impl>(options, std::move(store), std::move(worker), bus, std::move(notifier))) {}

Scheduler::~Scheduler() {
    stop();
}

void Scheduler::start() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    if (impl_->started) {
        return;
    }

    size_t recovered = impl_->store->recover_interrupted();

    impl_->records.clear();
    uint64_t max_sequence = 0;
    for (auto& transfer : impl_->store->get_all()) {
        max_sequence = std::max(max_sequence, transfer.sequence);
        impl_->records[transfer.id] = std::move(transfer);
    }
    impl_->next_sequence = max_sequence + 1;

    impl_->started = true;
    impl_->stopping = false;

    Logger::instance().info("Scheduler started: {} transfers loaded, {} recovered, max {} concurrent",
                            impl_->records.size(), recovered, impl_->slots.capacity());
    impl_->admit_locked();
}

void Scheduler::stop() {
    std::vector<std::thread> threads;
    {
        std::unique_lock<std::mutex> lock(impl_->mutex);
        if (!impl_->started) {
            return;
        }
        impl_->stopping = true;

        for (auto& [id, run] : impl_->runs) {
            run.token->cancel();
        }
        for (auto& [id, run] : impl_->draining) {
            run.token->cancel();
        }

        impl_->exit_cv.wait(lock, [this]() {
            return impl_->runs.empty() && impl_->draining.empty() && impl_->exiting == 0;
        });

        threads.swap(impl_->finished);
        impl_->started = false;
    }

    for (auto& thread : threads) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    Logger::instance().info("Scheduler stopped");
}

bool Scheduler::is_running() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->started && !impl_->stopping;
}

Transfer Scheduler::enqueue(const TransferRequest& request) {
    impl_->reap_finished();

    if (request.source.empty()) {
        throw TransferdError(ErrorCode::InvalidRequest, "source is required");
    }
    auto url = parse_url(request.source);
    if (!url || (url->scheme != "http" && url->scheme != "https")) {
        throw TransferdError(ErrorCode::InvalidRequest, "source must be an http(s) URL: " + request.source);
    }
    if (!is_safe_path_component(request.destination_name)) {
        throw TransferdError(ErrorCode::InvalidRequest,
                             "invalid destination name '" + request.destination_name + "'");
    }
    std::string category = request.category.empty() ? kDefaultCategory : request.category;
    if (!is_safe_path_component(category)) {
        throw TransferdError(ErrorCode::InvalidRequest, "invalid category '" + category + "'");
    }

    std::lock_guard<std::mutex> lock(impl_->mutex);

    Transfer transfer;
    transfer.id = impl_->unique_id();
    transfer.source = request.source;
    transfer.destination_name = request.destination_name;
    transfer.category = category;
    transfer.file_type = classify_file_type(request.destination_name);
    transfer.media_id = request.media_id;
    transfer.total_bytes = request.total_bytes_hint;
    transfer.status = TransferStatus::Queued;
    transfer.note = "Queued";
    transfer.sequence = impl_->next_sequence++;
    transfer.created_at = now_ms();
    transfer.updated_at = transfer.created_at;

    if (!impl_->store->put(transfer)) {
        throw TransferdError(ErrorCode::StorageError, "failed to persist transfer " + transfer.id);
    }
    impl_->records[transfer.id] = transfer;
    impl_->publish(TransferEventKind::Added, transfer);
    Logger::instance().info("Transfer {} queued: {} -> {}/{}", transfer.id, transfer.source,
                            transfer.category, transfer.destination_name);

    impl_->admit_locked();
    return impl_->records[transfer.id];
}

Transfer Scheduler::pause(const std::string& id) {
    impl_->reap_finished();
    std::lock_guard<std::mutex> lock(impl_->mutex);

    Transfer& transfer = impl_->find_or_throw(id);
    if (transfer.status != TransferStatus::Downloading) {
        throw TransferdError(ErrorCode::InvalidState,
                             "cannot pause transfer " + id + " in status " + to_string(transfer.status));
    }

    impl_->retire_run_locked(id, false);

    transfer.status = TransferStatus::Paused;
    transfer.speed_bytes_per_sec = 0.0;
    transfer.eta_seconds = -1;
    transfer.note = "Paused";
    transfer.updated_at = now_ms();
    impl_->persist(transfer);
    impl_->publish(TransferEventKind::Paused, transfer);
    Logger::instance().info("Transfer {} paused at {} bytes", id, transfer.downloaded_bytes);

    Transfer snapshot = transfer;
    impl_->admit_locked();
    return snapshot;
}

Transfer Scheduler::resume(const std::string& id) {
    impl_->reap_finished();
    std::lock_guard<std::mutex> lock(impl_->mutex);

    Transfer& transfer = impl_->find_or_throw(id);
    if (transfer.status == TransferStatus::Downloading || transfer.status == TransferStatus::Completed) {
        throw TransferdError(ErrorCode::InvalidState,
                             "cannot resume transfer " + id + " in status " + to_string(transfer.status));
    }

    transfer.status = TransferStatus::Queued;
    transfer.last_error.clear();
    transfer.error_code = ErrorCode::Success;
    transfer.note = "Queued";
    transfer.updated_at = now_ms();
    impl_->persist(transfer);
    impl_->publish(TransferEventKind::Queued, transfer);
    Logger::instance().info("Transfer {} resumed from {} bytes", id, transfer.downloaded_bytes);

    impl_->admit_locked();
    return impl_->records[id];
}

void Scheduler::cancel(const std::string& id) {
    impl_->reap_finished();
    std::lock_guard<std::mutex> lock(impl_->mutex);

    auto it = impl_->records.find(id);
    if (it == impl_->records.end()) {
        Logger::instance().debug("Cancel of unknown transfer {} ignored", id);
        return;
    }
    Transfer snapshot = it->second;

    bool partial_in_use = false;
    if (impl_->runs.count(id) > 0) {
        impl_->retire_run_locked(id, true);
        partial_in_use = true;
    } else if (auto drained = impl_->draining.find(id); drained != impl_->draining.end()) {
        drained->second.remove_partial = true;
        partial_in_use = true;
    }

    if (!impl_->store->remove(id)) {
        Logger::instance().error("Failed to remove record of canceled transfer {}", id);
    }
    impl_->records.erase(it);

    if (!partial_in_use && snapshot.status != TransferStatus::Completed) {
        impl_->remove_partial_file(snapshot);
    }

    impl_->publish(TransferEventKind::Canceled, snapshot);
    Logger::instance().info("Transfer {} canceled", id);

    impl_->admit_locked();
}

size_t Scheduler::clear_completed() {
    impl_->reap_finished();
    std::lock_guard<std::mutex> lock(impl_->mutex);

    size_t count = 0;
    for (auto it = impl_->records.begin(); it != impl_->records.end();) {
        if (it->second.status != TransferStatus::Completed) {
            ++it;
            continue;
        }
        if (!impl_->store->remove(it->first)) {
            Logger::instance().error("Failed to remove completed transfer {}", it->first);
            ++it;
            continue;
        }
        it = impl_->records.erase(it);
        ++count;
    }

    if (count > 0) {
        TransferEvent event;
        event.kind = TransferEventKind::Cleared;
        event.count = count;
        impl_->bus.publish(std::move(event));
        Logger::instance().info("Cleared {} completed transfers", count);
    }
    return count;
}

std::vector<Transfer> Scheduler::list(const TransferFilter& filter) const {
    std::vector<Transfer> result;
    {
        std::lock_guard<std::mutex> lock(impl_->mutex);
        for (const auto& [id, transfer] : impl_->records) {
            if (filter.matches(transfer)) {
                result.push_back(transfer);
            }
        }
    }
    std::sort(result.begin(), result.end(),
              [](const Transfer& a, const Transfer& b) { return admitted_before(b, a); });
    return result;
}

std::optional<Transfer> Scheduler::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    auto it = impl_->records.find(id);
    if (it == impl_->records.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Scheduler::set_max_concurrent(uint32_t n) {
    if (n == 0) {
        throw TransferdError(ErrorCode::InvalidRequest, "max_concurrent must be at least 1");
    }
    impl_->reap_finished();
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->slots.set_capacity(n);
    Logger::instance().info("Max concurrent transfers set to {}", n);
    impl_->admit_locked();
}

uint32_t Scheduler::max_concurrent() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return impl_->slots.capacity();
}

uint32_t Scheduler::active_count() const {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    return static_cast<uint32_t>(impl_->runs.size());
}

void Scheduler::set_auth_escalation_hook(AuthEscalationHook hook) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->auth_hook = std::move(hook);
}

} // namespace transferd
