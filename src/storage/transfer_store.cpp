#include "transferd/storage/transfer_store.h"
#include "transferd/base/logger.h"
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <unistd.h>
#include <nlohmann/json.hpp>

namespace transferd {

namespace fs = std::filesystem;

namespace {

constexpr const char* kRecordExtension = ".json";
constexpr const char* kTempSuffix = ".tmp";
constexpr const char* kRestartNote = "Paused (interrupted by restart)";

bool write_all(int fd, const std::string& data) {
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        written += static_cast<size_t>(n);
    }
    return true;
}

} // anonymous namespace

std::vector<Transfer> TransferStore::list_by_status(TransferStatus status) const {
    std::vector<Transfer> result;
    for (auto& transfer : get_all()) {
        if (transfer.status == status) {
            result.push_back(std::move(transfer));
        }
    }
    return result;
}

size_t TransferStore::recover_interrupted() {
    size_t recovered = 0;
    for (auto& transfer : list_by_status(TransferStatus::Downloading)) {
        transfer.status = TransferStatus::Paused;
        transfer.note = kRestartNote;
        transfer.speed_bytes_per_sec = 0.0;
        transfer.eta_seconds = -1;
        transfer.updated_at = now_ms();
        if (put(transfer)) {
            ++recovered;
            Logger::instance().info("Transfer {} interrupted by restart, now paused at {} bytes",
                                    transfer.id, transfer.downloaded_bytes);
        } else {
            Logger::instance().error("Failed to persist recovered transfer {}", transfer.id);
        }
    }
    return recovered;
}

// FileTransferStore

FileTransferStore::FileTransferStore(std::string directory)
    : directory_(std::move(directory)) {}

bool FileTransferStore::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        fs::create_directories(directory_);

        // A crash between write and rename leaves temp files behind
        for (const auto& entry : fs::directory_iterator(directory_)) {
            const auto name = entry.path().filename().string();
            if (entry.is_regular_file() && name.size() > std::strlen(kTempSuffix) &&
                name.compare(name.size() - std::strlen(kTempSuffix), std::string::npos, kTempSuffix) == 0) {
                Logger::instance().warning("Removing stale temp record: " + name);
                fs::remove(entry.path());
            }
        }
    } catch (const fs::filesystem_error& e) {
        Logger::instance().error("Failed to initialize transfer store at {}: {}", directory_, e.what());
        return false;
    }
    Logger::instance().info("Transfer store initialized at: " + directory_);
    return true;
}

std::string FileTransferStore::record_path(const std::string& id) const {
    return (fs::path(directory_) / (id + kRecordExtension)).string();
}

bool FileTransferStore::sync_directory() const {
    int dir_fd = ::open(directory_.c_str(), O_RDONLY | O_DIRECTORY);
    if (dir_fd < 0) {
        return false;
    }
    bool ok = ::fsync(dir_fd) == 0;
    ::close(dir_fd);
    return ok;
}

bool FileTransferStore::put(const Transfer& transfer) {
    if (!is_safe_path_component(transfer.id)) {
        Logger::instance().error("Refusing to persist transfer with unsafe id '{}'", transfer.id);
        return false;
    }

    std::string payload = nlohmann::json(transfer).dump(2);
    std::string final_path = record_path(transfer.id);
    std::string temp_path = final_path + kTempSuffix;

    std::lock_guard<std::mutex> lock(mutex_);

    int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        Logger::instance().error("Failed to open {}: {}", temp_path, std::strerror(errno));
        return false;
    }

    bool ok = write_all(fd, payload) && ::fsync(fd) == 0;
    int saved_errno = errno;
    ::close(fd);

    if (!ok) {
        Logger::instance().error("Failed to write record {}: {}", transfer.id, std::strerror(saved_errno));
        ::unlink(temp_path.c_str());
        return false;
    }

    if (::rename(temp_path.c_str(), final_path.c_str()) != 0) {
        Logger::instance().error("Failed to commit record {}: {}", transfer.id, std::strerror(errno));
        ::unlink(temp_path.c_str());
        return false;
    }

    if (!sync_directory()) {
        Logger::instance().warning("Failed to sync store directory after writing {}", transfer.id);
    }
    return true;
}

std::optional<Transfer> FileTransferStore::load(const std::string& path) const {
    std::ifstream file(path);
    if (!file.is_open()) {
        return std::nullopt;
    }

    try {
        nlohmann::json doc = nlohmann::json::parse(file);
        return doc.get<Transfer>();
    } catch (const nlohmann::json::exception& e) {
        Logger::instance().error("Skipping corrupt transfer record {}: {}", path, e.what());
    } catch (const TransferdError& e) {
        Logger::instance().error("Skipping invalid transfer record {}: {}", path, e.what());
    }
    return std::nullopt;
}

std::optional<Transfer> FileTransferStore::get(const std::string& id) const {
    if (!is_safe_path_component(id)) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return load(record_path(id));
}

std::vector<Transfer> FileTransferStore::get_all() const {
    std::vector<Transfer> result;
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::directory_iterator it(directory_, ec);
    if (ec) {
        Logger::instance().error("Failed to scan transfer store {}: {}", directory_, ec.message());
        return result;
    }

    // Entries can vanish mid-scan; errors end the scan instead of throwing
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            break;
        }
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec) || it->path().extension() != kRecordExtension) {
            continue;
        }
        if (auto transfer = load(it->path().string())) {
            result.push_back(std::move(*transfer));
        }
    }
    if (ec) {
        Logger::instance().error("Failed to scan transfer store {}: {}", directory_, ec.message());
    }
    return result;
}

bool FileTransferStore::remove(const std::string& id) {
    if (!is_safe_path_component(id)) {
        return true;
    }
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    fs::remove(record_path(id), ec);
    if (ec) {
        Logger::instance().error("Failed to remove record {}: {}", id, ec.message());
        return false;
    }
    if (!sync_directory()) {
        Logger::instance().warning("Failed to sync store directory after removing {}", id);
    }
    return true;
}

// MemoryTransferStore

bool MemoryTransferStore::put(const Transfer& transfer) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[transfer.id] = transfer;
    return true;
}

std::optional<Transfer> MemoryTransferStore::get(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<Transfer> MemoryTransferStore::get_all() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Transfer> result;
    result.reserve(records_.size());
    for (const auto& [id, transfer] : records_) {
        result.push_back(transfer);
    }
    return result;
}

bool MemoryTransferStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.erase(id);
    return true;
}

// TransferStoreFactory

std::unique_ptr<TransferStore> TransferStoreFactory::create(const TransferConfig& config, bool ephemeral) {
    if (ephemeral) {
        Logger::instance().info("Using in-memory transfer store");
        return std::make_unique<MemoryTransferStore>();
    }

    auto store = std::make_unique<FileTransferStore>(config.state_dir);
    if (!store->initialize()) {
        return nullptr;
    }
    return store;
}

} // namespace transferd
