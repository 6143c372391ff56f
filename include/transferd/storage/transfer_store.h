#ifndef TRANSFERD_STORAGE_TRANSFER_STORE_H
#define TRANSFERD_STORAGE_TRANSFER_STORE_H

#include "transferd/base/config.h"
#include "transferd/core/transfer.h"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace transferd {

// Durable record of every transfer, keyed by id
class TransferStore {
public:
    virtual ~TransferStore() = default;

    // Insert or replace; returns only once the record is durable
    virtual bool put(const Transfer& transfer) = 0;

    virtual std::optional<Transfer> get(const std::string& id) const = 0;

    virtual std::vector<Transfer> get_all() const = 0;

    // Returns false only on I/O failure; removing a missing id succeeds
    virtual bool remove(const std::string& id) = 0;

    virtual std::vector<Transfer> list_by_status(TransferStatus status) const;

    // Restart sweep: every `downloading` record becomes `paused`.
    // Returns the number of records reclassified.
    size_t recover_interrupted();
};

// One JSON document per record: <dir>/<id>.json
class FileTransferStore : public TransferStore {
public:
    explicit FileTransferStore(std::string directory);

    // Create the directory and drop stale temp files
    bool initialize();

    bool put(const Transfer& transfer) override;
    std::optional<Transfer> get(const std::string& id) const override;
    std::vector<Transfer> get_all() const override;
    bool remove(const std::string& id) override;

    const std::string& directory() const { return directory_; }

private:
    std::string record_path(const std::string& id) const;
    std::optional<Transfer> load(const std::string& path) const;
    bool sync_directory() const;

    std::string directory_;
    mutable std::mutex mutex_;
};

class MemoryTransferStore : public TransferStore {
public:
    bool put(const Transfer& transfer) override;
    std::optional<Transfer> get(const std::string& id) const override;
    std::vector<Transfer> get_all() const override;
    bool remove(const std::string& id) override;

private:
    std::map<std::string, Transfer> records_;
    mutable std::mutex mutex_;
};

class TransferStoreFactory {
public:
    // File store under config.state_dir, or an in-memory store when ephemeral
    static std::unique_ptr<TransferStore> create(const TransferConfig& config, bool ephemeral = false);
};

} // namespace transferd

#endif // TRANSFERD_STORAGE_TRANSFER_STORE_H
