#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <string>
#include <vector>
#include "transferd/storage/transfer_store.h"
#include "test_support.h"

using namespace transferd;
using transferd::test::TempDir;

namespace {

Transfer make_transfer(const std::string& id, TransferStatus status, uint64_t downloaded = 0) {
    Transfer transfer;
    transfer.id = id;
    transfer.source = "https://example.com/" + id + ".bin";
    transfer.destination_name = id + ".bin";
    transfer.status = status;
    transfer.downloaded_bytes = downloaded;
    transfer.total_bytes = 10000;
    transfer.created_at = now_ms();
    return transfer;
}

} // anonymous namespace

TEST_CASE("File Store Put And Get", "[storage][file]") {
    TempDir dir;
    FileTransferStore store(dir.sub("state"));
    REQUIRE(store.initialize());

    REQUIRE_FALSE(store.get("dl_missing").has_value());

    auto transfer = make_transfer("dl_1_a", TransferStatus::Queued);
    REQUIRE(store.put(transfer));
    REQUIRE(std::filesystem::exists(dir.sub("state/dl_1_a.json")));

    auto loaded = store.get("dl_1_a");
    REQUIRE(loaded.has_value());
    REQUIRE(loaded->source == transfer.source);
    REQUIRE(loaded->status == TransferStatus::Queued);

    transfer.status = TransferStatus::Paused;
    transfer.downloaded_bytes = 4096;
    REQUIRE(store.put(transfer));
    loaded = store.get("dl_1_a");
    REQUIRE(loaded->status == TransferStatus::Paused);
    REQUIRE(loaded->downloaded_bytes == 4096);
    REQUIRE(store.get_all().size() == 1);
}

TEST_CASE("File Store Remove", "[storage][file]") {
    TempDir dir;
    FileTransferStore store(dir.path());
    REQUIRE(store.initialize());

    REQUIRE(store.put(make_transfer("dl_1_a", TransferStatus::Completed)));
    REQUIRE(store.remove("dl_1_a"));
    REQUIRE_FALSE(store.get("dl_1_a").has_value());

    // Removing a missing id succeeds
    REQUIRE(store.remove("dl_1_a"));
    REQUIRE(store.remove("../escape"));
}

TEST_CASE("File Store Rejects Unsafe Ids", "[storage][file]") {
    TempDir dir;
    FileTransferStore store(dir.path());
    REQUIRE(store.initialize());

    REQUIRE_FALSE(store.put(make_transfer("../evil", TransferStatus::Queued)));
    REQUIRE_FALSE(store.get("../evil").has_value());
}

TEST_CASE("File Store Skips Corrupt Records", "[storage][file][recovery]") {
    TempDir dir;
    FileTransferStore store(dir.path());
    REQUIRE(store.initialize());

    REQUIRE(store.put(make_transfer("dl_1_good", TransferStatus::Queued)));
    transferd::test::write_file(dir.sub("dl_1_bad.json"), "{ not json");
    transferd::test::write_file(dir.sub("dl_1_status.json"),
                                R"({"id":"dl_1_status","source":"x","destinationName":"y","status":"bogus"})");
    transferd::test::write_file(dir.sub("notes.txt"), "ignored");

    auto all = store.get_all();
    REQUIRE(all.size() == 1);
    REQUIRE(all[0].id == "dl_1_good");
    REQUIRE_FALSE(store.get("dl_1_bad").has_value());
}

TEST_CASE("File Store Drops Stale Temp Files", "[storage][file][recovery]") {
    TempDir dir;
    transferd::test::write_file(dir.sub("dl_1_a.json.tmp"), "{");

    FileTransferStore store(dir.path());
    REQUIRE(store.initialize());
    REQUIRE_FALSE(std::filesystem::exists(dir.sub("dl_1_a.json.tmp")));
    REQUIRE(store.get_all().empty());
}

TEST_CASE("File Store Scan Tolerates Odd Entries", "[storage][file]") {
    TempDir dir;
    FileTransferStore store(dir.sub("state"));
    REQUIRE(store.initialize());
    REQUIRE(store.put(make_transfer("dl_1_ok", TransferStatus::Queued)));

    std::filesystem::create_directory(dir.sub("state/folder.json"));
    // Resolving a self-referencing link fails with ELOOP
    std::filesystem::create_symlink("loop.json", dir.sub("state/loop.json"));

    std::vector<Transfer> all;
    REQUIRE_NOTHROW(all = store.get_all());
    REQUIRE(all.size() == 1);
    REQUIRE(all[0].id == "dl_1_ok");

    std::filesystem::remove_all(dir.sub("state"));
    REQUIRE_NOTHROW(all = store.get_all());
    REQUIRE(all.empty());
}

TEST_CASE("Restart Sweep Pauses Interrupted Transfers", "[storage][recovery]") {
    TempDir dir;
    {
        FileTransferStore store(dir.path());
        REQUIRE(store.initialize());
        auto running = make_transfer("dl_1_run", TransferStatus::Downloading, 4096);
        running.speed_bytes_per_sec = 1024.0;
        running.eta_seconds = 5;
        REQUIRE(store.put(running));
        REQUIRE(store.put(make_transfer("dl_2_queued", TransferStatus::Queued)));
        REQUIRE(store.put(make_transfer("dl_3_done", TransferStatus::Completed, 10000)));
    }

    // A new process opens the same directory
    FileTransferStore store(dir.path());
    REQUIRE(store.initialize());
    REQUIRE(store.recover_interrupted() == 1);

    REQUIRE(store.list_by_status(TransferStatus::Downloading).empty());
    auto paused = store.get("dl_1_run");
    REQUIRE(paused->status == TransferStatus::Paused);
    REQUIRE(paused->downloaded_bytes == 4096);
    REQUIRE(paused->speed_bytes_per_sec == 0.0);
    REQUIRE(paused->eta_seconds == -1);
    REQUIRE(paused->note == "Paused (interrupted by restart)");

    REQUIRE(store.get("dl_2_queued")->status == TransferStatus::Queued);
    REQUIRE(store.get("dl_3_done")->status == TransferStatus::Completed);
    REQUIRE(store.recover_interrupted() == 0);
}

TEST_CASE("Memory Store", "[storage][memory]") {
    MemoryTransferStore store;
    REQUIRE(store.put(make_transfer("dl_1_a", TransferStatus::Downloading)));
    REQUIRE(store.put(make_transfer("dl_2_b", TransferStatus::Queued)));
    REQUIRE(store.get_all().size() == 2);
    REQUIRE(store.list_by_status(TransferStatus::Queued).size() == 1);

    REQUIRE(store.recover_interrupted() == 1);
    REQUIRE(store.get("dl_1_a")->status == TransferStatus::Paused);

    REQUIRE(store.remove("dl_1_a"));
    REQUIRE(store.remove("dl_1_a"));
    REQUIRE(store.get_all().size() == 1);
}

TEST_CASE("Store Factory", "[storage][factory]") {
    TempDir dir;
    TransferConfig config;
    config.state_dir = dir.sub("nested/state");

    auto ephemeral = TransferStoreFactory::create(config, true);
    REQUIRE(ephemeral != nullptr);
    REQUIRE(dynamic_cast<MemoryTransferStore*>(ephemeral.get()) != nullptr);

    auto durable = TransferStoreFactory::create(config);
    REQUIRE(durable != nullptr);
    REQUIRE(std::filesystem::is_directory(config.state_dir));
}
