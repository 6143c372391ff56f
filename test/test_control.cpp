#include <catch2/catch_test_macros.hpp>
#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>
#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>
#include "transferd/base/config.h"
#include "transferd/control/command_handler.h"
#include "fake_http_source.h"
#include "test_support.h"

using namespace transferd;
using namespace transferd::test;
using namespace std::chrono_literals;
using json = nlohmann::json;

namespace {

// Scheduler over a fake source. Files named "held*" stall after 1 KiB until
// the test ends; everything else downloads at once.
class ControlHarness {
public:
    ControlHarness() : content_(make_content(4000)), hold_(std::make_shared<Gate>()) {
        source_ = std::make_shared<FakeHttpSource>([this](const HttpRequest& request) {
            FakeResponse response = serve_content(request, content_);
            if (request.url.find("/held") != std::string::npos) {
                response.gate = hold_;
                response.hold_at = 1024;
            }
            return response;
        });

        TransferWorker::Options options;
        options.download_dir = dir_.sub("downloads");
        options.max_attempts = 1;
        auto worker = std::make_shared<TransferWorker>(
            options, source_, std::make_shared<RetryPolicy>(RetryPolicy::Options{1ms, 2.0, 2ms, 0.0}));

        Scheduler::Options scheduler_options;
        scheduler_options.max_concurrent = 2;
        scheduler_ = std::make_unique<Scheduler>(scheduler_options, std::make_shared<MemoryTransferStore>(),
                                                 worker, bus_, nullptr);
        scheduler_->start();
        handler_ = std::make_unique<CommandHandler>(*scheduler_);
    }

    ~ControlHarness() {
        handler_.reset();
        scheduler_->stop();
        bus_.shutdown();
    }

    json run(const std::string& command, json data = json::object()) {
        return handler_->handle({{"type", "command"}, {"event", command}, {"data", std::move(data)}});
    }

    std::string enqueue(const std::string& name) {
        json reply = run("enqueue", {{"url", "https://files.example.com/" + name}, {"name", name}});
        REQUIRE(reply["data"]["ok"] == true);
        return reply["data"]["transfer"]["id"].get<std::string>();
    }

    bool wait_status(const std::string& id, TransferStatus status) {
        return wait_until([&]() {
            auto transfer = scheduler_->get(id);
            return transfer && transfer->status == status;
        });
    }

    Scheduler& scheduler() { return *scheduler_; }

private:
    TempDir dir_;
    std::string content_;
    std::shared_ptr<Gate> hold_;
    std::shared_ptr<FakeHttpSource> source_;
    EventBus bus_;
    std::unique_ptr<Scheduler> scheduler_;
    std::unique_ptr<CommandHandler> handler_;
};

int error_code_of(const json& reply) {
    return reply["data"]["error"]["code"].get<int>();
}

// Restores the configuration singleton around each test
struct ConfigGuard {
    ConfigGuard() { Config::instance().reset(); }
    ~ConfigGuard() { Config::instance().reset(); }
};

} // anonymous namespace

TEST_CASE("Command Enqueue And Get", "[control][command]") {
    ControlHarness h;

    json reply = h.run("enqueue", {{"requestId", "r-1"},
                                   {"source", "https://files.example.com/movie.mkv"},
                                   {"destinationName", "movie.mkv"},
                                   {"category", "films"},
                                   {"mediaId", "m-42"},
                                   {"totalBytes", 4000}});
    REQUIRE(reply["type"] == "command");
    REQUIRE(reply["event"] == "result");
    REQUIRE(reply["data"]["requestId"] == "r-1");
    REQUIRE(reply["data"]["command"] == "enqueue");
    REQUIRE(reply["data"]["ok"] == true);
    REQUIRE(reply["data"]["transfer"]["category"] == "films");
    REQUIRE(reply["data"]["transfer"]["fileType"] == "video");
    REQUIRE(reply["data"]["transfer"]["mediaId"] == "m-42");

    std::string id = reply["data"]["transfer"]["id"].get<std::string>();
    REQUIRE(h.wait_status(id, TransferStatus::Completed));

    json got = h.run("get", {{"id", id}});
    REQUIRE(got["data"]["ok"] == true);
    REQUIRE(got["data"]["transfer"]["status"] == "completed");
    REQUIRE(got["data"]["transfer"]["downloadedBytes"] == 4000);
    REQUIRE(got["data"]["requestId"].is_null());
}

TEST_CASE("Command Pause Resume And Cancel", "[control][command]") {
    ControlHarness h;
    std::string id = h.enqueue("held.bin");
    REQUIRE(h.wait_status(id, TransferStatus::Downloading));

    json paused = h.run("pause", {{"id", id}});
    REQUIRE(paused["data"]["ok"] == true);
    REQUIRE(paused["data"]["transfer"]["status"] == "paused");

    json again = h.run("pause", {{"id", id}});
    REQUIRE(again["data"]["ok"] == false);
    REQUIRE(error_code_of(again) == static_cast<int>(ErrorCode::InvalidState));
    REQUIRE(again["data"]["error"]["kind"] == "InvalidState");

    json resumed = h.run("resume", {{"id", id}});
    REQUIRE(resumed["data"]["ok"] == true);
    REQUIRE(h.wait_status(id, TransferStatus::Downloading));

    json canceled = h.run("cancel", {{"id", id}});
    REQUIRE(canceled["data"]["ok"] == true);
    REQUIRE_FALSE(h.scheduler().get(id).has_value());

    json missing = h.run("get", {{"id", id}});
    REQUIRE(missing["data"]["ok"] == false);
    REQUIRE(error_code_of(missing) == static_cast<int>(ErrorCode::NotFound));
}

TEST_CASE("Command List And Clear Completed", "[control][command]") {
    ControlHarness h;
    std::string done = h.enqueue("song.mp3");
    REQUIRE(h.wait_status(done, TransferStatus::Completed));
    std::string active = h.enqueue("held.mkv");
    REQUIRE(h.wait_status(active, TransferStatus::Downloading));

    json all = h.run("list");
    REQUIRE(all["data"]["count"] == 2);
    REQUIRE(all["data"]["transfers"][0]["id"] == active);

    json audio = h.run("list", {{"fileType", "audio"}});
    REQUIRE(audio["data"]["count"] == 1);
    REQUIRE(audio["data"]["transfers"][0]["id"] == done);

    json downloading = h.run("list", {{"status", "downloading"}});
    REQUIRE(downloading["data"]["count"] == 1);

    json bad_status = h.run("list", {{"status", "sleeping"}});
    REQUIRE(bad_status["data"]["ok"] == false);
    REQUIRE(error_code_of(bad_status) == static_cast<int>(ErrorCode::InvalidRequest));

    json cleared = h.run("clear_completed");
    REQUIRE(cleared["data"]["count"] == 1);
    REQUIRE(h.run("list")["data"]["count"] == 1);
}

TEST_CASE("Command Set Max Concurrent", "[control][command]") {
    ControlHarness h;

    json raised = h.run("set_max_concurrent", {{"maxConcurrent", 5}});
    REQUIRE(raised["data"]["ok"] == true);
    REQUIRE(raised["data"]["maxConcurrent"] == 5);
    REQUIRE(h.scheduler().max_concurrent() == 5);

    json zero = h.run("set_max_concurrent", {{"maxConcurrent", 0}});
    REQUIRE(zero["data"]["ok"] == false);
    REQUIRE(h.scheduler().max_concurrent() == 5);

    json negative = h.run("set_max_concurrent", {{"maxConcurrent", -2}});
    REQUIRE(negative["data"]["ok"] == false);
    REQUIRE(error_code_of(negative) == static_cast<int>(ErrorCode::InvalidRequest));

    // 2^32 + 1 would wrap to 1 if narrowed
    json huge = h.run("set_max_concurrent", {{"maxConcurrent", 4294967297ULL}});
    REQUIRE(huge["data"]["ok"] == false);
    REQUIRE(error_code_of(huge) == static_cast<int>(ErrorCode::InvalidRequest));
    REQUIRE(h.scheduler().max_concurrent() == 5);
}

TEST_CASE("Command Rejects Bad Requests", "[control][command]") {
    ControlHarness h;

    json unknown = h.run("reboot");
    REQUIRE(unknown["data"]["ok"] == false);
    REQUIRE(unknown["data"]["command"] == "reboot");
    REQUIRE(error_code_of(unknown) == static_cast<int>(ErrorCode::InvalidRequest));

    json wrong_type = h.run("pause", {{"id", 17}});
    REQUIRE(wrong_type["data"]["ok"] == false);
    REQUIRE(error_code_of(wrong_type) == static_cast<int>(ErrorCode::InvalidRequest));

    json missing_id = h.run("cancel");
    REQUIRE(missing_id["data"]["ok"] == false);

    json bad_source = h.run("enqueue", {{"url", "ftp://files.example.com/a.bin"}, {"name", "a.bin"}});
    REQUIRE(bad_source["data"]["ok"] == false);

    json bad_name = h.run("enqueue", {{"url", "https://files.example.com/a.bin"}, {"name", "../a.bin"}});
    REQUIRE(bad_name["data"]["ok"] == false);
    REQUIRE(bad_name["data"]["error"]["message"].get<std::string>().find("destination") != std::string::npos);

    json not_object = CommandHandler(h.scheduler()).handle(json::array());
    REQUIRE(not_object["data"]["ok"] == false);
    REQUIRE(h.scheduler().list().empty());
}

TEST_CASE("Config Defaults", "[config]") {
    ConfigGuard guard;
    const auto& config = Config::instance().get();

    REQUIRE(config.transfer.max_concurrent == 3);
    REQUIRE(config.transfer.max_attempts == 3);
    REQUIRE(config.retry.base_delay_ms == 1000);
    REQUIRE(config.retry.max_delay_ms == 60000);
    REQUIRE(config.channel.url.empty());
    REQUIRE(config.channel.subscriptions == std::vector<std::string>{"downloads"});
    REQUIRE(Config::instance().validate());
}

TEST_CASE("Config Loads INI Files", "[config]") {
    ConfigGuard guard;
    TempDir dir;
    std::string path = dir.path() + "/transferd.conf";
    write_file(path,
               "# transferd\n"
               "[log]\n"
               "level = debug\n"
               "\n"
               "[transfer]\n"
               "download_dir = \"/data/downloads\"\n"
               "max_concurrent = 6\n"
               "chunk_size_kb = 128\n"
               "max_attempts = oops\n"
               "\n"
               "[retry]\n"
               "factor = 1.5\n"
               "jitter_ratio = 0\n"
               "\n"
               "[channel]\n"
               "url = wss://hub.example.com/ws\n"
               "subscriptions = downloads, media ,\n"
               "\n"
               "[placement]\n"
               "notify_url = http://library.local/hook\n");

    REQUIRE(Config::instance().load_from_file(path));
    const auto& config = Config::instance().get();
    REQUIRE(Config::instance().get_config_file() == path);
    REQUIRE(config.log.level == "debug");
    REQUIRE(config.transfer.download_dir == "/data/downloads");
    REQUIRE(config.transfer.max_concurrent == 6);
    REQUIRE(config.transfer.chunk_size_kb == 128);
    REQUIRE(config.transfer.max_attempts == 3);
    REQUIRE(config.retry.factor == 1.5);
    REQUIRE(config.retry.jitter_ratio == 0.0);
    REQUIRE(config.channel.url == "wss://hub.example.com/ws");
    REQUIRE(config.channel.subscriptions == std::vector<std::string>{"downloads", "media"});
    REQUIRE(config.placement.notify_url == "http://library.local/hook");
    REQUIRE(Config::instance().validate());

    REQUIRE_FALSE(Config::instance().load_from_file(dir.path() + "/missing.conf"));
}

TEST_CASE("Config Environment Overrides", "[config]") {
    ConfigGuard guard;
    setenv("TRANSFERD_MAX_CONCURRENT", "9", 1);
    setenv("TRANSFERD_CHANNEL_URL", "ws://localhost:9000/ws", 1);
    setenv("TRANSFERD_LOG_FILE", "/tmp/transferd.log", 1);
    setenv("TRANSFERD_MAX_ATTEMPTS", "many", 1);

    REQUIRE(Config::instance().load_from_env());
    const auto& config = Config::instance().get();
    REQUIRE(config.transfer.max_concurrent == 9);
    REQUIRE(config.transfer.max_attempts == 3);
    REQUIRE(config.channel.url == "ws://localhost:9000/ws");
    REQUIRE(config.log.output == "file");
    REQUIRE(config.log.file_path == "/tmp/transferd.log");

    unsetenv("TRANSFERD_MAX_CONCURRENT");
    unsetenv("TRANSFERD_CHANNEL_URL");
    unsetenv("TRANSFERD_LOG_FILE");
    unsetenv("TRANSFERD_MAX_ATTEMPTS");
}

TEST_CASE("Config Command Line Options", "[config]") {
    ConfigGuard guard;
    CLI::App app{"transferd"};
    Config::instance().add_command_line_options(app);

    app.parse("--max-concurrent 4 --download-dir /srv/media --channel-subscribe a,b "
              "--retry-max-delay 5000 --placement-url http://hook.local/placed",
              false);

    const auto& config = Config::instance().get();
    REQUIRE(config.transfer.max_concurrent == 4);
    REQUIRE(config.transfer.download_dir == "/srv/media");
    REQUIRE(config.channel.subscriptions == std::vector<std::string>{"a", "b"});
    REQUIRE(config.retry.max_delay_ms == 5000);
    REQUIRE(config.placement.notify_url == "http://hook.local/placed");
}

TEST_CASE("Config Validation", "[config]") {
    ConfigGuard guard;
    auto& config = Config::instance().get();

    SECTION("Zero concurrency") {
        config.transfer.max_concurrent = 0;
        REQUIRE_FALSE(Config::instance().validate());
    }

    SECTION("Zero attempts") {
        config.transfer.max_attempts = 0;
        REQUIRE_FALSE(Config::instance().validate());
    }

    SECTION("Shrinking backoff") {
        config.retry.factor = 0.5;
        REQUIRE_FALSE(Config::instance().validate());
    }

    SECTION("Cap below base") {
        config.retry.base_delay_ms = 10000;
        config.retry.max_delay_ms = 100;
        REQUIRE_FALSE(Config::instance().validate());
    }

    SECTION("Jitter out of range") {
        config.retry.jitter_ratio = 1.5;
        REQUIRE_FALSE(Config::instance().validate());
    }

    SECTION("Channel must be a WebSocket URL") {
        config.channel.url = "http://hub.example.com/ws";
        REQUIRE_FALSE(Config::instance().validate());
        config.channel.url = "wss://hub.example.com/ws";
        REQUIRE(Config::instance().validate());
        config.channel.heartbeat_interval_sec = 0;
        REQUIRE_FALSE(Config::instance().validate());
    }

    SECTION("Reset restores defaults") {
        config.transfer.max_concurrent = 0;
        Config::instance().reset();
        REQUIRE(Config::instance().get().transfer.max_concurrent == 3);
        REQUIRE(Config::instance().validate());
    }
}
