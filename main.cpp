#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <csignal>
#include <thread>
#include <chrono>
#include <algorithm>
#include <optional>

#include "CLI/CLI.hpp"
#include "transferd/base/logger.h"
#include "transferd/base/config.h"
#include "transferd/core/event_bus.h"
#include "transferd/core/retry_policy.h"
#include "transferd/storage/transfer_store.h"
#include "transferd/net/http.h"
#include "transferd/net/url.h"
#include "transferd/transfer/worker.h"
#include "transferd/transfer/placement_notifier.h"
#include "transferd/transfer/scheduler.h"
#include "transferd/notify/notification_channel.h"
#include "transferd/control/command_handler.h"

using namespace transferd;

// Global flag for signal handling
static volatile std::sig_atomic_t g_running = 1;

// Signal handler for graceful shutdown
void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = 0;
    }
}

namespace {

constexpr const char* kVersion = "0.1.0";

// Options of the fetch and list subcommands
struct FetchOptions {
    std::vector<std::string> urls;
    std::string name;
    std::string category;
};

struct ListOptions {
    std::string status;
    std::string category;
};

bool is_terminal(const std::optional<Transfer>& transfer) {
    return !transfer || transfer->status == TransferStatus::Completed ||
           transfer->status == TransferStatus::Error;
}

std::string describe(const Transfer& transfer) {
    std::string line = transfer.id + "  " + to_string(transfer.status) + "  " +
                       std::to_string(transfer.downloaded_bytes);
    if (transfer.total_bytes > 0) {
        line += "/" + std::to_string(transfer.total_bytes);
    }
    line += "  " + transfer.category + "/" + transfer.destination_name;
    if (!transfer.last_error.empty()) {
        line += "  (" + transfer.last_error + ")";
    }
    return line;
}

// Last path segment of the URL, without the query
std::string name_from_url(const std::string& source) {
    auto url = parse_url(source);
    if (!url) {
        return {};
    }
    std::string path = url->target.substr(0, url->target.find('?'));
    std::string name = path.substr(path.find_last_of('/') + 1);
    return name.empty() ? std::string("download") : name;
}

// Scan argv for -c/--config so the file is applied before the command line
std::string find_config_path(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            return argv[i + 1];
        }
        if (arg.rfind("--config=", 0) == 0) {
            return arg.substr(9);
        }
    }
    return {};
}

} // anonymous namespace

class TransferdApplication {
public:
    TransferdApplication() = default;
    ~TransferdApplication() {
        stop();
    }

    bool initialize(bool ephemeral, bool with_channel) {
        Logger::instance().info("Initializing transferd...");
        const auto& config = Config::instance().get();

        bus_ = std::make_unique<EventBus>();

        store_ = TransferStoreFactory::create(config.transfer, ephemeral);
        if (!store_) {
            Logger::instance().error("Failed to open transfer store in {}", config.transfer.state_dir);
            return false;
        }

        auto source = std::make_shared<CurlHttpSource>();
        auto retry_policy = std::make_shared<RetryPolicy>(RetryPolicy::from_config(config.retry));
        auto worker = std::make_shared<TransferWorker>(
            TransferWorker::Options::from_config(config.transfer), source, retry_policy);
        auto notifier = HttpPlacementNotifier::create(config.placement, config.transfer, source);

        scheduler_ = std::make_unique<Scheduler>(
            Scheduler::Options::from_config(config.transfer), store_, worker, *bus_, notifier);

        if (with_channel && !config.channel.url.empty()) {
            channel_ = std::make_unique<NotificationChannel>(
                NotificationChannel::Options::from_config(config.channel), WebSocketTransport::factory());
            channel_->set_status_callback([](ChannelState state, const std::string& detail) {
                if (detail.empty()) {
                    Logger::instance().info("Channel state: {}", to_string(state));
                } else {
                    Logger::instance().warning("Channel state: {} ({})", to_string(state), detail);
                }
            });
            command_handler_ = std::make_unique<CommandHandler>(*scheduler_);
            command_handler_->bind(*channel_);
            channel_->attach(*bus_);

            NotificationChannel* channel = channel_.get();
            scheduler_->set_auth_escalation_hook([channel](const Transfer& transfer) {
                Logger::instance().warning("Transfer {} was rejected as unauthenticated, refreshing channel auth",
                                           transfer.id);
                if (!channel->request_reauthentication()) {
                    Logger::instance().debug("Channel not authenticated, skipping re-authentication");
                }
            });
        }

        Logger::instance().info("transferd initialized");
        return true;
    }

    bool start() {
        Logger::instance().info("Starting transferd...");
        try {
            scheduler_->start();
        } catch (const TransferdError& e) {
            Logger::instance().error("Failed to start scheduler: {}", e.what());
            return false;
        }
        if (channel_) {
            channel_->connect();
        }
        Logger::instance().info("transferd started, {} transfers known", scheduler_->list().size());
        return true;
    }

    void stop() {
        if (stopped_ || !scheduler_) {
            return;
        }
        stopped_ = true;
        Logger::instance().info("Stopping transferd...");

        // Channel first so no command arrives while the scheduler winds down
        if (channel_) {
            channel_->detach();
            command_handler_->unbind();
            channel_->disconnect();
        }
        scheduler_->stop();
        bus_->shutdown();

        Logger::instance().info("transferd stopped");
    }

    // Daemon mode: run until a signal arrives
    int serve() {
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        Logger::instance().info("Shutdown signal received");
        stop();
        return 0;
    }

    // One-shot mode: enqueue every URL and wait for each to finish
    int fetch(const FetchOptions& options) {
        std::vector<std::string> ids;
        for (const auto& url : options.urls) {
            TransferRequest request;
            request.source = url;
            request.destination_name = (options.urls.size() == 1 && !options.name.empty())
                                           ? options.name : name_from_url(url);
            request.category = options.category;
            try {
                Transfer transfer = scheduler_->enqueue(request);
                std::cout << "queued " << transfer.id << " " << transfer.destination_name << std::endl;
                ids.push_back(transfer.id);
            } catch (const TransferdError& e) {
                std::cerr << "Cannot fetch " << url << ": " << e.what() << std::endl;
            }
        }

        while (g_running) {
            bool done = std::all_of(ids.begin(), ids.end(), [this](const std::string& id) {
                return is_terminal(scheduler_->get(id));
            });
            if (done) {
                break;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        bool all_completed = ids.size() == options.urls.size();
        for (const auto& id : ids) {
            auto transfer = scheduler_->get(id);
            if (!transfer) {
                std::cout << id << "  removed" << std::endl;
                all_completed = false;
                continue;
            }
            std::cout << describe(*transfer) << std::endl;
            if (transfer->status != TransferStatus::Completed) {
                all_completed = false;
            }
        }

        stop();
        return all_completed ? 0 : 1;
    }

private:
    std::unique_ptr<EventBus> bus_;
    std::shared_ptr<TransferStore> store_;
    std::unique_ptr<Scheduler> scheduler_;
    std::unique_ptr<NotificationChannel> channel_;
    std::unique_ptr<CommandHandler> command_handler_;
    bool stopped_ = false;
};

// Print persisted records without starting the scheduler
int list_transfers(const ListOptions& options) {
    TransferFilter filter;
    if (!options.status.empty()) {
        filter.status = parse_transfer_status(options.status);
        if (!filter.status) {
            std::cerr << "Unknown status: " << options.status << std::endl;
            return 1;
        }
    }
    if (!options.category.empty()) {
        filter.category = options.category;
    }

    auto store = TransferStoreFactory::create(Config::instance().get().transfer);
    if (!store) {
        std::cerr << "Failed to open transfer store" << std::endl;
        return 1;
    }

    std::vector<Transfer> transfers;
    for (auto& transfer : store->get_all()) {
        if (filter.matches(transfer)) {
            transfers.push_back(std::move(transfer));
        }
    }
    std::sort(transfers.begin(), transfers.end(), [](const Transfer& a, const Transfer& b) {
        if (a.created_at != b.created_at) {
            return a.created_at > b.created_at;
        }
        return a.sequence > b.sequence;
    });

    for (const auto& transfer : transfers) {
        std::cout << describe(transfer) << std::endl;
    }
    std::cout << transfers.size() << " transfer(s)" << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto& config = Config::instance();

    // defaults -> config file -> environment -> command line
    std::string config_path = find_config_path(argc, argv);
    if (!config_path.empty() && !config.load_from_file(config_path)) {
        std::cerr << "Failed to load config file: " << config_path << std::endl;
        return 1;
    }
    config.load_from_env();

    CLI::App app{"transferd - resumable transfer queue with a notification channel"};
    app.set_version_flag("-v,--version", std::string("transferd version ") + kVersion);
    app.require_subcommand(1);
    app.fallthrough();

    app.add_option("-c,--config", config_path, "Config file path");
    bool ephemeral = false;
    app.add_flag("--ephemeral", ephemeral, "Keep transfer records in memory only");
    config.add_command_line_options(app);

    auto* serve_cmd = app.add_subcommand("serve", "Run the transfer daemon until SIGINT/SIGTERM");

    FetchOptions fetch_options;
    auto* fetch_cmd = app.add_subcommand("fetch", "Download URLs and wait for them to finish");
    fetch_cmd->add_option("urls", fetch_options.urls, "Source URLs")->required();
    fetch_cmd->add_option("--name", fetch_options.name, "Destination file name (single URL only)");
    fetch_cmd->add_option("--category", fetch_options.category, "Destination category directory");

    ListOptions list_options;
    auto* list_cmd = app.add_subcommand("list", "Show persisted transfers");
    list_cmd->add_option("--status", list_options.status, "queued, downloading, paused, completed, error");
    list_cmd->add_option("--category", list_options.category, "Category filter");

    CLI11_PARSE(app, argc, argv);

    config.apply_logging();
    if (!config.validate()) {
        std::cerr << "Invalid configuration" << std::endl;
        return 1;
    }

    if (list_cmd->parsed()) {
        return list_transfers(list_options);
    }

    try {
        config.print();
        TransferdApplication application;

        bool serving = serve_cmd->parsed();
        if (!application.initialize(ephemeral, serving)) {
            std::cerr << "Failed to initialize application" << std::endl;
            return 1;
        }
        if (!application.start()) {
            std::cerr << "Failed to start application" << std::endl;
            return 1;
        }

        if (serving) {
            return application.serve();
        }
        if (fetch_cmd->parsed()) {
            return application.fetch(fetch_options);
        }
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
