#include "transferd/transfer/placement_notifier.h"
#include "transferd/base/logger.h"
#include <nlohmann/json.hpp>

namespace transferd {

using json = nlohmann::json;

HttpPlacementNotifier::HttpPlacementNotifier(std::string notify_url, std::string auth_token,
                                             std::shared_ptr<HttpSource> source,
                                             std::chrono::milliseconds timeout)
    : notify_url_(std::move(notify_url)),
      auth_token_(std::move(auth_token)),
      source_(std::move(source)),
      timeout_(timeout) {}

void HttpPlacementNotifier::on_completed(const Transfer& transfer, const std::string& final_path) {
    json body = {
        {"id", transfer.id},
        {"destinationName", transfer.destination_name},
        {"category", transfer.category},
        {"path", final_path},
        {"totalBytes", transfer.total_bytes}
    };

    HttpRequest request;
    request.method = "POST";
    request.url = notify_url_;
    request.body = body.dump();
    request.timeout = timeout_;
    request.set_header("Content-Type", "application/json");
    if (!auth_token_.empty()) {
        request.set_header("Authorization", "Bearer " + auth_token_);
    }

    auto result = source_->fetch(request);
    if (!result.ok()) {
        Logger::instance().warning("Placement notification for {} failed: {}", transfer.id, result.message);
        return;
    }

    int code = result.response.status_code();
    std::string response = result.response.read_all(4096);
    if (code < 200 || code >= 300) {
        Logger::instance().warning("Placement notification for {} rejected, HTTP {}: {}",
                                   transfer.id, code, response);
        return;
    }
    Logger::instance().info("Placement notified for {}: {}", transfer.id, final_path);
}

std::shared_ptr<PlacementNotifier> HttpPlacementNotifier::create(const PlacementConfig& placement,
                                                                 const TransferConfig& transfer,
                                                                 std::shared_ptr<HttpSource> source) {
    if (placement.notify_url.empty()) {
        return nullptr;
    }
    return std::make_shared<HttpPlacementNotifier>(placement.notify_url, transfer.auth_token,
                                                   std::move(source));
}

} // namespace transferd
