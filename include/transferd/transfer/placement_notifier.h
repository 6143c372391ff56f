#ifndef TRANSFERD_TRANSFER_PLACEMENT_NOTIFIER_H
#define TRANSFERD_TRANSFER_PLACEMENT_NOTIFIER_H

#include "transferd/base/config.h"
#include "transferd/core/transfer.h"
#include "transferd/net/http.h"
#include <chrono>
#include <memory>
#include <string>

namespace transferd {

// Told about every finished file so it can be organized and indexed
class PlacementNotifier {
public:
    virtual ~PlacementNotifier() = default;

    // Called from the worker thread after the record is persisted as completed.
    // Failures are the notifier's own business.
    virtual void on_completed(const Transfer& transfer, const std::string& final_path) = 0;
};

// POSTs a JSON summary of the finished file to a media-library hook
class HttpPlacementNotifier : public PlacementNotifier {
public:
    HttpPlacementNotifier(std::string notify_url, std::string auth_token,
                          std::shared_ptr<HttpSource> source,
                          std::chrono::milliseconds timeout = std::chrono::seconds(10));

    void on_completed(const Transfer& transfer, const std::string& final_path) override;

    // Build from config; null when no URL is configured
    static std::shared_ptr<PlacementNotifier> create(const PlacementConfig& placement,
                                                     const TransferConfig& transfer,
                                                     std::shared_ptr<HttpSource> source);

private:
    std::string notify_url_;
    std::string auth_token_;
    std::shared_ptr<HttpSource> source_;
    std::chrono::milliseconds timeout_;
};

} // namespace transferd

#endif // TRANSFERD_TRANSFER_PLACEMENT_NOTIFIER_H
