#ifndef TRANSFERD_CORE_TRANSFER_H
#define TRANSFERD_CORE_TRANSFER_H

#include "transferd/base/error_code.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace transferd {

enum class TransferStatus {
    Queued,
    Downloading,
    Paused,
    Completed,
    Error
};

std::string to_string(TransferStatus status);
std::optional<TransferStatus> parse_transfer_status(const std::string& value);

// The unit of work tracked by the scheduler
struct Transfer {
    std::string id;
    std::string source;
    std::string destination_name;
    std::string category = "other";
    std::string file_type = "other";
    std::string media_id;

    uint64_t total_bytes = 0;          // 0 = unknown
    uint64_t downloaded_bytes = 0;     // durably written to the partial file
    TransferStatus status = TransferStatus::Queued;

    double speed_bytes_per_sec = 0.0;
    int64_t eta_seconds = -1;          // -1 = unknown

    uint32_t retry_count = 0;
    std::string last_error;
    ErrorCode error_code = ErrorCode::Success;
    std::string note = "Queued";

    uint64_t sequence = 0;
    uint64_t created_at = 0;           // ms since epoch
    uint64_t started_at = 0;
    uint64_t completed_at = 0;
    uint64_t updated_at = 0;

    // downloaded/total in [0,1]; empty while the total is unknown
    std::optional<double> progress() const;

    bool is_active() const { return status == TransferStatus::Downloading; }
};

// Caller-supplied description of a new transfer
struct TransferRequest {
    std::string source;
    std::string destination_name;
    uint64_t total_bytes_hint = 0;
    std::string category;
    std::string media_id;
};

// Optional filters for Scheduler::list
struct TransferFilter {
    std::optional<TransferStatus> status;
    std::optional<std::string> category;
    std::optional<std::string> file_type;
    std::optional<std::string> media_id;

    bool matches(const Transfer& transfer) const;
};

// Milliseconds since the Unix epoch
uint64_t now_ms();

// "dl_<ms>_<9 base36 chars>"
std::string generate_transfer_id();

// Classify a file name by extension: video, audio, image, document, ...
std::string classify_file_type(const std::string& file_name);

// A single path component: non-empty, no separators, not "." or ".."
bool is_safe_path_component(const std::string& name);

// Wire/persisted representation (camelCase keys)
void to_json(nlohmann::json& j, const Transfer& transfer);
void from_json(const nlohmann::json& j, Transfer& transfer);

} // namespace transferd

#endif // TRANSFERD_CORE_TRANSFER_H
