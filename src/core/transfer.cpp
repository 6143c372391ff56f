#include "transferd/core/transfer.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <random>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace transferd {

std::string to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::Queued: return "queued";
        case TransferStatus::Downloading: return "downloading";
        case TransferStatus::Paused: return "paused";
        case TransferStatus::Completed: return "completed";
        case TransferStatus::Error: return "error";
    }
    return "error";
}

std::optional<TransferStatus> parse_transfer_status(const std::string& value) {
    if (value == "queued") return TransferStatus::Queued;
    if (value == "downloading") return TransferStatus::Downloading;
    if (value == "paused") return TransferStatus::Paused;
    if (value == "completed") return TransferStatus::Completed;
    if (value == "error") return TransferStatus::Error;
    return std::nullopt;
}

std::optional<double> Transfer::progress() const {
    if (total_bytes == 0) {
        return std::nullopt;
    }
    double ratio = static_cast<double>(downloaded_bytes) / static_cast<double>(total_bytes);
    return std::clamp(ratio, 0.0, 1.0);
}

bool TransferFilter::matches(const Transfer& transfer) const {
    if (status && transfer.status != *status) return false;
    if (category && transfer.category != *category) return false;
    if (file_type && transfer.file_type != *file_type) return false;
    if (media_id && transfer.media_id != *media_id) return false;
    return true;
}

uint64_t now_ms() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

std::string generate_transfer_id() {
    static constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> dist(0, 35);

    std::string suffix;
    suffix.reserve(9);
    for (int i = 0; i < 9; ++i) {
        suffix += kAlphabet[dist(rng)];
    }
    return "dl_" + std::to_string(now_ms()) + "_" + suffix;
}

std::string classify_file_type(const std::string& file_name) {
    static const std::unordered_map<std::string, std::string> kTypes = {
        {"mp4", "video"}, {"mkv", "video"}, {"avi", "video"}, {"mov", "video"},
        {"wmv", "video"}, {"webm", "video"}, {"m4v", "video"}, {"ts", "video"},
        {"mp3", "audio"}, {"flac", "audio"}, {"wav", "audio"}, {"aac", "audio"},
        {"ogg", "audio"}, {"m4a", "audio"}, {"opus", "audio"},
        {"jpg", "image"}, {"jpeg", "image"}, {"png", "image"}, {"gif", "image"},
        {"webp", "image"}, {"bmp", "image"}, {"svg", "image"},
        {"pdf", "document"}, {"doc", "document"}, {"docx", "document"},
        {"txt", "document"}, {"rtf", "document"},
        {"xls", "spreadsheet"}, {"xlsx", "spreadsheet"}, {"csv", "spreadsheet"},
        {"zip", "archive"}, {"rar", "archive"}, {"7z", "archive"},
        {"tar", "archive"}, {"gz", "archive"},
        {"exe", "application"}, {"msi", "application"}, {"apk", "application"},
        {"torrent", "torrent"},
        {"srt", "subtitle"}, {"vtt", "subtitle"}, {"sub", "subtitle"},
    };

    auto dot = file_name.rfind('.');
    if (dot == std::string::npos || dot + 1 >= file_name.size()) {
        return "other";
    }
    std::string ext = file_name.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto it = kTypes.find(ext);
    return it != kTypes.end() ? it->second : "other";
}

bool is_safe_path_component(const std::string& name) {
    if (name.empty() || name == "." || name == "..") {
        return false;
    }
    return name.find('/') == std::string::npos &&
           name.find('\\') == std::string::npos &&
           name.find('\0') == std::string::npos;
}

void to_json(nlohmann::json& j, const Transfer& transfer) {
    j = nlohmann::json{
        {"id", transfer.id},
        {"source", transfer.source},
        {"destinationName", transfer.destination_name},
        {"category", transfer.category},
        {"fileType", transfer.file_type},
        {"mediaId", transfer.media_id},
        {"totalBytes", transfer.total_bytes},
        {"downloadedBytes", transfer.downloaded_bytes},
        {"status", to_string(transfer.status)},
        {"speedBytesPerSec", transfer.speed_bytes_per_sec},
        {"etaSeconds", transfer.eta_seconds},
        {"retryCount", transfer.retry_count},
        {"lastError", transfer.last_error},
        {"errorCode", static_cast<int>(transfer.error_code)},
        {"errorKind", kind_name(transfer.error_code)},
        {"note", transfer.note},
        {"sequence", transfer.sequence},
        {"createdAt", transfer.created_at},
        {"startedAt", transfer.started_at},
        {"completedAt", transfer.completed_at},
        {"updatedAt", transfer.updated_at},
    };
    auto progress = transfer.progress();
    j["progress"] = progress ? nlohmann::json(*progress) : nlohmann::json(nullptr);
}

void from_json(const nlohmann::json& j, Transfer& transfer) {
    transfer.id = j.at("id").get<std::string>();
    transfer.source = j.at("source").get<std::string>();
    transfer.destination_name = j.at("destinationName").get<std::string>();
    transfer.category = j.value("category", std::string("other"));
    transfer.file_type = j.value("fileType", classify_file_type(transfer.destination_name));
    transfer.media_id = j.value("mediaId", std::string());
    transfer.total_bytes = j.value("totalBytes", uint64_t{0});
    transfer.downloaded_bytes = j.value("downloadedBytes", uint64_t{0});

    auto status = parse_transfer_status(j.at("status").get<std::string>());
    if (!status) {
        throw TransferdError(ErrorCode::StorageError,
                             "unknown status '" + j.at("status").get<std::string>() + "'");
    }
    transfer.status = *status;

    transfer.speed_bytes_per_sec = j.value("speedBytesPerSec", 0.0);
    transfer.eta_seconds = j.value("etaSeconds", int64_t{-1});
    transfer.retry_count = j.value("retryCount", uint32_t{0});
    transfer.last_error = j.value("lastError", std::string());
    transfer.error_code = static_cast<ErrorCode>(j.value("errorCode", 0));
    transfer.note = j.value("note", std::string());
    transfer.sequence = j.value("sequence", uint64_t{0});
    transfer.created_at = j.value("createdAt", uint64_t{0});
    transfer.started_at = j.value("startedAt", uint64_t{0});
    transfer.completed_at = j.value("completedAt", uint64_t{0});
    transfer.updated_at = j.value("updatedAt", uint64_t{0});
}

} // namespace transferd
