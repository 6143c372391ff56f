#include "transferd/control/command_handler.h"
#include "transferd/base/logger.h"
#include <limits>
#include <nlohmann/json.hpp>

namespace transferd {

using json = nlohmann::json;

namespace {

// Optional string argument; present but not a string is a bad request
std::string string_arg(const json& data, const char* key, const char* alias = nullptr) {
    for (const char* name : {key, alias}) {
        if (name == nullptr) {
            continue;
        }
        auto it = data.find(name);
        if (it == data.end() || it->is_null()) {
            continue;
        }
        if (!it->is_string()) {
            throw TransferdError(ErrorCode::InvalidRequest, std::string("'") + name + "' must be a string");
        }
        return it->get<std::string>();
    }
    return {};
}

std::string required_id(const json& data) {
    std::string id = string_arg(data, "id");
    if (id.empty()) {
        throw TransferdError(ErrorCode::InvalidRequest, "'id' is required");
    }
    return id;
}

uint64_t unsigned_arg(const json& data, const char* key) {
    auto it = data.find(key);
    if (it == data.end() || it->is_null()) {
        return 0;
    }
    if (!it->is_number_unsigned() && !(it->is_number_integer() && it->get<int64_t>() >= 0)) {
        throw TransferdError(ErrorCode::InvalidRequest, std::string("'") + key + "' must be a non-negative integer");
    }
    return it->get<uint64_t>();
}

TransferFilter parse_filter(const json& data) {
    TransferFilter filter;
    std::string status = string_arg(data, "status");
    if (!status.empty()) {
        filter.status = parse_transfer_status(status);
        if (!filter.status) {
            throw TransferdError(ErrorCode::InvalidRequest, "unknown status '" + status + "'");
        }
    }
    std::string category = string_arg(data, "category");
    if (!category.empty()) filter.category = category;
    std::string file_type = string_arg(data, "fileType");
    if (!file_type.empty()) filter.file_type = file_type;
    std::string media_id = string_arg(data, "mediaId");
    if (!media_id.empty()) filter.media_id = media_id;
    return filter;
}

} // anonymous namespace

CommandHandler::CommandHandler(Scheduler& scheduler) : scheduler_(scheduler) {}

CommandHandler::~CommandHandler() {
    unbind();
}

json CommandHandler::handle(const json& message) {
    json data = json::object();
    if (message.is_object() && message.contains("data") && message["data"].is_object()) {
        data = message["data"];
    }
    std::string command;
    if (message.is_object() && message.contains("event") && message["event"].is_string()) {
        command = message["event"].get<std::string>();
    }

    json result = {
        {"requestId", data.contains("requestId") ? data["requestId"] : json(nullptr)},
        {"command", command},
        {"ok", true}
    };

    try {
        if (command == "enqueue") {
            TransferRequest request;
            request.source = string_arg(data, "source", "url");
            request.destination_name = string_arg(data, "destinationName", "name");
            request.total_bytes_hint = unsigned_arg(data, "totalBytes");
            request.category = string_arg(data, "category");
            request.media_id = string_arg(data, "mediaId");
            result["transfer"] = scheduler_.enqueue(request);
        } else if (command == "pause") {
            result["transfer"] = scheduler_.pause(required_id(data));
        } else if (command == "resume") {
            result["transfer"] = scheduler_.resume(required_id(data));
        } else if (command == "cancel") {
            scheduler_.cancel(required_id(data));
        } else if (command == "clear_completed") {
            result["count"] = scheduler_.clear_completed();
        } else if (command == "list") {
            auto transfers = scheduler_.list(parse_filter(data));
            result["count"] = transfers.size();
            result["transfers"] = transfers;
        } else if (command == "get") {
            std::string id = required_id(data);
            auto transfer = scheduler_.get(id);
            if (!transfer) {
                throw TransferdError(ErrorCode::NotFound, "Transfer not found: " + id);
            }
            result["transfer"] = *transfer;
        } else if (command == "set_max_concurrent") {
            uint64_t n = unsigned_arg(data, "maxConcurrent");
            if (n > std::numeric_limits<uint32_t>::max()) {
                throw TransferdError(ErrorCode::InvalidRequest, "'maxConcurrent' is out of range");
            }
            scheduler_.set_max_concurrent(static_cast<uint32_t>(n));
            result["maxConcurrent"] = scheduler_.max_concurrent();
        } else {
            throw TransferdError(ErrorCode::InvalidRequest, "unknown command '" + command + "'");
        }
    } catch (const TransferdError& e) {
        result["ok"] = false;
        result["error"] = {
            {"code", static_cast<int>(e.code())},
            {"kind", kind_name(e.code())},
            {"message", e.detail()}
        };
        Logger::instance().debug("Command {} failed: {}", command, e.what());
    } catch (const json::exception& e) {
        result["ok"] = false;
        result["error"] = {
            {"code", static_cast<int>(ErrorCode::InvalidRequest)},
            {"kind", kind_name(ErrorCode::InvalidRequest)},
            {"message", e.what()}
        };
    }

    return {{"type", "command"}, {"event", "result"}, {"data", std::move(result)}};
}

void CommandHandler::bind(NotificationChannel& channel) {
    unbind();
    channel_ = &channel;
    handler_id_ = channel.on("command", "", [this](const json& message) {
        if (message.value("event", std::string()) == "result") {
            return;
        }
        json reply = handle(message);
        if (!channel_->send(reply)) {
            Logger::instance().warning("Failed to send command reply for {}",
                                       reply["data"].value("command", std::string()));
        }
    });
}

void CommandHandler::unbind() {
    if (channel_) {
        channel_->off(handler_id_);
        channel_ = nullptr;
        handler_id_ = 0;
    }
}

} // namespace transferd
