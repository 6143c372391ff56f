#ifndef TRANSFERD_CONTROL_COMMAND_HANDLER_H
#define TRANSFERD_CONTROL_COMMAND_HANDLER_H

#include "transferd/notify/notification_channel.h"
#include "transferd/transfer/scheduler.h"
#include <nlohmann/json_fwd.hpp>

namespace transferd {

// Maps {"type":"command","event":<name>,"data":{...}} messages onto
// Scheduler commands and answers with {"type":"command","event":"result"}.
class CommandHandler {
public:
    explicit CommandHandler(Scheduler& scheduler);
    ~CommandHandler();

    CommandHandler(const CommandHandler&) = delete;
    CommandHandler& operator=(const CommandHandler&) = delete;

    // Execute one command message and build the reply
    nlohmann::json handle(const nlohmann::json& message);

    // Serve commands arriving on the channel; replies go back over it
    void bind(NotificationChannel& channel);
    void unbind();

private:
    Scheduler& scheduler_;
    NotificationChannel* channel_ = nullptr;
    HandlerId handler_id_ = 0;
};

} // namespace transferd

#endif // TRANSFERD_CONTROL_COMMAND_HANDLER_H
