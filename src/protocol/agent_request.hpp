#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/message_contract.hpp"

namespace agentrt::protocol {

    // The validated input of one agent invocation
    struct AgentRequest {
        std::optional<std::string> id;
        std::optional<std::string> session_id;  // Backfilled once if absent
        std::optional<std::string> user_id;     // Backfilled once if absent
        std::vector<Message> input;
        std::vector<nlohmann::json> tools;      // Opaque tool descriptors
        bool stream = true;

        // Text of the last user message, empty when there is none
        std::string last_user_text() const {
            for (auto it = input.rbegin(); it != input.rend(); ++it) {
                if (it->role == Role::User && it->type == MessageType::Message) {
                    return it->joined_text();
                }
            }
            return "";
        }
    };

} // namespace agentrt::protocol
