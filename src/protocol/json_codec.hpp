#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/agent_request.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/message_contract.hpp"

namespace agentrt::protocol {

nlohmann::json content_to_json(const Content& content);
nlohmann::json message_to_json(const Message& message);
nlohmann::json response_to_json(const AgentResponse& response);
nlohmann::json request_to_json(const AgentRequest& request);

// Wire form of one stream element: the body plus "sequence_number" and "object".
nlohmann::json event_to_json(const Event& event);

// All parse failures are ErrorCategory::Validation.
core::errors::Result<Message> parse_message(const nlohmann::json& payload);
core::errors::Result<AgentRequest> parse_agent_request(const nlohmann::json& payload);
core::errors::Result<AgentRequest> parse_agent_request_text(const std::string& body);

}  // namespace agentrt::protocol
