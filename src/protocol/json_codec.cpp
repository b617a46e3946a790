#include "protocol/json_codec.hpp"

#include <utility>

namespace agentrt::protocol {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentError invalid(const std::string& message, const std::string& code) {
    return AgentError{ErrorCategory::Validation, message, code,
                      "See the request schema: {input: [...], session_id?, user_id?, stream?, tools?}"};
}

json error_to_json(const ErrorInfo& error) {
    json payload;
    payload["code"] = error.code;
    payload["message"] = error.message;
    return payload;
}

std::optional<Role> parse_role(const std::string& text) {
    if (text == "user") return Role::User;
    if (text == "assistant") return Role::Assistant;
    if (text == "system") return Role::System;
    if (text == "tool") return Role::Tool;
    return std::nullopt;
}

std::optional<MessageType> parse_message_type(const std::string& text) {
    if (text == "message") return MessageType::Message;
    if (text == "function_call") return MessageType::FunctionCall;
    if (text == "function_call_output") return MessageType::FunctionCallOutput;
    if (text == "reasoning") return MessageType::Reasoning;
    return std::nullopt;
}

core::errors::Result<Content> parse_content(const json& payload) {
    if (!payload.is_object()) {
        return invalid("Content item must be an object.", "invalid_content");
    }

    Content content;
    std::string type = "text";
    if (const auto it = payload.find("type"); it != payload.end() && !it->is_null()) {
        if (!it->is_string()) {
            return invalid("Content 'type' must be a string.", "invalid_content");
        }
        type = it->get<std::string>();
    }
    if (type == "text") {
        const auto it = payload.find("text");
        if (it == payload.end() || !it->is_string()) {
            return invalid("Text content requires a string 'text' field.", "invalid_content");
        }
        content.type = ContentType::Text;
        content.text = it->get<std::string>();
    } else if (type == "data") {
        const auto it = payload.find("data");
        if (it == payload.end() || !it->is_object()) {
            return invalid("Data content requires an object 'data' field.", "invalid_content");
        }
        content.type = ContentType::Data;
        content.data = *it;
    } else {
        return invalid("Unsupported content type: " + type, "unsupported_content_type");
    }

    if (const auto it = payload.find("delta"); it != payload.end() && it->is_boolean()) {
        content.delta = it->get<bool>();
    }
    if (const auto it = payload.find("status"); it != payload.end() && it->is_string()) {
        const auto status = parse_run_status(it->get<std::string>());
        if (!status) {
            return invalid("Unknown content status: " + it->get<std::string>(), "invalid_status");
        }
        content.status = *status;
    }
    return content;
}

// Optional string field; null is treated as absent.
core::errors::Result<std::optional<std::string>> optional_string(const json& payload,
                                                                 const char* key) {
    const auto it = payload.find(key);
    if (it == payload.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return invalid(std::string("Field '") + key + "' must be a string.", "invalid_field_type");
    }
    return std::optional<std::string>{it->get<std::string>()};
}

}  // namespace

json content_to_json(const Content& content) {
    json payload;
    payload["object"] = "content";
    payload["type"] = to_string(content.type);
    if (content.type == ContentType::Text) {
        payload["text"] = content.text;
    } else {
        payload["data"] = content.data;
    }
    payload["delta"] = content.delta;
    payload["status"] = to_string(content.status);
    return payload;
}

json message_to_json(const Message& message) {
    json payload;
    payload["object"] = "message";
    payload["id"] = message.id;
    payload["type"] = to_string(message.type);
    payload["role"] = to_string(message.role);
    payload["status"] = to_string(message.status);
    payload["content"] = json::array();
    for (const auto& part : message.content) {
        payload["content"].push_back(content_to_json(part));
    }
    payload["error"] = message.error.has_value() ? error_to_json(message.error.value()) : json(nullptr);
    return payload;
}

json response_to_json(const AgentResponse& response) {
    json payload;
    payload["object"] = "response";
    payload["id"] = response.id;
    payload["session_id"] = response.session_id;
    payload["status"] = to_string(response.status);
    payload["created_at"] = response.created_at;
    payload["completed_at"] =
        response.completed_at.has_value() ? json(response.completed_at.value()) : json(nullptr);
    payload["output"] = json::array();
    for (const auto& message : response.output) {
        payload["output"].push_back(message_to_json(message));
    }
    payload["error"] = response.error.has_value() ? error_to_json(response.error.value()) : json(nullptr);
    return payload;
}

json request_to_json(const AgentRequest& request) {
    json payload;
    payload["input"] = json::array();
    for (const auto& message : request.input) {
        payload["input"].push_back(message_to_json(message));
    }
    payload["session_id"] = request.session_id.has_value() ? json(request.session_id.value()) : json(nullptr);
    payload["user_id"] = request.user_id.has_value() ? json(request.user_id.value()) : json(nullptr);
    payload["stream"] = request.stream;
    payload["tools"] = request.tools;
    if (request.id.has_value()) {
        payload["id"] = request.id.value();
    }
    return payload;
}

json event_to_json(const Event& event) {
    json payload = event.is_response() ? response_to_json(*event.response())
                                       : message_to_json(*event.message());
    payload["sequence_number"] = event.sequence_number;
    return payload;
}

core::errors::Result<Message> parse_message(const json& payload) {
    if (!payload.is_object()) {
        return invalid("Input item must be an object.", "invalid_message");
    }

    Message message;
    message.role = Role::User;

    if (const auto it = payload.find("id"); it != payload.end() && it->is_string()) {
        message.id = it->get<std::string>();
    }
    if (const auto it = payload.find("type"); it != payload.end() && !it->is_null()) {
        const auto type = it->is_string() ? parse_message_type(it->get<std::string>()) : std::nullopt;
        if (!type) {
            return invalid("Unknown message type: " + it->dump(), "unknown_message_type");
        }
        message.type = *type;
    }
    if (const auto it = payload.find("role"); it != payload.end() && !it->is_null()) {
        const auto role = it->is_string() ? parse_role(it->get<std::string>()) : std::nullopt;
        if (!role) {
            return invalid("Unknown message role: " + it->dump(), "unknown_role");
        }
        message.role = *role;
    }
    if (const auto it = payload.find("status"); it != payload.end() && !it->is_null()) {
        const auto status = it->is_string() ? parse_run_status(it->get<std::string>()) : std::nullopt;
        if (!status) {
            return invalid("Unknown message status: " + it->dump(), "invalid_status");
        }
        message.status = *status;
    }
    if (const auto it = payload.find("content"); it != payload.end() && !it->is_null()) {
        if (!it->is_array()) {
            return invalid("Message 'content' must be an array.", "invalid_content");
        }
        for (const auto& part : *it) {
            auto parsed = parse_content(part);
            if (core::errors::is_error(parsed)) {
                return core::errors::get_error(parsed);
            }
            message.content.push_back(std::move(core::errors::get_value(parsed)));
        }
    }
    return message;
}

core::errors::Result<AgentRequest> parse_agent_request(const json& payload) {
    if (!payload.is_object()) {
        return invalid("Request body must be a JSON object.", "invalid_request_body");
    }

    AgentRequest request;

    const auto input = payload.find("input");
    if (input == payload.end() || input->is_null()) {
        return invalid("Request is missing the required 'input' field.", "missing_input");
    }
    if (!input->is_array()) {
        return invalid("Field 'input' must be an array.", "invalid_input");
    }
    for (const auto& item : *input) {
        auto message = parse_message(item);
        if (core::errors::is_error(message)) {
            return core::errors::get_error(message);
        }
        request.input.push_back(std::move(core::errors::get_value(message)));
    }

    auto session_id = optional_string(payload, "session_id");
    if (core::errors::is_error(session_id)) {
        return core::errors::get_error(session_id);
    }
    request.session_id = core::errors::get_value(session_id);

    auto user_id = optional_string(payload, "user_id");
    if (core::errors::is_error(user_id)) {
        return core::errors::get_error(user_id);
    }
    request.user_id = core::errors::get_value(user_id);

    auto request_id = optional_string(payload, "id");
    if (core::errors::is_error(request_id)) {
        return core::errors::get_error(request_id);
    }
    request.id = core::errors::get_value(request_id);

    if (const auto it = payload.find("stream"); it != payload.end() && !it->is_null()) {
        if (!it->is_boolean()) {
            return invalid("Field 'stream' must be a boolean.", "invalid_field_type");
        }
        request.stream = it->get<bool>();
    }

    if (const auto it = payload.find("tools"); it != payload.end() && !it->is_null()) {
        if (!it->is_array()) {
            return invalid("Field 'tools' must be an array.", "invalid_field_type");
        }
        for (const auto& tool : *it) {
            request.tools.push_back(tool);
        }
    }

    return request;
}

core::errors::Result<AgentRequest> parse_agent_request_text(const std::string& body) {
    json payload = json::parse(body, nullptr, /*allow_exceptions=*/false);
    if (payload.is_discarded()) {
        return invalid("Request body is not valid JSON.", "invalid_json");
    }
    return parse_agent_request(payload);
}

}  // namespace agentrt::protocol
