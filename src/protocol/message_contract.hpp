#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "core/config/ids.hpp"
#include "protocol/run_status.hpp"
#include "protocol/tool_contract.hpp"

namespace agentrt::protocol {

    enum class Role {
        User,
        Assistant,
        System,
        Tool
    };

    // The four kinds of output a handler may produce
    enum class MessageType {
        Message,
        FunctionCall,
        FunctionCallOutput,
        Reasoning
    };

    enum class ContentType {
        Text,
        Data
    };

    struct ErrorInfo {
        std::string code;
        std::string message;
    };

    struct Content {
        ContentType type = ContentType::Text;
        std::string text;                                  // ContentType::Text
        nlohmann::json data = nlohmann::json::object();    // ContentType::Data
        bool delta = false;
        RunStatus status = RunStatus::Completed;
    };

    struct Message {
        std::string id = core::config::generate_prefixed_id("msg");
        MessageType type = MessageType::Message;
        Role role = Role::Assistant;
        std::vector<Content> content;
        RunStatus status = RunStatus::Completed;
        std::optional<ErrorInfo> error;

        // Completed single-text message
        static Message text(Role role, std::string text) {
            Message message;
            message.role = role;
            Content content;
            content.type = ContentType::Text;
            content.text = std::move(text);
            message.content.push_back(std::move(content));
            return message;
        }

        static Message reasoning(std::string text) {
            Message message = Message::text(Role::Assistant, std::move(text));
            message.type = MessageType::Reasoning;
            return message;
        }

        static Message function_call(const FunctionCall& call) {
            Message message;
            message.type = MessageType::FunctionCall;
            message.role = Role::Assistant;
            Content content;
            content.type = ContentType::Data;
            content.data = {{"call_id", call.call_id},
                            {"name", call.name},
                            {"arguments", call.arguments}};
            message.content.push_back(std::move(content));
            return message;
        }

        static Message function_call_output(const FunctionCallOutput& output) {
            Message message;
            message.type = MessageType::FunctionCallOutput;
            message.role = Role::Tool;
            Content content;
            content.type = ContentType::Data;
            content.data = {{"call_id", output.call_id}, {"output", output.output}};
            message.content.push_back(std::move(content));
            return message;
        }

        // Concatenation of every text content part
        std::string joined_text() const {
            std::string joined;
            for (const auto& part : content) {
                if (part.type == ContentType::Text) {
                    joined += part.text;
                }
            }
            return joined;
        }
    };

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::User: return "user";
            case Role::Assistant: return "assistant";
            case Role::System: return "system";
            case Role::Tool: return "tool";
            default: return "unknown";
        }
    }

    inline std::string to_string(const MessageType type) {
        switch (type) {
            case MessageType::Message: return "message";
            case MessageType::FunctionCall: return "function_call";
            case MessageType::FunctionCallOutput: return "function_call_output";
            case MessageType::Reasoning: return "reasoning";
            default: return "unknown";
        }
    }

    inline std::string to_string(const ContentType type) {
        switch (type) {
            case ContentType::Text: return "text";
            case ContentType::Data: return "data";
            default: return "unknown";
        }
    }

} // namespace agentrt::protocol
