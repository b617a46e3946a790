#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "core/config/ids.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/run_status.hpp"

namespace agentrt::protocol {

    inline std::int64_t now_unix_seconds() {
        return std::chrono::duration_cast<std::chrono::seconds>(
                   std::chrono::system_clock::now().time_since_epoch())
            .count();
    }

    // The envelope wrapping every event of one request.
    // created -> in_progress -> completed | failed, terminal exactly once.
    struct AgentResponse {
        std::string id = core::config::generate_prefixed_id("response");
        std::string session_id;
        RunStatus status = RunStatus::Created;
        std::int64_t created_at = now_unix_seconds();
        std::optional<std::int64_t> completed_at;
        std::vector<Message> output;
        std::optional<ErrorInfo> error;

        void in_progress() { status = RunStatus::InProgress; }

        void completed() {
            status = RunStatus::Completed;
            completed_at = now_unix_seconds();
        }

        void failed(ErrorInfo info) {
            status = RunStatus::Failed;
            completed_at = now_unix_seconds();
            error = std::move(info);
        }

        void add_message(Message message) { output.push_back(std::move(message)); }

        // Text of every accumulated message, in arrival order
        std::vector<std::string> output_texts() const {
            std::vector<std::string> texts;
            for (const auto& message : output) {
                texts.push_back(message.joined_text());
            }
            return texts;
        }
    };

    // One unit on the wire: a handler message or an envelope snapshot.
    struct Event {
        std::int64_t sequence_number = 0;
        std::variant<Message, AgentResponse> body;

        bool is_response() const { return std::holds_alternative<AgentResponse>(body); }

        const AgentResponse* response() const { return std::get_if<AgentResponse>(&body); }
        const Message* message() const { return std::get_if<Message>(&body); }

        RunStatus status() const {
            if (const auto* envelope = response()) {
                return envelope->status;
            }
            return std::get<Message>(body).status;
        }

        std::string object() const { return is_response() ? "response" : "message"; }
    };

} // namespace agentrt::protocol
