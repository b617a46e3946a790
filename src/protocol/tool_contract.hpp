#pragma once
#include <string>

namespace agentrt::protocol {

    // How the model asks the caller to run a tool
    struct FunctionCall {
        std::string call_id;
        std::string name;       // e.g., "get_current_weather"
        std::string arguments;  // Raw JSON string of the arguments
    };

    // How the tool result is handed back to the model
    struct FunctionCallOutput {
        std::string call_id;
        std::string output;     // Raw tool output, usually JSON text
    };

} // namespace agentrt::protocol
