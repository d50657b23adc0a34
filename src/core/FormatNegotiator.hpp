#pragma once
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace ReadServe {

// Request signals the output format is chosen from.
struct NegotiationInput {
    std::optional<std::string> format_param;
    std::string accept;
    std::string user_agent;
};

// A rule yields a format token when it applies to the input.
using NegotiationRule = std::function<std::optional<std::string>(const NegotiationInput&)>;

class FormatNegotiator {
public:
    // Explicit format parameter, then Accept, then known crawler User-Agents, then "html".
    // The explicit value is returned as given; it is validated when rendering.
    static std::string Select(const NegotiationInput& input);

    // Rules in evaluation order. The first rule that yields a token wins.
    static const std::vector<NegotiationRule>& Rules();

    // Case-insensitive match against known LLM agents and crawlers.
    static bool IsAutomationAgent(const std::string& user_agent);

    static constexpr const char* kDefaultFormat = "html";
};

}
