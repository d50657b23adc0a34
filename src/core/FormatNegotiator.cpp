#include "FormatNegotiator.hpp"
#include <algorithm>
#include <array>

namespace {

const std::array<const char*, 9> kAutomationAgents = {
    "gptbot",
    "chatgpt",
    "claude",
    "googlebot",
    "bingbot",
    "anthropic",
    "perplexity",
    "claudebot",
    "github-copilot",
};

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + 32) : static_cast<char>(c);
    });
    return s;
}

ReadServe::NegotiationRule AcceptRule(std::vector<std::string> media_types, std::string token) {
    return [media_types = std::move(media_types), token = std::move(token)](const ReadServe::NegotiationInput& in) -> std::optional<std::string> {
        const std::string accept = ToLower(in.accept);
        for (const auto& media_type : media_types) {
            if (accept.find(media_type) != std::string::npos) return token;
        }
        return std::nullopt;
    };
}

} // anonymous namespace

namespace ReadServe {

const std::vector<NegotiationRule>& FormatNegotiator::Rules() {
    static const std::vector<NegotiationRule> rules = {
        // An empty format parameter counts as absent.
        [](const NegotiationInput& in) -> std::optional<std::string> {
            if (in.format_param && !in.format_param->empty()) return *in.format_param;
            return std::nullopt;
        },
        AcceptRule({"application/json"}, "json"),
        AcceptRule({"text/markdown", "text/x-markdown"}, "md"),
        AcceptRule({"text/plain"}, "text"),
        AcceptRule({"text/html"}, "html"),
        [](const NegotiationInput& in) -> std::optional<std::string> {
            if (IsAutomationAgent(in.user_agent)) return std::string("md");
            return std::nullopt;
        },
    };
    return rules;
}

std::string FormatNegotiator::Select(const NegotiationInput& input) {
    for (const auto& rule : Rules()) {
        if (auto token = rule(input)) return *token;
    }
    return kDefaultFormat;
}

bool FormatNegotiator::IsAutomationAgent(const std::string& user_agent) {
    const std::string ua = ToLower(user_agent);
    return std::any_of(kAutomationAgents.begin(), kAutomationAgents.end(), [&ua](const char* needle) {
        return ua.find(needle) != std::string::npos;
    });
}

}
