#include "Response.hpp"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>
#include "../utils/Logger.hpp"

namespace {

bool EqualsIgnoreCase(const std::string& a, const std::string& b) {
    return a.size() == b.size() && std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
        return std::tolower(x) == std::tolower(y);
    });
}

}

namespace ReadServe {

bool Response::SetHeader(const std::string& name, const std::string& value) {
    if (committed_) return false;
    for (auto& header : headers_) {
        if (EqualsIgnoreCase(header.first, name)) {
            header.second = value;
            return true;
        }
    }
    headers_.emplace_back(name, value);
    return true;
}

std::string Response::Header(const std::string& name) const {
    for (const auto& header : headers_) {
        if (EqualsIgnoreCase(header.first, name)) return header.second;
    }
    return "";
}

bool Response::SetStatus(int status) {
    if (committed_) return false;
    status_ = status;
    return true;
}

void Response::Write(std::string_view data) {
    committed_ = true;
    body_.append(data.data(), data.size());
}

bool Response::WriteError(int status, const std::string& message) {
    if (committed_) {
        Logger::Log(LogLevel::Error, "Cannot send error response (" + std::to_string(status) + " " + message + "): body already started");
        return false;
    }
    nlohmann::json body = {{"error", message}};
    SetHeader("Content-Type", "application/json");
    SetStatus(status);
    Write(body.dump() + "\n");
    return true;
}

}
