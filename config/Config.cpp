#include "Config.hpp"
#include <fstream>
#include <iomanip>
#include <stdexcept>
#include <filesystem>
#include "../src/utils/Logger.hpp"

namespace ReadServe {

void Config::Load(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }
    nlohmann::json data;
    try {
        data = nlohmann::json::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed config file " + path + ": " + e.what());
    }
    if (!data.is_object()) {
        throw std::runtime_error("Config file " + path + " must contain a JSON object");
    }

    const Config defaults;
    try {
        listen_address = data.value("listen_address", defaults.listen_address);
        listen_port = data.value("listen_port", defaults.listen_port);
        handler_timeout_ms = data.value("handler_timeout_ms", defaults.handler_timeout_ms);
        http_timeout_ms = data.value("http_timeout_ms", defaults.http_timeout_ms);
        dial_timeout_ms = data.value("dial_timeout_ms", defaults.dial_timeout_ms);
        http_max_redirects = data.value("http_max_redirects", defaults.http_max_redirects);
        max_body_bytes = data.value("max_body_bytes", defaults.max_body_bytes);
        server_io_timeout_ms = data.value("server_io_timeout_ms", defaults.server_io_timeout_ms);
        max_connections = data.value("max_connections", defaults.max_connections);
        default_accept_language = data.value("default_accept_language", defaults.default_accept_language);
        content_security_policy = data.value("content_security_policy", defaults.content_security_policy);
        referrer_policy = data.value("referrer_policy", defaults.referrer_policy);
        log_level = data.value("log_level", defaults.log_level);
        log_dir = data.value("log_dir", defaults.log_dir);
    } catch (const nlohmann::json::type_error& e) {
        throw std::runtime_error("Invalid value type in config file " + path + ": " + e.what());
    }

    if (listen_port <= 0 || listen_port > 65535) {
        throw std::runtime_error("listen_port must be between 1 and 65535");
    }
    if (handler_timeout_ms <= 0 || http_timeout_ms <= 0 || dial_timeout_ms <= 0 || server_io_timeout_ms <= 0) {
        throw std::runtime_error("timeouts must be positive");
    }
    if (http_max_redirects < 0) {
        throw std::runtime_error("http_max_redirects must not be negative");
    }
    if (max_body_bytes <= 0) {
        throw std::runtime_error("max_body_bytes must be positive");
    }
    if (max_connections <= 0) {
        throw std::runtime_error("max_connections must be positive");
    }

    // Write back missing keys so existing config.json reflects newly added options.
    // Unknown keys are preserved.
    bool changed = false;
    const nlohmann::json current = ToJson();
    for (auto it = current.begin(); it != current.end(); ++it) {
        if (!data.contains(it.key())) {
            data[it.key()] = it.value();
            changed = true;
        }
    }

    if (changed) {
        std::filesystem::path p(path);
        std::filesystem::path bak = p;
        bak += ".bak";
        std::error_code ec;
        std::filesystem::copy_file(p, bak, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec) {
            Logger::Log(LogLevel::Warn, "Could not back up config before update: " + ec.message());
        }

        std::ofstream o(path, std::ios::trunc);
        if (!o.is_open()) {
            Logger::Log(LogLevel::Warn, "Could not write missing keys back to " + path);
            return;
        }
        o << std::setw(4) << data << std::endl;
    }
}

void Config::CreateDefault(const std::string& path_str) {
    std::filesystem::path path(path_str);

    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }

    Config defaultConfig;
    std::ofstream o(path);
    if (!o.is_open()) {
        throw std::runtime_error("Could not open config file for writing: " + path_str);
    }
    o << std::setw(4) << defaultConfig.ToJson() << std::endl;
}

nlohmann::json Config::ToJson() const {
    nlohmann::json data;
    data["listen_address"] = listen_address;
    data["listen_port"] = listen_port;
    data["handler_timeout_ms"] = handler_timeout_ms;
    data["http_timeout_ms"] = http_timeout_ms;
    data["dial_timeout_ms"] = dial_timeout_ms;
    data["http_max_redirects"] = http_max_redirects;
    data["max_body_bytes"] = max_body_bytes;
    data["server_io_timeout_ms"] = server_io_timeout_ms;
    data["max_connections"] = max_connections;
    data["default_accept_language"] = default_accept_language;
    data["content_security_policy"] = content_security_policy;
    data["referrer_policy"] = referrer_policy;
    data["log_level"] = log_level;
    data["log_dir"] = log_dir;
    return data;
}

}
