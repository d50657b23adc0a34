#pragma once
#include <string>
#include <cstddef>
#include <nlohmann/json.hpp>

namespace ReadServe {
    struct Config {
        std::string listen_address = "0.0.0.0";
        int listen_port = 8080;
        long handler_timeout_ms = 5000;
        long http_timeout_ms = 10000;
        long dial_timeout_ms = 30000;
        long http_max_redirects = 5;
        long long max_body_bytes = 2097152; // 2 MiB
        long server_io_timeout_ms = 30000;
        long max_connections = 256;
        std::string default_accept_language = "en-US,en;q=0.9";
        std::string content_security_policy = "default-src 'self'; script-src 'self' https://bookmarklet-theme.vercel.app; style-src 'self' https://unpkg.com;";
        std::string referrer_policy = "no-referrer-when-downgrade";
        std::string log_level = "info";
        std::string log_dir;

        void Load(const std::string& path);
        void CreateDefault(const std::string& path);
        nlohmann::json ToJson() const;
    };
}
