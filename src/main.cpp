#include <iostream>
#include <cstdlib>
#include <curl/curl.h>
#include <filesystem>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include "../config/Config.hpp"
#include "core/ArticleFetcher.hpp"
#include "core/HtmlTemplate.hpp"
#include "core/ReaderHandler.hpp"
#include "core/RenderDispatcher.hpp"
#include "network/SafeTransport.hpp"
#include "parser/ArticleExtractor.hpp"
#include "server/HttpServer.hpp"
#include "server/ReaderEndpoint.hpp"
#include "utils/Logger.hpp"

namespace {

// Global libcurl state for the lifetime of main.
struct CurlGlobal {
    CURLcode status;
    CurlGlobal() : status(curl_global_init(CURL_GLOBAL_ALL)) {}
    ~CurlGlobal() { if (status == CURLE_OK) curl_global_cleanup(); }
};

std::filesystem::path ConfigPath(int argc, char* argv[]) {
    for (int i = 1; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == "--config") {
            return std::filesystem::path(argv[i + 1]);
        }
    }
    std::filesystem::path exe_dir = std::filesystem::path(argv[0]).parent_path();
    return exe_dir / "config" / "config.json";
}

}

int main(int argc, char* argv[]) {
    if (argc == 0 || argv[0] == nullptr) {
        ReadServe::Logger::Log(ReadServe::LogLevel::Error, "Cannot determine executable path.");
        return 1;
    }
    const std::string config_path_str = ConfigPath(argc, argv).string();

    CurlGlobal curl;
    if (curl.status != CURLE_OK) {
        ReadServe::Logger::Log(ReadServe::LogLevel::Error, std::string("curl_global_init failed: ") + curl_easy_strerror(curl.status));
        return 1;
    }

    // Load Config
    ReadServe::Config config;
    try {
        config.Load(config_path_str);
        ReadServe::Logger::Log(ReadServe::LogLevel::Info, "Configuration loaded from: " + config_path_str);
    } catch (const std::runtime_error& e) {
        std::string error_message = e.what();
        if (error_message.find("Could not open config file") != std::string::npos) {
            ReadServe::Logger::Log(ReadServe::LogLevel::Warn, "config.json not found. Creating a default one at: " + config_path_str);
            try {
                config.CreateDefault(config_path_str);
            } catch (const std::exception& create_e) {
                // Defaults still apply; only the file could not be written.
                ReadServe::Logger::Log(ReadServe::LogLevel::Warn, "Failed to create default config: " + std::string(create_e.what()));
            }
        } else {
            ReadServe::Logger::Log(ReadServe::LogLevel::Error, "Failed to load config: " + error_message);
            return 1;
        }
    }

    ReadServe::Logger::Init(config.log_dir, ReadServe::Logger::FromString(config.log_level));

    try {
        // Setup Core Components
        ReadServe::SafeTransportOptions transport_options;
        transport_options.max_redirects = config.http_max_redirects;
        transport_options.request_timeout = std::chrono::milliseconds(config.http_timeout_ms);
        transport_options.dial_timeout = std::chrono::milliseconds(config.dial_timeout_ms);
        ReadServe::SafeTransport transport(transport_options);

        ReadServe::ArticleExtractor extractor;
        ReadServe::FetchOptions fetch_options;
        fetch_options.max_body_bytes = static_cast<size_t>(config.max_body_bytes);
        fetch_options.default_accept_language = config.default_accept_language;
        ReadServe::ArticleFetcher fetcher(transport, extractor, fetch_options);

        ReadServe::HtmlTemplate html_template;
        ReadServe::RenderDispatcher renderer(html_template);

        ReadServe::ReaderOptions reader_options;
        reader_options.handler_timeout = std::chrono::milliseconds(config.handler_timeout_ms);
        reader_options.content_security_policy = config.content_security_policy;
        reader_options.referrer_policy = config.referrer_policy;
        ReadServe::ReaderHandler handler(fetcher, renderer, reader_options);
        ReadServe::ReaderEndpoint endpoint(handler);

        ReadServe::HttpServerOptions server_options;
        server_options.io_timeout = std::chrono::milliseconds(config.server_io_timeout_ms);
        server_options.max_connections = static_cast<size_t>(config.max_connections);
        ReadServe::HttpServer server(config.listen_address, static_cast<unsigned short>(config.listen_port),
            [&endpoint](const ReadServe::HttpRequest& req, const ReadServe::RequestContext& ctx) {
                return endpoint(req, ctx);
            }, server_options);
        server.Start();
        ReadServe::Logger::Log(ReadServe::LogLevel::Info, "Listening on " + config.listen_address + ":" + std::to_string(server.Port()));

        boost::asio::io_context signal_ioc;
        boost::asio::signal_set signals(signal_ioc, SIGINT, SIGTERM);
        signals.async_wait([](const boost::system::error_code& ec, int signal_number) {
            if (!ec) {
                ReadServe::Logger::Log(ReadServe::LogLevel::Info, "Received signal " + std::to_string(signal_number) + ", shutting down");
            }
        });
        signal_ioc.run();

        server.Stop();
    } catch (const std::exception& e) {
        ReadServe::Logger::Log(ReadServe::LogLevel::Error, "Fatal: " + std::string(e.what()));
        return 1;
    }

    ReadServe::Logger::Log(ReadServe::LogLevel::Info, "Server stopped");
    return 0;
}
