#include "HttpServer.hpp"
#include <algorithm>
#include <sys/socket.h>
#include <boost/asio/ip/address.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include "../utils/Logger.hpp"

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace ReadServe {

namespace {

using Clock = std::chrono::steady_clock;

constexpr Clock::time_point kNoDeadline = Clock::time_point::max();

}

HttpServer::HttpServer(const std::string& address, unsigned short port, RequestHandler handler, HttpServerOptions options)
    : acceptor_(ioc_), reaper_(ioc_), handler_(std::move(handler)), options_(options) {
    tcp::endpoint endpoint(boost::asio::ip::make_address(address), port);
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(boost::asio::socket_base::max_listen_connections);
    DoAccept();
    ScheduleReap();
}

HttpServer::~HttpServer() {
    Stop();
}

unsigned short HttpServer::Port() const {
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
}

void HttpServer::Run() {
    ioc_.run();
}

void HttpServer::Start() {
    thread_ = std::thread([this]() { Run(); });
}

void HttpServer::Stop() {
    if (stopped_.exchange(true)) return;

    ioc_.stop();
    if (thread_.joinable()) thread_.join();
    boost::system::error_code ec;
    acceptor_.close(ec);

    server_ctx_.Cancel();
    std::unique_lock<std::mutex> lock(sessions_mutex_);
    // Unblock sessions waiting on an idle keep-alive connection.
    for (const auto& entry : sessions_) {
        ::shutdown(entry.first->native_handle(), SHUT_RDWR);
    }
    sessions_cv_.wait(lock, [this]() { return sessions_.empty(); });
}

void HttpServer::DoAccept() {
    acceptor_.async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                Logger::Log(LogLevel::Warn, "Accept failed: " + ec.message());
            }
        } else {
            tcp::socket* raw = nullptr;
            {
                std::lock_guard<std::mutex> lock(sessions_mutex_);
                if (sessions_.size() < options_.max_connections) {
                    raw = new tcp::socket(std::move(socket));
                    sessions_.emplace(raw, Clock::now() + options_.io_timeout);
                }
            }
            if (raw == nullptr) {
                Logger::Log(LogLevel::Warn, "Connection limit reached (" + std::to_string(options_.max_connections) + "), closing new connection");
                boost::system::error_code ignored;
                socket.close(ignored);
                if (acceptor_.is_open() && !stopped_) DoAccept();
                return;
            }
            std::thread([this, raw]() {
                std::unique_ptr<tcp::socket> owned(raw);
                Session(*owned);

                std::lock_guard<std::mutex> lock(sessions_mutex_);
                boost::system::error_code ignored;
                owned->shutdown(tcp::socket::shutdown_send, ignored);
                owned->close(ignored);
                sessions_.erase(raw);
                owned.reset();
                sessions_cv_.notify_all();
            }).detach();
        }
        if (acceptor_.is_open() && !stopped_) DoAccept();
    });
}

void HttpServer::ScheduleReap() {
    auto interval = std::clamp(options_.io_timeout / 4, std::chrono::milliseconds(10), std::chrono::milliseconds(1000));
    reaper_.expires_after(interval);
    reaper_.async_wait([this](boost::system::error_code ec) {
        if (ec || stopped_) return;
        ReapExpired();
        ScheduleReap();
    });
}

void HttpServer::ReapExpired() {
    const auto now = Clock::now();
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (auto& entry : sessions_) {
        if (entry.second <= now) {
            Logger::Log(LogLevel::Debug, "Closing connection after I/O timeout");
            // The session thread sees end of stream or an error and exits.
            ::shutdown(entry.first->native_handle(), SHUT_RDWR);
            entry.second = kNoDeadline;
        }
    }
}

void HttpServer::SetDeadline(tcp::socket* socket, Clock::time_point deadline) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(socket);
    if (it != sessions_.end()) it->second = deadline;
}

void HttpServer::Session(tcp::socket& socket) {
    boost::beast::flat_buffer buffer;
    boost::system::error_code ec;

    for (;;) {
        HttpRequest req;
        SetDeadline(&socket, Clock::now() + options_.io_timeout);
        http::read(socket, buffer, req, ec);
        if (ec == http::error::end_of_stream) break;
        if (ec) {
            Logger::Log(LogLevel::Debug, "Connection read ended: " + ec.message());
            break;
        }

        SetDeadline(&socket, kNoDeadline);
        HttpReply res;
        try {
            res = handler_(req, server_ctx_);
        } catch (const std::exception& e) {
            Logger::Log(LogLevel::Error, "Unhandled error while serving " + std::string(req.target()) + ": " + e.what());
            res = HttpReply(http::status::internal_server_error, req.version());
            res.set(http::field::content_type, "application/json");
            res.body() = "{\"error\":\"internal server error\"}\n";
        }
        res.version(req.version());
        res.keep_alive(req.keep_alive() && !stopped_);
        res.prepare_payload();

        SetDeadline(&socket, Clock::now() + options_.io_timeout);
        http::write(socket, res, ec);
        if (ec) {
            Logger::Log(LogLevel::Debug, "Connection write failed: " + ec.message());
            break;
        }
        if (!res.keep_alive()) break;
    }
}

}
