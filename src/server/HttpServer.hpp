#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/http.hpp>
#include "../network/RequestContext.hpp"

namespace ReadServe {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpReply = boost::beast::http::response<boost::beast::http::string_body>;
using RequestHandler = std::function<HttpReply(const HttpRequest&, const RequestContext&)>;

struct HttpServerOptions {
    // A request must arrive, and a reply be written, within this time; idle keep-alive
    // connections are closed when it runs out.
    std::chrono::milliseconds io_timeout{30000};
    // Connections accepted beyond this many open ones are closed immediately.
    size_t max_connections = 256;
};

// HTTP/1.1 server. Connections are accepted on an io_context and each one is served by
// its own thread with blocking reads and writes; keep-alive is honoured. A timer on the
// accept loop shuts down connections whose read or write deadline has passed.
class HttpServer {
public:
    // Binds immediately; port 0 picks a free port. Throws boost::system::system_error.
    HttpServer(const std::string& address, unsigned short port, RequestHandler handler, HttpServerOptions options = {});
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    unsigned short Port() const;

    // Blocks until Stop() is called.
    void Run();
    // Runs the accept loop on a background thread.
    void Start();
    // Closes the listener, cancels in-flight requests and waits for open connections.
    void Stop();

private:
    void DoAccept();
    void ScheduleReap();
    void ReapExpired();
    void SetDeadline(boost::asio::ip::tcp::socket* socket, std::chrono::steady_clock::time_point deadline);
    void Session(boost::asio::ip::tcp::socket& socket);

    boost::asio::io_context ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::steady_timer reaper_;
    RequestHandler handler_;
    HttpServerOptions options_;
    RequestContext server_ctx_;
    std::thread thread_;
    std::atomic<bool> stopped_{false};

    std::mutex sessions_mutex_;
    std::condition_variable sessions_cv_;
    // Open connections and their current I/O deadline. A socket is destroyed under
    // sessions_mutex_ after leaving the map.
    std::map<boost::asio::ip::tcp::socket*, std::chrono::steady_clock::time_point> sessions_;
};

}
