#pragma once

#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <atomic>
#include <memory>
#include <string>

namespace gitmcp {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class RequestRouter;

struct HttpServerOptions {
    std::string host = "127.0.0.1";
    unsigned short port = 3015;
    unsigned maxPortRetries = 15;
    unsigned portRetryDelayMs = 50;
};

/**
 * HTTP server based on Boost.Beast.
 *
 * When the requested port is in use, the next ports are tried, up to
 * maxPortRetries times, with portRetryDelayMs between attempts.
 */
class HttpServer {
public:
    HttpServer(net::io_context& ioc, HttpServerOptions options, RequestRouter& router);

    void run();
    void stop();

    unsigned short boundPort() const { return m_boundPort; }
    const std::string& host() const { return m_options.host; }

private:
    void bindWithRetry();
    bool tryBind(const tcp::endpoint& endpoint, beast::error_code& ec);
    void doAccept();

    net::io_context& m_ioc;
    HttpServerOptions m_options;
    RequestRouter& m_router;
    tcp::acceptor m_acceptor;
    unsigned short m_boundPort = 0;
    std::atomic<bool> m_running{false};
};

} // namespace server
} // namespace gitmcp
