#include "server/HttpServer.hpp"
#include "server/HttpSession.hpp"
#include "server/Logger.hpp"
#include <chrono>
#include <stdexcept>
#include <thread>

namespace gitmcp {
namespace server {

HttpServer::HttpServer(net::io_context& ioc, HttpServerOptions options, RequestRouter& router)
    : m_ioc(ioc)
    , m_options(std::move(options))
    , m_router(router)
    , m_acceptor(net::make_strand(ioc))
{
    bindWithRetry();
    LOG_INFO("Server listening on http://" + m_options.host + ":" + std::to_string(m_boundPort));
}

bool HttpServer::tryBind(const tcp::endpoint& endpoint, beast::error_code& ec) {
    m_acceptor.open(endpoint.protocol(), ec);
    if (ec) {
        throw std::runtime_error("Failed to open acceptor: " + ec.message());
    }

    m_acceptor.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        throw std::runtime_error("Failed to set reuse_address: " + ec.message());
    }

    m_acceptor.bind(endpoint, ec);
    if (ec) {
        beast::error_code ignored;
        m_acceptor.close(ignored);
        return false;
    }

    m_acceptor.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        throw std::runtime_error("Failed to listen: " + ec.message());
    }
    return true;
}

void HttpServer::bindWithRetry() {
    beast::error_code ec;
    auto address = net::ip::make_address(m_options.host, ec);
    if (ec) {
        throw std::runtime_error("Invalid bind address '" + m_options.host + "': " + ec.message());
    }

    unsigned attempts = m_options.maxPortRetries + 1;
    for (unsigned attempt = 0; attempt < attempts; ++attempt) {
        unsigned port = static_cast<unsigned>(m_options.port) + attempt;
        if (port > 65535) {
            break;
        }

        tcp::endpoint endpoint(address, static_cast<unsigned short>(port));
        if (tryBind(endpoint, ec)) {
            m_boundPort = m_acceptor.local_endpoint().port();
            if (attempt > 0) {
                LOG_WARN("Port " + std::to_string(m_options.port) + " was in use, bound to "
                         + std::to_string(m_boundPort));
            }
            return;
        }

        if (ec != net::error::address_in_use) {
            throw std::runtime_error("Failed to bind: " + ec.message());
        }

        LOG_WARN("Port " + std::to_string(port) + " in use, retrying");
        std::this_thread::sleep_for(std::chrono::milliseconds(m_options.portRetryDelayMs));
    }

    throw std::runtime_error("No free port in range " + std::to_string(m_options.port) + "-"
                             + std::to_string(m_options.port + m_options.maxPortRetries));
}

void HttpServer::run() {
    m_running = true;
    doAccept();
}

void HttpServer::stop() {
    if (!m_running.exchange(false)) {
        return;
    }
    // Close on the acceptor's strand so a pending async_accept is not raced
    net::post(m_acceptor.get_executor(), [this]() {
        beast::error_code ec;
        m_acceptor.close(ec);
    });
}

void HttpServer::doAccept() {
    if (!m_running) return;

    m_acceptor.async_accept(
        net::make_strand(m_ioc),
        [this](beast::error_code ec, tcp::socket socket) {
            if (!ec) {
                std::make_shared<HttpSession>(std::move(socket), m_router)->run();
            } else if (ec != net::error::operation_aborted) {
                LOG_WARN("Accept error: " + ec.message());
            }

            if (m_running) {
                doAccept();
            }
        });
}

} // namespace server
} // namespace gitmcp
