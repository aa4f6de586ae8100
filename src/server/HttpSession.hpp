#pragma once

#include "transport/TransportTypes.hpp"
#include <boost/asio.hpp>
#include <boost/beast.hpp>
#include <memory>
#include <optional>
#include <string>

namespace gitmcp {
namespace server {

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class RequestRouter;

/**
 * HTTP session - one client connection.
 * Converts Beast messages to and from the transport types and hands each
 * request to the RequestRouter.
 */
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, RequestRouter& router);

    void run();

    // Beast request -> framework-neutral request (method upper case, query dropped)
    static transport::HttpRequest toTransportRequest(const http::request<http::string_body>& req);

private:
    void doRead();
    void onRead(beast::error_code ec, std::size_t bytes_transferred);
    void sendResponse(http::response<http::string_body> response);
    void onWrite(bool close, beast::error_code ec, std::size_t bytes_transferred);
    void doClose();

    http::response<http::string_body> makeResponse(const transport::TransportResponse& res,
                                                   unsigned version, bool keepAlive) const;

    // Chunked transfer of a stream payload; returns false when the connection must close
    bool writeStream(const transport::TransportResponse& res, unsigned version, bool keepAlive,
                     uint64_t requestId);

    beast::tcp_stream m_stream;
    beast::flat_buffer m_buffer;
    std::optional<http::request_parser<http::string_body>> m_parser;
    RequestRouter& m_router;
};

} // namespace server
} // namespace gitmcp
