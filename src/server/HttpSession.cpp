#include "server/HttpSession.hpp"
#include "server/RequestRouter.hpp"
#include "server/Logger.hpp"
#include "core/McpError.hpp"
#include <cctype>
#include <chrono>

namespace gitmcp {
namespace server {

namespace {
constexpr const char* kServerHeader = "git-mcp-server";
constexpr std::size_t kBodyLimit = 4 * 1024 * 1024;
}

HttpSession::HttpSession(tcp::socket socket, RequestRouter& router)
    : m_stream(std::move(socket))
    , m_router(router)
{
}

void HttpSession::run() {
    net::dispatch(
        m_stream.get_executor(),
        beast::bind_front_handler(&HttpSession::doRead, shared_from_this()));
}

void HttpSession::doRead() {
    m_parser.emplace();
    m_parser->body_limit(kBodyLimit);
    m_stream.expires_after(std::chrono::seconds(30));

    http::async_read(
        m_stream,
        m_buffer,
        *m_parser,
        beast::bind_front_handler(&HttpSession::onRead, shared_from_this()));
}

transport::HttpRequest HttpSession::toTransportRequest(const http::request<http::string_body>& req) {
    transport::HttpRequest out;
    out.method = std::string(req.method_string());
    for (auto& c : out.method) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }

    std::string target(req.target());
    auto query = target.find('?');
    out.path = query == std::string::npos ? target : target.substr(0, query);

    for (const auto& field : req) {
        out.headers.set(std::string(field.name_string()), std::string(field.value()));
    }
    out.body = req.body();
    return out;
}

void HttpSession::onRead(beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec == http::error::end_of_stream) {
        return doClose();
    }

    if (ec == http::error::body_limit) {
        LOG_WARN("Request body too large");
        transport::TransportResponse tooLarge = transport::jsonRpcErrorResponse(
            413, static_cast<int>(core::JsonRpcErrorCode::InvalidRequest), "Request body too large");
        auto res = makeResponse(tooLarge, 11, false);
        return sendResponse(std::move(res));
    }

    if (ec) {
        if (ec != beast::error::timeout) {
            LOG_ERROR("Read error: " + ec.message());
        }
        return;
    }

    auto req = m_parser->release();
    auto& logger = Logger::instance();
    uint64_t requestId = logger.logRequest(std::string(req.method_string()),
                                           std::string(req.target()), req.body());

    transport::TransportResponse result = m_router.route(toTransportRequest(req));

    if (result.hasStream()) {
        if (writeStream(result, req.version(), req.keep_alive(), requestId)) {
            doRead();
        } else {
            doClose();
        }
        return;
    }

    auto res = makeResponse(result, req.version(), req.keep_alive());
    logger.logResponse(requestId, static_cast<int>(result.statusCode), res.body(), res.body().size());
    sendResponse(std::move(res));
}

http::response<http::string_body> HttpSession::makeResponse(const transport::TransportResponse& result,
                                                            unsigned version, bool keepAlive) const {
    http::response<http::string_body> res{static_cast<http::status>(result.statusCode), version};
    res.set(http::field::server, kServerHeader);
    res.set(http::field::cache_control, "no-store");
    for (const auto& [name, value] : result.headers.entries()) {
        res.set(name, value);
    }

    const json* body = result.body();
    if (body && !body->is_null()) {
        res.set(http::field::content_type, "application/json");
        res.body() = body->dump();
    }
    res.keep_alive(keepAlive);
    res.prepare_payload();
    return res;
}

bool HttpSession::writeStream(const transport::TransportResponse& result, unsigned version,
                              bool keepAlive, uint64_t requestId) {
    auto stream = result.stream();

    // Streams are written synchronously; no read timeout while they run
    m_stream.expires_never();

    http::response<http::empty_body> res{static_cast<http::status>(result.statusCode), version};
    res.set(http::field::server, kServerHeader);
    res.set(http::field::content_type, stream->contentType());
    res.set(http::field::cache_control, "no-cache");
    for (const auto& [name, value] : result.headers.entries()) {
        res.set(name, value);
    }
    res.keep_alive(keepAlive);
    res.chunked(true);

    beast::error_code ec;
    http::response_serializer<http::empty_body> sr{res};
    http::write_header(m_stream, sr, ec);
    if (ec) {
        LOG_ERROR("Stream header write error: " + ec.message());
        return false;
    }

    size_t total = 0;
    while (auto chunk = stream->nextChunk()) {
        total += chunk->size();
        net::write(m_stream, http::make_chunk(net::buffer(*chunk)), ec);
        if (ec) {
            LOG_ERROR("Stream write error: " + ec.message());
            return false;
        }
    }

    net::write(m_stream, http::make_chunk_last(), ec);
    if (ec) {
        LOG_ERROR("Stream write error: " + ec.message());
        return false;
    }

    Logger::instance().logResponse(requestId, static_cast<int>(result.statusCode), "<stream>", total);
    return keepAlive;
}

void HttpSession::sendResponse(http::response<http::string_body> response) {
    auto sp = std::make_shared<http::response<http::string_body>>(std::move(response));
    bool needEof = sp->need_eof();

    http::async_write(
        m_stream,
        *sp,
        [self = shared_from_this(), sp, needEof](beast::error_code ec, std::size_t bytes) {
            self->onWrite(needEof, ec, bytes);
        });
}

void HttpSession::onWrite(bool close, beast::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        LOG_ERROR("Write error: " + ec.message());
        return;
    }

    if (close) {
        return doClose();
    }

    doRead();
}

void HttpSession::doClose() {
    beast::error_code ec;
    m_stream.socket().shutdown(tcp::socket::shutdown_send, ec);
    if (ec && ec != beast::errc::not_connected) {
        LOG_DEBUG("Socket shutdown: " + ec.message());
    }
}

} // namespace server
} // namespace gitmcp
