#include "sharepoint_client.hpp"
#include "errors.hpp"
#include "mapping.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>

#ifdef SPO_SWEEP_HAS_SSL
#include <boost/beast/ssl.hpp>
#include <boost/asio/ssl.hpp>
#endif

#include <iostream>
#include <stdexcept>

namespace beast = boost::beast;
namespace http  = beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace spo_sweep {

namespace {

constexpr const char* kUserAgent = "NONISV|spo_sweep|spo_sweep/1.0";
constexpr const char* kODataJson = "application/json;odata=nometadata";

http::request<http::string_body> buildRequest(const UrlParts& endpoint,
                                              const std::string& accessToken,
                                              const std::string& method,
                                              const std::string& requestBody)
{
    const http::verb verb =
        (method == "POST") ? http::verb::post : http::verb::get;

    http::request<http::string_body> req{verb, endpoint.target, 11};
    req.set(http::field::host, endpoint.host);
    req.set(http::field::accept, kODataJson);
    req.set(http::field::user_agent, kUserAgent);
    if (!accessToken.empty()) {
        req.set(http::field::authorization, "Bearer " + accessToken);
    }
    if (verb == http::verb::post) {
        req.set(http::field::content_type, kODataJson);
        req.body() = requestBody;
    }
    req.prepare_payload();
    return req;
}

SharePointClient::Response toResponse(const http::response<http::string_body>& res) {
    SharePointClient::Response response;
    response.httpStatus = res.result_int();

    const auto retryAfter = res[http::field::retry_after];
    if (!retryAfter.empty()) {
        response.retryAfter =
            parseRetryAfter(std::string(retryAfter.data(), retryAfter.size()));
    }

    if (!res.body().empty()) {
        // Error pages (e.g. throttling HTML from the front door) are not
        // JSON; only a successful body must parse.
        response.body = nlohmann::json::parse(res.body(), nullptr, false);
        if (response.body.is_discarded()) {
            if (response.httpStatus >= 200 && response.httpStatus < 300) {
                throw std::runtime_error("Failed to parse JSON response");
            }
            response.body = nullptr;
        }
    }
    return response;
}

} // namespace

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

SharePointClient::SharePointClient(int timeoutMs, int pageSize)
    : mTimeoutMs(timeoutMs)
    , mPageSize(pageSize) {}

// ---------------------------------------------------------------------------
// SharePointService
// ---------------------------------------------------------------------------

Session SharePointClient::connect(const std::string& siteUrl,
                                  const Credentials& credentials)
{
    const auto parts = parseUrl(siteUrl);
#ifndef SPO_SWEEP_HAS_SSL
    if (parts.scheme == "https") {
        throw std::runtime_error(
            "HTTPS site requested but SSL support was not compiled in. "
            "Rebuild with OpenSSL to enable HTTPS.");
    }
#endif

    Session session;
    session.siteUrl     = siteUrl;
    session.scheme      = parts.scheme;
    session.host        = parts.host;
    session.port        = parts.port;
    session.webPath     = parts.target;
    session.accessToken = credentials.accessToken;
    while (!session.webPath.empty() && session.webPath.back() == '/') {
        session.webPath.pop_back();
    }

    const auto resp = call(session, "GET", apiRoot(session) + "/web?$select=Title");
    session.title = resp.body.is_object() ? resp.body.value("Title", "") : "";

    if (mVerbose) {
        std::cerr << "[SharePointClient] Connected to " << siteUrl
                  << " (" << session.title << ")\n";
    }
    return session;
}

void SharePointClient::disconnect(const Session& session) {
    // Requests are stateless; nothing is held open between calls.
    if (mVerbose) {
        std::cerr << "[SharePointClient] Disconnected from "
                  << session.siteUrl << "\n";
    }
}

std::vector<ListInfo> SharePointClient::listLists(const Session& session) {
    const auto resp = call(session, "GET",
        apiRoot(session) +
        "/web/lists?$select=Title,Hidden,ItemCount,RootFolder/ServerRelativeUrl"
        "&$expand=RootFolder");
    return parseListsResponse(resp.body);
}

std::optional<ComplianceLabel>
SharePointClient::getLabel(const Session& session, const ListInfo& list) {
    const auto resp = call(session, "POST",
        apiRoot(session) +
        "/SP.CompliancePolicy.SPPolicyStoreProxy.GetListComplianceTag",
        {{"listUrl", list.url}});
    return parseComplianceTag(resp.body);
}

void SharePointClient::resetLabel(const Session& session, const ListInfo& list) {
    setComplianceTag(session, list, "");
}

void SharePointClient::applyLabel(const Session& session,
                                  const ListInfo& list,
                                  const std::string& labelName) {
    setComplianceTag(session, list, labelName);
}

ItemsPage SharePointClient::listItemsPage(const Session& session,
                                          const ListInfo& list,
                                          const std::string& nextLink)
{
    const std::string target = nextLink.empty()
        ? apiRoot(session) + "/web/lists/GetByTitle(" +
              urlEncode(odataQuote(list.title)) +
              ")/items?$select=Id,Title,FileLeafRef,_ComplianceFlags&$top=" +
              std::to_string(mPageSize)
        : parseUrl(nextLink).target;

    const auto resp = call(session, "GET", target);
    return parseItemsPage(resp.body);
}

bool SharePointClient::unlockItem(const Session& session,
                                  const ListInfo& list,
                                  int itemId)
{
    const auto resp = call(session, "POST",
        apiRoot(session) +
        "/SP.CompliancePolicy.SPPolicyStoreProxy.UnlockRecordItem",
        {{"listUrl", list.url}, {"itemId", itemId}});
    return parseBooleanResult(resp.body, true);
}

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------

void SharePointClient::setComplianceTag(const Session& session,
                                        const ListInfo& list,
                                        const std::string& tagName)
{
    call(session, "POST",
         apiRoot(session) +
         "/SP.CompliancePolicy.SPPolicyStoreProxy.SetListComplianceTag",
         {{"listUrl", list.url},
          {"complianceTagValue", tagName},
          {"blockDelete", false},
          {"blockEdit", false},
          {"syncToItems", !tagName.empty()}});
}

std::string SharePointClient::apiRoot(const Session& session) {
    return session.webPath + "/_api";
}

SharePointClient::Response
SharePointClient::call(const Session& session,
                       const std::string& method,
                       const std::string& target,
                       const nlohmann::json& payload)
{
    const UrlParts endpoint{session.scheme, session.host, session.port, target};
    const std::string body = payload.is_null() ? std::string() : payload.dump();

    if (mVerbose) {
        std::cerr << "[SharePointClient] " << method << " " << session.host
                  << target << "\n";
    }

    auto resp = send(endpoint, session.accessToken, method, body);

    if (mVerbose) {
        std::cerr << "[SharePointClient] HTTP " << resp.httpStatus << "\n";
    }

    if (resp.httpStatus < 200 || resp.httpStatus >= 300) {
        std::string detail = extractODataError(resp.body);
        if (detail.empty()) detail = "request failed";
        throw RemoteError(resp.httpStatus,
                          "HTTP " + std::to_string(resp.httpStatus) + " for " +
                          method + " " + target + ": " + detail,
                          resp.retryAfter);
    }
    return resp;
}

SharePointClient::Response
SharePointClient::send(const UrlParts& endpoint,
                       const std::string& accessToken,
                       const std::string& method,
                       const std::string& requestBody)
{
    try {
        return endpoint.scheme == "https"
            ? doHttpsRequest(endpoint, accessToken, method, requestBody)
            : doHttpRequest(endpoint, accessToken, method, requestBody);
    } catch (const boost::system::system_error& e) {
        throw RemoteError(0, std::string("Network error: ") + e.what());
    }
}

// ---------------------------------------------------------------------------
// Plain HTTP
// ---------------------------------------------------------------------------

SharePointClient::Response
SharePointClient::doHttpRequest(const UrlParts& endpoint,
                                const std::string& accessToken,
                                const std::string& method,
                                const std::string& requestBody)
{
    net::io_context ioc;
    tcp::resolver   resolver(ioc);
    beast::tcp_stream stream(ioc);

    // Resolve + connect with timeout.
    auto const results = resolver.resolve(endpoint.host, endpoint.port);
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    stream.connect(results);

    auto req = buildRequest(endpoint, accessToken, method, requestBody);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    stream.expires_after(std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    // Graceful shutdown (non-critical errors are swallowed).
    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return toResponse(res);
}

// ---------------------------------------------------------------------------
// HTTPS (compiled only when OpenSSL is available)
// ---------------------------------------------------------------------------

SharePointClient::Response
SharePointClient::doHttpsRequest(const UrlParts& endpoint,
                                 const std::string& accessToken,
                                 const std::string& method,
                                 const std::string& requestBody)
{
#ifdef SPO_SWEEP_HAS_SSL
    namespace ssl = net::ssl;

    net::io_context ioc;
    ssl::context    ctx(ssl::context::tlsv12_client);
    ctx.set_default_verify_paths();
    ctx.set_verify_mode(ssl::verify_peer);

    tcp::resolver resolver(ioc);
    beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);

    // SNI hostname.
    if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint.host.c_str())) {
        throw std::runtime_error("Failed to set SNI hostname");
    }

    auto const results = resolver.resolve(endpoint.host, endpoint.port);
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    beast::get_lowest_layer(stream).connect(results);

    stream.handshake(ssl::stream_base::client);

    auto req = buildRequest(endpoint, accessToken, method, requestBody);
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    beast::get_lowest_layer(stream).expires_after(
        std::chrono::milliseconds(mTimeoutMs));
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.shutdown(ec);

    return toResponse(res);
#else
    (void)endpoint;
    (void)accessToken;
    (void)method;
    (void)requestBody;
    throw std::runtime_error("HTTPS not supported: built without OpenSSL");
#endif
}

} // namespace spo_sweep
