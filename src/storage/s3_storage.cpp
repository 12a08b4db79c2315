#include "s3_storage.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <chrono>
#include <cstdint>
#include <limits>
#include <map>

#include "../utils/digest.hpp"

namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = boost::asio::ip::tcp;

namespace {

constexpr auto kHttpTimeout = std::chrono::seconds(30);

std::string formatUtc(std::time_t t, const char* format) {
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    size_t n = std::strftime(buf, sizeof(buf), format, &tm);
    return std::string(buf, n);
}

std::vector<uint8_t> toBytes(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

template <class Stream>
std::optional<std::vector<uint8_t>> exchange(Stream& stream,
                                             const http::request<http::empty_body>& req,
                                             const std::string& key) {
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response_parser<http::vector_body<uint8_t>> parser;
    parser.body_limit(std::numeric_limits<std::uint64_t>::max());
    http::read(stream, buffer, parser);

    auto& res = parser.get();
    if (res.result() == http::status::not_found) {
        return std::nullopt;
    }
    if (http::to_status_class(res.result()) != http::status_class::successful) {
        throw StorageError("GET " + key + " failed with HTTP " +
                           std::to_string(res.result_int()));
    }
    return std::move(res.body());
}

} // namespace

S3Storage::S3Storage(const S3Config& config)
    : config_(config) {
    endpoint_ = endpointFor();
}

S3Storage::Endpoint S3Storage::endpointFor() const {
    Endpoint ep;

    if (config_.endpoint.empty()) {
        ep.scheme = "https";
        ep.host = config_.region == "us-east-1"
            ? config_.bucket + ".s3.amazonaws.com"
            : config_.bucket + ".s3." + config_.region + ".amazonaws.com";
        ep.port = "443";
        ep.authority = ep.host;
        return ep;
    }

    std::string rest = config_.endpoint;
    size_t scheme_end = rest.find("://");
    if (scheme_end == std::string::npos) {
        ep.scheme = "https";
    } else {
        ep.scheme = rest.substr(0, scheme_end);
        rest = rest.substr(scheme_end + 3);
    }
    if (ep.scheme != "http" && ep.scheme != "https") {
        throw StorageError("Unsupported S3 endpoint scheme: " + ep.scheme);
    }

    size_t slash = rest.find('/');
    ep.authority = rest.substr(0, slash);
    if (slash != std::string::npos) {
        ep.path_prefix = rest.substr(slash);
        while (!ep.path_prefix.empty() && ep.path_prefix.back() == '/') {
            ep.path_prefix.pop_back();
        }
    }

    size_t colon = ep.authority.rfind(':');
    if (colon != std::string::npos) {
        ep.host = ep.authority.substr(0, colon);
        ep.port = ep.authority.substr(colon + 1);
    } else {
        ep.host = ep.authority;
        ep.port = ep.scheme == "https" ? "443" : "80";
    }
    return ep;
}

std::string S3Storage::uriEncode(const std::string& value, bool keep_slash) {
    static const char digits[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(value.size() * 3);
    for (unsigned char c : value) {
        bool unreserved = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') ||
                          (c >= '0' && c <= '9') ||
                          c == '-' || c == '_' || c == '.' || c == '~';
        if (unreserved || (keep_slash && c == '/')) {
            out.push_back(static_cast<char>(c));
        } else {
            out.push_back('%');
            out.push_back(digits[c >> 4]);
            out.push_back(digits[c & 0x0F]);
        }
    }
    return out;
}

std::string S3Storage::canonicalUri(const std::string& key) const {
    std::string path = endpoint_.path_prefix;
    if (!config_.endpoint.empty()) {
        path += "/" + uriEncode(config_.bucket, false);
    }
    path += "/" + uriEncode(key, true);
    return path;
}

std::string S3Storage::presign(const std::string& method,
                               const std::string& key,
                               const std::string& content_type,
                               int ttl_seconds,
                               std::time_t now) const {
    const std::string origin = endpoint_.scheme + "://" + endpoint_.authority;
    const std::string uri = canonicalUri(key);

    if (config_.access_key_id.empty() || config_.secret_access_key.empty()) {
        // Anonymous access; only works against public buckets.
        return origin + uri;
    }

    const std::string amz_date = formatUtc(now, "%Y%m%dT%H%M%SZ");
    const std::string date = amz_date.substr(0, 8);
    const std::string scope = date + "/" + config_.region + "/s3/aws4_request";

    std::string canonical_headers = "";
    std::string signed_headers;
    if (!content_type.empty()) {
        canonical_headers += "content-type:" + content_type + "\n";
        signed_headers = "content-type;host";
    } else {
        signed_headers = "host";
    }
    canonical_headers += "host:" + endpoint_.authority + "\n";

    std::map<std::string, std::string> query = {
        {"X-Amz-Algorithm", "AWS4-HMAC-SHA256"},
        {"X-Amz-Credential", config_.access_key_id + "/" + scope},
        {"X-Amz-Date", amz_date},
        {"X-Amz-Expires", std::to_string(ttl_seconds)},
        {"X-Amz-SignedHeaders", signed_headers}
    };

    std::string canonical_query;
    for (const auto& kv : query) {
        if (!canonical_query.empty()) canonical_query += "&";
        canonical_query += uriEncode(kv.first, false) + "=" + uriEncode(kv.second, false);
    }

    const std::string canonical_request =
        method + "\n" +
        uri + "\n" +
        canonical_query + "\n" +
        canonical_headers + "\n" +
        signed_headers + "\n" +
        "UNSIGNED-PAYLOAD";

    const std::string string_to_sign =
        "AWS4-HMAC-SHA256\n" +
        amz_date + "\n" +
        scope + "\n" +
        sha256Hex(canonical_request);

    std::vector<uint8_t> signing_key = hmacSha256(toBytes("AWS4" + config_.secret_access_key), date);
    signing_key = hmacSha256(signing_key, config_.region);
    signing_key = hmacSha256(signing_key, "s3");
    signing_key = hmacSha256(signing_key, "aws4_request");
    const std::string signature = toHex(hmacSha256(signing_key, string_to_sign));

    return origin + uri + "?" + canonical_query + "&X-Amz-Signature=" + signature;
}

WriteTarget S3Storage::issueWriteTarget(const std::string& key,
                                        const std::string& content_type,
                                        int ttl_seconds) {
    WriteTarget target;
    target.url = presign("PUT", key, content_type, ttl_seconds, std::time(nullptr));
    target.method = "PUT";
    target.headers["Content-Type"] = content_type;
    target.expires_in_seconds = ttl_seconds;
    return target;
}

std::optional<std::vector<uint8_t>> S3Storage::fetchObject(const std::string& key) {
    const std::string url = presign("GET", key, "", 60, std::time(nullptr));
    const std::string target = url.substr(endpoint_.scheme.size() + 3 + endpoint_.authority.size());

    http::request<http::empty_body> req{http::verb::get, target, 11};
    req.set(http::field::host, endpoint_.authority);
    req.set(http::field::user_agent, "skinscan-ingest");

    try {
        net::io_context ioc;
        tcp::resolver resolver(ioc);
        auto const results = resolver.resolve(endpoint_.host, endpoint_.port);

        if (endpoint_.scheme == "https") {
            ssl::context ctx(ssl::context::tls_client);
            ctx.set_default_verify_paths();
            ctx.set_verify_mode(ssl::verify_peer);

            beast::ssl_stream<beast::tcp_stream> stream(ioc, ctx);
            stream.set_verify_callback(ssl::host_name_verification(endpoint_.host));
            if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str())) {
                throw StorageError("Failed to set SNI host name " + endpoint_.host);
            }

            beast::get_lowest_layer(stream).expires_after(kHttpTimeout);
            beast::get_lowest_layer(stream).connect(results);
            stream.handshake(ssl::stream_base::client);

            auto body = exchange(stream, req, key);

            // Servers routinely drop the connection without close_notify;
            // the body is complete at this point.
            beast::error_code ec;
            stream.shutdown(ec);
            return body;
        }

        beast::tcp_stream stream(ioc);
        stream.expires_after(kHttpTimeout);
        stream.connect(results);

        auto body = exchange(stream, req, key);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return body;
    } catch (const beast::system_error& e) {
        throw StorageError("GET " + key + " failed: " + e.code().message());
    }
}

std::string S3Storage::publicUrl(const std::string& key) const {
    if (!config_.public_base_url.empty()) {
        std::string base = config_.public_base_url;
        while (!base.empty() && base.back() == '/') {
            base.pop_back();
        }
        return base + "/" + key;
    }
    return "s3://" + config_.bucket + "/" + key;
}
