#include "http_client.hpp"

#include "errors.hpp"

#include <cpr/cpr.h>

#include <iostream>

const char* const CprHttpClient::kDefaultUserAgent = "madokami-source/1.0 (+https://manga.madokami.al)";

CprHttpClient::CprHttpClient(std::string userAgent, int timeoutMs, bool verbose)
    : userAgent_(std::move(userAgent)),
      timeoutMs_(timeoutMs),
      verbose_(verbose) {}

Response CprHttpClient::send(const Request& request) {
    if (request.method != "GET") {
        throw NetworkError("Unsupported method: " + request.method);
    }

    cpr::Header hdr{{"User-Agent", userAgent_}};
    for (const auto& kv : request.headers) hdr[kv.first] = kv.second;

    if (verbose_) std::cerr << "Visiting: " << request.url << std::endl;
    cpr::Response r = cpr::Get(cpr::Url{request.url},
                               hdr,
                               cpr::Timeout{timeoutMs_},
                               cpr::Redirect{true});
    if (r.error) {
        throw NetworkError("Request failed: " + request.url + ": " + r.error.message);
    }
    if (verbose_) std::cerr << "  Status: " << r.status_code << ", bytes: " << r.text.size() << std::endl;
    if (r.status_code >= 400) {
        throw NetworkError("HTTP " + std::to_string(r.status_code) + " for " + request.url, r.status_code);
    }

    Response out;
    out.status = r.status_code;
    out.body = std::move(r.text);
    return out;
}
