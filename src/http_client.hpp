#pragma once

#include <map>
#include <string>

struct Request {
    std::string method = "GET";
    std::string url;
    std::map<std::string, std::string> headers;

    static Request get(std::string url) {
        Request r;
        r.url = std::move(url);
        return r;
    }

    void set_header(const std::string& name, std::string value) {
        headers[name] = std::move(value);
    }
};

struct Response {
    long status = 0;
    std::string body;
};

// Transport used by the source. Implementations throw NetworkError on
// transport failure or an error status; they never retry.
class HttpClient {
public:
    virtual ~HttpClient() = default;
    virtual Response send(const Request& request) = 0;
};

class CprHttpClient : public HttpClient {
public:
    explicit CprHttpClient(std::string userAgent = kDefaultUserAgent,
                           int timeoutMs = 30000,
                           bool verbose = false);

    Response send(const Request& request) override;

    static const char* const kDefaultUserAgent;

private:
    std::string userAgent_;
    int timeoutMs_;
    bool verbose_;
};
