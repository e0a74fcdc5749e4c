#pragma once

#include <string>

struct HttpResult {
    bool ok = false;          // true once a status line was received
    int status_code = 0;
    std::string error;        // transport error text when !ok
};

struct ParsedUrl {
    std::string scheme;       // "http" or "https"
    std::string host;
    int port = 0;
    std::string target;       // path + query, always starts with '/'
};

bool parse_url(const std::string& url, ParsedUrl& out, std::string* error = nullptr);

// Outbound GET seam; tests substitute their own implementation
class HttpTransport {
public:
    virtual ~HttpTransport() = default;
    virtual HttpResult get(const std::string& url) = 0;
};

// One-shot HTTP/1.1 GET over POSIX sockets, TLS through OpenSSL for https
class SimpleHttpClient : public HttpTransport {
public:
    explicit SimpleHttpClient(int timeout_seconds = 15);

    HttpResult get(const std::string& url) override;

private:
    int timeout_seconds_;

    int connect_tcp(const ParsedUrl& url, std::string& error);
    HttpResult exchange_plain(int fd, const std::string& request);
    HttpResult exchange_tls(int fd, const ParsedUrl& url, const std::string& request);
    static HttpResult parse_status_line(const std::string& response_head);
};
