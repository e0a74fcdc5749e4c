#include "http-client.h"
#include <iostream>
#include <sstream>
#include <memory>
#include <cstring>
#include <cerrno>
#include <cctype>
#include <stdexcept>
#include <sys/socket.h>
#include <sys/time.h>
#include <netdb.h>
#include <unistd.h>
#include <openssl/ssl.h>
#include <openssl/err.h>
#include <openssl/x509v3.h>

static std::string openssl_error_string(const char* what) {
    unsigned long code = ERR_get_error();
    if (code == 0) return std::string(what);
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    ERR_clear_error();
    return std::string(what) + ": " + buf;
}

bool parse_url(const std::string& url, ParsedUrl& out, std::string* error) {
    size_t scheme_end = url.find("://");
    if (scheme_end == std::string::npos) {
        if (error) *error = "missing scheme in URL";
        return false;
    }

    ParsedUrl parsed;
    parsed.scheme = url.substr(0, scheme_end);
    for (auto& c : parsed.scheme) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (parsed.scheme == "http") {
        parsed.port = 80;
    } else if (parsed.scheme == "https") {
        parsed.port = 443;
    } else {
        if (error) *error = "unsupported scheme '" + parsed.scheme + "'";
        return false;
    }

    size_t authority_start = scheme_end + 3;
    size_t path_start = url.find_first_of("/?", authority_start);
    std::string authority = url.substr(authority_start,
        path_start == std::string::npos ? std::string::npos : path_start - authority_start);

    if (path_start == std::string::npos) {
        parsed.target = "/";
    } else {
        parsed.target = url.substr(path_start);
        if (parsed.target[0] == '?') parsed.target = "/" + parsed.target;
    }

    // Bracketed IPv6 literal: [::1]:8080
    if (!authority.empty() && authority[0] == '[') {
        size_t close_bracket = authority.find(']');
        if (close_bracket == std::string::npos) {
            if (error) *error = "malformed IPv6 host";
            return false;
        }
        parsed.host = authority.substr(1, close_bracket - 1);
        authority = authority.substr(close_bracket + 1);
        if (!authority.empty() && authority[0] != ':') {
            if (error) *error = "malformed host";
            return false;
        }
    } else {
        size_t colon = authority.find(':');
        parsed.host = authority.substr(0, colon);
        authority = colon == std::string::npos ? std::string() : authority.substr(colon);
    }

    if (!authority.empty()) {
        try {
            size_t used = 0;
            int port = std::stoi(authority.substr(1), &used);
            if (used != authority.size() - 1 || port < 1 || port > 65535) throw std::out_of_range("port");
            parsed.port = port;
        } catch (const std::exception&) {
            if (error) *error = "invalid port in URL";
            return false;
        }
    }

    if (parsed.host.empty()) {
        if (error) *error = "missing host in URL";
        return false;
    }

    out = parsed;
    return true;
}

SimpleHttpClient::SimpleHttpClient(int timeout_seconds) : timeout_seconds_(timeout_seconds) {}

HttpResult SimpleHttpClient::get(const std::string& url) {
    HttpResult result;
    ParsedUrl parsed;
    std::string error;
    if (!parse_url(url, parsed, &error)) {
        result.error = error;
        return result;
    }

    int fd = connect_tcp(parsed, error);
    if (fd < 0) {
        result.error = error;
        return result;
    }

    std::string host_header = parsed.host;
    if (parsed.host.find(':') != std::string::npos) host_header = "[" + parsed.host + "]";
    bool default_port = (parsed.scheme == "http" && parsed.port == 80) ||
                        (parsed.scheme == "https" && parsed.port == 443);
    if (!default_port) host_header += ":" + std::to_string(parsed.port);

    std::ostringstream request;
    request << "GET " << parsed.target << " HTTP/1.1\r\n"
            << "Host: " << host_header << "\r\n"
            << "User-Agent: click-to-call/1.0\r\n"
            << "Accept: */*\r\n"
            << "Connection: close\r\n"
            << "\r\n";

    if (parsed.scheme == "https") {
        result = exchange_tls(fd, parsed, request.str());
    } else {
        result = exchange_plain(fd, request.str());
    }
    close(fd);
    return result;
}

int SimpleHttpClient::connect_tcp(const ParsedUrl& url, std::string& error) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* results = nullptr;
    std::string port = std::to_string(url.port);
    int rc = getaddrinfo(url.host.c_str(), port.c_str(), &hints, &results);
    if (rc != 0) {
        error = "could not resolve host '" + url.host + "': " + gai_strerror(rc);
        return -1;
    }

    int fd = -1;
    std::string last_error = "no addresses for host '" + url.host + "'";
    for (struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
        fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (fd < 0) {
            last_error = std::string("socket: ") + strerror(errno);
            continue;
        }

        // SO_SNDTIMEO also bounds connect() on Linux
        struct timeval timeout;
        timeout.tv_sec = timeout_seconds_;
        timeout.tv_usec = 0;
        setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

        if (connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }
        last_error = "connect to " + url.host + ":" + port + " failed: " + strerror(errno);
        close(fd);
        fd = -1;
    }
    freeaddrinfo(results);

    if (fd < 0) error = last_error;
    return fd;
}

HttpResult SimpleHttpClient::exchange_plain(int fd, const std::string& request) {
    HttpResult result;

    size_t sent = 0;
    while (sent < request.size()) {
        ssize_t n = send(fd, request.data() + sent, request.size() - sent, 0);
        if (n <= 0) {
            result.error = std::string("send failed: ") + strerror(errno);
            return result;
        }
        sent += static_cast<size_t>(n);
    }

    std::string head;
    char buffer[4096];
    while (head.find("\r\n") == std::string::npos && head.size() < 16384) {
        ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
        if (n < 0) {
            result.error = std::string("receive failed: ") + strerror(errno);
            return result;
        }
        if (n == 0) break;
        head.append(buffer, static_cast<size_t>(n));
    }
    return parse_status_line(head);
}

HttpResult SimpleHttpClient::exchange_tls(int fd, const ParsedUrl& url, const std::string& request) {
    HttpResult result;

    std::unique_ptr<SSL_CTX, decltype(&SSL_CTX_free)> ctx(SSL_CTX_new(TLS_client_method()), &SSL_CTX_free);
    if (!ctx) {
        result.error = openssl_error_string("TLS context creation failed");
        return result;
    }
    SSL_CTX_set_min_proto_version(ctx.get(), TLS1_2_VERSION);
    SSL_CTX_set_verify(ctx.get(), SSL_VERIFY_PEER, nullptr);
    if (SSL_CTX_set_default_verify_paths(ctx.get()) != 1) {
        result.error = openssl_error_string("loading system trust store failed");
        return result;
    }

    std::unique_ptr<SSL, decltype(&SSL_free)> ssl(SSL_new(ctx.get()), &SSL_free);
    if (!ssl) {
        result.error = openssl_error_string("TLS session creation failed");
        return result;
    }

    SSL_set_tlsext_host_name(ssl.get(), url.host.c_str());
    SSL_set1_host(ssl.get(), url.host.c_str());
    SSL_set_fd(ssl.get(), fd);

    if (SSL_connect(ssl.get()) != 1) {
        long verify = SSL_get_verify_result(ssl.get());
        if (verify != X509_V_OK) {
            result.error = std::string("TLS certificate verification failed: ") +
                           X509_verify_cert_error_string(verify);
        } else {
            result.error = openssl_error_string("TLS handshake failed");
        }
        return result;
    }

    size_t sent = 0;
    while (sent < request.size()) {
        int n = SSL_write(ssl.get(), request.data() + sent, static_cast<int>(request.size() - sent));
        if (n <= 0) {
            result.error = openssl_error_string("TLS write failed");
            return result;
        }
        sent += static_cast<size_t>(n);
    }

    std::string head;
    char buffer[4096];
    while (head.find("\r\n") == std::string::npos && head.size() < 16384) {
        int n = SSL_read(ssl.get(), buffer, sizeof(buffer));
        if (n <= 0) {
            int err = SSL_get_error(ssl.get(), n);
            if (err == SSL_ERROR_ZERO_RETURN) break;
            if (head.empty()) {
                result.error = openssl_error_string("TLS read failed");
                return result;
            }
            break;
        }
        head.append(buffer, static_cast<size_t>(n));
    }
    SSL_shutdown(ssl.get());
    return parse_status_line(head);
}

HttpResult SimpleHttpClient::parse_status_line(const std::string& response_head) {
    HttpResult result;
    if (response_head.empty()) {
        result.error = "empty response from server";
        return result;
    }

    std::string line = response_head.substr(0, response_head.find("\r\n"));
    std::istringstream status_line(line);
    std::string version;
    int code = 0;
    status_line >> version >> code;
    if (version.rfind("HTTP/", 0) != 0 || code < 100 || code > 999) {
        result.error = "malformed HTTP status line";
        return result;
    }

    result.ok = true;
    result.status_code = code;
    return result;
}
