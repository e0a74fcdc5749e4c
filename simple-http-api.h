#pragma once

#include <string>
#include <map>
#include <memory>
#include <thread>
#include <atomic>

// Forward declarations
class AppController;
class Database;

// Local web form for the click-to-call settings and manual dialing.
// Loopback only, and only for requests whose Host and Origin name this
// listener; POST bodies must be declared application/json. Request threads
// never touch the controller directly; they post to its EventQueue and wait
// for the result.

struct HttpRequest {
    std::string method;
    std::string path;
    std::map<std::string, std::string> headers;
    std::map<std::string, std::string> query_params;
    std::string body;
};

struct HttpResponse {
    int status_code;
    std::string status_text;
    std::map<std::string, std::string> headers;
    std::string body;
};

class SimpleHttpServer {
public:
    SimpleHttpServer(int port, std::shared_ptr<AppController> controller, Database* database = nullptr);
    ~SimpleHttpServer();

    bool start();
    void stop();
    bool is_running() const { return running_; }
    int port() const { return port_; }
    std::string url() const { return "http://127.0.0.1:" + std::to_string(port_) + "/"; }

    // Exposed for tests; does not need a socket
    HttpResponse handle_request(const HttpRequest& request);
    static HttpRequest parse_request(const std::string& raw_request);
    static std::string create_response(const HttpResponse& response);

private:
    int port_;
    int server_socket_;
    std::atomic<bool> running_;
    std::atomic<int> active_clients_;
    std::thread server_thread_;
    std::shared_ptr<AppController> controller_;
    Database* database_;

    void server_loop();
    void handle_client(int client_socket);
    std::string read_raw_request(int client_socket);

    HttpResponse serve_index();
    HttpResponse api_state_get(const HttpRequest& request);
    HttpResponse api_settings_post(const HttpRequest& request);
    HttpResponse api_call_post(const HttpRequest& request);
    HttpResponse api_history_get(const HttpRequest& request);
    HttpResponse api_history_delete(const HttpRequest& request);

    bool is_loopback_host(const std::string& host) const;
    bool is_loopback_origin(const std::string& origin) const;
    static bool has_json_body(const HttpRequest& request);

    static HttpResponse json_response(int status_code, const std::string& status_text, const std::string& body);
};
