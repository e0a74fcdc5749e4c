#include "simple-http-api.h"
#include "app-controller.h"
#include "database.h"
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>
#include <future>
#include <functional>
#include <utility>
#include <cctype>
#include <chrono>
#include <cstring>
#include <cerrno>
#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>

using json = nlohmann::json;

static const size_t kMaxRequestBytes = 64 * 1024;

SimpleHttpServer::SimpleHttpServer(int port, std::shared_ptr<AppController> controller, Database* database)
    : port_(port), server_socket_(-1), running_(false), active_clients_(0),
      controller_(std::move(controller)), database_(database) {}

SimpleHttpServer::~SimpleHttpServer() {
    stop();
}

bool SimpleHttpServer::start() {
    server_socket_ = socket(AF_INET, SOCK_STREAM, 0);
    if (server_socket_ < 0) {
        std::cerr << "Failed to create socket" << std::endl;
        return false;
    }

    // Allow socket reuse
    int opt = 1;
    setsockopt(server_socket_, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    struct sockaddr_in address;
    std::memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    address.sin_port = htons(port_);

    if (bind(server_socket_, (struct sockaddr*)&address, sizeof(address)) < 0) {
        std::cerr << "Failed to bind to port " << port_ << ": " << strerror(errno) << std::endl;
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    if (listen(server_socket_, 10) < 0) {
        std::cerr << "Failed to listen on socket" << std::endl;
        close(server_socket_);
        server_socket_ = -1;
        return false;
    }

    running_ = true;
    server_thread_ = std::thread(&SimpleHttpServer::server_loop, this);

    std::cout << "🌐 Click-To-Call form at " << url() << std::endl;
    return true;
}

void SimpleHttpServer::stop() {
    running_ = false;
    if (server_socket_ >= 0) {
        // shutdown() wakes the blocked accept()
        shutdown(server_socket_, SHUT_RDWR);
        close(server_socket_);
        server_socket_ = -1;
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
    // Client threads hold `this`; give in-flight requests time to finish
    for (int i = 0; i < 70 && active_clients_.load() > 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
}

void SimpleHttpServer::server_loop() {
    while (running_) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_socket = accept(server_socket_, (struct sockaddr*)&client_addr, &client_len);
        if (client_socket < 0) {
            if (running_ && errno != EINTR) {
                std::cerr << "Failed to accept client connection" << std::endl;
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            continue;
        }

        // Handle client in separate thread for simplicity
        active_clients_.fetch_add(1);
        std::thread client_thread([this, client_socket]() {
            handle_client(client_socket);
            active_clients_.fetch_sub(1);
        });
        client_thread.detach();
    }
}

std::string SimpleHttpServer::read_raw_request(int client_socket) {
    std::string raw;
    char buffer[8192];
    size_t expected_total = 0;

    while (raw.size() < kMaxRequestBytes) {
        ssize_t n = recv(client_socket, buffer, sizeof(buffer), 0);
        if (n <= 0) break;
        raw.append(buffer, static_cast<size_t>(n));

        size_t headers_end = raw.find("\r\n\r\n");
        if (headers_end == std::string::npos) continue;

        if (expected_total == 0) {
            HttpRequest head = parse_request(raw.substr(0, headers_end + 4));
            size_t content_length = 0;
            for (const auto& header : head.headers) {
                std::string name = header.first;
                for (auto& ch : name) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
                if (name != "content-length") continue;
                try {
                    content_length = std::stoul(header.second);
                } catch (const std::exception&) {
                    content_length = 0;
                }
            }
            expected_total = headers_end + 4 + content_length;
        }
        if (raw.size() >= expected_total) break;
    }
    return raw;
}

void SimpleHttpServer::handle_client(int client_socket) {
    // Set socket timeout
    struct timeval timeout;
    timeout.tv_sec = 5;
    timeout.tv_usec = 0;
    setsockopt(client_socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
    setsockopt(client_socket, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

    try {
        std::string raw_request = read_raw_request(client_socket);
        if (raw_request.empty()) {
            close(client_socket);
            return;
        }

        HttpRequest request = parse_request(raw_request);
        HttpResponse response = handle_request(request);
        std::string response_str = create_response(response);
        send(client_socket, response_str.c_str(), response_str.length(), MSG_NOSIGNAL);
    } catch (const std::exception& e) {
        std::cerr << "Client handling error: " << e.what() << std::endl;
        std::string error_response = "HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\n\r\n";
        send(client_socket, error_response.c_str(), error_response.length(), MSG_NOSIGNAL);
    }

    close(client_socket);
}

HttpRequest SimpleHttpServer::parse_request(const std::string& raw_request) {
    HttpRequest request;
    std::istringstream stream(raw_request);
    std::string line;

    // Parse request line
    if (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        std::istringstream request_line(line);
        request_line >> request.method >> request.path;

        // Parse query parameters
        size_t query_pos = request.path.find('?');
        if (query_pos != std::string::npos) {
            std::string query = request.path.substr(query_pos + 1);
            request.path = request.path.substr(0, query_pos);

            // Simple query parsing
            size_t pos = 0;
            while (pos < query.length()) {
                size_t eq_pos = query.find('=', pos);
                size_t amp_pos = query.find('&', pos);
                if (amp_pos == std::string::npos) amp_pos = query.length();

                if (eq_pos != std::string::npos && eq_pos < amp_pos) {
                    std::string key = query.substr(pos, eq_pos - pos);
                    std::string value = query.substr(eq_pos + 1, amp_pos - eq_pos - 1);
                    request.query_params[key] = value;
                }
                pos = amp_pos + 1;
            }
        }
    }

    // Parse headers
    while (std::getline(stream, line) && line != "\r") {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon_pos = line.find(':');
        if (colon_pos != std::string::npos) {
            std::string key = line.substr(0, colon_pos);
            std::string value = line.substr(colon_pos + 1);
            // Trim whitespace
            value.erase(0, value.find_first_not_of(" \t"));
            value.erase(value.find_last_not_of(" \t") + 1);
            request.headers[key] = value;
        }
    }

    // Parse body (binary safe)
    size_t headers_end = raw_request.find("\r\n\r\n");
    if (headers_end != std::string::npos) {
        request.body = raw_request.substr(headers_end + 4);
    }

    return request;
}

std::string SimpleHttpServer::create_response(const HttpResponse& response) {
    std::ostringstream stream;
    stream << "HTTP/1.1 " << response.status_code << " " << response.status_text << "\r\n";

    for (const auto& header : response.headers) {
        stream << header.first << ": " << header.second << "\r\n";
    }

    stream << "Content-Length: " << response.body.length() << "\r\n";
    stream << "Connection: close\r\n";
    stream << "\r\n";
    stream << response.body;

    return stream.str();
}

HttpResponse SimpleHttpServer::json_response(int status_code, const std::string& status_text,
                                             const std::string& body) {
    HttpResponse response;
    response.status_code = status_code;
    response.status_text = status_text;
    response.headers["Content-Type"] = "application/json";
    response.headers["Cache-Control"] = "no-store";
    response.body = body;
    return response;
}

// Runs fn on the controller's thread and returns what it produced. fn must
// own everything it touches: after a timeout it may still run later.
static bool run_on_controller(AppController& controller, std::function<json()> fn, json& out) {
    auto done = std::make_shared<std::promise<json>>();
    std::future<json> finished = done->get_future();
    controller.queue().post([fn, done]() {
        done->set_value(fn());
    });
    if (finished.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
        return false;
    }
    out = finished.get();
    return true;
}

// Header names are matched case-insensitively; empty when absent
static std::string header_value(const HttpRequest& request, const std::string& name) {
    for (const auto& header : request.headers) {
        if (header.first.size() != name.size()) continue;
        bool same = true;
        for (size_t i = 0; i < name.size() && same; ++i) {
            same = std::tolower(static_cast<unsigned char>(header.first[i])) ==
                   std::tolower(static_cast<unsigned char>(name[i]));
        }
        if (same) return header.second;
    }
    return "";
}

bool SimpleHttpServer::is_loopback_host(const std::string& host) const {
    const std::string port = ":" + std::to_string(port_);
    return host == "127.0.0.1" + port || host == "localhost" + port;
}

bool SimpleHttpServer::is_loopback_origin(const std::string& origin) const {
    const std::string prefix = "http://";
    return origin.rfind(prefix, 0) == 0 && is_loopback_host(origin.substr(prefix.size()));
}

bool SimpleHttpServer::has_json_body(const HttpRequest& request) {
    std::string type = header_value(request, "Content-Type");
    type = type.substr(0, type.find(';'));
    type.erase(type.find_last_not_of(" \t") + 1);
    for (auto& ch : type) ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
    return type == "application/json";
}

HttpResponse SimpleHttpServer::handle_request(const HttpRequest& request) {
    // Only pages served from this listener may drive it; a foreign Host
    // means DNS rebinding, a foreign Origin means a cross-site request
    if (!is_loopback_host(header_value(request, "Host"))) {
        std::cout << "⚠️ Rejected form request with Host '" << header_value(request, "Host") << "'" << std::endl;
        return json_response(403, "Forbidden", R"({"error": "Forbidden host"})");
    }
    std::string origin = header_value(request, "Origin");
    if (!origin.empty() && !is_loopback_origin(origin)) {
        std::cout << "⚠️ Rejected cross-origin form request from " << origin << std::endl;
        return json_response(403, "Forbidden", R"({"error": "Forbidden origin"})");
    }
    if (request.method == "POST" && !has_json_body(request)) {
        return json_response(415, "Unsupported Media Type", R"({"error": "Expected application/json"})");
    }

    if (request.path == "/" || request.path == "/index.html") {
        if (request.method != "GET") {
            return json_response(405, "Method Not Allowed", R"({"error": "Method not allowed"})");
        }
        return serve_index();
    }

    if (request.path == "/api/state" && request.method == "GET") {
        return api_state_get(request);
    } else if (request.path == "/api/settings" && request.method == "POST") {
        return api_settings_post(request);
    } else if (request.path == "/api/call" && request.method == "POST") {
        return api_call_post(request);
    } else if (request.path == "/api/history" && request.method == "GET") {
        return api_history_get(request);
    } else if (request.path == "/api/history" && request.method == "DELETE") {
        return api_history_delete(request);
    }

    return json_response(404, "Not Found", R"({"error": "Not found"})");
}

// Snapshot of the form state; the shared key is reported only as present/absent
static json state_to_json(const AppController& controller) {
    const Settings& settings = controller.settings();
    const SessionState& session = controller.session();
    return json{
        {"domain", settings.domain},
        {"extension", settings.extension},
        {"key_set", !settings.key.empty()},
        {"auto_answer", settings.auto_answer},
        {"phone_number", session.phone_number},
        {"status_message", session.status_message}
    };
}

HttpResponse SimpleHttpServer::api_state_get(const HttpRequest&) {
    std::shared_ptr<AppController> controller = controller_;
    json state;
    if (!run_on_controller(*controller_, [controller]() { return state_to_json(*controller); }, state)) {
        return json_response(503, "Service Unavailable", R"({"error": "Application is busy"})");
    }
    return json_response(200, "OK", state.dump());
}

HttpResponse SimpleHttpServer::api_settings_post(const HttpRequest& request) {
    json body;
    try {
        body = json::parse(request.body);
    } catch (const json::exception& e) {
        return json_response(400, "Bad Request", json{{"error", std::string("Invalid JSON: ") + e.what()}}.dump());
    }
    if (!body.is_object()) {
        return json_response(400, "Bad Request", R"({"error": "Expected a JSON object"})");
    }

    std::shared_ptr<AppController> controller = controller_;
    json result;
    bool ran = run_on_controller(*controller_, [controller, body]() {
        Settings updated = controller->settings();
        try {
            if (body.contains("domain")) updated.domain = body.at("domain").get<std::string>();
            if (body.contains("extension")) updated.extension = body.at("extension").get<std::string>();
            // Key is write-only: absent means keep the stored one
            if (body.contains("key")) updated.key = body.at("key").get<std::string>();
            if (body.contains("auto_answer")) updated.auto_answer = body.at("auto_answer").get<bool>();
        } catch (const json::exception& e) {
            return json{{"error", std::string("Invalid field: ") + e.what()}};
        }
        bool saved = controller->save_settings(updated);
        json state = state_to_json(*controller);
        state["success"] = saved;
        return state;
    }, result);

    if (!ran) {
        return json_response(503, "Service Unavailable", R"({"error": "Application is busy"})");
    }
    if (result.contains("error")) {
        return json_response(400, "Bad Request", result.dump());
    }
    bool saved = result.value("success", false);
    return json_response(saved ? 200 : 500, saved ? "OK" : "Internal Server Error", result.dump());
}

HttpResponse SimpleHttpServer::api_call_post(const HttpRequest& request) {
    std::string phone_number;
    bool has_phone = false;
    if (!request.body.empty()) {
        try {
            json body = json::parse(request.body);
            if (body.is_object() && body.contains("phone_number")) {
                phone_number = body.at("phone_number").get<std::string>();
                has_phone = true;
            }
        } catch (const json::exception& e) {
            return json_response(400, "Bad Request", json{{"error", std::string("Invalid JSON: ") + e.what()}}.dump());
        }
    }

    std::shared_ptr<AppController> controller = controller_;
    json result;
    bool ran = run_on_controller(*controller_, [controller, has_phone, phone_number]() {
        if (has_phone) controller->set_phone_number(phone_number);
        bool placed = controller->place_call();
        json state = state_to_json(*controller);
        state["success"] = placed;
        return state;
    }, result);
    if (!ran) {
        return json_response(503, "Service Unavailable", R"({"error": "Application is busy"})");
    }

    bool placed = result.value("success", false);
    // The status line explains a validation failure
    return json_response(placed ? 202 : 400, placed ? "Accepted" : "Bad Request", result.dump());
}

HttpResponse SimpleHttpServer::api_history_get(const HttpRequest& request) {
    if (!database_ || !database_->is_open()) {
        return json_response(200, "OK", R"({"calls": []})");
    }

    int limit = 20;
    auto it = request.query_params.find("limit");
    if (it != request.query_params.end()) {
        try {
            limit = std::stoi(it->second);
        } catch (const std::exception&) {
            limit = 20;
        }
        if (limit < 1) limit = 1;
        if (limit > 500) limit = 500;
    }

    json calls = json::array();
    for (const auto& record : database_->get_recent_calls(limit)) {
        calls.push_back({
            {"id", record.id},
            {"created_at", record.created_at},
            {"phone_number", record.phone_number},
            {"extension", record.extension},
            {"domain", record.domain},
            {"outcome", record.outcome},
            {"http_status", record.http_status},
            {"message", record.message}
        });
    }
    return json_response(200, "OK", json{{"calls", calls}}.dump());
}

HttpResponse SimpleHttpServer::api_history_delete(const HttpRequest&) {
    if (!database_ || !database_->is_open()) {
        return json_response(503, "Service Unavailable", R"({"error": "Call history is disabled"})");
    }
    if (!database_->clear_history()) {
        return json_response(500, "Internal Server Error", R"({"success": false})");
    }
    std::cout << "🧹 Call history cleared" << std::endl;
    return json_response(200, "OK", R"({"success": true})");
}

HttpResponse SimpleHttpServer::serve_index() {
    HttpResponse response;
    response.status_code = 200;
    response.status_text = "OK";
    response.headers["Content-Type"] = "text/html; charset=utf-8";
    response.body = R"HTML(<!DOCTYPE html>
<html lang="en">
<head>
    <meta charset="UTF-8">
    <meta name="viewport" content="width=device-width, initial-scale=1.0">
    <title>Click-To-Call</title>
    <style>
        body { font-family: -apple-system, BlinkMacSystemFont, sans-serif; margin: 0; padding: 20px; background: #f1f3f5; }
        .card { max-width: 400px; margin: 0 auto; background: #fff; border-radius: 10px; padding: 20px; box-shadow: 0 4px 16px rgba(0,0,0,0.08); }
        .row { display: flex; align-items: center; margin-bottom: 10px; }
        .row label { width: 110px; }
        .row input[type=text], .row input[type=password] { flex: 1; padding: 6px; }
        button { padding: 8px 14px; margin: 10px 0; cursor: pointer; }
        #status { min-height: 1.2em; color: #333; }
        .history { font-size: 0.85em; color: #555; margin-top: 15px; }
    </style>
</head>
<body>
<div class="card">
    <div class="row"><label for="domain">Domain:</label><input type="text" id="domain" placeholder="Enter domain"></div>
    <div class="row"><label for="extension">Extension:</label><input type="text" id="extension" placeholder="Enter extension"></div>
    <div class="row"><label for="key">Key:</label><input type="password" id="key" placeholder="Enter key"></div>
    <div class="row"><label><input type="checkbox" id="auto_answer"> Auto Answer</label></div>
    <button id="save">Save Settings</button>
    <div class="row"><label for="phone">Phone Number:</label><input type="text" id="phone" placeholder="Enter phone number"></div>
    <button id="call">Place Call</button>
    <div id="status"></div>
    <div class="history" id="history"></div>
    <button id="clear">Clear History</button>
</div>
<script>
let loaded = false;
function render(state) {
    if (!loaded) {
        document.getElementById('domain').value = state.domain;
        document.getElementById('extension').value = state.extension;
        document.getElementById('auto_answer').checked = state.auto_answer;
        document.getElementById('key').placeholder = state.key_set ? '(unchanged)' : 'Enter key';
        loaded = true;
    }
    const phone = document.getElementById('phone');
    if (document.activeElement !== phone && state.phone_number) phone.value = state.phone_number;
    document.getElementById('status').textContent = state.status_message;
}
async function refresh() {
    try {
        const r = await fetch('/api/state');
        render(await r.json());
        const h = await (await fetch('/api/history?limit=5')).json();
        const list = document.getElementById('history');
        list.replaceChildren(...h.calls.map(c => {
            const row = document.createElement('div');
            row.textContent = `${c.created_at} ${c.phone_number}: ${c.message}`;
            return row;
        }));
    } catch (e) {}
}
document.getElementById('save').onclick = async () => {
    const body = {
        domain: document.getElementById('domain').value,
        extension: document.getElementById('extension').value,
        auto_answer: document.getElementById('auto_answer').checked
    };
    const key = document.getElementById('key').value;
    if (key) body.key = key;
    const r = await fetch('/api/settings', {method: 'POST', headers: {'Content-Type': 'application/json'}, body: JSON.stringify(body)});
    const s = await r.json();
    document.getElementById('status').textContent = s.status_message || s.error;
    document.getElementById('key').value = '';
};
document.getElementById('call').onclick = async () => {
    const r = await fetch('/api/call', {method: 'POST', headers: {'Content-Type': 'application/json'},
        body: JSON.stringify({phone_number: document.getElementById('phone').value})});
    const s = await r.json();
    document.getElementById('status').textContent = s.status_message || s.error;
};
document.getElementById('clear').onclick = async () => {
    await fetch('/api/history', {method: 'DELETE'});
    refresh();
};
refresh();
setInterval(refresh, 1000);
</script>
</body>
</html>)HTML";
    return response;
}
