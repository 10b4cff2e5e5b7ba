#pragma once

#include "../cache/ttl_cache.hpp"
#include "../config.hpp"
#include "../error.hpp"
#include "../validation/file_validator.hpp"

#include <functional>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <string>

class HistoryDb;
class TaskTracker;
class TranscriptionService;

// REST front over the transcription core.
class HttpServer {
public:
    using Handler = std::function<void(const httplib::Request&, httplib::Response&)>;

    HttpServer(Config config, TranscriptionService& service, TaskTracker& tasks,
               FileValidator validator, HistoryDb* history = nullptr);

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    // Blocks until stop() is called. False when the address cannot be bound.
    bool listen();

    // Binds an ephemeral port and returns it, or -1. Serve with listen_after_bind().
    int bind_to_any_port(const std::string& host);
    bool listen_after_bind();

    void stop();
    bool is_running() const;

    // Logs the request line before and status/timing after calling handler,
    // unless the path starts with one of the configured exclusions.
    Handler with_request_log(Handler handler);

private:
    void register_routes();
    void transcribe_upload(const httplib::Request& req, httplib::Response& res);
    void transcribe_async(const httplib::Request& req, httplib::Response& res);
    void transcribe_url(const httplib::Request& req, httplib::Response& res);
    void transcribe_base64(const httplib::Request& req, httplib::Response& res);
    void transcribe_local(const httplib::Request& req, httplib::Response& res);
    void list_models(const httplib::Request& req, httplib::Response& res);
    void get_model(const httplib::Request& req, httplib::Response& res);
    void get_task(const httplib::Request& req, httplib::Response& res);
    void get_history(const httplib::Request& req, httplib::Response& res);

    nlohmann::json model_object();
    void route(const std::string& pattern, bool post, void (HttpServer::*fn)(const httplib::Request&, httplib::Response&));

    Config config_;
    TranscriptionService& service_;
    TaskTracker& tasks_;
    FileValidator validator_;
    HistoryDb* history_;
    TtlCache<std::string, nlohmann::json> model_cache_;
    httplib::Server svr_;
};

// Client address, honoring X-Forwarded-For then X-Real-IP.
std::string client_address(const httplib::Request& req);

void send_json(httplib::Response& res, const nlohmann::json& body, int status = 200);
void send_error(httplib::Response& res, const Error& err);
