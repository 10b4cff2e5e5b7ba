#include "http_server.hpp"

#include "../log.hpp"
#include "../source/audio_source.hpp"
#include "../storage/history_db.hpp"
#include "../tasks/task_tracker.hpp"
#include "../transcription/transcription_service.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <stdexcept>

using json = nlohmann::json;

namespace {

std::expected<RequestParams, Error> params_from_form(const httplib::Request& req) {
    RequestParams p;
    if (req.has_file("language")) p.language = req.get_file_value("language").content;
    if (req.has_file("prompt")) p.prompt = req.get_file_value("prompt").content;
    if (req.has_file("return_timestamps")) {
        p.return_timestamps = parse_flag(req.get_file_value("return_timestamps").content);
    }
    if (req.has_file("temperature")) {
        try {
            p.temperature = std::stod(req.get_file_value("temperature").content);
        } catch (const std::exception&) {
            return std::unexpected(Error{ErrorKind::BadRequest, "Invalid temperature"});
        }
    }
    return p;
}

std::expected<RequestParams, Error> params_from_json(const json& body) {
    RequestParams p;
    try {
        if (body.contains("language")) p.language = body["language"].get<std::string>();
        if (body.contains("prompt")) p.prompt = body["prompt"].get<std::string>();
        if (body.contains("temperature")) {
            const auto& t = body["temperature"];
            p.temperature = t.is_string() ? std::stod(t.get<std::string>()) : t.get<double>();
        }
        if (body.contains("return_timestamps")) {
            const auto& r = body["return_timestamps"];
            p.return_timestamps = r.is_boolean() ? r.get<bool>() : parse_flag(r.get<std::string>());
        }
    } catch (const std::exception& e) {
        return std::unexpected(Error{ErrorKind::BadRequest, std::string("Invalid parameter: ") + e.what()});
    }
    return p;
}

json parse_body(const httplib::Request& req) {
    auto j = json::parse(req.body, nullptr, false);
    if (j.is_discarded() || !j.is_object()) return json::object();
    return j;
}

UploadedSource uploaded_source(const httplib::Request& req, uint64_t max_bytes) {
    UploadedSource src{.max_bytes = max_bytes};
    if (req.has_file("file")) {
        const auto& f = req.get_file_value("file");
        src.part = UploadedPart{.filename = f.filename, .content = f.content, .content_type = f.content_type};
    }
    return src;
}

std::string describe_request(const httplib::Request& req) {
    std::string out;
    if (req.is_multipart_form_data()) {
        std::string files, params;
        for (const auto& [name, part] : req.files) {
            auto& sink = part.filename.empty() ? params : files;
            if (!sink.empty()) sink += ",";
            sink += part.filename.empty() ? name : name + "=" + part.filename;
        }
        if (!files.empty()) out += " files: " + files;
        if (!params.empty()) out += " params: " + params;
    } else if (!req.body.empty()) {
        auto j = json::parse(req.body, nullptr, false);
        if (j.is_object()) {
            std::string keys;
            for (auto& [k, v] : j.items()) {
                if (!keys.empty()) keys += ",";
                keys += k;
            }
            out += " params: " + keys;
        }
    }
    return out;
}

std::string offending_file(const httplib::Request& req) {
    if (req.has_file("file")) return req.get_file_value("file").filename;
    auto j = json::parse(req.body, nullptr, false);
    if (j.is_object()) {
        if (j.contains("file_path") && j["file_path"].is_string()) return j["file_path"];
        if (j.contains("url") && j["url"].is_string()) return j["url"];
    }
    return "-";
}

} // namespace

std::string client_address(const httplib::Request& req) {
    auto fwd = req.get_header_value("X-Forwarded-For");
    if (!fwd.empty()) {
        auto first = fwd.substr(0, fwd.find(','));
        first.erase(0, first.find_first_not_of(' '));
        first.erase(first.find_last_not_of(' ') + 1);
        if (!first.empty()) return first;
    }
    auto real = req.get_header_value("X-Real-IP");
    if (!real.empty()) return real;
    return req.remote_addr.empty() ? "unknown" : req.remote_addr;
}

void send_json(httplib::Response& res, const json& body, int status) {
    res.status = status;
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
}

void send_error(httplib::Response& res, const Error& err) {
    send_json(res, {{"error", err.message}}, http_status(err.kind));
}

HttpServer::HttpServer(Config config, TranscriptionService& service, TaskTracker& tasks,
                       FileValidator validator, HistoryDb* history)
    : config_(std::move(config)), service_(service), tasks_(tasks),
      validator_(std::move(validator)), history_(history),
      model_cache_(std::chrono::seconds(config_.cache.model_ttl_s)) {
    svr_.set_default_headers({{"Server", "transcribe-gateway/" + config_.server.version}});

    svr_.set_exception_handler([](const httplib::Request& req, httplib::Response& res,
                                  std::exception_ptr ep) {
        std::string msg = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            msg = e.what();
        } catch (...) {
        }
        logging::error("http", "{} {}: unhandled exception: {}", req.method, req.path, msg);
        send_json(res, {{"error", "Internal server error"}}, 500);
    });

    svr_.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
        if (res.body.empty() && res.status == 404) {
            send_json(res, {{"error", "Not found"}, {"details", req.path}}, 404);
        }
    });

    register_routes();
}

void HttpServer::route(const std::string& pattern, bool post,
                       void (HttpServer::*fn)(const httplib::Request&, httplib::Response&)) {
    auto handler = with_request_log([this, fn](const httplib::Request& req, httplib::Response& res) {
        (this->*fn)(req, res);
    });
    if (post) svr_.Post(pattern, handler);
    else svr_.Get(pattern, handler);
}

void HttpServer::register_routes() {
    svr_.Get("/health", with_request_log([this](const httplib::Request&, httplib::Response& res) {
        send_json(res, {{"status", "ok"}, {"version", config_.server.version}});
    }));
    svr_.Get("/config", with_request_log([this](const httplib::Request&, httplib::Response& res) {
        send_json(res, config_.to_json());
    }));

    route("/local/transcriptions", true, &HttpServer::transcribe_local);
    route("/v1/models", false, &HttpServer::list_models);
    route(R"(/v1/models/([^/]+))", false, &HttpServer::get_model);
    route("/v1/audio/transcriptions", true, &HttpServer::transcribe_upload);
    route("/v1/audio/transcriptions/multipart", true, &HttpServer::transcribe_upload);
    route("/v1/audio/transcriptions/url", true, &HttpServer::transcribe_url);
    route("/v1/audio/transcriptions/base64", true, &HttpServer::transcribe_base64);
    route("/v1/audio/transcriptions/async", true, &HttpServer::transcribe_async);
    route(R"(/v1/tasks/([^/]+))", false, &HttpServer::get_task);
    route("/v1/history", false, &HttpServer::get_history);
}

HttpServer::Handler HttpServer::with_request_log(Handler handler) {
    return [this, handler = std::move(handler)](const httplib::Request& req, httplib::Response& res) {
        bool excluded = !config_.logging.requests ||
                        std::ranges::any_of(config_.logging.exclude_paths, [&](const std::string& p) {
                            return req.path.starts_with(p);
                        });
        if (excluded) {
            handler(req, res);
            return;
        }

        auto client = client_address(req);
        auto agent = req.get_header_value("User-Agent");
        logging::info("request", "{} {} from {} ({}){}", req.method, req.path, client,
                      agent.empty() ? "-" : agent, describe_request(req));

        auto start = std::chrono::steady_clock::now();
        handler(req, res);
        double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();

        logging::info("request", "{} {} -> {} in {:.3f}s, {} bytes", req.method, req.path,
                      res.status, elapsed, res.body.size());
        if (res.status == 400) {
            logging::warn("request", "invalid file request to {} with '{}' from {}", req.path,
                          offending_file(req), client);
        }
    };
}

void HttpServer::transcribe_upload(const httplib::Request& req, httplib::Response& res) {
    auto params = params_from_form(req);
    if (!params) return send_error(res, params.error());

    AudioSource source = uploaded_source(req, config_.validation.max_file_size_bytes());
    auto resp = service_.run(source, *params, &validator_);
    if (!resp) return send_error(res, resp.error());
    send_json(res, resp->to_json());
}

void HttpServer::transcribe_async(const httplib::Request& req, httplib::Response& res) {
    auto params = params_from_form(req);
    if (!params) return send_error(res, params.error());

    // Reject bad uploads before a task exists for them
    AudioSource probe = uploaded_source(req, config_.validation.max_file_size_bytes());
    auto fetched = fetch(probe);
    if (!fetched) return send_error(res, fetched.error());
    if (auto ok = validator_.validate(*fetched->stream, fetched->name); !ok) {
        return send_error(res, ok.error());
    }
    fetched->stream.reset();

    auto task_id = tasks_.submit([this, source = std::move(probe), params = *params]() mutable
                                 -> std::expected<json, std::string> {
        auto resp = service_.run(source, params);
        if (!resp) return std::unexpected(resp.error().message);
        return resp->to_json();
    });
    send_json(res, {{"task_id", task_id}}, 202);
}

void HttpServer::transcribe_url(const httplib::Request& req, httplib::Response& res) {
    auto body = parse_body(req);
    if (!body.contains("url") || !body["url"].is_string()) {
        return send_json(res, {{"error", "No URL provided"},
                               {"details", "Please provide 'url' in the JSON request"}}, 400);
    }
    auto params = params_from_json(body);
    if (!params) return send_error(res, params.error());

    AudioSource source = RemoteSource{
        .url = body["url"].get<std::string>(),
        .max_bytes = config_.validation.max_file_size_bytes(),
        .resources = &service_.resources(),
    };
    auto resp = service_.run(source, *params, &validator_);
    if (!resp) return send_error(res, resp.error());
    send_json(res, resp->to_json());
}

void HttpServer::transcribe_base64(const httplib::Request& req, httplib::Response& res) {
    auto body = parse_body(req);
    if (!body.contains("file") || !body["file"].is_string()) {
        return send_json(res, {{"error", "No base64 file provided"},
                               {"details", "Please provide 'file' in the JSON request"}}, 400);
    }
    auto params = params_from_json(body);
    if (!params) return send_error(res, params.error());

    AudioSource source = InlineSource{
        .payload = body["file"].get<std::string>(),
        .max_bytes = config_.validation.max_file_size_bytes(),
        .resources = &service_.resources(),
    };
    auto resp = service_.run(source, *params, &validator_);
    if (!resp) return send_error(res, resp.error());
    send_json(res, resp->to_json());
}

void HttpServer::transcribe_local(const httplib::Request& req, httplib::Response& res) {
    auto body = parse_body(req);
    if (!body.contains("file_path") || !body["file_path"].is_string()) {
        return send_json(res, {{"error", "No file_path provided"}}, 400);
    }

    auto path = validate_local_file_path(body["file_path"].get<std::string>(),
                                         config_.allowed_directories);
    if (!path) {
        logging::warn("http", "/local/transcriptions rejected '{}' from {}: {}",
                      body["file_path"].get<std::string>(), client_address(req), path.error().message);
        return send_error(res, path.error());
    }

    auto params = params_from_json(body);
    if (!params) return send_error(res, params.error());

    AudioSource source = LocalPathSource{
        .path = *path,
        .max_bytes = config_.validation.max_file_size_bytes(),
    };
    auto resp = service_.run(source, *params);
    if (!resp) return send_error(res, resp.error());
    send_json(res, resp->to_json());
}

json HttpServer::model_object() {
    return model_cache_.get_or_compute("model", [this] {
        return json{
            {"id", service_.model_name()},
            {"object", "model"},
            {"owned_by", "openai"},
            {"permissions", json::array()},
        };
    });
}

void HttpServer::list_models(const httplib::Request&, httplib::Response& res) {
    send_json(res, {{"data", json::array({model_object()})}, {"object", "list"}});
}

void HttpServer::get_model(const httplib::Request& req, httplib::Response& res) {
    auto id = req.matches[1].str();
    auto model = model_object();
    if (id != model["id"].get<std::string>()) {
        return send_json(res, {{"error", "Model not found"},
                               {"details", "Model '" + id + "' does not exist"}}, 404);
    }
    send_json(res, model);
}

void HttpServer::get_task(const httplib::Request& req, httplib::Response& res) {
    auto task = tasks_.status(req.matches[1].str());
    if (!task) return send_json(res, {{"error", "Task not found"}}, 404);
    send_json(res, task->to_json());
}

void HttpServer::get_history(const httplib::Request& req, httplib::Response& res) {
    int limit = 10;
    if (req.has_param("limit")) {
        try {
            limit = std::clamp(std::stoi(req.get_param_value("limit")), 1, 1000);
        } catch (const std::exception&) {
            return send_error(res, Error{ErrorKind::BadRequest, "Invalid limit"});
        }
    }

    json entries = json::array();
    bool enabled = history_ && history_->is_open();
    if (enabled) {
        for (auto& e : history_->recent(limit)) {
            entries.push_back({
                {"id", e.id},
                {"timestamp", e.timestamp},
                {"filename", e.filename},
                {"text", e.text},
                {"duration_seconds", e.audio_duration},
                {"processing_time", e.processing_time},
                {"model", e.model},
            });
        }
    }
    send_json(res, {{"enabled", enabled}, {"data", entries}});
}

bool HttpServer::listen() {
    logging::info("http", "listening on {}:{}", config_.server.host, config_.server.port);
    if (!svr_.listen(config_.server.host, config_.server.port)) {
        logging::error("http", "could not bind {}:{}", config_.server.host, config_.server.port);
        return false;
    }
    return true;
}

int HttpServer::bind_to_any_port(const std::string& host) {
    return svr_.bind_to_any_port(host);
}

bool HttpServer::listen_after_bind() {
    return svr_.listen_after_bind();
}

void HttpServer::stop() {
    svr_.stop();
}

bool HttpServer::is_running() const {
    return svr_.is_running();
}
