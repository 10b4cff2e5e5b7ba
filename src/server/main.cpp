#include "config.hpp"
#include "http/http_server.hpp"
#include "log.hpp"
#include "platform/platform_paths.hpp"
#include "storage/history_db.hpp"
#include "storage/temp_files.hpp"
#include "tasks/task_tracker.hpp"
#include "transcription/transcription_service.hpp"
#include "validation/file_validator.hpp"
#include "whisper/lan_backend.hpp"

#include <charconv>
#include <csignal>
#include <curl/curl.h>
#include <filesystem>
#include <memory>
#include <print>
#include <pthread.h>
#include <thread>

namespace {

ValidationPolicy policy_from(const Config& cfg) {
    return ValidationPolicy{
        .max_file_size_mb = cfg.validation.max_file_size_mb,
        .allowed_extensions = cfg.validation.allowed_extensions,
        .allowed_mime_types = {cfg.validation.allowed_mime_types.begin(),
                               cfg.validation.allowed_mime_types.end()},
    };
}

} // namespace

int main(int argc, char* argv[]) {
    bool verbose = false;
    std::string config_path;
    int port_override = 0;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--verbose" || arg == "-v") {
            verbose = true;
        } else if (arg == "--config" || arg == "-c") {
            if (i + 1 < argc) config_path = argv[++i];
        } else if (arg == "--port" || arg == "-p") {
            if (i + 1 < argc) {
                std::string_view v = argv[++i];
                auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), port_override);
                if (ec != std::errc{} || port_override <= 0 || port_override > 65535) {
                    std::println(stderr, "Invalid port: {}", v);
                    return 1;
                }
            }
        } else if (arg == "--help" || arg == "-h") {
            std::println("Usage: transcribe-gateway [options]");
            std::println("Options:");
            std::println("  -c, --config PATH   Config file path");
            std::println("  -p, --port N        Listen port (overrides config)");
            std::println("  -v, --verbose       Enable debug logging");
            std::println("  -h, --help          Show this help");
            return 0;
        } else {
            std::println(stderr, "Unknown option: {}", arg);
            return 1;
        }
    }

    Config config = config_path.empty() ? Config::load_default() : Config::load(config_path);
    if (port_override) config.server.port = static_cast<uint16_t>(port_override);

    logging::set_level(verbose ? logging::Level::Debug : logging::parse_level(config.logging.level));
    if (!config.logging.file.empty()) logging::set_file(config.logging.file);

    if (config.backend.type != "lan") {
        logging::error("main", "unknown backend type '{}'", config.backend.type);
        return 1;
    }

    // Handled by the signal thread below; every later thread inherits the mask
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    std::signal(SIGPIPE, SIG_IGN);

    curl_global_init(CURL_GLOBAL_DEFAULT);

    ResourceManager resources(config.audio.scratch_dir);

    std::unique_ptr<HistoryDb> history;
    if (config.history.enabled) {
        auto path = config.history.path;
        if (path.empty()) {
            auto data = platform::data_dir();
            if (!data.empty()) path = (std::filesystem::path(data) / "history.db").string();
        }
        history = std::make_unique<HistoryDb>();
        if (path.empty() || !history->open(path)) {
            logging::warn("main", "history disabled, could not open database");
            history.reset();
        }
    }

    LanBackend backend(config.backend.url, config.backend.api_format, config.backend.model,
                       static_cast<long>(config.backend.timeout_s));
    TranscriptionService service(config, resources, backend, history.get());
    TaskTracker tasks(std::chrono::seconds(config.tasks.max_age_s));
    HttpServer server(config, service, tasks, FileValidator(policy_from(config)), history.get());

    logging::info("main", "backend: {} @ {} ({})", config.backend.type, config.backend.url,
                  config.backend.api_format);

    std::jthread signal_thread([&server, signals](std::stop_token) {
        int sig = 0;
        if (sigwait(&signals, &sig) == 0) {
            logging::info("main", "received signal {}, shutting down", sig);
            server.stop();
        }
    });

    bool ok = server.listen();
    if (!ok) {
        // Wake the signal thread so it can be joined
        pthread_kill(signal_thread.native_handle(), SIGTERM);
    }
    signal_thread.join();

    tasks.join_all();
    resources.release_all();
    curl_global_cleanup();

    logging::info("main", "stopped");
    return ok ? 0 : 1;
}
