#include <catch2/catch_test_macros.hpp>

#include "source/audio_source.hpp"
#include "storage/temp_files.hpp"
#include "test_support.hpp"

#include <chrono>
#include <filesystem>
#include <httplib.h>
#include <sstream>
#include <string>
#include <thread>
#include <variant>

namespace fs = std::filesystem;

namespace {

std::string slurp(std::istream& in) {
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

constexpr size_t kOversizeBody = 256 * 1024;

// Loopback HTTP origin for RemoteSource downloads.
struct OriginServer {
    httplib::Server svr;
    std::thread thread;
    int port = -1;
    std::string redirect_target;

    OriginServer() {
        svr.Get("/clip.wav", [](const httplib::Request&, httplib::Response& res) {
            res.set_content("RIFF-remote-bytes", "audio/wav");
        });
        svr.Get("/declared", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(std::string(kOversizeBody, 'x'), "audio/wav");
        });
        svr.Get("/chunked", [](const httplib::Request&, httplib::Response& res) {
            res.set_chunked_content_provider("audio/wav", [](size_t offset, httplib::DataSink& sink) {
                if (offset >= kOversizeBody) {
                    sink.done();
                    return true;
                }
                std::string chunk(16 * 1024, 'x');
                return sink.write(chunk.data(), chunk.size());
            });
        });
        svr.Get("/redirect", [this](const httplib::Request&, httplib::Response& res) {
            res.set_redirect(redirect_target);
        });

        port = svr.bind_to_any_port("127.0.0.1");
        thread = std::thread([this] { svr.listen_after_bind(); });
        for (int i = 0; i < 200 && !svr.is_running(); i++) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }

    ~OriginServer() {
        svr.stop();
        if (thread.joinable()) thread.join();
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port) + path;
    }
};

} // namespace

TEST_CASE("check_size", "[source]") {

    SECTION("RestoresReadPosition") {
        std::istringstream in("0123456789");
        in.seekg(4);
        auto size = check_size(in, 100);
        REQUIRE(size.has_value());
        REQUIRE(*size == 10);
        REQUIRE(in.tellg() == 4);
    }

    SECTION("OverCeiling") {
        std::istringstream in("0123456789");
        auto size = check_size(in, 9);
        REQUIRE_FALSE(size.has_value());
        REQUIRE(size.error().kind == ErrorKind::TooLarge);
    }

    SECTION("ExactlyAtCeiling") {
        std::istringstream in("0123456789");
        REQUIRE(check_size(in, 10).has_value());
    }
}

TEST_CASE("UploadedSource", "[source]") {

    SECTION("MissingPart") {
        AudioSource src = UploadedSource{.max_bytes = 1024};
        auto res = fetch(src);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::MissingPart);
    }

    SECTION("EmptyFilename") {
        AudioSource src = UploadedSource{.part = UploadedPart{.filename = "", .content = "abc"}, .max_bytes = 1024};
        auto res = fetch(src);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::EmptySelection);
    }

    SECTION("YieldsStreamAtStart") {
        AudioSource src = UploadedSource{.part = UploadedPart{.filename = "clip.wav", .content = "RIFFdata"},
                                         .max_bytes = 1024};
        auto res = fetch(src);
        REQUIRE(res.has_value());
        REQUIRE(res->name == "clip.wav");
        REQUIRE(slurp(*res->stream) == "RIFFdata");
        cleanup(src);
    }

    SECTION("TooLarge") {
        AudioSource src = UploadedSource{.part = UploadedPart{.filename = "clip.wav", .content = std::string(2048, 'x')},
                                         .max_bytes = 1024};
        auto res = fetch(src);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::TooLarge);
    }
}

TEST_CASE("LocalPathSource", "[source]") {
    test::TmpDir dir("tg_test_src");

    SECTION("OpensExistingFile") {
        auto path = dir.file("speech.wav");
        test::write_file(path, "RIFF1234");
        AudioSource src = LocalPathSource{.path = path, .max_bytes = 1024};
        auto res = fetch(src);
        REQUIRE(res.has_value());
        REQUIRE(res->name == "speech.wav");
        REQUIRE(slurp(*res->stream) == "RIFF1234");
        cleanup(src);
        REQUIRE(fs::exists(path));
    }

    SECTION("NotFound") {
        AudioSource src = LocalPathSource{.path = dir.file("missing.wav"), .max_bytes = 1024};
        auto res = fetch(src);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::NotFound);
    }

    SECTION("TooLarge") {
        auto path = dir.file("big.wav");
        test::write_file(path, std::string(4096, 'x'));
        AudioSource src = LocalPathSource{.path = path, .max_bytes = 1024};
        auto res = fetch(src);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::TooLarge);
    }
}

TEST_CASE("InlineSource", "[source]") {
    test::TmpDir scratch("tg_test_inline");
    ResourceManager rm(scratch.path.string());

    SECTION("DecodesIntoScratchAndCleansUp") {
        AudioSource src = InlineSource{.payload = "UklGRmRhdGE=", .max_bytes = 1024, .resources = &rm};
        auto res = fetch(src);
        REQUIRE(res.has_value());
        REQUIRE(res->name.ends_with(".wav"));
        REQUIRE(slurp(*res->stream) == "RIFFdata");
        REQUIRE(scratch.count_entries() == 2);

        res->stream.reset();
        cleanup(src);
        REQUIRE(scratch.count_entries() == 0);
        cleanup(src);
    }

    SECTION("MalformedPayload") {
        AudioSource src = InlineSource{.payload = "%%%not-base64%%%", .max_bytes = 1024, .resources = &rm};
        auto res = fetch(src);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::DecodeError);
        cleanup(src);
        REQUIRE(scratch.count_entries() == 0);
    }

    SECTION("TooLargeBeforeStaging") {
        AudioSource src = InlineSource{.payload = "QUFBQUFBQUFBQQ==", .max_bytes = 4, .resources = &rm};
        auto res = fetch(src);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::TooLarge);
        REQUIRE(scratch.count_entries() == 0);
    }
}

TEST_CASE("RemoteSource", "[source]") {
    test::TmpDir dir("tg_test_remote");
    test::TmpDir scratch("tg_test_remote_scratch");
    ResourceManager rm(scratch.path.string());
    OriginServer origin;
    REQUIRE(origin.port > 0);

    SECTION("DownloadsIntoScratchAndCleansUp") {
        AudioSource src = RemoteSource{.url = origin.url("/clip.wav"), .max_bytes = 1024, .resources = &rm};
        auto res = fetch(src);
        REQUIRE(res.has_value());
        REQUIRE(res->name.ends_with(".wav"));
        REQUIRE(slurp(*res->stream) == "RIFF-remote-bytes");

        res->stream.reset();
        cleanup(src);
        REQUIRE(scratch.count_entries() == 0);
    }

    SECTION("DeclaredLengthOverCeilingWritesNothing") {
        AudioSource src = RemoteSource{.url = origin.url("/declared"), .max_bytes = 128 * 1024, .resources = &rm};
        auto res = fetch(src);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::TooLarge);

        auto staged = std::get<RemoteSource>(src).downloaded;
        REQUIRE((!fs::exists(staged) || fs::file_size(staged) == 0));
        cleanup(src);
        REQUIRE(scratch.count_entries() == 0);
    }

    SECTION("StreamedBodyOverCeiling") {
        AudioSource src = RemoteSource{.url = origin.url("/chunked"), .max_bytes = 128 * 1024, .resources = &rm};
        auto res = fetch(src);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::TooLarge);

        auto staged = std::get<RemoteSource>(src).downloaded;
        REQUIRE((!fs::exists(staged) || fs::file_size(staged) <= 128 * 1024));
        cleanup(src);
        REQUIRE(scratch.count_entries() == 0);
    }

    SECTION("HttpErrorStatus") {
        AudioSource src = RemoteSource{.url = origin.url("/missing.wav"), .max_bytes = 1024, .resources = &rm};
        auto res = fetch(src);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::FetchError);
        REQUIRE(res.error().message.starts_with("Error downloading file: "));
        cleanup(src);
        REQUIRE(scratch.count_entries() == 0);
    }

    SECTION("FileSchemeRejected") {
        auto secret = dir.file("secret.wav");
        test::write_file(secret, "RIFF-secret");
        AudioSource src = RemoteSource{.url = "file://" + secret, .max_bytes = 1024, .resources = &rm};
        auto res = fetch(src);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::FetchError);
        cleanup(src);
        REQUIRE(scratch.count_entries() == 0);
    }

    SECTION("RedirectToFileSchemeRejected") {
        auto secret = dir.file("secret.wav");
        test::write_file(secret, "RIFF-secret");
        origin.redirect_target = "file://" + secret;
        AudioSource src = RemoteSource{.url = origin.url("/redirect"), .max_bytes = 1024, .resources = &rm};
        auto res = fetch(src);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::FetchError);
        cleanup(src);
        REQUIRE(scratch.count_entries() == 0);
    }

    SECTION("SchemeIsCaseInsensitive") {
        auto url = origin.url("/clip.wav");
        url.replace(0, 4, "HTTP");
        AudioSource src = RemoteSource{.url = url, .max_bytes = 1024, .resources = &rm};
        auto res = fetch(src);
        REQUIRE(res.has_value());
        res->stream.reset();
        cleanup(src);
    }

    SECTION("EmptyUrl") {
        AudioSource src = RemoteSource{.url = "", .max_bytes = 1024, .resources = &rm};
        auto res = fetch(src);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::BadRequest);
    }
}
