#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"
#include "validation/file_validator.hpp"

#include <filesystem>
#include <sstream>
#include <string>

namespace fs = std::filesystem;

namespace {

ValidationPolicy default_policy() {
    return ValidationPolicy{
        .max_file_size_mb = 1,
        .allowed_extensions = {".wav", ".mp3", ".ogg", ".flac", ".m4a"},
        .allowed_mime_types = {"audio/wav", "audio/x-wav", "audio/mpeg", "audio/ogg", "audio/flac"},
    };
}

MimeSniffer fixed_sniffer(std::string mime, int* calls = nullptr) {
    return [mime, calls](std::string_view) -> std::expected<std::string, std::string> {
        if (calls) (*calls)++;
        return mime;
    };
}

std::string wav_bytes() {
    auto bytes = test::sine_wav(16000, 0.1);
    return {bytes.begin(), bytes.end()};
}

} // namespace

TEST_CASE("FileValidator", "[validator]") {

    SECTION("AcceptsAllowedFile") {
        FileValidator v(default_policy(), fixed_sniffer("audio/x-wav"));
        std::istringstream in(wav_bytes());
        REQUIRE(v.validate(in, "clip.wav").has_value());
    }

    SECTION("ExtensionIsCaseInsensitive") {
        FileValidator v(default_policy(), fixed_sniffer("audio/mpeg"));
        std::istringstream in("ID3");
        REQUIRE(v.validate(in, "SONG.MP3").has_value());
    }

    SECTION("SizeCheckedFirst") {
        int calls = 0;
        FileValidator v(default_policy(), fixed_sniffer("text/plain", &calls));
        std::istringstream in(std::string(2 * 1024 * 1024, 'x'));
        auto res = v.validate(in, "notes.txt");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::TooLarge);
        REQUIRE(calls == 0);
    }

    SECTION("RejectsExtension") {
        int calls = 0;
        FileValidator v(default_policy(), fixed_sniffer("audio/x-wav", &calls));
        std::istringstream in(wav_bytes());
        auto res = v.validate(in, "clip.exe");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::UnsupportedExtension);
        REQUIRE(calls == 0);
    }

    SECTION("RejectsContentType") {
        FileValidator v(default_policy(), fixed_sniffer("application/x-dosexec"));
        std::istringstream in("MZ....");
        auto res = v.validate(in, "clip.wav");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::UnsupportedContentType);
        REQUIRE(res.error().message.find("application/x-dosexec") != std::string::npos);
    }

    SECTION("UndeterminedTypeIsAccepted") {
        FileValidator v(default_policy(), [](std::string_view) -> std::expected<std::string, std::string> {
            return std::unexpected("no magic database");
        });
        std::istringstream in("whatever");
        REQUIRE(v.validate(in, "clip.wav").has_value());
    }

    SECTION("SniffSeesFirstKilobyteAndRestoresPosition") {
        size_t seen = 0;
        FileValidator v(default_policy(), [&seen](std::string_view head) -> std::expected<std::string, std::string> {
            seen = head.size();
            return "audio/x-wav";
        });
        std::istringstream in(std::string(5000, 'a'));
        REQUIRE(v.validate(in, "clip.wav").has_value());
        REQUIRE(seen == 1024);
        REQUIRE(in.tellg() == 0);
    }

    SECTION("LibmagicRecognizesWav") {
        FileValidator v(default_policy());
        std::istringstream in(wav_bytes());
        REQUIRE(v.validate(in, "clip.wav").has_value());
    }

    SECTION("LibmagicRejectsText") {
        FileValidator v(default_policy());
        std::istringstream in("just some plain text, definitely not audio\n");
        auto res = v.validate(in, "clip.wav");
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::UnsupportedContentType);
    }
}

TEST_CASE("validate_local_file_path", "[validator]") {
    test::TmpDir root("tg_test_roots");
    fs::create_directories(root.path / "sub");
    auto canonical_root = fs::canonical(root.path);

    SECTION("RelativeFileResolvesUnderRoot") {
        auto res = validate_local_file_path("clip.wav", {root.path.string()});
        REQUIRE(res.has_value());
        REQUIRE(*res == (canonical_root / "clip.wav").string());
    }

    SECTION("NestedPath") {
        auto res = validate_local_file_path("sub/../sub/a.wav", {root.path.string()});
        REQUIRE(res.has_value());
        REQUIRE(*res == (canonical_root / "sub" / "a.wav").string());
    }

    SECTION("TraversalRejected") {
        auto res = validate_local_file_path("../../etc/passwd", {root.path.string()});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::PathTraversal);
    }

    SECTION("AbsolutePathOutsideRootRejected") {
        auto res = validate_local_file_path("/etc/passwd", {root.path.string()});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::PathTraversal);
    }

    SECTION("AbsolutePathInsideRootAccepted") {
        auto inside = (canonical_root / "sub" / "b.wav").string();
        auto res = validate_local_file_path(inside, {root.path.string()});
        REQUIRE(res.has_value());
        REQUIRE(*res == inside);
    }

    SECTION("SiblingWithSharedPrefixRejected") {
        auto sibling = canonical_root.string() + "-evil/clip.wav";
        auto res = validate_local_file_path(sibling, {root.path.string()});
        REQUIRE_FALSE(res.has_value());
    }

    SECTION("SymlinkEscapeRejected") {
        fs::create_directory_symlink("/etc", root.path / "link");
        auto res = validate_local_file_path("link/passwd", {root.path.string()});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::PathTraversal);
    }

    SECTION("AbsolutePathInSecondRoot") {
        test::TmpDir other("tg_test_roots2");
        auto inside = (fs::canonical(other.path) / "x.wav").string();
        auto res = validate_local_file_path(inside, {root.path.string(), other.path.string()});
        REQUIRE(res.has_value());
        REQUIRE(*res == inside);
    }

    SECTION("EmptyRootsFailClosed") {
        auto res = validate_local_file_path("clip.wav", {});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error().kind == ErrorKind::PathTraversal);
    }
}
