#include <doctest/doctest.h>
#include <confine/ambient.hpp>
#include <confine/validator.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/ostream_sink.h>

#include <algorithm>
#include <cstdlib>
#include <memory>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace confine;

namespace {

ValidatorOptions lexical() {
    ValidatorOptions options;
    options.symlinks = SymlinkPolicy::Lexical;
    return options;
}

PathValidator make_validator(const std::string& base, const ValidatorOptions& options = lexical()) {
    auto created = PathValidator::create(base, options);
    REQUIRE(created.ok);
    return *created.validator;
}

Bytes bytes_of(const std::string& s) {
    return Bytes(s.begin(), s.end());
}

std::string appending_decode(const Bytes& bytes, Encoding encoding) {
    return codec::decode(bytes, encoding) + "/../../etc/passwd";
}

Bytes redirecting_construct(const ByteSource&, Encoding encoding) {
    return codec::encode("/etc/passwd", encoding);
}

struct AmbientDecodeGuard {
    ~AmbientDecodeGuard() { ambient_codecs().set_decode(&codec::decode); }
};

// Helper to create temporary test directory
class TempTestDir {
public:
    TempTestDir() {
        std::string temp_base = std::filesystem::temp_directory_path().string();
        std::srand(static_cast<unsigned>(std::time(nullptr)));
        std::string unique_name = "confine_test_" + std::to_string(std::time(nullptr)) + "_" +
                                  std::to_string(std::rand());
        path = temp_base + "/" + unique_name;
        std::filesystem::create_directories(path);
        path = std::filesystem::canonical(path).generic_string();
    }

    ~TempTestDir() {
        if (!path.empty()) {
            std::error_code ec;
            std::filesystem::remove_all(path, ec);
        }
    }

    std::string path;
};

} // namespace

// ============================================================================
// Construction
// ============================================================================

TEST_CASE("base directory is canonicalized at construction") {
    CHECK(make_validator("/srv/data").base_directory() == "/srv/data");
    CHECK(make_validator("/srv/data/").base_directory() == "/srv/data");
    CHECK(make_validator("/srv//data/./x/..").base_directory() == "/srv/data");
    CHECK(make_validator("/").base_directory() == "/");
}

TEST_CASE("relative base directory is made absolute") {
    auto v = make_validator("relative/dir");
    auto expected = (std::filesystem::current_path() / "relative/dir").lexically_normal();
    CHECK(v.base_directory() == expected.generic_string());
}

TEST_CASE("invalid base directory is rejected") {
    SUBCASE("empty") {
        auto created = PathValidator::create("", lexical());
        CHECK_FALSE(created.ok);
        CHECK_FALSE(created.validator.has_value());
        CHECK(created.error == ValidationError::InvalidBaseDirectory);
    }
    SUBCASE("embedded NUL") {
        auto created = PathValidator::create(std::string("/srv\0data", 9), lexical());
        CHECK_FALSE(created.ok);
        CHECK(created.error == ValidationError::InvalidBaseDirectory);
    }
}

TEST_CASE("validator uses the process-wide snapshot by default") {
    auto v = make_validator("/srv/data");
    REQUIRE(trusted_primitives() != nullptr);
    CHECK(v.snapshot().bindings().decode == trusted_primitives()->bindings().decode);
}

// ============================================================================
// Confinement
// ============================================================================

TEST_CASE("path inside base is accepted") {
    auto v = make_validator("/srv/data");
    auto r = v.validate(std::string("reports/q1.csv"));
    REQUIRE(r.ok);
    CHECK(r.path == "/srv/data/reports/q1.csv");
    CHECK(r.error == ValidationError::None);
}

TEST_CASE("traversal out of base is rejected") {
    auto v = make_validator("/srv/data");

    SUBCASE("through a subdirectory") {
        auto r = v.validate(std::string("reports/../../etc/passwd"));
        CHECK_FALSE(r.ok);
        CHECK(r.error == ValidationError::PathTraversal);
        CHECK(r.path.empty());
    }
    SUBCASE("direct") {
        auto r = v.validate(std::string("../../etc/passwd"));
        CHECK(r.error == ValidationError::PathTraversal);
    }
    SUBCASE("deeply nested") {
        auto r = v.validate(std::string("a/b/c/../../../../../../../etc"));
        CHECK(r.error == ValidationError::PathTraversal);
    }
    SUBCASE("absolute path elsewhere") {
        auto r = v.validate(std::string("/etc/passwd"));
        CHECK(r.error == ValidationError::PathTraversal);
    }
    SUBCASE("parent of base") {
        auto r = v.validate(std::string(".."));
        CHECK(r.error == ValidationError::PathTraversal);
    }
}

TEST_CASE("sibling sharing the base as prefix is rejected") {
    CHECK_FALSE(is_within_base("/allowed-evil", "/allowed"));
    CHECK_FALSE(is_within_base("/allowed-evil/x", "/allowed"));
    CHECK(is_within_base("/allowed/x", "/allowed"));
    CHECK(is_within_base("/allowed", "/allowed"));
    CHECK_FALSE(is_within_base("/allowed/", "/allowed/x"));

    auto v = make_validator("/allowed");
    auto r = v.validate(std::string("../allowed-evil/secret"));
    CHECK(r.error == ValidationError::PathTraversal);
    auto abs = v.validate(std::string("/allowed-evil"));
    CHECK(abs.error == ValidationError::PathTraversal);
}

TEST_CASE("base itself is returned exactly") {
    auto v = make_validator("/srv/data");
    for (const char* candidate : {"", ".", "/srv/data", "/srv/data/", "reports/..", "./"}) {
        auto r = v.validate(std::string(candidate));
        REQUIRE(r.ok);
        CHECK(r.path == "/srv/data");
    }
}

TEST_CASE("absolute path inside base is accepted") {
    auto v = make_validator("/srv/data");
    auto r = v.validate(std::string("/srv/data/reports/../logs//today.log"));
    REQUIRE(r.ok);
    CHECK(r.path == "/srv/data/logs/today.log");
}

TEST_CASE("root base accepts any absolute path") {
    auto v = make_validator("/");
    auto r = v.validate(std::string("etc/passwd"));
    REQUIRE(r.ok);
    CHECK(r.path == "/etc/passwd");
    CHECK(is_within_base("/etc", "/"));
}

TEST_CASE("validation is idempotent") {
    auto v = make_validator("/srv/data");
    for (const char* candidate : {"reports/q1.csv", "../escape", "a/./b//c"}) {
        auto first = v.validate(std::string(candidate));
        auto second = v.validate(std::string(candidate));
        CHECK(first.ok == second.ok);
        CHECK(first.path == second.path);
        CHECK(first.error == second.error);
    }
}

TEST_CASE("re-validating a result returns it unchanged") {
    auto v = make_validator("/srv/data");
    for (const char* candidate : {"reports/q1.csv", "x/../y", "", "deep/er/path/"}) {
        auto first = v.validate(std::string(candidate));
        REQUIRE(first.ok);
        auto again = v.validate(first.path);
        REQUIRE(again.ok);
        CHECK(again.path == first.path);
    }
}

// ============================================================================
// Input kinds
// ============================================================================

TEST_CASE("byte candidates are decoded") {
    auto v = make_validator("/srv/data");

    SUBCASE("utf8 bytes") {
        auto r = v.validate(bytes_of("reports/q1.csv"));
        REQUIRE(r.ok);
        CHECK(r.path == "/srv/data/reports/q1.csv");
    }
    SUBCASE("traversal in bytes") {
        auto r = v.validate(bytes_of("../../etc/passwd"));
        CHECK(r.error == ValidationError::PathTraversal);
    }
    SUBCASE("invalid utf8 bytes decode with replacement characters") {
        // An overlong '/' must not act as a separator
        auto r = v.validate(Bytes{'.', '.', 0xC0, 0xAF, 'e', 't', 'c'});
        REQUIRE(r.ok);
        CHECK(r.path == "/srv/data/..\xEF\xBF\xBD\xEF\xBF\xBD" "etc");
    }
}

TEST_CASE("byte candidates use the configured encoding") {
    ValidatorOptions options = lexical();
    options.encoding = Encoding::Latin1;
    auto v = make_validator("/srv/data", options);
    auto r = v.validate(Bytes{'c', 'a', 'f', 0xE9});
    REQUIRE(r.ok);
    CHECK(r.path == "/srv/data/caf\xC3\xA9");
}

TEST_CASE("value that is neither text nor bytes is rejected") {
    auto v = make_validator("/srv/data");
    auto r = v.validate(Candidate{});
    CHECK_FALSE(r.ok);
    CHECK(r.error == ValidationError::InvalidInputType);
}

TEST_CASE("text that is not UTF-8 is rejected") {
    auto v = make_validator("/srv/data");
    auto r = v.validate(std::string("reports/\xFF"));
    CHECK(r.error == ValidationError::InvalidInputType);
}

TEST_CASE("NUL in text or bytes is rejected") {
    auto v = make_validator("/srv/data");
    auto text = v.validate(std::string("bin/\0app", 8));
    CHECK(text.error == ValidationError::ContainsNul);
    auto bytes = v.validate(Bytes{'a', 0x00, 'b'});
    CHECK(bytes.error == ValidationError::ContainsNul);
}

TEST_CASE("control characters in a candidate are escaped in messages and logs") {
    auto v = make_validator("/srv/data");

    std::ostringstream captured;
    auto previous = spdlog::default_logger();
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(captured);
    auto logger = std::make_shared<spdlog::logger>("validator_capture", sink);
    logger->set_pattern("%v");
    spdlog::set_default_logger(logger);

    auto r = v.validate(std::string("../evil\n[warning] forged entry"));
    spdlog::set_default_logger(previous);
    spdlog::drop("validator_capture");

    CHECK(r.error == ValidationError::PathTraversal);
    CHECK(r.message.find('\n') == std::string::npos);
    CHECK(r.message.find("\\n") != std::string::npos);

    // One log line for one rejection
    std::string out = captured.str();
    REQUIRE_FALSE(out.empty());
    CHECK(std::count(out.begin(), out.end(), '\n') == 1);
    CHECK(out.find("\\n[warning] forged entry") != std::string::npos);
}

TEST_CASE("error kinds have stable names") {
    CHECK(std::string(to_string(ValidationError::PathTraversal)) == "path_traversal");
    CHECK(std::string(to_string(ValidationError::IntegrityViolation)) == "integrity_violation");
    CHECK(std::string(to_string(ValidationError::InvalidInputType)) == "invalid_input_type");
    CHECK(std::string(to_string(ValidationError::InvalidBaseDirectory)) == "invalid_base_directory");
}

// ============================================================================
// Tamper resistance
// ============================================================================

TEST_CASE("ambient decode override after capture does not reach the validator") {
    auto before = make_validator("/srv/data");

    AmbientDecodeGuard guard;
    REQUIRE(ambient_codecs().set_decode(&appending_decode));
    REQUIRE(ambient_codecs().decode(bytes_of("reports/q1.csv"), Encoding::Utf8) ==
            "reports/q1.csv/../../etc/passwd");

    // Created before and after the override, both use the captured decode.
    auto after = make_validator("/srv/data");
    for (const PathValidator* v : {&before, &after}) {
        auto r = v->validate(bytes_of("reports/q1.csv"));
        REQUIRE(r.ok);
        CHECK(r.path == "/srv/data/reports/q1.csv");
    }
}

TEST_CASE("tampered decode in the snapshot is an integrity violation") {
    auto bindings = builtin_bindings();
    bindings.decode = &appending_decode;
    auto snapshot = PrimitiveSnapshot::from(bindings);
    REQUIRE(snapshot.has_value());

    auto created = PathValidator::create("/srv/data", lexical(), *snapshot);
    REQUIRE(created.ok);

    auto text = created.validator->validate(std::string("reports/q1.csv"));
    CHECK_FALSE(text.ok);
    CHECK(text.error == ValidationError::IntegrityViolation);
    CHECK(text.path.empty());

    auto bytes = created.validator->validate(bytes_of("reports/q1.csv"));
    CHECK(bytes.error == ValidationError::IntegrityViolation);
}

TEST_CASE("tampered construct in the snapshot is an integrity violation") {
    auto bindings = builtin_bindings();
    bindings.construct = &redirecting_construct;
    auto snapshot = PrimitiveSnapshot::from(bindings);
    REQUIRE(snapshot.has_value());

    auto created = PathValidator::create("/srv/data", lexical(), *snapshot);
    REQUIRE(created.ok);
    auto r = created.validator->validate(std::string("reports/q1.csv"));
    CHECK(r.error == ValidationError::IntegrityViolation);
}

TEST_CASE("traversal is reported before the round trip") {
    auto bindings = builtin_bindings();
    bindings.construct = &redirecting_construct;
    auto snapshot = PrimitiveSnapshot::from(bindings);
    REQUIRE(snapshot.has_value());

    auto created = PathValidator::create("/srv/data", lexical(), *snapshot);
    REQUIRE(created.ok);
    auto r = created.validator->validate(std::string("../../etc/passwd"));
    CHECK(r.error == ValidationError::PathTraversal);
}

// ============================================================================
// Symlinks
// ============================================================================

TEST_CASE("symlink escaping the base is rejected when resolving") {
    TempTestDir temp_dir;
    std::string base = temp_dir.path + "/base";
    std::string outside = temp_dir.path + "/outside";
    std::filesystem::create_directories(base + "/docs");
    std::filesystem::create_directories(outside);
    std::ofstream(outside + "/secret") << "secret";
    std::filesystem::create_directory_symlink(outside, base + "/link");

    SUBCASE("resolve") {
        auto v = make_validator(base, ValidatorOptions{});
        auto escaped = v.validate(std::string("link/secret"));
        CHECK(escaped.error == ValidationError::PathTraversal);

        auto inside = v.validate(std::string("docs/readme.txt"));
        REQUIRE(inside.ok);
        CHECK(inside.path == base + "/docs/readme.txt");
    }

    SUBCASE("lexical") {
        auto v = make_validator(base, lexical());
        auto r = v.validate(std::string("link/secret"));
        REQUIRE(r.ok);
        CHECK(r.path == base + "/link/secret");
    }
}

TEST_CASE("symlink staying inside the base is resolved") {
    TempTestDir temp_dir;
    std::string base = temp_dir.path + "/base";
    std::filesystem::create_directories(base + "/real");
    std::filesystem::create_directory_symlink(base + "/real", base + "/alias");

    auto v = make_validator(base, ValidatorOptions{});
    auto r = v.validate(std::string("alias/file"));
    REQUIRE(r.ok);
    CHECK(r.path == base + "/real/file");
}

TEST_CASE("symlinked base directory is resolved at construction") {
    TempTestDir temp_dir;
    std::string real = temp_dir.path + "/real";
    std::filesystem::create_directories(real);
    std::filesystem::create_directory_symlink(real, temp_dir.path + "/alias");

    auto v = make_validator(temp_dir.path + "/alias", ValidatorOptions{});
    CHECK(v.base_directory() == real);
    auto r = v.validate(std::string("x"));
    REQUIRE(r.ok);
    CHECK(r.path == real + "/x");
}

// ============================================================================
// Concurrency
// ============================================================================

TEST_CASE("concurrent validation gives consistent results") {
    auto v = make_validator("/srv/data");
    std::vector<int> failures(8, 0);
    std::vector<std::thread> threads;
    for (size_t t = 0; t < failures.size(); ++t) {
        threads.emplace_back([&v, &failures, t]() {
            for (int i = 0; i < 200; ++i) {
                auto ok = v.validate(std::string("reports/q1.csv"));
                auto bad = v.validate(bytes_of("../../etc/passwd"));
                if (!ok.ok || ok.path != "/srv/data/reports/q1.csv" ||
                    bad.error != ValidationError::PathTraversal) {
                    ++failures[t];
                }
            }
        });
    }
    for (auto& th : threads) th.join();
    for (int f : failures) CHECK(f == 0);
}
