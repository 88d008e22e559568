#define BOOST_TEST_MODULE local_storage_backend

#include <boost/test/unit_test.hpp>

#include "checksum.hpp"
#include "local_storage_backend.hpp"
#include "logger.hpp"
#include "test_helpers.hpp"

#include <fstream>
#include <iterator>

using namespace chunkflow::engine;
using namespace std::chrono_literals;
using chunkflow::testing::bytes_of;
using chunkflow::testing::TempDir;

namespace {

struct BackendFixture {
    TempDir dir;
    Logger logger{"", LogLevel::kError, false};
    LocalStorageBackend backend{dir.path() / "store", "https://cdn.example.com/", logger};
};

std::string read_text(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

bool has_code(UploadErrorCode code, const UploadError& e) {
    return e.code() == code;
}

}  // namespace

BOOST_FIXTURE_TEST_CASE(test_parts_assemble_in_index_order, BackendFixture) {
    const auto upload_id = backend.initiate("alice/document/s1/notes.txt", "text/plain", {{"k", "v"}});
    BOOST_REQUIRE(backend.upload_exists(upload_id));

    const auto part2 = bytes_of("gamma");
    const auto part0 = bytes_of("alpha-");
    const auto part1 = bytes_of("beta-");
    const auto ack2 = backend.upload_part(upload_id, 2, part2, ChecksumComputer::compute(part2), 1s);
    const auto ack0 = backend.upload_part(upload_id, 0, part0, ChecksumComputer::compute(part0), 1s);
    const auto ack1 = backend.upload_part(upload_id, 1, part1, "", 1s);

    BOOST_REQUIRE_EQUAL(ack0.etag, "\"" + ChecksumComputer::md5(part0) + "\"");
    BOOST_REQUIRE_EQUAL(ack1.checksum, ChecksumComputer::compute(part1));

    const auto result = backend.complete_multipart(upload_id, {{0, ack0.etag}, {1, ack1.etag}, {2, ack2.etag}});
    const auto object = backend.object_path("alice/document/s1/notes.txt");
    BOOST_REQUIRE_EQUAL(read_text(object), "alpha-beta-gamma");
    BOOST_REQUIRE_EQUAL(result.url, "file://" + object.string());
    BOOST_REQUIRE(result.public_url);
    BOOST_REQUIRE_EQUAL(*result.public_url, "https://cdn.example.com/alice/document/s1/notes.txt");
    BOOST_REQUIRE(!backend.upload_exists(upload_id));
}

BOOST_FIXTURE_TEST_CASE(test_checksum_mismatch_is_rejected, BackendFixture) {
    const auto upload_id = backend.initiate("k/file.bin", "application/pdf", {});
    const auto data = bytes_of("payload");
    BOOST_REQUIRE_EXCEPTION(backend.upload_part(upload_id, 0, data, ChecksumComputer::compute(bytes_of("other")), 1s),
                            UploadError,
                            [](const UploadError& e) { return has_code(UploadErrorCode::kChecksumMismatch, e); });
}

BOOST_FIXTURE_TEST_CASE(test_completion_validates_parts, BackendFixture) {
    const auto upload_id = backend.initiate("k/file.bin", "application/pdf", {});
    const auto data = bytes_of("payload");
    const auto ack = backend.upload_part(upload_id, 0, data, "", 1s);
    const auto ack1 = backend.upload_part(upload_id, 1, data, "", 1s);

    BOOST_REQUIRE_EXCEPTION(backend.complete_multipart(upload_id, {{1, ack1.etag}, {0, ack.etag}}), UploadError,
                            [](const UploadError& e) { return has_code(UploadErrorCode::kValidationError, e); });
    BOOST_REQUIRE_EXCEPTION(backend.complete_multipart(upload_id, {{0, "\"bogus\""}}), UploadError,
                            [](const UploadError& e) { return has_code(UploadErrorCode::kServerError, e); });
    BOOST_REQUIRE_EXCEPTION(backend.complete_multipart(upload_id, {{0, ack.etag}, {5, ack.etag}}), UploadError,
                            [](const UploadError& e) { return has_code(UploadErrorCode::kServerError, e); });
    BOOST_REQUIRE(backend.upload_exists(upload_id));
}

BOOST_FIXTURE_TEST_CASE(test_abort_removes_staging, BackendFixture) {
    const auto upload_id = backend.initiate("k/file.bin", "application/pdf", {});
    backend.upload_part(upload_id, 0, bytes_of("x"), "", 1s);
    backend.abort_multipart(upload_id);
    BOOST_REQUIRE(!backend.upload_exists(upload_id));
    BOOST_REQUIRE_EXCEPTION(backend.abort_multipart(upload_id), UploadError,
                            [](const UploadError& e) { return has_code(UploadErrorCode::kServerError, e); });
    BOOST_REQUIRE_EXCEPTION(backend.upload_part(upload_id, 0, bytes_of("x"), "", 1s), UploadError,
                            [](const UploadError& e) { return has_code(UploadErrorCode::kServerError, e); });
}

BOOST_FIXTURE_TEST_CASE(test_rejects_path_traversal, BackendFixture) {
    BOOST_REQUIRE_EXCEPTION(backend.initiate("../../etc/passwd", "text/plain", {}), UploadError,
                            [](const UploadError& e) { return has_code(UploadErrorCode::kValidationError, e); });
    BOOST_REQUIRE_EXCEPTION(backend.abort_multipart("../escape"), UploadError,
                            [](const UploadError& e) { return has_code(UploadErrorCode::kServerError, e); });
}
