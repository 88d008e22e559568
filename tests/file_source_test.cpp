#define BOOST_TEST_MODULE file_source

#include <boost/test/unit_test.hpp>

#include "file_source.hpp"
#include "test_helpers.hpp"

#include <fstream>
#include <stdexcept>

using namespace chunkflow::engine;
using chunkflow::testing::bytes_of;
using chunkflow::testing::TempDir;

namespace {

std::filesystem::path write_text(const TempDir& dir, const std::string& name, const std::string& text) {
    const auto path = dir.path() / name;
    std::ofstream out(path, std::ios::binary);
    out << text;
    return path;
}

}  // namespace

BOOST_AUTO_TEST_CASE(test_reads_ranges) {
    TempDir dir;
    const LocalFileSource source(write_text(dir, "data.bin", "0123456789"));
    BOOST_REQUIRE_EQUAL(source.size(), 10u);
    BOOST_REQUIRE(source.read(0, 4) == bytes_of("0123"));
    BOOST_REQUIRE(source.read(6, 4) == bytes_of("6789"));
}

BOOST_AUTO_TEST_CASE(test_read_past_end_is_truncated) {
    TempDir dir;
    const LocalFileSource source(write_text(dir, "data.bin", "0123456789"));
    BOOST_REQUIRE(source.read(8, 16) == bytes_of("89"));
    BOOST_REQUIRE(source.read(10, 4).empty());
}

BOOST_AUTO_TEST_CASE(test_missing_file_is_rejected) {
    TempDir dir;
    BOOST_REQUIRE_THROW(LocalFileSource(dir.path() / "absent.bin"), std::runtime_error);
    BOOST_REQUIRE_THROW(LocalFileSource(dir.path()), std::runtime_error);
}
