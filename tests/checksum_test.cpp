#define BOOST_TEST_MODULE checksum

#include <boost/test/unit_test.hpp>

#include "checksum.hpp"
#include "test_helpers.hpp"

using namespace chunkflow::engine;
using chunkflow::testing::bytes_of;

BOOST_AUTO_TEST_CASE(test_sha256_known_vectors) {
    BOOST_REQUIRE_EQUAL(ChecksumComputer::compute(bytes_of("abc")),
                        "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    BOOST_REQUIRE_EQUAL(ChecksumComputer::compute(bytes_of("")),
                        "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

BOOST_AUTO_TEST_CASE(test_md5_known_vector) {
    BOOST_REQUIRE_EQUAL(ChecksumComputer::md5(bytes_of("abc")), "900150983cd24fb0d6963f7d28e17f72");
}

BOOST_AUTO_TEST_CASE(test_matches_is_exact) {
    const auto data = bytes_of("chunk payload");
    const auto digest = ChecksumComputer::compute(data);
    BOOST_REQUIRE(ChecksumComputer::matches(data, digest));
    BOOST_REQUIRE(!ChecksumComputer::matches(bytes_of("chunk payloaD"), digest));
    BOOST_REQUIRE(!ChecksumComputer::matches(data, ""));
}

BOOST_AUTO_TEST_CASE(test_random_ids_are_hex_and_distinct) {
    const auto a = random_hex_id();
    const auto b = random_hex_id();
    BOOST_REQUIRE_EQUAL(a.size(), 32u);
    BOOST_REQUIRE_EQUAL(random_hex_id(4).size(), 8u);
    BOOST_REQUIRE(a.find_first_not_of("0123456789abcdef") == std::string::npos);
    BOOST_REQUIRE_NE(a, b);
}
