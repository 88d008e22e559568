#define BOOST_TEST_MODULE retry_strategy

#include <boost/test/unit_test.hpp>

#include "retry_strategy.hpp"

using namespace chunkflow::engine;
using namespace std::chrono_literals;

BOOST_AUTO_TEST_CASE(test_exponential_delays_are_capped) {
    ExponentialBackoffStrategy strategy(RetrySettings{});
    BOOST_REQUIRE(strategy.delay_before_retry(1) == 1000ms);
    BOOST_REQUIRE(strategy.delay_before_retry(2) == 2000ms);
    BOOST_REQUIRE(strategy.delay_before_retry(3) == 4000ms);
    BOOST_REQUIRE(strategy.delay_before_retry(4) == 8000ms);
    BOOST_REQUIRE(strategy.delay_before_retry(5) == 10000ms);
    BOOST_REQUIRE(strategy.delay_before_retry(30) == 10000ms);
}

BOOST_AUTO_TEST_CASE(test_retry_budget) {
    ExponentialBackoffStrategy strategy(RetrySettings{});
    BOOST_REQUIRE_EQUAL(strategy.max_retries(), 3u);
    BOOST_REQUIRE(strategy.should_retry(UploadErrorCode::kNetworkError, 0));
    BOOST_REQUIRE(strategy.should_retry(UploadErrorCode::kNetworkError, 2));
    BOOST_REQUIRE(!strategy.should_retry(UploadErrorCode::kNetworkError, 3));
}

BOOST_AUTO_TEST_CASE(test_only_transport_errors_retry) {
    ExponentialBackoffStrategy strategy(RetrySettings{});
    BOOST_REQUIRE(strategy.should_retry(UploadErrorCode::kServerError, 0));
    BOOST_REQUIRE(strategy.should_retry(UploadErrorCode::kChecksumMismatch, 0));
    BOOST_REQUIRE(!strategy.should_retry(UploadErrorCode::kAuthenticationError, 0));
    BOOST_REQUIRE(!strategy.should_retry(UploadErrorCode::kQuotaExceeded, 0));
    BOOST_REQUIRE(!strategy.should_retry(UploadErrorCode::kValidationError, 0));
    BOOST_REQUIRE(!strategy.should_retry(UploadErrorCode::kSessionExpired, 0));
}

BOOST_AUTO_TEST_CASE(test_custom_multiplier) {
    RetrySettings settings;
    settings.base_delay = 100ms;
    settings.max_delay = 250ms;
    settings.backoff_multiplier = 1.5;
    ExponentialBackoffStrategy strategy(settings);
    BOOST_REQUIRE(strategy.delay_before_retry(1) == 100ms);
    BOOST_REQUIRE(strategy.delay_before_retry(2) == 150ms);
    BOOST_REQUIRE(strategy.delay_before_retry(3) == 225ms);
    BOOST_REQUIRE(strategy.delay_before_retry(4) == 250ms);
}
