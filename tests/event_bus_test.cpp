#define BOOST_TEST_MODULE event_bus

#include <boost/test/unit_test.hpp>

#include "event_bus.hpp"
#include "logger.hpp"
#include "test_helpers.hpp"

#include <stdexcept>

using namespace chunkflow::engine;
using chunkflow::testing::EventRecorder;

namespace {

UploadEvent progress_event(const std::string& session_id, std::uint64_t uploaded) {
    UploadEvent event;
    event.type = UploadEventType::kSessionProgress;
    event.session_id = session_id;
    ChunkedUploadProgress progress;
    progress.session_id = session_id;
    progress.uploaded_bytes = uploaded;
    event.payload = progress;
    return event;
}

struct BusFixture {
    Logger logger{"", LogLevel::kError, false};
    EventBus bus{logger};
};

}  // namespace

BOOST_AUTO_TEST_CASE(test_event_names) {
    BOOST_REQUIRE_EQUAL(std::string(event_name(UploadEventType::kSessionCreated)), "session:created");
    BOOST_REQUIRE_EQUAL(std::string(event_name(UploadEventType::kSessionProgress)), "session:progress");
    BOOST_REQUIRE_EQUAL(std::string(event_name(UploadEventType::kChunkStarted)), "chunk:upload:start");
    BOOST_REQUIRE_EQUAL(std::string(event_name(UploadEventType::kChunkRetry)), "chunk:upload:retry");
    BOOST_REQUIRE_EQUAL(std::string(event_name(UploadEventType::kQueueStats)), "queue:stats");
    BOOST_REQUIRE_EQUAL(std::string(event_name(UploadEventType::kUploadOrphaned)), "upload:orphaned");
}

BOOST_FIXTURE_TEST_CASE(test_fifo_delivery_per_subscriber, BusFixture) {
    EventRecorder recorder(bus);
    bus.start();
    for (std::uint64_t i = 0; i < 200; ++i) {
        bus.publish(progress_event("s1", i));
    }
    bus.flush();
    const auto events = recorder.events();
    BOOST_REQUIRE_EQUAL(events.size(), 200u);
    for (std::uint64_t i = 0; i < events.size(); ++i) {
        BOOST_REQUIRE_EQUAL(std::get<ChunkedUploadProgress>(events[i].payload).uploaded_bytes, i);
    }
    bus.stop();
}

BOOST_FIXTURE_TEST_CASE(test_session_filter_and_unsubscribe, BusFixture) {
    std::vector<std::string> seen;
    const auto id = bus.subscribe([&](const UploadEvent& event) { seen.push_back(event.session_id); }, "s2");
    bus.publish(progress_event("s1", 1));
    bus.publish(progress_event("s2", 1));
    bus.flush();
    BOOST_REQUIRE_EQUAL(seen.size(), 1u);
    BOOST_REQUIRE_EQUAL(seen[0], "s2");

    bus.unsubscribe(id);
    bus.publish(progress_event("s2", 2));
    bus.flush();
    BOOST_REQUIRE_EQUAL(seen.size(), 1u);
}

BOOST_FIXTURE_TEST_CASE(test_failing_handler_does_not_block_others, BusFixture) {
    bus.subscribe([](const UploadEvent&) { throw std::runtime_error("handler broke"); });
    EventRecorder recorder(bus);
    bus.start();
    bus.publish(progress_event("s1", 1));
    bus.publish(progress_event("s1", 2));
    bus.flush();
    BOOST_REQUIRE_EQUAL(recorder.events().size(), 2u);
}

BOOST_FIXTURE_TEST_CASE(test_stop_delivers_pending_events, BusFixture) {
    EventRecorder recorder(bus);
    bus.start();
    for (int i = 0; i < 50; ++i) {
        bus.publish(progress_event("s1", i));
    }
    bus.stop();
    BOOST_REQUIRE_EQUAL(recorder.events().size(), 50u);
}
