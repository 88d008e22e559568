#define BOOST_TEST_MODULE session_janitor

#include <boost/test/unit_test.hpp>

#include "event_bus.hpp"
#include "logger.hpp"
#include "session_janitor.hpp"
#include "session_store.hpp"
#include "task_executor.hpp"
#include "test_helpers.hpp"
#include "upload_orchestrator.hpp"

#include <stdexcept>

using namespace chunkflow::engine;
using namespace chunkflow::testing;
using namespace std::chrono_literals;

namespace {

struct JanitorFixture {
    TempDir dir;
    EngineConfig config;
    Logger logger{"", LogLevel::kError, false};
    ManualClock clock;
    std::unique_ptr<SessionStore> store;
    FakeStorageBackend backend;
    TaskExecutor executor{2, &logger};
    EventBus events{logger};
    std::unique_ptr<UploadOrchestrator> orchestrator;

    JanitorFixture() {
        config.database_file = (dir.path() / "janitor.db").string();
        config.retry.base_delay = 1ms;
        config.retry.max_delay = 1ms;
        config.session_expiry = std::chrono::hours(1);
        store = std::make_unique<SessionStore>(config.database_file);
        store->initialize_schema();
        orchestrator = std::make_unique<UploadOrchestrator>(config, *store, backend, executor, events, clock, logger);
    }

    ~JanitorFixture() { orchestrator.reset(); }

    // Leaves a paused session behind by exhausting the only chunk's retries.
    std::string paused_session() {
        backend.fail_part(0, UploadErrorCode::kNetworkError, FakeStorageBackend::kAlways);
        UploadRequest req;
        req.source = MemoryFileSource::patterned(500);
        req.file_name = "notes.txt";
        req.mime_type = "text/plain";
        req.owner = "carol";
        const auto id = orchestrator->start_upload(std::move(req));
        BOOST_REQUIRE(orchestrator->wait(id, 10s));
        return id;
    }
};

}  // namespace

BOOST_AUTO_TEST_CASE(test_rejects_non_positive_interval) {
    TempDir dir;
    EngineConfig config;
    config.database_file = (dir.path() / "janitor.db").string();
    Logger logger{"", LogLevel::kError, false};
    ManualClock clock;
    SessionStore store{config.database_file};
    FakeStorageBackend backend;
    TaskExecutor executor{1, &logger};
    EventBus events{logger};
    UploadOrchestrator orchestrator{config, store, backend, executor, events, clock, logger};

    BOOST_REQUIRE_THROW(SessionJanitor(orchestrator, clock, logger, 0ms), std::invalid_argument);
}

BOOST_FIXTURE_TEST_CASE(test_sweep_once_removes_expired_sessions, JanitorFixture) {
    SessionJanitor janitor(*orchestrator, clock, logger, 1h);
    const auto id = paused_session();
    BOOST_REQUIRE(!janitor.last_sweep().has_value());

    BOOST_REQUIRE_EQUAL(janitor.sweep_once(), 0u);
    BOOST_REQUIRE(janitor.last_sweep() == clock.now());
    BOOST_REQUIRE(store->load(id).has_value());

    clock.advance(std::chrono::hours(2));
    BOOST_REQUIRE_EQUAL(janitor.sweep_once(), 1u);
    BOOST_REQUIRE(!store->load(id).has_value());
    BOOST_REQUIRE_EQUAL(backend.abort_calls(), 1);
    BOOST_REQUIRE(janitor.last_sweep() == clock.now());
}

BOOST_FIXTURE_TEST_CASE(test_periodic_sweep, JanitorFixture) {
    const auto id = paused_session();
    clock.advance(std::chrono::hours(2));

    SessionJanitor janitor(*orchestrator, clock, logger, 10ms);
    janitor.start();
    BOOST_REQUIRE(janitor.running());
    BOOST_REQUIRE(wait_until([&] { return !store->load(id).has_value(); }));
    BOOST_REQUIRE(janitor.last_sweep().has_value());

    janitor.stop();
    BOOST_REQUIRE(!janitor.running());
    janitor.stop();
}
