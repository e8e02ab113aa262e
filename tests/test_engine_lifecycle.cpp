#include <gtest/gtest.h>
#include "mock_backend.h"
#include "xLoad/constants.h"
#include "xLoad/delivery.h"
#include <chrono>
#include <sstream>
#include <thread>

using namespace xload;
using xload::test::MockBackend;
using xload::test::makePairs;

class EngineLifecycleTest : public ::testing::Test {
protected:
    void SetUp() override {
        mock_ = std::make_shared<MockBackend>();
        sink_ = std::make_shared<LogSink>(&log_, LogLevel::DEBUG);
        backend_ = std::make_unique<Backend>(mock_, sink_);
    }

    std::unique_ptr<OpenedEngine> open(const std::string& table, int32_t id) {
        std::unique_ptr<OpenedEngine> engine;
        Status status = backend_->openEngine(ctx_, table, id, engine);
        EXPECT_TRUE(status.ok()) << status.toString();
        return engine;
    }

    std::unique_ptr<ClosedEngine> closed(const std::string& table, int32_t id) {
        std::unique_ptr<ClosedEngine> engine;
        Status status = backend_->recovery().unsafeCloseEngine(ctx_, table, id, engine);
        EXPECT_TRUE(status.ok()) << status.toString();
        return engine;
    }

    Context ctx_;
    std::ostringstream log_;
    std::shared_ptr<LogSink> sink_;
    std::shared_ptr<MockBackend> mock_;
    std::unique_ptr<Backend> backend_;
};

// ============================================================================
// Normal sequence
// ============================================================================

TEST_F(EngineLifecycleTest, OpenWriteCloseImportCleanup) {
    auto opened = open("`db`.`t`", 1);
    ASSERT_NE(nullptr, opened);
    EXPECT_EQ("`db`.`t`", opened->tableName());

    auto rows = makePairs(4, 4, 6);
    ASSERT_TRUE(opened->writeRows(ctx_, {"a", "b"}, *rows).ok());

    std::unique_ptr<ClosedEngine> closed_engine;
    ASSERT_TRUE(opened->close(ctx_, closed_engine).ok());
    ASSERT_NE(nullptr, closed_engine);
    EXPECT_EQ(opened->uuid(), closed_engine->uuid());

    ASSERT_TRUE(closed_engine->import(ctx_).ok());
    ASSERT_TRUE(closed_engine->cleanup(ctx_).ok());

    EXPECT_EQ((std::vector<std::string>{"openEngine", "writeRows", "closeEngine",
                                        "importEngine", "cleanupEngine"}),
              mock_->calls());
    EXPECT_EQ(1, backend_->counters().opened());
    EXPECT_EQ(1, backend_->counters().closed());
    EXPECT_EQ(0, backend_->counters().unbalanced());

    std::string tag;
    EXPECT_EQ(makeEngineUUID("`db`.`t`", 1, tag), mock_->engineArgs("openEngine")[0]);
}

TEST_F(EngineLifecycleTest, CommitTimestampFixedAtOpen) {
    int64_t before_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    auto opened = open("t", 1);
    ASSERT_NE(nullptr, opened);

    // Whole seconds, zero logical part
    uint64_t ts = opened->commitTS();
    EXPECT_EQ(0u, ts & ((1u << kLogicalBits) - 1));
    EXPECT_EQ(0, extractPhysical(ts) % 1000);
    EXPECT_LE(extractPhysical(ts), before_ms + 1000);
    EXPECT_GE(extractPhysical(ts), before_ms - 1000);

    auto rows = makePairs(2, 4, 4);
    ASSERT_TRUE(opened->writeRows(ctx_, {}, *rows).ok());
    ASSERT_TRUE(opened->writeRows(ctx_, {}, *rows).ok());
    EXPECT_EQ(ts, mock_->lastCommitTS());
}

TEST_F(EngineLifecycleTest, OpenLogsEngineFields) {
    auto opened = open("tbl", 1);
    ASSERT_NE(nullptr, opened);
    EXPECT_NE(std::string::npos,
              log_.str().find("[Engine] INFO open engine engineTag=tbl:1 "
                              "engineUUID=130cb92c-81e1-50a8-9491-189ba9e51289"));
}

TEST_F(EngineLifecycleTest, OpenFailureIsNotCounted) {
    mock_->failNext("openEngine", Status(ErrorCode::ERR_UNAVAILABLE, "down"));
    std::unique_ptr<OpenedEngine> engine;
    Status status = backend_->openEngine(ctx_, "t", 1, engine);
    EXPECT_EQ(ErrorCode::ERR_UNAVAILABLE, status.code());
    EXPECT_EQ(nullptr, engine);
    EXPECT_EQ(0, backend_->counters().opened());
}

// ============================================================================
// writeRows
// ============================================================================

TEST_F(EngineLifecycleTest, WriteRowsSplitsIntoChunks) {
    mock_->setMaxChunkSize(25);
    auto opened = open("t", 1);
    auto rows = makePairs(5, 4, 6);  // 10 bytes each

    ASSERT_TRUE(opened->writeRows(ctx_, {}, *rows).ok());
    EXPECT_EQ((std::vector<size_t>{20, 20, 10}), mock_->writtenChunks());
}

TEST_F(EngineLifecycleTest, EmptyRowsWriteNothing) {
    auto opened = open("t", 1);
    auto rows = makePairs(0, 0, 0);
    ASSERT_TRUE(opened->writeRows(ctx_, {}, *rows).ok());
    EXPECT_EQ(0, mock_->callCount("writeRows"));
}

TEST_F(EngineLifecycleTest, WriteRowsRetriesRetryableFailure) {
    auto opened = open("t", 1);
    mock_->failNext("writeRows", Status(ErrorCode::ERR_BUSY, "server is busy"), 2);

    auto rows = makePairs(3, 4, 4);
    ASSERT_TRUE(opened->writeRows(ctx_, {}, *rows).ok());
    EXPECT_EQ(3, mock_->callCount("writeRows"));
    EXPECT_EQ(1u, mock_->writtenChunks().size());
    EXPECT_NE(std::string::npos, log_.str().find("write rows spuriously failed"));
}

TEST_F(EngineLifecycleTest, WriteRowsGivesUpAfterMaxRetry) {
    auto opened = open("`db`.`t`", 1);
    mock_->failNext("writeRows", Status(ErrorCode::ERR_UNAVAILABLE, "region unavailable"), 3);

    auto rows = makePairs(3, 4, 4);
    Status status = opened->writeRows(ctx_, {}, *rows);
    EXPECT_EQ(ErrorCode::ERR_UNAVAILABLE, status.code());
    EXPECT_NE(std::string::npos, status.message().find("[`db`.`t`] write rows reach max retry 3 and still failed"));
    EXPECT_NE(std::string::npos, status.message().find("region unavailable"));
    EXPECT_EQ(kMaxRetryTimes, mock_->callCount("writeRows"));
}

TEST_F(EngineLifecycleTest, WriteRowsStopsOnNonRetryableFailure) {
    mock_->setMaxChunkSize(8);
    auto opened = open("t", 1);
    auto rows = makePairs(3, 4, 4);  // three chunks

    ASSERT_TRUE(mock_->writtenChunks().empty());
    mock_->failNext("writeRows", Status::OK());
    mock_->failNext("writeRows", Status(ErrorCode::ERR_INVALID_ARGUMENT, "bad key"));

    Status status = opened->writeRows(ctx_, {}, *rows);
    EXPECT_EQ(ErrorCode::ERR_INVALID_ARGUMENT, status.code());
    EXPECT_EQ("bad key", status.message());
    EXPECT_EQ(2, mock_->callCount("writeRows"));
    EXPECT_EQ(1u, mock_->writtenChunks().size());
}

TEST_F(EngineLifecycleTest, WriteRowsHonoursCancellation) {
    auto opened = open("t", 1);
    ctx_.cancel();
    auto rows = makePairs(3, 4, 4);
    EXPECT_EQ(ErrorCode::ERR_CANCELLED, opened->writeRows(ctx_, {}, *rows).code());
    EXPECT_EQ(0, mock_->callCount("writeRows"));
}

TEST_F(EngineLifecycleTest, WriteRowsWaitsForExclusiveGate) {
    auto opened = open("t", 1);
    std::unique_lock<std::shared_mutex> exclusive = backend_->writeGate()->acquireExclusive();

    std::thread writer([this, &opened] {
        auto rows = makePairs(2, 4, 4);
        EXPECT_TRUE(opened->writeRows(ctx_, {}, *rows).ok());
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    EXPECT_EQ(0, mock_->callCount("writeRows"));
    exclusive.unlock();
    writer.join();
    EXPECT_EQ(1, mock_->callCount("writeRows"));
}

TEST_F(EngineLifecycleTest, FlushForwardsToBackend) {
    auto opened = open("t", 1);
    ASSERT_TRUE(opened->flush().ok());
    EXPECT_EQ(opened->uuid(), mock_->engineArgs("flushEngine")[0]);
}

// ============================================================================
// close
// ============================================================================

TEST_F(EngineLifecycleTest, CloseFailureKeepsEngineOpen) {
    auto opened = open("t", 1);
    mock_->failNext("closeEngine", Status(ErrorCode::ERR_IO_FAILED, "disk full"));

    std::unique_ptr<ClosedEngine> closed_engine;
    EXPECT_EQ(ErrorCode::ERR_IO_FAILED, opened->close(ctx_, closed_engine).code());
    EXPECT_EQ(nullptr, closed_engine);
    EXPECT_EQ(1, backend_->counters().unbalanced());
    EXPECT_NE(std::string::npos, log_.str().find("engine close failed"));

    ASSERT_TRUE(opened->close(ctx_, closed_engine).ok());
    EXPECT_EQ(0, backend_->counters().unbalanced());
}

// ============================================================================
// import
// ============================================================================

TEST_F(EngineLifecycleTest, ImportRetriesRetryableFailure) {
    auto engine = closed("t", 1);
    mock_->failNext("importEngine", Status(ErrorCode::ERR_TIMED_OUT, "ingest timeout"), 2);

    ASSERT_TRUE(engine->import(ctx_).ok());
    EXPECT_EQ(3, mock_->callCount("importEngine"));
    EXPECT_NE(std::string::npos, log_.str().find("import spuriously failed, going to retry again"));
    EXPECT_NE(std::string::npos, log_.str().find("retryCnt=2"));
}

TEST_F(EngineLifecycleTest, ImportGivesUpAfterMaxRetry) {
    auto engine = closed("t", 1);
    mock_->failNext("importEngine", Status(ErrorCode::ERR_NETWORK, "connection reset"), 3);

    Status status = engine->import(ctx_);
    EXPECT_EQ(ErrorCode::ERR_NETWORK, status.code());
    EXPECT_NE(std::string::npos,
              status.message().find("[" + engine->uuid().toString() +
                                    "] import reach max retry 3 and still failed"));
    EXPECT_EQ(kMaxRetryTimes, mock_->callCount("importEngine"));
}

TEST_F(EngineLifecycleTest, ImportSleepsOnlyBetweenAttempts) {
    // Two sleeps fit before the deadline, a third would not
    mock_->setRetryDelay(std::chrono::milliseconds(300));
    auto engine = closed("t", 1);
    mock_->failNext("importEngine", Status(ErrorCode::ERR_BUSY, "busy"), 3);

    Context ctx(std::chrono::milliseconds(750));
    auto start = std::chrono::steady_clock::now();
    Status status = engine->import(ctx);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(ErrorCode::ERR_BUSY, status.code());
    EXPECT_GE(elapsed, std::chrono::milliseconds(600));
}

TEST_F(EngineLifecycleTest, ImportReturnsNonRetryableFailure) {
    auto engine = closed("t", 1);
    mock_->setRetryDelay(std::chrono::seconds(5));
    mock_->failNext("importEngine", Status(ErrorCode::ERR_CORRUPTION, "bad run"));

    auto start = std::chrono::steady_clock::now();
    Status status = engine->import(ctx_);
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_EQ(ErrorCode::ERR_CORRUPTION, status.code());
    EXPECT_EQ("bad run", status.message());
    EXPECT_EQ(1, mock_->callCount("importEngine"));
    EXPECT_LT(elapsed, std::chrono::seconds(1));
}

TEST_F(EngineLifecycleTest, ImportRetrySleepWakesOnCancel) {
    mock_->setRetryDelay(std::chrono::seconds(30));
    auto engine = closed("t", 1);
    mock_->failNext("importEngine", Status(ErrorCode::ERR_BUSY, "busy"), 3);

    std::thread canceller([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        ctx_.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    Status status = engine->import(ctx_);
    auto elapsed = std::chrono::steady_clock::now() - start;
    canceller.join();

    EXPECT_EQ(ErrorCode::ERR_CANCELLED, status.code());
    EXPECT_LT(elapsed, std::chrono::seconds(10));
    EXPECT_EQ(1, mock_->callCount("importEngine"));
}

TEST_F(EngineLifecycleTest, CleanupReportsFailure) {
    auto engine = closed("t", 1);
    mock_->failNext("cleanupEngine", Status(ErrorCode::ERR_IO_FAILED, "rm failed"));
    EXPECT_EQ(ErrorCode::ERR_IO_FAILED, engine->cleanup(ctx_).code());
    EXPECT_NE(std::string::npos, log_.str().find("WARN cleanup failed"));
}

// ============================================================================
// Recovery operations
// ============================================================================

TEST_F(EngineLifecycleTest, UnsafeCloseDoesNotTouchCounters) {
    auto engine = closed("`db`.`t`", 4);
    ASSERT_NE(nullptr, engine);

    std::string tag;
    EXPECT_EQ(makeEngineUUID("`db`.`t`", 4, tag), engine->uuid());
    EXPECT_EQ(1, mock_->callCount("closeEngine"));
    EXPECT_EQ(0, backend_->counters().opened());
    EXPECT_EQ(0, backend_->counters().closed());
}

TEST_F(EngineLifecycleTest, UnsafeCloseWithUUIDUsesGivenIdentity) {
    EngineUUID uuid = xload::test::uuidOf("00000000-0000-0000-0000-0000000000aa");
    std::unique_ptr<ClosedEngine> engine;
    ASSERT_TRUE(backend_->recovery().unsafeCloseEngineWithUUID(ctx_, "resumed", uuid, engine).ok());
    EXPECT_EQ(uuid, engine->uuid());
    EXPECT_EQ(uuid, mock_->engineArgs("closeEngine")[0]);
}

TEST_F(EngineLifecycleTest, UnsafeImportAndResetNeverCloses) {
    auto opened = open("t", 1);
    mock_->failNext("importEngine", Status(ErrorCode::ERR_BUSY, "busy"));

    ASSERT_TRUE(backend_->recovery().unsafeImportAndReset(ctx_, opened->uuid()).ok());
    EXPECT_EQ(0, mock_->callCount("closeEngine"));
    EXPECT_EQ(2, mock_->callCount("importEngine"));
    EXPECT_EQ(1, mock_->callCount("resetEngine"));
    EXPECT_EQ(opened->uuid(), mock_->engineArgs("resetEngine")[0]);
    EXPECT_NE(std::string::npos, log_.str().find("engineTag=<import-and-reset>"));

    // Still writable afterwards
    auto rows = makePairs(1, 4, 4);
    EXPECT_TRUE(opened->writeRows(ctx_, {}, *rows).ok());
}

TEST_F(EngineLifecycleTest, UnsafeImportAndResetSkipsResetOnImportFailure) {
    auto opened = open("t", 1);
    mock_->failNext("importEngine", Status(ErrorCode::ERR_CORRUPTION, "bad"));

    EXPECT_EQ(ErrorCode::ERR_CORRUPTION,
              backend_->recovery().unsafeImportAndReset(ctx_, opened->uuid()).code());
    EXPECT_EQ(0, mock_->callCount("resetEngine"));
}

// ============================================================================
// Facade forwarding
// ============================================================================

TEST_F(EngineLifecycleTest, FacadeForwardsToBackend) {
    EXPECT_TRUE(backend_->shouldPostProcess());
    EXPECT_NE(nullptr, backend_->makeEmptyRows());
    EXPECT_NE(nullptr, backend_->newEncoder(TableInfo(), SessionOptions()));

    mock_->failNext("checkRequirements", Status(ErrorCode::ERR_UNSUPPORTED, "too old"));
    EXPECT_EQ(ErrorCode::ERR_UNSUPPORTED, backend_->checkRequirements(ctx_).code());

    std::vector<TableInfo> tables(3);
    ASSERT_TRUE(backend_->fetchRemoteTableModels(ctx_, "db", tables).ok());
    EXPECT_TRUE(tables.empty());

    ASSERT_TRUE(backend_->flushAll().ok());
    EXPECT_EQ(1, mock_->callCount("flushAllEngines"));

    backend_->close();
    EXPECT_TRUE(mock_->isClosed());
}
