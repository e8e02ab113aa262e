#include <gtest/gtest.h>
#include "test_utils.h"
#include "xLoad/delivery.h"
#include "xLoad/local_backend.h"
#include "xLoad/run_file.h"
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

using namespace xload;

namespace fs = std::filesystem;

class LocalBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = make_test_dir("local_backend");
        remove_directory(test_dir_);

        config_.sorted_kv_dir = join_path(test_dir_, "sorted-kv");
        config_.target_db_path = join_path(test_dir_, "target.db");
        config_.retry_import_delay_ms = 1;
        config_.flush_threads = 2;

        sink_ = std::make_shared<LogSink>(&log_, LogLevel::DEBUG);
        local_ = openBackend();
    }

    void TearDown() override {
        local_.reset();
        remove_directory(test_dir_);
    }

    std::shared_ptr<LocalBackend> openBackend() {
        auto backend = std::make_shared<LocalBackend>(config_, sink_);
        Status status = backend->open();
        EXPECT_TRUE(status.ok()) << status.toString();
        return backend;
    }

    EngineUUID engine(const std::string& table, int32_t id) {
        std::string tag;
        return makeEngineUUID(table, id, tag);
    }

    Status write(LocalBackend& backend, const EngineUUID& uuid,
                 const std::vector<KvPair>& pairs) {
        KvPairs rows(pairs);
        return backend.writeRows(ctx_, uuid, "t", {}, 0, rows);
    }

    std::string lookup(const std::string& key) {
        std::string value;
        bool found = false;
        Status status = local_->targetStore().get(key, value, found);
        EXPECT_TRUE(status.ok()) << status.toString();
        return found ? value : "<missing>";
    }

    int64_t targetCount() {
        int64_t count = -1;
        Status status = local_->targetStore().countPairs(count);
        EXPECT_TRUE(status.ok()) << status.toString();
        return count;
    }

    std::string test_dir_;
    DeliveryConfig config_;
    Context ctx_;
    std::ostringstream log_;
    std::shared_ptr<LogSink> sink_;
    std::shared_ptr<LocalBackend> local_;
};

// ============================================================================
// Engine lifecycle
// ============================================================================

TEST_F(LocalBackendTest, WriteCloseImportCleanup) {
    std::cout << "\n=== Local engine round trip ===" << std::endl;
    EngineUUID uuid = engine("`db`.`t`", 1);

    ASSERT_TRUE(local_->openEngine(ctx_, uuid).ok());
    EXPECT_TRUE(fs::is_directory(local_->engineDir(uuid)));

    ASSERT_TRUE(write(*local_, uuid, {{"k1", "v1"}, {"k2", "v2"}}).ok());
    ASSERT_TRUE(write(*local_, uuid, {{"k3", "v3"}}).ok());
    ASSERT_TRUE(local_->closeEngine(ctx_, uuid).ok());
    EXPECT_EQ(1u, local_->runCount(uuid));

    ASSERT_TRUE(local_->importEngine(ctx_, uuid).ok());
    EXPECT_EQ(3, targetCount());
    EXPECT_EQ("v2", lookup("k2"));

    ASSERT_TRUE(local_->cleanupEngine(ctx_, uuid).ok());
    EXPECT_FALSE(fs::exists(local_->engineDir(uuid)));
    EXPECT_EQ(0u, local_->engineCount());
    std::cout << "  Round trip passed" << std::endl;
}

TEST_F(LocalBackendTest, OpenIsIdempotent) {
    EngineUUID uuid = engine("t", 1);
    ASSERT_TRUE(local_->openEngine(ctx_, uuid).ok());
    ASSERT_TRUE(write(*local_, uuid, {{"a", "1"}}).ok());
    ASSERT_TRUE(local_->openEngine(ctx_, uuid).ok());
    EXPECT_EQ(1u, local_->engineCount());

    std::vector<EngineFileSize> sizes = local_->engineFileSizes();
    ASSERT_EQ(1u, sizes.size());
    EXPECT_EQ(2, sizes[0].size);
}

TEST_F(LocalBackendTest, LaterWritesWin) {
    EngineUUID uuid = engine("t", 1);
    ASSERT_TRUE(local_->openEngine(ctx_, uuid).ok());

    ASSERT_TRUE(write(*local_, uuid, {{"k", "old"}, {"x", "1"}}).ok());
    ASSERT_TRUE(local_->flushEngine(uuid).ok());
    ASSERT_TRUE(write(*local_, uuid, {{"k", "new"}}).ok());
    ASSERT_TRUE(local_->closeEngine(ctx_, uuid).ok());
    EXPECT_EQ(2u, local_->runCount(uuid));

    ASSERT_TRUE(local_->importEngine(ctx_, uuid).ok());
    EXPECT_EQ("new", lookup("k"));
    EXPECT_EQ(2, targetCount());
}

TEST_F(LocalBackendTest, ImportIsIdempotent) {
    EngineUUID uuid = engine("t", 1);
    ASSERT_TRUE(local_->openEngine(ctx_, uuid).ok());
    ASSERT_TRUE(write(*local_, uuid, {{"a", "1"}, {"b", "2"}}).ok());
    ASSERT_TRUE(local_->closeEngine(ctx_, uuid).ok());

    ASSERT_TRUE(local_->importEngine(ctx_, uuid).ok());
    ASSERT_TRUE(local_->importEngine(ctx_, uuid).ok());
    EXPECT_EQ(2, targetCount());
}

TEST_F(LocalBackendTest, MemtableSpillsAtLimit) {
    config_.memtable_limit = 64;
    local_.reset();
    local_ = openBackend();

    EngineUUID uuid = engine("t", 1);
    ASSERT_TRUE(local_->openEngine(ctx_, uuid).ok());
    ASSERT_TRUE(write(*local_, uuid, {{"key-1", std::string(40, 'a')}}).ok());
    EXPECT_EQ(0u, local_->runCount(uuid));
    ASSERT_TRUE(write(*local_, uuid, {{"key-2", std::string(40, 'b')}}).ok());
    EXPECT_EQ(1u, local_->runCount(uuid));
}

TEST_F(LocalBackendTest, WriteRejections) {
    EngineUUID uuid = engine("t", 1);
    EXPECT_EQ(ErrorCode::ERR_NOT_FOUND, write(*local_, uuid, {{"a", "1"}}).code());

    ASSERT_TRUE(local_->openEngine(ctx_, uuid).ok());
    ASSERT_TRUE(local_->closeEngine(ctx_, uuid).ok());
    EXPECT_EQ(ErrorCode::ERR_INVALID_ARGUMENT, write(*local_, uuid, {{"a", "1"}}).code());

    ctx_.cancel();
    EXPECT_EQ(ErrorCode::ERR_CANCELLED, local_->openEngine(ctx_, engine("t", 2)).code());
}

TEST_F(LocalBackendTest, CloseUnknownEngineIsNotFound) {
    EXPECT_EQ(ErrorCode::ERR_NOT_FOUND, local_->closeEngine(ctx_, engine("t", 9)).code());
    EXPECT_EQ(ErrorCode::ERR_NOT_FOUND, local_->importEngine(ctx_, engine("t", 9)).code());
}

// ============================================================================
// Resume across processes
// ============================================================================

TEST_F(LocalBackendTest, CloseEngineOpenedByEarlierProcess) {
    std::cout << "\n=== Resume from disk ===" << std::endl;
    EngineUUID uuid = engine("`db`.`t`", 3);
    ASSERT_TRUE(local_->openEngine(ctx_, uuid).ok());
    ASSERT_TRUE(write(*local_, uuid, {{"a", "1"}}).ok());
    ASSERT_TRUE(local_->flushEngine(uuid).ok());
    ASSERT_TRUE(write(*local_, uuid, {{"b", "2"}}).ok());
    ASSERT_TRUE(local_->flushEngine(uuid).ok());

    local_->close();
    local_.reset();

    // Crash leftovers are dropped on reload
    std::ofstream(join_path(join_path(config_.sorted_kv_dir, uuid.toString()), "run_000003.kv.tmp"))
        << "partial";

    local_ = openBackend();
    EXPECT_EQ(0u, local_->engineCount());
    ASSERT_TRUE(local_->closeEngine(ctx_, uuid).ok());
    EXPECT_EQ(2u, local_->runCount(uuid));
    EXPECT_FALSE(fs::exists(join_path(local_->engineDir(uuid), "run_000003.kv.tmp")));
    EXPECT_NE(std::string::npos, log_.str().find("engine reloaded from disk"));

    ASSERT_TRUE(local_->importEngine(ctx_, uuid).ok());
    EXPECT_EQ("1", lookup("a"));
    EXPECT_EQ("2", lookup("b"));
    std::cout << "  Resume passed" << std::endl;
}

TEST_F(LocalBackendTest, ReopenContinuesRunNumbering) {
    EngineUUID uuid = engine("t", 1);
    ASSERT_TRUE(local_->openEngine(ctx_, uuid).ok());
    ASSERT_TRUE(write(*local_, uuid, {{"k", "first"}}).ok());
    local_.reset();  // close flushes the open memtable

    local_ = openBackend();
    ASSERT_TRUE(local_->openEngine(ctx_, uuid).ok());
    EXPECT_EQ(1u, local_->runCount(uuid));
    ASSERT_TRUE(write(*local_, uuid, {{"k", "second"}}).ok());
    ASSERT_TRUE(local_->closeEngine(ctx_, uuid).ok());
    EXPECT_EQ(2u, local_->runCount(uuid));
    EXPECT_TRUE(fs::exists(join_path(local_->engineDir(uuid), "run_000002.kv")));

    ASSERT_TRUE(local_->importEngine(ctx_, uuid).ok());
    EXPECT_EQ("second", lookup("k"));
}

// ============================================================================
// Reset, flush and sizes
// ============================================================================

TEST_F(LocalBackendTest, ResetDropsContentButStaysOpen) {
    EngineUUID uuid = engine("t", 1);
    ASSERT_TRUE(local_->openEngine(ctx_, uuid).ok());
    ASSERT_TRUE(write(*local_, uuid, {{"a", "1"}}).ok());
    ASSERT_TRUE(local_->flushEngine(uuid).ok());
    ASSERT_TRUE(write(*local_, uuid, {{"b", "2"}}).ok());

    ASSERT_TRUE(local_->resetEngine(ctx_, uuid).ok());
    EXPECT_EQ(0u, local_->runCount(uuid));
    ASSERT_EQ(1u, local_->engineFileSizes().size());
    EXPECT_EQ(0, local_->engineFileSizes()[0].size);

    ASSERT_TRUE(write(*local_, uuid, {{"c", "3"}}).ok());
    ASSERT_TRUE(local_->closeEngine(ctx_, uuid).ok());
    ASSERT_TRUE(local_->importEngine(ctx_, uuid).ok());
    EXPECT_EQ(1, targetCount());
    EXPECT_EQ("3", lookup("c"));
}

TEST_F(LocalBackendTest, EngineFileSizesCountMemtableAndRuns) {
    EngineUUID uuid = engine("t", 1);
    ASSERT_TRUE(local_->openEngine(ctx_, uuid).ok());
    ASSERT_TRUE(write(*local_, uuid, {{"abc", "defg"}, {"h", "ij"}}).ok());

    std::vector<EngineFileSize> sizes = local_->engineFileSizes();
    ASSERT_EQ(1u, sizes.size());
    EXPECT_EQ(uuid, sizes[0].uuid);
    EXPECT_EQ(10, sizes[0].size);
    EXPECT_FALSE(sizes[0].is_importing);

    // Overwriting a key replaces its value bytes
    ASSERT_TRUE(write(*local_, uuid, {{"h", "i"}}).ok());
    EXPECT_EQ(9, local_->engineFileSizes()[0].size);

    ASSERT_TRUE(local_->flushEngine(uuid).ok());
    int64_t run_size = static_cast<int64_t>(
        fs::file_size(join_path(local_->engineDir(uuid), "run_000001.kv")));
    EXPECT_EQ(run_size, local_->engineFileSizes()[0].size);
    EXPECT_GE(run_size, static_cast<int64_t>(sizeof(RunFileHeader)));
}

TEST_F(LocalBackendTest, FlushAllEngines) {
    std::vector<EngineUUID> uuids;
    for (int32_t id = 0; id < 5; ++id) {
        EngineUUID uuid = engine("t", id);
        uuids.push_back(uuid);
        ASSERT_TRUE(local_->openEngine(ctx_, uuid).ok());
        ASSERT_TRUE(write(*local_, uuid, {{"k" + std::to_string(id), "v"}}).ok());
    }

    ASSERT_TRUE(local_->flushAllEngines().ok());
    for (const EngineUUID& uuid : uuids) {
        EXPECT_EQ(1u, local_->runCount(uuid));
    }
}

TEST_F(LocalBackendTest, FlushUnknownEngineIsNotFound) {
    EXPECT_EQ(ErrorCode::ERR_NOT_FOUND, local_->flushEngine(engine("t", 1)).code());
}

// ============================================================================
// Run file integrity
// ============================================================================

TEST_F(LocalBackendTest, CorruptRunFailsImport) {
    EngineUUID uuid = engine("t", 1);
    ASSERT_TRUE(local_->openEngine(ctx_, uuid).ok());
    ASSERT_TRUE(write(*local_, uuid, {{"a", std::string(100, 'x')}}).ok());
    ASSERT_TRUE(local_->closeEngine(ctx_, uuid).ok());

    std::string path = join_path(local_->engineDir(uuid), "run_000001.kv");
    {
        std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
        ASSERT_TRUE(file.is_open());
        file.seekp(sizeof(RunFileHeader) + 2);
        file.put('\x7f');
    }

    Status status = local_->importEngine(ctx_, uuid);
    EXPECT_EQ(ErrorCode::ERR_CORRUPTION, status.code());
    EXPECT_EQ(0, targetCount());
}

TEST_F(LocalBackendTest, CorruptRunHeaderFailsImport) {
    EngineUUID uuid = engine("t", 1);
    ASSERT_TRUE(local_->openEngine(ctx_, uuid).ok());
    ASSERT_TRUE(write(*local_, uuid, {{"a", "1"}}).ok());
    ASSERT_TRUE(local_->closeEngine(ctx_, uuid).ok());

    // entry_count sits at offset 16 of the header
    std::string path = join_path(local_->engineDir(uuid), "run_000001.kv");
    {
        std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
        ASSERT_TRUE(file.is_open());
        uint64_t huge = 0x7fffffffffffffffull;
        file.seekp(16);
        file.write(reinterpret_cast<const char*>(&huge), sizeof(huge));
    }

    Status status = local_->importEngine(ctx_, uuid);
    EXPECT_EQ(ErrorCode::ERR_CORRUPTION, status.code());
    EXPECT_EQ(0, targetCount());
}

TEST_F(LocalBackendTest, RunHeaderFieldsAreBoundedBeforeAllocation) {
    std::string dir = join_path(test_dir_, "runs");
    create_directory(dir);
    std::string path = join_path(dir, "run.kv");
    uint64_t file_size = 0;
    ASSERT_TRUE(writeRunFile(path, {{"a", "1"}}, CompressionType::COMP_NONE, file_size).ok());

    RunFileHeader header;
    {
        std::ifstream in(path, std::ios::binary);
        in.read(reinterpret_cast<char*>(&header), sizeof(header));
        ASSERT_TRUE(in.good());
    }
    EXPECT_EQ(runHeaderCRC32(header), header.header_crc32);

    auto rewrite = [&path](const RunFileHeader& patched) {
        std::fstream file(path, std::ios::in | std::ios::out | std::ios::binary);
        file.write(reinterpret_cast<const char*>(&patched), sizeof(patched));
    };

    // Damage that keeps the header CRC consistent is caught by the bounds
    RunFileHeader oversized = header;
    oversized.payload_size = 1ull << 62;
    oversized.header_crc32 = runHeaderCRC32(oversized);
    rewrite(oversized);
    std::vector<KvPair> pairs;
    EXPECT_EQ(ErrorCode::ERR_CORRUPTION, readRunFile(path, pairs).code());

    RunFileHeader too_many = header;
    too_many.entry_count = 0x7fffffffffffffffull;
    too_many.header_crc32 = runHeaderCRC32(too_many);
    rewrite(too_many);
    EXPECT_EQ(ErrorCode::ERR_CORRUPTION, readRunFile(path, pairs).code());

    rewrite(header);
    ASSERT_TRUE(readRunFile(path, pairs).ok());
    EXPECT_EQ(1u, pairs.size());
}

TEST_F(LocalBackendTest, UncompressedRuns) {
    config_.run_compression = CompressionType::COMP_NONE;
    local_.reset();
    local_ = openBackend();

    EngineUUID uuid = engine("t", 1);
    ASSERT_TRUE(local_->openEngine(ctx_, uuid).ok());
    ASSERT_TRUE(write(*local_, uuid, {{"a", "1"}, {"b", "2"}}).ok());
    ASSERT_TRUE(local_->closeEngine(ctx_, uuid).ok());

    std::vector<KvPair> pairs;
    ASSERT_TRUE(readRunFile(join_path(local_->engineDir(uuid), "run_000001.kv"), pairs).ok());
    ASSERT_EQ(2u, pairs.size());
    EXPECT_EQ("a", pairs[0].key);
    EXPECT_EQ("2", pairs[1].value);
}

// ============================================================================
// Requirements, catalog and the facade
// ============================================================================

TEST_F(LocalBackendTest, CheckRequirements) {
    EXPECT_TRUE(local_->checkRequirements(ctx_).ok());
    local_->close();
    EXPECT_EQ(ErrorCode::ERR_UNAVAILABLE, local_->checkRequirements(ctx_).code());
}

TEST_F(LocalBackendTest, OpenRejectsInvalidConfig) {
    DeliveryConfig bad = config_;
    bad.max_chunk_size = 0;
    LocalBackend backend(bad, sink_);
    Status status = backend.open();
    EXPECT_EQ(ErrorCode::ERR_INVALID_ARGUMENT, status.code());
    EXPECT_NE(std::string::npos, status.message().find("chunk"));
}

TEST_F(LocalBackendTest, FetchRemoteTableModels) {
    TableInfo table;
    table.id = 12;
    table.name = "orders";
    table.pk_is_handle = true;
    ColumnInfo id;
    id.name = "id";
    id.is_primary_key = true;
    table.columns = {id};
    ASSERT_TRUE(local_->targetStore().registerTableModel("shop", table).ok());

    std::vector<TableInfo> tables;
    ASSERT_TRUE(local_->fetchRemoteTableModels(ctx_, "shop", tables).ok());
    ASSERT_EQ(1u, tables.size());
    EXPECT_EQ("orders", tables[0].name);
    EXPECT_EQ(0, tables[0].handleColumnOffset());
    EXPECT_TRUE(tables[0].hasValidColumnLayout());
}

TEST_F(LocalBackendTest, FacadeEncodesAndDelivers) {
    std::cout << "\n=== Facade over local backend ===" << std::endl;
    Backend backend(local_, sink_);

    TableInfo table;
    table.id = 7;
    table.name = "items";
    table.pk_is_handle = true;
    ColumnInfo id;
    id.name = "id";
    id.is_primary_key = true;
    ColumnInfo name;
    name.name = "name";
    name.offset = 1;
    name.type = ColumnType::STRING;
    table.columns = {id, name};
    IndexInfo by_name;
    by_name.id = 1;
    by_name.name = "idx_name";
    by_name.column_offsets = {1};
    table.indices = {by_name};

    std::unique_ptr<IEncoder> encoder = backend.newEncoder(table, SessionOptions());
    std::unique_ptr<IRows> data = backend.makeEmptyRows();
    std::unique_ptr<IRows> indices = backend.makeEmptyRows();
    KVChecksum data_checksum, index_checksum;
    Logger logger("Test", sink_);
    for (int64_t i = 1; i <= 50; ++i) {
        std::unique_ptr<IRow> row;
        std::vector<Datum> values = {Datum(i), Datum("item-" + std::to_string(i))};
        ASSERT_TRUE(encoder->encode(logger, values, i, {}, row).ok());
        row->classifyAndAppend(data.get(), &data_checksum, indices.get(), &index_checksum);
    }
    encoder->close();

    std::unique_ptr<OpenedEngine> data_engine;
    std::unique_ptr<OpenedEngine> index_engine;
    ASSERT_TRUE(backend.openEngine(ctx_, "`shop`.`items`", 0, data_engine).ok());
    ASSERT_TRUE(backend.openEngine(ctx_, "`shop`.`items`", -1, index_engine).ok());
    ASSERT_TRUE(data_engine->writeRows(ctx_, {"id", "name"}, *data).ok());
    ASSERT_TRUE(index_engine->writeRows(ctx_, {"id", "name"}, *indices).ok());

    for (auto* opened : {data_engine.get(), index_engine.get()}) {
        std::unique_ptr<ClosedEngine> closed;
        ASSERT_TRUE(opened->close(ctx_, closed).ok());
        ASSERT_TRUE(closed->import(ctx_).ok());
        ASSERT_TRUE(closed->cleanup(ctx_).ok());
    }
    EXPECT_EQ(0, backend.counters().unbalanced());

    // Target content matches the checksums of what was encoded
    std::vector<KvPair> stored;
    ASSERT_TRUE(local_->targetStore().scanPairs(stored).ok());
    KVChecksum stored_checksum;
    for (const KvPair& pair : stored) {
        stored_checksum.update(pair.key, pair.value);
    }
    KVChecksum expected = data_checksum;
    expected.add(index_checksum);
    EXPECT_EQ(expected, stored_checksum);
    EXPECT_EQ(100u, stored.size());
    std::cout << "  Delivered " << stored.size() << " pairs" << std::endl;
}

TEST_F(LocalBackendTest, ImportAndResetKeepsEngineWritable) {
    Backend backend(local_, sink_);
    std::unique_ptr<OpenedEngine> opened;
    ASSERT_TRUE(backend.openEngine(ctx_, "t", 1, opened).ok());

    KvPairs rows({{"a", "1"}, {"b", "2"}});
    ASSERT_TRUE(opened->writeRows(ctx_, {}, rows).ok());
    ASSERT_TRUE(opened->flush().ok());

    ASSERT_TRUE(backend.recovery().unsafeImportAndReset(ctx_, opened->uuid()).ok());
    EXPECT_EQ(2, targetCount());
    EXPECT_EQ(0, local_->engineFileSizes()[0].size);

    KvPairs more(std::vector<KvPair>{{"c", "3"}});
    ASSERT_TRUE(opened->writeRows(ctx_, {}, more).ok());
    std::unique_ptr<ClosedEngine> closed;
    ASSERT_TRUE(opened->close(ctx_, closed).ok());
    ASSERT_TRUE(closed->import(ctx_).ok());
    EXPECT_EQ(3, targetCount());
}
