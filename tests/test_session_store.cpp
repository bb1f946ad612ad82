#include <gtest/gtest.h>
#include <managers/session_store.hpp>
#include <core/utils.hpp>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;

class SessionStoreTest : public ::testing::Test {
protected:
    fs::path state_dir;

    void SetUp() override {
        auto name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        state_dir = fs::temp_directory_path() /
                    ("ego_store_" + std::string(name) + "_" + std::to_string(getpid()));
        fs::remove_all(state_dir);
    }

    void TearDown() override {
        fs::remove_all(state_dir);
    }

    void write_raw(const std::string& file_name, const std::string& content) {
        fs::create_directories(state_dir);
        std::ofstream(state_dir / file_name) << content;
    }

    SessionRecord sample_record() {
        SessionRecord r;
        r.project_path = "/home/dev/projects/my app";
        parse_iso_utc("2025-01-15T10:00:00Z", r.start_time);
        r.initial_line_count = 1234;
        r.initial_char_count = 56789;
        r.initial_files = {
            {"src/main.rs", 420, 0x0123456789abcdefULL},
            {"README.md", 12, 0x0000000000000012ULL},
        };
        return r;
    }
};

TEST_F(SessionStoreTest, EmptySlot) {
    SessionStore store(state_dir);
    EXPECT_FALSE(store.exists());

    auto loaded = store.load();
    EXPECT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.code, ErrorCode::NoActiveSession);
}

TEST_F(SessionStoreTest, SaveCreatesStateDirectory) {
    SessionStore store(state_dir);
    auto saved = store.save(sample_record());
    ASSERT_TRUE(saved.is_ok()) << saved.error;
    EXPECT_TRUE(store.exists());
    EXPECT_EQ(store.path(), state_dir / "session.yaml");
}

TEST_F(SessionStoreTest, RecordRoundTrips) {
    SessionStore store(state_dir);
    auto original = sample_record();
    ASSERT_TRUE(store.save(original).is_ok());

    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok()) << loaded.error;
    const auto& r = loaded.value;
    EXPECT_EQ(r.project_path, original.project_path);
    EXPECT_EQ(r.start_time, original.start_time);
    EXPECT_EQ(r.initial_line_count, 1234u);
    EXPECT_EQ(r.initial_char_count, 56789u);
    ASSERT_EQ(r.initial_files.size(), 2u);
    EXPECT_EQ(r.initial_files[0].path, "src/main.rs");
    EXPECT_EQ(r.initial_files[0].size, 420u);
    EXPECT_EQ(r.initial_files[0].hash, 0x0123456789abcdefULL);
    EXPECT_EQ(r.initial_files[1].hash, 0x12ULL);
}

TEST_F(SessionStoreTest, SaveLeavesNoTempFile) {
    SessionStore store(state_dir);
    ASSERT_TRUE(store.save(sample_record()).is_ok());
    EXPECT_FALSE(fs::exists(state_dir / "session.yaml.tmp"));
}

TEST_F(SessionStoreTest, LeftoverTempFileIsNotARecord) {
    write_raw("session.yaml.tmp", "version: 1\nproject_path: /half");
    SessionStore store(state_dir);
    EXPECT_FALSE(store.exists());

    ASSERT_TRUE(store.save(sample_record()).is_ok());
    auto loaded = store.load();
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value.project_path, "/home/dev/projects/my app");
}

TEST_F(SessionStoreTest, RemoveEmptiesSlot) {
    SessionStore store(state_dir);
    ASSERT_TRUE(store.save(sample_record()).is_ok());

    EXPECT_TRUE(store.remove().is_ok());
    EXPECT_FALSE(store.exists());

    auto again = store.remove();
    EXPECT_TRUE(again.is_err());
    EXPECT_EQ(again.code, ErrorCode::NoActiveSession);
}

TEST_F(SessionStoreTest, GarbageIsCorrupt) {
    write_raw("session.yaml", "{{{ not yaml");
    SessionStore store(state_dir);
    EXPECT_TRUE(store.exists());

    auto loaded = store.load();
    EXPECT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.code, ErrorCode::CorruptRecord);
}

TEST_F(SessionStoreTest, MissingFieldsAreCorrupt) {
    write_raw("session.yaml", "version: 1\nproject_path: /x\n");
    SessionStore store(state_dir);

    auto loaded = store.load();
    EXPECT_EQ(loaded.code, ErrorCode::CorruptRecord);
}

TEST_F(SessionStoreTest, BadTimestampIsCorrupt) {
    write_raw("session.yaml",
              "version: 1\nproject_path: /x\nstart_time: yesterday\ninitial_line_count: 3\n");
    SessionStore store(state_dir);

    auto loaded = store.load();
    EXPECT_EQ(loaded.code, ErrorCode::CorruptRecord);
}

TEST_F(SessionStoreTest, UnknownVersionIsCorrupt) {
    write_raw("session.yaml",
              "version: 99\nproject_path: /x\nstart_time: 2025-01-15T10:00:00Z\n"
              "initial_line_count: 3\n");
    SessionStore store(state_dir);

    auto loaded = store.load();
    EXPECT_EQ(loaded.code, ErrorCode::CorruptRecord);
}

TEST_F(SessionStoreTest, NegativeCountIsCorrupt) {
    write_raw("session.yaml",
              "version: 1\nproject_path: /x\nstart_time: 2025-01-15T10:00:00Z\n"
              "initial_line_count: -4\n");
    SessionStore store(state_dir);

    auto loaded = store.load();
    EXPECT_EQ(loaded.code, ErrorCode::CorruptRecord);
}
