#include <gtest/gtest.h>
#include <managers/line_counter.hpp>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

static std::string numbered_lines(int n) {
    std::string s;
    for (int i = 0; i < n; ++i) s += "line " + std::to_string(i) + "\n";
    return s;
}

static FileCount tally_of(const std::string& content) {
    LineTally t;
    t.feed(content.data(), content.size());
    return t.finish();
}

class LineCounterTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        auto name = ::testing::UnitTest::GetInstance()->current_test_info()->name();
        test_dir = fs::temp_directory_path() /
                   ("ego_counter_" + std::string(name) + "_" + std::to_string(getpid()));
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const std::string& rel_path, const std::string& content) {
        auto full = test_dir / rel_path;
        fs::create_directories(full.parent_path());
        std::ofstream(full, std::ios::binary) << content;
    }

    uint64_t count(const ScanPolicy& policy = ScanPolicy{}) {
        LineCounter counter(policy);
        auto result = counter.count_lines(test_dir);
        EXPECT_TRUE(result.is_ok()) << result.error;
        return result.value.total_lines;
    }
};

TEST(LineTally, EmptyContentHasNoLines) {
    EXPECT_EQ(tally_of("").lines, 0u);
}

TEST(LineTally, UnterminatedFinalLineCounts) {
    EXPECT_EQ(tally_of("a").lines, 1u);
    EXPECT_EQ(tally_of("a\nb").lines, 2u);
    EXPECT_EQ(tally_of("a\nb\n").lines, 2u);
}

TEST(LineTally, BlankLinesCount) {
    EXPECT_EQ(tally_of("\n").lines, 1u);
    EXPECT_EQ(tally_of("\n\n\n").lines, 3u);
}

TEST(LineTally, CrlfCountsOnce) {
    EXPECT_EQ(tally_of("a\r\nb\r\n").lines, 2u);
}

TEST(LineTally, ChunkBoundariesDoNotMatter) {
    std::string content = "one\ntwo\nthree";
    LineTally t;
    for (char c : content) t.feed(&c, 1);
    auto split = t.finish();
    auto whole = tally_of(content);
    EXPECT_EQ(split.lines, whole.lines);
    EXPECT_EQ(split.hash, whole.hash);
    EXPECT_EQ(split.size, content.size());
}

TEST(LineTally, CharsAreCodePoints) {
    auto fc = tally_of("h\xc3\xa9llo\n");   // "héllo\n"
    EXPECT_EQ(fc.chars, 6u);
    EXPECT_EQ(fc.size, 7u);
}

TEST(LineTally, NulMarksBinary) {
    LineTally t;
    std::string content("ab\0cd", 5);
    t.feed(content.data(), content.size());
    EXPECT_TRUE(t.binary());
}

TEST_F(LineCounterTest, EmptyDirectory) {
    EXPECT_EQ(count(), 0u);
}

TEST_F(LineCounterTest, CountsOnlyRecognizedExtensions) {
    write_file("a.rs", numbered_lines(10));
    write_file("data.xyz", numbered_lines(5));
    write_file("Makefile", numbered_lines(3));
    write_file("image.png", numbered_lines(7));

    EXPECT_EQ(count(), 10u);
}

TEST_F(LineCounterTest, ExtensionMatchIsCaseInsensitive) {
    write_file("MAIN.CPP", numbered_lines(4));
    write_file("notes.Md", numbered_lines(2));

    EXPECT_EQ(count(), 6u);
}

TEST_F(LineCounterTest, WalksSubdirectories) {
    write_file("a.py", numbered_lines(1));
    write_file("src/b.py", numbered_lines(2));
    write_file("src/deep/nested/c.py", numbered_lines(3));

    EXPECT_EQ(count(), 6u);
}

TEST_F(LineCounterTest, ExtraExtensionsFromPolicy) {
    write_file("build.xyz", numbered_lines(5));
    ScanPolicy policy;
    policy.extra_extensions = {"xyz"};

    EXPECT_EQ(count(policy), 5u);
}

TEST_F(LineCounterTest, BinaryFileIsSkippedWithWarning) {
    write_file("a.rs", numbered_lines(10));
    write_file("blob.c", std::string("int x;\n\0\0\0garbage\n", 18));

    LineCounter counter;
    auto result = counter.count_lines(test_dir);
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.total_lines, 10u);
    EXPECT_EQ(result.value.files_counted, 1u);
    EXPECT_EQ(result.value.files_skipped, 1u);
    ASSERT_EQ(result.value.warnings.size(), 1u);
    EXPECT_NE(result.value.warnings[0].find("blob.c"), std::string::npos);
}

TEST_F(LineCounterTest, UnreadableFileIsSkipped) {
    if (geteuid() == 0) {
        GTEST_SKIP() << "permission bits are not enforced for root";
    }
    write_file("a.rs", numbered_lines(10));
    write_file("secret.rs", numbered_lines(4));
    fs::permissions(test_dir / "secret.rs", fs::perms::none);

    LineCounter counter;
    auto result = counter.count_lines(test_dir);
    fs::permissions(test_dir / "secret.rs", fs::perms::owner_all);

    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.total_lines, 10u);
    EXPECT_EQ(result.value.files_skipped, 1u);
}

TEST_F(LineCounterTest, SymlinksAreNotFollowed) {
    write_file("real/a.rs", numbered_lines(10));
    fs::create_symlink(test_dir / "real" / "a.rs", test_dir / "link.rs");
    fs::create_directory_symlink(test_dir / "real", test_dir / "linked_dir");

    EXPECT_EQ(count(), 10u);
}

TEST_F(LineCounterTest, SymlinkCycleTerminates) {
    write_file("loop/a.rs", numbered_lines(2));
    fs::create_directory_symlink(test_dir, test_dir / "loop" / "back");

    EXPECT_EQ(count(), 2u);
}

TEST_F(LineCounterTest, HiddenEntriesIncludedByDefault) {
    write_file("a.rs", numbered_lines(1));
    write_file(".hidden.rs", numbered_lines(2));
    write_file(".config/settings.json", numbered_lines(3));

    EXPECT_EQ(count(), 6u);
}

TEST_F(LineCounterTest, HiddenEntriesExcludedByPolicy) {
    write_file("a.rs", numbered_lines(1));
    write_file(".hidden.rs", numbered_lines(2));
    write_file(".config/settings.json", numbered_lines(3));

    ScanPolicy policy;
    policy.include_hidden = false;
    EXPECT_EQ(count(policy), 1u);
}

TEST_F(LineCounterTest, RepeatedScansAreIdentical) {
    write_file("a.rs", numbered_lines(10));
    write_file("src/b.py", numbered_lines(7));
    write_file("src/c.txt", "no newline at end");

    auto first = count();
    EXPECT_EQ(first, 18u);
    EXPECT_EQ(count(), first);
    EXPECT_EQ(count(), first);
}

TEST_F(LineCounterTest, ParallelMatchesSequential) {
    uint64_t expected = 0;
    for (int d = 0; d < 6; ++d) {
        for (int f = 0; f < 15; ++f) {
            int n = d * 15 + f;
            write_file("dir" + std::to_string(d) + "/f" + std::to_string(f) + ".cpp",
                       numbered_lines(n));
            expected += n;
        }
    }

    ScanPolicy sequential;
    sequential.threads = 1;
    ScanPolicy parallel;
    parallel.threads = 8;

    LineCounter seq_counter(sequential);
    LineCounter par_counter(parallel);
    auto seq = seq_counter.count_lines(test_dir);
    auto par = par_counter.count_lines(test_dir);
    ASSERT_TRUE(seq.is_ok());
    ASSERT_TRUE(par.is_ok());

    EXPECT_EQ(seq.value.total_lines, expected);
    EXPECT_EQ(par.value.total_lines, expected);
    EXPECT_EQ(par.value.total_chars, seq.value.total_chars);
    ASSERT_EQ(par.value.files.size(), seq.value.files.size());
    for (size_t i = 0; i < seq.value.files.size(); ++i) {
        EXPECT_EQ(par.value.files[i].path, seq.value.files[i].path);
        EXPECT_EQ(par.value.files[i].hash, seq.value.files[i].hash);
    }
}

TEST_F(LineCounterTest, FingerprintsAreRelativeAndSorted) {
    write_file("z.rs", "z\n");
    write_file("src/a.rs", "a\n");
    write_file("b.rs", "b\n");

    LineCounter counter;
    auto result = counter.count_lines(test_dir);
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value.files.size(), 3u);
    EXPECT_EQ(result.value.files[0].path, "b.rs");
    EXPECT_EQ(result.value.files[1].path, "src/a.rs");
    EXPECT_EQ(result.value.files[2].path, "z.rs");
    EXPECT_EQ(result.value.files[0].size, 2u);
}

TEST_F(LineCounterTest, MissingRootIsInvalidPath) {
    LineCounter counter;
    auto result = counter.count_lines(test_dir / "does-not-exist");
    EXPECT_TRUE(result.is_err());
    EXPECT_EQ(result.code, ErrorCode::InvalidPath);
}

TEST_F(LineCounterTest, SingleFileRoot) {
    write_file("only.py", numbered_lines(9));
    write_file("other.bin", numbered_lines(2));

    LineCounter counter;
    auto py = counter.count_lines(test_dir / "only.py");
    ASSERT_TRUE(py.is_ok());
    EXPECT_EQ(py.value.total_lines, 9u);

    auto bin = counter.count_lines(test_dir / "other.bin");
    ASSERT_TRUE(bin.is_ok());
    EXPECT_EQ(bin.value.total_lines, 0u);
}

TEST_F(LineCounterTest, CountFileReportsMissingFile) {
    auto result = count_file(test_dir / "gone.rs");
    EXPECT_TRUE(result.is_err());
}
