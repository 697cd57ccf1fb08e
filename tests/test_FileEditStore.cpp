/**
 * FileEditStore: 读写、str_replace、有界撤销历史与同路径并发。
 */
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include "editor/FileEditStore.h"

namespace fs = std::filesystem;

static std::string readAll(const fs::path& p) {
    std::string s;
    std::ifstream f(p, std::ios::binary);
    if (f) s.assign(std::istreambuf_iterator<char>(f), std::istreambuf_iterator<char>());
    return s;
}

static void writeRaw(const fs::path& p, const std::string& content) {
    std::ofstream f(p, std::ios::binary | std::ios::trunc);
    f << content;
}

class FileEditStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto now = std::chrono::steady_clock::now().time_since_epoch().count();
        testDir = fs::temp_directory_path() / ("anvil_store_test_" + std::to_string(now));
        fs::create_directories(testDir);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testDir, ec);
    }

    fs::path testDir;
};

TEST_F(FileEditStoreTest, WriteThenViewRoundTrip) {
    FileEditStore store;
    fs::path f = testDir / "hello.txt";

    auto written = store.write(f, "Hello, world!");
    ASSERT_TRUE(written.ok()) << written.error().describe();
    EXPECT_EQ(written.value(), "Hello, world!");

    auto viewed = store.view(f);
    ASSERT_TRUE(viewed.ok());
    EXPECT_EQ(viewed.value(), "Hello, world!");
    EXPECT_EQ(readAll(f), "Hello, world!");
}

TEST_F(FileEditStoreTest, WriteNormalizesLineEndingsAndCreatesParents) {
    FileEditStore store;
    fs::path f = testDir / "a" / "b" / "c.txt";

    auto written = store.write(f, "one\r\ntwo\r\n");
    ASSERT_TRUE(written.ok()) << written.error().describe();
    EXPECT_EQ(readAll(f), "one\ntwo\n");
    EXPECT_EQ(store.view(f).value(), "one\ntwo\n");
}

TEST_F(FileEditStoreTest, ViewMissingFileIsNotFound) {
    FileEditStore store;
    auto res = store.view(testDir / "missing.txt");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().kind, ErrorKind::NotFound);

    auto dir = store.view(testDir);
    ASSERT_FALSE(dir.ok());
    EXPECT_EQ(dir.error().kind, ErrorKind::NotFound);
}

TEST_F(FileEditStoreTest, ViewRejectsOversizedFile) {
    FileEditStore store;
    fs::path f = testDir / "big.txt";
    writeRaw(f, std::string(FileEditStore::MAX_FILE_BYTES + 1, 'x'));

    auto res = store.view(f);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().kind, ErrorKind::TooLarge);
}

TEST_F(FileEditStoreTest, ViewRejectsTooManyCharacters) {
    FileEditStore store;
    fs::path f = testDir / "chars.txt";
    // 400001 个字符, 字节数仍低于 400KB
    writeRaw(f, std::string(FileEditStore::MAX_CHARS + 1, 'y'));

    auto res = store.view(f);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().kind, ErrorKind::TooLarge);
}

TEST_F(FileEditStoreTest, WriteTooLargeLeavesDiskUntouched) {
    FileEditStore store;
    fs::path f = testDir / "keep.txt";
    ASSERT_TRUE(store.write(f, "original").ok());

    auto res = store.write(f, std::string(FileEditStore::MAX_CHARS + 1, 'z'));
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().kind, ErrorKind::TooLarge);
    EXPECT_EQ(readAll(f), "original");
    EXPECT_EQ(store.historyDepth(f), 0u);
}

TEST_F(FileEditStoreTest, WriteToDirectoryIsInvalidArgument) {
    FileEditStore store;
    auto res = store.write(testDir, "x");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(FileEditStoreTest, WriteFailsWhenParentCannotBeCreated) {
    FileEditStore store;
    fs::path blocker = testDir / "blocker";
    writeRaw(blocker, "i am a file");

    auto res = store.write(blocker / "child.txt", "x");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().kind, ErrorKind::IOError);
    EXPECT_EQ(store.historyDepth(blocker / "child.txt"), 0u);
}

TEST_F(FileEditStoreTest, UndoRestoresPreviousWrite) {
    FileEditStore store;
    fs::path f = testDir / "undo.txt";

    ASSERT_TRUE(store.write(f, "A").ok());
    ASSERT_TRUE(store.write(f, "B").ok());

    auto undone = store.undo(f);
    ASSERT_TRUE(undone.ok());
    EXPECT_EQ(undone.value(), "A");
    EXPECT_EQ(readAll(f), "A");
    EXPECT_EQ(store.view(f).value(), "A");

    auto again = store.undo(f);
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error().kind, ErrorKind::NoHistory);
}

TEST_F(FileEditStoreTest, UndoOnUntouchedPathHasNoHistory) {
    FileEditStore store;
    fs::path f = testDir / "never.txt";
    writeRaw(f, "content");

    auto res = store.undo(f);
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().kind, ErrorKind::NoHistory);
    EXPECT_EQ(readAll(f), "content");
}

TEST_F(FileEditStoreTest, FirstWriteOverExistingFileIsUndoable) {
    FileEditStore store;
    fs::path f = testDir / "existing.txt";
    writeRaw(f, "before");

    ASSERT_TRUE(store.write(f, "after").ok());
    EXPECT_EQ(store.historyDepth(f), 1u);
    EXPECT_EQ(store.undo(f).value(), "before");
    EXPECT_EQ(readAll(f), "before");
}

TEST_F(FileEditStoreTest, HistoryIsBoundedAndEvictsOldest) {
    FileEditStore store(10);
    fs::path f = testDir / "bounded.txt";
    writeRaw(f, "v0");

    for (int i = 1; i <= 11; ++i) {
        ASSERT_TRUE(store.write(f, "v" + std::to_string(i)).ok());
    }
    EXPECT_EQ(store.historyDepth(f), 10u);

    std::string last;
    for (int i = 0; i < 10; ++i) {
        auto res = store.undo(f);
        ASSERT_TRUE(res.ok()) << "undo #" << i;
        last = res.value();
    }
    // v0 已被挤出, 最早可恢复的是 v1
    EXPECT_EQ(last, "v1");
    EXPECT_EQ(store.undo(f).error().kind, ErrorKind::NoHistory);
}

TEST_F(FileEditStoreTest, ZeroHistoryKeepsNothing) {
    FileEditStore store(0);
    fs::path f = testDir / "zero.txt";
    ASSERT_TRUE(store.write(f, "a").ok());
    ASSERT_TRUE(store.write(f, "b").ok());
    EXPECT_EQ(store.undo(f).error().kind, ErrorKind::NoHistory);
}

TEST_F(FileEditStoreTest, StrReplaceUniqueMatch) {
    FileEditStore store;
    fs::path f = testDir / "replace.txt";
    ASSERT_TRUE(store.write(f, "Hello, world!").ok());

    auto res = store.strReplace(f, "world", "Anvil");
    ASSERT_TRUE(res.ok()) << res.error().describe();
    EXPECT_EQ(res.value(), "Hello, Anvil!");
    EXPECT_EQ(readAll(f), "Hello, Anvil!");

    EXPECT_EQ(store.undo(f).value(), "Hello, world!");
}

TEST_F(FileEditStoreTest, StrReplaceSnippetShowsContext) {
    FileEditStore store;
    fs::path f = testDir / "lines.txt";
    std::string content;
    for (int i = 1; i <= 20; ++i) content += "line" + std::to_string(i) + "\n";
    ASSERT_TRUE(store.write(f, content).ok());

    auto res = store.strReplace(f, "line10\n", "LINE10\nEXTRA\n");
    ASSERT_TRUE(res.ok());
    // 替换起点 (下标 9) 前 4 行, 到起点 + 4 + 插入文本换行数
    EXPECT_EQ(res.value(), "line6\nline7\nline8\nline9\nLINE10\nEXTRA\nline11\nline12\nline13\nline14\nline15");
}

TEST_F(FileEditStoreTest, StrReplaceNoMatchLeavesStateUnchanged) {
    FileEditStore store;
    fs::path f = testDir / "nomatch.txt";
    ASSERT_TRUE(store.write(f, "abc").ok());
    size_t depth = store.historyDepth(f);

    auto res = store.strReplace(f, "xyz", "q");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().kind, ErrorKind::NoMatch);
    EXPECT_EQ(readAll(f), "abc");
    EXPECT_EQ(store.historyDepth(f), depth);
}

TEST_F(FileEditStoreTest, StrReplaceAmbiguousLeavesStateUnchanged) {
    FileEditStore store;
    fs::path f = testDir / "ambiguous.txt";
    ASSERT_TRUE(store.write(f, "foo foo").ok());
    size_t depth = store.historyDepth(f);

    auto res = store.strReplace(f, "foo", "bar");
    ASSERT_FALSE(res.ok());
    EXPECT_EQ(res.error().kind, ErrorKind::AmbiguousMatch);
    EXPECT_EQ(readAll(f), "foo foo");
    EXPECT_EQ(store.historyDepth(f), depth);
}

TEST_F(FileEditStoreTest, StrReplaceMissingFileAndEmptyNeedle) {
    FileEditStore store;
    auto missing = store.strReplace(testDir / "nope.txt", "a", "b");
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error().kind, ErrorKind::NotFound);

    fs::path f = testDir / "empty-needle.txt";
    ASSERT_TRUE(store.write(f, "abc").ok());
    auto empty = store.strReplace(f, "", "b");
    ASSERT_FALSE(empty.ok());
    EXPECT_EQ(empty.error().kind, ErrorKind::InvalidArgument);
}

TEST_F(FileEditStoreTest, ExternalModificationIsPickedUp) {
    FileEditStore store;
    fs::path f = testDir / "external.txt";
    ASSERT_TRUE(store.write(f, "mine").ok());

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    writeRaw(f, "theirs, changed outside");
    fs::last_write_time(f, fs::last_write_time(f) + std::chrono::seconds(2));

    EXPECT_EQ(store.view(f).value(), "theirs, changed outside");
    ASSERT_TRUE(store.write(f, "mine again").ok());
    EXPECT_EQ(store.undo(f).value(), "theirs, changed outside");
}

TEST_F(FileEditStoreTest, DeletedFileUndoesToEmpty) {
    FileEditStore store;
    fs::path f = testDir / "vanish.txt";
    ASSERT_TRUE(store.write(f, "here").ok());
    fs::remove(f);

    ASSERT_TRUE(store.write(f, "back").ok());
    auto res = store.undo(f);
    ASSERT_TRUE(res.ok());
    EXPECT_EQ(res.value(), "");
    EXPECT_TRUE(fs::exists(f));
    EXPECT_EQ(readAll(f), "");
}

TEST_F(FileEditStoreTest, IgnorePatternsRejectEveryOperation) {
    FileEditStore store(10, {"secret\\.txt$"});
    fs::path f = testDir / "secret.txt";

    EXPECT_EQ(store.write(f, "x").error().kind, ErrorKind::InvalidArgument);
    EXPECT_FALSE(fs::exists(f));
    writeRaw(f, "classified");
    EXPECT_EQ(store.view(f).error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(store.strReplace(f, "classified", "x").error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(store.undo(f).error().kind, ErrorKind::InvalidArgument);
    EXPECT_EQ(readAll(f), "classified");
}

TEST_F(FileEditStoreTest, ConcurrentWritesToSamePathKeepHistoryConsistent) {
    FileEditStore store(100);
    fs::path f = testDir / "shared.txt";
    ASSERT_TRUE(store.write(f, "seed").ok());

    const int threads = 8;
    std::vector<std::thread> workers;
    std::atomic<int> failures{0};
    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([&store, &f, &failures, i]() {
            if (!store.write(f, "writer-" + std::to_string(i)).ok()) failures++;
        });
    }
    for (auto& t : workers) t.join();

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(store.historyDepth(f), static_cast<size_t>(threads));

    // 依次撤销, 最终回到 seed, 且每一步都是完整的某次写入
    std::string final;
    for (int i = 0; i < threads; ++i) {
        auto res = store.undo(f);
        ASSERT_TRUE(res.ok());
        final = res.value();
        EXPECT_TRUE(final == "seed" || final.rfind("writer-", 0) == 0) << final;
    }
    EXPECT_EQ(final, "seed");
}

TEST_F(FileEditStoreTest, ConcurrentEditsOnDistinctPathsAreIndependent) {
    FileEditStore store;
    const int threads = 8;
    std::vector<std::thread> workers;
    std::atomic<int> failures{0};
    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([this, &store, &failures, i]() {
            fs::path f = testDir / ("file" + std::to_string(i) + ".txt");
            for (int n = 0; n < 5; ++n) {
                if (!store.write(f, std::to_string(n)).ok()) failures++;
            }
            if (!store.strReplace(f, "4", "four").ok()) failures++;
        });
    }
    for (auto& t : workers) t.join();

    EXPECT_EQ(failures.load(), 0);
    for (int i = 0; i < threads; ++i) {
        fs::path f = testDir / ("file" + std::to_string(i) + ".txt");
        EXPECT_EQ(readAll(f), "four");
        EXPECT_EQ(store.historyDepth(f), 5u);
    }
}
