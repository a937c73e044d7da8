#include "storage/Manager.hpp"
#include "storage/FileHandle.hpp"
#include "storage/Error.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <set>
#include <thread>

namespace fs = std::filesystem;

using namespace rh::storage;

class ManagerTest : public ::testing::Test {
protected:
    fs::path test_dir;
    std::unique_ptr<Manager> manager;

    static constexpr uintmax_t LIMIT = 1024;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() / (std::string("reelhall_manager_") + info->name());
        fs::remove_all(test_dir);
        manager = std::make_unique<Manager>(test_dir / "uploads", LIMIT,
                                            std::vector<std::string>{".mp4", ".webm", ".png"});
        manager->ensureRoot();
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    static void writeTextFile(const fs::path& path, const std::string& content) {
        std::ofstream out(path);
        out << content;
    }

    [[nodiscard]] std::size_t filesOnDisk() const {
        return static_cast<std::size_t>(std::distance(fs::directory_iterator(manager->root()), fs::directory_iterator{}));
    }
};

TEST_F(ManagerTest, EnsureRootCreatesDirectory) {
    EXPECT_TRUE(fs::is_directory(test_dir / "uploads"));
    EXPECT_NO_THROW(manager->ensureRoot());
}

TEST_F(ManagerTest, StoreThenListRoundTrip) {
    const std::string content = "not really a video";
    const auto stored = manager->store("clip.mp4", content.size(), content);

    EXPECT_EQ(stored.displayName, "clip.mp4");
    EXPECT_TRUE(stored.storedName.ends_with("-clip.mp4"));
    EXPECT_EQ(stored.sizeBytes, content.size());
    ASSERT_TRUE(stored.mimeType);
    EXPECT_EQ(*stored.mimeType, "video/mp4");

    const auto files = manager->list();
    ASSERT_EQ(files.size(), 1u);
    EXPECT_EQ(files[0].storedName, stored.storedName);
    EXPECT_EQ(files[0].displayName, "clip.mp4");
    EXPECT_EQ(files[0].sizeBytes, content.size());

    const auto handle = manager->open(stored.storedName);
    EXPECT_EQ(handle->size(), content.size());
    const auto bytes = handle->read(0, content.size());
    EXPECT_EQ(std::string(bytes.begin(), bytes.end()), content);
}

TEST_F(ManagerTest, SameDisplayNameGetsDistinctStoredNames) {
    std::set<std::string> names;
    for (int i = 0; i < 20; ++i) names.insert(manager->store("same.mp4", 1, "x").storedName);

    EXPECT_EQ(names.size(), 20u);
    EXPECT_EQ(manager->list().size(), 20u);
}

TEST_F(ManagerTest, ConcurrentStoresNeverCollide) {
    std::vector<std::thread> threads;
    std::mutex m;
    std::set<std::string> names;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < 10; ++i) {
                auto f = manager->store("race.mp4", 2, "ab");
                std::scoped_lock lock(m);
                names.insert(f.storedName);
            }
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(names.size(), 40u);
    EXPECT_EQ(filesOnDisk(), 40u);
}

TEST_F(ManagerTest, DeleteIsFinal) {
    const auto stored = manager->store("gone.mp4", 3, "abc");
    manager->remove(stored.storedName);

    EXPECT_TRUE(manager->list().empty());
    EXPECT_FALSE(fs::exists(manager->root() / stored.storedName));

    try {
        manager->remove(stored.storedName);
        FAIL() << "second delete should report NotFound";
    } catch (const Error& e) {
        EXPECT_EQ(e.reason(), Error::Reason::NotFound);
    }

    try {
        (void)manager->open(stored.storedName);
        FAIL() << "open after delete should report NotFound";
    } catch (const Error& e) {
        EXPECT_EQ(e.reason(), Error::Reason::NotFound);
    }
}

TEST_F(ManagerTest, DisallowedExtensionCreatesNothing) {
    try {
        (void)manager->store("script.sh", 4, "echo");
        FAIL() << "expected UnsupportedType";
    } catch (const Error& e) {
        EXPECT_EQ(e.reason(), Error::Reason::UnsupportedType);
        EXPECT_STREQ(e.what(), "Extension .sh not allowed");
    }

    EXPECT_THROW((void)manager->store("noextension", 1, "x"), Error);
    EXPECT_EQ(filesOnDisk(), 0u);
}

TEST_F(ManagerTest, ExtensionCheckIsCaseInsensitive) {
    const auto stored = manager->store("LOUD.MP4", 1, "x");
    EXPECT_EQ(manager->list().size(), 1u);
    ASSERT_TRUE(stored.mimeType);
    EXPECT_EQ(*stored.mimeType, "video/mp4");
}

TEST_F(ManagerTest, OversizedUploadCreatesNothing) {
    const std::string big(LIMIT + 1, 'x');
    try {
        (void)manager->store("big.mp4", big.size(), big);
        FAIL() << "expected TooLarge";
    } catch (const Error& e) {
        EXPECT_EQ(e.reason(), Error::Reason::TooLarge);
        EXPECT_STREQ(e.what(), "File too large. Limit is 0.0009765625MB");
    }
    EXPECT_EQ(filesOnDisk(), 0u);

    const std::string exact(LIMIT, 'x');
    EXPECT_NO_THROW((void)manager->store("exact.mp4", exact.size(), exact));
}

TEST_F(ManagerTest, UnsafeDisplayNameIsRejected) {
    try {
        (void)manager->store("../escape.mp4", 1, "x");
        FAIL() << "expected PathTraversal";
    } catch (const Error& e) {
        EXPECT_EQ(e.reason(), Error::Reason::PathTraversal);
    }
    EXPECT_EQ(filesOnDisk(), 0u);
    EXPECT_FALSE(fs::exists(test_dir / "escape.mp4"));
}

TEST_F(ManagerTest, DotsInsideDisplayNameAreKept) {
    const auto f = manager->store("clip..final.mp4", 1, "x");
    EXPECT_TRUE(f.storedName.ends_with("-clip..final.mp4"));
    EXPECT_EQ(f.displayName, "clip..final.mp4");
    EXPECT_TRUE(fs::exists(manager->root() / f.storedName));

    manager->remove(f.storedName);
    EXPECT_EQ(filesOnDisk(), 0u);
}

TEST_F(ManagerTest, TraversalOnDeleteAndOpen) {
    writeTextFile(test_dir / "outside.mp4", "secret");

    for (const std::string name : {"../outside.mp4", "a/b.mp4", "..\\outside.mp4"}) {
        try {
            manager->remove(name);
            FAIL() << name;
        } catch (const Error& e) {
            EXPECT_EQ(e.reason(), Error::Reason::PathTraversal) << name;
        }
        EXPECT_THROW((void)manager->open(name), Error);
    }
    EXPECT_TRUE(fs::exists(test_dir / "outside.mp4"));
}

TEST_F(ManagerTest, ListIsNewestFirst) {
    const auto a = manager->store("a.mp4", 1, "a");
    std::this_thread::sleep_for(std::chrono::milliseconds(15));
    const auto b = manager->store("b.mp4", 1, "b");
    std::this_thread::sleep_for(std::chrono::milliseconds(15));
    const auto c = manager->store("c.mp4", 1, "c");

    const auto files = manager->list();
    ASSERT_EQ(files.size(), 3u);
    EXPECT_EQ(files[0].storedName, c.storedName);
    EXPECT_EQ(files[1].storedName, b.storedName);
    EXPECT_EQ(files[2].storedName, a.storedName);
}

TEST_F(ManagerTest, HiddenEntriesAreInvisible) {
    writeTextFile(manager->root() / "notes.txt", "hello");
    fs::create_directory(manager->root() / "subdir.mp4");

    EXPECT_TRUE(manager->list().empty());

    try {
        (void)manager->open("notes.txt");
        FAIL() << "non allow-listed name must not be served";
    } catch (const Error& e) {
        EXPECT_EQ(e.reason(), Error::Reason::NotFound);
    }

    EXPECT_THROW(manager->remove("notes.txt"), Error);
    EXPECT_TRUE(fs::exists(manager->root() / "notes.txt"));

    EXPECT_THROW(manager->remove("subdir.mp4"), Error);
    EXPECT_TRUE(fs::is_directory(manager->root() / "subdir.mp4"));
}

TEST_F(ManagerTest, ExternallyPlacedFilesAreListedWithDecodedNames) {
    writeTextFile(manager->root() / "plain.png", "png");
    writeTextFile(manager->root() / "1700000000000-old.webm", "webm");

    const auto files = manager->list();
    ASSERT_EQ(files.size(), 2u);

    std::set<std::string> display;
    for (const auto& f : files) display.insert(f.displayName);
    EXPECT_TRUE(display.contains("plain.png"));
    EXPECT_TRUE(display.contains("old.webm"));

    const auto st = manager->stat("plain.png");
    EXPECT_EQ(st.sizeBytes, 3u);
    ASSERT_TRUE(st.mimeType);
    EXPECT_EQ(*st.mimeType, "image/png");
}

TEST_F(ManagerTest, PartialReadsThroughHandle) {
    std::string content;
    for (int i = 0; i < 1000; ++i) content += static_cast<char>('a' + i % 26);
    const auto stored = manager->store("long.mp4", content.size(), content);

    const auto handle = manager->open(stored.storedName);
    const auto window = handle->read(500, 100);
    EXPECT_EQ(std::string(window.begin(), window.end()), content.substr(500, 100));

    // Reads past the end are short, not errors
    const auto tail = handle->read(990, 100);
    EXPECT_EQ(tail.size(), 10u);
}
