#include <gtest/gtest.h>
#include "durable_store.hpp"
#include "unit_test_utils.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <thread>

class FileDurableStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = std::make_unique<unit_test_utils::TempDirectory>();
        store_ = std::make_unique<FileDurableStore>(temp_dir_->path(), 10 * 1024 * 1024); // 10MB capacity
    }

    void TearDown() override {
        store_.reset(); // Destroy store before cleaning up directory
    }

    std::string recordPath(const std::string& key) const {
        std::string file_id = sha256Hex(key);
        return temp_dir_->path() + "/" + file_id.substr(0, 2) + "/" + file_id + ".rec";
    }

    std::unique_ptr<unit_test_utils::TempDirectory> temp_dir_;
    std::unique_ptr<FileDurableStore> store_;
};

TEST_F(FileDurableStoreTest, WriteAndRead) {
    store_->write("user:1", "Hello, MiniCache!");

    EXPECT_TRUE(store_->hasKey("user:1"));
    auto value = store_->read("user:1");
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, "Hello, MiniCache!");
}

TEST_F(FileDurableStoreTest, EmptyValue) {
    store_->write("empty", "");

    auto value = store_->read("empty");
    ASSERT_TRUE(value.has_value());
    EXPECT_TRUE(value->empty());
}

TEST_F(FileDurableStoreTest, BinaryValue) {
    std::string value("a\0b\0c", 5);
    store_->write("binary", value);

    EXPECT_EQ(store_->read("binary"), value);
}

TEST_F(FileDurableStoreTest, OverwriteReplacesValueAndSpace) {
    store_->write("key", std::string(100, 'a'));
    store_->write("key", std::string(40, 'b'));

    EXPECT_EQ(store_->read("key"), std::string(40, 'b'));
    EXPECT_EQ(store_->getUsedSpace(), 40);
}

TEST_F(FileDurableStoreTest, ReadMissingKeyIsNotFound) {
    EXPECT_FALSE(store_->read("nonexistent").has_value());
}

TEST_F(FileDurableStoreTest, RemoveKey) {
    store_->write("key", "value");

    EXPECT_TRUE(store_->remove("key"));
    EXPECT_FALSE(store_->hasKey("key"));
    EXPECT_FALSE(store_->read("key").has_value());
    EXPECT_FALSE(std::filesystem::exists(recordPath("key")));
    EXPECT_EQ(store_->getUsedSpace(), 0);

    EXPECT_FALSE(store_->remove("key"));
}

TEST_F(FileDurableStoreTest, CapacityExhaustionThrowsStoreError) {
    FileDurableStore small(temp_dir_->file_path("small"), 100);

    small.write("fits", std::string(60, 'x'));
    EXPECT_THROW(small.write("too_big", std::string(60, 'y')), StoreError);

    // Overwriting the same key reuses its space
    EXPECT_NO_THROW(small.write("fits", std::string(90, 'z')));
    EXPECT_EQ(small.getAvailableSpace(), 10);
}

TEST_F(FileDurableStoreTest, CorruptedRecordFailsChecksum) {
    store_->write("key", "original");

    std::ofstream corrupt(recordPath("key"), std::ios::binary | std::ios::trunc);
    corrupt << "tampered";
    corrupt.close();

    EXPECT_THROW(store_->read("key"), StoreError);
}

TEST_F(FileDurableStoreTest, HealthCheckDetectsMissingRecord) {
    EXPECT_TRUE(store_->performHealthCheck());

    store_->write("health", "value");
    EXPECT_TRUE(store_->performHealthCheck());

    std::filesystem::remove(recordPath("health"));
    EXPECT_FALSE(store_->performHealthCheck());
}

TEST_F(FileDurableStoreTest, PersistenceAcrossInstances) {
    store_->write("persistent", "survives restart");
    store_.reset();

    store_ = std::make_unique<FileDurableStore>(temp_dir_->path(), 10 * 1024 * 1024);

    EXPECT_TRUE(store_->hasKey("persistent"));
    EXPECT_EQ(store_->read("persistent"), "survives restart");
    EXPECT_EQ(store_->getUsedSpace(), static_cast<int64_t>(std::string("survives restart").size()));
}

TEST_F(FileDurableStoreTest, RecordsLiveInHashedSubdirectories) {
    store_->write("layout", "value");

    std::string file_id = sha256Hex("layout");
    std::string subdir = temp_dir_->path() + "/" + file_id.substr(0, 2);
    EXPECT_TRUE(std::filesystem::exists(subdir + "/" + file_id + ".rec"));
    EXPECT_TRUE(std::filesystem::exists(subdir + "/" + file_id + ".meta"));
}

TEST_F(FileDurableStoreTest, GetStoredKeys) {
    store_->write("a", "1");
    store_->write("b", "2");

    auto keys = store_->getStoredKeys();
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<std::string>{"a", "b"}));
}

TEST_F(FileDurableStoreTest, ConcurrentOperations) {
    const int num_threads = 5;
    const int keys_per_thread = 10;
    std::atomic<int> successful_reads{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < keys_per_thread; ++i) {
                std::string key = "thread_" + std::to_string(t) + "_key_" + std::to_string(i);
                std::string value(100 + i, static_cast<char>('a' + t));

                store_->write(key, value);
                if (store_->read(key) == value) {
                    successful_reads++;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    int expected_operations = num_threads * keys_per_thread;
    EXPECT_EQ(successful_reads.load(), expected_operations);
    EXPECT_EQ(store_->getStoredKeys().size(), expected_operations);
}

TEST(InMemoryDurableStoreTest, WriteReadRemove) {
    InMemoryDurableStore store;

    EXPECT_FALSE(store.read("key").has_value());

    store.write("key", "v1");
    store.write("key", "v2");
    EXPECT_EQ(store.read("key"), "v2");
    EXPECT_EQ(store.size(), 1);

    EXPECT_TRUE(store.remove("key"));
    EXPECT_FALSE(store.remove("key"));
    EXPECT_EQ(store.size(), 0);
}

TEST(Sha256HexTest, KnownDigest) {
    EXPECT_EQ(sha256Hex("abc"),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
