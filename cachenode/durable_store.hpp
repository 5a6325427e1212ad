#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

// Durable I/O failure. Propagated to the caller, never retried here.
class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// Synchronous key -> value persistence behind the cache.
class DurableStore {
public:
    virtual ~DurableStore() = default;

    virtual void write(const std::string& key, const std::string& value) = 0;

    // nullopt when the key is absent
    virtual std::optional<std::string> read(const std::string& key) = 0;

    // Returns true if the key existed
    virtual bool remove(const std::string& key) = 0;
};

class InMemoryDurableStore : public DurableStore {
private:
    mutable std::mutex db_mutex;
    std::unordered_map<std::string, std::string> records;

public:
    void write(const std::string& key, const std::string& value) override;
    std::optional<std::string> read(const std::string& key) override;
    bool remove(const std::string& key) override;

    size_t size() const;
};

struct RecordMetadata {
    std::string key;
    std::string file_id;     // hex SHA-256 of the key
    size_t size;
    std::string checksum;    // hex SHA-256 of the value
    std::chrono::system_clock::time_point written_at;
};

// One file per key under 256 hashed subdirectories, with a .meta sidecar
// holding the value checksum and the original key.
class FileDurableStore : public DurableStore {
private:
    std::string storage_path;
    std::atomic<int64_t> total_capacity;
    std::atomic<int64_t> used_space;

    mutable std::mutex metadata_mutex;
    std::unordered_map<std::string, RecordMetadata> records;  // key -> metadata

    std::string getRecordPath(const std::string& file_id) const;
    std::string getMetaPath(const std::string& file_id) const;
    void ensureStorageDirectory();
    void loadExistingRecords();

public:
    explicit FileDurableStore(const std::string& storage_path, int64_t capacity_bytes = 1024L * 1024 * 1024); // Default 1GB
    ~FileDurableStore() override = default;

    void write(const std::string& key, const std::string& value) override;
    std::optional<std::string> read(const std::string& key) override;
    bool remove(const std::string& key) override;

    bool hasKey(const std::string& key) const;
    std::vector<std::string> getStoredKeys() const;
    int64_t getAvailableSpace() const;
    int64_t getUsedSpace() const;

    // Verify every indexed record still has its file on disk
    bool performHealthCheck();
};

// Hex-encoded SHA-256 digest
std::string sha256Hex(const std::string& data);
