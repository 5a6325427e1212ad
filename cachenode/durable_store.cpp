#include "durable_store.hpp"
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <openssl/sha.h>

namespace fs = std::filesystem;

std::string sha256Hex(const std::string& data) {
    unsigned char hash[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), hash);

    std::stringstream ss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

// InMemoryDurableStore

void InMemoryDurableStore::write(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(db_mutex);
    records[key] = value;
}

std::optional<std::string> InMemoryDurableStore::read(const std::string& key) {
    std::lock_guard<std::mutex> lock(db_mutex);
    auto it = records.find(key);
    if (it == records.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool InMemoryDurableStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(db_mutex);
    return records.erase(key) > 0;
}

size_t InMemoryDurableStore::size() const {
    std::lock_guard<std::mutex> lock(db_mutex);
    return records.size();
}

// FileDurableStore

FileDurableStore::FileDurableStore(const std::string& storage_path, int64_t capacity_bytes)
    : storage_path(storage_path), total_capacity(capacity_bytes), used_space(0) {

    ensureStorageDirectory();
    loadExistingRecords();

    std::cout << "[INFO] Durable store initialized at " << storage_path
              << " with capacity " << capacity_bytes / (1024*1024) << " MB\n";
    std::cout << "[INFO] Found " << records.size() << " existing records, "
              << "using " << used_space.load() << " bytes\n";
}

void FileDurableStore::ensureStorageDirectory() {
    std::error_code ec;
    fs::create_directories(storage_path, ec);
    if (ec) {
        throw StoreError("Failed to create storage directory " + storage_path + ": " + ec.message());
    }

    // Two-level hierarchy keyed by the first byte of the file id
    for (int i = 0; i < 256; ++i) {
        std::stringstream ss;
        ss << std::hex << std::setfill('0') << std::setw(2) << i;
        fs::create_directories(fs::path(storage_path) / ss.str(), ec);
        if (ec) {
            throw StoreError("Failed to create storage subdirectory: " + ec.message());
        }
    }
}

void FileDurableStore::loadExistingRecords() {
    std::lock_guard<std::mutex> lock(metadata_mutex);

    for (const auto& dir_entry : fs::recursive_directory_iterator(storage_path)) {
        if (!dir_entry.is_regular_file() || dir_entry.path().extension() != ".meta") {
            continue;
        }

        std::ifstream meta_file(dir_entry.path());
        if (!meta_file.is_open()) {
            std::cerr << "[WARNING] Cannot open metadata file " << dir_entry.path() << "\n";
            continue;
        }

        RecordMetadata metadata;
        std::string size_line;
        std::getline(meta_file, metadata.checksum);
        std::getline(meta_file, size_line);
        std::stringstream key_stream;
        key_stream << meta_file.rdbuf();
        metadata.key = key_stream.str();
        metadata.file_id = dir_entry.path().stem().string();
        metadata.written_at = std::chrono::system_clock::now(); // Approximate

        fs::path record_path = dir_entry.path();
        record_path.replace_extension(".rec");
        if (!fs::exists(record_path)) {
            std::cerr << "[WARNING] Metadata without record file: " << metadata.file_id << "\n";
            continue;
        }
        metadata.size = fs::file_size(record_path);

        used_space += static_cast<int64_t>(metadata.size);
        records[metadata.key] = metadata;
    }
}

std::string FileDurableStore::getRecordPath(const std::string& file_id) const {
    fs::path record_path = fs::path(storage_path) / file_id.substr(0, 2) / (file_id + ".rec");
    return record_path.string();
}

std::string FileDurableStore::getMetaPath(const std::string& file_id) const {
    fs::path meta_path = fs::path(storage_path) / file_id.substr(0, 2) / (file_id + ".meta");
    return meta_path.string();
}

void FileDurableStore::write(const std::string& key, const std::string& value) {
    int64_t previous_size = 0;
    {
        std::lock_guard<std::mutex> lock(metadata_mutex);
        auto it = records.find(key);
        if (it != records.end()) {
            previous_size = static_cast<int64_t>(it->second.size);
        }
    }

    // Check capacity
    if (used_space.load() - previous_size + static_cast<int64_t>(value.size()) > total_capacity.load()) {
        throw StoreError("Insufficient storage space for key " + key);
    }

    std::string file_id = sha256Hex(key);
    std::string record_path = getRecordPath(file_id);

    std::ofstream file(record_path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
        throw StoreError("Failed to open file for writing: " + record_path);
    }

    file.write(value.data(), value.size());
    file.flush();

    if (!file.good()) {
        file.close();
        fs::remove(record_path);
        throw StoreError("Failed to write record for key " + key);
    }
    file.close();

    std::string checksum = sha256Hex(value);

    std::ofstream meta_file(getMetaPath(file_id), std::ios::trunc);
    if (!meta_file.is_open()) {
        throw StoreError("Failed to write metadata for key " + key);
    }
    meta_file << checksum << "\n" << value.size() << "\n" << key;
    meta_file.close();

    std::lock_guard<std::mutex> lock(metadata_mutex);
    RecordMetadata metadata;
    metadata.key = key;
    metadata.file_id = file_id;
    metadata.size = value.size();
    metadata.checksum = checksum;
    metadata.written_at = std::chrono::system_clock::now();

    // Update case
    auto it = records.find(key);
    if (it != records.end()) {
        used_space -= static_cast<int64_t>(it->second.size);
    }

    records[key] = metadata;
    used_space += static_cast<int64_t>(metadata.size);
}

std::optional<std::string> FileDurableStore::read(const std::string& key) {
    std::string expected_checksum;
    std::string file_id;
    {
        std::lock_guard<std::mutex> lock(metadata_mutex);
        auto it = records.find(key);
        if (it == records.end()) {
            return std::nullopt;
        }
        expected_checksum = it->second.checksum;
        file_id = it->second.file_id;
    }

    std::string record_path = getRecordPath(file_id);
    std::ifstream file(record_path, std::ios::binary);
    if (!file.is_open()) {
        throw StoreError("Failed to open record file: " + record_path);
    }

    std::stringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        throw StoreError("Failed to read record for key " + key);
    }
    std::string value = ss.str();

    if (!expected_checksum.empty() && sha256Hex(value) != expected_checksum) {
        throw StoreError("Checksum verification failed for key " + key);
    }

    return value;
}

bool FileDurableStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(metadata_mutex);

    auto it = records.find(key);
    if (it == records.end()) {
        return false;
    }

    std::error_code ec;
    fs::remove(getRecordPath(it->second.file_id), ec);
    if (ec) {
        throw StoreError("Failed to delete record for key " + key + ": " + ec.message());
    }
    fs::remove(getMetaPath(it->second.file_id), ec);

    used_space -= static_cast<int64_t>(it->second.size);
    records.erase(it);
    return true;
}

bool FileDurableStore::hasKey(const std::string& key) const {
    std::lock_guard<std::mutex> lock(metadata_mutex);
    return records.find(key) != records.end();
}

std::vector<std::string> FileDurableStore::getStoredKeys() const {
    std::lock_guard<std::mutex> lock(metadata_mutex);
    std::vector<std::string> keys;
    keys.reserve(records.size());

    for (const auto& [key, _] : records) {
        keys.push_back(key);
    }

    return keys;
}

int64_t FileDurableStore::getAvailableSpace() const {
    return total_capacity.load() - used_space.load();
}

int64_t FileDurableStore::getUsedSpace() const {
    return used_space.load();
}

bool FileDurableStore::performHealthCheck() {
    std::lock_guard<std::mutex> lock(metadata_mutex);

    int missing_records = 0;
    for (const auto& [key, metadata] : records) {
        if (!fs::exists(getRecordPath(metadata.file_id))) {
            std::cerr << "[WARNING] Missing record file for key: " << key << "\n";
            missing_records++;
        }
    }

    if (missing_records > 0) {
        std::cerr << "[WARNING] Health check found " << missing_records << " issues\n";
        return false;
    }

    return true;
}
