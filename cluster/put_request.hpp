#pragma once

#include <cstdint>
#include <string>

// One logical write, carried across the replication boundary.
// operation_id is unique per write but receivers do not deduplicate on it.
struct PutRequest {
    std::string key;
    std::string value;
    std::string operation_id;
    int64_t timestamp = 0;  // milliseconds since epoch

    static PutRequest create(const std::string& key, const std::string& value);
};

// Random RFC 4122 version-4 style identifier
std::string generateOperationId();
