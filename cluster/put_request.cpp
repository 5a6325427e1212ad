#include "put_request.hpp"
#include <chrono>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>

std::string generateOperationId() {
    static std::mutex generator_mutex;
    static std::mt19937_64 generator{std::random_device{}()};

    uint64_t high;
    uint64_t low;
    {
        std::lock_guard<std::mutex> lock(generator_mutex);
        high = generator();
        low = generator();
    }

    // Version 4, variant 10xx
    high = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    low = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::stringstream ss;
    ss << std::hex << std::setfill('0')
       << std::setw(8) << (high >> 32) << "-"
       << std::setw(4) << ((high >> 16) & 0xFFFF) << "-"
       << std::setw(4) << (high & 0xFFFF) << "-"
       << std::setw(4) << (low >> 48) << "-"
       << std::setw(12) << (low & 0xFFFFFFFFFFFFULL);
    return ss.str();
}

PutRequest PutRequest::create(const std::string& key, const std::string& value) {
    PutRequest request;
    request.key = key;
    request.value = value;
    request.operation_id = generateOperationId();
    request.timestamp = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return request;
}
