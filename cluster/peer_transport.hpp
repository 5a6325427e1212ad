#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include "node.hpp"
#include "put_request.hpp"
#include "minicache.grpc.pb.h"

enum class RpcStatus {
    OK,                // 200
    NOT_FOUND,         // 404
    INVALID_ARGUMENT,  // 400
    INTERNAL,          // 500
    UNAVAILABLE        // timeout / refused
};

struct RpcResult {
    RpcStatus status;
    std::string value;
    std::string message;

    bool ok() const { return status == RpcStatus::OK; }
};

const char* rpcStatusName(RpcStatus status);

// Inter-node channel. Every call is bounded by the caller's timeout.
class PeerTransport {
public:
    virtual ~PeerTransport() = default;

    virtual RpcResult put(const Node& target, const PutRequest& request,
                          std::chrono::milliseconds timeout) = 0;
    virtual RpcResult get(const Node& target, const std::string& key,
                          std::chrono::milliseconds timeout) = 0;
    virtual RpcResult remove(const Node& target, const std::string& key,
                             std::chrono::milliseconds timeout) = 0;
};

class GrpcPeerTransport : public PeerTransport {
private:
    std::mutex stubs_mutex;
    std::unordered_map<std::string, std::unique_ptr<ReplicaService::Stub>> stubs;  // address -> stub

    ReplicaService::Stub& stubFor(const Node& target);

public:
    RpcResult put(const Node& target, const PutRequest& request,
                  std::chrono::milliseconds timeout) override;
    RpcResult get(const Node& target, const std::string& key,
                  std::chrono::milliseconds timeout) override;
    RpcResult remove(const Node& target, const std::string& key,
                     std::chrono::milliseconds timeout) override;

    static RpcStatus fromGrpcStatus(const grpc::Status& status);
};
