#include "peer_transport.hpp"
#include <grpcpp/grpcpp.h>

const char* rpcStatusName(RpcStatus status) {
    switch (status) {
        case RpcStatus::OK: return "OK";
        case RpcStatus::NOT_FOUND: return "NOT_FOUND";
        case RpcStatus::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case RpcStatus::INTERNAL: return "INTERNAL";
        case RpcStatus::UNAVAILABLE: return "UNAVAILABLE";
    }
    return "UNKNOWN";
}

RpcStatus GrpcPeerTransport::fromGrpcStatus(const grpc::Status& status) {
    switch (status.error_code()) {
        case grpc::StatusCode::OK:
            return RpcStatus::OK;
        case grpc::StatusCode::NOT_FOUND:
            return RpcStatus::NOT_FOUND;
        case grpc::StatusCode::INVALID_ARGUMENT:
            return RpcStatus::INVALID_ARGUMENT;
        case grpc::StatusCode::UNAVAILABLE:
        case grpc::StatusCode::DEADLINE_EXCEEDED:
        case grpc::StatusCode::CANCELLED:
            return RpcStatus::UNAVAILABLE;
        default:
            return RpcStatus::INTERNAL;
    }
}

ReplicaService::Stub& GrpcPeerTransport::stubFor(const Node& target) {
    std::lock_guard<std::mutex> lock(stubs_mutex);

    auto it = stubs.find(target.address());
    if (it == stubs.end()) {
        auto channel = grpc::CreateChannel(target.address(), grpc::InsecureChannelCredentials());
        it = stubs.emplace(target.address(), ReplicaService::NewStub(channel)).first;
    }
    return *it->second;
}

RpcResult GrpcPeerTransport::put(const Node& target, const PutRequest& request,
                                 std::chrono::milliseconds timeout) {
    ReplicaWrite write;
    write.set_key(request.key);
    write.set_value(request.value);
    write.set_operation_id(request.operation_id);
    write.set_timestamp(request.timestamp);

    Ack ack;
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + timeout);

    grpc::Status status = stubFor(target).Put(&context, write, &ack);
    if (!status.ok()) {
        return {fromGrpcStatus(status), "", status.error_message()};
    }
    if (!ack.ok()) {
        return {RpcStatus::INTERNAL, "", ack.message()};
    }
    return {RpcStatus::OK, "", ack.message()};
}

RpcResult GrpcPeerTransport::get(const Node& target, const std::string& key,
                                 std::chrono::milliseconds timeout) {
    KeyRequest request;
    request.set_key(key);

    ValueResponse response;
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + timeout);

    grpc::Status status = stubFor(target).Get(&context, request, &response);
    if (!status.ok()) {
        return {fromGrpcStatus(status), "", status.error_message()};
    }
    if (!response.found()) {
        return {RpcStatus::NOT_FOUND, "", "Key not found"};
    }
    return {RpcStatus::OK, response.value(), ""};
}

RpcResult GrpcPeerTransport::remove(const Node& target, const std::string& key,
                                    std::chrono::milliseconds timeout) {
    KeyRequest request;
    request.set_key(key);

    Ack ack;
    grpc::ClientContext context;
    context.set_deadline(std::chrono::system_clock::now() + timeout);

    grpc::Status status = stubFor(target).Delete(&context, request, &ack);
    if (!status.ok()) {
        return {fromGrpcStatus(status), "", status.error_message()};
    }
    return {ack.ok() ? RpcStatus::OK : RpcStatus::INTERNAL, "", ack.message()};
}
