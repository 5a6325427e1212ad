#include "cache_service.hpp"
#include <iostream>

namespace {

Status emptyKey() {
    return Status(grpc::StatusCode::INVALID_ARGUMENT, "Key must not be empty");
}

Status storeFailure(const std::string& key, const std::exception& e) {
    std::cerr << "[ERROR] Request for key " << key << " failed: " << e.what() << "\n";
    return Status(grpc::StatusCode::INTERNAL, e.what());
}

}  // namespace

// ReplicaServiceImpl

Status ReplicaServiceImpl::Put(ServerContext* context, const ::ReplicaWrite* request, ::Ack* response) {
    if (request->key().empty()) {
        return emptyKey();
    }

    PutRequest write;
    write.key = request->key();
    write.value = request->value();
    write.operation_id = request->operation_id();
    write.timestamp = request->timestamp();

    try {
        coordinator->handlePutRequest(write);
    } catch (const std::exception& e) {
        return storeFailure(request->key(), e);
    }

    response->set_ok(true);
    response->set_message("Replica stored");
    return Status::OK;
}

Status ReplicaServiceImpl::Get(ServerContext* context, const ::KeyRequest* request, ::ValueResponse* response) {
    if (request->key().empty()) {
        return emptyKey();
    }

    std::optional<std::string> value;
    try {
        value = coordinator->handleGetRequest(request->key());
    } catch (const std::exception& e) {
        return storeFailure(request->key(), e);
    }

    if (!value.has_value()) {
        return Status(grpc::StatusCode::NOT_FOUND, "Key not found");
    }

    response->set_found(true);
    response->set_key(request->key());
    response->set_value(*value);
    return Status::OK;
}

Status ReplicaServiceImpl::Delete(ServerContext* context, const ::KeyRequest* request, ::Ack* response) {
    if (request->key().empty()) {
        return emptyKey();
    }

    bool removed = false;
    try {
        removed = coordinator->handleDeleteRequest(request->key());
    } catch (const std::exception& e) {
        return storeFailure(request->key(), e);
    }

    if (!removed) {
        return Status(grpc::StatusCode::NOT_FOUND, "Key not found");
    }

    response->set_ok(true);
    response->set_message("Key removed");
    return Status::OK;
}

// CacheServiceImpl

Status CacheServiceImpl::Put(ServerContext* context, const ::WriteRequest* request, ::Ack* response) {
    if (request->key().empty()) {
        return emptyKey();
    }

    bool replicated = false;
    try {
        replicated = coordinator->put(request->key(), request->value());
    } catch (const std::exception& e) {
        return storeFailure(request->key(), e);
    }

    // A failed replication still leaves the local replica written
    response->set_ok(replicated);
    response->set_message(replicated ? "Write replicated" : "Replication failed");
    return Status::OK;
}

Status CacheServiceImpl::Get(ServerContext* context, const ::KeyRequest* request, ::ValueResponse* response) {
    if (request->key().empty()) {
        return emptyKey();
    }

    std::optional<std::string> value;
    try {
        value = coordinator->get(request->key());
    } catch (const std::exception& e) {
        return storeFailure(request->key(), e);
    }

    if (!value.has_value()) {
        return Status(grpc::StatusCode::NOT_FOUND, "Key not found");
    }

    response->set_found(true);
    response->set_key(request->key());
    response->set_value(*value);
    return Status::OK;
}

Status CacheServiceImpl::Delete(ServerContext* context, const ::KeyRequest* request, ::Ack* response) {
    if (request->key().empty()) {
        return emptyKey();
    }

    bool confirmed = false;
    try {
        confirmed = coordinator->remove(request->key());
    } catch (const std::exception& e) {
        return storeFailure(request->key(), e);
    }

    response->set_ok(confirmed);
    response->set_message(confirmed ? "Key removed" : "Some replicas did not confirm the delete");
    return Status::OK;
}
