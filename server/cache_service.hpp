#pragma once

#include <grpcpp/grpcpp.h>
#include "minicache.grpc.pb.h"
#include "../cluster/coordinator.hpp"

using grpc::ServerContext;
using grpc::Status;

// Inter-node endpoint: replica writes, owner reads and local deletes
class ReplicaServiceImpl final : public ReplicaService::Service {
private:
    DistributedCoordinator* coordinator;

public:
    explicit ReplicaServiceImpl(DistributedCoordinator* coordinator) : coordinator(coordinator) {}

    Status Put(ServerContext* context, const ::ReplicaWrite* request, ::Ack* response) override;
    Status Get(ServerContext* context, const ::KeyRequest* request, ::ValueResponse* response) override;
    Status Delete(ServerContext* context, const ::KeyRequest* request, ::Ack* response) override;
};

// Client-facing endpoint routed through the coordinator
class CacheServiceImpl final : public CacheService::Service {
private:
    DistributedCoordinator* coordinator;

public:
    explicit CacheServiceImpl(DistributedCoordinator* coordinator) : coordinator(coordinator) {}

    Status Put(ServerContext* context, const ::WriteRequest* request, ::Ack* response) override;
    Status Get(ServerContext* context, const ::KeyRequest* request, ::ValueResponse* response) override;
    Status Delete(ServerContext* context, const ::KeyRequest* request, ::Ack* response) override;
};
