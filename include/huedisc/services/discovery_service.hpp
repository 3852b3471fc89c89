/**
 * @file discovery_service.hpp
 * @brief Callback gRPC service exposing the discovery engine to local clients.
 *
 * BridgeDiscovery is the API a home-automation process talks to:
 * - DiscoverBridges: run one session and return its bridges
 * - StopDiscovery: cancel the running session
 * - GetStatus: coordinator state, stage and last outcome
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#pragma once

#include "huedisc/core/discovery_coordinator.hpp"
#include "huedisc/services/export.hpp"

#include <grpcpp/grpcpp.h>
#include <memory>

// Include generated gRPC service base
#include "huedisc/proto/discovery_service.grpc.pb.h"

namespace huedisc {
namespace services {

/**
 * @class DiscoveryServiceImpl
 * @brief Implementation of the BridgeDiscovery gRPC service.
 *
 * Usage:
 * @code
 * auto coordinator = std::make_shared<core::DiscoveryCoordinator>(strategies);
 * DiscoveryServiceImpl service(coordinator, caps.mdns);
 *
 * grpc::ServerBuilder builder;
 * builder.AddListeningPort("127.0.0.1:5680", grpc::InsecureServerCredentials());
 * builder.RegisterService(&service);
 * auto server = builder.BuildAndStart();
 * @endcode
 */
class HUEDISC_SERVICES_API DiscoveryServiceImpl final : public rpc::BridgeDiscovery::CallbackService {
public:
    DiscoveryServiceImpl(std::shared_ptr<core::DiscoveryCoordinator> coordinator,
                         bool mdnsAvailable);

    /**
     * @brief Handle DiscoverBridges RPC.
     * Finishes when the session completes. A call made while another
     * session runs finishes at once with outcome "rejected".
     */
    grpc::ServerUnaryReactor* DiscoverBridges(
        grpc::CallbackServerContext* context,
        const rpc::DiscoverBridgesRequest* request,
        rpc::DiscoverBridgesResponse* response) override;

    grpc::ServerUnaryReactor* StopDiscovery(
        grpc::CallbackServerContext* context,
        const rpc::StopDiscoveryRequest* request,
        rpc::StopDiscoveryResponse* response) override;

    grpc::ServerUnaryReactor* GetStatus(
        grpc::CallbackServerContext* context,
        const rpc::GetStatusRequest* request,
        rpc::GetStatusResponse* response) override;

private:
    std::shared_ptr<core::DiscoveryCoordinator> coordinator_;
    bool mdnsAvailable_;
};

/**
 * @brief Copy a bridge record into its wire form.
 */
HUEDISC_SERVICES_API void toProto(const core::BridgeRecord& record, rpc::BridgeRecord* out);

}  // namespace services
}  // namespace huedisc
