/**
 * @file discovery_service.cpp
 * @brief BridgeDiscovery gRPC service implementation
 *
 * @copyright Copyright (c) 2024 huedisc Contributors
 * @license MIT License
 */

#include "huedisc/services/discovery_service.hpp"
#include "huedisc/utils/logger.hpp"

#include <chrono>
#include <vector>

namespace huedisc {
namespace services {

void toProto(const core::BridgeRecord& record, rpc::BridgeRecord* out) {
    out->set_id(record.id);
    out->set_normalized_id(record.normalized_id);
    out->set_ip_address(record.ip_address);
    out->set_port(record.port);
    out->set_name(record.name);
}

DiscoveryServiceImpl::DiscoveryServiceImpl(std::shared_ptr<core::DiscoveryCoordinator> coordinator,
                                           bool mdnsAvailable)
    : coordinator_(std::move(coordinator))
    , mdnsAvailable_(mdnsAvailable)
{
    LOG_INFO("DiscoveryService", "Service ready (mode={}, mdns={})",
             core::toString(coordinator_->mode()), mdnsAvailable_);
}

// =============================================================================
// DiscoverBridges
// =============================================================================

grpc::ServerUnaryReactor* DiscoveryServiceImpl::DiscoverBridges(
    grpc::CallbackServerContext* context,
    const rpc::DiscoverBridgesRequest* /*request*/,
    rpc::DiscoverBridgesResponse* response) {

    auto* reactor = context->DefaultReactor();
    auto started = std::chrono::steady_clock::now();

    LOG_DEBUG("DiscoveryService", "DiscoverBridges from {}", context->peer());

    bool accepted = coordinator_->discoverBridgesWithOutcome(
        [reactor, response, started](std::vector<core::BridgeRecord> bridges,
                                     core::DiscoveryOutcome outcome) {
            for (const auto& bridge : bridges) {
                toProto(bridge, response->add_bridges());
            }
            response->set_outcome(core::toString(outcome));
            response->set_elapsed_ms(std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count());
            reactor->Finish(grpc::Status::OK);
        });

    if (!accepted) {
        LOG_INFO("DiscoveryService", "DiscoverBridges rejected, session already running");
    }
    return reactor;
}

// =============================================================================
// StopDiscovery
// =============================================================================

grpc::ServerUnaryReactor* DiscoveryServiceImpl::StopDiscovery(
    grpc::CallbackServerContext* context,
    const rpc::StopDiscoveryRequest* /*request*/,
    rpc::StopDiscoveryResponse* response) {

    bool wasRunning = coordinator_->isRunning();
    coordinator_->stopDiscovery();
    response->set_was_running(wasRunning);

    LOG_INFO("DiscoveryService", "StopDiscovery (was_running={})", wasRunning);

    auto* reactor = context->DefaultReactor();
    reactor->Finish(grpc::Status::OK);
    return reactor;
}

// =============================================================================
// GetStatus
// =============================================================================

grpc::ServerUnaryReactor* DiscoveryServiceImpl::GetStatus(
    grpc::CallbackServerContext* context,
    const rpc::GetStatusRequest* /*request*/,
    rpc::GetStatusResponse* response) {

    response->set_running(coordinator_->isRunning());
    response->set_state(core::toString(coordinator_->state()));
    response->set_stage(core::toString(coordinator_->stage()));
    response->set_last_outcome(core::toString(coordinator_->lastOutcome()));
    response->set_mode(core::toString(coordinator_->mode()));
    response->set_mdns_available(mdnsAvailable_);

    auto* reactor = context->DefaultReactor();
    reactor->Finish(grpc::Status::OK);
    return reactor;
}

}  // namespace services
}  // namespace huedisc
