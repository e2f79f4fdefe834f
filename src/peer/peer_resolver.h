#ifndef VERIFYREP_PEER_PEER_RESOLVER_H_
#define VERIFYREP_PEER_PEER_RESOLVER_H_

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <replication_peers.grpc.pb.h>

#include "peer_descriptor.h"

namespace VerifyRep {

/// Peer configuration as stored in the registry
struct PeerConfig {
	std::string cluster_key;
	std::vector<std::string> scan_endpoints;
	std::string security_context;
	bool enabled = true;
};

/**
 * Live connection to the metadata registry. Released when destroyed.
 */
class RegistryConnection {
public:
	virtual ~RegistryConnection() = default;

	/// @return nullopt when no peer with this id is registered
	/// @throws MetadataUnavailable when the registry cannot answer
	virtual std::optional<PeerConfig> GetPeerConfig(const std::string& peer_id) = 0;
};

/**
 * Interface for the peer metadata registry
 */
class PeerRegistry {
public:
	virtual ~PeerRegistry() = default;

	/// @throws MetadataUnavailable when the registry cannot be reached
	virtual std::unique_ptr<RegistryConnection> Connect() = 0;
};

/**
 * Resolves a replication peer id to its connection descriptor
 */
class PeerResolver {
public:
	explicit PeerResolver(PeerRegistry& registry) : registry_(registry) {}

	/// @throws PeerNotFound, MetadataUnavailable
	PeerDescriptor Resolve(const std::string& peer_id);

private:
	PeerRegistry& registry_;
};

/**
 * Registry reached through the ReplicationPeers gRPC service
 */
class GrpcPeerRegistry : public PeerRegistry {
public:
	GrpcPeerRegistry(const std::string& address,
			std::chrono::milliseconds connect_timeout,
			std::chrono::milliseconds rpc_timeout);

	std::unique_ptr<RegistryConnection> Connect() override;

private:
	std::string address_;
	std::chrono::milliseconds connect_timeout_;
	std::chrono::milliseconds rpc_timeout_;
};

} // namespace VerifyRep

#endif // VERIFYREP_PEER_PEER_RESOLVER_H_
