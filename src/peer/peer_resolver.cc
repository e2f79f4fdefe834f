#include "peer_resolver.h"

#include <utility>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

#include "common/errors.h"

namespace VerifyRep {

namespace {

class GrpcRegistryConnection : public RegistryConnection {
	public:
		GrpcRegistryConnection(std::shared_ptr<grpc::Channel> channel, std::string address,
				std::chrono::milliseconds rpc_timeout)
			: stub_(replicationpeers::ReplicationPeers::NewStub(channel)),
			  address_(std::move(address)),
			  rpc_timeout_(rpc_timeout) {}

		~GrpcRegistryConnection() override {
			VLOG(1) << "Released registry connection to " << address_;
		}

		std::optional<PeerConfig> GetPeerConfig(const std::string& peer_id) override {
			replicationpeers::GetPeerConfigRequest request;
			request.set_peer_id(peer_id);
			replicationpeers::GetPeerConfigResponse response;

			grpc::ClientContext context;
			context.set_deadline(std::chrono::system_clock::now() + rpc_timeout_);

			grpc::Status status = stub_->GetPeerConfig(&context, request, &response);
			if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
				return std::nullopt;
			}
			if (!status.ok()) {
				throw MetadataUnavailable(absl::StrCat("An error occurred while trying to read peer ",
							peer_id, " from registry ", address_, ": ", status.error_message()));
			}
			if (!response.found()) {
				return std::nullopt;
			}

			PeerConfig config;
			config.cluster_key = response.cluster_key();
			config.scan_endpoints.assign(response.scan_endpoints().begin(), response.scan_endpoints().end());
			config.security_context = response.security_context();
			config.enabled = response.enabled();
			return config;
		}

	private:
		std::unique_ptr<replicationpeers::ReplicationPeers::Stub> stub_;
		std::string address_;
		std::chrono::milliseconds rpc_timeout_;
};

} // end of namespace

PeerDescriptor PeerResolver::Resolve(const std::string& peer_id) {
	std::optional<PeerConfig> config;
	{
		// Connection is released at the end of this scope, on every path
		std::unique_ptr<RegistryConnection> connection = registry_.Connect();
		if (!connection) {
			throw MetadataUnavailable("Registry returned no connection");
		}
		config = connection->GetPeerConfig(peer_id);
	}
	if (!config.has_value()) {
		throw PeerNotFound(peer_id);
	}

	ClusterKey key;
	if (!ClusterKey::Parse(config->cluster_key, &key)) {
		throw MetadataUnavailable(absl::StrCat("Peer ", peer_id, " has a malformed cluster key '",
					config->cluster_key, "'"));
	}
	if (config->scan_endpoints.empty()) {
		throw MetadataUnavailable(absl::StrCat("Peer ", peer_id, " has no scan endpoints"));
	}

	PeerDescriptor peer;
	peer.peer_id = peer_id;
	peer.cluster_key = config->cluster_key;
	peer.znode_parent = key.znode_parent;
	peer.endpoints = config->scan_endpoints;
	peer.security_context = config->security_context;
	peer.enabled = config->enabled;

	LOG(INFO) << "Peer cluster key: " << peer.cluster_key << ", scan endpoints: "
		<< absl::StrJoin(peer.endpoints, ",");
	if (!peer.enabled) {
		LOG(WARNING) << "Replication to peer " << peer_id << " is disabled, expect divergence";
	}
	return peer;
}

GrpcPeerRegistry::GrpcPeerRegistry(const std::string& address,
		std::chrono::milliseconds connect_timeout,
		std::chrono::milliseconds rpc_timeout)
	: address_(address), connect_timeout_(connect_timeout), rpc_timeout_(rpc_timeout) {}

std::unique_ptr<RegistryConnection> GrpcPeerRegistry::Connect() {
	std::shared_ptr<grpc::Channel> channel = grpc::CreateChannel(address_, grpc::InsecureChannelCredentials());
	auto deadline = std::chrono::system_clock::now() + connect_timeout_;
	if (!channel->WaitForConnected(deadline)) {
		throw MetadataUnavailable("Failed to connect to peer registry at " + address_ + " within timeout");
	}
	VLOG(1) << "Connected to registry " << address_;
	return std::make_unique<GrpcRegistryConnection>(std::move(channel), address_, rpc_timeout_);
}

} // namespace VerifyRep
