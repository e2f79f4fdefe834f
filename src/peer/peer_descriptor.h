#ifndef VERIFYREP_PEER_PEER_DESCRIPTOR_H_
#define VERIFYREP_PEER_PEER_DESCRIPTOR_H_

#include <string>
#include <vector>

namespace VerifyRep {

/**
 * Parsed form of a cluster key "host1,host2:port:/parent"
 */
struct ClusterKey {
	std::vector<std::string> quorum;
	int port = 0;
	std::string znode_parent;

	std::string ToString() const;

	/// @return false when key is not of the form quorum:port:parent
	static bool Parse(const std::string& key, ClusterKey* out);
};

/**
 * Connection information of a replication peer. Resolved once per job and
 * shared read-only by every partition worker.
 */
struct PeerDescriptor {
	std::string peer_id;
	std::string cluster_key;
	// Root of the peer's metadata tree, from the cluster key
	std::string znode_parent;
	// TableScan servers of the peer cluster
	std::vector<std::string> endpoints;
	std::string security_context;
	bool enabled = true;
};

} // namespace VerifyRep

#endif // VERIFYREP_PEER_PEER_DESCRIPTOR_H_
