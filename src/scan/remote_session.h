#ifndef VERIFYREP_SCAN_REMOTE_SESSION_H_
#define VERIFYREP_SCAN_REMOTE_SESSION_H_

#include <memory>
#include <optional>
#include <string>

#include "peer/peer_descriptor.h"
#include "row_scanner.h"
#include "scan_spec.h"

namespace VerifyRep {

/**
 * Opens scans against a peer cluster. Second step after PeerResolver::Resolve.
 */
class RemoteSessionFactory {
public:
	virtual ~RemoteSessionFactory() = default;

	/// @param spec Scan spec already positioned at the partition's first key
	/// @throws ScanError when the peer cannot be reached or refuses the scan
	virtual std::unique_ptr<RowScanner> OpenSession(const PeerDescriptor& peer,
			const std::string& table,
			const ScanSpec& spec) = 0;
};

/**
 * Partition-scoped cursor on the remote cluster with an explicit
 * open/use/close lifecycle. Owned by exactly one PartitionVerifier.
 * The destructor closes the cursor.
 */
class RemoteSession {
public:
	RemoteSession(RemoteSessionFactory& factory, const PeerDescriptor& peer, const std::string& table);
	~RemoteSession();

	RemoteSession(const RemoteSession&) = delete;
	RemoteSession& operator=(const RemoteSession&) = delete;

	/// Opens the cursor at start_key using spec for every other scan field.
	/// @throws RemoteSessionError on failure or if already opened
	void Open(const ScanSpec& spec, const std::string& start_key);

	/// @throws RemoteSessionError when the cursor fails or is not open
	std::optional<Row> Next();

	/// No-op when never opened or already closed
	void Close();

	bool IsOpen() const { return scanner_ != nullptr; }
	bool WasOpened() const { return opened_; }

private:
	RemoteSessionFactory& factory_;
	const PeerDescriptor& peer_;
	std::string table_;
	std::unique_ptr<RowScanner> scanner_;
	bool opened_ = false;
};

} // namespace VerifyRep

#endif // VERIFYREP_SCAN_REMOTE_SESSION_H_
