#ifndef VERIFYREP_VERIFIER_PARTITION_VERIFIER_H_
#define VERIFYREP_VERIFIER_PARTITION_VERIFIER_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "peer/peer_descriptor.h"
#include "result_classifier.h"
#include "scan/remote_session.h"
#include "scan/row_scanner.h"
#include "scan/scan_spec.h"

namespace VerifyRep {

/// GOODROWS / BADROWS of one partition
struct PartitionCounters {
	uint64_t good_rows = 0;
	uint64_t bad_rows = 0;
};

using RowComparator = std::function<VerificationOutcome(const Row&, const std::optional<Row>&)>;

/**
 * Lockstep comparator for one key-range partition.
 *
 * Every local row is paired with the next remote row, strictly by position.
 * There is no re-alignment by key: once one side yields an extra or missing
 * row, every later row of the partition is reported as a mismatch.
 */
class PartitionVerifier {
public:
	/// spec and peer must outlive the verifier
	PartitionVerifier(const ScanSpec& spec,
			const std::string& table,
			const PeerDescriptor& peer,
			RemoteSessionFactory& session_factory,
			RowComparator comparator = &ResultClassifier::Compare);
	~PartitionVerifier();

	PartitionVerifier(const PartitionVerifier&) = delete;
	PartitionVerifier& operator=(const PartitionVerifier&) = delete;

	/// Compares local_row with the next remote row and counts the outcome.
	/// The first call opens the remote session at local_row's key.
	/// @throws RemoteSessionError when the remote cursor fails
	VerificationOutcome VerifyRow(const Row& local_row);

	/// Closes the remote session. No-op if it was never opened or is closed.
	void Close();

	const PartitionCounters& counters() const { return counters_; }
	const std::optional<std::string>& partition_start_key() const { return partition_start_key_; }
	bool IsSessionOpen() const { return session_.IsOpen(); }

private:
	const ScanSpec& spec_;
	RemoteSession session_;
	RowComparator comparator_;
	std::optional<std::string> partition_start_key_;
	PartitionCounters counters_;
};

/**
 * Drives verifier over every row of local_scanner until it is exhausted.
 * Both cursors are closed on every exit path.
 * @param cancelled checked between rows, may be null
 * @throws JobCancelled, RemoteSessionError, ScanError
 */
PartitionCounters RunPartition(RowScanner& local_scanner,
		PartitionVerifier& verifier,
		const std::atomic<bool>* cancelled = nullptr);

} // namespace VerifyRep

#endif // VERIFYREP_VERIFIER_PARTITION_VERIFIER_H_
