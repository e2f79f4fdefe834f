#include "partition_verifier.h"

#include <exception>
#include <utility>

#include <glog/logging.h>

#include "absl/cleanup/cleanup.h"

#include "common/errors.h"

namespace VerifyRep {

PartitionVerifier::PartitionVerifier(const ScanSpec& spec,
		const std::string& table,
		const PeerDescriptor& peer,
		RemoteSessionFactory& session_factory,
		RowComparator comparator)
	: spec_(spec),
	  session_(session_factory, peer, table),
	  comparator_(std::move(comparator)) {}

PartitionVerifier::~PartitionVerifier() {
	Close();
}

VerificationOutcome PartitionVerifier::VerifyRow(const Row& local_row) {
	if (!session_.WasOpened()) {
		// Both cursors start aligned at the partition's first row
		partition_start_key_ = local_row.key;
		session_.Open(spec_, local_row.key);
	}

	std::optional<Row> remote_row = session_.Next();

	VerificationOutcome outcome;
	try {
		outcome = comparator_(local_row, remote_row);
	} catch (const std::exception& e) {
		LOG(ERROR) << "Unexpected failure comparing row " << EscapeBytes(local_row.key) << ": " << e.what();
		outcome = VerificationOutcome::Mismatch(
				"Unexpected comparison failure on row " + EscapeBytes(local_row.key) + ": " + e.what());
	} catch (...) {
		LOG(ERROR) << "Unexpected non-standard failure comparing row " << EscapeBytes(local_row.key);
		outcome = VerificationOutcome::Mismatch(
				"Unexpected comparison failure on row " + EscapeBytes(local_row.key) + ": unknown exception");
	}

	if (outcome.IsMatch()) {
		++counters_.good_rows;
	} else {
		LOG(WARNING) << "Bad row: " << outcome.diagnostic;
		++counters_.bad_rows;
	}
	return outcome;
}

void PartitionVerifier::Close() {
	session_.Close();
}

PartitionCounters RunPartition(RowScanner& local_scanner,
		PartitionVerifier& verifier,
		const std::atomic<bool>* cancelled) {
	auto close_cursors = absl::MakeCleanup([&local_scanner, &verifier] {
		verifier.Close();
		local_scanner.Close();
	});

	while (true) {
		if (cancelled != nullptr && cancelled->load(std::memory_order_acquire)) {
			throw JobCancelled();
		}
		std::optional<Row> local_row = local_scanner.Next();
		if (!local_row.has_value()) {
			break;
		}
		verifier.VerifyRow(*local_row);
	}
	return verifier.counters();
}

} // namespace VerifyRep
