#ifndef VERIFYREP_JOB_VERIFY_JOB_H_
#define VERIFYREP_JOB_VERIFY_JOB_H_

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/synchronization/mutex.h"

#include "job_options.h"
#include "partition_source.h"
#include "peer/peer_resolver.h"
#include "scan/remote_session.h"
#include "verifier/partition_verifier.h"

namespace VerifyRep {

enum class Counter {
	GOODROWS,
	BADROWS
};

const char* CounterName(Counter counter);

/**
 * Job-wide totals. Only finished partitions are merged in.
 */
class JobCounters {
public:
	void Merge(const PartitionCounters& partition) {
		absl::MutexLock lock(&mutex_);
		good_rows_ += partition.good_rows;
		bad_rows_ += partition.bad_rows;
	}

	uint64_t Get(Counter counter) const {
		absl::MutexLock lock(&mutex_);
		return counter == Counter::GOODROWS ? good_rows_ : bad_rows_;
	}

private:
	mutable absl::Mutex mutex_;
	uint64_t good_rows_ ABSL_GUARDED_BY(mutex_) = 0;
	uint64_t bad_rows_ ABSL_GUARDED_BY(mutex_) = 0;
};

struct JobReport {
	std::string job_name;
	uint64_t good_rows = 0;
	uint64_t bad_rows = 0;
	size_t partitions = 0;
	size_t failed_partitions = 0;
	bool cancelled = false;

	/// True when every partition was verified, whatever the mismatch count
	bool Succeeded() const { return failed_partitions == 0 && !cancelled; }
};

/**
 * Map-only verification job.
 *
 * Submission resolves the peer and builds the canonical scan spec once, then
 * runs one PartitionVerifier per partition on a thread pool. A failed
 * partition is rerun from scratch up to max_partition_attempts times; rows
 * counted by a failed attempt are discarded.
 */
class VerifyJob {
public:
	/// Collaborators must outlive the job
	VerifyJob(VerifyJobOptions options,
			PeerRegistry& registry,
			PartitionSource& partition_source,
			RemoteSessionFactory& session_factory);

	VerifyJob(const VerifyJob&) = delete;
	VerifyJob& operator=(const VerifyJob&) = delete;

	/// Submits the job and waits for every partition.
	/// @throws InvalidArguments, ConfigurationError, PeerNotFound, MetadataUnavailable, ScanError
	///         when the job cannot be submitted; nothing is scheduled in that case
	JobReport Run();

	/// Stops workers between rows. Safe to call from any thread.
	void Cancel() { cancelled_.store(true, std::memory_order_release); }

	const std::string& name() const { return name_; }
	const JobCounters& counters() const { return counters_; }

private:
	/// @return false when every attempt failed
	bool RunPartitionWithRetries(const PeerDescriptor& peer, const ScanSpec& spec, const KeyRange& range);

	const VerifyJobOptions options_;
	const std::string name_;
	PeerRegistry& registry_;
	PartitionSource& partition_source_;
	RemoteSessionFactory& session_factory_;

	std::atomic<bool> cancelled_{false};
	JobCounters counters_;
};

} // namespace VerifyRep

#endif // VERIFYREP_JOB_VERIFY_JOB_H_
