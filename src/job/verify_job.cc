#include "verify_job.h"

#include <algorithm>
#include <exception>
#include <memory>
#include <utility>

#include <boost/asio/post.hpp>
#include <boost/asio/thread_pool.hpp>
#include <glog/logging.h>

#include "common/errors.h"

namespace VerifyRep {

const char* CounterName(Counter counter) {
	switch (counter) {
		case Counter::GOODROWS:
			return "GOODROWS";
		case Counter::BADROWS:
			return "BADROWS";
	}
	return "UNKNOWN";
}

VerifyJob::VerifyJob(VerifyJobOptions options,
		PeerRegistry& registry,
		PartitionSource& partition_source,
		RemoteSessionFactory& session_factory)
	: options_(std::move(options)),
	  name_(options_.JobName()),
	  registry_(registry),
	  partition_source_(partition_source),
	  session_factory_(session_factory) {}

JobReport VerifyJob::Run() {
	if (!options_.replication_enabled) {
		throw ConfigurationError("Replication needs to be enabled to verify it.");
	}

	// Canonical spec, shared read-only by every partition
	const ScanSpec spec = ScanSpecBuilder::Build(options_.time_range, options_.max_versions,
			options_.families, options_.scan_caching);

	PeerResolver resolver(registry_);
	const PeerDescriptor peer = resolver.Resolve(options_.peer_id);

	std::vector<KeyRange> partitions = partition_source_.ListPartitions(options_.table_name, spec);
	LOG(INFO) << "Submitting " << name_ << " with " << partitions.size() << " partitions, scan "
		<< spec.ToString();

	JobReport report;
	report.job_name = name_;
	report.partitions = partitions.size();

	std::atomic<size_t> failed{0};
	{
		size_t threads = std::max<size_t>(1, std::min<size_t>(options_.worker_threads, partitions.size()));
		boost::asio::thread_pool pool(threads);
		for (const KeyRange& range : partitions) {
			boost::asio::post(pool, [this, &peer, &spec, &range, &failed] {
				if (!RunPartitionWithRetries(peer, spec, range)) {
					failed.fetch_add(1, std::memory_order_relaxed);
				}
			});
		}
		pool.join();
	}

	report.failed_partitions = failed.load();
	report.cancelled = cancelled_.load(std::memory_order_acquire);
	report.good_rows = counters_.Get(Counter::GOODROWS);
	report.bad_rows = counters_.Get(Counter::BADROWS);

	LOG(INFO) << name_ << " finished: " << CounterName(Counter::GOODROWS) << "=" << report.good_rows
		<< " " << CounterName(Counter::BADROWS) << "=" << report.bad_rows
		<< " failed partitions " << report.failed_partitions << "/" << report.partitions;
	return report;
}

bool VerifyJob::RunPartitionWithRetries(const PeerDescriptor& peer, const ScanSpec& spec, const KeyRange& range) {
	const ScanSpec partition_spec = spec.WithRange(range);

	for (int attempt = 1; attempt <= options_.max_partition_attempts; ++attempt) {
		try {
			PartitionVerifier verifier(partition_spec, options_.table_name, peer, session_factory_);
			std::unique_ptr<RowScanner> local_scanner =
				partition_source_.OpenLocalScan(options_.table_name, partition_spec);
			PartitionCounters counters = RunPartition(*local_scanner, verifier, &cancelled_);
			counters_.Merge(counters);
			VLOG(1) << "Partition " << range.ToString() << " done: " << counters.good_rows
				<< " good, " << counters.bad_rows << " bad";
			return true;
		} catch (const JobCancelled&) {
			LOG(WARNING) << "Partition " << range.ToString() << " cancelled";
			return false;
		} catch (const std::exception& e) {
			if (attempt < options_.max_partition_attempts) {
				LOG(WARNING) << "Partition " << range.ToString() << " attempt " << attempt
					<< " failed, rescheduling: " << e.what();
			} else {
				LOG(ERROR) << "Partition " << range.ToString() << " failed after " << attempt
					<< " attempts: " << e.what();
			}
		}
	}
	return false;
}

} // namespace VerifyRep
