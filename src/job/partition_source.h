#ifndef VERIFYREP_JOB_PARTITION_SOURCE_H_
#define VERIFYREP_JOB_PARTITION_SOURCE_H_

#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include "absl/synchronization/mutex.h"

#include "common/row.h"
#include "scan/grpc_row_scanner.h"
#include "scan/row_scanner.h"
#include "scan/scan_spec.h"

namespace VerifyRep {

/**
 * Interface for the primary cluster's side of the job: splits the table into
 * independent partitions and scans each one.
 */
class PartitionSource {
public:
	virtual ~PartitionSource() = default;

	/// Disjoint key ranges in ascending order covering the rows spec selects
	/// @throws ScanError
	virtual std::vector<KeyRange> ListPartitions(const std::string& table, const ScanSpec& spec) = 0;

	/// @param spec Job spec already bounded to one partition
	/// @throws ScanError
	virtual std::unique_ptr<RowScanner> OpenLocalScan(const std::string& table, const ScanSpec& spec) = 0;
};

/**
 * PartitionSource backed by the primary cluster's TableScan service
 */
class GrpcPartitionSource : public PartitionSource {
public:
	GrpcPartitionSource(const std::string& address, const ScanRpcOptions& options);

	std::vector<KeyRange> ListPartitions(const std::string& table, const ScanSpec& spec) override;
	std::unique_ptr<RowScanner> OpenLocalScan(const std::string& table, const ScanSpec& spec) override;

private:
	std::shared_ptr<grpc::Channel> Channel();

	std::string address_;
	ScanRpcOptions options_;
	absl::Mutex mutex_;
	std::shared_ptr<grpc::Channel> channel_ ABSL_GUARDED_BY(mutex_);
};

} // namespace VerifyRep

#endif // VERIFYREP_JOB_PARTITION_SOURCE_H_
