#include "partition_source.h"

#include <utility>

#include <glog/logging.h>
#include <table_scan.grpc.pb.h>

#include "absl/strings/str_cat.h"

#include "common/errors.h"

namespace VerifyRep {

GrpcPartitionSource::GrpcPartitionSource(const std::string& address, const ScanRpcOptions& options)
	: address_(address), options_(options) {}

std::shared_ptr<grpc::Channel> GrpcPartitionSource::Channel() {
	absl::MutexLock lock(&mutex_);
	if (!channel_) {
		channel_ = ConnectToAny({address_}, options_.connect_timeout);
	}
	return channel_;
}

std::vector<KeyRange> GrpcPartitionSource::ListPartitions(const std::string& table, const ScanSpec& spec) {
	auto stub = tablescan::TableScan::NewStub(Channel());

	tablescan::GetPartitionsRequest request;
	request.set_table(table);
	ToProto(spec, request.mutable_scan());
	tablescan::GetPartitionsResponse response;

	grpc::ClientContext context;
	context.set_deadline(std::chrono::system_clock::now() + options_.rpc_timeout);

	grpc::Status status = stub->GetPartitions(&context, request, &response);
	if (!status.ok()) {
		throw ScanError(absl::StrCat("GetPartitions on table ", table, " failed: ", status.error_message()));
	}

	std::vector<KeyRange> partitions;
	partitions.reserve(response.partitions_size());
	for (const auto& p : response.partitions()) {
		partitions.push_back(KeyRange{p.start(), p.end()});
	}
	VLOG(1) << "Table " << table << " has " << partitions.size() << " partitions";
	return partitions;
}

std::unique_ptr<RowScanner> GrpcPartitionSource::OpenLocalScan(const std::string& table, const ScanSpec& spec) {
	return std::make_unique<GrpcRowScanner>(Channel(), table, spec, options_);
}

} // namespace VerifyRep
