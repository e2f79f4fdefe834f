#include "grpc_row_scanner.h"

#include <utility>

#include <glog/logging.h>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

#include "common/config.h"
#include "common/errors.h"

namespace VerifyRep {

namespace {

std::string DescribeStatus(const grpc::Status& status) {
	return absl::StrCat(static_cast<int>(status.error_code()), ": ", status.error_message());
}

} // end of namespace

void ToProto(const ScanSpec& spec, tablescan::Scan* scan) {
	scan->mutable_time_range()->set_start(spec.time_range.start);
	scan->mutable_time_range()->set_end(spec.time_range.end);
	if (spec.max_versions.has_value()) {
		scan->set_has_max_versions(true);
		scan->set_max_versions(*spec.max_versions);
	}
	for (const auto& family : spec.families) {
		scan->add_families(family);
	}
	scan->set_start_row(spec.start_row);
	scan->set_stop_row(spec.stop_row);
}

Row FromProto(const tablescan::Row& proto) {
	Row row;
	row.key = proto.key();
	row.cells.reserve(proto.cells_size());
	for (const auto& c : proto.cells()) {
		Cell cell;
		cell.row = proto.key();
		cell.family = c.family();
		cell.qualifier = c.qualifier();
		cell.timestamp = c.timestamp();
		cell.value = c.value();
		row.cells.push_back(std::move(cell));
	}
	return row;
}

std::shared_ptr<grpc::Channel> ConnectToAny(const std::vector<std::string>& endpoints,
		std::chrono::milliseconds connect_timeout) {
	for (const auto& endpoint : endpoints) {
		std::shared_ptr<grpc::Channel> channel = grpc::CreateChannel(endpoint, grpc::InsecureChannelCredentials());
		auto deadline = std::chrono::system_clock::now() + connect_timeout;
		if (channel->WaitForConnected(deadline)) {
			VLOG(2) << "Connected to " << endpoint;
			return channel;
		}
		LOG(WARNING) << "Failed to connect to " << endpoint << " within " << connect_timeout.count() << "ms";
	}
	throw ScanError("Could not connect to any of [" + absl::StrJoin(endpoints, ",") + "]");
}

GrpcRowScanner::GrpcRowScanner(std::shared_ptr<grpc::Channel> channel,
		const std::string& table,
		const ScanSpec& spec,
		const ScanRpcOptions& options)
	: channel_(std::move(channel)),
	  stub_(tablescan::TableScan::NewStub(channel_)),
	  table_(table),
	  options_(options),
	  caching_(spec.caching) {
	tablescan::OpenScannerRequest request;
	request.set_table(table_);
	ToProto(spec, request.mutable_scan());
	request.set_lease_ms(DEFAULT_SCANNER_LEASE_MS);

	tablescan::OpenScannerResponse response;
	grpc::ClientContext context;
	PrepareContext(&context);

	grpc::Status status = stub_->OpenScanner(&context, request, &response);
	if (!status.ok()) {
		throw ScanError(absl::StrCat("OpenScanner on table ", table_, " failed: ", DescribeStatus(status)));
	}
	scanner_id_ = response.scanner_id();
	open_ = true;
	VLOG(2) << "Opened scanner " << scanner_id_ << " on table " << table_
		<< " lease " << response.lease_ms() << "ms";
}

GrpcRowScanner::~GrpcRowScanner() {
	Close();
}

void GrpcRowScanner::PrepareContext(grpc::ClientContext* context) const {
	context->set_deadline(std::chrono::system_clock::now() + options_.rpc_timeout);
	if (!options_.security_context.empty()) {
		context->AddMetadata(SECURITY_CONTEXT_METADATA_KEY, options_.security_context);
	}
}

void GrpcRowScanner::FetchBatch() {
	tablescan::NextRequest request;
	request.set_scanner_id(scanner_id_);
	request.set_max_rows(caching_);

	tablescan::NextResponse response;
	grpc::ClientContext context;
	PrepareContext(&context);

	grpc::Status status = stub_->Next(&context, request, &response);
	if (status.error_code() == grpc::StatusCode::NOT_FOUND) {
		// The server dropped the scanner: lease expired while we were idle
		open_ = false;
		throw ScanError(absl::StrCat("Scanner ", scanner_id_, " on table ", table_,
					" expired: ", status.error_message()));
	}
	if (!status.ok()) {
		throw ScanError(absl::StrCat("Next on scanner ", scanner_id_, " failed: ", DescribeStatus(status)));
	}

	for (const auto& row : response.rows()) {
		buffered_.push_back(FromProto(row));
	}
	more_rows_ = response.more_rows();
}

void GrpcRowScanner::FillBuffer() {
	int empty_batches = 0;
	while (buffered_.empty() && more_rows_) {
		FetchBatch();
		if (buffered_.empty() && more_rows_) {
			// Server skipped a region without a matching row
			++empty_batches;
			VLOG(2) << "Scanner " << scanner_id_ << " on table " << table_
				<< " returned an empty batch (" << empty_batches << " in a row)";
			LOG_EVERY_N(WARNING, 1000) << "Scanner " << scanner_id_ << " on table " << table_
				<< " keeps returning empty batches";
		}
	}
}

std::optional<Row> GrpcRowScanner::Next() {
	if (!open_) {
		throw ScanError(absl::StrCat("Scanner ", scanner_id_, " on table ", table_, " is closed"));
	}
	FillBuffer();
	if (buffered_.empty()) {
		return std::nullopt;
	}
	Row row = std::move(buffered_.front());
	buffered_.pop_front();
	return row;
}

void GrpcRowScanner::Close() {
	if (!open_) {
		return;
	}
	open_ = false;
	buffered_.clear();

	tablescan::CloseScannerRequest request;
	request.set_scanner_id(scanner_id_);
	tablescan::CloseScannerResponse response;
	grpc::ClientContext context;
	PrepareContext(&context);

	grpc::Status status = stub_->CloseScanner(&context, request, &response);
	if (!status.ok()) {
		// Lease expiry reclaims the scanner on the server
		LOG(WARNING) << "CloseScanner " << scanner_id_ << " failed: " << DescribeStatus(status);
	} else {
		VLOG(2) << "Closed scanner " << scanner_id_ << " on table " << table_;
	}
}

std::unique_ptr<RowScanner> GrpcRemoteSessionFactory::OpenSession(const PeerDescriptor& peer,
		const std::string& table,
		const ScanSpec& spec) {
	ScanRpcOptions options = options_;
	options.security_context = peer.security_context;
	std::shared_ptr<grpc::Channel> channel = ConnectToAny(peer.endpoints, options.connect_timeout);
	return std::make_unique<GrpcRowScanner>(std::move(channel), table, spec, options);
}

} // namespace VerifyRep
