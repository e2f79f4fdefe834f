#ifndef VERIFYREP_SCAN_GRPC_ROW_SCANNER_H_
#define VERIFYREP_SCAN_GRPC_ROW_SCANNER_H_

#include <chrono>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include <grpcpp/grpcpp.h>
#include <table_scan.grpc.pb.h>

#include "remote_session.h"
#include "row_scanner.h"
#include "scan_spec.h"

namespace VerifyRep {

/// Timeouts used by every TableScan client
struct ScanRpcOptions {
	std::chrono::milliseconds connect_timeout{2000};
	std::chrono::milliseconds rpc_timeout{60000};
	// Attached as call metadata when not empty
	std::string security_context;
};

/// Fills a protobuf Scan from spec
void ToProto(const ScanSpec& spec, tablescan::Scan* scan);

/// Converts a protobuf row into the in-memory model
Row FromProto(const tablescan::Row& row);

/**
 * Channel to the first endpoint that connects within the connect timeout.
 * @throws ScanError when none does
 */
std::shared_ptr<grpc::Channel> ConnectToAny(const std::vector<std::string>& endpoints,
		std::chrono::milliseconds connect_timeout);

/**
 * RowScanner over the TableScan service. Rows are fetched `caching` at a
 * time. A lease expiry or any RPC failure raises ScanError.
 */
class GrpcRowScanner : public RowScanner {
public:
	/// Opens the server-side scanner.
	/// @throws ScanError when OpenScanner fails
	GrpcRowScanner(std::shared_ptr<grpc::Channel> channel,
			const std::string& table,
			const ScanSpec& spec,
			const ScanRpcOptions& options);
	~GrpcRowScanner() override;

	GrpcRowScanner(const GrpcRowScanner&) = delete;
	GrpcRowScanner& operator=(const GrpcRowScanner&) = delete;

	std::optional<Row> Next() override;
	void Close() override;

	uint64_t scanner_id() const { return scanner_id_; }

private:
	void PrepareContext(grpc::ClientContext* context) const;
	void FetchBatch();
	// Fetches until a row arrives or the server reports no more rows
	void FillBuffer();

	std::shared_ptr<grpc::Channel> channel_;
	std::unique_ptr<tablescan::TableScan::Stub> stub_;
	std::string table_;
	ScanRpcOptions options_;
	int caching_;

	uint64_t scanner_id_ = 0;
	bool open_ = false;
	bool more_rows_ = true;
	std::deque<Row> buffered_;
};

/**
 * Opens GrpcRowScanners against a peer's endpoints
 */
class GrpcRemoteSessionFactory : public RemoteSessionFactory {
public:
	explicit GrpcRemoteSessionFactory(const ScanRpcOptions& options) : options_(options) {}

	std::unique_ptr<RowScanner> OpenSession(const PeerDescriptor& peer,
			const std::string& table,
			const ScanSpec& spec) override;

private:
	ScanRpcOptions options_;
};

} // namespace VerifyRep

#endif // VERIFYREP_SCAN_GRPC_ROW_SCANNER_H_
