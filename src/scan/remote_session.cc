#include "remote_session.h"

#include <utility>

#include <glog/logging.h>

#include "common/errors.h"

namespace VerifyRep {

RemoteSession::RemoteSession(RemoteSessionFactory& factory, const PeerDescriptor& peer, const std::string& table)
	: factory_(factory), peer_(peer), table_(table) {}

RemoteSession::~RemoteSession() {
	Close();
}

void RemoteSession::Open(const ScanSpec& spec, const std::string& start_key) {
	if (opened_) {
		throw RemoteSessionError("Remote session for peer " + peer_.peer_id + " was already opened");
	}
	opened_ = true;

	ScanSpec remote_spec = spec.WithStartRow(start_key);
	VLOG(1) << "Opening remote scanner on peer " << peer_.peer_id << " (" << peer_.znode_parent << ") table " << table_
		<< " at " << EscapeBytes(start_key);
	try {
		scanner_ = factory_.OpenSession(peer_, table_, remote_spec);
	} catch (const ScanError& e) {
		throw RemoteSessionError("Failed to open remote scanner on peer " + peer_.peer_id + ": " + e.what());
	}
	if (!scanner_) {
		throw RemoteSessionError("No remote scanner returned for peer " + peer_.peer_id);
	}
}

std::optional<Row> RemoteSession::Next() {
	if (!scanner_) {
		throw RemoteSessionError("Remote session for peer " + peer_.peer_id + " is not open");
	}
	try {
		return scanner_->Next();
	} catch (const ScanError& e) {
		throw RemoteSessionError("Failed to read remote scanner on peer " + peer_.peer_id + ": " + e.what());
	}
}

void RemoteSession::Close() {
	if (!scanner_) {
		return;
	}
	std::unique_ptr<RowScanner> scanner = std::move(scanner_);
	VLOG(1) << "Closing remote scanner on peer " << peer_.peer_id << " table " << table_;
	scanner->Close();
}

} // namespace VerifyRep
