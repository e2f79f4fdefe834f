#include "result_classifier.h"

#include "absl/strings/str_cat.h"

namespace VerifyRep {

namespace {

std::string DescribeCellDifference(const Cell& local, const Cell& remote) {
	if (local.row != remote.row) return "row";
	if (local.family != remote.family) return "family";
	if (local.qualifier != remote.qualifier) return "qualifier";
	if (local.timestamp != remote.timestamp) return "timestamp";
	return "value";
}

std::string Diff(const std::string& reason, const Row& local, const Row& remote) {
	return absl::StrCat("This result was different (", reason, "): ", local.ToString(),
			" compared to ", remote.ToString());
}

} // end of namespace

VerificationOutcome ResultClassifier::Compare(const Row& local, const std::optional<Row>& remote) {
	if (!remote.has_value()) {
		return VerificationOutcome::Mismatch(absl::StrCat(
					"Remote scanner exhausted before local row ", EscapeBytes(local.key), ": ",
					local.ToString()));
	}
	if (local.key != remote->key) {
		return VerificationOutcome::Mismatch(Diff(absl::StrCat("row key ", EscapeBytes(local.key),
						" vs ", EscapeBytes(remote->key)), local, *remote));
	}
	if (local.cells.size() != remote->cells.size()) {
		return VerificationOutcome::Mismatch(Diff(absl::StrCat("cell count ", local.cells.size(),
						" vs ", remote->cells.size()), local, *remote));
	}
	for (size_t i = 0; i < local.cells.size(); ++i) {
		if (local.cells[i] != remote->cells[i]) {
			return VerificationOutcome::Mismatch(Diff(absl::StrCat(
							DescribeCellDifference(local.cells[i], remote->cells[i]),
							" of cell ", i), local, *remote));
		}
	}
	return VerificationOutcome::Match();
}

} // namespace VerifyRep
