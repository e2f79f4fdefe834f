#include "row.h"

#include "absl/strings/escaping.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

namespace VerifyRep {

std::string EscapeBytes(const std::string& bytes) {
	return absl::CHexEscape(bytes);
}

bool Cell::operator==(const Cell& other) const {
	return timestamp == other.timestamp &&
		row == other.row &&
		family == other.family &&
		qualifier == other.qualifier &&
		value == other.value;
}

std::string Cell::ToString() const {
	return absl::StrCat(EscapeBytes(row), "/", EscapeBytes(family), ":", EscapeBytes(qualifier),
			"/", timestamp, "/vlen=", value.size(), "/value=", EscapeBytes(value));
}

bool Row::operator==(const Row& other) const {
	return key == other.key && cells == other.cells;
}

std::string Row::ToString() const {
	if (cells.empty()) {
		return absl::StrCat("row=", EscapeBytes(key), ", keyvalues=NONE");
	}
	return absl::StrCat("row=", EscapeBytes(key), ", keyvalues={",
			absl::StrJoin(cells, ", ", [](std::string* out, const Cell& cell) {
				absl::StrAppend(out, cell.ToString());
			}),
			"}");
}

std::string KeyRange::ToString() const {
	return absl::StrCat("[", EscapeBytes(start), ", ", end.empty() ? "<end>" : EscapeBytes(end), ")");
}

} // namespace VerifyRep
