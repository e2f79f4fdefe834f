#include "scan_spec.h"

#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

#include "common/errors.h"

namespace VerifyRep {

ScanSpec ScanSpec::WithStartRow(const std::string& start_key) const {
	ScanSpec copy = *this;
	copy.start_row = start_key;
	return copy;
}

ScanSpec ScanSpec::WithRange(const KeyRange& range) const {
	ScanSpec copy = *this;
	copy.start_row = range.start;
	copy.stop_row = range.end;
	return copy;
}

bool ScanSpec::EqualsIgnoringStartRow(const ScanSpec& other) const {
	return time_range == other.time_range &&
		max_versions == other.max_versions &&
		families == other.families &&
		stop_row == other.stop_row &&
		caching == other.caching;
}

std::string ScanSpec::ToString() const {
	return absl::StrCat("{timeRange=[", time_range.start, ",", time_range.end, ")",
			", maxVersions=", max_versions.has_value() ? std::to_string(*max_versions) : "all",
			", families=[", absl::StrJoin(families, ","), "]",
			", startRow=", EscapeBytes(start_row),
			", stopRow=", EscapeBytes(stop_row),
			", caching=", caching, "}");
}

ScanSpec ScanSpecBuilder::Build(const TimeRange& time_range,
		std::optional<int> max_versions,
		const std::vector<std::string>& families,
		int caching) {
	if (time_range.start > time_range.end) {
		throw InvalidArguments(absl::StrCat("Invalid time range: start ", time_range.start,
					" is after end ", time_range.end));
	}
	if (max_versions.has_value() && *max_versions < 0) {
		throw InvalidArguments(absl::StrCat("Invalid max versions: ", *max_versions));
	}
	if (caching < 1) {
		throw InvalidArguments(absl::StrCat("Invalid scanner caching: ", caching));
	}

	ScanSpec spec;
	spec.time_range = time_range;
	spec.max_versions = max_versions;
	spec.caching = caching;
	for (const auto& family : families) {
		if (family.empty()) {
			throw InvalidArguments("Empty column family name");
		}
		spec.families.insert(family);
	}
	return spec;
}

std::vector<std::string> ParseFamilyList(const std::string& families) {
	std::vector<std::string> result = absl::StrSplit(families, ',');
	for (const auto& family : result) {
		if (family.empty()) {
			throw InvalidArguments("Empty column family name in '" + families + "'");
		}
	}
	return result;
}

} // namespace VerifyRep
