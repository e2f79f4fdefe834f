#include "peer_descriptor.h"

#include <utility>

#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

namespace VerifyRep {

std::string ClusterKey::ToString() const {
	return absl::StrCat(absl::StrJoin(quorum, ","), ":", port, ":", znode_parent);
}

bool ClusterKey::Parse(const std::string& key, ClusterKey* out) {
	// Only the first two colons separate fields
	std::vector<std::string> parts = absl::StrSplit(key, absl::MaxSplits(':', 2));
	if (parts.size() != 3) {
		return false;
	}

	ClusterKey parsed;
	parsed.quorum = absl::StrSplit(parts[0], ',', absl::SkipEmpty());
	if (parsed.quorum.empty()) {
		return false;
	}
	if (!absl::SimpleAtoi(parts[1], &parsed.port) || parsed.port <= 0 || parsed.port > 65535) {
		return false;
	}
	if (parts[2].empty() || parts[2][0] != '/') {
		return false;
	}
	parsed.znode_parent = parts[2];

	*out = std::move(parsed);
	return true;
}

} // namespace VerifyRep
