#ifndef VERIFYREP_VERIFIER_RESULT_CLASSIFIER_H_
#define VERIFYREP_VERIFIER_RESULT_CLASSIFIER_H_

#include <optional>
#include <string>
#include <utility>

#include "common/row.h"

namespace VerifyRep {

enum class Verdict {
	MATCH,
	MISMATCH
};

struct VerificationOutcome {
	Verdict verdict = Verdict::MATCH;
	// Empty for MATCH
	std::string diagnostic;

	bool IsMatch() const { return verdict == Verdict::MATCH; }

	static VerificationOutcome Match() { return {Verdict::MATCH, ""}; }
	static VerificationOutcome Mismatch(std::string diagnostic) {
		return {Verdict::MISMATCH, std::move(diagnostic)};
	}
};

/**
 * Strict structural row comparison. Same key, same cell count and pairwise
 * identical cells in the same order, or it is a mismatch.
 */
class ResultClassifier {
public:
	/// @param remote nullopt when the remote scanner is exhausted
	static VerificationOutcome Compare(const Row& local, const std::optional<Row>& remote);
};

} // namespace VerifyRep

#endif // VERIFYREP_VERIFIER_RESULT_CLASSIFIER_H_
