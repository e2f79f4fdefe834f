#pragma once

#include <optional>

#include "common/row.h"

namespace VerifyRep {

/**
 * Interface for a forward-only row cursor over one scan
 */
class RowScanner {
public:
	virtual ~RowScanner() = default;

	/// Next row in ascending key order, nullopt once exhausted.
	/// @throws ScanError when the cursor cannot be read
	virtual std::optional<Row> Next() = 0;

	/// Releases the cursor. Must not throw; calling it more than once is harmless.
	virtual void Close() = 0;
};

} // namespace VerifyRep
