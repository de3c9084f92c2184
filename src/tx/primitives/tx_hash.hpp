#pragma once

#include "primitives/transaction.hpp"

namespace tidelink::primitives {

// SHA3-256 of the canonical encoding.
Hash256 ComputeTxHash(const Transaction& tx);

}  // namespace tidelink::primitives
