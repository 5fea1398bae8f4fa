#pragma once

#include <string>

namespace Crosscheck {

// BRC20 tickers are case-insensitive.
std::string NormalizeTicker(const std::string& ticker);

/**
 * Canonical form of a decimal amount: optional '-', no leading zeros in the
 * integer part, no trailing zeros in the fraction, "0" for any zero value.
 * Returns false if value is not a plain decimal number.
 */
bool NormalizeDecimal(const std::string& value, std::string& out);

} // namespace Crosscheck
