#include "normalize.h"

#include <algorithm>
#include <cctype>

namespace Crosscheck {

std::string NormalizeTicker(const std::string& ticker) {
    std::string lower(ticker);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower;
}

bool NormalizeDecimal(const std::string& value, std::string& out) {
    size_t pos = 0;
    bool negative = false;
    if (pos < value.size() && (value[pos] == '-' || value[pos] == '+')) {
        negative = value[pos] == '-';
        ++pos;
    }

    std::string integer_part;
    std::string fraction_part;
    bool seen_point = false;
    bool seen_digit = false;
    for (; pos < value.size(); ++pos) {
        char c = value[pos];
        if (c == '.') {
            if (seen_point) return false;
            seen_point = true;
            continue;
        }
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
        seen_digit = true;
        (seen_point ? fraction_part : integer_part).push_back(c);
    }
    if (!seen_digit) {
        return false;
    }

    size_t first_nonzero = integer_part.find_first_not_of('0');
    integer_part = first_nonzero == std::string::npos ? "0" : integer_part.substr(first_nonzero);
    size_t last_nonzero = fraction_part.find_last_not_of('0');
    fraction_part = last_nonzero == std::string::npos ? "" : fraction_part.substr(0, last_nonzero + 1);

    if (integer_part == "0" && fraction_part.empty()) {
        out = "0";
        return true;
    }
    out = negative ? "-" : "";
    out += integer_part;
    if (!fraction_part.empty()) {
        out += "." + fraction_part;
    }
    return true;
}

} // namespace Crosscheck
