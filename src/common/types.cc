#include "types.h"

#include <algorithm>
#include <cctype>

namespace Crosscheck {

namespace {

std::string ToUpper(const std::string& value) {
    std::string upper(value);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    return upper;
}

} // namespace

const char* ChainName(ChainId chain) {
    switch (chain) {
        case ChainId::BITCOIN: return "BITCOIN";
        case ChainId::FRACTAL: return "FRACTAL";
    }
    return "UNKNOWN";
}

const char* ProtocolName(ProtocolId protocol) {
    switch (protocol) {
        case ProtocolId::ORDINAL: return "ORDINAL";
        case ProtocolId::BRC20: return "BRC20";
    }
    return "UNKNOWN";
}

std::string ChainNetworkName(ChainId chain) {
    switch (chain) {
        case ChainId::BITCOIN: return "bitcoin";
        case ChainId::FRACTAL: return "fractal";
    }
    return "unknown";
}

bool ParseChain(const std::string& value, ChainId& out) {
    std::string upper = ToUpper(value);
    if (upper == "BITCOIN") {
        out = ChainId::BITCOIN;
        return true;
    }
    if (upper == "FRACTAL") {
        out = ChainId::FRACTAL;
        return true;
    }
    return false;
}

bool ParseProtocol(const std::string& value, ProtocolId& out) {
    std::string upper = ToUpper(value);
    if (upper == "ORDINAL") {
        out = ProtocolId::ORDINAL;
        return true;
    }
    if (upper == "BRC20") {
        out = ProtocolId::BRC20;
        return true;
    }
    return false;
}

BlockHeight FirstActivationHeight(ChainId chain, ProtocolId protocol) {
    if (chain == ChainId::FRACTAL) {
        return 21000;
    }
    // Bitcoin mainnet
    return protocol == ProtocolId::ORDINAL ? 767430 : 779832;
}

} // namespace Crosscheck
