#ifndef CROSSCHECK_COMMON_TYPES_H_
#define CROSSCHECK_COMMON_TYPES_H_

#include <cstdint>
#include <string>

namespace Crosscheck {

using BlockHeight = uint64_t;

enum class ChainId {
    BITCOIN,
    FRACTAL
};

enum class ProtocolId {
    ORDINAL,
    BRC20
};

const char* ChainName(ChainId chain);
const char* ProtocolName(ProtocolId protocol);

/**
 * Network name as reported by an indexer's node info ("bitcoin", "fractal").
 */
std::string ChainNetworkName(ChainId chain);

// Case-insensitive; returns false for unknown names.
bool ParseChain(const std::string& value, ChainId& out);
bool ParseProtocol(const std::string& value, ProtocolId& out);

/**
 * First block at which the protocol produced any receipts on the chain.
 * Used as the start height when none is configured.
 */
BlockHeight FirstActivationHeight(ChainId chain, ProtocolId protocol);

} // namespace Crosscheck

#endif // CROSSCHECK_COMMON_TYPES_H_
