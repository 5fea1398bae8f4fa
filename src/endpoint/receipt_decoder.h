#pragma once

#include <string>

#include "endpoint.h"

namespace Crosscheck {

struct NodeInfo {
    std::string network;
    BlockHeight ord_block_height = 0;
};

/**
 * Decodes indexer JSON responses. Every method returns OK or
 * INVALID_RESPONSE; error carries the offending path on failure.
 *
 * Receipt bodies have the shape
 *   {"data": {"block": [{"txid": "...", "events": [ {...}, ... ]}, ...]}}
 * A null or missing "data" / "block" decodes to an empty receipt set.
 */
class ReceiptDecoder {
public:
    static FetchStatus DecodeNodeInfo(const std::string& body, NodeInfo& info, std::string& error);

    static FetchStatus DecodeBlockReceipts(ProtocolId protocol, const std::string& body,
                                           Receipts& receipts, std::string& error);
};

} // namespace Crosscheck
