#pragma once

#include <string>
#include <variant>
#include <vector>

#include "../common/types.h"

namespace Crosscheck {

/**
 * One inscription event (inscribe or transfer) in a block.
 */
struct InscriptionEvent {
    std::string inscription_id;
    std::string txid;
    std::string owner;
    std::string content_hash;
    uint64_t sequence = 0;  // transfer sequence number of the inscription

    bool operator==(const InscriptionEvent& other) const {
        return inscription_id == other.inscription_id && txid == other.txid &&
               owner == other.owner && content_hash == other.content_hash &&
               sequence == other.sequence;
    }
};

struct OrdinalReceipts {
    std::vector<InscriptionEvent> events;

    bool operator==(const OrdinalReceipts& other) const { return events == other.events; }
};

enum class Brc20Operation {
    DEPLOY,
    MINT,
    TRANSFER,
    BURN
};

const char* Brc20OperationName(Brc20Operation op);
bool ParseBrc20Operation(const std::string& value, Brc20Operation& out);

/**
 * One valid token-ledger entry. amount is the normalized decimal balance delta.
 */
struct Brc20Event {
    std::string ticker;
    std::string txid;
    Brc20Operation op = Brc20Operation::MINT;
    std::string from;
    std::string to;
    std::string amount;

    bool operator==(const Brc20Event& other) const {
        return ticker == other.ticker && txid == other.txid && op == other.op &&
               from == other.from && to == other.to && amount == other.amount;
    }
};

struct Brc20Receipts {
    std::vector<Brc20Event> events;

    bool operator==(const Brc20Receipts& other) const { return events == other.events; }
};

// Closed set: adding a protocol means adding an alternative and its comparator.
using Receipts = std::variant<OrdinalReceipts, Brc20Receipts>;

inline ProtocolId ProtocolOf(const Receipts& receipts) {
    return std::holds_alternative<OrdinalReceipts>(receipts) ? ProtocolId::ORDINAL : ProtocolId::BRC20;
}

inline Receipts EmptyReceipts(ProtocolId protocol) {
    if (protocol == ProtocolId::ORDINAL) {
        return OrdinalReceipts{};
    }
    return Brc20Receipts{};
}

} // namespace Crosscheck
