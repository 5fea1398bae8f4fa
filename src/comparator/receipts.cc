#include "receipts.h"

#include "normalize.h"

namespace Crosscheck {

const char* Brc20OperationName(Brc20Operation op) {
    switch (op) {
        case Brc20Operation::DEPLOY: return "deploy";
        case Brc20Operation::MINT: return "mint";
        case Brc20Operation::TRANSFER: return "transfer";
        case Brc20Operation::BURN: return "burn";
    }
    return "unknown";
}

bool ParseBrc20Operation(const std::string& value, Brc20Operation& out) {
    // Indexers disagree on casing ("Mint", "TRANSFER"); the ticker helper lowercases.
    std::string lower = NormalizeTicker(value);
    if (lower == "deploy") {
        out = Brc20Operation::DEPLOY;
    } else if (lower == "mint") {
        out = Brc20Operation::MINT;
    } else if (lower == "transfer") {
        out = Brc20Operation::TRANSFER;
    } else if (lower == "burn") {
        out = Brc20Operation::BURN;
    } else {
        return false;
    }
    return true;
}

} // namespace Crosscheck
