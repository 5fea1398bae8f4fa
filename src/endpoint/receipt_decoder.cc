#include "receipt_decoder.h"

#include <memory>

#include <json/json.h>

#include "../comparator/normalize.h"

namespace Crosscheck {

namespace {

bool ParseJson(const std::string& body, Json::Value& root, std::string& error) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    std::string errors;
    if (!reader->parse(body.data(), body.data() + body.size(), &root, &errors)) {
        error = "malformed JSON: " + errors;
        return false;
    }
    return true;
}

bool RequireString(const Json::Value& object, const char* field, const std::string& path,
                   std::string& out, std::string& error) {
    const Json::Value& value = object[field];
    if (!value.isString()) {
        error = path + "." + field + " must be a string";
        return false;
    }
    out = value.asString();
    return true;
}

// Absent or null is accepted as empty; any other non-string is a schema error.
bool OptionalString(const Json::Value& object, const char* field, const std::string& path,
                    std::string& out, std::string& error) {
    const Json::Value& value = object[field];
    if (value.isNull()) {
        out.clear();
        return true;
    }
    if (!value.isString()) {
        error = path + "." + field + " must be a string";
        return false;
    }
    out = value.asString();
    return true;
}

bool DecodeInscription(const Json::Value& event, const std::string& path, const std::string& txid,
                       InscriptionEvent& out, std::string& error) {
    if (!RequireString(event, "inscriptionId", path, out.inscription_id, error)) return false;
    if (!OptionalString(event, "owner", path, out.owner, error)) return false;
    if (!OptionalString(event, "contentHash", path, out.content_hash, error)) return false;

    const Json::Value& sequence = event["sequence"];
    if (sequence.isNull()) {
        out.sequence = 0;
    } else if (sequence.isUInt64()) {
        out.sequence = sequence.asUInt64();
    } else {
        error = path + ".sequence must be a non-negative integer";
        return false;
    }

    std::string event_txid;
    if (!OptionalString(event, "txid", path, event_txid, error)) return false;
    out.txid = event_txid.empty() ? txid : event_txid;
    return true;
}

// Returns true with keep=false for events the indexer itself marked invalid.
bool DecodeLedgerEntry(const Json::Value& event, const std::string& path, const std::string& txid,
                       Brc20Event& out, bool& keep, std::string& error) {
    const Json::Value& valid = event["valid"];
    if (!valid.isNull() && !valid.isBool()) {
        error = path + ".valid must be a boolean";
        return false;
    }
    keep = valid.isNull() || valid.asBool();
    if (!keep) {
        return true;
    }

    std::string type;
    if (!RequireString(event, "type", path, type, error)) return false;
    if (!ParseBrc20Operation(type, out.op)) {
        error = path + ".type has unknown operation '" + type + "'";
        return false;
    }
    if (!RequireString(event, "tick", path, out.ticker, error)) return false;
    if (!OptionalString(event, "from", path, out.from, error)) return false;
    if (!OptionalString(event, "to", path, out.to, error)) return false;

    const Json::Value& amount = event["amount"];
    std::string raw_amount;
    if (amount.isNull()) {
        raw_amount = "0";
    } else if (amount.isString()) {
        raw_amount = amount.asString();
    } else if (amount.isIntegral()) {
        raw_amount = amount.isUInt64() ? std::to_string(amount.asUInt64()) : std::to_string(amount.asInt64());
    } else {
        error = path + ".amount must be a decimal string or integer";
        return false;
    }
    if (!NormalizeDecimal(raw_amount, out.amount)) {
        error = path + ".amount '" + raw_amount + "' is not a decimal number";
        return false;
    }

    std::string event_txid;
    if (!OptionalString(event, "txid", path, event_txid, error)) return false;
    out.txid = event_txid.empty() ? txid : event_txid;
    // "msg" is free text and never compared.
    return true;
}

} // namespace

FetchStatus ReceiptDecoder::DecodeNodeInfo(const std::string& body, NodeInfo& info, std::string& error) {
    Json::Value root;
    if (!ParseJson(body, root, error)) {
        return FetchStatus::INVALID_RESPONSE;
    }
    const Json::Value& data = root.isObject() ? root["data"] : Json::Value::nullSingleton();
    const Json::Value& chain_info = data.isObject() ? data["chainInfo"] : Json::Value::nullSingleton();
    if (!chain_info.isObject()) {
        error = "data.chainInfo missing from node info";
        return FetchStatus::INVALID_RESPONSE;
    }
    if (!RequireString(chain_info, "network", "data.chainInfo", info.network, error)) {
        return FetchStatus::INVALID_RESPONSE;
    }
    if (info.network == "mainnet") {
        info.network = "bitcoin";
    }
    const Json::Value& height = chain_info["ordBlockHeight"];
    if (!height.isUInt64()) {
        error = "data.chainInfo.ordBlockHeight must be a non-negative integer";
        return FetchStatus::INVALID_RESPONSE;
    }
    info.ord_block_height = height.asUInt64();
    return FetchStatus::OK;
}

FetchStatus ReceiptDecoder::DecodeBlockReceipts(ProtocolId protocol, const std::string& body,
                                                Receipts& receipts, std::string& error) {
    Json::Value root;
    if (!ParseJson(body, root, error)) {
        return FetchStatus::INVALID_RESPONSE;
    }
    if (!root.isObject()) {
        error = "response root must be an object";
        return FetchStatus::INVALID_RESPONSE;
    }

    OrdinalReceipts ordinal;
    Brc20Receipts brc20;
    const Json::Value& data = root["data"];
    const Json::Value& block = data.isObject() ? data["block"] : Json::Value::nullSingleton();
    if (!data.isNull() && !data.isObject()) {
        error = "data must be an object";
        return FetchStatus::INVALID_RESPONSE;
    }
    if (!block.isNull() && !block.isArray()) {
        error = "data.block must be an array";
        return FetchStatus::INVALID_RESPONSE;
    }

    for (Json::ArrayIndex i = 0; !block.isNull() && i < block.size(); ++i) {
        const Json::Value& tx = block[i];
        std::string tx_path = "data.block[" + std::to_string(i) + "]";
        if (!tx.isObject()) {
            error = tx_path + " must be an object";
            return FetchStatus::INVALID_RESPONSE;
        }
        std::string txid;
        if (!OptionalString(tx, "txid", tx_path, txid, error)) {
            return FetchStatus::INVALID_RESPONSE;
        }
        const Json::Value& events = tx["events"];
        if (events.isNull()) {
            continue;
        }
        if (!events.isArray()) {
            error = tx_path + ".events must be an array";
            return FetchStatus::INVALID_RESPONSE;
        }
        for (Json::ArrayIndex j = 0; j < events.size(); ++j) {
            const Json::Value& event = events[j];
            std::string path = tx_path + ".events[" + std::to_string(j) + "]";
            if (!event.isObject()) {
                error = path + " must be an object";
                return FetchStatus::INVALID_RESPONSE;
            }
            if (protocol == ProtocolId::ORDINAL) {
                InscriptionEvent decoded;
                if (!DecodeInscription(event, path, txid, decoded, error)) {
                    return FetchStatus::INVALID_RESPONSE;
                }
                ordinal.events.push_back(std::move(decoded));
            } else {
                Brc20Event decoded;
                bool keep = true;
                if (!DecodeLedgerEntry(event, path, txid, decoded, keep, error)) {
                    return FetchStatus::INVALID_RESPONSE;
                }
                if (keep) {
                    brc20.events.push_back(std::move(decoded));
                }
            }
        }
    }

    if (protocol == ProtocolId::ORDINAL) {
        receipts = std::move(ordinal);
    } else {
        receipts = std::move(brc20);
    }
    return FetchStatus::OK;
}

} // namespace Crosscheck
