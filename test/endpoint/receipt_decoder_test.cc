#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/endpoint/receipt_decoder.h"

using namespace Crosscheck;
using ::testing::HasSubstr;
using ::testing::SizeIs;

TEST(NodeInfoDecodeTest, MainnetIsReportedAsBitcoin) {
    NodeInfo info;
    std::string error;
    ASSERT_EQ(ReceiptDecoder::DecodeNodeInfo(
                  R"({"code":0,"data":{"chainInfo":{"network":"mainnet","ordBlockHeight":840000}}})",
                  info, error),
              FetchStatus::OK) << error;
    EXPECT_EQ(info.network, "bitcoin");
    EXPECT_EQ(info.ord_block_height, 840000u);
}

TEST(NodeInfoDecodeTest, FractalNetworkPassesThrough) {
    NodeInfo info;
    std::string error;
    ASSERT_EQ(ReceiptDecoder::DecodeNodeInfo(
                  R"({"data":{"chainInfo":{"network":"fractal","ordBlockHeight":21500}}})", info, error),
              FetchStatus::OK);
    EXPECT_EQ(info.network, "fractal");
}

TEST(NodeInfoDecodeTest, MissingHeightIsInvalid) {
    NodeInfo info;
    std::string error;
    EXPECT_EQ(ReceiptDecoder::DecodeNodeInfo(R"({"data":{"chainInfo":{"network":"mainnet"}}})", info, error),
              FetchStatus::INVALID_RESPONSE);
    EXPECT_THAT(error, HasSubstr("ordBlockHeight"));

    EXPECT_EQ(ReceiptDecoder::DecodeNodeInfo("[1,2]", info, error), FetchStatus::INVALID_RESPONSE);
    EXPECT_EQ(ReceiptDecoder::DecodeNodeInfo("<html>", info, error), FetchStatus::INVALID_RESPONSE);
}

TEST(BlockReceiptsDecodeTest, OrdinalEvents) {
    const std::string body = R"({
      "data": {"block": [
        {"txid": "aa", "events": [
          {"inscriptionId": "aai0", "owner": "bc1qx", "contentHash": "h1", "sequence": 2},
          {"inscriptionId": "bbi0", "txid": "override"}
        ]},
        {"txid": "cc", "events": null}
      ]}
    })";
    Receipts receipts;
    std::string error;
    ASSERT_EQ(ReceiptDecoder::DecodeBlockReceipts(ProtocolId::ORDINAL, body, receipts, error),
              FetchStatus::OK) << error;

    const auto* ordinal = std::get_if<OrdinalReceipts>(&receipts);
    ASSERT_NE(ordinal, nullptr);
    ASSERT_THAT(ordinal->events, SizeIs(2));
    EXPECT_EQ(ordinal->events[0].inscription_id, "aai0");
    EXPECT_EQ(ordinal->events[0].txid, "aa");
    EXPECT_EQ(ordinal->events[0].owner, "bc1qx");
    EXPECT_EQ(ordinal->events[0].content_hash, "h1");
    EXPECT_EQ(ordinal->events[0].sequence, 2u);
    EXPECT_EQ(ordinal->events[1].txid, "override");
    EXPECT_EQ(ordinal->events[1].sequence, 0u);
}

TEST(BlockReceiptsDecodeTest, Brc20DropsInvalidEventsAndIgnoresMsg) {
    const std::string body = R"({
      "data": {"block": [
        {"txid": "t1", "events": [
          {"valid": true, "type": "transfer", "tick": "ORDI", "from": "a", "to": "b",
           "amount": "001.50", "msg": "ok"},
          {"valid": false, "type": "mint", "tick": "ordi", "amount": "1", "msg": "exceeds limit"},
          {"type": "mint", "tick": "sats", "to": "c", "amount": 1000}
        ]}
      ]}
    })";
    Receipts receipts;
    std::string error;
    ASSERT_EQ(ReceiptDecoder::DecodeBlockReceipts(ProtocolId::BRC20, body, receipts, error),
              FetchStatus::OK) << error;

    const auto* brc20 = std::get_if<Brc20Receipts>(&receipts);
    ASSERT_NE(brc20, nullptr);
    ASSERT_THAT(brc20->events, SizeIs(2));
    EXPECT_EQ(brc20->events[0].ticker, "ORDI");
    EXPECT_EQ(brc20->events[0].op, Brc20Operation::TRANSFER);
    EXPECT_EQ(brc20->events[0].amount, "1.5");
    EXPECT_EQ(brc20->events[0].txid, "t1");
    EXPECT_EQ(brc20->events[1].op, Brc20Operation::MINT);
    EXPECT_EQ(brc20->events[1].amount, "1000");
}

TEST(BlockReceiptsDecodeTest, NullBlockIsEmpty) {
    Receipts receipts;
    std::string error;
    ASSERT_EQ(ReceiptDecoder::DecodeBlockReceipts(ProtocolId::BRC20, R"({"data":null})", receipts, error),
              FetchStatus::OK);
    EXPECT_EQ(receipts, Receipts(Brc20Receipts{}));

    ASSERT_EQ(ReceiptDecoder::DecodeBlockReceipts(ProtocolId::ORDINAL, R"({"data":{"block":null}})",
                                                  receipts, error),
              FetchStatus::OK);
    EXPECT_EQ(receipts, Receipts(OrdinalReceipts{}));
}

TEST(BlockReceiptsDecodeTest, SchemaViolationsAreInvalidResponses) {
    Receipts receipts;
    std::string error;

    EXPECT_EQ(ReceiptDecoder::DecodeBlockReceipts(ProtocolId::ORDINAL, "not json", receipts, error),
              FetchStatus::INVALID_RESPONSE);

    EXPECT_EQ(ReceiptDecoder::DecodeBlockReceipts(ProtocolId::ORDINAL,
                  R"({"data":{"block":[{"txid":"a","events":[{"owner":"x"}]}]}})", receipts, error),
              FetchStatus::INVALID_RESPONSE);
    EXPECT_THAT(error, HasSubstr("data.block[0].events[0].inscriptionId"));

    EXPECT_EQ(ReceiptDecoder::DecodeBlockReceipts(ProtocolId::BRC20,
                  R"({"data":{"block":[{"events":[{"type":"teleport","tick":"x","amount":"1"}]}]}})",
                  receipts, error),
              FetchStatus::INVALID_RESPONSE);
    EXPECT_THAT(error, HasSubstr("teleport"));

    EXPECT_EQ(ReceiptDecoder::DecodeBlockReceipts(ProtocolId::BRC20,
                  R"({"data":{"block":[{"events":[{"type":"mint","tick":"x","amount":"1e3"}]}]}})",
                  receipts, error),
              FetchStatus::INVALID_RESPONSE);

    EXPECT_EQ(ReceiptDecoder::DecodeBlockReceipts(ProtocolId::ORDINAL, R"({"data":{"block":{}}})",
                                                  receipts, error),
              FetchStatus::INVALID_RESPONSE);
}
