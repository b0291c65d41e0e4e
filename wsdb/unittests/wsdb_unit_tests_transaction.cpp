#include <wsdb/transaction.hpp>

#include <sstream>

#include <gtest/gtest.h>

#include "wsdb_unit_tests_environment.hpp"

using namespace wsdb;

class TransactionTest : public ::testing::Test {
protected:
    static Transaction with_state(State state) {
        Transaction tx = test::transaction("0xabc", state);
        if (state == State::Confirmed) {
            tx.block = test::block(10, "b10");
        }
        return tx;
    }

    static bool allowed(State from, State to) {
        return lifecycle::transition_allowed(with_state(from), with_state(to));
    }
};

TEST_F(TransactionTest, Binary) {
    Transaction tx = test::transaction("0xabc", State::Confirmed);
    tx.own = false;
    tx.confirm_timestamp = 2000;
    tx.block = test::block(100, "0xblock");
    tx.block_pos = 3;
    tx.status = Status::Ok;
    tx.version = 7;
    tx.changes.push_back(test::change("w1", "0x01", "100", Direction::Send));
    tx.changes.push_back(test::change("w2", "0x02", "99"));

    Transaction decoded;
    ASSERT_TRUE(Transaction::from_binary(tx.to_binary(), decoded));
    EXPECT_EQ(decoded, tx);
    ASSERT_TRUE(decoded.own.has_value());
    EXPECT_FALSE(*decoded.own);
}

TEST_F(TransactionTest, AbsentOptionalsStayAbsent) {
    Transaction tx = test::transaction("0xabc", State::Submitted);

    Transaction decoded;
    ASSERT_TRUE(Transaction::from_binary(tx.to_binary(), decoded));
    EXPECT_FALSE(decoded.own.has_value());
    EXPECT_FALSE(decoded.block.has_value());
}

TEST_F(TransactionTest, Undecodable) {
    Transaction decoded;
    EXPECT_FALSE(Transaction::from_binary(ws::Bytes{0xFF}, decoded));

    ws::Bytes data = test::transaction("0xabc", State::Prepared).to_binary();
    data.resize(data.size() - 1);
    EXPECT_FALSE(Transaction::from_binary(data, decoded));
}

TEST_F(TransactionTest, Meta) {
    TransactionMeta meta;
    meta.timestamp = 10;
    meta.blockchain = Blockchain::Bitcoin;
    meta.tx_id = "txid";
    meta.label = "rent";
    meta.raw = {0x01, 0x00, 0x02};

    TransactionMeta decoded;
    ASSERT_TRUE(TransactionMeta::from_binary(meta.to_binary(), decoded));
    EXPECT_EQ(decoded.timestamp, 10u);
    EXPECT_EQ(decoded.blockchain, Blockchain::Bitcoin);
    EXPECT_EQ(decoded.label, "rent");
    EXPECT_EQ(decoded.raw, meta.raw);
}

TEST_F(TransactionTest, OwnFlag) {
    Transaction tx = test::transaction("0xabc", State::Prepared);
    EXPECT_FALSE(tx.is_own());

    tx.changes.push_back(test::change("w", "a", "1", Direction::Send));
    EXPECT_TRUE(tx.is_own());

    tx.own = false;
    EXPECT_FALSE(tx.is_own());
}

TEST_F(TransactionTest, LegalTransitions) {
    EXPECT_TRUE(allowed(State::Prepared, State::Prepared));
    EXPECT_TRUE(allowed(State::Prepared, State::Submitted));
    EXPECT_TRUE(allowed(State::Submitted, State::Submitted));
    EXPECT_TRUE(allowed(State::Submitted, State::Confirmed));
    EXPECT_TRUE(allowed(State::Submitted, State::Replaced));
    EXPECT_TRUE(allowed(State::Submitted, State::Dropped));
    EXPECT_TRUE(allowed(State::Confirmed, State::Confirmed));
    EXPECT_TRUE(allowed(State::Confirmed, State::Dropped));
}

TEST_F(TransactionTest, IllegalTransitions) {
    EXPECT_FALSE(allowed(State::Prepared, State::Confirmed));
    EXPECT_FALSE(allowed(State::Prepared, State::Replaced));
    EXPECT_FALSE(allowed(State::Prepared, State::Dropped));
    EXPECT_FALSE(allowed(State::Submitted, State::Prepared));
    EXPECT_FALSE(allowed(State::Confirmed, State::Prepared));
    EXPECT_FALSE(allowed(State::Confirmed, State::Replaced));
    EXPECT_FALSE(allowed(State::Replaced, State::Submitted));
    EXPECT_FALSE(allowed(State::Replaced, State::Replaced));
    EXPECT_FALSE(allowed(State::Dropped, State::Submitted));
    EXPECT_FALSE(allowed(State::Dropped, State::Dropped));
}

TEST_F(TransactionTest, ConfirmedReversal) {
    const Transaction confirmed = with_state(State::Confirmed);

    Transaction reverted = with_state(State::Submitted);
    EXPECT_TRUE(lifecycle::transition_allowed(confirmed, reverted));

    reverted.block = confirmed.block;
    std::string reason;
    EXPECT_FALSE(lifecycle::transition_allowed(confirmed, reverted, &reason));
    EXPECT_FALSE(reason.empty());

    reverted.block = test::block(10, "other");
    EXPECT_TRUE(lifecycle::transition_allowed(confirmed, reverted));
}

TEST_F(TransactionTest, ConfirmedRewriteKeepsBlock) {
    const Transaction confirmed = with_state(State::Confirmed);
    Transaction moved = confirmed;
    moved.block = test::block(11, "b11");
    EXPECT_FALSE(lifecycle::transition_allowed(confirmed, moved));
}

TEST_F(TransactionTest, UnknownStates) {
    const auto unknown = static_cast<State>(99);
    EXPECT_FALSE(lifecycle::is_known(unknown));
    EXPECT_FALSE(allowed(State::Submitted, unknown));
    EXPECT_FALSE(allowed(unknown, State::Submitted));

    Transaction tx = with_state(State::Submitted);
    tx.state = unknown;
    EXPECT_FALSE(lifecycle::block_consistent(tx));
}

TEST_F(TransactionTest, BlockConsistency) {
    Transaction tx = with_state(State::Confirmed);
    EXPECT_TRUE(lifecycle::block_consistent(tx));
    tx.block.reset();
    EXPECT_FALSE(lifecycle::block_consistent(tx));

    tx = with_state(State::Prepared);
    tx.block = test::block(1, "b1");
    EXPECT_FALSE(lifecycle::block_consistent(tx));

    tx.state = State::Submitted;
    EXPECT_TRUE(lifecycle::block_consistent(tx));
}

TEST_F(TransactionTest, Names) {
    std::ostringstream os;
    os << State::Confirmed << ' ' << Blockchain::Ethereum << ' ' << static_cast<Blockchain>(7);
    EXPECT_EQ(os.str(), "CONFIRMED ETHEREUM UNKNOWN(7)");
    EXPECT_TRUE(lifecycle::is_terminal(State::Replaced));
    EXPECT_FALSE(lifecycle::is_terminal(State::Confirmed));
}

TEST_F(TransactionTest, MergeKeepsSinceTimestamp) {
    Transaction stored = with_state(State::Prepared);
    stored.since_timestamp = 500;

    Transaction incoming = with_state(State::Submitted);
    incoming.since_timestamp = 0;
    EXPECT_EQ(lifecycle::merge(stored, incoming).since_timestamp, 500u);

    incoming.since_timestamp = 700;
    EXPECT_EQ(lifecycle::merge(stored, incoming).since_timestamp, 700u);
}

TEST_F(TransactionTest, MergeKeepsLaterConfirmTimestamp) {
    Transaction stored = with_state(State::Confirmed);
    stored.confirm_timestamp = 3000;

    Transaction incoming = with_state(State::Confirmed);
    incoming.confirm_timestamp = 2000;
    EXPECT_EQ(lifecycle::merge(stored, incoming).confirm_timestamp, 3000u);

    incoming.confirm_timestamp = 4000;
    EXPECT_EQ(lifecycle::merge(stored, incoming).confirm_timestamp, 4000u);

    // dropping the block drops the confirmation
    Transaction reverted = with_state(State::Submitted);
    reverted.confirm_timestamp = 0;
    EXPECT_EQ(lifecycle::merge(stored, reverted).confirm_timestamp, 0u);
}

TEST_F(TransactionTest, MergeCarriesWalletOfSimilarChange) {
    Transaction stored = with_state(State::Submitted);
    stored.changes.push_back(test::change("w1", "0x01", "10"));
    stored.changes.back().entry_id = 3;
    stored.changes.push_back(test::change("w2", "0x02", "10"));
    stored.changes.back().entry_id = 4;

    Transaction incoming = with_state(State::Submitted);
    incoming.changes.push_back(test::change("", "0x02", "10"));
    incoming.changes.push_back(test::change("", "0x01", "10"));
    // differs in direction from every stored change
    incoming.changes.push_back(test::change("", "0x01", "10", Direction::Send));
    incoming.changes.push_back(test::change("w9", "0x01", "10"));

    const Transaction merged = lifecycle::merge(stored, incoming);
    ASSERT_EQ(merged.changes.size(), 4u);
    EXPECT_EQ(merged.changes[0].wallet_id, "w2");
    EXPECT_EQ(merged.changes[0].entry_id, 4u);
    EXPECT_EQ(merged.changes[1].wallet_id, "w1");
    EXPECT_EQ(merged.changes[1].entry_id, 3u);
    EXPECT_TRUE(merged.changes[2].wallet_id.empty());
    EXPECT_EQ(merged.changes[3].wallet_id, "w9");
}

TEST_F(TransactionTest, MergeKeepsStoredFees) {
    Change fee = test::change("w1", "0x01", "1", Direction::Send);
    fee.change_type = ChangeType::Fee;

    Transaction stored = with_state(State::Submitted);
    stored.changes.push_back(test::change("w1", "0x01", "10", Direction::Send));
    stored.changes.push_back(fee);

    Transaction incoming = with_state(State::Submitted);
    incoming.changes.push_back(test::change("w1", "0x01", "10", Direction::Send));

    Transaction merged = lifecycle::merge(stored, incoming);
    ASSERT_EQ(merged.changes.size(), 2u);
    EXPECT_EQ(merged.changes[1], fee);

    // fees of the incoming record replace the stored ones
    Change new_fee = fee;
    new_fee.amount = "2";
    incoming.changes.push_back(new_fee);
    merged = lifecycle::merge(stored, incoming);
    ASSERT_EQ(merged.changes.size(), 2u);
    EXPECT_EQ(merged.changes[1].amount, "2");
}
