/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "consensus/poa/impl/proof_of_authority_impl.hpp"

#include <atomic>
#include <functional>
#include <thread>

#include <gtest/gtest.h>

#include "consensus/authority/authority_registry_error.hpp"
#include "consensus/poa/poa_error.hpp"
#include "consensus/timeline/timeline_error.hpp"
#include "mock/core/clock/clock_mock.hpp"
#include "testutil/outcome.hpp"
#include "testutil/prepare_loggers.hpp"

using namespace dynpoa;
using namespace consensus;
using namespace consensus::poa;
using namespace std::chrono_literals;

using authority::AuthorityRegistryError;
using authority::AuthorityUpdate;
using primitives::Authority;
using primitives::AuthorityBlock;
using primitives::Payload;
using testing::NiceMock;
using testing::Return;
using ValidationError = PoaBlockValidator::ValidationError;

class ProofOfAuthorityTest : public testing::Test {
 protected:
  static void SetUpTestCase() {
    testutil::prepareLoggers();
  }

  void SetUp() override {
    ON_CALL(*clock_, now())
        .WillByDefault(Return(clock::SystemClock::TimePoint{genesis_time_}));

    EXPECT_OUTCOME_TRUE(engine, ProofOfAuthorityImpl::create(config(), clock_));
    engine_ = engine;
  }

  EngineConfig config() const {
    return EngineConfig{
        .slot_duration = 5s,
        .genesis_time = genesis_time_,
        .genesis_payload = {{"network", "testnet"}},
        .genesis_metadata = std::nullopt,
        .authorities = {makeAuthority("bob", 1), makeAuthority("alice", 2)},
    };
  }

  static Authority makeAuthority(std::string id,
                                 primitives::AuthorityWeight weight) {
    auto secret = id + "-secret";
    return Authority{.id = std::move(id),
                     .secret = std::move(secret),
                     .weight = weight,
                     .active = true,
                     .metadata = {}};
  }

  /// Middle of the {@param slot}
  TimePoint slotTime(SlotNumber slot) const {
    return engine_->slotStartTime(slot) + 2500ms;
  }

  outcome::result<AuthorityBlock> produce(std::string_view id,
                                          SlotNumber slot) {
    OUTCOME_TRY(block,
                engine_->createBlock(id, {{"slot", slot}}, slotTime(slot), {}));
    return engine_->submitBlock(std::move(block));
  }

  static std::vector<std::string> ids(const primitives::AuthorityList &list) {
    std::vector<std::string> result;
    for (auto &authority : list) {
      result.push_back(authority.id);
    }
    return result;
  }

  TimePoint genesis_time_ = primitives::fromUnixMillis(1700000000000);
  std::shared_ptr<NiceMock<clock::SystemClockMock>> clock_ =
      std::make_shared<NiceMock<clock::SystemClockMock>>();
  std::shared_ptr<ProofOfAuthorityImpl> engine_;
};

/**
 * @given engine configured with two authorities
 * @when it is created
 * @then chain consists of the genesis block and authorities are sorted
 */
TEST_F(ProofOfAuthorityTest, Genesis) {
  EXPECT_EQ(engine_->height(), 1);
  EXPECT_EQ(engine_->genesisTime(), genesis_time_);
  EXPECT_EQ(engine_->slotDuration(), 5s);

  auto genesis = engine_->genesisBlock();
  EXPECT_EQ(genesis.slot, 0);
  EXPECT_EQ(genesis.proposer, primitives::kGenesisProposer);
  EXPECT_EQ(genesis.timestamp, genesis_time_);
  EXPECT_EQ(genesis.parent_hash, primitives::BlockHash{});
  EXPECT_FALSE(genesis.signature.has_value());
  EXPECT_EQ(genesis, engine_->lastBlock());

  EXPECT_EQ(ids(engine_->authorities()),
            (std::vector<std::string>{"alice", "bob"}));
  EXPECT_EQ(ids(engine_->activeAuthorities()),
            (std::vector<std::string>{"alice", "bob"}));
  EXPECT_OUTCOME_TRUE_1(engine_->verifyBlock(genesis));
  EXPECT_OUTCOME_TRUE_1(engine_->validateChain());
}

/**
 * @given configuration without genesis time
 * @when engine is created
 * @then genesis time is taken from the clock
 */
TEST_F(ProofOfAuthorityTest, GenesisTimeFromClock) {
  auto now = genesis_time_ + 42s;
  EXPECT_CALL(*clock_, now())
      .WillOnce(Return(clock::SystemClock::TimePoint{now}));
  auto cfg = config();
  cfg.genesis_time.reset();
  EXPECT_OUTCOME_TRUE(engine, ProofOfAuthorityImpl::create(cfg, clock_));
  EXPECT_EQ(engine->genesisTime(), now);
  EXPECT_EQ(engine->genesisBlock().timestamp, now);
}

/**
 * @given invalid configurations
 * @when engine is created
 * @then configuration error is returned
 */
TEST_F(ProofOfAuthorityTest, InvalidConfig) {
  auto zero_duration = config();
  zero_duration.slot_duration = 0s;
  EXPECT_EC(ProofOfAuthorityImpl::create(zero_duration, clock_),
            TimelineError::INVALID_SLOT_DURATION);

  auto zero_weight = config();
  zero_weight.authorities.push_back(makeAuthority("carol", 0));
  EXPECT_EC(ProofOfAuthorityImpl::create(zero_weight, clock_),
            AuthorityRegistryError::INVALID_WEIGHT);
}

/**
 * @given alice with weight 2 and bob with weight 1
 * @when leaders are queried
 * @then rotation is alice, alice, bob
 */
TEST_F(ProofOfAuthorityTest, Schedule) {
  std::vector<std::string> leaders;
  for (SlotNumber slot = 1; slot <= 6; ++slot) {
    EXPECT_OUTCOME_TRUE(leader, engine_->authorityForSlot(slot));
    leaders.push_back(leader.id);
  }
  EXPECT_EQ(leaders,
            (std::vector<std::string>{
                "alice", "alice", "bob", "alice", "alice", "bob"}));

  EXPECT_EC(engine_->authorityForSlot(0), PoaError::INVALID_SLOT);

  EXPECT_OUTCOME_TRUE(slot, engine_->slotForTimestamp(genesis_time_ + 16s));
  EXPECT_EQ(slot, 3);
  EXPECT_OUTCOME_TRUE(expected, engine_->expectedAuthorityAt(slotTime(3)));
  EXPECT_EQ(expected.id, "bob");
  EXPECT_EC(engine_->expectedAuthorityAt(genesis_time_ + 1s),
            PoaError::GENESIS_SLOT_RESERVED);
  EXPECT_EC(engine_->slotForTimestamp(genesis_time_ - 1s),
            TimelineError::TIMESTAMP_BEFORE_GENESIS);
}

/**
 * @given scheduled leaders
 * @when they produce blocks for slots 1, 2 and 3
 * @then blocks are linked into a valid chain
 */
TEST_F(ProofOfAuthorityTest, ProduceChain) {
  EXPECT_OUTCOME_TRUE(block1, produce("alice", 1));
  EXPECT_OUTCOME_TRUE(block2, produce(" alice ", 2));
  EXPECT_OUTCOME_TRUE(block3, produce("bob", 3));

  EXPECT_EQ(engine_->height(), 4);
  EXPECT_EQ(block1.parent_hash, engine_->genesisBlock().hash());
  EXPECT_EQ(block2.proposer, "alice");
  EXPECT_EQ(block2.parent_hash, block1.hash());
  EXPECT_EQ(block3.parent_hash, block2.hash());
  EXPECT_EQ(engine_->lastBlock(), block3);
  EXPECT_OUTCOME_TRUE_1(engine_->validateChain());

  auto chain = engine_->chain();
  ASSERT_EQ(chain.size(), 4);
  EXPECT_EQ(chain[2], block2);
}

/**
 * @given block of alice for slot 1
 * @when bob produces the next block skipping slot 2
 * @then block is accepted
 */
TEST_F(ProofOfAuthorityTest, SlotGap) {
  EXPECT_OUTCOME_TRUE_1(produce("alice", 1));
  EXPECT_OUTCOME_TRUE(block, produce("bob", 3));
  EXPECT_EQ(block.slot, 3);
  EXPECT_OUTCOME_TRUE_1(engine_->validateChain());
}

/**
 * @given engine with registered authorities
 * @when blocks are created by wrong authorities or for wrong slots
 * @then creation fails
 */
TEST_F(ProofOfAuthorityTest, CreateBlockErrors) {
  EXPECT_EC(engine_->createBlock("carol", {}, slotTime(1), {}),
            AuthorityRegistryError::UNKNOWN_AUTHORITY);
  EXPECT_EC(engine_->createBlock("  ", {}, slotTime(1), {}),
            AuthorityRegistryError::EMPTY_IDENTIFIER);
  EXPECT_EC(engine_->createBlock("alice", {}, genesis_time_ + 1s, {}),
            PoaError::GENESIS_SLOT_RESERVED);
  EXPECT_EC(engine_->createBlock("alice", {}, genesis_time_ - 1s, {}),
            TimelineError::TIMESTAMP_BEFORE_GENESIS);
  EXPECT_EC(engine_->createBlock("bob", {}, slotTime(2), {}),
            PoaError::NOT_SCHEDULED_LEADER);

  EXPECT_OUTCOME_TRUE_1(produce("alice", 2));
  EXPECT_EC(engine_->createBlock("alice", {}, slotTime(1), {}),
            PoaError::SLOT_NOT_ADVANCING);
  EXPECT_EC(engine_->createBlock("alice", {}, slotTime(2), {}),
            PoaError::SLOT_NOT_ADVANCING);

  EXPECT_OUTCOME_TRUE_1(
      engine_->updateAuthority("bob", AuthorityUpdate{.active = false}));
  EXPECT_EC(engine_->createBlock("bob", {}, slotTime(3), {}),
            PoaError::INACTIVE_AUTHORITY);
}

/**
 * @given clock pointing into slot 1
 * @when block is created without timestamp
 * @then current time is used
 */
TEST_F(ProofOfAuthorityTest, DefaultTimestamp) {
  auto now = genesis_time_ + 5s + 1ms;
  EXPECT_CALL(*clock_, now())
      .WillOnce(Return(clock::SystemClock::TimePoint{now}));
  EXPECT_OUTCOME_TRUE(
      block,
      engine_->createBlock("alice", {}, std::nullopt, Payload{{"k", "v"}}));
  EXPECT_EQ(block.slot, 1);
  EXPECT_EQ(block.timestamp, now);
  EXPECT_EQ(block.metadata, (Payload{{"k", "v"}}));
  EXPECT_OUTCOME_TRUE_1(engine_->verifyBlock(block));
}

/**
 * @given created block
 * @when its content is changed before submission
 * @then verification reports the mismatch and submission is rejected
 */
TEST_F(ProofOfAuthorityTest, TamperedBlockRejected) {
  EXPECT_OUTCOME_TRUE(
      block, engine_->createBlock("alice", {{"amount", 1}}, slotTime(1), {}));
  EXPECT_OUTCOME_TRUE_1(engine_->verifyBlock(block));

  auto tampered = block;
  tampered.payload["amount"] = 1000;
  EXPECT_EC(engine_->verifyBlock(tampered), ValidationError::HASH_MISMATCH);
  EXPECT_EC(engine_->submitBlock(tampered), PoaError::BLOCK_REJECTED);

  auto forged = block;
  forged.signature =
      makeAuthority("bob", 1).sign(primitives::signingMessage(block));
  EXPECT_EC(engine_->verifyBlock(forged), ValidationError::INVALID_SIGNATURE);
  EXPECT_EC(engine_->submitBlock(forged), PoaError::BLOCK_REJECTED);

  EXPECT_EQ(engine_->height(), 1);
  EXPECT_OUTCOME_TRUE_1(engine_->submitBlock(block));
  EXPECT_EQ(engine_->height(), 2);
}

/**
 * @given accepted block
 * @when it or the genesis block is submitted again
 * @then submission is rejected
 */
TEST_F(ProofOfAuthorityTest, Resubmission) {
  EXPECT_OUTCOME_TRUE(block, produce("alice", 1));
  EXPECT_EC(engine_->submitBlock(block), PoaError::BLOCK_REJECTED);
  EXPECT_EC(engine_->verifyBlock(block), ValidationError::SLOT_NOT_ADVANCING);
  EXPECT_OUTCOME_TRUE_1(
      engine_->verifyBlock(block, engine_->genesisBlock()));

  EXPECT_EC(engine_->submitBlock(engine_->genesisBlock()),
            PoaError::BLOCK_REJECTED);
  EXPECT_EQ(engine_->height(), 2);
}

/**
 * @given chain containing a block of bob
 * @when bob is deregistered
 * @then historical blocks stay valid, while bob can not produce anymore
 */
TEST_F(ProofOfAuthorityTest, DeregistrationKeepsHistory) {
  EXPECT_OUTCOME_TRUE(block1, produce("alice", 1));
  EXPECT_OUTCOME_TRUE(block3, produce("bob", 3));

  EXPECT_OUTCOME_TRUE(removed, engine_->deregisterAuthority("bob"));
  EXPECT_EQ(removed.id, "bob");
  EXPECT_EQ(ids(engine_->authorities()), (std::vector<std::string>{"alice"}));
  EXPECT_EC(engine_->deregisterAuthority("bob"),
            AuthorityRegistryError::UNKNOWN_AUTHORITY);

  EXPECT_OUTCOME_TRUE_1(engine_->validateChain());
  EXPECT_OUTCOME_TRUE_1(engine_->verifyBlock(block3, block1));
  EXPECT_OUTCOME_TRUE(leader3, engine_->authorityForSlot(3));
  EXPECT_EQ(leader3.id, "bob");
  EXPECT_OUTCOME_TRUE(leader6, engine_->authorityForSlot(6));
  EXPECT_EQ(leader6.id, "alice");

  EXPECT_EC(engine_->createBlock("bob", {}, slotTime(6), {}),
            AuthorityRegistryError::UNKNOWN_AUTHORITY);
  EXPECT_OUTCOME_TRUE_1(produce("alice", 6));
  EXPECT_OUTCOME_TRUE_1(engine_->validateChain());
}

/**
 * @given bob deregistered after his block at slot 3
 * @when bob signs a block for slot 6 with his old secret, which would be his
 * slot under the previous authority set
 * @then the set effective at slot 6 decides and the block is rejected
 */
TEST_F(ProofOfAuthorityTest, DeregisteredAuthorityBlockRejected) {
  EXPECT_OUTCOME_TRUE_1(produce("alice", 1));
  EXPECT_OUTCOME_TRUE(block3, produce("bob", 3));
  EXPECT_OUTCOME_TRUE_1(engine_->deregisterAuthority("bob"));

  AuthorityBlock block{.slot = 6,
                       .proposer = "bob",
                       .timestamp = slotTime(6),
                       .payload = Payload{{"slot", 6}},
                       .parent_hash = block3.hash()};
  primitives::calculateBlockHash(block);
  block.signature =
      makeAuthority("bob", 1).sign(primitives::signingMessage(block));

  EXPECT_EC(engine_->verifyBlock(block),
            ValidationError::UNEXPECTED_PROPOSER);
  EXPECT_EC(engine_->verifyBlock(block, block3),
            ValidationError::UNEXPECTED_PROPOSER);
  EXPECT_EC(engine_->submitBlock(block), PoaError::BLOCK_REJECTED);
  EXPECT_EQ(engine_->height(), 3);
  EXPECT_EQ(engine_->lastBlock(), block3);
}

/**
 * @given two valid blocks of alice competing for slot 1
 * @when they are submitted from two threads at once
 * @then exactly one is accepted and the chain grows by one block
 */
TEST_F(ProofOfAuthorityTest, ConcurrentSubmission) {
  for (int round = 0; round < 20; ++round) {
    EXPECT_OUTCOME_TRUE(engine, ProofOfAuthorityImpl::create(config(), clock_));

    EXPECT_OUTCOME_TRUE(
        first, engine->createBlock("alice", {{"fork", 1}}, slotTime(1), {}));
    EXPECT_OUTCOME_TRUE(
        second, engine->createBlock("alice", {{"fork", 2}}, slotTime(1), {}));
    ASSERT_NE(first.hash(), second.hash());

    std::atomic_bool start{false};
    std::atomic_int accepted{0};
    auto submit = [&](const AuthorityBlock &block) {
      while (not start.load()) {
        std::this_thread::yield();
      }
      if (engine->submitBlock(block).has_value()) {
        ++accepted;
      }
    };
    std::thread t1(submit, std::cref(first));
    std::thread t2(submit, std::cref(second));
    start = true;
    t1.join();
    t2.join();

    EXPECT_EQ(accepted.load(), 1);
    EXPECT_EQ(engine->height(), 2);
    auto head = engine->lastBlock();
    EXPECT_TRUE(head == first or head == second);
    EXPECT_OUTCOME_TRUE_1(engine->validateChain());
  }
}

/**
 * @given chain with head at slot 1
 * @when a new authority is registered
 * @then schedule changes only from slot 2
 */
TEST_F(ProofOfAuthorityTest, RegistrationTakesEffectAfterHead) {
  EXPECT_OUTCOME_TRUE_1(produce("alice", 1));
  // cycle alice, alice, bob
  EXPECT_OUTCOME_TRUE(before, engine_->authorityForSlot(4));
  EXPECT_EQ(before.id, "alice");

  EXPECT_OUTCOME_TRUE_1(
      engine_->registerAuthority(makeAuthority("carol", 1), false));
  EXPECT_EC(engine_->registerAuthority(makeAuthority("carol", 1), false),
            AuthorityRegistryError::DUPLICATE_AUTHORITY);

  // cycle alice, alice, bob, carol
  EXPECT_OUTCOME_TRUE(leader1, engine_->authorityForSlot(1));
  EXPECT_EQ(leader1.id, "alice");
  EXPECT_OUTCOME_TRUE(after, engine_->authorityForSlot(4));
  EXPECT_EQ(after.id, "carol");

  EXPECT_OUTCOME_TRUE_1(produce("carol", 4));
  EXPECT_OUTCOME_TRUE_1(engine_->validateChain());
}

/**
 * @given authority with changed weight and secret
 * @when blocks are produced afterwards
 * @then new weight and secret are used while old blocks stay valid
 */
TEST_F(ProofOfAuthorityTest, UpdateAuthority) {
  EXPECT_OUTCOME_TRUE_1(produce("bob", 3));
  EXPECT_OUTCOME_TRUE(
      updated,
      engine_->updateAuthority(
          "alice", AuthorityUpdate{.secret = "rotated", .weight = 1}));
  EXPECT_EQ(updated.weight, 1u);
  EXPECT_EQ(updated.secret, "rotated");
  EXPECT_EC(engine_->updateAuthority("carol", AuthorityUpdate{}),
            AuthorityRegistryError::UNKNOWN_AUTHORITY);

  // cycle alice, bob
  EXPECT_OUTCOME_TRUE(leader4, engine_->authorityForSlot(4));
  EXPECT_EQ(leader4.id, "bob");
  EXPECT_OUTCOME_TRUE(block5, produce("alice", 5));
  EXPECT_EQ(block5.signature, updated.sign(primitives::signingMessage(block5)));
  EXPECT_OUTCOME_TRUE_1(engine_->validateChain());
}

/**
 * @given engine with one produced block
 * @when snapshot is exported
 * @then it describes the state without disclosing secrets
 */
TEST_F(ProofOfAuthorityTest, Snapshot) {
  EXPECT_OUTCOME_TRUE(block, produce("alice", 1));
  EXPECT_OUTCOME_TRUE_1(engine_->deregisterAuthority("bob"));

  auto snapshot = engine_->snapshot();
  EXPECT_EQ(snapshot.genesis_time, genesis_time_);
  EXPECT_EQ(snapshot.slot_duration, 5s);
  EXPECT_EQ(ids(snapshot.authorities), (std::vector<std::string>{"alice"}));
  ASSERT_EQ(snapshot.authority_history.size(), 2);
  EXPECT_EQ(snapshot.authority_history[0].start_slot, 1);
  EXPECT_EQ(snapshot.authority_history[0].authorities->size(), 2);
  EXPECT_EQ(snapshot.authority_history[1].start_slot, 2);
  ASSERT_EQ(snapshot.chain.size(), 2);
  EXPECT_EQ(snapshot.chain[1], block);

  auto json = snapshotToJson(snapshot);
  EXPECT_EQ(json.find("secret"), std::string::npos);
  EXPECT_NE(json.find(R"("genesis_time":"2023-11-14T22:13:20Z")"),
            std::string::npos);
  EXPECT_NE(json.find(R"("slot_duration_seconds":5.0)"), std::string::npos);
  EXPECT_NE(json.find(R"("start_slot":2)"), std::string::npos);
  EXPECT_NE(json.find(fmt::format("{:l}", block.hash())), std::string::npos);
}
