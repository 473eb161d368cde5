#include "internal/ledger/stream_ledger.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <limits>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/custody/memory_custody.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/vesting/vesting.hpp"

namespace {

using streamledger::custody::Custody;
using streamledger::custody::MemoryCustody;
using streamledger::custody::TransferResult;
using streamledger::custody::TransferStatus;
using streamledger::db::memory::MemoryRepository;
using streamledger::ledger::CallContext;
using streamledger::ledger::CreateStreamParams;
using streamledger::ledger::ErrorCode;
using streamledger::ledger::LedgerOptions;
using streamledger::ledger::StreamLedger;

/*
  Custody whose transfers can be switched to fail.
*/
class FailingCustody final : public Custody {
 public:
  TransferResult Deposit(const std::string& from, uint64_t amount) override {
    if (fail_deposit) return TransferResult::Err(TransferStatus::Rejected, "deposit disabled");
    return inner.Deposit(from, amount);
  }

  TransferResult Payout(const std::string& to, uint64_t amount) override {
    if (fail_payout) return TransferResult::Err(TransferStatus::Rejected, "payout disabled");
    return inner.Payout(to, amount);
  }

  TransferResult ReverseDeposit(const std::string& from, uint64_t amount) override {
    return inner.ReverseDeposit(from, amount);
  }

  TransferResult ReversePayout(const std::string& to, uint64_t amount) override {
    return inner.ReversePayout(to, amount);
  }

  bool          fail_deposit = false;
  bool          fail_payout  = false;
  MemoryCustody inner;
};

/*
  Custody that, once armed, commits a competing transaction on the ledger's
  repository right after each transfer, so the ledger's own commit fails.
*/
class RacingCustody final : public Custody {
 public:
  explicit RacingCustody(std::shared_ptr<MemoryRepository> repository) : repository_(std::move(repository)) {}

  TransferResult Deposit(const std::string& from, uint64_t amount) override {
    auto result = inner.Deposit(from, amount);
    Race();
    return result;
  }

  TransferResult Payout(const std::string& to, uint64_t amount) override {
    auto result = inner.Payout(to, amount);
    Race();
    return result;
  }

  TransferResult ReverseDeposit(const std::string& from, uint64_t amount) override {
    return inner.ReverseDeposit(from, amount);
  }

  TransferResult ReversePayout(const std::string& to, uint64_t amount) override {
    return inner.ReversePayout(to, amount);
  }

  bool          armed = false;
  MemoryCustody inner;

 private:
  void Race() {
    if (!armed) return;
    repository_->Begin()->Commit();
  }

  std::shared_ptr<MemoryRepository> repository_;
};

struct Fixture {
  std::shared_ptr<MemoryRepository> repository = std::make_shared<MemoryRepository>();
  std::shared_ptr<FailingCustody>   custody    = std::make_shared<FailingCustody>();
  std::unique_ptr<StreamLedger>     ledger;

  explicit Fixture(LedgerOptions options = {}) {
    ledger = std::make_unique<StreamLedger>(repository, custody, "admin", options);
  }
};

CreateStreamParams WithDuration(const std::string& recipient, uint64_t amount, uint64_t duration) {
  CreateStreamParams params;
  params.recipient     = recipient;
  params.funded_amount = amount;
  params.duration      = duration;
  return params;
}

CreateStreamParams WithEndDate(const std::string& recipient, uint64_t amount, uint64_t end_date) {
  CreateStreamParams params;
  params.recipient     = recipient;
  params.funded_amount = amount;
  params.end_date      = end_date;
  return params;
}

uint64_t MustCreate(StreamLedger& ledger, const CallContext& ctx, const CreateStreamParams& params) {
  auto created = ledger.CreateStream(ctx, params);
  assert(created);
  return *created;
}

void TestLedgerInitialisesOwnerOnce() {
  auto repository = std::make_shared<MemoryRepository>();
  auto custody    = std::make_shared<MemoryCustody>();

  StreamLedger first(repository, custody, "admin");
  auto         info = first.GetLedgerInfo();
  assert(info);
  assert(info->owner == "admin");
  assert(info->next_stream_id == 1);

  // a second ledger over the same store keeps the stored owner
  StreamLedger second(repository, custody, "mallory");
  info = second.GetLedgerInfo();
  assert(info);
  assert(info->owner == "admin");
}

void TestCreateAssignsSequentialIds() {
  Fixture f;
  const CallContext alice{"alice", 100};

  assert(MustCreate(*f.ledger, alice, WithDuration("bob", 1000, 1000)) == 1);
  assert(MustCreate(*f.ledger, alice, WithEndDate("carol", 50, 200)) == 2);

  auto stream = f.ledger->GetStreamById(1);
  assert(stream);
  assert(stream->payer == "alice");
  assert(stream->recipient == "bob");
  assert(stream->original_balance == 1000);
  assert(stream->current_balance == 1000);
  assert(stream->start_date == 100);
  assert(stream->end_date == 1100);

  auto second = f.ledger->GetStreamById(2);
  assert(second);
  assert(second->end_date == 200);

  assert(f.custody->inner.Escrow() == 1050);
  assert(f.custody->inner.DepositedBy("alice") == 1050);
  assert(f.ledger->GetLedgerInfo()->next_stream_id == 3);
}

void TestCreateRejectsSelfStream() {
  Fixture f;
  auto    created = f.ledger->CreateStream({"alice", 0}, WithDuration("alice", 10, 10));
  assert(!created);
  assert(created.code == ErrorCode::SelfStream);
}

void TestCreateRejectsZeroFunds() {
  Fixture f;
  auto    created = f.ledger->CreateStream({"alice", 0}, WithDuration("bob", 0, 10));
  assert(created.code == ErrorCode::ZeroOrMissingFunds);
}

void TestCreateRejectsBadTimeParameters() {
  Fixture f;
  const CallContext alice{"alice", 100};

  CreateStreamParams both = WithDuration("bob", 10, 10);
  both.end_date           = 500;
  assert(f.ledger->CreateStream(alice, both).code == ErrorCode::InvalidTimeParameters);

  CreateStreamParams neither;
  neither.recipient     = "bob";
  neither.funded_amount = 10;
  assert(f.ledger->CreateStream(alice, neither).code == ErrorCode::InvalidTimeParameters);

  assert(f.ledger->CreateStream(alice, WithEndDate("bob", 10, 100)).code == ErrorCode::InvalidTimeParameters);
  assert(f.ledger->CreateStream(alice, WithEndDate("bob", 10, 50)).code == ErrorCode::InvalidTimeParameters);
  assert(f.ledger->CreateStream(alice, WithDuration("bob", 10, 0)).code == ErrorCode::InvalidTimeParameters);

  const auto overflow = WithDuration("bob", 10, std::numeric_limits<uint64_t>::max());
  assert(f.ledger->CreateStream(alice, overflow).code == ErrorCode::InvalidTimeParameters);

  // nothing was stored or deposited
  assert(f.ledger->GetLedgerInfo()->next_stream_id == 1);
  assert(f.custody->inner.Escrow() == 0);
}

void TestCreateValidationOrder() {
  Fixture f;
  CreateStreamParams params;
  params.recipient     = "alice";
  params.funded_amount = 0;
  assert(f.ledger->CreateStream({"alice", 0}, params).code == ErrorCode::SelfStream);

  params.recipient = "bob";
  assert(f.ledger->CreateStream({"alice", 0}, params).code == ErrorCode::ZeroOrMissingFunds);
}

void TestMinimumDuration() {
  Fixture f(LedgerOptions{.min_stream_duration_sec = 300});
  assert(f.ledger->CreateStream({"alice", 0}, WithDuration("bob", 10, 299)).code == ErrorCode::InvalidTimeParameters);
  assert(f.ledger->CreateStream({"alice", 0}, WithDuration("bob", 10, 300)));
}

void TestWithdrawRoundTrip() {
  Fixture f;
  const auto id = MustCreate(*f.ledger, {"alice", 0}, WithEndDate("bob", 1000, 1000));

  auto at_half = f.ledger->GetStreamById(id);
  assert(streamledger::vesting::VestedAmount(*at_half, 500) == 500);

  auto first = f.ledger->RecipientWithdraw({"bob", 500}, id);
  assert(first);
  assert(*first == 500);
  assert(f.ledger->GetStreamById(id)->current_balance == 500);

  auto second = f.ledger->RecipientWithdraw({"bob", 1000}, id);
  assert(second);
  assert(*second == 500);
  assert(f.ledger->GetStreamById(id)->current_balance == 0);

  assert(f.custody->inner.PaidTo("bob") == 1000);
  assert(f.custody->inner.Escrow() == 0);
}

void TestWithdrawSpecifiedAmount() {
  Fixture f;
  const auto id = MustCreate(*f.ledger, {"alice", 0}, WithEndDate("bob", 1000, 1000));

  auto partial = f.ledger->RecipientWithdraw({"bob", 600}, id, 250);
  assert(partial);
  assert(*partial == 250);

  auto rest = f.ledger->RecipientWithdraw({"bob", 600}, id);
  assert(*rest == 350);
  assert(f.ledger->GetStreamById(id)->current_balance == 400);
}

void TestOverWithdrawalDoesNotMutate() {
  Fixture f;
  const auto id     = MustCreate(*f.ledger, {"alice", 0}, WithEndDate("bob", 1000, 1000));
  const auto before = *f.ledger->GetStreamById(id);

  auto too_much = f.ledger->RecipientWithdraw({"bob", 500}, id, 501);
  assert(too_much.code == ErrorCode::InsufficientAvailableBalance);

  auto zero = f.ledger->RecipientWithdraw({"bob", 500}, id, 0);
  assert(zero.code == ErrorCode::InsufficientAvailableBalance);

  assert(*f.ledger->GetStreamById(id) == before);
  assert(f.custody->inner.PaidTo("bob") == 0);
}

void TestUnspecifiedWithdrawWithNothingAvailable() {
  Fixture f;
  const auto id = MustCreate(*f.ledger, {"alice", 100}, WithDuration("bob", 1000, 1000));

  auto none = f.ledger->RecipientWithdraw({"bob", 100}, id);
  assert(none);
  assert(*none == 0);
  assert(f.ledger->GetStreamById(id)->current_balance == 1000);
  assert(f.custody->inner.PaidTo("bob") == 0);
}

void TestWithdrawByNonRecipient() {
  Fixture f;
  const auto id = MustCreate(*f.ledger, {"alice", 0}, WithEndDate("bob", 1000, 1000));

  auto payer = f.ledger->RecipientWithdraw({"alice", 1000}, id);
  assert(payer.code == ErrorCode::Unauthorized);

  auto stranger = f.ledger->RecipientWithdraw({"eve", 1000}, id, 1);
  assert(stranger.code == ErrorCode::Unauthorized);

  assert(f.ledger->GetStreamById(id)->current_balance == 1000);
}

void TestUnknownStream() {
  Fixture f;
  assert(f.ledger->GetStreamById(42).code == ErrorCode::StreamNotFound);
  assert(f.ledger->RecipientWithdraw({"bob", 0}, 42).code == ErrorCode::StreamNotFound);
}

void TestFailedDepositRollsBack() {
  Fixture f;
  f.custody->fail_deposit = true;

  auto created = f.ledger->CreateStream({"alice", 0}, WithDuration("bob", 100, 100));
  assert(created.code == ErrorCode::TransferFailed);
  assert(f.ledger->GetLedgerInfo()->next_stream_id == 1);
  assert(f.ledger->GetStreamById(1).code == ErrorCode::StreamNotFound);

  f.custody->fail_deposit = false;
  assert(MustCreate(*f.ledger, {"alice", 0}, WithDuration("bob", 100, 100)) == 1);
}

void TestFailedPayoutRollsBack() {
  Fixture f;
  const auto id = MustCreate(*f.ledger, {"alice", 0}, WithEndDate("bob", 1000, 1000));

  f.custody->fail_payout = true;
  auto failed            = f.ledger->RecipientWithdraw({"bob", 1000}, id);
  assert(failed.code == ErrorCode::TransferFailed);
  assert(f.ledger->GetStreamById(id)->current_balance == 1000);

  f.custody->fail_payout = false;
  auto retried           = f.ledger->RecipientWithdraw({"bob", 1000}, id);
  assert(*retried == 1000);
}

void TestFailedCommitReversesPayout() {
  auto repository = std::make_shared<MemoryRepository>();
  auto custody    = std::make_shared<RacingCustody>(repository);
  StreamLedger ledger(repository, custody, "admin");

  const auto id = MustCreate(ledger, {"alice", 0}, WithEndDate("bob", 1000, 1000));

  custody->armed = true;
  auto lost      = ledger.RecipientWithdraw({"bob", 1000}, id);
  assert(lost.code == ErrorCode::StorageFailure);
  assert(ledger.GetStreamById(id)->current_balance == 1000);
  assert(custody->inner.PaidTo("bob") == 0);
  assert(custody->inner.Escrow() == 1000);

  custody->armed = false;
  assert(*ledger.RecipientWithdraw({"bob", 1000}, id) == 1000);
  assert(*ledger.RecipientWithdraw({"bob", 1000}, id) == 0);

  // a 1000 stream pays out 1000, never more
  assert(custody->inner.PaidTo("bob") == 1000);
  assert(custody->inner.Escrow() == 0);
  assert(ledger.GetStreamById(id)->current_balance == 0);
}

void TestFailedCommitReversesDeposit() {
  auto repository = std::make_shared<MemoryRepository>();
  auto custody    = std::make_shared<RacingCustody>(repository);
  StreamLedger ledger(repository, custody, "admin");

  custody->armed = true;
  auto lost      = ledger.CreateStream({"alice", 0}, WithDuration("bob", 500, 100));
  assert(lost.code == ErrorCode::StorageFailure);
  assert(ledger.GetLedgerInfo()->next_stream_id == 1);
  assert(ledger.GetStreamById(1).code == ErrorCode::StreamNotFound);
  assert(custody->inner.DepositedBy("alice") == 0);
  assert(custody->inner.Escrow() == 0);

  custody->armed = false;
  assert(MustCreate(ledger, {"alice", 0}, WithDuration("bob", 500, 100)) == 1);
  assert(custody->inner.Escrow() == 500);
}

void TestOutstandingBalanceTracksStreams() {
  Fixture f;
  assert(streamledger::ledger::OutstandingBalance(*f.repository) == 0);

  const auto first = MustCreate(*f.ledger, {"alice", 0}, WithEndDate("bob", 1000, 1000));
  MustCreate(*f.ledger, {"alice", 0}, WithEndDate("carol", 300, 1000));
  assert(*f.ledger->RecipientWithdraw({"bob", 250}, first) == 250);

  assert(streamledger::ledger::OutstandingBalance(*f.repository) == 1050);
  assert(streamledger::ledger::OutstandingBalance(*f.repository) == f.custody->inner.Escrow());
}

void TestDrainedStreamStaysReadable() {
  Fixture f;
  const auto id = MustCreate(*f.ledger, {"alice", 0}, WithEndDate("bob", 10, 10));
  assert(*f.ledger->RecipientWithdraw({"bob", 10}, id) == 10);

  auto drained = f.ledger->GetStreamById(id);
  assert(drained);
  assert(streamledger::model::StateOf(*drained) == streamledger::model::StreamState::kDrained);
  assert(*f.ledger->RecipientWithdraw({"bob", 20}, id) == 0);
  assert(f.ledger->RecipientWithdraw({"bob", 20}, id, 1).code == ErrorCode::InsufficientAvailableBalance);
}

void TestConcurrentWithdrawalsNeverOverdraw() {
  Fixture f;
  const auto id = MustCreate(*f.ledger, {"alice", 0}, WithEndDate("bob", 10000, 1000));

  std::atomic<uint64_t>    total{0};
  std::vector<std::thread> workers;
  for (int i = 0; i < 8; ++i) {
    workers.emplace_back([&] {
      for (int j = 0; j < 200; ++j) {
        auto out = f.ledger->RecipientWithdraw({"bob", 600}, id, 7);
        if (out) total += *out;
      }
    });
  }
  for (auto& w : workers) w.join();

  // 6000 vested at t=600, 7 per call
  assert(total.load() <= 6000);
  assert(total.load() == 6000 / 7 * 7);
  assert(f.ledger->GetStreamById(id)->current_balance == 10000 - total.load());
}

void TestRandomOperationsKeepInvariants() {
  Fixture    f;
  std::mt19937_64 rng(7);

  const std::vector<std::string> accounts = {"alice", "bob", "carol"};
  uint64_t                       now      = 0;
  uint64_t                       created  = 0;

  for (int step = 0; step < 500; ++step) {
    now += rng() % 50;
    const auto& caller = accounts[rng() % accounts.size()];

    if (rng() % 3 == 0 || created == 0) {
      const auto& recipient = accounts[rng() % accounts.size()];
      auto        out       = f.ledger->CreateStream({caller, now}, WithDuration(recipient, 1 + rng() % 5000, rng() % 400));
      if (out) {
        ++created;
        assert(*out == created);
      }
      continue;
    }

    const uint64_t id = 1 + rng() % created;
    if (rng() % 2 == 0) {
      (void)f.ledger->RecipientWithdraw({caller, now}, id);
    } else {
      (void)f.ledger->RecipientWithdraw({caller, now}, id, rng() % 300);
    }

    for (uint64_t sid = 1; sid <= created; ++sid) {
      auto s = f.ledger->GetStreamById(sid);
      assert(s);
      assert(s->current_balance <= s->original_balance);
      assert(s->original_balance - s->current_balance <= streamledger::vesting::VestedAmount(*s, now));
    }
  }

  assert(f.ledger->GetLedgerInfo()->next_stream_id == created + 1);
}

} // namespace

int main() {
  TestLedgerInitialisesOwnerOnce();
  TestCreateAssignsSequentialIds();
  TestCreateRejectsSelfStream();
  TestCreateRejectsZeroFunds();
  TestCreateRejectsBadTimeParameters();
  TestCreateValidationOrder();
  TestMinimumDuration();
  TestWithdrawRoundTrip();
  TestWithdrawSpecifiedAmount();
  TestOverWithdrawalDoesNotMutate();
  TestUnspecifiedWithdrawWithNothingAvailable();
  TestWithdrawByNonRecipient();
  TestUnknownStream();
  TestFailedDepositRollsBack();
  TestFailedPayoutRollsBack();
  TestFailedCommitReversesPayout();
  TestFailedCommitReversesDeposit();
  TestOutstandingBalanceTracksStreams();
  TestDrainedStreamStaysReadable();
  TestConcurrentWithdrawalsNeverOverdraw();
  TestRandomOperationsKeepInvariants();

  std::cout << "streamledger_unit_stream_ledger: pass\n";
  return 0;
}
