#include <pledge/contracts/attestation.hpp>
#include <pledge/crypto/verify.hpp>
#include <pledge/orchestration/contract_client.hpp>
#include <pledge/orchestration/engine_gateway.hpp>
#include <pledge/orchestration/milestone_payout.hpp>
#include <pledge/runtime/contract_ids.hpp>
#include <pledge/testing/ed25519_key.hpp>
#include <pledge/testing/engine_fixture.hpp>
#include <pledge/testing/flaky_gateway.hpp>
#include <gtest/gtest.h>

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

using namespace pledge::schema;

namespace {

/// One project with a funded escrow and a single registered milestone.
class milestone_payout_test : public ::testing::Test {
 protected:
  explicit milestone_payout_test(const bool strict = false)
      : fixture_{strict ? "pledge_payout_strict" : "pledge_payout",
                 strict},
        inner_{fixture_.engine()},
        gateway_{inner_} {}

  void SetUp() override {
    if (!pledge::crypto::available()) {
      GTEST_SKIP()
          << "OpenSSL backend does not expose required crypto providers";
    }
    admin_key_ = pledge::testing::ed25519_key::generate();
    backer_key_ = pledge::testing::ed25519_key::generate();
    attester_ = pledge::testing::ed25519_key::generate();
    ASSERT_TRUE(admin_key_ && backer_key_ && attester_);
    admin_.emplace(make_client(*admin_key_));
    backer_.emplace(make_client(*backer_key_));

    auto admin = admin_key_->address();
    ASSERT_EQ(admin_->initialize_token(admin, 7, "Pledge", "PLG").code, 0u);
    ASSERT_EQ(admin_->mint(backer_key_->address(), 1'000).code, 0u);
    ASSERT_EQ(admin_
                  ->initialize_escrow(
                      address_t{pledge::runtime::token_contract_id()},
                      attester_->public_key())
                  .code,
              0u);
    ASSERT_EQ(admin_->initialize_milestones(admin, attester_->public_key())
                  .code,
              0u);
    ASSERT_EQ(backer_->deposit(project_, 500, "launch").code, 0u);
    ASSERT_EQ(admin_->register_milestone(project_, milestone_, 300, false,
                                         recipient_)
                  .code,
              0u);
  }

  pledge::orchestration::contract_client make_client(
      const pledge::testing::ed25519_key& key) {
    return pledge::orchestration::contract_client{
        gateway_, fixture_.network_id(), key.address(),
        [key](const bytes_view_t& message) {
          return signature_t{key.sign(message)};
        }};
  }

  /// Same nonce for the same subject, a fresh nonce for every new subject.
  pledge::orchestration::attestation_provider_t attestations() {
    return [this](const attestation_subject_t& subject) {
      auto key = to_hex(pledge::contracts::make_attestation_payload(
          fixture_.network_id(), subject, 0));
      auto nonce = nonces_.try_emplace(key, nonces_.size() + 1).first->second;
      return attester_->attest(fixture_.network_id(), subject, nonce);
    };
  }

  /// One nonce per action, shared by every milestone.
  pledge::orchestration::attestation_provider_t attestations_per_action() {
    return [this](const attestation_subject_t& subject) {
      auto nonce = uint64_t{1} + static_cast<uint64_t>(subject.action);
      return attester_->attest(fixture_.network_id(), subject, nonce);
    };
  }

  pledge::orchestration::milestone_payout make_saga(
      const uint32_t max_attempts = 3) {
    return pledge::orchestration::milestone_payout{
        *admin_, attestations(),
        pledge::orchestration::payout_options{.max_attempts = max_attempts}};
  }

  pledge::orchestration::milestone_payout make_saga(
      pledge::orchestration::attestation_provider_t provider) {
    return pledge::orchestration::milestone_payout{*admin_,
                                                   std::move(provider)};
  }

  /// Client that talks to the ledger without going through `gateway_`.
  pledge::orchestration::contract_client make_direct_client(
      const pledge::testing::ed25519_key& key) {
    return pledge::orchestration::contract_client{
        inner_, fixture_.network_id(), key.address(),
        [key](const bytes_view_t& message) {
          return signature_t{key.sign(message)};
        }};
  }

  amount_t recipient_balance() { return admin_->token_balance(recipient_); }

  pledge::testing::engine_fixture fixture_;
  pledge::orchestration::engine_gateway inner_;
  pledge::testing::flaky_gateway gateway_;
  std::optional<pledge::testing::ed25519_key> admin_key_;
  std::optional<pledge::testing::ed25519_key> backer_key_;
  std::optional<pledge::testing::ed25519_key> attester_;
  std::optional<pledge::orchestration::contract_client> admin_;
  std::optional<pledge::orchestration::contract_client> backer_;
  std::map<std::string, uint64_t> nonces_;
  address_t recipient_{pledge::testing::make_account(0x33)};
  project_id_t project_{pledge::testing::make_hash(0x60)};
  milestone_id_t milestone_{pledge::testing::make_hash(0x61)};
};

class strict_milestone_payout_test : public milestone_payout_test {
 protected:
  strict_milestone_payout_test() : milestone_payout_test{true} {}
};

}  // namespace

TEST_F(milestone_payout_test, pays_out_released_milestone) {
  auto report = make_saga().run(milestone_);
  EXPECT_TRUE(report.completed);
  EXPECT_EQ(report.step, pledge::orchestration::payout_step::completed);
  EXPECT_FALSE(report.milestone_already_released);
  EXPECT_FALSE(report.funds_reconciled);

  EXPECT_EQ(recipient_balance(), 300);
  EXPECT_EQ(admin_->get_balance(project_), 200);
  auto milestone = admin_->get_milestone(milestone_);
  ASSERT_TRUE(milestone.has_value());
  EXPECT_TRUE(milestone->released);
}

TEST_F(milestone_payout_test, unknown_milestone_stops_before_any_submission) {
  auto applied = gateway_.applied();
  auto report = make_saga().run(pledge::testing::make_hash(0x99));
  EXPECT_FALSE(report.completed);
  EXPECT_EQ(report.step, pledge::orchestration::payout_step::read_milestone);
  EXPECT_EQ(report.code,
            static_cast<uint32_t>(contract_error_code::not_found));
  EXPECT_EQ(gateway_.applied(), applied);
}

TEST_F(milestone_payout_test, lost_responses_still_pay_exactly_once) {
  // Both the milestone release and the funds release land, but the
  // coordinator never hears back.
  gateway_.drop_responses(1);
  auto first = make_saga().run(milestone_);
  EXPECT_TRUE(first.completed);
  EXPECT_TRUE(first.milestone_already_released);

  EXPECT_EQ(recipient_balance(), 300);
  EXPECT_EQ(admin_->get_balance(project_), 200);
}

TEST_F(milestone_payout_test, lost_funds_response_is_reconciled_by_payment) {
  auto saga = make_saga();
  ASSERT_EQ(admin_
                ->release_milestone(milestone_,
                                    pledge::testing::make_unsigned_attestation())
                .code,
            0u);
  gateway_.drop_responses(1);
  auto report = saga.run(milestone_);
  EXPECT_TRUE(report.completed);
  EXPECT_TRUE(report.milestone_already_released);
  EXPECT_TRUE(report.funds_reconciled);
  EXPECT_EQ(recipient_balance(), 300);
  EXPECT_EQ(admin_->get_balance(project_), 200);

  auto payment = admin_->get_milestone_payment(milestone_);
  ASSERT_TRUE(payment.has_value());
  EXPECT_EQ(payment->project_id, project_);
  EXPECT_EQ(payment->recipient, recipient_);
  EXPECT_EQ(payment->amount, 300);
}

TEST_F(milestone_payout_test, claim_during_lost_submission_is_not_masked) {
  ASSERT_EQ(admin_
                ->release_milestone(milestone_,
                                    pledge::testing::make_unsigned_attestation())
                .code,
            0u);
  auto other = make_direct_client(*backer_key_);
  auto claimed = std::optional<invocation_result_t>{};
  gateway_.refuse_submissions(1);
  gateway_.after_next_failure([&] {
    claimed = other.claim(project_, 300,
                          pledge::testing::make_unsigned_attestation());
  });

  auto report = make_saga().run(milestone_);
  ASSERT_TRUE(claimed.has_value());
  ASSERT_EQ(claimed->code, 0u);
  EXPECT_FALSE(report.completed);
  EXPECT_EQ(report.step, pledge::orchestration::payout_step::release_funds);
  EXPECT_EQ(report.code,
            static_cast<uint32_t>(contract_error_code::insufficient_balance));
  EXPECT_EQ(recipient_balance(), 0);
  EXPECT_FALSE(admin_->get_milestone_payment(milestone_).has_value());
}

TEST_F(milestone_payout_test, deposit_during_lost_response_pays_once) {
  ASSERT_EQ(admin_
                ->release_milestone(milestone_,
                                    pledge::testing::make_unsigned_attestation())
                .code,
            0u);
  auto other = make_direct_client(*backer_key_);
  auto deposited = std::optional<invocation_result_t>{};
  gateway_.drop_responses(1);
  gateway_.after_next_failure(
      [&] { deposited = other.deposit(project_, 300, "late backer"); });

  auto report = make_saga().run(milestone_);
  ASSERT_TRUE(deposited.has_value());
  ASSERT_EQ(deposited->code, 0u);
  EXPECT_TRUE(report.completed);
  EXPECT_TRUE(report.funds_reconciled);
  EXPECT_EQ(recipient_balance(), 300);
  EXPECT_EQ(admin_->get_balance(project_), 500);
}

TEST_F(milestone_payout_test, refused_submissions_are_retried) {
  gateway_.refuse_submissions(2);
  auto report = make_saga().run(milestone_);
  EXPECT_TRUE(report.completed);
  EXPECT_EQ(recipient_balance(), 300);
}

TEST_F(milestone_payout_test, gives_up_after_max_attempts) {
  gateway_.refuse_submissions(3);
  auto report = make_saga(3).run(milestone_);
  EXPECT_FALSE(report.completed);
  EXPECT_EQ(report.step,
            pledge::orchestration::payout_step::release_milestone);
  EXPECT_EQ(report.codespace, "pledge.gateway");
  EXPECT_EQ(recipient_balance(), 0);

  // A later run picks up where the first stopped.
  auto resumed = make_saga().run(milestone_);
  EXPECT_TRUE(resumed.completed);
  EXPECT_EQ(recipient_balance(), 300);
}

TEST_F(milestone_payout_test, underfunded_escrow_stops_at_funds_step) {
  ASSERT_EQ(admin_->register_milestone(project_, pledge::testing::make_hash(1),
                                       900, false, recipient_)
                .code,
            0u);
  auto report = make_saga().run(pledge::testing::make_hash(1));
  EXPECT_FALSE(report.completed);
  EXPECT_EQ(report.step, pledge::orchestration::payout_step::release_funds);
  EXPECT_EQ(report.code,
            static_cast<uint32_t>(contract_error_code::insufficient_balance));
  EXPECT_EQ(report.codespace, "pledge.escrow");

  auto milestone = admin_->get_milestone(pledge::testing::make_hash(1));
  ASSERT_TRUE(milestone.has_value());
  EXPECT_TRUE(milestone->released);
  EXPECT_EQ(recipient_balance(), 0);
}

TEST_F(strict_milestone_payout_test, rerun_after_completion_pays_nothing) {
  auto first = make_saga().run(milestone_);
  ASSERT_TRUE(first.completed);
  ASSERT_EQ(recipient_balance(), 300);

  // Enough funds for a second payout; the escrow payment record stops it.
  ASSERT_EQ(backer_->deposit(project_, 400, "top up").code, 0u);
  auto second = make_saga().run(milestone_);
  EXPECT_TRUE(second.completed);
  EXPECT_TRUE(second.milestone_already_released);
  EXPECT_TRUE(second.funds_reconciled);
  EXPECT_EQ(recipient_balance(), 300);
  EXPECT_EQ(admin_->get_balance(project_), 600);
}

TEST_F(strict_milestone_payout_test, lost_response_with_signed_attestations) {
  gateway_.drop_responses(1);
  auto report = make_saga().run(milestone_);
  EXPECT_TRUE(report.completed);
  EXPECT_TRUE(report.milestone_already_released);
  EXPECT_EQ(recipient_balance(), 300);
}

TEST_F(strict_milestone_payout_test, pays_two_milestones_for_same_recipient) {
  const auto second_id = pledge::testing::make_hash(0x62);
  ASSERT_EQ(backer_->deposit(project_, 100, "second milestone").code, 0u);
  ASSERT_EQ(admin_->register_milestone(project_, second_id, 300, false,
                                       recipient_)
                .code,
            0u);

  auto first = make_saga().run(milestone_);
  ASSERT_TRUE(first.completed);
  EXPECT_EQ(recipient_balance(), 300);

  auto second = make_saga().run(second_id);
  EXPECT_TRUE(second.completed);
  EXPECT_FALSE(second.milestone_already_released);
  EXPECT_FALSE(second.funds_reconciled);
  EXPECT_EQ(recipient_balance(), 600);
  EXPECT_EQ(admin_->get_balance(project_), 0);

  for (const auto& id : {milestone_, second_id}) {
    auto milestone = admin_->get_milestone(id);
    ASSERT_TRUE(milestone.has_value());
    EXPECT_TRUE(milestone->released);
    auto payment = admin_->get_milestone_payment(id);
    ASSERT_TRUE(payment.has_value());
    EXPECT_EQ(payment->milestone_id, id);
    EXPECT_EQ(payment->amount, 300);
  }
}

TEST_F(strict_milestone_payout_test, reused_nonce_is_not_counted_as_released) {
  const auto second_id = pledge::testing::make_hash(0x62);
  ASSERT_EQ(backer_->deposit(project_, 100, "second milestone").code, 0u);
  ASSERT_EQ(admin_->register_milestone(project_, second_id, 300, false,
                                       recipient_)
                .code,
            0u);

  ASSERT_TRUE(make_saga(attestations_per_action()).run(milestone_).completed);
  ASSERT_EQ(recipient_balance(), 300);

  auto report = make_saga(attestations_per_action()).run(second_id);
  EXPECT_FALSE(report.completed);
  EXPECT_EQ(report.step,
            pledge::orchestration::payout_step::release_milestone);
  EXPECT_EQ(report.code,
            static_cast<uint32_t>(contract_error_code::attestation_replayed));
  auto milestone = admin_->get_milestone(second_id);
  ASSERT_TRUE(milestone.has_value());
  EXPECT_FALSE(milestone->released);
  EXPECT_FALSE(admin_->get_milestone_payment(second_id).has_value());
  EXPECT_EQ(recipient_balance(), 300);
}
