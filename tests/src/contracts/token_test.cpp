#include <pledge/contracts/token.hpp>
#include <pledge/runtime/contract_ids.hpp>
#include <pledge/testing/contract_fixture.hpp>
#include <gtest/gtest.h>

#include <limits>

using pledge::schema::contract_error_code;

namespace {

class token_test : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_EQ(call({admin_},
                   [&](pledge::contracts::token& token) {
                     return token.initialize(pledge::schema::initialize_token_t{
                         .admin = admin_, .name = "Pledge", .symbol = "PLG"});
                   }),
              contract_error_code::ok);
  }

  template <typename Fn>
  contract_error_code call(std::vector<pledge::schema::address_t> authorized,
                           Fn&& fn) {
    return fixture_.frame(pledge::runtime::token_contract_id(),
                          std::move(authorized),
                          [&](pledge::runtime::context& ctx) {
                            auto token = pledge::contracts::token{ctx};
                            return fn(token);
                          });
  }

  pledge::schema::amount_t balance(const pledge::schema::address_t& who) {
    return fixture_.view(pledge::runtime::token_contract_id(),
                         [&](pledge::runtime::context& ctx) {
                           return pledge::contracts::token{ctx}.balance(who);
                         });
  }

  contract_error_code mint(const pledge::schema::address_t& to,
                           const pledge::schema::amount_t amount) {
    return call({admin_}, [&](pledge::contracts::token& token) {
      return token.mint(pledge::schema::mint_token_t{.to = to, .amount = amount});
    });
  }

  pledge::testing::contract_fixture fixture_;
  pledge::schema::address_t admin_{pledge::testing::make_account(1)};
  pledge::schema::address_t alice_{pledge::testing::make_account(2)};
  pledge::schema::address_t bob_{pledge::testing::make_account(3)};
};

}  // namespace

TEST_F(token_test, initialize_runs_once) {
  auto code = call({admin_}, [&](pledge::contracts::token& token) {
    return token.initialize(
        pledge::schema::initialize_token_t{.admin = alice_});
  });
  EXPECT_EQ(code, contract_error_code::already_initialized);

  auto config = fixture_.view(pledge::runtime::token_contract_id(),
                              [](pledge::runtime::context& ctx) {
                                return pledge::contracts::token{ctx}.config();
                              });
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->admin, admin_);
  EXPECT_EQ(config->decimals, 7u);
  EXPECT_EQ(config->symbol, "PLG");
}

TEST_F(token_test, mint_requires_admin_authorization) {
  auto code = call({alice_}, [&](pledge::contracts::token& token) {
    return token.mint(pledge::schema::mint_token_t{.to = alice_, .amount = 10});
  });
  EXPECT_EQ(code, contract_error_code::unauthorized);
  EXPECT_EQ(balance(alice_), 0);

  EXPECT_EQ(mint(alice_, 10), contract_error_code::ok);
  EXPECT_EQ(balance(alice_), 10);
}

TEST_F(token_test, mint_rejects_non_positive_and_overflowing_amounts) {
  EXPECT_EQ(mint(alice_, 0), contract_error_code::invalid_amount);
  EXPECT_EQ(mint(alice_, -5), contract_error_code::invalid_amount);
  EXPECT_EQ(mint(alice_, std::numeric_limits<pledge::schema::amount_t>::max()),
            contract_error_code::ok);
  EXPECT_EQ(mint(alice_, 1), contract_error_code::amount_overflow);
}

TEST_F(token_test, transfer_moves_balance_between_accounts) {
  ASSERT_EQ(mint(alice_, 100), contract_error_code::ok);
  auto code = call({alice_}, [&](pledge::contracts::token& token) {
    return token.transfer(pledge::schema::transfer_token_t{
        .from = alice_, .to = bob_, .amount = 40});
  });
  EXPECT_EQ(code, contract_error_code::ok);
  EXPECT_EQ(balance(alice_), 60);
  EXPECT_EQ(balance(bob_), 40);
  ASSERT_EQ(fixture_.last_events().size(), 1u);
  EXPECT_EQ(fixture_.last_events().front().type, "transfer");
}

TEST_F(token_test, transfer_requires_sender_authorization_and_funds) {
  ASSERT_EQ(mint(alice_, 100), contract_error_code::ok);
  auto unauthorized = call({bob_}, [&](pledge::contracts::token& token) {
    return token.transfer(pledge::schema::transfer_token_t{
        .from = alice_, .to = bob_, .amount = 1});
  });
  EXPECT_EQ(unauthorized, contract_error_code::unauthorized);

  auto insufficient = call({alice_}, [&](pledge::contracts::token& token) {
    return token.transfer(pledge::schema::transfer_token_t{
        .from = alice_, .to = bob_, .amount = 101});
  });
  EXPECT_EQ(insufficient, contract_error_code::insufficient_balance);
  EXPECT_EQ(balance(alice_), 100);
  EXPECT_EQ(balance(bob_), 0);
}

TEST_F(token_test, self_transfer_keeps_balance) {
  ASSERT_EQ(mint(alice_, 50), contract_error_code::ok);
  auto code = call({alice_}, [&](pledge::contracts::token& token) {
    return token.transfer(pledge::schema::transfer_token_t{
        .from = alice_, .to = alice_, .amount = 50});
  });
  EXPECT_EQ(code, contract_error_code::ok);
  EXPECT_EQ(balance(alice_), 50);
}
