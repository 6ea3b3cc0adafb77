#include <pledge/orchestration/contract_client.hpp>
#include <pledge/orchestration/engine_gateway.hpp>
#include <pledge/runtime/contract_ids.hpp>
#include <pledge/schema/host_error_code.hpp>
#include <pledge/testing/engine_fixture.hpp>
#include <pledge/testing/flaky_gateway.hpp>
#include <gtest/gtest.h>

using namespace pledge::schema;

namespace {

pledge::orchestration::contract_client::sign_fn_t placeholder_signer() {
  return [](const bytes_view_t&) {
    return signature_t{ed25519_signature_t{}};
  };
}

}  // namespace

TEST(contract_client, tracks_nonce_across_submissions) {
  auto fixture = pledge::testing::engine_fixture{"pledge_client_nonce"};
  auto gateway = pledge::orchestration::engine_gateway{fixture.engine()};
  auto client = pledge::orchestration::contract_client{
      gateway, fixture.network_id(), pledge::testing::make_account(1),
      placeholder_signer()};

  EXPECT_EQ(client.register_project(pledge::testing::make_hash(1), "a").code,
            0u);
  EXPECT_EQ(client.register_project(pledge::testing::make_hash(2), "b").code,
            0u);
  EXPECT_EQ(client.last_nonce(), 2u);
  EXPECT_EQ(client.get_project_count(), 2u);
}

TEST(contract_client, refreshes_stale_nonce_and_retries_once) {
  auto fixture = pledge::testing::engine_fixture{"pledge_client_stale"};
  auto gateway = pledge::orchestration::engine_gateway{fixture.engine()};
  auto source = pledge::testing::make_account(1);
  auto first = pledge::orchestration::contract_client{
      gateway, fixture.network_id(), source, placeholder_signer()};
  auto second = pledge::orchestration::contract_client{
      gateway, fixture.network_id(), source, placeholder_signer()};

  ASSERT_EQ(first.register_project(pledge::testing::make_hash(1), "a").code,
            0u);
  ASSERT_EQ(second.register_project(pledge::testing::make_hash(2), "b").code,
            0u);
  auto result = first.register_project(pledge::testing::make_hash(3), "c");
  EXPECT_EQ(result.code, 0u);
  EXPECT_EQ(first.last_nonce(), 3u);
}

TEST(contract_client, contract_failure_keeps_nonce) {
  auto fixture = pledge::testing::engine_fixture{"pledge_client_failure"};
  auto gateway = pledge::orchestration::engine_gateway{fixture.engine()};
  auto client = pledge::orchestration::contract_client{
      gateway, fixture.network_id(), pledge::testing::make_account(1),
      placeholder_signer()};

  ASSERT_EQ(client.register_project(pledge::testing::make_hash(1), "a").code,
            0u);
  auto duplicate = client.register_project(pledge::testing::make_hash(1), "a");
  EXPECT_EQ(duplicate.code,
            static_cast<uint32_t>(contract_error_code::already_registered));
  EXPECT_FALSE(pledge::orchestration::is_host_error(
      duplicate, static_cast<uint32_t>(host_error_code::invalid_nonce)));
  EXPECT_EQ(client.register_project(pledge::testing::make_hash(2), "b").code,
            0u);
}

TEST(contract_client, unavailable_gateway_resets_nonce_cache) {
  auto fixture = pledge::testing::engine_fixture{"pledge_client_flaky"};
  auto engine_gateway = pledge::orchestration::engine_gateway{fixture.engine()};
  auto gateway = pledge::testing::flaky_gateway{engine_gateway};
  auto client = pledge::orchestration::contract_client{
      gateway, fixture.network_id(), pledge::testing::make_account(1),
      placeholder_signer()};

  gateway.drop_responses(1);
  EXPECT_THROW(client.register_project(pledge::testing::make_hash(1), "a"),
               pledge::orchestration::gateway_unavailable);
  EXPECT_EQ(gateway.applied(), 1u);

  EXPECT_EQ(client.register_project(pledge::testing::make_hash(2), "b").code,
            0u);
  EXPECT_EQ(client.get_project_count(), 2u);
}

TEST(contract_client, typed_reads_decode_query_values) {
  auto fixture = pledge::testing::engine_fixture{"pledge_client_reads"};
  auto gateway = pledge::orchestration::engine_gateway{fixture.engine()};
  auto admin = pledge::testing::make_account(1);
  auto client = pledge::orchestration::contract_client{
      gateway, fixture.network_id(), admin, placeholder_signer()};

  EXPECT_FALSE(client.get_escrow_config().has_value());
  ASSERT_EQ(client.initialize_token(admin, 7, "Pledge", "PLG").code, 0u);
  ASSERT_EQ(client.mint(admin, 25).code, 0u);
  ASSERT_EQ(client
                .initialize_escrow(
                    address_t{pledge::runtime::token_contract_id()},
                    pledge::testing::make_ed25519_signer(4))
                .code,
            0u);

  EXPECT_EQ(client.token_balance(admin), 25);
  auto config = client.get_escrow_config();
  ASSERT_TRUE(config.has_value());
  EXPECT_EQ(config->attestation_pubkey, pledge::testing::make_ed25519_signer(4));
  EXPECT_FALSE(client.get_milestone(pledge::testing::make_hash(9)).has_value());
  EXPECT_EQ(client.get_balance(pledge::testing::make_hash(9)), 0);
}
