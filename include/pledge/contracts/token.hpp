#pragma once
#include <pledge/runtime/context.hpp>
#include <pledge/schema/contract_error_code.hpp>
#include <pledge/schema/initialize_token.hpp>
#include <pledge/schema/mint_token.hpp>
#include <pledge/schema/token_config.hpp>
#include <pledge/schema/transfer_token.hpp>
#include <optional>

namespace pledge::contracts {

/// Minimal fungible token the escrow settles in.
class token final {
 public:
  explicit token(pledge::runtime::context& context);

  pledge::schema::contract_error_code initialize(
      const pledge::schema::initialize_token_t& op);
  pledge::schema::contract_error_code mint(
      const pledge::schema::mint_token_t& op);
  pledge::schema::contract_error_code transfer(
      const pledge::schema::transfer_token_t& op);

  pledge::schema::amount_t balance(
      const pledge::schema::address_t& address) const;
  std::optional<pledge::schema::token_config_t> config() const;

 private:
  pledge::runtime::context& context_;
};

}  // namespace pledge::contracts
