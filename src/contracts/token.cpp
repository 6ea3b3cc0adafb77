#include <pledge/common/checked.hpp>
#include <pledge/contracts/token.hpp>
#include <spdlog/spdlog.h>

#include <string>

using namespace pledge::schema;

namespace pledge::contracts {

namespace {

constexpr auto kConfigKey = std::string_view{"CONFIG"};
constexpr auto kBalanceKind = std::string_view{"BALANCE"};

}  // namespace

token::token(pledge::runtime::context& context) : context_(context) {}

contract_error_code token::initialize(const initialize_token_t& op) {
  if (config()) {
    return contract_error_code::already_initialized;
  }
  context_.put_instance(kConfigKey, token_config_t{.admin = op.admin,
                                                   .decimals = op.decimals,
                                                   .name = op.name,
                                                   .symbol = op.symbol});
  spdlog::info("Token '{}' initialized with admin {}", op.symbol,
               to_string(op.admin));
  return contract_error_code::ok;
}

contract_error_code token::mint(const mint_token_t& op) {
  auto current = config();
  if (!current) {
    return contract_error_code::not_initialized;
  }
  if (!context_.is_authorized(current->admin)) {
    return contract_error_code::unauthorized;
  }
  if (op.amount <= 0) {
    return contract_error_code::invalid_amount;
  }
  auto updated = pledge::common::checked_add(balance(op.to), op.amount);
  if (!updated) {
    return contract_error_code::amount_overflow;
  }
  context_.put_persistent(kBalanceKind, op.to, *updated);
  context_.emit("mint", {make_attribute("to", to_string(op.to), true),
                         make_attribute("amount", std::to_string(op.amount))});
  return contract_error_code::ok;
}

contract_error_code token::transfer(const transfer_token_t& op) {
  if (op.amount <= 0) {
    return contract_error_code::invalid_amount;
  }
  if (!context_.is_authorized(op.from)) {
    return contract_error_code::unauthorized;
  }
  auto from_balance = balance(op.from);
  if (from_balance < op.amount) {
    return contract_error_code::insufficient_balance;
  }
  if (op.from != op.to) {
    auto to_balance = pledge::common::checked_add(balance(op.to), op.amount);
    if (!to_balance) {
      return contract_error_code::amount_overflow;
    }
    context_.put_persistent(kBalanceKind, op.from, from_balance - op.amount);
    context_.put_persistent(kBalanceKind, op.to, *to_balance);
  }
  context_.emit("transfer",
                {make_attribute("from", to_string(op.from), true),
                 make_attribute("to", to_string(op.to), true),
                 make_attribute("amount", std::to_string(op.amount))});
  return contract_error_code::ok;
}

amount_t token::balance(const address_t& address) const {
  return context_.get_persistent<amount_t>(kBalanceKind, address).value_or(0);
}

std::optional<token_config_t> token::config() const {
  return context_.get_instance<token_config_t>(kConfigKey);
}

}  // namespace pledge::contracts
