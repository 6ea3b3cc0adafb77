#pragma once

#include <pledge/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

// Schema type: contract error code.
// Failure reasons returned by contract entry points. Values are stable on the
// wire (they become the invocation result code).
namespace pledge::schema {

enum class contract_error_code : uint32_t {
  ok = 0,
  already_initialized = 100,
  not_initialized = 101,
  invalid_amount = 102,
  not_found = 103,
  already_exists = 104,
  already_registered = 105,
  already_released = 106,
  insufficient_balance = 107,
  invalid_attestation = 108,
  attestation_replayed = 109,
  unauthorized = 110,
  token_transfer_failed = 111,
  amount_overflow = 112,
};

inline constexpr auto kContractErrorCodeMappings = std::array{
    std::pair<std::string_view, contract_error_code>{"ok",
                                                     contract_error_code::ok},
    std::pair<std::string_view, contract_error_code>{
        "already_initialized", contract_error_code::already_initialized},
    std::pair<std::string_view, contract_error_code>{
        "not_initialized", contract_error_code::not_initialized},
    std::pair<std::string_view, contract_error_code>{
        "invalid_amount", contract_error_code::invalid_amount},
    std::pair<std::string_view, contract_error_code>{
        "not_found", contract_error_code::not_found},
    std::pair<std::string_view, contract_error_code>{
        "already_exists", contract_error_code::already_exists},
    std::pair<std::string_view, contract_error_code>{
        "already_registered", contract_error_code::already_registered},
    std::pair<std::string_view, contract_error_code>{
        "already_released", contract_error_code::already_released},
    std::pair<std::string_view, contract_error_code>{
        "insufficient_balance", contract_error_code::insufficient_balance},
    std::pair<std::string_view, contract_error_code>{
        "invalid_attestation", contract_error_code::invalid_attestation},
    std::pair<std::string_view, contract_error_code>{
        "attestation_replayed", contract_error_code::attestation_replayed},
    std::pair<std::string_view, contract_error_code>{
        "unauthorized", contract_error_code::unauthorized},
    std::pair<std::string_view, contract_error_code>{
        "token_transfer_failed", contract_error_code::token_transfer_failed},
    std::pair<std::string_view, contract_error_code>{
        "amount_overflow", contract_error_code::amount_overflow}};

template <>
inline std::optional<contract_error_code> try_from_string<contract_error_code>(
    const std::string_view value) {
  return from_string(value, kContractErrorCodeMappings);
}

inline constexpr std::string_view to_string(const contract_error_code value) {
  return to_string(value, kContractErrorCodeMappings).value_or("unknown");
}

}  // namespace pledge::schema
