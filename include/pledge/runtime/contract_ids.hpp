#pragma once
#include <pledge/schema/primitives.hpp>
#include <string_view>

// Deployed contract identities. Each id is the blake3 hash of
// "pledge.contract.<name>" and doubles as the contract's address.
namespace pledge::runtime {

inline constexpr auto kRegistryContractName = std::string_view{"registry"};
inline constexpr auto kEscrowContractName = std::string_view{"escrow"};
inline constexpr auto kMilestonesContractName = std::string_view{"milestones"};
inline constexpr auto kTokenContractName = std::string_view{"token"};

pledge::schema::named_signer_t make_contract_id(std::string_view name);

const pledge::schema::named_signer_t& registry_contract_id();
const pledge::schema::named_signer_t& escrow_contract_id();
const pledge::schema::named_signer_t& milestones_contract_id();
const pledge::schema::named_signer_t& token_contract_id();

/// Name of a deployed contract, or "unknown".
std::string_view contract_name(const pledge::schema::named_signer_t& id);

}  // namespace pledge::runtime
