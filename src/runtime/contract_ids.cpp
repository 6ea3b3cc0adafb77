#include <pledge/blake3/hash.hpp>
#include <pledge/runtime/contract_ids.hpp>

#include <string>

namespace pledge::runtime {

pledge::schema::named_signer_t make_contract_id(const std::string_view name) {
  auto seed = std::string{"pledge.contract."};
  seed.append(name);
  return pledge::blake3::hash(std::string_view{seed});
}

const pledge::schema::named_signer_t& registry_contract_id() {
  static const auto id = make_contract_id(kRegistryContractName);
  return id;
}

const pledge::schema::named_signer_t& escrow_contract_id() {
  static const auto id = make_contract_id(kEscrowContractName);
  return id;
}

const pledge::schema::named_signer_t& milestones_contract_id() {
  static const auto id = make_contract_id(kMilestonesContractName);
  return id;
}

const pledge::schema::named_signer_t& token_contract_id() {
  static const auto id = make_contract_id(kTokenContractName);
  return id;
}

std::string_view contract_name(const pledge::schema::named_signer_t& id) {
  if (id == registry_contract_id()) {
    return kRegistryContractName;
  }
  if (id == escrow_contract_id()) {
    return kEscrowContractName;
  }
  if (id == milestones_contract_id()) {
    return kMilestonesContractName;
  }
  if (id == token_contract_id()) {
    return kTokenContractName;
  }
  return "unknown";
}

}  // namespace pledge::runtime
