#pragma once
#include <pledge/schema/primitives.hpp>

// Schema type: escrow account.
// Per-project custody ledger. Both totals only grow and
// total_claimed <= total_deposited always holds.
namespace pledge::schema {

template <uint16_t Version>
struct escrow_account;

template <>
struct escrow_account<1> final {
  uint16_t version{1};
  project_id_t project_id{};
  amount_t total_deposited{};
  amount_t total_claimed{};
  ed25519_signer_id attestation_pubkey{};
};

using escrow_account_t = escrow_account<1>;

inline amount_t available_balance(const escrow_account_t& account) {
  return account.total_deposited - account.total_claimed;
}

}  // namespace pledge::schema
