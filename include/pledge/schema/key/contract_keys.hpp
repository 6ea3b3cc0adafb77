#pragma once
#include <pledge/schema/encoding/scale/encoder.hpp>
#include <pledge/schema/primitives.hpp>
#include <string_view>

// Key layout.
//   SYS|CONTRACT|<contract hex>|INSTANCE|<name>
//   SYS|CONTRACT|<contract hex>|PERSISTENT|<kind>|<SCALE id>
//   SYS|HOST|NONCE|<SCALE address>
namespace pledge::schema::key {

extern const std::string_view kContractPrefix;
extern const std::string_view kHostPrefix;
extern const std::string_view kHostNoncePrefix;
extern const std::string_view kInstanceSegment;
extern const std::string_view kPersistentSegment;

pledge::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                          const pledge::schema::bytes_t& id);

/// Prefix shared by every key a contract owns.
pledge::schema::bytes_t make_contract_prefix(
    const pledge::schema::named_signer_t& contract);

pledge::schema::bytes_t make_instance_key(
    const pledge::schema::named_signer_t& contract,
    std::string_view name);

pledge::schema::bytes_t make_persistent_prefix(
    const pledge::schema::named_signer_t& contract,
    std::string_view kind);

template <typename Id>
pledge::schema::bytes_t make_persistent_key(
    const pledge::schema::named_signer_t& contract,
    const std::string_view kind,
    const Id& id) {
  auto key = make_persistent_prefix(contract, kind);
  pledge::schema::encoding::scale_encoder_t{}.encode(id, key);
  return key;
}

pledge::schema::bytes_t make_nonce_key(const pledge::schema::address_t& source);

}  // namespace pledge::schema::key
