#include <pledge/schema/key/contract_keys.hpp>

#include <iterator>

namespace pledge::schema::key {

const std::string_view kContractPrefix{"SYS|CONTRACT|"};
const std::string_view kHostPrefix{"SYS|HOST|"};
const std::string_view kHostNoncePrefix{"SYS|HOST|NONCE|"};
const std::string_view kInstanceSegment{"|INSTANCE|"};
const std::string_view kPersistentSegment{"|PERSISTENT|"};

pledge::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                          const pledge::schema::bytes_t& id) {
  auto key = pledge::schema::make_bytes(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

pledge::schema::bytes_t make_contract_prefix(
    const pledge::schema::named_signer_t& contract) {
  return make_prefixed_key(
      kContractPrefix, pledge::schema::make_bytes(pledge::schema::to_hex(contract)));
}

pledge::schema::bytes_t make_instance_key(
    const pledge::schema::named_signer_t& contract,
    const std::string_view name) {
  auto key = make_contract_prefix(contract);
  key.insert(std::end(key), std::begin(kInstanceSegment),
             std::end(kInstanceSegment));
  key.insert(std::end(key), std::begin(name), std::end(name));
  return key;
}

pledge::schema::bytes_t make_persistent_prefix(
    const pledge::schema::named_signer_t& contract,
    const std::string_view kind) {
  auto key = make_contract_prefix(contract);
  key.insert(std::end(key), std::begin(kPersistentSegment),
             std::end(kPersistentSegment));
  key.insert(std::end(key), std::begin(kind), std::end(kind));
  key.push_back('|');
  return key;
}

pledge::schema::bytes_t make_nonce_key(
    const pledge::schema::address_t& source) {
  return make_prefixed_key(kHostNoncePrefix,
                           pledge::schema::encoding::scale_encoder_t{}.encode(source));
}

}  // namespace pledge::schema::key
