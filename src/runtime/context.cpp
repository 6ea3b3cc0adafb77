#include <pledge/runtime/context.hpp>
#include <pledge/runtime/contract_ids.hpp>

#include <algorithm>
#include <string>
#include <utility>

namespace pledge::runtime {

context::context(overlay& state,
                 const pledge::schema::ledger_info_t& ledger,
                 const pledge::schema::network_id_t& network_id,
                 const pledge::schema::named_signer_t& contract,
                 std::vector<pledge::schema::address_t> authorized,
                 std::vector<pledge::schema::contract_event_t>& events,
                 const bool strict_crypto)
    : state_(state),
      ledger_(ledger),
      network_id_(network_id),
      contract_(contract),
      authorized_(std::move(authorized)),
      events_(events),
      strict_crypto_(strict_crypto) {}

const pledge::schema::named_signer_t& context::contract() const {
  return contract_;
}

pledge::schema::address_t context::contract_address() const {
  return pledge::schema::address_t{contract_};
}

const pledge::schema::ledger_info_t& context::ledger() const {
  return ledger_;
}

const pledge::schema::network_id_t& context::network_id() const {
  return network_id_;
}

bool context::strict_crypto() const {
  return strict_crypto_;
}

bool context::is_authorized(const pledge::schema::address_t& address) const {
  return std::ranges::find(authorized_, address) != std::end(authorized_);
}

void context::emit(
    std::string type,
    std::vector<pledge::schema::contract_event_attribute_t> attributes) {
  events_.push_back(pledge::schema::contract_event_t{
      .contract = std::string{contract_name(contract_)},
      .type = std::move(type),
      .attributes = std::move(attributes)});
}

}  // namespace pledge::runtime
