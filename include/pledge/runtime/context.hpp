#pragma once
#include <pledge/runtime/overlay.hpp>
#include <pledge/schema/contract_error_code.hpp>
#include <pledge/schema/contract_event.hpp>
#include <pledge/schema/encoding/scale/encoder.hpp>
#include <pledge/schema/key/contract_keys.hpp>
#include <pledge/schema/ledger_info.hpp>
#include <pledge/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pledge::runtime {

/// Host services available to one executing contract frame.
///
/// A frame sees only its own keyspace. Writes land in the frame's overlay;
/// `call` runs a nested frame in a child overlay that is merged back only
/// when the callee returns `ok`.
class context final {
 public:
  context(overlay& state,
          const pledge::schema::ledger_info_t& ledger,
          const pledge::schema::network_id_t& network_id,
          const pledge::schema::named_signer_t& contract,
          std::vector<pledge::schema::address_t> authorized,
          std::vector<pledge::schema::contract_event_t>& events,
          bool strict_crypto);

  const pledge::schema::named_signer_t& contract() const;
  pledge::schema::address_t contract_address() const;
  const pledge::schema::ledger_info_t& ledger() const;
  const pledge::schema::network_id_t& network_id() const;
  bool strict_crypto() const;

  /// True when `address` signed the invocation, or when it is the address of
  /// the contract that called into this frame.
  bool is_authorized(const pledge::schema::address_t& address) const;

  template <typename T>
  std::optional<T> get_instance(std::string_view name) const;

  template <typename T>
  void put_instance(std::string_view name, const T& value);

  template <typename T, typename Id>
  std::optional<T> get_persistent(std::string_view kind, const Id& id) const;

  template <typename T, typename Id>
  void put_persistent(std::string_view kind, const Id& id, const T& value);

  template <typename Id>
  bool has_persistent(std::string_view kind, const Id& id) const;

  void emit(std::string type,
            std::vector<pledge::schema::contract_event_attribute_t> attributes);

  /// Run `fn(child_context)` as a call from this contract into `callee`.
  template <typename Fn>
  pledge::schema::contract_error_code call(
      const pledge::schema::named_signer_t& callee,
      Fn&& fn);

 private:
  template <typename T>
  std::optional<T> read(const pledge::schema::bytes_t& key) const;

  template <typename T>
  void write(const pledge::schema::bytes_t& key, const T& value);

  overlay& state_;
  const pledge::schema::ledger_info_t& ledger_;
  const pledge::schema::network_id_t& network_id_;
  pledge::schema::named_signer_t contract_;
  std::vector<pledge::schema::address_t> authorized_;
  std::vector<pledge::schema::contract_event_t>& events_;
  bool strict_crypto_{true};
};

template <typename T>
std::optional<T> context::read(const pledge::schema::bytes_t& key) const {
  auto raw = state_.get(pledge::schema::make_bytes_view(key));
  if (!raw) {
    return std::nullopt;
  }
  return pledge::schema::encoding::scale_encoder_t{}.decode<T>(
      pledge::schema::make_bytes_view(*raw));
}

template <typename T>
void context::write(const pledge::schema::bytes_t& key, const T& value) {
  state_.put(pledge::schema::make_bytes_view(key),
             pledge::schema::encoding::scale_encoder_t{}.encode(value));
}

template <typename T>
std::optional<T> context::get_instance(const std::string_view name) const {
  return read<T>(pledge::schema::key::make_instance_key(contract_, name));
}

template <typename T>
void context::put_instance(const std::string_view name, const T& value) {
  write(pledge::schema::key::make_instance_key(contract_, name), value);
}

template <typename T, typename Id>
std::optional<T> context::get_persistent(const std::string_view kind,
                                         const Id& id) const {
  return read<T>(
      pledge::schema::key::make_persistent_key(contract_, kind, id));
}

template <typename T, typename Id>
void context::put_persistent(const std::string_view kind,
                             const Id& id,
                             const T& value) {
  write(pledge::schema::key::make_persistent_key(contract_, kind, id), value);
}

template <typename Id>
bool context::has_persistent(const std::string_view kind, const Id& id) const {
  auto key = pledge::schema::key::make_persistent_key(contract_, kind, id);
  return state_.get(pledge::schema::make_bytes_view(key)).has_value();
}

template <typename Fn>
pledge::schema::contract_error_code context::call(
    const pledge::schema::named_signer_t& callee,
    Fn&& fn) {
  auto staged = overlay::layered_on(state_);
  auto authorized = authorized_;
  authorized.push_back(contract_address());
  auto child = context{staged,
                       ledger_,
                       network_id_,
                       callee,
                       std::move(authorized),
                       events_,
                       strict_crypto_};

  auto events_mark = events_.size();
  auto code = std::forward<Fn>(fn)(child);
  if (code == pledge::schema::contract_error_code::ok) {
    staged.merge_into(state_);
  } else {
    events_.resize(events_mark);
  }
  return code;
}

}  // namespace pledge::runtime
