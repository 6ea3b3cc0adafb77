#include <spdlog/spdlog.h>
#include <algorithm>
#include <iterator>
#include <pledge/blake3/hash.hpp>
#include <pledge/contracts/funding_escrow.hpp>
#include <pledge/contracts/milestone_manager.hpp>
#include <pledge/contracts/project_registry.hpp>
#include <pledge/contracts/token.hpp>
#include <pledge/crypto/verify.hpp>
#include <pledge/execution/engine.hpp>
#include <pledge/runtime/context.hpp>
#include <pledge/runtime/contract_ids.hpp>
#include <pledge/schema/contract_error_code.hpp>
#include <pledge/schema/host_error_code.hpp>
#include <pledge/schema/key/contract_keys.hpp>
#include <pledge/schema/query_error_code.hpp>
#include <string>
#include <tuple>
#include <utility>

using namespace pledge::schema;

namespace {

using encoder_t = pledge::schema::encoding::encoder<
    pledge::schema::encoding::scale_encoder_tag>;

constexpr auto kHostCodespace = std::string_view{"pledge.host"};
constexpr auto kQueryCodespace = std::string_view{"pledge.query"};

/// Result of dispatching one payload to its contract.
struct dispatch_outcome final {
  contract_error_code code{};
  named_signer_t contract{};
  std::string_view operation;
};

hash32_t fold_state_root(const hash32_t& seed,
                         const bytes_t& invocation,
                         const uint64_t height,
                         const uint64_t index) {
  auto material = bytes_t{};
  material.reserve(seed.size() + invocation.size() + 16);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(invocation),
                  std::end(invocation));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return pledge::blake3::hash(make_bytes_view(material));
}

invocation_result_t make_host_error(const host_error_code code,
                                    std::string log,
                                    std::string info,
                                    const std::string_view codespace) {
  auto result = invocation_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

std::string make_contract_codespace(const named_signer_t& contract) {
  auto codespace = std::string{"pledge."};
  codespace.append(pledge::runtime::contract_name(contract));
  return codespace;
}

template <typename Key, typename Fn>
void answer(query_result_t& result, const bytes_view_t& data, Fn&& fn) {
  auto encoder = encoder_t{};
  auto key = encoder.try_decode<Key>(data);
  if (!key) {
    result.code = static_cast<uint32_t>(query_error_code::invalid_key);
    result.log = "invalid query key";
    return;
  }
  result.value = encoder.encode(std::forward<Fn>(fn)(*key));
}

}  // namespace

namespace pledge::execution {

engine::engine(
    pledge::schema::encoding::encoder<
        pledge::schema::encoding::scale_encoder_tag>& encoder,
    pledge::storage::storage<pledge::storage::rocksdb_storage_tag>& storage,
    const network_id_t& network_id,
    const bool require_strict_crypto)
    : encoder_(encoder),
      storage_(storage),
      network_id_(network_id),
      require_strict_crypto_(require_strict_crypto),
      signature_verifier_(pledge::crypto::verify_signature),
      pending_block_(make_committed_view()) {
  auto lock = std::scoped_lock{mutex_};
  auto committed = storage_.load_committed_state();
  if (committed) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
  }
  if (!require_strict_crypto_) {
    spdlog::warn(
        "Strict crypto disabled; signatures and attestations are only "
        "length checked");
  }
  spdlog::info("Execution engine ready at height {} on network {}",
               last_committed_height_, to_hex(network_id_));
}

invocation_result_t engine::check_invocation(const bytes_view_t& raw) {
  auto lock = std::scoped_lock{mutex_};
  auto invocation = encoder_.try_decode<invocation_t>(raw);
  if (!invocation) {
    return make_host_error(host_error_code::invalid_invocation,
                           "invalid invocation", "undecodable envelope",
                           kHostCodespace);
  }
  return validate_invocation(*invocation, make_committed_view(),
                             kHostCodespace);
}

block_result_t engine::finalize_block(const ledger_info_t& ledger,
                                      const std::vector<bytes_t>& invocations) {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_) {
    spdlog::warn("Discarding uncommitted block {}", *pending_height_);
  }
  pending_block_.clear();

  auto result = block_result_t{};
  result.results.reserve(invocations.size());

  auto rolling_root = last_committed_state_root_;
  for (auto i = std::size_t{0}; i < invocations.size(); ++i) {
    if (ledger.timestamp == 0) {
      result.results.push_back(make_host_error(
          host_error_code::invalid_block_time, "invalid block time",
          "block timestamp must be positive", kHostCodespace));
      continue;
    }
    auto invocation =
        encoder_.try_decode<invocation_t>(make_bytes_view(invocations[i]));
    if (!invocation) {
      result.results.push_back(make_host_error(
          host_error_code::invalid_invocation, "invalid invocation",
          "undecodable envelope", kHostCodespace));
      continue;
    }
    auto validated =
        validate_invocation(*invocation, pending_block_, kHostCodespace);
    if (validated.code != 0) {
      result.results.push_back(std::move(validated));
      continue;
    }
    auto executed = execute_invocation(*invocation, ledger, pending_block_);
    if (executed.code == 0) {
      rolling_root =
          fold_state_root(rolling_root, invocations[i], ledger.sequence, i);
    }
    result.results.push_back(std::move(executed));
  }

  pending_height_ = static_cast<int64_t>(ledger.sequence);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_) {
    storage_.apply(pending_block_.entries(),
                   pledge::storage::committed_state{
                       .height = *pending_height_,
                       .state_root = pending_state_root_});
    last_committed_height_ = *pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_.reset();
    pending_block_.clear();
    spdlog::debug("Committed block {}", last_committed_height_);
  }

  auto result = commit_result_t{};
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

query_result_t engine::query(const std::string_view path,
                             const bytes_view_t& data) {
  auto lock = std::scoped_lock{mutex_};
  auto result = query_result_t{};
  result.key = make_bytes(data);
  result.height = last_committed_height_;
  result.codespace = std::string{kQueryCodespace};

  auto view = make_committed_view();
  auto ledger = ledger_info_t{
      .sequence = static_cast<uint64_t>(last_committed_height_)};
  auto events = std::vector<contract_event_t>{};
  auto make_context = [&](const named_signer_t& contract) {
    return pledge::runtime::context{
        view, ledger, network_id_, contract, {}, events, require_strict_crypto_};
  };

  if (path == "/engine/info") {
    auto app = app_info_t{};
    app.last_block_height = last_committed_height_;
    app.last_block_state_root = last_committed_state_root_;
    result.value = encoder_.encode(app);
  } else if (path == "/engine/nonce") {
    answer<address_t>(result, data, [&](const address_t& source) {
      return load_nonce(view, source);
    });
  } else if (path == "/registry/project") {
    auto context = make_context(pledge::runtime::registry_contract_id());
    answer<project_id_t>(result, data, [&](const project_id_t& id) {
      return pledge::contracts::project_registry{context}.get_project(id);
    });
  } else if (path == "/registry/count") {
    auto context = make_context(pledge::runtime::registry_contract_id());
    result.value = encoder_.encode(
        pledge::contracts::project_registry{context}.get_project_count());
  } else if (path == "/escrow/balance") {
    auto context = make_context(pledge::runtime::escrow_contract_id());
    answer<project_id_t>(result, data, [&](const project_id_t& id) {
      return pledge::contracts::funding_escrow{context}.get_balance(id);
    });
  } else if (path == "/escrow/info") {
    auto context = make_context(pledge::runtime::escrow_contract_id());
    answer<project_id_t>(result, data, [&](const project_id_t& id) {
      return pledge::contracts::funding_escrow{context}.get_escrow_info(id);
    });
  } else if (path == "/escrow/config") {
    auto context = make_context(pledge::runtime::escrow_contract_id());
    result.value = encoder_.encode(
        pledge::contracts::funding_escrow{context}.get_config());
  } else if (path == "/escrow/milestone_payment") {
    auto context = make_context(pledge::runtime::escrow_contract_id());
    answer<milestone_id_t>(result, data, [&](const milestone_id_t& id) {
      return pledge::contracts::funding_escrow{context}.get_milestone_payment(
          id);
    });
  } else if (path == "/milestones/milestone") {
    auto context = make_context(pledge::runtime::milestones_contract_id());
    answer<milestone_id_t>(result, data, [&](const milestone_id_t& id) {
      return pledge::contracts::milestone_manager{context}.get_milestone(id);
    });
  } else if (path == "/milestones/project") {
    auto context = make_context(pledge::runtime::milestones_contract_id());
    answer<project_id_t>(result, data, [&](const project_id_t& id) {
      return pledge::contracts::milestone_manager{context}
          .get_project_milestones(id);
    });
  } else if (path == "/milestones/released_amount") {
    auto context = make_context(pledge::runtime::milestones_contract_id());
    answer<project_id_t>(result, data, [&](const project_id_t& id) {
      return pledge::contracts::milestone_manager{context}
          .get_project_released_amount(id);
    });
  } else if (path == "/milestones/can_release") {
    auto context = make_context(pledge::runtime::milestones_contract_id());
    answer<milestone_id_t>(result, data, [&](const milestone_id_t& id) {
      return pledge::contracts::milestone_manager{context}
          .can_release_milestone(id);
    });
  } else if (path == "/token/balance") {
    auto context = make_context(pledge::runtime::token_contract_id());
    answer<address_t>(result, data, [&](const address_t& address) {
      return pledge::contracts::token{context}.balance(address);
    });
  } else {
    result.code = static_cast<uint32_t>(query_error_code::unsupported_path);
    result.log = "unsupported path";
    result.info = std::string{path};
  }
  return result;
}

void engine::set_signature_verifier(signature_verifier_t verifier) {
  auto lock = std::scoped_lock{mutex_};
  if (!require_strict_crypto_) {
    spdlog::debug("Ignoring signature verifier in compatibility mode");
    return;
  }
  signature_verifier_ = std::move(verifier);
}

invocation_result_t engine::validate_invocation(
    const invocation_t& invocation,
    const pledge::runtime::overlay& state,
    const std::string_view codespace) const {
  if (invocation.version != 1) {
    return make_host_error(host_error_code::unsupported_version,
                           "unsupported invocation version",
                           "expected version 1", codespace);
  }
  if (invocation.network_id != network_id_) {
    return make_host_error(host_error_code::invalid_network,
                           "invalid network", to_hex(invocation.network_id),
                           codespace);
  }
  auto expected_nonce = load_nonce(state, invocation.source) + 1;
  if (invocation.nonce != expected_nonce) {
    return make_host_error(host_error_code::invalid_nonce, "invalid nonce",
                           "expected " + std::to_string(expected_nonce),
                           codespace);
  }

  auto signed_by_source = std::ranges::any_of(
      invocation.authorizations,
      [&](const authorization_t& entry) {
        return entry.signer == invocation.source;
      });
  if (!signed_by_source) {
    return make_host_error(host_error_code::missing_source_signature,
                           "missing source signature",
                           to_string(invocation.source), codespace);
  }

  auto message = encoder_.encode(make_signing_payload(invocation));
  for (const auto& entry : invocation.authorizations) {
    if (std::holds_alternative<named_signer_t>(entry.signer)) {
      return make_host_error(host_error_code::signature_verification_failed,
                             "contract identities cannot sign",
                             to_string(entry.signer), codespace);
    }
    if (require_strict_crypto_ &&
        !signature_verifier_(make_bytes_view(message), entry.signer,
                             entry.signature)) {
      return make_host_error(host_error_code::signature_verification_failed,
                             "signature verification failed",
                             to_string(entry.signer), codespace);
    }
  }
  return invocation_result_t{};
}

invocation_result_t engine::execute_invocation(
    const invocation_t& invocation,
    const ledger_info_t& ledger,
    pledge::runtime::overlay& state) {
  auto staged = pledge::runtime::overlay::layered_on(state);
  auto events = std::vector<contract_event_t>{};
  auto authorized = std::vector<address_t>{};
  authorized.reserve(invocation.authorizations.size());
  for (const auto& entry : invocation.authorizations) {
    authorized.push_back(entry.signer);
  }

  auto run = [&](const named_signer_t& contract, const std::string_view name,
                 auto&& call) {
    auto context = pledge::runtime::context{staged,     ledger,
                                            network_id_, contract,
                                            authorized, events,
                                            require_strict_crypto_};
    return dispatch_outcome{
        .code = call(context), .contract = contract, .operation = name};
  };
  using pledge::runtime::escrow_contract_id;
  using pledge::runtime::milestones_contract_id;
  using pledge::runtime::registry_contract_id;
  using pledge::runtime::token_contract_id;
  using registry = pledge::contracts::project_registry;
  using escrow = pledge::contracts::funding_escrow;
  using milestones = pledge::contracts::milestone_manager;
  using token = pledge::contracts::token;

  auto outcome = std::visit(
      overloaded{
          [&](const register_project_t& op) {
            return run(registry_contract_id(), "register_project",
                       [&](auto& ctx) {
                         return registry{ctx}.register_project(op);
                       });
          },
          [&](const update_project_metadata_t& op) {
            return run(registry_contract_id(), "update_project_metadata",
                       [&](auto& ctx) {
                         return registry{ctx}.update_metadata(op);
                       });
          },
          [&](const initialize_escrow_t& op) {
            return run(escrow_contract_id(), "initialize_escrow",
                       [&](auto& ctx) { return escrow{ctx}.initialize(op); });
          },
          [&](const deposit_t& op) {
            return run(escrow_contract_id(), "deposit",
                       [&](auto& ctx) { return escrow{ctx}.deposit(op); });
          },
          [&](const claim_t& op) {
            return run(escrow_contract_id(), "claim",
                       [&](auto& ctx) { return escrow{ctx}.claim(op); });
          },
          [&](const release_to_recipient_t& op) {
            return run(escrow_contract_id(), "release_to_recipient",
                       [&](auto& ctx) {
                         return escrow{ctx}.release_to_recipient(op);
                       });
          },
          [&](const initialize_milestones_t& op) {
            return run(milestones_contract_id(), "initialize_milestones",
                       [&](auto& ctx) {
                         return milestones{ctx}.initialize(op);
                       });
          },
          [&](const register_milestone_t& op) {
            return run(milestones_contract_id(), "register_milestone",
                       [&](auto& ctx) {
                         return milestones{ctx}.register_milestone(op);
                       });
          },
          [&](const submit_milestone_proof_t& op) {
            return run(milestones_contract_id(), "submit_milestone_proof",
                       [&](auto& ctx) {
                         return milestones{ctx}.submit_proof(op);
                       });
          },
          [&](const release_milestone_t& op) {
            return run(milestones_contract_id(), "release_milestone",
                       [&](auto& ctx) {
                         return milestones{ctx}.release_milestone(op);
                       });
          },
          [&](const initialize_token_t& op) {
            return run(token_contract_id(), "initialize_token",
                       [&](auto& ctx) { return token{ctx}.initialize(op); });
          },
          [&](const mint_token_t& op) {
            return run(token_contract_id(), "mint_token",
                       [&](auto& ctx) { return token{ctx}.mint(op); });
          },
          [&](const transfer_token_t& op) {
            return run(token_contract_id(), "transfer_token",
                       [&](auto& ctx) { return token{ctx}.transfer(op); });
          }},
      invocation.payload);

  auto result = invocation_result_t{};
  result.codespace = make_contract_codespace(outcome.contract);
  if (outcome.code != contract_error_code::ok) {
    result.code = static_cast<uint32_t>(outcome.code);
    result.log = std::string{to_string(outcome.code)};
    result.info = std::string{outcome.operation};
    spdlog::debug("Invocation {} from {} failed: {}", outcome.operation,
                  to_string(invocation.source), result.log);
    return result;
  }

  auto nonce_key = pledge::schema::key::make_nonce_key(invocation.source);
  staged.put(make_bytes_view(nonce_key), encoder_.encode(invocation.nonce));
  staged.merge_into(state);

  result.info = std::string{outcome.operation};
  result.events = std::move(events);
  return result;
}

uint64_t engine::load_nonce(const pledge::runtime::overlay& state,
                            const address_t& source) const {
  auto key = pledge::schema::key::make_nonce_key(source);
  auto raw = state.get(make_bytes_view(key));
  if (!raw) {
    return 0;
  }
  return encoder_.decode<uint64_t>(make_bytes_view(*raw));
}

pledge::runtime::overlay engine::make_committed_view() const {
  return pledge::runtime::overlay{[this](const bytes_view_t& key) {
    return storage_.get_raw(key);
  }};
}

}  // namespace pledge::execution
