#include <pledge/common/checked.hpp>
#include <pledge/contracts/project_registry.hpp>
#include <spdlog/spdlog.h>

using namespace pledge::schema;

namespace pledge::contracts {

namespace {

constexpr auto kProjectCountKey = std::string_view{"PROJECT_COUNT"};
constexpr auto kProjectKind = std::string_view{"PROJECT"};

}  // namespace

project_registry::project_registry(pledge::runtime::context& context)
    : context_(context) {}

contract_error_code project_registry::register_project(
    const register_project_t& op) {
  if (!context_.is_authorized(op.owner)) {
    return contract_error_code::unauthorized;
  }
  if (context_.has_persistent(kProjectKind, op.project_id)) {
    return contract_error_code::already_registered;
  }
  auto count = pledge::common::checked_add(get_project_count(), uint32_t{1});
  if (!count) {
    return contract_error_code::amount_overflow;
  }

  context_.put_persistent(
      kProjectKind, op.project_id,
      project_state_t{.project_id = op.project_id,
                      .owner = op.owner,
                      .metadata_uri = op.metadata_uri,
                      .registered_at = context_.ledger().timestamp});
  context_.put_instance(kProjectCountKey, *count);

  spdlog::info("Registered project {} owned by {}", to_hex(op.project_id),
               to_string(op.owner));
  context_.emit("project_registered",
                {make_attribute("project_id", to_hex(op.project_id), true),
                 make_attribute("owner", to_string(op.owner), true),
                 make_attribute("metadata_uri", op.metadata_uri)});
  return contract_error_code::ok;
}

contract_error_code project_registry::update_metadata(
    const update_project_metadata_t& op) {
  auto project = get_project(op.project_id);
  if (!project) {
    return contract_error_code::not_found;
  }
  if (!context_.is_authorized(project->owner)) {
    return contract_error_code::unauthorized;
  }
  project->metadata_uri = op.metadata_uri;
  context_.put_persistent(kProjectKind, op.project_id, *project);
  context_.emit("project_metadata_updated",
                {make_attribute("project_id", to_hex(op.project_id), true),
                 make_attribute("metadata_uri", op.metadata_uri)});
  return contract_error_code::ok;
}

std::optional<project_state_t> project_registry::get_project(
    const project_id_t& project_id) const {
  return context_.get_persistent<project_state_t>(kProjectKind, project_id);
}

uint32_t project_registry::get_project_count() const {
  return context_.get_instance<uint32_t>(kProjectCountKey).value_or(0);
}

}  // namespace pledge::contracts
