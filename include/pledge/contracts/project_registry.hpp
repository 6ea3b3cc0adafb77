#pragma once
#include <pledge/runtime/context.hpp>
#include <pledge/schema/contract_error_code.hpp>
#include <pledge/schema/project_state.hpp>
#include <pledge/schema/register_project.hpp>
#include <pledge/schema/update_project_metadata.hpp>
#include <cstdint>
#include <optional>

namespace pledge::contracts {

/// Project identity and metadata pointer.
class project_registry final {
 public:
  explicit project_registry(pledge::runtime::context& context);

  /// Register a project owned by `op.owner`, who must authorize the call.
  pledge::schema::contract_error_code register_project(
      const pledge::schema::register_project_t& op);

  /// Replace the metadata pointer; only the stored owner may do this.
  pledge::schema::contract_error_code update_metadata(
      const pledge::schema::update_project_metadata_t& op);

  std::optional<pledge::schema::project_state_t> get_project(
      const pledge::schema::project_id_t& project_id) const;
  uint32_t get_project_count() const;

 private:
  pledge::runtime::context& context_;
};

}  // namespace pledge::contracts
