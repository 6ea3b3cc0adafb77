#pragma once
#include <pledge/schema/primitives.hpp>
#include <string>

// Schema type: update project metadata.
// Registry call; authorized by the stored owner, not by a field here.
namespace pledge::schema {

template <uint16_t Version>
struct update_project_metadata;

template <>
struct update_project_metadata<1> final {
  uint16_t version{1};
  project_id_t project_id{};
  std::string metadata_uri;
};

using update_project_metadata_t = update_project_metadata<1>;

}  // namespace pledge::schema
