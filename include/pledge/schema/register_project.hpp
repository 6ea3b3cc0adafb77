#pragma once
#include <pledge/schema/primitives.hpp>
#include <string>

// Schema type: register project.
// Registry call; the owner must authorize the invocation.
namespace pledge::schema {

template <uint16_t Version>
struct register_project;

template <>
struct register_project<1> final {
  uint16_t version{1};
  address_t owner{};
  project_id_t project_id{};
  std::string metadata_uri;
};

using register_project_t = register_project<1>;

}  // namespace pledge::schema
