#pragma once

#include <pledge/schema/primitives.hpp>
#include <cstdint>

// Schema type: commit result.
// Height and state root that were persisted together with the block writes.
namespace pledge::schema {

template <uint16_t Version>
struct commit_result;

template <>
struct commit_result<1> final {
  uint16_t version{1};
  int64_t committed_height{};
  hash32_t state_root{};
};

using commit_result_t = commit_result<1>;

}  // namespace pledge::schema
