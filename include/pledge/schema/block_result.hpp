#pragma once

#include <pledge/schema/invocation_result.hpp>
#include <pledge/schema/primitives.hpp>
#include <cstdint>
#include <vector>

// Schema type: block result.
// Finalize output: per-invocation results plus the candidate post-block
// state root.
namespace pledge::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  std::vector<invocation_result_t> results;
  hash32_t state_root{};
};

using block_result_t = block_result<1>;

}  // namespace pledge::schema
