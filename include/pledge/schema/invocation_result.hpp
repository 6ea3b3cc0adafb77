#pragma once

#include <pledge/schema/contract_event.hpp>
#include <pledge/schema/primitives.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace pledge::schema {

template <uint16_t Version>
struct invocation_result;

template <>
struct invocation_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<contract_event_t> events;
};

using invocation_result_t = invocation_result<1>;

}  // namespace pledge::schema
