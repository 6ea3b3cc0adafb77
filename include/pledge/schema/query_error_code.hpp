#pragma once

#include <cstdint>

// Schema type: query error code.
namespace pledge::schema {

enum class query_error_code : uint32_t {
  invalid_key = 1,
  unsupported_path = 3,
};

}  // namespace pledge::schema
