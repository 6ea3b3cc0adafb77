#pragma once

#include <cstdint>

namespace pledge::schema {

// Envelope failures detected by the host before any contract runs.
enum class host_error_code : uint32_t {
  invalid_invocation = 1,
  unsupported_version = 2,
  invalid_network = 3,
  invalid_nonce = 4,
  missing_source_signature = 5,
  signature_verification_failed = 6,
  invalid_block_time = 7,
};

}  // namespace pledge::schema
