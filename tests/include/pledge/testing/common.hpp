#pragma once

#include <pledge/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace pledge::testing {

inline pledge::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = pledge::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline pledge::schema::ed25519_signer_id make_ed25519_signer(
    const uint8_t seed) {
  auto signer = pledge::schema::ed25519_signer_id{};
  for (std::size_t i = 0; i < signer.public_key.size(); ++i) {
    signer.public_key[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return signer;
}

inline pledge::schema::address_t make_account(const uint8_t seed) {
  return pledge::schema::address_t{make_ed25519_signer(seed)};
}

/// Attestation bytes that pass the length check only.
inline pledge::schema::bytes_t make_unsigned_attestation() {
  return pledge::schema::bytes_t(pledge::schema::kMinimumSignatureSize + 8,
                                 0x5A);
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace pledge::testing
