#pragma once

#include <pledge/schema/primitives.hpp>

namespace pledge::crypto {

/// True when the linked OpenSSL exposes ed25519 and secp256k1.
bool available();

bool verify_signature(const pledge::schema::bytes_view_t& message,
                      const pledge::schema::signer_id_t& signer,
                      const pledge::schema::signature_t& signature);

}  // namespace pledge::crypto
