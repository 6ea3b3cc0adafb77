#pragma once

#include <pledge/schema/primitives.hpp>
#include <functional>

namespace pledge::execution {

using signature_verifier_t =
    std::function<bool(const pledge::schema::bytes_view_t& message,
                       const pledge::schema::signer_id_t& signer,
                       const pledge::schema::signature_t& signature)>;

}  // namespace pledge::execution
