#pragma once
#include <pledge/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace pledge::blake3 {

pledge::schema::hash32_t hash(const std::string_view& str);
pledge::schema::hash32_t hash(const pledge::schema::bytes_view_t& bytes);

}  // namespace pledge::blake3
