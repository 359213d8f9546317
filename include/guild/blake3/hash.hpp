#pragma once
#include <guild/schema/primitives.hpp>
#include <span>

namespace guild::blake3 {

guild::schema::hash32_t hash(const guild::schema::bytes_view_t& bytes);

}  // namespace guild::blake3
