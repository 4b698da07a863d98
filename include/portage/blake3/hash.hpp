#pragma once
#include <portage/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace portage::blake3 {

portage::schema::hash32_t hash(const std::string_view& str);
portage::schema::hash32_t hash(const portage::schema::bytes_view_t& bytes);

}  // namespace portage::blake3
