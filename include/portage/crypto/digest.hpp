#pragma once

#include <portage/schema/primitives.hpp>

#include <string_view>

namespace portage::crypto {

portage::schema::hash32_t sha256(const portage::schema::bytes_view_t& bytes);
portage::schema::hash32_t sha256(const std::string_view& str);

/// Original Keccak-256 (pre-NIST padding), as used by the EVM.
portage::schema::hash32_t keccak256(const portage::schema::bytes_view_t& bytes);
portage::schema::hash32_t keccak256(const std::string_view& str);

}  // namespace portage::crypto
