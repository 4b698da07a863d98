#pragma once
#include <portage/schema/primitives.hpp>
#include <optional>
#include <span>

namespace portage::schema::encoding {

// Codec selection is a build-time choice: callers name the library tag,
// e.g. `encoder<scale_encoder_tag>`, and never touch the library directly.
template <typename Library>
struct encoder {
  template <typename T>
  portage::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, portage::schema::bytes_t& out);

  template <typename T>
  T decode(const portage::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const portage::schema::bytes_view_t& bytes);
};

}  // namespace portage::schema::encoding
