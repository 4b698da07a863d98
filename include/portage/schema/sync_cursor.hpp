#pragma once

#include <cstdint>

// Schema type: sync cursor.
// Bridge workflow: sequential ingestion position. The next block reads index
// last_processed_index + 1 from the L2.
namespace portage::schema {

template <uint16_t Version>
struct sync_cursor;

template <>
struct sync_cursor<1> final {
  uint16_t version{1};
  uint64_t last_processed_index{};
  uint64_t last_external_height{};
};

using sync_cursor_t = sync_cursor<1>;

}  // namespace portage::schema
