#include <portage/bridge/abi.hpp>
#include <portage/crypto/digest.hpp>

#include <spdlog/fmt/fmt.h>
#include <iterator>
#include <limits>

namespace portage::bridge::abi {

namespace {

constexpr auto kWordSize = std::size_t{32};

std::optional<uint64_t> word_as_size(const portage::schema::bytes_view_t& data,
                                     std::size_t offset) {
  if (offset > data.size() || data.size() - offset < kWordSize) {
    return std::nullopt;
  }
  auto value =
      portage::schema::from_word(data.subspan(offset, kWordSize));
  if (value > std::numeric_limits<uint64_t>::max()) {
    return std::nullopt;
  }
  return static_cast<uint64_t>(value);
}

}  // namespace

portage::schema::bytes_t selector(std::string_view signature) {
  auto digest = portage::crypto::keccak256(signature);
  return portage::schema::bytes_t(std::begin(digest), std::begin(digest) + 4);
}

std::string encode_call(std::string_view signature) {
  auto calldata = selector(signature);
  return "0x" + portage::schema::to_hex(portage::schema::make_bytes_view(calldata));
}

std::string encode_call(std::string_view signature,
                        const portage::schema::amount_t& argument) {
  auto calldata = selector(signature);
  auto word = portage::schema::to_word(argument);
  calldata.insert(std::end(calldata), std::begin(word), std::end(word));
  return "0x" + portage::schema::to_hex(portage::schema::make_bytes_view(calldata));
}

std::optional<portage::schema::amount_t> decode_uint256(
    const portage::schema::bytes_view_t& data) {
  if (data.size() < kWordSize) {
    return std::nullopt;
  }
  return portage::schema::from_word(data.first(kWordSize));
}

std::optional<std::pair<std::string, portage::schema::amount_t>>
decode_string_uint256(const portage::schema::bytes_view_t& data) {
  if (data.size() < 2 * kWordSize) {
    return std::nullopt;
  }
  auto offset = word_as_size(data, 0);
  if (!offset) {
    return std::nullopt;
  }
  auto amount = portage::schema::from_word(data.subspan(kWordSize, kWordSize));

  auto length = word_as_size(data, *offset);
  if (!length) {
    return std::nullopt;
  }
  auto start = *offset + kWordSize;
  if (start > data.size() || data.size() - start < *length) {
    return std::nullopt;
  }
  auto account = portage::schema::make_string(data.subspan(start, *length));
  return std::pair{std::move(account), amount};
}

std::string block_tag(std::optional<uint64_t> height) {
  if (!height) {
    return "latest";
  }
  return fmt::format("0x{:x}", *height);
}

std::optional<uint64_t> parse_quantity(std::string_view quantity) {
  if (quantity.size() < 3 || quantity.size() > 18 ||
      !(quantity.starts_with("0x") || quantity.starts_with("0X"))) {
    return std::nullopt;
  }
  auto value = uint64_t{0};
  for (auto c : quantity.substr(2)) {
    value <<= 4;
    if (c >= '0' && c <= '9') {
      value |= static_cast<uint64_t>(c - '0');
    } else if (c >= 'a' && c <= 'f') {
      value |= static_cast<uint64_t>(c - 'a' + 10);
    } else if (c >= 'A' && c <= 'F') {
      value |= static_cast<uint64_t>(c - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return value;
}

}  // namespace portage::bridge::abi
