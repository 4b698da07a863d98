#include <portage/crypto/digest.hpp>
#include <portage/schema/address.hpp>

#include <algorithm>
#include <array>
#include <iterator>

namespace portage::schema {

namespace {

constexpr auto kCharset = std::string_view{"qpzry9x8gf2tvdw0s3jn54khce6mua7l"};
constexpr auto kMaxEncodedLength = size_t{90};
constexpr auto kChecksumLength = size_t{6};

int8_t charset_index(const char c) {
  auto lowered =
      (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
  auto position = kCharset.find(lowered);
  if (position == std::string_view::npos) {
    return -1;
  }
  return static_cast<int8_t>(position);
}

uint32_t polymod(const bytes_t& values) {
  static constexpr auto kGenerator = std::array<uint32_t, 5>{
      0x3b6a57b2u, 0x26508e6du, 0x1ea119fau, 0x3d4233ddu, 0x2a1462b3u};
  auto checksum = uint32_t{1};
  for (const auto value : values) {
    auto top = static_cast<uint8_t>(checksum >> 25u);
    checksum = ((checksum & 0x1ffffffu) << 5u) ^ value;
    for (size_t i = 0; i < kGenerator.size(); ++i) {
      if (((top >> i) & 1u) != 0) {
        checksum ^= kGenerator[i];
      }
    }
  }
  return checksum;
}

bytes_t expand_hrp(const std::string_view hrp) {
  auto expanded = bytes_t(hrp.size() * 2 + 1);
  for (size_t i = 0; i < hrp.size(); ++i) {
    auto c = static_cast<uint8_t>(hrp[i]);
    expanded[i] = c >> 5u;
    expanded[i + hrp.size() + 1] = c & 0x1fu;
  }
  expanded[hrp.size()] = 0;
  return expanded;
}

bytes_t create_checksum(const std::string_view hrp, const bytes_t& values) {
  auto material = expand_hrp(hrp);
  material.insert(std::end(material), std::begin(values), std::end(values));
  material.resize(material.size() + kChecksumLength);
  auto mod = polymod(material) ^ 1u;
  auto checksum = bytes_t(kChecksumLength);
  for (size_t i = 0; i < kChecksumLength; ++i) {
    checksum[i] = static_cast<uint8_t>((mod >> (5 * (5 - i))) & 31u);
  }
  return checksum;
}

bool verify_checksum(const std::string_view hrp, const bytes_t& values) {
  auto material = expand_hrp(hrp);
  material.insert(std::end(material), std::begin(values), std::end(values));
  return polymod(material) == 1u;
}

// Regroup bit strings; 8->5 pads the tail, 5->8 rejects non-zero padding.
template <unsigned From, unsigned To, bool Pad>
std::optional<bytes_t> convert_bits(const bytes_view_t& input) {
  auto out = bytes_t{};
  out.reserve((input.size() * From + To - 1) / To);
  auto accumulator = uint32_t{0};
  auto bits = unsigned{0};
  constexpr auto kMaxValue = (1u << To) - 1u;
  constexpr auto kMaxAccumulator = (1u << (From + To - 1)) - 1u;
  for (const auto value : input) {
    if ((value >> From) != 0) {
      return std::nullopt;
    }
    accumulator = ((accumulator << From) | value) & kMaxAccumulator;
    bits += From;
    while (bits >= To) {
      bits -= To;
      out.push_back(static_cast<uint8_t>((accumulator >> bits) & kMaxValue));
    }
  }
  if constexpr (Pad) {
    if (bits > 0) {
      out.push_back(
          static_cast<uint8_t>((accumulator << (To - bits)) & kMaxValue));
    }
  } else {
    if (bits >= From || ((accumulator << (To - bits)) & kMaxValue) != 0) {
      return std::nullopt;
    }
  }
  return out;
}

bool valid_account_length(const size_t size) {
  return size == 20 || size == 32;
}

}  // namespace

std::string bech32_encode(std::string_view hrp, const bytes_view_t& payload) {
  auto values = *convert_bits<8, 5, true>(payload);
  auto checksum = create_checksum(hrp, values);
  auto out = std::string{hrp};
  out.reserve(out.size() + 1 + values.size() + checksum.size());
  out.push_back('1');
  for (const auto value : values) {
    out.push_back(kCharset[value]);
  }
  for (const auto value : checksum) {
    out.push_back(kCharset[value]);
  }
  return out;
}

std::optional<std::pair<std::string, bytes_t>> bech32_decode(
    std::string_view encoded) {
  auto has_lower = false;
  auto has_upper = false;
  for (const auto ch : encoded) {
    auto c = static_cast<unsigned char>(ch);
    if (c < 33 || c > 126) {
      return std::nullopt;
    }
    has_lower = has_lower || (c >= 'a' && c <= 'z');
    has_upper = has_upper || (c >= 'A' && c <= 'Z');
  }
  if (has_lower && has_upper) {
    return std::nullopt;
  }

  auto separator = encoded.rfind('1');
  if (encoded.size() > kMaxEncodedLength ||
      separator == std::string_view::npos || separator == 0 ||
      separator + kChecksumLength + 1 > encoded.size()) {
    return std::nullopt;
  }

  auto values = bytes_t{};
  values.reserve(encoded.size() - separator - 1);
  for (auto i = separator + 1; i < encoded.size(); ++i) {
    auto index = charset_index(encoded[i]);
    if (index < 0) {
      return std::nullopt;
    }
    values.push_back(static_cast<uint8_t>(index));
  }

  auto hrp = std::string{};
  hrp.reserve(separator);
  for (size_t i = 0; i < separator; ++i) {
    auto c = encoded[i];
    hrp.push_back((c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a')
                                         : c);
  }
  if (!verify_checksum(hrp, values)) {
    return std::nullopt;
  }

  values.resize(values.size() - kChecksumLength);
  auto payload = convert_bits<5, 8, false>(values);
  if (!payload) {
    return std::nullopt;
  }
  return std::pair{std::move(hrp), std::move(*payload)};
}

std::string make_account_address(const bytes_view_t& account_id) {
  return bech32_encode(kAccountPrefix, account_id);
}

std::string make_account_address(const signer_id_t& signer) {
  auto digest = portage::crypto::sha256(signer_bytes(signer));
  return make_account_address(bytes_view_t{digest.data(), 20});
}

std::optional<std::string> normalize_account(std::string_view account) {
  if (auto decoded = bech32_decode(account)) {
    if (decoded->first == kAccountPrefix &&
        valid_account_length(decoded->second.size())) {
      return make_account_address(decoded->second);
    }
  }

  if (account.size() <= kAccountPrefix.size()) {
    return std::nullopt;
  }
  auto lowered = std::string{account};
  std::transform(std::begin(lowered), std::end(lowered), std::begin(lowered),
                 [](const char c) {
                   return (c >= 'A' && c <= 'Z')
                              ? static_cast<char>(c - 'A' + 'a')
                              : c;
                 });
  if (!std::string_view{lowered}.starts_with(kAccountPrefix)) {
    return std::nullopt;
  }
  auto hex = std::string_view{lowered}.substr(kAccountPrefix.size());
  if (hex.starts_with("0x")) {
    return std::nullopt;
  }
  auto raw = try_from_hex(hex);
  if (!raw || !valid_account_length(raw->size())) {
    return std::nullopt;
  }
  return make_account_address(*raw);
}

std::optional<eth_address_t> try_parse_eth_address(std::string_view address) {
  if (address.size() != 42 || !address.starts_with("0x")) {
    return std::nullopt;
  }
  auto raw = try_from_hex(address);
  if (!raw || raw->size() != 20) {
    return std::nullopt;
  }
  auto out = eth_address_t{};
  std::copy(std::begin(*raw), std::end(*raw), std::begin(out));
  return out;
}

std::string to_eth_address_string(const eth_address_t& address) {
  return "0x" + to_hex(address);
}

}  // namespace portage::schema
