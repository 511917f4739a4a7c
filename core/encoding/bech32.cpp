/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "encoding/bech32.hpp"

#include <array>

OUTCOME_CPP_DEFINE_CATEGORY(foxchain::encoding, Bech32Error, e) {
  using E = foxchain::encoding::Bech32Error;
  switch (e) {
    case E::MIXED_CASE:
      return "Bech32 string mixes upper and lower case";
    case E::MISSING_SEPARATOR:
      return "Bech32 separator '1' not found";
    case E::INVALID_HRP:
      return "Bech32 human-readable part is empty or has invalid characters";
    case E::INVALID_CHARACTER:
      return "Invalid character in Bech32 data part";
    case E::TOO_SHORT:
      return "Bech32 data part is shorter than the checksum";
    case E::TOO_LONG:
      return "Bech32 string exceeds the length limit";
  }
  return "Unknown Bech32 error";
}

OUTCOME_CPP_DEFINE_CATEGORY(foxchain::encoding, ConvertBitsError, e) {
  using E = foxchain::encoding::ConvertBitsError;
  switch (e) {
    case E::INVALID_BIT_WIDTH:
      return "Bit width of a group must be between 1 and 8";
    case E::VALUE_OUT_OF_RANGE:
      return "Input value does not fit into the source bit width";
    case E::NON_ZERO_PADDING:
      return "Padding bits are not zero";
    case E::EXCESS_PADDING:
      return "Padding is longer than a source group";
  }
  return "Unknown bit conversion error";
}

namespace foxchain::encoding {

  namespace {
    constexpr std::array<int8_t, 128> makeCharsetMap() {
      std::array<int8_t, 128> map{};
      map.fill(-1);
      for (size_t i = 0; i < kBech32Charset.size(); ++i) {
        auto c = kBech32Charset[i];
        map[static_cast<uint8_t>(c)] = static_cast<int8_t>(i);
        if (c >= 'a' and c <= 'z') {
          map[static_cast<uint8_t>(c - 'a' + 'A')] = static_cast<int8_t>(i);
        }
      }
      return map;
    }

    constexpr auto charsetMap = makeCharsetMap();

    bool isLower(char c) {
      return c >= 'a' and c <= 'z';
    }

    bool isUpper(char c) {
      return c >= 'A' and c <= 'Z';
    }
  }  // namespace

  bool isBech32Char(char c) {
    auto code = static_cast<uint8_t>(c);
    return code < charsetMap.size() and charsetMap[code] != -1;
  }

  outcome::result<Bech32Parts> splitBech32(std::string_view str,
                                           size_t max_length) {
    if (str.size() > max_length) {
      return Bech32Error::TOO_LONG;
    }

    bool has_lower = false;
    bool has_upper = false;
    for (char c : str) {
      has_lower |= isLower(c);
      has_upper |= isUpper(c);
    }
    if (has_lower and has_upper) {
      return Bech32Error::MIXED_CASE;
    }

    auto separator = str.rfind(kBech32Separator);
    if (separator == std::string_view::npos) {
      return Bech32Error::MISSING_SEPARATOR;
    }
    if (separator == 0) {
      return Bech32Error::INVALID_HRP;
    }
    if (str.size() - separator - 1 < kBech32ChecksumLength) {
      return Bech32Error::TOO_SHORT;
    }

    Bech32Parts parts;
    parts.hrp.reserve(separator);
    for (char c : str.substr(0, separator)) {
      if (c < 33 or c > 126) {
        return Bech32Error::INVALID_HRP;
      }
      parts.hrp.push_back(isUpper(c) ? static_cast<char>(c - 'A' + 'a') : c);
    }

    parts.values.reserve(str.size() - separator - 1);
    for (char c : str.substr(separator + 1)) {
      if (not isBech32Char(c)) {
        return Bech32Error::INVALID_CHARACTER;
      }
      parts.values.putUint8(
          static_cast<uint8_t>(charsetMap[static_cast<uint8_t>(c)]));
    }
    return parts;
  }

  std::string joinBech32(std::string_view hrp, common::BufferView values) {
    std::string res;
    res.reserve(hrp.size() + 1 + values.size());
    res.append(hrp);
    res.push_back(kBech32Separator);
    for (auto value : values) {
      res.push_back(kBech32Charset[value & 0x1f]);
    }
    return res;
  }

  outcome::result<common::Buffer> convertBits(common::BufferView data,
                                              unsigned from_bits,
                                              unsigned to_bits,
                                              bool pad) {
    if (from_bits == 0 or from_bits > 8 or to_bits == 0 or to_bits > 8) {
      return ConvertBitsError::INVALID_BIT_WIDTH;
    }

    const uint32_t max_value = (1u << to_bits) - 1;
    const uint32_t max_acc = (1u << (from_bits + to_bits - 1)) - 1;
    uint32_t acc = 0;
    unsigned bits = 0;

    common::Buffer out;
    out.reserve(data.size() * from_bits / to_bits + 1);
    for (auto value : data) {
      if ((value >> from_bits) != 0) {
        return ConvertBitsError::VALUE_OUT_OF_RANGE;
      }
      acc = ((acc << from_bits) | value) & max_acc;
      bits += from_bits;
      while (bits >= to_bits) {
        bits -= to_bits;
        out.putUint8(static_cast<uint8_t>((acc >> bits) & max_value));
      }
    }

    if (pad) {
      if (bits > 0) {
        out.putUint8(static_cast<uint8_t>((acc << (to_bits - bits)) & max_value));
      }
    } else if (bits >= from_bits) {
      return ConvertBitsError::EXCESS_PADDING;
    } else if (((acc << (to_bits - bits)) & max_value) != 0) {
      return ConvertBitsError::NON_ZERO_PADDING;
    }
    return out;
  }

}  // namespace foxchain::encoding
