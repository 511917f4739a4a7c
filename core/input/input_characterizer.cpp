/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "input/input_characterizer.hpp"

#include <algorithm>
#include <cctype>
#include <string>

#include "checksum/base58check.hpp"
#include "common/hexutil.hpp"
#include "encoding/base58.hpp"
#include "encoding/bech32.hpp"

namespace foxchain::input {

  namespace {
    /// prefix, one account byte and one checksum byte
    constexpr size_t kMinSs58Length = 3;
    constexpr size_t kMinBase58CheckLength =
        1 + checksum::kBase58CheckChecksumLength;

    std::string_view trim(std::string_view str) {
      auto is_space = [](char c) {
        return std::isspace(static_cast<unsigned char>(c)) != 0;
      };
      while (not str.empty() and is_space(str.front())) {
        str.remove_prefix(1);
      }
      while (not str.empty() and is_space(str.back())) {
        str.remove_suffix(1);
      }
      return str;
    }

    bool startsWith0x(std::string_view str) {
      return str.size() >= 2 and str[0] == '0'
         and (str[1] == 'x' or str[1] == 'X');
    }

    void characterizeHex(InputSignature &signature) {
      auto digits = signature.hexDigits();
      if (digits.empty() or digits.size() % 2 != 0
          or not common::isHexDigits(digits)) {
        return;
      }
      signature.families.insert(registry::EncodingFamily::HEX);
      signature.hex_length = digits.size() / 2;
    }

    void characterizeBase58(InputSignature &signature) {
      auto decoded = encoding::decodeBase58(signature.input);
      if (decoded.has_error()) {
        return;
      }
      auto length = decoded.value().size();
      signature.base58_length = length;
      signature.families.insert(registry::EncodingFamily::BASE58);
      if (length >= kMinSs58Length) {
        signature.families.insert(registry::EncodingFamily::SS58);
      }
      if (length >= kMinBase58CheckLength) {
        signature.families.insert(registry::EncodingFamily::BASE58CHECK);
      }
    }

    void characterizeBech32(InputSignature &signature) {
      // mixed case is a decoding error, reported by the decoder itself
      std::string lowercase = signature.input;
      std::transform(lowercase.begin(),
                     lowercase.end(),
                     lowercase.begin(),
                     [](unsigned char c) { return std::tolower(c); });
      auto parts =
          encoding::splitBech32(lowercase, encoding::kBech32ExtendedMaxLength);
      if (parts.has_error()) {
        return;
      }
      signature.families.insert(registry::EncodingFamily::BECH32);
      signature.bech32_hrp = std::move(parts.value().hrp);
    }
  }  // namespace

  InputSignature characterize(std::string_view raw) {
    InputSignature signature;
    signature.input = std::string{trim(raw)};
    if (signature.input.empty()
        or signature.input.size() > kMaxInputLength) {
      return signature;
    }

    signature.has_0x_prefix = startsWith0x(signature.input);

    characterizeHex(signature);
    characterizeBase58(signature);
    characterizeBech32(signature);
    return signature;
  }

}  // namespace foxchain::input
