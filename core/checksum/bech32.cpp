/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "checksum/bech32.hpp"

#include <array>

OUTCOME_CPP_DEFINE_CATEGORY(foxchain::checksum, Bech32ChecksumError, e) {
  using E = foxchain::checksum::Bech32ChecksumError;
  switch (e) {
    case E::INVALID_CHECKSUM:
      return "Bech32 checksum mismatch";
  }
  return "Unknown Bech32 checksum error";
}

namespace foxchain::checksum {

  namespace {
    constexpr uint32_t kBech32Constant = 1;
    constexpr uint32_t kBech32mConstant = 0x2bc830a3;

    constexpr std::array<uint32_t, 5> kGenerator{
        0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3};

    class Polymod {
     public:
      void feed(uint8_t value) {
        uint8_t top = chk_ >> 25;
        chk_ = ((chk_ & 0x1ffffff) << 5) ^ value;
        for (size_t i = 0; i < kGenerator.size(); ++i) {
          if (((top >> i) & 1) != 0) {
            chk_ ^= kGenerator[i];
          }
        }
      }

      /// HRP high bits, zero separator, HRP low bits
      void feedHrp(std::string_view hrp) {
        for (char c : hrp) {
          feed(static_cast<uint8_t>(c) >> 5);
        }
        feed(0);
        for (char c : hrp) {
          feed(static_cast<uint8_t>(c) & 0x1f);
        }
      }

      uint32_t value() const {
        return chk_;
      }

     private:
      uint32_t chk_ = 1;
    };

    uint32_t variantConstant(Bech32Variant variant) {
      switch (variant) {
        case Bech32Variant::BECH32:
          return kBech32Constant;
        case Bech32Variant::BECH32M:
          return kBech32mConstant;
      }
      return kBech32Constant;
    }
  }  // namespace

  std::optional<Bech32Variant> verifyBech32Checksum(
      std::string_view hrp, common::BufferView values) {
    Polymod polymod;
    polymod.feedHrp(hrp);
    for (auto value : values) {
      polymod.feed(value);
    }
    if (polymod.value() == kBech32Constant) {
      return Bech32Variant::BECH32;
    }
    if (polymod.value() == kBech32mConstant) {
      return Bech32Variant::BECH32M;
    }
    return std::nullopt;
  }

  std::string encodeBech32(std::string_view hrp,
                           common::BufferView data,
                           Bech32Variant variant) {
    Polymod polymod;
    polymod.feedHrp(hrp);
    for (auto value : data) {
      polymod.feed(value);
    }
    for (size_t i = 0; i < encoding::kBech32ChecksumLength; ++i) {
      polymod.feed(0);
    }
    const uint32_t mod = polymod.value() ^ variantConstant(variant);

    common::Buffer values{data};
    for (size_t i = 0; i < encoding::kBech32ChecksumLength; ++i) {
      values.putUint8(static_cast<uint8_t>((mod >> (5 * (5 - i))) & 0x1f));
    }
    return encoding::joinBech32(hrp, values);
  }

  outcome::result<Bech32Decoded> decodeBech32(std::string_view str,
                                              size_t max_length) {
    OUTCOME_TRY(parts, encoding::splitBech32(str, max_length));

    auto variant = verifyBech32Checksum(parts.hrp, parts.values);
    if (not variant) {
      return Bech32ChecksumError::INVALID_CHECKSUM;
    }

    parts.values.resize(parts.values.size() - encoding::kBech32ChecksumLength);
    return Bech32Decoded{
        .hrp = std::move(parts.hrp),
        .data = std::move(parts.values),
        .variant = *variant,
    };
  }

}  // namespace foxchain::checksum
