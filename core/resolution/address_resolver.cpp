/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "resolution/address_resolver.hpp"

#include <algorithm>

#include <fmt/format.h>

#include "checksum/base58check.hpp"
#include "checksum/bech32.hpp"
#include "checksum/eip55.hpp"
#include "checksum/ss58.hpp"
#include "common/hexutil.hpp"
#include "encoding/base58.hpp"
#include "resolution/resolution_error.hpp"

namespace foxchain::resolution {

  using registry::EncodingFamily;

  namespace {
    constexpr uint8_t kMaxWitnessVersion = 16;
    constexpr size_t kP2wpkhProgramLength = 20;
    constexpr size_t kP2wshProgramLength = 32;

    template <typename Format, typename Predicate>
    bool anyRegistered(const registry::ChainRegistry &registry,
                       const Predicate &predicate) {
      for (auto &chain : registry.chains()) {
        for (auto &format : chain.formats) {
          if (auto f = std::get_if<Format>(&format); f and predicate(*f)) {
            return true;
          }
        }
      }
      return false;
    }

    /**
     * Witness program of segwit address: the first 5-bit value is the
     * witness version, the rest is the program
     */
    outcome::result<common::Buffer> witnessProgram(
        const checksum::Bech32Decoded &decoded,
        const registry::Bech32Format &format) {
      if (decoded.data.empty()) {
        return ResolutionError::INVALID_WITNESS_PROGRAM;
      }
      const auto version = decoded.data[0];
      if (version > kMaxWitnessVersion) {
        return ResolutionError::INVALID_WITNESS_PROGRAM;
      }
      const auto expected_variant = version == 0
                                      ? checksum::Bech32Variant::BECH32
                                      : checksum::Bech32Variant::BECH32M;
      if (decoded.variant != expected_variant) {
        return ResolutionError::BECH32_VARIANT_MISMATCH;
      }

      OUTCOME_TRY(program,
                  encoding::convertBits(
                      decoded.data.view(1, decoded.data.size() - 1), 5, 8, false));
      if (version == 0 and program.size() != kP2wpkhProgramLength
          and program.size() != kP2wshProgramLength) {
        return ResolutionError::INVALID_WITNESS_PROGRAM;
      }
      if (program.size() < format.min_length
          or program.size() > format.max_length) {
        return ResolutionError::INVALID_WITNESS_PROGRAM;
      }
      return program;
    }

    outcome::result<common::Buffer> bech32Payload(
        const checksum::Bech32Decoded &decoded,
        const registry::Bech32Format &format) {
      if (decoded.variant != checksum::Bech32Variant::BECH32) {
        return ResolutionError::BECH32_VARIANT_MISMATCH;
      }
      OUTCOME_TRY(payload, encoding::convertBits(decoded.data, 5, 8, false));
      if (payload.size() < format.min_length
          or payload.size() > format.max_length) {
        return ResolutionError::LENGTH_MISMATCH;
      }
      return payload;
    }
  }  // namespace

  AddressResolver::AddressResolver(
      std::shared_ptr<const registry::ChainRegistry> registry,
      std::shared_ptr<crypto::Hasher> hasher)
      : registry_{std::move(registry)},
        hasher_{std::move(hasher)},
        logger_{log::createLogger("AddressResolver", "address_resolution")} {}

  Resolution AddressResolver::resolve(
      const input::InputSignature &signature) const {
    Resolution resolution;
    for (auto family : signature.families) {
      switch (family) {
        case EncodingFamily::HEX:
          resolveHex(signature, resolution);
          break;
        case EncodingFamily::BASE58CHECK:
          resolveBase58Check(signature, resolution);
          break;
        case EncodingFamily::BECH32:
          resolveBech32(signature, resolution);
          break;
        case EncodingFamily::BASE58:
          resolveBase58(signature, resolution);
          break;
        case EncodingFamily::SS58:
          resolveSs58(signature, resolution);
          break;
      }
    }

    // one match per chain, the strongest evidence wins and keeps every
    // encoding the chain matched with
    std::vector<Match> unique;
    for (auto &match : resolution.matches) {
      auto it = std::find_if(unique.begin(), unique.end(), [&](const auto &m) {
        return m.chain == match.chain;
      });
      if (it == unique.end()) {
        unique.emplace_back(std::move(match));
        continue;
      }
      auto encodings = std::move(it->encodings);
      encodings.insert(
          encodings.end(), match.encodings.begin(), match.encodings.end());
      if (match.evidence < it->evidence) {
        *it = std::move(match);
      }
      it->encodings = std::move(encodings);
    }
    resolution.matches = std::move(unique);

    for (auto &match : resolution.matches) {
      SL_DEBUG(logger_,
               "Address {} matches chain {}: {}",
               signature.input,
               match.chain->id,
               match.reasoning);
    }
    return resolution;
  }

  template <typename Format>
  AddressResolver::Fitting<Format> AddressResolver::fitting(
      const input::InputSignature &signature) const {
    Fitting<Format> res;
    for (auto chain : registry_->bySignature(signature)) {
      for (auto &format : chain->formats) {
        if (auto f = std::get_if<Format>(&format);
            f and registry::fitsSignature(format, signature)) {
          res.emplace_back(chain, f);
        }
      }
    }
    return res;
  }

  void AddressResolver::reject(Resolution &resolution,
                               EncodingFamily family,
                               std::error_code reason) const {
    SL_DEBUG(logger_,
             "Input is not a valid {} address: {}",
             registry::toString(family),
             reason.message());
    resolution.rejections.emplace_back(reason);
  }

  void AddressResolver::resolveHex(const input::InputSignature &signature,
                                   Resolution &resolution) const {
    auto formats = fitting<registry::HexFormat>(signature);
    if (formats.empty()) {
      if (signature.has_0x_prefix
          and anyRegistered<registry::HexFormat>(
              *registry_, [](const auto &) { return true; })) {
        reject(resolution,
               EncodingFamily::HEX,
               ResolutionError::LENGTH_MISMATCH);
      }
      return;
    }

    auto digits = signature.hexDigits();
    auto bytes = common::unhex(digits);
    if (bytes.has_error()) {
      reject(resolution, EncodingFamily::HEX, bytes.error());
      return;
    }
    const common::BufferView address(bytes.value());

    Evidence evidence = Evidence::LENGTH_ONLY;
    std::string normalized;
    std::string reasoning;
    if (address.size() == checksum::kEvmAddressLength) {
      auto status = checksum::validateEip55(digits, *hasher_);
      if (status.has_error()) {
        reject(resolution, EncodingFamily::HEX, status.error());
        return;
      }
      normalized = checksum::toEip55(address, *hasher_);
      if (status.value() == checksum::Eip55Status::CHECKSUMMED) {
        evidence = Evidence::CHECKSUM;
        reasoning = "Hex address with valid EIP-55 checksum";
      } else {
        evidence = Evidence::UNCHECKSUMMED;
        reasoning = "Single-case hex address, EIP-55 checksum not present";
      }
    } else {
      normalized = common::hex_lower_0x(address);
      reasoning = fmt::format("Hex string of {} bytes", address.size());
    }
    if (not signature.has_0x_prefix) {
      normalized.erase(0, 2);
    }

    for (auto &[chain, format] : formats) {
      resolution.matches.push_back({
          .chain = chain,
          .kind = InputKind::ADDRESS,
          .encodings = {EncodingFamily::HEX},
          .evidence = evidence,
          .reasoning = reasoning,
          .normalized = normalized,
      });
    }
  }

  void AddressResolver::resolveBase58Check(
      const input::InputSignature &signature, Resolution &resolution) const {
    auto formats = fitting<registry::Base58CheckFormat>(signature);

    auto decoded = checksum::decodeBase58Check(signature.input, *hasher_);
    if (decoded.has_error()) {
      // random Base58 text fails this checksum, only shaped input is rejected
      if (not formats.empty()) {
        reject(resolution, EncodingFamily::BASE58CHECK, decoded.error());
      }
      return;
    }
    auto &bytes = decoded.value();
    const auto version = bytes[0];
    const auto payload_length = bytes.size() - 1;
    auto normalized = checksum::encodeBase58Check(bytes, *hasher_);

    bool matched = false;
    for (auto &[chain, format] : formats) {
      auto it = std::find_if(
          format->versions.begin(),
          format->versions.end(),
          [&](const auto &v) { return v.value == version; });
      if (it == format->versions.end()
          or payload_length != format->payload_length) {
        continue;
      }
      matched = true;
      resolution.matches.push_back({
          .chain = chain,
          .kind = InputKind::ADDRESS,
          .encodings = {EncodingFamily::BASE58CHECK},
          .evidence = Evidence::CHECKSUM,
          .reasoning = fmt::format(
              "Base58Check {} address with version byte 0x{:02x}, checksum "
              "verified",
              it->kind,
              version),
          .normalized = normalized,
      });
    }
    if (matched) {
      return;
    }

    const bool version_known = anyRegistered<registry::Base58CheckFormat>(
        *registry_, [&](const registry::Base58CheckFormat &f) {
          return std::any_of(f.versions.begin(),
                             f.versions.end(),
                             [&](const auto &v) { return v.value == version; });
        });
    reject(resolution,
           EncodingFamily::BASE58CHECK,
           version_known ? ResolutionError::LENGTH_MISMATCH
                         : ResolutionError::UNKNOWN_PREFIX);
  }

  void AddressResolver::resolveBech32(const input::InputSignature &signature,
                                      Resolution &resolution) const {
    auto formats = fitting<registry::Bech32Format>(signature);
    const bool hrp_known = anyRegistered<registry::Bech32Format>(
        *registry_, [&](const registry::Bech32Format &f) {
          return std::find(f.hrps.begin(), f.hrps.end(), signature.bech32_hrp)
              != f.hrps.end();
        });

    size_t max_length = formats.empty() ? encoding::kBech32ExtendedMaxLength
                                        : encoding::kBech32MaxLength;
    for (auto &[_, format] : formats) {
      max_length = std::max(max_length, format->max_string_length);
    }
    auto decoded = checksum::decodeBech32(signature.input, max_length);
    if (decoded.has_error()) {
      // separator and charset alone are weak hints, unknown HRP is no claim
      if (hrp_known) {
        reject(resolution, EncodingFamily::BECH32, decoded.error());
      }
      return;
    }
    auto &address = decoded.value();

    if (formats.empty()) {
      reject(resolution,
             EncodingFamily::BECH32,
             hrp_known ? ResolutionError::LENGTH_MISMATCH
                       : ResolutionError::UNKNOWN_PREFIX);
      return;
    }

    auto normalized =
        checksum::encodeBech32(address.hrp, address.data, address.variant);
    for (auto &[chain, format] : formats) {
      auto payload = format->segwit ? witnessProgram(address, *format)
                                    : bech32Payload(address, *format);
      if (payload.has_error()) {
        reject(resolution, EncodingFamily::BECH32, payload.error());
        continue;
      }
      resolution.matches.push_back({
          .chain = chain,
          .kind = InputKind::ADDRESS,
          .encodings = {EncodingFamily::BECH32},
          .evidence = Evidence::CHECKSUM,
          .reasoning =
              format->segwit
                  ? fmt::format(
                      "Segwit v{} address with HRP '{}', {}-byte witness "
                      "program",
                      address.data[0],
                      address.hrp,
                      payload.value().size())
                  : fmt::format("Bech32 address with HRP '{}', {}-byte payload",
                                address.hrp,
                                payload.value().size()),
          .normalized = normalized,
      });
    }
  }

  void AddressResolver::resolveBase58(const input::InputSignature &signature,
                                      Resolution &resolution) const {
    auto formats = fitting<registry::Base58Format>(signature);
    if (formats.empty()) {
      return;
    }

    auto decoded = encoding::decodeBase58(signature.input);
    if (decoded.has_error()) {
      reject(resolution, EncodingFamily::BASE58, decoded.error());
      return;
    }
    auto normalized = encoding::encodeBase58(decoded.value());
    for (auto &[chain, format] : formats) {
      resolution.matches.push_back({
          .chain = chain,
          .kind = InputKind::ADDRESS,
          .encodings = {EncodingFamily::BASE58},
          .evidence = Evidence::LENGTH_ONLY,
          .reasoning = fmt::format(
              "Base58 string of {} bytes without checksum, matched by length",
              decoded.value().size()),
          .normalized = normalized,
      });
    }
  }

  void AddressResolver::resolveSs58(const input::InputSignature &signature,
                                    Resolution &resolution) const {
    auto formats = fitting<registry::Ss58Format>(signature);

    auto decoded = checksum::decodeSs58(signature.input, *hasher_);
    if (decoded.has_error()) {
      if (not formats.empty()) {
        reject(resolution, EncodingFamily::SS58, decoded.error());
      }
      return;
    }
    auto &address = decoded.value();

    auto normalized =
        checksum::encodeSs58(address.prefix, address.account, *hasher_);
    if (normalized.has_error()) {
      reject(resolution, EncodingFamily::SS58, normalized.error());
      return;
    }

    bool matched = false;
    for (auto &[chain, format] : formats) {
      if (format->prefix != address.prefix
          or std::find(format->account_lengths.begin(),
                       format->account_lengths.end(),
                       address.account.size())
                 == format->account_lengths.end()) {
        continue;
      }
      matched = true;
      resolution.matches.push_back({
          .chain = chain,
          .kind = InputKind::ADDRESS,
          .encodings = {EncodingFamily::SS58},
          .evidence = Evidence::CHECKSUM,
          .reasoning = fmt::format(
              "SS58 address with network prefix {}, checksum verified",
              address.prefix),
          .normalized = normalized.value(),
      });
    }
    if (matched) {
      return;
    }

    const bool prefix_known = anyRegistered<registry::Ss58Format>(
        *registry_, [&](const registry::Ss58Format &f) {
          return f.prefix == address.prefix;
        });
    reject(resolution,
           EncodingFamily::SS58,
           prefix_known ? ResolutionError::LENGTH_MISMATCH
                        : ResolutionError::UNKNOWN_PREFIX);
  }

}  // namespace foxchain::resolution
