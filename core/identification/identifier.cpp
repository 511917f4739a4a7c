/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "identification/identifier.hpp"

#include <algorithm>
#include <map>

#include "crypto/hasher/hasher_impl.hpp"
#include "crypto/secp256k1/secp256k1_provider_impl.hpp"
#include "identification/confidence.hpp"
#include "input/input_characterizer.hpp"

namespace foxchain::identification {

  Identifier::Identifier(
      std::shared_ptr<const registry::ChainRegistry> registry,
      std::shared_ptr<crypto::Hasher> hasher,
      std::shared_ptr<crypto::Secp256k1Provider> secp256k1_provider)
      : registry_{registry},
        address_resolver_{registry, hasher},
        public_key_resolver_{std::move(registry),
                             std::move(hasher),
                             std::move(secp256k1_provider)},
        logger_{log::createLogger("Identifier", "identification")} {}

  outcome::result<IdentificationResult> Identifier::identify(
      std::string_view input) const {
    auto signature = input::characterize(input);
    if (signature.input.empty()) {
      return IdentifyError::EMPTY_INPUT;
    }
    if (signature.input.size() > input::kMaxInputLength) {
      SL_DEBUG(logger_,
               "Input of {} characters is too long to identify",
               signature.input.size());
      return IdentifyError::INVALID_LENGTH;
    }

    auto addresses = address_resolver_.resolve(signature);
    if (not addresses.matches.empty()) {
      return rank(addresses.matches);
    }

    auto keys = public_key_resolver_.resolve(signature);
    if (not keys.matches.empty()) {
      return rank(keys.matches);
    }

    auto &rejections = addresses.rejections;
    rejections.insert(
        rejections.end(), keys.rejections.begin(), keys.rejections.end());
    auto reason = mostSpecific(rejections);
    SL_DEBUG(logger_,
             "Input '{}' is not identified: {}",
             signature.input,
             make_error_code(reason).message());
    return reason;
  }

  IdentificationResult Identifier::rank(
      const std::vector<resolution::Match> &matches) const {
    std::map<std::string_view, size_t> group_sizes;
    for (auto &match : matches) {
      ++group_sizes[match.chain->group];
    }

    struct Ranked {
      const resolution::Match *match;
      double confidence;
      size_t index;
    };
    std::vector<Ranked> ranked;
    ranked.reserve(matches.size());
    for (auto &match : matches) {
      const bool shared = group_sizes[match.chain->group] > 1;
      ranked.push_back({
          .match = &match,
          .confidence =
              confidenceOf(match.evidence, shared, match.chain->primary),
          .index = registry_->indexOf(*match.chain),
      });
    }
    std::sort(ranked.begin(), ranked.end(), [](const auto &a, const auto &b) {
      if (a.confidence != b.confidence) {
        return a.confidence > b.confidence;
      }
      return a.index < b.index;
    });

    IdentificationResult result;
    result.normalized = ranked.front().match->normalized;
    result.candidates.reserve(ranked.size());
    for (auto &r : ranked) {
      result.candidates.push_back({
          .chain = r.match->chain->id,
          .kind = r.match->kind,
          .encodings = r.match->encodings,
          .confidence = r.confidence,
          .reasoning = r.match->reasoning,
          .derived_address = r.match->derived_address,
      });
    }
    SL_DEBUG(logger_,
             "Identified '{}' with {} candidates, top is {}",
             result.normalized,
             result.candidates.size(),
             result.candidates.front().chain);
    return result;
  }

  outcome::result<IdentificationResult> identify(std::string_view input) {
    static const Identifier identifier{
        registry::defaultRegistry(),
        std::make_shared<crypto::HasherImpl>(),
        std::make_shared<crypto::Secp256k1ProviderImpl>()};
    return identifier.identify(input);
  }

}  // namespace foxchain::identification
