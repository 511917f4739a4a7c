/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "registry/registry_loader.hpp"

#include <limits>
#include <optional>
#include <sstream>

#include <boost/property_tree/json_parser.hpp>

#include "common/hexutil.hpp"

OUTCOME_CPP_DEFINE_CATEGORY(foxchain::registry, RegistryLoader::Error, e) {
  using E = foxchain::registry::RegistryLoader::Error;
  switch (e) {
    case E::PARSER_ERROR:
      return "Internal parser error";
    case E::MISSING_ENTRY:
      return "A required entry is missing in the chain registry";
    case E::UNKNOWN_ENCODING:
      return "Unknown address encoding in the chain registry";
    case E::UNKNOWN_KEY_TYPE:
      return "Unknown public key type in the chain registry";
    case E::UNKNOWN_STEP:
      return "Unknown derivation step in the chain registry";
    case E::INVALID_VALUE:
      return "An entry of the chain registry has invalid value";
  }
  return "Unknown error in RegistryLoader";
}

namespace foxchain::registry {

  namespace pt = boost::property_tree;

  namespace {
    std::optional<KeySerialization> keySerializationFrom(
        std::string_view name) {
      if (name == "given") {
        return KeySerialization::AS_GIVEN;
      }
      if (name == "compressed") {
        return KeySerialization::COMPRESSED;
      }
      if (name == "uncompressed") {
        return KeySerialization::UNCOMPRESSED;
      }
      if (name == "xy") {
        return KeySerialization::UNCOMPRESSED_XY;
      }
      if (name == "raw") {
        return KeySerialization::RAW;
      }
      return std::nullopt;
    }

    std::optional<HashAlgorithm> hashAlgorithmFrom(std::string_view name) {
      if (name == "sha256") {
        return HashAlgorithm::SHA2_256;
      }
      if (name == "sha3_256") {
        return HashAlgorithm::SHA3_256;
      }
      if (name == "keccak256") {
        return HashAlgorithm::KECCAK_256;
      }
      if (name == "ripemd160") {
        return HashAlgorithm::RIPEMD_160;
      }
      if (name == "blake2b256") {
        return HashAlgorithm::BLAKE2B_256;
      }
      return std::nullopt;
    }
  }  // namespace

  RegistryLoader::RegistryLoader()
      : logger_{log::createLogger("RegistryLoader", "registry")} {}

  outcome::result<std::shared_ptr<const ChainRegistry>>
  RegistryLoader::loadFrom(const std::string &path) {
    RegistryLoader loader;
    pt::ptree tree;
    try {
      pt::read_json(path, tree);
    } catch (pt::json_parser_error &e) {
      loader.logger_->error(
          "Parser error: {}, line {}: {}", e.filename(), e.line(), e.message());
      return Error::PARSER_ERROR;
    }
    return loader.load(tree);
  }

  outcome::result<std::shared_ptr<const ChainRegistry>>
  RegistryLoader::loadFromString(const std::string &json) {
    RegistryLoader loader;
    pt::ptree tree;
    try {
      std::istringstream stream{json};
      pt::read_json(stream, tree);
    } catch (pt::json_parser_error &e) {
      loader.logger_->error(
          "Parser error: line {}: {}", e.line(), e.message());
      return Error::PARSER_ERROR;
    }
    return loader.load(tree);
  }

  outcome::result<std::shared_ptr<const ChainRegistry>> RegistryLoader::load(
      const Tree &tree) const {
    OUTCOME_TRY(chains_tree, ensure("chains", tree.get_child_optional("chains")));

    std::vector<ChainDescriptor> chains;
    for (auto &[_, chain_tree] : chains_tree) {
      OUTCOME_TRY(chain, loadChain(chain_tree));
      chains.emplace_back(std::move(chain));
    }
    SL_DEBUG(logger_, "Loaded {} chain descriptors", chains.size());

    auto registry = ChainRegistry::create(std::move(chains));
    if (registry.has_error()) {
      logger_->error("Chain registry is inconsistent: {}",
                     registry.error().message());
    }
    return registry;
  }

  outcome::result<ChainDescriptor> RegistryLoader::loadChain(
      const Tree &tree) const {
    ChainDescriptor chain;
    OUTCOME_TRY(id, value<std::string>(tree, "id"));
    chain.id = std::move(id);
    OUTCOME_TRY(name, valueOr<std::string>(tree, "name", chain.id));
    chain.name = std::move(name);
    OUTCOME_TRY(group, valueOr<std::string>(tree, "group", chain.id));
    chain.group = std::move(group);
    OUTCOME_TRY(primary, valueOr<bool>(tree, "primary", false));
    chain.primary = primary;

    OUTCOME_TRY(formats, ensure("formats", tree.get_child_optional("formats")));
    for (auto &[_, format_tree] : formats) {
      OUTCOME_TRY(format, loadFormat(format_tree));
      chain.formats.emplace_back(std::move(format));
    }

    if (auto derivations = tree.get_child_optional("derivations")) {
      for (auto &[_, derivation_tree] : derivations.value()) {
        OUTCOME_TRY(derivation, loadDerivation(derivation_tree));
        chain.derivations.emplace_back(std::move(derivation));
      }
    }
    return chain;
  }

  outcome::result<AddressFormat> RegistryLoader::loadFormat(
      const Tree &tree) const {
    OUTCOME_TRY(encoding, value<std::string>(tree, "encoding"));

    if (encoding == "hex") {
      HexFormat format;
      OUTCOME_TRY(prefix, valueOr(tree, "prefix", format.require_0x_prefix));
      format.require_0x_prefix = prefix;
      OUTCOME_TRY(length, valueOr(tree, "length", format.length));
      format.length = length;
      return format;
    }

    if (encoding == "base58check") {
      Base58CheckFormat format;
      OUTCOME_TRY(versions,
                  ensure("versions", tree.get_child_optional("versions")));
      for (auto &[_, version_tree] : versions) {
        OUTCOME_TRY(version, value<unsigned>(version_tree, "value"));
        if (version > std::numeric_limits<uint8_t>::max()) {
          logger_->error("Version byte {} is out of range", version);
          return Error::INVALID_VALUE;
        }
        OUTCOME_TRY(kind, valueOr<std::string>(version_tree, "kind", ""));
        format.versions.push_back(
            {static_cast<uint8_t>(version), std::move(kind)});
      }
      OUTCOME_TRY(payload_length,
                  valueOr(tree, "payload_length", format.payload_length));
      format.payload_length = payload_length;
      return format;
    }

    if (encoding == "bech32") {
      Bech32Format format;
      OUTCOME_TRY(hrps, ensure("hrps", tree.get_child_optional("hrps")));
      for (auto &[_, hrp] : hrps) {
        format.hrps.push_back(hrp.get_value<std::string>());
      }
      OUTCOME_TRY(min_length, valueOr(tree, "min_length", format.min_length));
      format.min_length = min_length;
      OUTCOME_TRY(max_length, valueOr(tree, "max_length", format.max_length));
      format.max_length = max_length;
      OUTCOME_TRY(segwit, valueOr(tree, "segwit", format.segwit));
      format.segwit = segwit;
      OUTCOME_TRY(
          max_string_length,
          valueOr(tree, "max_string_length", format.max_string_length));
      format.max_string_length = max_string_length;
      return format;
    }

    if (encoding == "base58") {
      Base58Format format;
      OUTCOME_TRY(min_length, valueOr(tree, "min_length", format.min_length));
      format.min_length = min_length;
      OUTCOME_TRY(max_length, valueOr(tree, "max_length", format.max_length));
      format.max_length = max_length;
      return format;
    }

    if (encoding == "ss58") {
      Ss58Format format;
      OUTCOME_TRY(prefix, value<unsigned>(tree, "prefix"));
      if (prefix > std::numeric_limits<uint16_t>::max()) {
        logger_->error("SS58 prefix {} is out of range", prefix);
        return Error::INVALID_VALUE;
      }
      format.prefix = static_cast<uint16_t>(prefix);
      if (auto lengths = tree.get_child_optional("account_lengths")) {
        format.account_lengths.clear();
        for (auto &[_, length] : lengths.value()) {
          auto account_length = length.get_value_optional<size_t>();
          if (not account_length) {
            logger_->error("Invalid SS58 account length '{}'",
                           length.get_value<std::string>());
            return Error::INVALID_VALUE;
          }
          format.account_lengths.push_back(account_length.value());
        }
      }
      return format;
    }

    logger_->error("Unknown address encoding '{}'", encoding);
    return Error::UNKNOWN_ENCODING;
  }

  outcome::result<DerivationSpec> RegistryLoader::loadDerivation(
      const Tree &tree) const {
    DerivationSpec derivation;

    OUTCOME_TRY(key_type, value<std::string>(tree, "key_type"));
    if (key_type == toString(KeyType::SECP256K1)) {
      derivation.key_type = KeyType::SECP256K1;
    } else if (key_type == toString(KeyType::ED25519)) {
      derivation.key_type = KeyType::ED25519;
    } else {
      logger_->error("Unknown key type '{}'", key_type);
      return Error::UNKNOWN_KEY_TYPE;
    }

    OUTCOME_TRY(steps, ensure("steps", tree.get_child_optional("steps")));
    for (auto &[_, step_tree] : steps) {
      OUTCOME_TRY(pipeline_step, loadStep(step_tree));
      derivation.steps.emplace_back(std::move(pipeline_step));
    }

    OUTCOME_TRY(encoder_tree,
                ensure("encoder", tree.get_child_optional("encoder")));
    OUTCOME_TRY(output_encoder, loadEncoder(encoder_tree));
    derivation.encoder = std::move(output_encoder);
    return derivation;
  }

  outcome::result<PipelineStep> RegistryLoader::loadStep(
      const Tree &tree) const {
    if (tree.size() != 1) {
      logger_->error("Derivation step must have exactly one entry");
      return Error::UNKNOWN_STEP;
    }
    auto &[kind, argument] = tree.front();
    auto text = argument.get_value<std::string>();

    if (kind == "serialize") {
      auto form = keySerializationFrom(text);
      if (not form) {
        logger_->error("Unknown key serialization '{}'", text);
        return Error::INVALID_VALUE;
      }
      return step::SerializeKey{form.value()};
    }
    if (kind == "hash") {
      auto algorithm = hashAlgorithmFrom(text);
      if (not algorithm) {
        logger_->error("Unknown hash algorithm '{}'", text);
        return Error::INVALID_VALUE;
      }
      return step::Hash{algorithm.value()};
    }
    if (kind == "take_first" or kind == "take_last") {
      auto count = argument.get_value_optional<size_t>();
      if (not count) {
        logger_->error("Invalid byte count '{}' of '{}'", text, kind);
        return Error::INVALID_VALUE;
      }
      if (kind == "take_first") {
        return step::TakeFirst{count.value()};
      }
      return step::TakeLast{count.value()};
    }
    if (kind == "prepend") {
      auto bytes = common::unhex(text);
      if (bytes.has_error()) {
        logger_->error("Invalid prepended bytes '{}': {}",
                       text,
                       bytes.error().message());
        return Error::INVALID_VALUE;
      }
      return step::Prepend{common::Buffer{std::move(bytes.value())}};
    }

    logger_->error("Unknown derivation step '{}'", kind);
    return Error::UNKNOWN_STEP;
  }

  outcome::result<OutputEncoder> RegistryLoader::loadEncoder(
      const Tree &tree) const {
    OUTCOME_TRY(type, value<std::string>(tree, "type"));

    if (type == "eip55") {
      return encoder::Eip55{};
    }
    if (type == "base58check") {
      return encoder::Base58Check{};
    }
    if (type == "base58") {
      return encoder::Base58{};
    }
    if (type == "bech32") {
      OUTCOME_TRY(hrp, value<std::string>(tree, "hrp"));
      return encoder::Bech32{std::move(hrp)};
    }
    if (type == "ss58") {
      OUTCOME_TRY(prefix, value<unsigned>(tree, "prefix"));
      if (prefix > std::numeric_limits<uint16_t>::max()) {
        logger_->error("SS58 prefix {} is out of range", prefix);
        return Error::INVALID_VALUE;
      }
      return encoder::Ss58{static_cast<uint16_t>(prefix)};
    }

    logger_->error("Unknown output encoder '{}'", type);
    return Error::UNKNOWN_ENCODING;
  }

}  // namespace foxchain::registry
