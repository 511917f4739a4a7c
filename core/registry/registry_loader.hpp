/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <memory>
#include <string>

#include <boost/optional.hpp>
#include <boost/property_tree/ptree.hpp>

#include "log/logger.hpp"
#include "outcome/outcome.hpp"
#include "registry/chain_registry.hpp"

namespace foxchain::registry {

  /**
   * Builds chain registry from JSON metadata:
   * {"chains": [{"id", "name", "group", "primary", "formats": [...],
   * "derivations": [...]}]}
   */
  class RegistryLoader {
   public:
    enum class Error {
      PARSER_ERROR = 1,
      MISSING_ENTRY,
      UNKNOWN_ENCODING,
      UNKNOWN_KEY_TYPE,
      UNKNOWN_STEP,
      INVALID_VALUE,
    };

    static outcome::result<std::shared_ptr<const ChainRegistry>> loadFrom(
        const std::string &path);

    static outcome::result<std::shared_ptr<const ChainRegistry>>
    loadFromString(const std::string &json);

   private:
    using Tree = boost::property_tree::ptree;

    RegistryLoader();

    outcome::result<std::shared_ptr<const ChainRegistry>> load(
        const Tree &tree) const;

    outcome::result<ChainDescriptor> loadChain(const Tree &tree) const;
    outcome::result<AddressFormat> loadFormat(const Tree &tree) const;
    outcome::result<DerivationSpec> loadDerivation(const Tree &tree) const;
    outcome::result<PipelineStep> loadStep(const Tree &tree) const;
    outcome::result<OutputEncoder> loadEncoder(const Tree &tree) const;

    template <typename T>
    outcome::result<std::decay_t<T>> ensure(std::string_view entry_name,
                                            boost::optional<T> opt_entry) const {
      if (not opt_entry) {
        logger_->error("Required '{}' entry not found in the chain registry",
                       entry_name);
        return Error::MISSING_ENTRY;
      }
      return opt_entry.value();
    }

    /**
     * Reads entry {@param name} of {@param tree} as {@tparam T}, or
     * {@param fallback} when the entry is absent
     */
    template <typename T>
    outcome::result<T> valueOr(const Tree &tree,
                               const std::string &name,
                               T fallback) const {
      auto entry = tree.get_child_optional(name);
      if (not entry) {
        return fallback;
      }
      auto value = entry->get_value_optional<T>();
      if (not value) {
        logger_->error("Entry '{}' has invalid value '{}'",
                       name,
                       entry->get_value<std::string>());
        return Error::INVALID_VALUE;
      }
      return value.value();
    }

    template <typename T>
    outcome::result<T> value(const Tree &tree, const std::string &name) const {
      OUTCOME_TRY(entry, ensure(name, tree.get_child_optional(name)));
      auto value = entry.get_value_optional<T>();
      if (not value) {
        logger_->error("Entry '{}' has invalid value '{}'",
                       name,
                       entry.get_value<std::string>());
        return Error::INVALID_VALUE;
      }
      return value.value();
    }

    log::Logger logger_;
  };

}  // namespace foxchain::registry

OUTCOME_HPP_DECLARE_ERROR(foxchain::registry, RegistryLoader::Error);
