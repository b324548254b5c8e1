/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#pragma once

#include <filesystem>

#include <soralog/impl/configurator_from_yaml.hpp>

namespace lightbabe::log {

  /**
   * Declares the logging groups of lightbabe on top of \param previous
   * configuration. Groups are children of "lightbabe", so the level of the
   * whole library is tuned through log::defaultGroupName.
   * Caller may replace the embedded tree by its own YAML, given as content or
   * as path to a file
   */
  class Configurator : public soralog::ConfiguratorFromYAML {
   public:
    explicit Configurator(std::shared_ptr<soralog::Configurator> previous);

    Configurator(std::shared_ptr<soralog::Configurator> previous,
                 std::string config);

    Configurator(std::shared_ptr<soralog::Configurator> previous,
                 std::filesystem::path path);
  };

}  // namespace lightbabe::log
