/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/configurator.hpp"

#include <string_view>

namespace lightbabe::log {

  namespace {
    constexpr std::string_view kGroups = R"(
# ----------------
sinks:
  - name: console
    type: console
    stream: stderr
    thread: name
    color: false
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    is_fallback: true
    children:
      - name: lightbabe
        children:
          - name: consensus
            children:
              - name: babe
                children:
                  - name: header_verifier
                  - name: slot_claim_validator
      - name: others
        children:
          - name: testing
# ----------------
  )";
  }  // namespace

  Configurator::Configurator(std::shared_ptr<soralog::Configurator> previous)
      : ConfiguratorFromYAML(std::move(previous), std::string(kGroups)) {}

  Configurator::Configurator(std::shared_ptr<soralog::Configurator> previous,
                             std::string config)
      : ConfiguratorFromYAML(std::move(previous), std::move(config)) {}

  Configurator::Configurator(std::shared_ptr<soralog::Configurator> previous,
                             std::filesystem::path path)
      : ConfiguratorFromYAML(std::move(previous), std::move(path)) {}

}  // namespace lightbabe::log
