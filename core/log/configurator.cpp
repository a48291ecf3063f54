/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "log/configurator.hpp"

#include <boost/program_options.hpp>

OUTCOME_CPP_DEFINE_CATEGORY(dynpoa::log, ConfiguratorError, e) {
  using E = dynpoa::log::ConfiguratorError;
  switch (e) {
    case E::NO_SUCH_CONFIG_FILE:
      return "Logging config given by --logcfg is not a regular file";
    case E::MALFORMED_ARGUMENTS:
      return "Option --logcfg must be given once with a path";
  }
  return "Unknown log::ConfiguratorError";
}

namespace dynpoa::log {

  namespace {
    const std::string kGroupTree(R"(
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
      - name: dynpoa
        children:
          - name: application
          - name: authority
          - name: consensus
            children:
              - name: timeline
              - name: poa
              - name: block_validator
)");
  }  // namespace

  Configurator::Configurator() : ConfiguratorFromYAML(kGroupTree) {}

  Configurator::Configurator(std::shared_ptr<soralog::Configurator> previous)
      : ConfiguratorFromYAML(std::move(previous), kGroupTree) {}

  Configurator::Configurator(std::filesystem::path path)
      : ConfiguratorFromYAML(std::make_shared<Configurator>(), std::move(path)) {
  }

  outcome::result<std::optional<std::filesystem::path>>
  Configurator::findConfigFile(int argc, const char **argv) {
    namespace po = boost::program_options;
    po::options_description desc;
    // `--log` is declared so that its values are not taken as options
    desc.add_options()                             //
        ("logcfg", po::value<std::string>())       //
        ("log,l", po::value<std::vector<std::string>>());

    po::variables_map vm;
    try {
      po::store(po::command_line_parser(argc, argv)
                    .options(desc)
                    .allow_unregistered()
                    .run(),
                vm);
    } catch (const po::error &) {
      return ConfiguratorError::MALFORMED_ARGUMENTS;
    }

    auto it = vm.find("logcfg");
    if (it == vm.end()) {
      return std::optional<std::filesystem::path>{};
    }
    std::filesystem::path path = it->second.as<std::string>();
    if (not std::filesystem::is_regular_file(path)) {
      return ConfiguratorError::NO_SUCH_CONFIG_FILE;
    }
    return std::optional<std::filesystem::path>{std::move(path)};
  }

}  // namespace dynpoa::log
