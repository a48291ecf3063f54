/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include "application/impl/app_configuration_impl.hpp"

#include <array>
#include <cstdio>
#include <iostream>
#include <memory>
#include <optional>
#include <utility>

#include <rapidjson/error/en.h>
#include <rapidjson/filereadstream.h>
#include <boost/program_options.hpp>

namespace {
  namespace fs = std::filesystem;
  namespace po = boost::program_options;

  /// Member {@param name} of {@param object}, if present and of type T
  template <typename T>
  std::optional<T> member(const rapidjson::Value &object, const char *name) {
    if (not object.IsObject()) {
      return std::nullopt;
    }
    auto it = object.FindMember(name);
    if (it == object.MemberEnd() or not it->value.Is<T>()) {
      return std::nullopt;
    }
    return it->value.Get<T>();
  }

  /// A string or an array whose string items are taken
  std::vector<std::string> stringList(const rapidjson::Value &object,
                                      const char *name) {
    std::vector<std::string> list;
    if (not object.IsObject()) {
      return list;
    }
    if (auto single = member<const char *>(object, name)) {
      list.emplace_back(*single);
      return list;
    }
    auto it = object.FindMember(name);
    if (it != object.MemberEnd() and it->value.IsArray()) {
      for (auto &item : it->value.GetArray()) {
        if (item.IsString()) {
          list.emplace_back(item.GetString(), item.GetStringLength());
        }
      }
    }
    return list;
  }

  /// Value given on the command line, default values are ignored
  template <typename T>
  std::optional<T> explicitArgument(const po::variables_map &vm,
                                    const char *name) {
    auto it = vm.find(name);
    if (it == vm.end() or it->second.defaulted()) {
      return std::nullopt;
    }
    return it->second.as<T>();
  }
}  // namespace

namespace dynpoa::application {

  AppConfigurationImpl::AppConfigurationImpl(log::Logger logger)
      : logger_(std::move(logger)) {}

  void AppConfigurationImpl::parseGeneral(const rapidjson::Value &segment) {
    if (auto overrides = stringList(segment, "log"); not overrides.empty()) {
      log_overrides_ = std::move(overrides);
    }
  }

  void AppConfigurationImpl::parseBlockchain(const rapidjson::Value &segment) {
    if (auto chain = member<const char *>(segment, "chain")) {
      chain_spec_path_ = *chain;
    }
  }

  void AppConfigurationImpl::parseDevelopment(const rapidjson::Value &segment) {
    blocks_to_produce_ =
        member<unsigned>(segment, "blocks").value_or(blocks_to_produce_);
    print_snapshot_ =
        member<bool>(segment, "print-snapshot").value_or(print_snapshot_);
  }

  bool AppConfigurationImpl::loadConfigFile(const fs::path &path) {
    std::unique_ptr<std::FILE, decltype(&std::fclose)> file(
        std::fopen(path.c_str(), "r"), &std::fclose);
    if (not file) {
      SL_ERROR(logger_,
               "Can not open configuration file {}, "
               "please specify a valid path with -c option",
               path.native());
      return false;
    }

    std::array<char, 1024> buffer{};
    rapidjson::FileReadStream stream(file.get(), buffer.data(), buffer.size());
    rapidjson::Document document;
    document.ParseStream(stream);
    if (document.HasParseError()) {
      SL_ERROR(logger_,
               "Configuration file {} is not valid JSON: {} at offset {}",
               path.native(),
               rapidjson::GetParseError_En(document.GetParseError()),
               document.GetErrorOffset());
      return false;
    }
    if (not document.IsObject()) {
      SL_ERROR(logger_, "Configuration file {} must hold an object",
               path.native());
      return false;
    }

    static const std::array<std::pair<const char *, SegmentParser>, 3>
        kSegments{{
            {"general", &AppConfigurationImpl::parseGeneral},
            {"blockchain", &AppConfigurationImpl::parseBlockchain},
            {"development", &AppConfigurationImpl::parseDevelopment},
        }};
    for (auto &[name, parse] : kSegments) {
      if (auto it = document.FindMember(name); it != document.MemberEnd()) {
        (this->*parse)(it->value);
      }
    }
    SL_DEBUG(logger_, "Configuration file {} is applied", path.native());
    return true;
  }

  bool AppConfigurationImpl::validate() const {
    if (chain_spec_path_.empty()) {
      SL_ERROR(logger_,
               "Chain spec is not specified, "
               "please specify it with --chain option");
      return false;
    }
    if (not fs::exists(chain_spec_path_)) {
      SL_ERROR(logger_,
               "Chain spec {} does not exist, "
               "please specify a valid path with --chain option",
               chain_spec_path_.native());
      return false;
    }
    if (blocks_to_produce_ == 0) {
      SL_ERROR(logger_, "Number of blocks to produce must be positive");
      return false;
    }
    return true;
  }

  bool AppConfigurationImpl::initializeFromArgs(int argc, const char **argv) {
    // clang-format off
    po::options_description desc("General options");
    desc.add_options()
        ("help,h", "show this help message")
        ("log,l", po::value<std::vector<std::string>>(),
          "Sets a custom logging filter. Syntax is `<group>=<level>`, e.g. -lpoa=debug.\n"
          "Log levels (most to least verbose) are trace, debug, verbose, info, warn, error, critical, off. By default, all groups log `info`.\n"
          "The global log level can be set with -l<level>.")
        ("config-file,c", po::value<std::string>(), "Filepath to load configuration from.")
        ("logcfg", po::value<std::string>(), "Path to YAML logging configuration")
        ;

    po::options_description blockchain_desc("Blockchain options");
    blockchain_desc.add_options()
        ("chain", po::value<std::string>(), "required, chainspec file path")
        ;

    po::options_description development_desc("Development options");
    development_desc.add_options()
        ("blocks", po::value<uint32_t>()->default_value(kDefaultBlocksToProduce),
          "number of slots to author, each by its scheduled leader")
        ("print-snapshot", po::bool_switch(), "print engine snapshot as JSON on exit")
        ;
    // clang-format on

    desc.add(blockchain_desc).add(development_desc);

    po::variables_map vm;
    try {
      po::store(po::parse_command_line(argc, argv, desc), vm);
      po::notify(vm);
    } catch (const std::exception &e) {
      std::cerr << "Error: " << e.what() << '\n'
                << "Try run with option '--help' for more information"
                << std::endl;
      return false;
    }

    if (vm.count("help") > 0) {
      std::cout << desc << std::endl;
      return false;
    }

    if (auto path = explicitArgument<std::string>(vm, "config-file")) {
      if (not loadConfigFile(*path)) {
        return false;
      }
    }

    if (auto overrides =
            explicitArgument<std::vector<std::string>>(vm, "log")) {
      log_overrides_ = std::move(*overrides);
    }
    if (auto chain = explicitArgument<std::string>(vm, "chain")) {
      chain_spec_path_ = *chain;
    }
    if (auto blocks = explicitArgument<uint32_t>(vm, "blocks")) {
      blocks_to_produce_ = *blocks;
    }
    if (vm["print-snapshot"].as<bool>()) {
      print_snapshot_ = true;
    }

    return validate();
  }

}  // namespace dynpoa::application
