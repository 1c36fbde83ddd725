/**
 * Copyright Quadrivium LLC
 * All Rights Reserved
 * SPDX-License-Identifier: Apache-2.0
 */

#include <cstdlib>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <injaddr/address/address_converter_impl.hpp>
#include <injaddr/log/configurator.hpp>
#include <injaddr/log/logger.hpp>

namespace {
  const std::string logger_config(R"(
# ----------------
sinks:
  - name: console
    type: console
    color: true
    latency: 0
groups:
  - name: main
    sink: console
    level: info
    children:
      - name: injaddr
# ----------------
  )");

  enum class Mode { AUTO, BATCH, EVM_TO_TARGET, TARGET_TO_EVM, TO_PREFIX };

  struct Options {
    Mode mode = Mode::AUTO;
    std::string prefix;
    std::vector<std::string> addresses;
  };

  void printUsage(const char *name) {
    fmt::print(stderr,
               "Usage: {} [--batch | --evm-to-inj | --inj-to-evm | "
               "--to-prefix PREFIX] ADDRESS...\n",
               name);
  }

  std::optional<Options> parseOptions(int argc, char *argv[]) {
    Options options;
    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];  // NOLINT
      if (arg == "--batch") {
        options.mode = Mode::BATCH;
      } else if (arg == "--evm-to-inj") {
        options.mode = Mode::EVM_TO_TARGET;
      } else if (arg == "--inj-to-evm") {
        options.mode = Mode::TARGET_TO_EVM;
      } else if (arg == "--to-prefix") {
        if (i + 1 == argc) {
          return std::nullopt;
        }
        options.mode = Mode::TO_PREFIX;
        options.prefix = argv[++i];  // NOLINT
      } else if (arg.starts_with("--")) {
        return std::nullopt;
      } else {
        options.addresses.emplace_back(std::move(arg));
      }
    }
    if (options.addresses.empty()) {
      return std::nullopt;
    }
    return options;
  }

  void printResult(const injaddr::address::ConversionResult &result) {
    if (result.source_chain_prefix) {
      fmt::print("{} -> {} {} ({}:{})\n",
                 result.input,
                 result.injective_address,
                 result.evm_address,
                 result.source_type,
                 *result.source_chain_prefix);
    } else {
      fmt::print("{} -> {} {} ({})\n",
                 result.input,
                 result.injective_address,
                 result.evm_address,
                 result.source_type);
    }
  }

  void printFailure(std::string_view input,
                    const injaddr::address::ConversionFailure &failure) {
    fmt::print(stderr, "{} -> error: {}\n", input, failure);
  }
}  // namespace

int main(int argc, char *argv[]) {
  using injaddr::address::AddressConverterImpl;
  using injaddr::address::AddressResult;
  using injaddr::address::ConversionResult;

  // prepare log system
  auto logging_system = std::make_shared<soralog::LoggingSystem>(
      std::make_shared<soralog::ConfiguratorFromYAML>(
          // Original injaddr logging config
          std::make_shared<injaddr::log::Configurator>(),
          // Additional logging config for application
          logger_config));
  auto r = logging_system->configure();
  if (not r.message.empty()) {
    (r.has_error ? std::cerr : std::cout) << r.message << std::endl;
  }
  if (r.has_error) {
    exit(EXIT_FAILURE);
  }

  injaddr::log::setLoggingSystem(logging_system);
  if (std::getenv("TRACE_DEBUG") != nullptr) {
    injaddr::log::setLevelOfGroup(injaddr::log::defaultGroupName,
                                  soralog::Level::DEBUG);
  } else {
    injaddr::log::setLevelOfGroup(injaddr::log::defaultGroupName,
                                  soralog::Level::WARN);
  }

  auto log = injaddr::log::createLogger("Convert", injaddr::log::cliGroupName);

  auto options = parseOptions(argc, argv);
  if (not options) {
    log->error("Invalid command line");
    printUsage(argv[0]);  // NOLINT
    std::exit(EXIT_FAILURE);
  }

  AddressConverterImpl converter;
  size_t failed = 0;

  if (options->mode == Mode::BATCH) {
    auto report = converter.convertBatch(options->addresses);
    if (report.has_error()) {
      fmt::print(stderr, "batch rejected: {}\n", report.error());
      std::exit(EXIT_FAILURE);
    }
    for (const auto &result : report.value().successes) {
      printResult(result);
    }
    for (const auto &failure : report.value().failures) {
      printFailure(failure.input, failure.error);
    }
    failed = report.value().failures.size();
    SL_DEBUG(log,
             "converted {} of {} addresses",
             report.value().total(),
             options->addresses.size());
    return failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
  }

  auto convert =
      [&](const std::string &address) -> AddressResult<ConversionResult> {
    switch (options->mode) {
      case Mode::EVM_TO_TARGET:
        return converter.convertFromEvm(address);
      case Mode::TARGET_TO_EVM:
        return converter.convertFromTarget(address);
      default:
        return converter.convertAddress(address);
    }
  };

  for (const auto &address : options->addresses) {
    auto result = convert(address);
    if (result.has_error()) {
      printFailure(address, result.error());
      ++failed;
      continue;
    }
    if (options->mode != Mode::TO_PREFIX) {
      printResult(result.value());
      continue;
    }
    auto foreign = converter.targetToForeign(result.value().injective_address,
                                             options->prefix);
    if (foreign.has_error()) {
      printFailure(address, foreign.error());
      ++failed;
      continue;
    }
    fmt::print("{} -> {}\n", address, foreign.value());
  }

  return failed == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
}
