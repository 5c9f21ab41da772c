/**
 * @file uln_check.cpp
 * @brief Validate a single Unique Learner Number from the command line
 *
 * Usage:
 *   ./uln-check [--json] <uln>
 *
 * Exit status:
 *   0   valid ULN
 *   1   checksum failure (INVALID_VALUE)
 *   2   malformed input (INVALID_FORMAT)
 *   64  usage error
 *
 * Environment:
 *   ULN_LOG_LEVEL, ULN_LOG_TO_FILE, ULN_LOG_FILE
 */

#include <iostream>
#include <optional>
#include <string>
#include <spdlog/spdlog.h>

#include "uln/config/config_manager.h"
#include "uln/domain/uln.h"
#include "uln/exception/domain_exception.h"
#include "uln/logging/logger.h"
#include "uln/serialization/uln_serializer.h"
#include "uln/validation/uln_validator.h"

using uln::exception::ErrorCode;
using uln::exception::errorCodeToExitStatus;
using uln::exception::errorCodeToString;

namespace {

void printUsage(std::ostream& os) {
    os << "Usage: uln-check [--json] <uln>\n"
       << "  --json   print the validated ULN as JSON\n"
       << "  --help   show this message\n";
}

struct Options {
    bool json = false;
    bool help = false;
    std::optional<std::string> candidate;
};

std::optional<Options> parseArgs(int argc, char* argv[]) {
    Options opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--json") {
            opts.json = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else if (!opts.candidate) {
            opts.candidate = arg;
        } else {
            spdlog::warn("Unexpected argument: {}", arg);
            return std::nullopt;
        }
    }
    return opts;
}

int reject(ErrorCode code, const std::string& message) {
    std::cerr << errorCodeToString(code) << ": " << message << std::endl;
    return errorCodeToExitStatus(code);
}

int checkCandidate(const Options& opts) {
    try {
        // Structural problems are reported separately from checksum failures
        if (!uln::validation::isValidUln(opts.candidate)) {
            spdlog::info("Rejected ULN candidate");
            return reject(ErrorCode::INVALID_VALUE, "Invalid ULN value");
        }

        auto value = uln::domain::Uln::fromString(opts.candidate);
        if (opts.json) {
            std::cout << uln::serialization::toJsonString(value) << std::endl;
        } else {
            std::cout << value << std::endl;
        }
        spdlog::info("Accepted {}", value.toString());
        return 0;

    } catch (const uln::exception::NullInputException& e) {
        printUsage(std::cerr);
        return reject(ErrorCode::NULL_INPUT, e.getMessage());
    } catch (const uln::exception::DomainException& e) {
        auto code = uln::exception::errorCodeFromString(e.getCode());
        return reject(code.value_or(ErrorCode::INVALID_VALUE), e.getMessage());
    }
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    auto& config = uln::config::ConfigManager::getInstance();
    uln::logging::Logger::initialize(
        "uln-check",
        config.getString(uln::config::ConfigManager::LOG_LEVEL,
                         uln::config::ConfigManager::DEFAULT_LOG_LEVEL),
        config.getBool(uln::config::ConfigManager::LOG_TO_FILE, false),
        config.getString(uln::config::ConfigManager::LOG_FILE,
                         uln::config::ConfigManager::DEFAULT_LOG_FILE));

    int status = 0;
    auto opts = parseArgs(argc, argv);
    if (!opts) {
        printUsage(std::cerr);
        status = errorCodeToExitStatus(ErrorCode::NULL_INPUT);
    } else if (opts->help) {
        printUsage(std::cout);
    } else {
        status = checkCandidate(*opts);
    }

    // flush_on(warn) leaves info lines buffered in the file sink
    uln::logging::Logger::flush();
    return status;
}
