/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main.cpp
 * @brief Entry point of the `quid` command-line tool.
 *
 * @details
 * This file contains the `main` function which orchestrates a single command:
 * 1. Option Parsing (`--log-level`, `--help`, `QUID_LOG_LEVEL`).
 * 2. Command Dispatch (`v3`, `v4`, `v5`, `v7`, `inspect`).
 * 3. Output of one canonical identifier per line on stdout.
 */

#include "quid/codec/codec.hpp"
#include "quid/core/error.hpp"
#include "quid/core/uuid.hpp"
#include "quid/gen/id_generator.hpp"
#include "quid/infra/logger.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using quid::codec::Codec;
using quid::core::Uuid;
using quid::gen::IdGenerator;
using quid::infra::LogLevel;
using quid::infra::Logger;

namespace {

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [OPTIONS] COMMAND [ARGS]\n"
              << "Commands:\n"
              << "  v3 NAMESPACE NAME        Name-based identifier (MD5)\n"
              << "  v4 [COUNT]               Random identifier(s) (Default COUNT: 1)\n"
              << "  v5 NAMESPACE NAME        Name-based identifier (SHA-1)\n"
              << "  v7 [UNIX_MILLIS] [COUNT] Time-ordered identifier(s) (Default: now, 1)\n"
              << "  inspect UUID             Show version, variant and v7 timestamp\n"
              << "NAMESPACE is one of dns, url, oid, x500, or any UUID.\n"
              << "Options:\n"
              << "  --log-level LEVEL   trace|debug|info|warn|error|fatal "
                 "(Default: $QUID_LOG_LEVEL or info)\n"
              << "  --help              Show this help message\n";
}

std::optional<Uuid> resolve_namespace(const std::string& name)
{
    if (name == "dns")
        return quid::core::kNamespaceDns;
    if (name == "url")
        return quid::core::kNamespaceUrl;
    if (name == "oid")
        return quid::core::kNamespaceOid;
    if (name == "x500")
        return quid::core::kNamespaceX500;
    return Codec::parse(name);
}

const char* variant_name(quid::core::Variant variant)
{
    switch (variant) {
    case quid::core::Variant::NCS:
        return "NCS";
    case quid::core::Variant::RFC4122:
        return "RFC 4122";
    case quid::core::Variant::Microsoft:
        return "Microsoft";
    case quid::core::Variant::Future:
        return "Future";
    }
    return "unknown";
}

long parse_count(const std::vector<std::string>& args, std::size_t index)
{
    if (args.size() <= index) {
        return 1;
    }
    long count = std::stol(args[index]);
    if (count < 1) {
        throw std::invalid_argument("COUNT must be positive");
    }
    return count;
}

int run_named(const std::vector<std::string>& args, bool sha1)
{
    if (args.size() != 3) {
        Logger::log(LogLevel::ERROR, "Usage: " + args[0] + " NAMESPACE NAME");
        return 1;
    }
    std::optional<Uuid> ns = resolve_namespace(args[1]);
    if (!ns) {
        Logger::log(LogLevel::ERROR, "Invalid namespace: '" + args[1] + "'");
        return 1;
    }
    std::cout << (sha1 ? IdGenerator::v5(*ns, args[2]) : IdGenerator::v3(*ns, args[2])) << "\n";
    return 0;
}

int run_inspect(const std::vector<std::string>& args)
{
    if (args.size() != 2) {
        Logger::log(LogLevel::ERROR, "Usage: inspect UUID");
        return 1;
    }
    std::optional<Uuid> uuid = Codec::parse(args[1]);
    if (!uuid) {
        Logger::log(LogLevel::ERROR, "Invalid UUID: '" + args[1] + "'");
        return 1;
    }

    std::cout << "uuid:    " << *uuid << "\n"
              << "version: " << uuid->version() << "\n"
              << "variant: " << variant_name(uuid->variant()) << "\n";
    if (auto time = uuid->time()) {
        std::cout << "time:    " << time->time_since_epoch().count() << " ms since epoch\n";
    }
    return 0;
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    // 1. Configuration Defaults (environment first, command line wins)
    if (const char* env = std::getenv("QUID_LOG_LEVEL")) {
        if (auto level = Logger::parse_level(env)) {
            Logger::set_level(*level);
        } else {
            Logger::log(LogLevel::WARN, "Config: ignoring unknown QUID_LOG_LEVEL '" +
                                            std::string(env) + "'");
        }
    }

    // 2. Parse Command Line Options
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--help") {
            print_help(argv[0]);
            return 0;
        }
        if (arg == "--log-level") {
            if (i + 1 >= argc) {
                Logger::log(LogLevel::ERROR, "Config: --log-level requires a value");
                return 1;
            }
            auto level = Logger::parse_level(argv[++i]);
            if (!level) {
                Logger::log(LogLevel::ERROR,
                            "Config: unknown log level '" + std::string(argv[i]) + "'");
                return 1;
            }
            Logger::set_level(*level);
            continue;
        }
        args.push_back(arg);
    }

    if (args.empty()) {
        print_help(argv[0]);
        return 1;
    }

    Logger::log(LogLevel::DEBUG, "Config: command '" + args[0] + "' with " +
                                     std::to_string(args.size() - 1) + " argument(s)");

    // 3. Command Dispatch
    try {
        const std::string& command = args[0];
        if (command == "v3") {
            return run_named(args, false);
        }
        if (command == "v5") {
            return run_named(args, true);
        }
        if (command == "v4") {
            long count = parse_count(args, 1);
            for (long i = 0; i < count; ++i) {
                std::cout << IdGenerator::v4() << "\n";
            }
            return 0;
        }
        if (command == "v7") {
            auto now = std::chrono::system_clock::now();
            if (args.size() > 1) {
                now = std::chrono::system_clock::time_point(
                    std::chrono::milliseconds(std::stoll(args[1])));
            }
            long count = parse_count(args, 2);
            for (long i = 0; i < count; ++i) {
                std::cout << IdGenerator::v7(now) << "\n";
            }
            return 0;
        }
        if (command == "inspect") {
            return run_inspect(args);
        }

        Logger::log(LogLevel::ERROR, "Unknown command: " + command);
        print_help(argv[0]);
        return 1;

    } catch (const quid::core::RandomSourceError& e) {
        Logger::log(LogLevel::FATAL, "System: random source unavailable: " + std::string(e.what()));
        return 1;
    } catch (const std::exception& e) {
        Logger::log(LogLevel::FATAL, "System: " + std::string(e.what()));
        return 1;
    }
}
