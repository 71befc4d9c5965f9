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
 * @brief Entry point of the `mintid` command line tool.
 *
 * @details
 * Three modes share one binary:
 * 1. **Generate** (default): print COUNT identifiers of the chosen version.
 * 2. **Parse**: decode each argument and report its fields.
 * 3. **Bench**: measure v4/v7 throughput from N threads against one pool.
 */

#include "mintid/core/codec.hpp"
#include "mintid/core/errors.hpp"
#include "mintid/gen/generator.hpp"
#include "mintid/infra/logger.hpp"
#include "mintid/infra/worker_pool.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace {

enum class Mode { Generate, Parse, Bench };
enum class Kind { V4, V7, V7Lazy };

/**
 * @brief Prints usage instructions to stdout.
 */
void print_help(const char* binary_name)
{
    std::cout << "Usage: " << binary_name << " [COUNT] [--v4|--v7|--v7-lazy] [--format FMT]\n"
              << "       " << binary_name << " --parse TEXT...\n"
              << "       " << binary_name << " --bench THREADS COUNT\n"
              << "Options:\n"
              << "  COUNT         Number of identifiers to print (Default: 1)\n"
              << "  --v4          Random identifiers (Default)\n"
              << "  --v7          Time-ordered identifiers, monotonic per shard\n"
              << "  --v7-lazy     Time-ordered identifiers with a random tail\n"
              << "  --format FMT  canonical | upper | hex | HEX | braced | urn\n"
              << "  --parse       Decode each TEXT and print its fields\n"
              << "  --bench       Generate COUNT v4 and v7 ids on THREADS workers\n"
              << "  --help        Show this help message\n"
              << "Environment:\n"
              << "  MINTID_LOG_LEVEL  trace | debug | info | warn | error | fatal\n";
}

mintid::core::Format parse_format(const std::string& name)
{
    if (name == "canonical")
        return mintid::core::Format::Canonical;
    if (name == "upper")
        return mintid::core::Format::CanonicalUpper;
    if (name == "hex")
        return mintid::core::Format::Hex;
    if (name == "HEX")
        return mintid::core::Format::HexUpper;
    if (name == "braced")
        return mintid::core::Format::Braced;
    if (name == "urn")
        return mintid::core::Format::Urn;
    throw std::invalid_argument("unknown format '" + name + "'");
}

mintid::core::Uuid generate(mintid::gen::Generator& gen, Kind kind)
{
    switch (kind) {
    case Kind::V7:
        return gen.new_v7();
    case Kind::V7Lazy:
        return gen.new_v7_lazy();
    case Kind::V4:
        break;
    }
    return gen.new_v4();
}

/**
 * @brief Prints the decoded fields of every input, one block per argument.
 *
 * @return int Number of inputs that failed to parse.
 */
int run_parse(const std::vector<std::string>& inputs)
{
    int failures = 0;
    for (const std::string& text : inputs) {
        try {
            mintid::core::Uuid u = mintid::core::parse(text);
            std::cout << mintid::core::to_string(u) << "\n"
                      << "  version: " << static_cast<int>(u.version()) << "\n"
                      << "  variant: " << mintid::core::variant_name(u.variant()) << "\n";
            if (u.version() == mintid::core::kVersionTimeOrdered) {
                std::cout << "  unix_ms: " << u.unix_millis() << "\n";
            }
        } catch (const mintid::FormatError& e) {
            mintid::infra::Logger::log(mintid::infra::LogLevel::ERROR,
                                       "Parse: " + std::string(e.what()));
            ++failures;
        }
    }
    return failures;
}

/**
 * @brief Runs `count` generations of `kind` split over the pool's workers.
 *
 * @return double Elapsed wall time in seconds.
 */
double bench_kind(mintid::gen::Generator& gen, mintid::infra::WorkerPool& pool, Kind kind,
                  size_t count)
{
    const size_t per_worker = count / pool.size();
    std::atomic<size_t> checksum{0};

    auto start = std::chrono::steady_clock::now();
    for (size_t w = 0; w < pool.size(); ++w) {
        pool.enqueue([&gen, &checksum, kind, per_worker] {
            size_t local = 0;
            for (size_t i = 0; i < per_worker; ++i) {
                local += generate(gen, kind)[15];
            }
            checksum.fetch_add(local, std::memory_order_relaxed);
        });
    }
    pool.wait_idle();
    auto elapsed = std::chrono::steady_clock::now() - start;

    mintid::infra::Logger::log(mintid::infra::LogLevel::DEBUG,
                               "Bench: checksum " + std::to_string(checksum.load()));
    return std::chrono::duration<double>(elapsed).count();
}

void run_bench(size_t threads, size_t count)
{
    mintid::gen::Generator& gen = mintid::gen::Generator::instance();
    mintid::infra::WorkerPool pool(threads);

    mintid::infra::Logger::log(mintid::infra::LogLevel::INFO,
                               "Bench: " + std::to_string(pool.size()) + " threads, " +
                                   std::to_string(gen.shard_count()) + " shards, " +
                                   std::to_string(count) + " ids per version.");

    const std::pair<Kind, const char*> kinds[] = {
        {Kind::V4, "v4"}, {Kind::V7, "v7"}, {Kind::V7Lazy, "v7-lazy"}};
    for (const auto& entry : kinds) {
        double seconds = bench_kind(gen, pool, entry.first, count);
        double rate = seconds > 0 ? static_cast<double>(count) / seconds : 0.0;
        std::cout << entry.second << ": " << seconds * 1000.0 << " ms, "
                  << static_cast<uint64_t>(rate) << " ids/s\n";
    }
}

} // namespace

/**
 * @brief Main Execution Entry Point.
 */
int main(int argc, char* argv[])
{
    Mode mode = Mode::Generate;
    Kind kind = Kind::V4;
    mintid::core::Format format = mintid::core::Format::Canonical;
    size_t count = 1;
    std::vector<std::string> positional;

    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--help" || arg == "-h") {
                print_help(argv[0]);
                return 0;
            } else if (arg == "--v4") {
                kind = Kind::V4;
            } else if (arg == "--v7") {
                kind = Kind::V7;
            } else if (arg == "--v7-lazy") {
                kind = Kind::V7Lazy;
            } else if (arg == "--format") {
                if (i + 1 >= argc) {
                    throw std::invalid_argument("--format requires a value");
                }
                format = parse_format(argv[++i]);
            } else if (arg == "--parse") {
                mode = Mode::Parse;
            } else if (arg == "--bench") {
                mode = Mode::Bench;
            } else {
                positional.push_back(arg);
            }
        }

        switch (mode) {
        case Mode::Parse:
            if (positional.empty()) {
                throw std::invalid_argument("--parse requires at least one TEXT");
            }
            return run_parse(positional) == 0 ? 0 : 1;

        case Mode::Bench: {
            size_t threads = positional.size() > 0 ? std::stoul(positional[0]) : 16;
            size_t total = positional.size() > 1 ? std::stoul(positional[1]) : 1000000;
            run_bench(threads, total);
            return 0;
        }

        case Mode::Generate:
            break;
        }

        if (!positional.empty()) {
            count = std::stoul(positional[0]);
        }

        mintid::gen::Generator& gen = mintid::gen::Generator::instance();
        for (size_t i = 0; i < count; ++i) {
            std::cout << mintid::core::to_string(generate(gen, kind), format) << '\n';
        }

    } catch (const std::exception& e) {
        mintid::infra::Logger::log(mintid::infra::LogLevel::FATAL,
                                   "mintid: " + std::string(e.what()));
        return 1;
    }

    return 0;
}
