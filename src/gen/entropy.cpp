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
 * @file entropy.cpp
 * @brief Kernel-backed implementation of `EntropySource`.
 */

#include "mintid/gen/entropy.hpp"

#include "mintid/core/errors.hpp"
#include "mintid/infra/logger.hpp"

#include <cerrno>
#include <cstring>
#include <string>
#include <sys/random.h>

namespace mintid::gen {

/**
 * @brief Loops over `getrandom` until `length` bytes have been written.
 *
 * A blocking call (flags = 0): before the kernel pool is initialised this waits,
 * afterwards requests of up to 256 bytes never return short.
 */
void SystemEntropySource::fill(uint8_t* out, size_t length)
{
    size_t filled = 0;
    while (filled < length) {
        ssize_t n = ::getrandom(out + filled, length - filled, 0);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            infra::Logger::log(infra::LogLevel::ERROR,
                               "Entropy: getrandom failed: " + std::string(std::strerror(err)));
            throw EntropyError("uuid: random source failure: " + std::string(std::strerror(err)),
                               err);
        }
        filled += static_cast<size_t>(n);
    }
}

} // namespace mintid::gen
