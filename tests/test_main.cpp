/* SPDX-FileCopyrightText: 2025 CubeSphereNet Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include "core/logger.hpp"
#include <gtest/gtest.h>
#include <torch/torch.h>

int main(int argc, char** argv) {
    // Warnings and above only; layer construction logs at debug level
    csn::core::Logger::get().init(csn::core::LogLevel::Warn);

    ::testing::InitGoogleTest(&argc, argv);

    // Fixed seed so initializer statistics are reproducible
    torch::manual_seed(42);

    return RUN_ALL_TESTS();
}
