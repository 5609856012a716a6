//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "gtest_printer.hpp"

#include <gtest/gtest.h>

#include <memory>

/// Shared by all test executables; each one logs into `./<executable name>.log`.
///
int main(int argc, char** const argv)
{
    netcfgd::GtestPrinter::setupLogging(argc, argv);

    testing::InitGoogleTest(&argc, argv);

    // GoogleTest takes ownership of the listener.
    testing::UnitTest::GetInstance()->listeners().Append(std::make_unique<netcfgd::GtestPrinter>().release());

    return RUN_ALL_TESTS();
}
