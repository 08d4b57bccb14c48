// tests/test_framework/test_entrypoint.cpp
/**
 * @file test_entrypoint.cpp
 * @brief Main entry point of leapcal_tests.
 *
 * Runs GoogleTest with a SummaryPrinter appended to the default listeners, then
 * drains the global Logger. Tests never call Logger::shutdown() in-process: the
 * logger cannot be restarted, so the one shutdown happens here.
 *
 * Exit status is 0 when every test passed and 1 otherwise.
 */
#include "test_entrypoint.h"
#include "lcal_service.hpp"

#include <iostream>

void SummaryPrinter::OnTestProgramEnd(const ::testing::UnitTest &unit_test)
{
    std::cout << "\nTests run: " << unit_test.test_to_run_count() << '\n'
              << "Failures: " << unit_test.failed_test_count() << '\n'
              << "Errors: 0\n"
              << "Skipped: " << unit_test.skipped_test_count() << '\n'
              << std::flush;
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);

    // Listener ownership passes to GoogleTest.
    ::testing::UnitTest::GetInstance()->listeners().Append(new SummaryPrinter);

    const int result = RUN_ALL_TESTS();

    leapcal::utils::Logger::instance().shutdown();
    return result == 0 ? 0 : 1;
}
