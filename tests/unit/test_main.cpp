#include <gtest/gtest.h>
#include <MiProbe/MiProbe.h>

#include <iostream>

int main(int argc, char** argv) {
    // Print library info
    std::cout << "========================================\n";
    std::cout << "MiProbe Unit Tests\n";
    std::cout << "Version: " << Mi::Probe::GetVersion() << "\n";
    std::cout << "========================================\n\n";

    // Keep test output readable; individual tests capture what they check
    Mi::Probe::Platform::Log::SetLevel(Mi::Probe::Platform::LogLevel::Error);

    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
