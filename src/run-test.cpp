/* Copyright (c) 2025 The propstore authors */

#include <chrono>
#include <iostream>
#include <propstore/common/logger.hpp>
#include <propstore/common/test.hpp>

int main(const int argc, const char **argv)
{
    using namespace propstore;
    if (argc >= 2) {
        std::cerr << fmt::format("using test-filter mask: {}\n", argv[1]);
        boost::ut::cfg<boost::ut::override> = { .filter = argv[1] };
    }
    const auto start = std::chrono::steady_clock::now();
    const bool res = boost::ut::cfg<boost::ut::override>.run();
    const std::chrono::duration<double> duration = std::chrono::steady_clock::now() - start;
    logger::info("run-test took {:.3f} secs", duration.count());
    return res ? 1 : 0;
}
