/* Copyright (c) 2025 The propstore authors */

#include <propstore/common/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace propstore;
    return cli::run(argc, argv);
}
