/* This file is part of the Thor SDK project.
 * Copyright (c) 2025 Thor SDK contributors
 * This code is distributed under the license specified in the LICENSE file. */

#include <thor/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace thor_sdk;
    return cli::run(argc, argv);
}
