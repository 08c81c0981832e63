/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <sc/cli.hpp>

int main(const int argc, const char **argv)
{
    using namespace static_cbor;
    consider_bin_dir(argv[0]);
    return cli::run(argc, argv);
}
