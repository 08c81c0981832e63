/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <sc/cli.hpp>
#include <sc/cli/common.hpp>
#include <sc/file.hpp>

namespace static_cbor::cli::validate {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "validate";
            cmd.desc = "check that a file is a sequence of well-formed CBOR items";
            cmd.args.expect({ "<path>" });
            common::add_opts(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto &path = args.at(0);
            const auto data = file::read(path);
            const auto num_items = common::decode_all(data, common::arena_size(opts),
                [&](const size_t, const size_t, const cbor::value &, const buffer) {
                });
            logger::info("{}: {} valid items in {} bytes", path, num_items, data.size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
