/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <sc/cbor/stringify.hpp>
#include <sc/cli.hpp>
#include <sc/cli/common.hpp>
#include <sc/file.hpp>

namespace static_cbor::cli::inspect {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "inspect";
            cmd.desc = "decode all CBOR items in a file and print them in a human-readable form";
            cmd.args.expect({ "<path>" });
            cmd.opts.try_emplace("hex", "interpret the argument as a hex-encoded byte string instead of a file path");
            common::add_opts(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto data = opts.contains("hex") ? uint8_vector::from_hex(args.at(0)) : file::read(args.at(0));
            const auto &cfg = static_cbor::config::get();
            const cbor::stringify_config str_cfg { cfg.max_depth, cfg.max_seq_to_expand };
            const auto num_items = common::decode_all(data, common::arena_size(opts),
                [&](const size_t idx, const size_t offset, const cbor::value &item, const buffer raw) {
                    fmt::print("ITEM {} at offset {} ({} bytes): {}\n", idx, offset, raw.size(), cbor::stringify(item, str_cfg));
                });
            logger::info("decoded {} items from {} bytes", num_items, data.size());
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
