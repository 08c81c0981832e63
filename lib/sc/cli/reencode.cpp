/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */

#include <sc/cbor/encoder.hpp>
#include <sc/cli.hpp>
#include <sc/cli/common.hpp>
#include <sc/file.hpp>

namespace static_cbor::cli::reencode {
    struct cmd: command {
        void configure(config &cmd) const override
        {
            cmd.name = "reencode";
            cmd.desc = "rewrite all CBOR items of a file with shortest-form arguments, definite lengths, and double floats";
            cmd.args.expect({ "<in-path>", "<out-path>" });
            common::add_opts(cmd);
        }

        void run(const arguments &args, const options &opts) const override
        {
            const auto &in_path = args.at(0);
            const auto &out_path = args.at(1);
            const auto data = file::read(in_path);
            uint8_vector out {};
            const auto num_items = common::decode_all(data, common::arena_size(opts),
                [&](const size_t idx, const size_t offset, const cbor::value &item, const buffer) {
                    const auto pos = out.size();
                    const auto sz = cbor::encoded_size(item);
                    out.resize(pos + sz);
                    const auto res = cbor::encode(item, write_buffer { out.data() + pos, sz });
                    if (res.has_error())
                        throw error("item #{} at offset {} cannot be encoded: {}", idx, offset, res.error().message());
                    if (res.value() != sz)
                        throw error("item #{} at offset {}: encoded {} bytes but expected {}", idx, offset, res.value(), sz);
                });
            file::write(out_path, out);
            logger::info("reencoded {} items: {} bytes in {}, {} bytes in {}", num_items, data.size(), in_path, out.size(), out_path);
        }
    };
    static auto instance = command::reg(std::make_shared<cmd>());
}
