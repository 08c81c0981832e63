/* This file is part of Static CBOR project
 * Copyright (c) 2022-2023 Alex Sierkov (alex dot sierkov at gmail dot com)
 * Copyright (c) 2024-2025 R2 Rationality OÜ (info at r2rationality dot com)
 * This code is distributed under the license specified in:
 * the LICENSE file at the root of the project */
#include <array>
#include <cstdlib>
#include <sc/cbor/decoder.hpp>
#include <sc/cbor/encoder.hpp>

// Every successfully decoded item must reencode into exactly encoded_size bytes,
// and decoding the reencoded bytes must produce an equal value.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, const size_t size)
{
    using namespace static_cbor;
    static std::array<cbor::value, 0x1000> arena {};
    static std::array<cbor::value, 0x1000> arena2 {};
    static std::array<uint8_t, 0x20000> out {};
    const auto res = cbor::decode(buffer { data, size }, arena);
    if (res.has_error())
        return 0;
    const auto &dec = res.value();
    const auto sz = cbor::encoded_size(dec.root);
    if (sz > out.size())
        return 0;
    const auto enc_res = cbor::encode(dec.root, out);
    if (!enc_res || enc_res.value() != sz)
        std::abort();
    const auto res2 = cbor::decode(buffer { out.data(), sz }, arena2);
    if (!res2 || !(res2.value().root == dec.root) || res2.value().bytes_consumed != sz)
        std::abort();
    return 0;
}
