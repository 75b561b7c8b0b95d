// Copyright (c) 2025-2026 The Satwire Developers
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "core/serialize.h"

// ---------------------------------------------------------------------------
// Explicit template instantiations for the stream pairings the library
// actually uses: payload encoders write into DataStream or VectorWriter,
// payload decoders read from SpanReader (zero-copy over the frame body).
// ---------------------------------------------------------------------------

namespace core {

// -------------------------------------------------------------------
// CompactSize
// -------------------------------------------------------------------
template void     ser_write_compact_size<DataStream>(
    DataStream&, uint64_t);
template void     ser_write_compact_size<VectorWriter>(
    VectorWriter&, uint64_t);
template uint64_t ser_read_compact_size<DataStream>(DataStream&);
template uint64_t ser_read_compact_size<SpanReader>(SpanReader&);

template size_t ser_read_count<SpanReader>(
    SpanReader&, size_t, const char*);

// -------------------------------------------------------------------
// Primitive writers (DataStream)
// -------------------------------------------------------------------
template void ser_write_u8<DataStream>(DataStream&, uint8_t);
template void ser_write_u16<DataStream>(DataStream&, uint16_t);
template void ser_write_u16_be<DataStream>(DataStream&, uint16_t);
template void ser_write_u32<DataStream>(DataStream&, uint32_t);
template void ser_write_u64<DataStream>(DataStream&, uint64_t);
template void ser_write_i32<DataStream>(DataStream&, int32_t);
template void ser_write_i64<DataStream>(DataStream&, int64_t);
template void ser_write_bytes<DataStream>(
    DataStream&, std::span<const uint8_t>);

// -------------------------------------------------------------------
// Primitive writers (VectorWriter)
// -------------------------------------------------------------------
template void ser_write_u8<VectorWriter>(VectorWriter&, uint8_t);
template void ser_write_u32<VectorWriter>(VectorWriter&, uint32_t);
template void ser_write_u64<VectorWriter>(VectorWriter&, uint64_t);
template void ser_write_bytes<VectorWriter>(
    VectorWriter&, std::span<const uint8_t>);

// -------------------------------------------------------------------
// Primitive readers (SpanReader)
// -------------------------------------------------------------------
template uint8_t  ser_read_u8<SpanReader>(SpanReader&);
template uint16_t ser_read_u16<SpanReader>(SpanReader&);
template uint16_t ser_read_u16_be<SpanReader>(SpanReader&);
template uint32_t ser_read_u32<SpanReader>(SpanReader&);
template uint64_t ser_read_u64<SpanReader>(SpanReader&);
template int32_t  ser_read_i32<SpanReader>(SpanReader&);
template int64_t  ser_read_i64<SpanReader>(SpanReader&);
template void     ser_read_bytes<SpanReader>(
    SpanReader&, std::span<uint8_t>);

// -------------------------------------------------------------------
// Bool / string / byte vector
// -------------------------------------------------------------------
template void ser_write_bool<DataStream>(DataStream&, bool);
template bool ser_read_bool<SpanReader>(SpanReader&);

template void        ser_write_string<DataStream>(
    DataStream&, std::string_view);
template std::string ser_read_string<SpanReader>(SpanReader&, size_t);

template void ser_write_vector<DataStream>(
    DataStream&, const std::vector<uint8_t>&);
template std::vector<uint8_t> ser_read_vector<SpanReader>(
    SpanReader&);

// -------------------------------------------------------------------
// uint256
// -------------------------------------------------------------------
template void          ser_write_uint256<DataStream>(
    DataStream&, const core::uint256&);
template core::uint256 ser_read_uint256<SpanReader>(SpanReader&);

}  // namespace core
