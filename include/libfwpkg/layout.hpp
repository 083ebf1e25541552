#ifndef LIBFWPKG_LAYOUT_HPP
#define LIBFWPKG_LAYOUT_HPP

#include <array>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace fwpkg {

using Bytes = std::vector<uint8_t>;

// On-disk layout. Every integer field is a big-endian u64.
//
//   [header        kHeaderSize bytes at 0]
//   [segment table segment_count * kRecordSize bytes at kHeaderSize]
//   [segment data  at header_length, up to total_length]
//   [hash table    (segment_count + 1) * kDigestSize bytes at total_length]
const std::array<uint8_t, 8> kMagic {{ 'S', 'C', 'E', 'U', 'F', 0, 0, 0 }};

const std::size_t kHeaderSize = 0x30;
const std::size_t kRecordSize = 0x20;
const std::size_t kDigestSize = 0x14;

// Field offsets within the header, used to report where a bad value lives.
const std::size_t kSegmentCountOffset = 0x18;
const std::size_t kHeaderLengthOffset = 0x20;
const std::size_t kTotalLengthOffset = 0x28;

const uint64_t kPackageVersion = 1;

} // namespace fwpkg

#endif
