#ifndef LIBFWPKG_SEGMENT_TABLE_HPP
#define LIBFWPKG_SEGMENT_TABLE_HPP

#include <libfwpkg/layout.hpp>
#include <libfwpkg/segment.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/fusion/include/adapt_struct.hpp>

#include <vector>

#include <cstdint>

namespace fwpkg {

struct SegmentEntry {
    SegmentId id = 0;
    uint64_t offset = 0;    // absolute, from the start of the package
    uint64_t size = 0;
    uint64_t flags = 0;
};

bool operator== (const SegmentEntry& lhs, const SegmentEntry& rhs);
bool operator!= (const SegmentEntry& lhs, const SegmentEntry& rhs);

using SegmentTable = std::vector<SegmentEntry>;

// Parse `count` records from the start of `data`, which must begin
// immediately after the header. Throws PackageError with TRUNCATED_INPUT if
// `data` is too short; the reported offset is the package offset of the
// first incomplete record. Offsets and sizes are not bounds-checked here.
SegmentTable parseSegmentTable (boost::asio::const_buffer data, uint64_t count);

// Append the records of `table` to `out`, in order.
void serializeSegmentTable (const SegmentTable& table, Bytes& out);

} // namespace fwpkg

BOOST_FUSION_ADAPT_STRUCT(fwpkg::SegmentEntry,
    (uint64_t, id)
    (uint64_t, offset)
    (uint64_t, size)
    (uint64_t, flags))

#endif
