#ifndef LIBFWPKG_SEGMENT_STORE_HPP
#define LIBFWPKG_SEGMENT_STORE_HPP

#include <libfwpkg/layout.hpp>
#include <libfwpkg/segment.hpp>
#include <libfwpkg/segment_table.hpp>

#include <boost/asio/buffer.hpp>

#include <memory>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace fwpkg {

// Return the `entry.size` bytes of `buffer` starting at `entry.offset`.
// Throws PackageError with SEGMENT_OUT_OF_BOUNDS if the range does not fit.
boost::asio::const_buffer slice (const SegmentEntry& entry, boost::asio::const_buffer buffer);

// Payload bytes of a package, in segment table order. The store shares
// ownership of the package buffer and keeps only offset/size pairs into it,
// so the views it hands out stay valid for as long as the store (or a copy of
// it) is alive.
class SegmentStore {
public:
    using Buffer = std::shared_ptr<const Bytes>;

    SegmentStore () = default;

    // Every entry of `table` is sliced out of `buffer` up front.
    SegmentStore (Buffer buffer, const SegmentTable& table);

    std::size_t size () const { return mViews.size(); }
    bool empty () const { return mViews.empty(); }

    SegmentId id (std::size_t index) const { return mViews.at(index).id; }

    // Payload of the index'th segment in table order. Throws std::out_of_range.
    boost::asio::const_buffer at (std::size_t index) const;

    // Payload of the first segment with the given id. Throws std::out_of_range
    // if there is none.
    boost::asio::const_buffer find (SegmentId id) const;
    bool contains (SegmentId id) const;

    // Copy of the index'th payload.
    Bytes copy (std::size_t index) const;

private:
    struct View {
        SegmentId id;
        std::size_t offset;
        std::size_t size;
    };

    boost::asio::const_buffer view (const View& v) const;

    Buffer mBuffer;
    std::vector<View> mViews;
};

// Offsets for segments of the given sizes, packed back to back starting at
// `dataOffset`. Throws PackageError with PACKAGE_TOO_LARGE if the end of the
// last segment would not fit in a u64.
std::vector<uint64_t> assignOffsets (uint64_t dataOffset, const std::vector<uint64_t>& sizes);

struct PackedSegments {
    std::vector<uint64_t> offsets;
    Bytes data;     // payloads concatenated in order; data[0] lives at offsets[0]
};

PackedSegments packSegments (uint64_t dataOffset, const std::vector<Segment>& segments);

} // namespace fwpkg

#endif
