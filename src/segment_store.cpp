#include <libfwpkg/segment_store.hpp>
#include <libfwpkg/system_error.hpp>

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace fwpkg {

boost::asio::const_buffer slice (const SegmentEntry& entry, boost::asio::const_buffer buffer) {
    auto available = boost::asio::buffer_size(buffer);
    if (entry.offset > available || entry.size > available - entry.offset) {
        throw PackageError{Status::SEGMENT_OUT_OF_BOUNDS, entry.offset, entry.id};
    }
    return boost::asio::buffer(buffer + static_cast<std::size_t>(entry.offset),
        static_cast<std::size_t>(entry.size));
}

SegmentStore::SegmentStore (Buffer buffer, const SegmentTable& table)
    : mBuffer(std::move(buffer))
{
    mViews.reserve(table.size());
    auto whole = boost::asio::buffer(*mBuffer);
    for (auto&& entry : table) {
        slice(entry, whole);
        mViews.push_back({ entry.id,
            static_cast<std::size_t>(entry.offset), static_cast<std::size_t>(entry.size) });
    }
}

boost::asio::const_buffer SegmentStore::view (const View& v) const {
    return boost::asio::buffer(mBuffer->data() + v.offset, v.size);
}

boost::asio::const_buffer SegmentStore::at (std::size_t index) const {
    return view(mViews.at(index));
}

boost::asio::const_buffer SegmentStore::find (SegmentId id) const {
    auto it = std::find_if(mViews.begin(), mViews.end(),
        [id](const View& v) { return v.id == id; });
    if (it == mViews.end()) {
        throw std::out_of_range{"no segment with the requested id"};
    }
    return view(*it);
}

bool SegmentStore::contains (SegmentId id) const {
    return std::any_of(mViews.begin(), mViews.end(),
        [id](const View& v) { return v.id == id; });
}

Bytes SegmentStore::copy (std::size_t index) const {
    auto payload = at(index);
    auto b = static_cast<const uint8_t*>(payload.data());
    return Bytes(b, b + payload.size());
}

std::vector<uint64_t> assignOffsets (uint64_t dataOffset, const std::vector<uint64_t>& sizes) {
    auto offsets = std::vector<uint64_t>{};
    offsets.reserve(sizes.size());
    auto cursor = dataOffset;
    for (auto size : sizes) {
        if (size > std::numeric_limits<uint64_t>::max() - cursor) {
            throw PackageError{Status::PACKAGE_TOO_LARGE, cursor};
        }
        offsets.push_back(cursor);
        cursor += size;
    }
    return offsets;
}

PackedSegments packSegments (uint64_t dataOffset, const std::vector<Segment>& segments) {
    auto sizes = std::vector<uint64_t>{};
    sizes.reserve(segments.size());
    for (auto&& segment : segments) {
        sizes.push_back(segment.payload().size());
    }

    auto packed = PackedSegments{};
    packed.offsets = assignOffsets(dataOffset, sizes);
    auto total = std::size_t(0);
    for (auto size : sizes) {
        total += static_cast<std::size_t>(size);
    }
    packed.data.reserve(total);
    for (auto&& segment : segments) {
        packed.data.insert(packed.data.end(),
            segment.payload().begin(), segment.payload().end());
    }
    return packed;
}

} // namespace fwpkg
