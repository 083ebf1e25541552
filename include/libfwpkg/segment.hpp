#ifndef LIBFWPKG_SEGMENT_HPP
#define LIBFWPKG_SEGMENT_HPP

#include <libfwpkg/layout.hpp>

#include <boost/optional.hpp>

#include <string>
#include <utility>
#include <vector>

#include <cstdint>

namespace fwpkg {

using SegmentId = uint64_t;

// Dumb container for one segment on its way into a package. Encapsulates a
// caller-defined id, opaque flags and the payload bytes.
class Segment {
public:
    using Id = SegmentId;
    using Flags = uint64_t;
    using Payload = Bytes;

    Segment () = default;
    Segment (Id i, const Payload& p) : mId(i), mPayload(p) {}
    Segment (Id i, Payload&& p) : mId(i), mPayload(std::move(p)) {}
    Segment (Id i, Flags f, Payload&& p) : mId(i), mFlags(f), mPayload(std::move(p)) {}

    Id id () const { return mId; }
    Flags flags () const { return mFlags; }
    const Payload& payload () const { return mPayload; }

    void id (Id i) { mId = i; }
    void flags (Flags f) { mFlags = f; }
    void payload (const Payload& p) { mPayload = p; }
    void payload (Payload&& p) { mPayload = std::move(p); }

private:
    Id mId = 0;
    Flags mFlags = 0;
    Payload mPayload;
};

// File names conventionally associated with well-known segment ids.
boost::optional<std::string> knownSegmentName (SegmentId id);

// Inverse of knownSegmentName. Accepts the name with or without its extension.
boost::optional<SegmentId> segmentIdFromName (const std::string& name);

// Parse a segment id, index or version given as text: decimal digits, or hex
// digits after a "0x" prefix. Signs, whitespace, octal and values past u64
// yield none.
boost::optional<uint64_t> parseSegmentNumber (const std::string& text);

} // namespace fwpkg

#endif
