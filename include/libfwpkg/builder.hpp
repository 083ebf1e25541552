#ifndef LIBFWPKG_BUILDER_HPP
#define LIBFWPKG_BUILDER_HPP

#include <libfwpkg/digest.hpp>
#include <libfwpkg/layout.hpp>
#include <libfwpkg/package.hpp>
#include <libfwpkg/segment.hpp>

#include <vector>

#include <cstdint>

namespace fwpkg {

// The header fields a caller chooses. Everything else in the header is
// derived from the segments.
struct HeaderFields {
    uint64_t packageVersion = kPackageVersion;
    uint64_t imageVersion = 0;
};

// Lay out `segments` in the given order, packed back to back after the
// segment table, and append a hash table computed with `provider`. The
// returned Package owns the serialized bytes (Package::bytes()), and reading
// those bytes back yields an equal Package.
//
// Throws PackageError with PACKAGE_TOO_LARGE if the layout does not fit the
// format's 64-bit lengths or this machine's address space.
Package buildPackage (std::vector<Segment> segments, const HeaderFields& fields,
        const DigestProvider& provider);

// Copy the segments of `package` back out, in table order, so they can be
// edited and rebuilt.
std::vector<Segment> segmentsOf (const Package& package);

HeaderFields headerFieldsOf (const Package& package);

// Size of the header plus a table of `segmentCount` records. Throws
// PackageError with PACKAGE_TOO_LARGE if that does not fit in a std::size_t.
uint64_t headerLengthFor (uint64_t segmentCount);

// Offset one past the hash table of a package whose payloads end at
// `totalLength`. Throws PackageError with PACKAGE_TOO_LARGE if that does not
// fit in a std::size_t.
uint64_t packageEndFor (uint64_t totalLength, uint64_t segmentCount);

} // namespace fwpkg

#endif
