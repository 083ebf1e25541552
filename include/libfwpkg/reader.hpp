#ifndef LIBFWPKG_READER_HPP
#define LIBFWPKG_READER_HPP

#include <libfwpkg/layout.hpp>
#include <libfwpkg/package.hpp>

#include <memory>

namespace fwpkg {

// Parse a complete package from memory. The returned Package takes ownership
// of `bytes`.
//
// Throws PackageError tagged with the offset at which parsing stopped:
//   MALFORMED_HEADER       input shorter than the header, or a header_length
//                          that contradicts segment_count or total_length
//   UNKNOWN_MAGIC          not a package
//   TRUNCATED_INPUT        the segment table, segment data or hash table runs
//                          past the end of the input
//   SEGMENT_OUT_OF_BOUNDS  the first table entry (in table order) whose range
//                          leaves [header_length, total_length)
//
// Digests are not checked; call verify() on the result for that.
Package readPackage (Bytes bytes);
Package readPackage (std::shared_ptr<const Bytes> bytes);

} // namespace fwpkg

#endif
