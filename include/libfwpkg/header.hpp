#ifndef LIBFWPKG_HEADER_HPP
#define LIBFWPKG_HEADER_HPP

#include <libfwpkg/layout.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/fusion/include/adapt_struct.hpp>

#include <cstdint>

namespace fwpkg {

// The fixed-size package header, minus the magic, which is implied.
struct Header {
    uint64_t packageVersion = kPackageVersion;
    uint64_t imageVersion = 0;
    uint64_t segmentCount = 0;
    uint64_t headerLength = 0;   // header + segment table; payload data begins here
    uint64_t totalLength = 0;    // header + table + payload data; hash table begins here
};

bool operator== (const Header& lhs, const Header& rhs);
bool operator!= (const Header& lhs, const Header& rhs);

// Parse the header prefix of `data`. Throws PackageError with
// MALFORMED_HEADER if `data` is shorter than kHeaderSize, or UNKNOWN_MAGIC.
// Cross-field consistency is the reader's business.
Header parseHeader (boost::asio::const_buffer data);

// Append the kHeaderSize serialized bytes of `header` to `out`.
void serializeHeader (const Header& header, Bytes& out);

} // namespace fwpkg

BOOST_FUSION_ADAPT_STRUCT(fwpkg::Header,
    (uint64_t, packageVersion)
    (uint64_t, imageVersion)
    (uint64_t, segmentCount)
    (uint64_t, headerLength)
    (uint64_t, totalLength))

#endif
