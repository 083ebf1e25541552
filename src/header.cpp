#include <libfwpkg/header.hpp>
#include <libfwpkg/system_error.hpp>

#include <libfwpkg/detail/grammar.hpp>

#include <algorithm>
#include <iterator>
#include <tuple>

namespace fwpkg {

bool operator== (const Header& lhs, const Header& rhs) {
    return std::tie(lhs.packageVersion, lhs.imageVersion, lhs.segmentCount,
            lhs.headerLength, lhs.totalLength)
        == std::tie(rhs.packageVersion, rhs.imageVersion, rhs.segmentCount,
            rhs.headerLength, rhs.totalLength);
}

bool operator!= (const Header& lhs, const Header& rhs) {
    return !(lhs == rhs);
}

Header parseHeader (boost::asio::const_buffer data) {
    if (boost::asio::buffer_size(data) < kHeaderSize) {
        throw PackageError{Status::MALFORMED_HEADER, 0};
    }

    auto b = static_cast<const uint8_t*>(data.data());
    if (!std::equal(kMagic.begin(), kMagic.end(), b)) {
        throw PackageError{Status::UNKNOWN_MAGIC, 0};
    }

    auto first = b + kMagic.size();
    auto last = b + kHeaderSize;
    auto header = Header{};
    // The size check above guarantees enough input for every field.
    if (!grammar::qi::parse(first, last, grammar::HeaderParser<const uint8_t*>{}, header)) {
        throw PackageError{Status::MALFORMED_HEADER, static_cast<uint64_t>(first - b)};
    }
    return header;
}

void serializeHeader (const Header& header, Bytes& out) {
    out.insert(out.end(), kMagic.begin(), kMagic.end());
    auto sink = std::back_inserter(out);
    grammar::karma::generate(sink,
        grammar::HeaderGenerator<decltype(sink)>{}, header);
}

} // namespace fwpkg
