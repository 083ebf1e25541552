#include <libfwpkg/reader.hpp>
#include <libfwpkg/system_error.hpp>

#include <libfwpkg/detail/log.hpp>

#include <ios>
#include <limits>
#include <utility>

namespace fwpkg {

namespace {

void checkHeaderLengths (const Header& header) {
    // parseSegmentTable already proved that segmentCount records fit in
    // memory, so this cannot overflow.
    auto minimum = kHeaderSize + header.segmentCount * kRecordSize;
    if (header.headerLength < minimum || header.headerLength > header.totalLength) {
        throw PackageError{Status::MALFORMED_HEADER, kHeaderLengthOffset};
    }
}

void checkSegmentBounds (const Header& header, const SegmentTable& table) {
    for (auto i = std::size_t(0); i < table.size(); ++i) {
        const auto& entry = table[i];
        if (entry.offset < header.headerLength
                || entry.offset > header.totalLength
                || entry.size > header.totalLength - entry.offset) {
            throw PackageError{Status::SEGMENT_OUT_OF_BOUNDS,
                kHeaderSize + i * kRecordSize, entry.id};
        }
    }
}

} // <anonymous>

Package readPackage (Bytes bytes) {
    return readPackage(std::make_shared<const Bytes>(std::move(bytes)));
}

Package readPackage (std::shared_ptr<const Bytes> bytes) {
    auto lg = detail::makeLogger("reader");
    auto whole = boost::asio::buffer(*bytes);
    auto length = uint64_t(bytes->size());

    auto header = parseHeader(whole);
    BOOST_LOG(lg) << "Header: package version " << header.packageVersion
        << ", image version 0x" << std::hex << header.imageVersion << std::dec
        << ", " << header.segmentCount << " segments";

    auto table = parseSegmentTable(whole + kHeaderSize, header.segmentCount);
    checkHeaderLengths(header);
    checkSegmentBounds(header, table);

    if (header.totalLength > length) {
        throw PackageError{Status::TRUNCATED_INPUT, length};
    }

    auto offset = static_cast<std::size_t>(header.totalLength);
    auto hashes = parseHashTable(whole + offset, header.segmentCount, header.totalLength);
    auto end = header.totalLength + hashes.size() * kDigestSize;
    if (end < length) {
        BOOST_LOG(lg) << "Ignoring " << length - end << " trailing bytes";
    }

    // The Package constructor slices every segment out of the buffer.
    return Package{std::move(bytes), header, std::move(table), std::move(hashes)};
}

} // namespace fwpkg
