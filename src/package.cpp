#include <libfwpkg/package.hpp>

#include <utility>

namespace fwpkg {

Package::Package (std::shared_ptr<const Bytes> bytes, const Header& header,
        SegmentTable table, HashTable hashes)
    : mBytes(std::move(bytes))
    , mHeader(header)
    , mTable(std::move(table))
    , mSegments(mBytes, mTable)
    , mHashes(std::move(hashes))
{}

boost::asio::const_buffer Package::headerRegion () const {
    return boost::asio::buffer(*mBytes, static_cast<std::size_t>(mHeader.headerLength));
}

} // namespace fwpkg
