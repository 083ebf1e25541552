#ifndef LIBFWPKG_PACKAGE_HPP
#define LIBFWPKG_PACKAGE_HPP

#include <libfwpkg/hash_table.hpp>
#include <libfwpkg/header.hpp>
#include <libfwpkg/layout.hpp>
#include <libfwpkg/segment_store.hpp>
#include <libfwpkg/segment_table.hpp>

#include <boost/asio/buffer.hpp>

#include <memory>

namespace fwpkg {

// A complete package: header, segment table, segment payloads and hash table,
// together with the serialized bytes they were parsed from or built into.
// Immutable; editing a package means building a new one.
class Package {
public:
    // The caller guarantees that `header`, `table` and `hashes` describe
    // `bytes`. Only readPackage and buildPackage construct packages.
    Package (std::shared_ptr<const Bytes> bytes, const Header& header,
            SegmentTable table, HashTable hashes);

    const Header& header () const { return mHeader; }
    const SegmentTable& segmentTable () const { return mTable; }
    const SegmentStore& segments () const { return mSegments; }
    const HashTable& hashTable () const { return mHashes; }

    // The serialized package.
    const Bytes& bytes () const { return *mBytes; }

    // Bytes [0, header_length), covered by the first hash table entry.
    boost::asio::const_buffer headerRegion () const;

private:
    std::shared_ptr<const Bytes> mBytes;
    Header mHeader;
    SegmentTable mTable;
    SegmentStore mSegments;
    HashTable mHashes;
};

} // namespace fwpkg

#endif
