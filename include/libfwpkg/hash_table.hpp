#ifndef LIBFWPKG_HASH_TABLE_HPP
#define LIBFWPKG_HASH_TABLE_HPP

#include <libfwpkg/digest.hpp>
#include <libfwpkg/layout.hpp>
#include <libfwpkg/segment.hpp>
#include <libfwpkg/segment_store.hpp>

#include <boost/asio/buffer.hpp>

#include <utility>
#include <vector>

#include <cstddef>
#include <cstdint>

namespace fwpkg {

class Package;

// Entry 0 covers the header and segment table, entry k covers the k'th
// segment (1-based) in table order.
using HashTable = std::vector<Digest>;

// Parse segmentCount + 1 digests from the start of `data`, which lives at
// package offset `offset`. Throws PackageError with TRUNCATED_INPUT, reporting
// the offset of the first incomplete digest.
HashTable parseHashTable (boost::asio::const_buffer data, uint64_t segmentCount, uint64_t offset);

void serializeHashTable (const HashTable& hashes, Bytes& out);

HashTable computeHashTable (boost::asio::const_buffer headerBytes,
        boost::asio::const_buffer tableBytes,
        const SegmentStore& segments,
        const DigestProvider& provider);

struct VerificationEntry {
    enum class Subject { HEADER, SEGMENT };

    Subject subject;
    std::size_t index;      // position in the hash table
    SegmentId id;           // meaningless for Subject::HEADER
    bool passed;
    Digest expected;        // as stored in the package
    Digest actual;          // as computed
};

class VerificationReport {
public:
    using Entries = std::vector<VerificationEntry>;

    VerificationReport () = default;
    explicit VerificationReport (Entries entries) : mEntries(std::move(entries)) {}

    const Entries& entries () const { return mEntries; }

    // True if every entry passed.
    bool passed () const;

    std::vector<VerificationEntry> failures () const;

private:
    Entries mEntries;
};

// Recompute every digest of `package` and compare it with the stored hash
// table. Mismatches are reported, never thrown.
VerificationReport verify (const Package& package, const DigestProvider& provider);

} // namespace fwpkg

#endif
