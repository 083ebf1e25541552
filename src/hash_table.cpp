#include <libfwpkg/hash_table.hpp>
#include <libfwpkg/package.hpp>
#include <libfwpkg/system_error.hpp>

#include <libfwpkg/detail/log.hpp>

#include <algorithm>
#include <iterator>

namespace fwpkg {

HashTable parseHashTable (boost::asio::const_buffer data, uint64_t segmentCount, uint64_t offset) {
    auto complete = boost::asio::buffer_size(data) / kDigestSize;
    if (segmentCount >= complete) {
        throw PackageError{Status::TRUNCATED_INPUT, offset + complete * kDigestSize};
    }

    auto count = static_cast<std::size_t>(segmentCount) + 1;
    auto hashes = HashTable(count);
    auto b = static_cast<const uint8_t*>(data.data());
    for (auto&& digest : hashes) {
        std::copy(b, b + kDigestSize, digest.begin());
        b += kDigestSize;
    }
    return hashes;
}

void serializeHashTable (const HashTable& hashes, Bytes& out) {
    out.reserve(out.size() + hashes.size() * kDigestSize);
    for (auto&& digest : hashes) {
        out.insert(out.end(), digest.begin(), digest.end());
    }
}

HashTable computeHashTable (boost::asio::const_buffer headerBytes,
        boost::asio::const_buffer tableBytes,
        const SegmentStore& segments,
        const DigestProvider& provider) {
    auto hashes = HashTable{};
    hashes.reserve(segments.size() + 1);
    hashes.push_back(provider.digest({ headerBytes, tableBytes }));
    for (auto i = std::size_t(0); i < segments.size(); ++i) {
        hashes.push_back(provider.digest(segments.at(i)));
    }
    return hashes;
}

bool VerificationReport::passed () const {
    return std::all_of(mEntries.begin(), mEntries.end(),
        [](const VerificationEntry& e) { return e.passed; });
}

std::vector<VerificationEntry> VerificationReport::failures () const {
    auto result = std::vector<VerificationEntry>{};
    std::copy_if(mEntries.begin(), mEntries.end(), std::back_inserter(result),
        [](const VerificationEntry& e) { return !e.passed; });
    return result;
}

VerificationReport verify (const Package& package, const DigestProvider& provider) {
    auto lg = detail::makeLogger("verify");
    const auto& hashes = package.hashTable();
    const auto& segments = package.segments();

    auto entries = VerificationReport::Entries{};
    entries.reserve(hashes.size());

    auto headerDigest = provider.digest(package.headerRegion());
    entries.push_back({ VerificationEntry::Subject::HEADER, 0, 0,
        headerDigest == hashes.at(0), hashes.at(0), headerDigest });

    for (auto i = std::size_t(0); i < segments.size(); ++i) {
        auto actual = provider.digest(segments.at(i));
        const auto& expected = hashes.at(i + 1);
        entries.push_back({ VerificationEntry::Subject::SEGMENT, i + 1, segments.id(i),
            actual == expected, expected, actual });
    }

    auto report = VerificationReport{std::move(entries)};
    BOOST_LOG(lg) << "Verified " << report.entries().size() << " digests, "
        << report.failures().size() << " mismatched";
    return report;
}

} // namespace fwpkg
