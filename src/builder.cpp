#include <libfwpkg/builder.hpp>
#include <libfwpkg/hash_table.hpp>
#include <libfwpkg/header.hpp>
#include <libfwpkg/segment_store.hpp>
#include <libfwpkg/segment_table.hpp>
#include <libfwpkg/system_error.hpp>

#include <libfwpkg/detail/log.hpp>

#include <limits>
#include <memory>
#include <utility>

namespace fwpkg {

namespace {

const auto kMaxLength = uint64_t(std::numeric_limits<std::size_t>::max());

} // <anonymous>

uint64_t headerLengthFor (uint64_t segmentCount) {
    if (segmentCount > (kMaxLength - kHeaderSize) / kRecordSize) {
        throw PackageError{Status::PACKAGE_TOO_LARGE, kSegmentCountOffset};
    }
    return kHeaderSize + segmentCount * kRecordSize;
}

uint64_t packageEndFor (uint64_t totalLength, uint64_t segmentCount) {
    if (totalLength > kMaxLength || segmentCount > kMaxLength / kDigestSize - 1) {
        throw PackageError{Status::PACKAGE_TOO_LARGE, kTotalLengthOffset};
    }
    auto digests = segmentCount + 1;
    if (digests > (kMaxLength - totalLength) / kDigestSize) {
        throw PackageError{Status::PACKAGE_TOO_LARGE, kTotalLengthOffset};
    }
    return totalLength + digests * kDigestSize;
}

Package buildPackage (std::vector<Segment> segments, const HeaderFields& fields,
        const DigestProvider& provider) {
    auto lg = detail::makeLogger("builder");

    auto header = Header{};
    header.packageVersion = fields.packageVersion;
    header.imageVersion = fields.imageVersion;
    header.segmentCount = segments.size();
    header.headerLength = headerLengthFor(header.segmentCount);

    auto packed = packSegments(header.headerLength, segments);
    header.totalLength = header.headerLength;
    if (!segments.empty()) {
        header.totalLength = packed.offsets.back() + segments.back().payload().size();
    }
    auto end = packageEndFor(header.totalLength, header.segmentCount);

    auto table = SegmentTable{};
    table.reserve(segments.size());
    for (auto i = std::size_t(0); i < segments.size(); ++i) {
        const auto& segment = segments[i];
        table.push_back({ segment.id(), packed.offsets[i],
            segment.payload().size(), segment.flags() });
    }
    segments.clear();

    auto bytes = std::make_shared<Bytes>();
    bytes->reserve(static_cast<std::size_t>(end));
    serializeHeader(header, *bytes);
    serializeSegmentTable(table, *bytes);
    bytes->insert(bytes->end(), packed.data.begin(), packed.data.end());
    packed.data = Bytes{};

    // The store records offsets rather than pointers, so the buffer may still
    // grow by the hash table below.
    auto store = SegmentStore{bytes, table};
    auto hashes = computeHashTable(
        boost::asio::buffer(bytes->data(), kHeaderSize),
        boost::asio::buffer(bytes->data() + kHeaderSize, table.size() * kRecordSize),
        store, provider);
    serializeHashTable(hashes, *bytes);

    BOOST_LOG(lg) << "Built package of " << table.size() << " segments, "
        << bytes->size() << " bytes";
    return Package{std::move(bytes), header, std::move(table), std::move(hashes)};
}

std::vector<Segment> segmentsOf (const Package& package) {
    auto segments = std::vector<Segment>{};
    const auto& table = package.segmentTable();
    segments.reserve(table.size());
    for (auto i = std::size_t(0); i < table.size(); ++i) {
        segments.emplace_back(table[i].id, table[i].flags, package.segments().copy(i));
    }
    return segments;
}

HeaderFields headerFieldsOf (const Package& package) {
    auto fields = HeaderFields{};
    fields.packageVersion = package.header().packageVersion;
    fields.imageVersion = package.header().imageVersion;
    return fields;
}

} // namespace fwpkg
