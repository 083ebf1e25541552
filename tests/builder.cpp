#define BOOST_TEST_MODULE builder
#include <boost/test/unit_test.hpp>

#include <libfwpkg/builder.hpp>
#include <libfwpkg/reader.hpp>
#include <libfwpkg/segment.hpp>
#include <libfwpkg/system_error.hpp>

#include "testing.hpp"

#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace {

std::string payloadOf (const fwpkg::Package& package, fwpkg::SegmentId id) {
    auto view = package.segments().find(id);
    auto p = static_cast<const char*>(view.data());
    return std::string(p, p + view.size());
}

} // <anonymous>

BOOST_AUTO_TEST_CASE(layout_is_contiguous) {
    auto segments = testing::sampleSegments();
    auto fields = fwpkg::HeaderFields{};
    fields.imageVersion = 0x4880000000000000;
    auto package = fwpkg::buildPackage(segments, fields, testing::FoldDigestProvider{});

    const auto& header = package.header();
    BOOST_CHECK_EQUAL(header.packageVersion, fwpkg::kPackageVersion);
    BOOST_CHECK_EQUAL(header.imageVersion, 0x4880000000000000u);
    BOOST_CHECK_EQUAL(header.segmentCount, 3u);
    BOOST_CHECK_EQUAL(header.headerLength, fwpkg::kHeaderSize + 3 * fwpkg::kRecordSize);

    auto cursor = header.headerLength;
    const auto& table = package.segmentTable();
    for (auto i = std::size_t(0); i < table.size(); ++i) {
        BOOST_CHECK_EQUAL(table[i].id, segments[i].id());
        BOOST_CHECK_EQUAL(table[i].offset, cursor);
        BOOST_CHECK_EQUAL(table[i].size, segments[i].payload().size());
        BOOST_CHECK_EQUAL(table[i].flags, segments[i].flags());
        cursor += table[i].size;
    }
    BOOST_CHECK_EQUAL(header.totalLength, cursor);
    BOOST_CHECK_EQUAL(package.bytes().size(), cursor + 4 * fwpkg::kDigestSize);
}

BOOST_AUTO_TEST_CASE(round_trip) {
    auto provider = testing::FoldDigestProvider{};
    auto built = fwpkg::buildPackage(testing::sampleSegments(), {}, provider);
    auto read = fwpkg::readPackage(built.bytes());

    BOOST_CHECK(read.header() == built.header());
    BOOST_CHECK(read.segmentTable() == built.segmentTable());
    BOOST_CHECK(read.hashTable() == built.hashTable());
    BOOST_REQUIRE_EQUAL(read.segments().size(), built.segments().size());
    for (auto&& segment : testing::sampleSegments()) {
        BOOST_CHECK_EQUAL(payloadOf(read, segment.id()),
            std::string(segment.payload().begin(), segment.payload().end()));
    }
    BOOST_CHECK(fwpkg::verify(read, provider).passed());
}

BOOST_AUTO_TEST_CASE(round_trip_with_empty_and_duplicate_segments) {
    auto segments = std::vector<fwpkg::Segment>{};
    segments.emplace_back(7, fwpkg::Bytes{});
    segments.emplace_back(7, testing::bytesOf("second seven"));
    segments.emplace_back(0, 0xffffffffffffffff, fwpkg::Bytes(300, 0));

    auto provider = fwpkg::Sha1DigestProvider{};
    auto built = fwpkg::buildPackage(segments, {}, provider);
    auto read = fwpkg::readPackage(built.bytes());

    BOOST_CHECK(read.segmentTable() == built.segmentTable());
    BOOST_CHECK_EQUAL(read.segments().at(0).size(), 0u);
    BOOST_CHECK_EQUAL(read.segments().at(1).size(), 12u);
    BOOST_CHECK_EQUAL(read.segmentTable()[2].flags, 0xffffffffffffffffu);
    BOOST_CHECK(fwpkg::verify(read, provider).passed());
}

BOOST_AUTO_TEST_CASE(empty_package) {
    auto provider = testing::FoldDigestProvider{};
    auto built = fwpkg::buildPackage({}, {}, provider);

    BOOST_CHECK_EQUAL(built.header().segmentCount, 0u);
    BOOST_CHECK_EQUAL(built.header().headerLength, fwpkg::kHeaderSize);
    BOOST_CHECK_EQUAL(built.header().totalLength, fwpkg::kHeaderSize);
    BOOST_CHECK_EQUAL(built.hashTable().size(), 1u);
    BOOST_CHECK_EQUAL(built.bytes().size(), fwpkg::kHeaderSize + fwpkg::kDigestSize);

    auto read = fwpkg::readPackage(built.bytes());
    BOOST_CHECK(read.segments().empty());
    BOOST_CHECK_EQUAL(read.hashTable().size(), 1u);
    BOOST_CHECK(read.hashTable()[0] == provider.digest(read.headerRegion()));

    auto report = fwpkg::verify(read, provider);
    BOOST_CHECK(report.passed());
    BOOST_CHECK_EQUAL(report.entries().size(), 1u);
}

BOOST_AUTO_TEST_CASE(build_is_deterministic) {
    auto provider = fwpkg::HmacSha1DigestProvider{testing::bytesOf("key")};
    auto a = fwpkg::buildPackage(testing::sampleSegments(), {}, provider);
    auto b = fwpkg::buildPackage(testing::sampleSegments(), {}, provider);
    BOOST_CHECK(a.bytes() == b.bytes());
}

BOOST_AUTO_TEST_CASE(order_is_preserved) {
    auto segments = testing::sampleSegments();
    std::swap(segments[0], segments[2]);
    auto package = fwpkg::buildPackage(segments, {}, testing::FoldDigestProvider{});
    BOOST_CHECK_EQUAL(package.segmentTable()[0].id, 0x300u);
    BOOST_CHECK_EQUAL(package.segmentTable()[2].id, 0x100u);
    BOOST_CHECK_EQUAL(package.segmentTable()[0].offset, package.header().headerLength);
}

BOOST_AUTO_TEST_CASE(edit_by_rebuilding) {
    auto provider = testing::FoldDigestProvider{};
    auto fields = fwpkg::HeaderFields{};
    fields.imageVersion = 42;
    auto before = fwpkg::buildPackage(testing::sampleSegments(), fields, provider);

    auto segments = fwpkg::segmentsOf(before);
    BOOST_REQUIRE_EQUAL(segments.size(), 3u);
    BOOST_CHECK_EQUAL(segments[1].flags(), 0x2u);

    segments.erase(segments.begin());
    segments.insert(segments.begin() + 1, fwpkg::Segment{0x501, testing::bytesOf("spkg")});
    auto edited = fwpkg::buildPackage(std::move(segments), fwpkg::headerFieldsOf(before), provider);

    BOOST_CHECK_EQUAL(edited.header().imageVersion, 42u);
    BOOST_REQUIRE_EQUAL(edited.segmentTable().size(), 3u);
    BOOST_CHECK_EQUAL(edited.segmentTable()[0].id, 0x200u);
    BOOST_CHECK_EQUAL(edited.segmentTable()[1].id, 0x501u);
    BOOST_CHECK_EQUAL(edited.segmentTable()[2].id, 0x300u);
    BOOST_CHECK_EQUAL(payloadOf(edited, 0x501), "spkg");
    BOOST_CHECK(fwpkg::verify(fwpkg::readPackage(edited.bytes()), provider).passed());
}

BOOST_AUTO_TEST_CASE(known_segment_names) {
    BOOST_CHECK_EQUAL(*fwpkg::knownSegmentName(0x100), "version.txt");
    BOOST_CHECK_EQUAL(*fwpkg::knownSegmentName(0x601), "ps3swu2.self");
    BOOST_CHECK(!fwpkg::knownSegmentName(0x999));

    BOOST_CHECK_EQUAL(*fwpkg::segmentIdFromName("vsh.tar"), 0x201u);
    BOOST_CHECK_EQUAL(*fwpkg::segmentIdFromName("update_files"), 0x300u);
    BOOST_CHECK(!fwpkg::segmentIdFromName("firmware.bin"));
}

BOOST_AUTO_TEST_CASE(segment_numbers) {
    BOOST_CHECK_EQUAL(*fwpkg::parseSegmentNumber("0"), 0u);
    BOOST_CHECK_EQUAL(*fwpkg::parseSegmentNumber("10"), 10u);
    BOOST_CHECK_EQUAL(*fwpkg::parseSegmentNumber("0x201"), 0x201u);
    BOOST_CHECK_EQUAL(*fwpkg::parseSegmentNumber("0XfF"), 0xffu);
    BOOST_CHECK_EQUAL(*fwpkg::parseSegmentNumber("18446744073709551615"),
        std::numeric_limits<uint64_t>::max());

    // A negative index must not wrap around to the last segment.
    BOOST_CHECK(!fwpkg::parseSegmentNumber("-1"));
    BOOST_CHECK(!fwpkg::parseSegmentNumber("+1"));
    BOOST_CHECK(!fwpkg::parseSegmentNumber("010"));
    BOOST_CHECK(!fwpkg::parseSegmentNumber(""));
    BOOST_CHECK(!fwpkg::parseSegmentNumber("0x"));
    BOOST_CHECK(!fwpkg::parseSegmentNumber(" 1"));
    BOOST_CHECK(!fwpkg::parseSegmentNumber("12ab"));
    BOOST_CHECK(!fwpkg::parseSegmentNumber("18446744073709551616"));
    BOOST_CHECK(!fwpkg::parseSegmentNumber("0x10000000000000000"));
}

BOOST_AUTO_TEST_CASE(header_length_grows_with_the_table) {
    BOOST_CHECK_EQUAL(fwpkg::headerLengthFor(0), fwpkg::kHeaderSize);
    BOOST_CHECK_EQUAL(fwpkg::headerLengthFor(2), fwpkg::kHeaderSize + 2 * fwpkg::kRecordSize);

    auto max = uint64_t(std::numeric_limits<std::size_t>::max());
    BOOST_CHECK_EXCEPTION(fwpkg::headerLengthFor(max),
        fwpkg::PackageError, testing::hasStatus(fwpkg::Status::PACKAGE_TOO_LARGE));
    BOOST_CHECK_EXCEPTION(fwpkg::headerLengthFor((max - fwpkg::kHeaderSize) / fwpkg::kRecordSize + 1),
        fwpkg::PackageError, testing::hasStatus(fwpkg::Status::PACKAGE_TOO_LARGE));
}

BOOST_AUTO_TEST_CASE(hash_table_end_must_fit) {
    BOOST_CHECK_EQUAL(fwpkg::packageEndFor(0x30, 0), 0x30u + fwpkg::kDigestSize);
    BOOST_CHECK_EQUAL(fwpkg::packageEndFor(0x100, 3), 0x100u + 4 * fwpkg::kDigestSize);

    auto max = uint64_t(std::numeric_limits<std::size_t>::max());
    // Ending exactly at the top of the address space still fits.
    BOOST_CHECK_EQUAL(fwpkg::packageEndFor(max - fwpkg::kDigestSize, 0), max);

    BOOST_CHECK_EXCEPTION(fwpkg::packageEndFor(max - fwpkg::kDigestSize + 1, 0),
        fwpkg::PackageError, testing::hasStatus(fwpkg::Status::PACKAGE_TOO_LARGE));
    BOOST_CHECK_EXCEPTION(fwpkg::packageEndFor(0x30, max),
        fwpkg::PackageError, testing::hasStatus(fwpkg::Status::PACKAGE_TOO_LARGE));
    BOOST_CHECK_EXCEPTION(fwpkg::packageEndFor(std::numeric_limits<uint64_t>::max(), 0),
        fwpkg::PackageError, testing::hasStatus(fwpkg::Status::PACKAGE_TOO_LARGE));
}
