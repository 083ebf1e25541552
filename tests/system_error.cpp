#define BOOST_TEST_MODULE system_error
#include <boost/test/unit_test.hpp>

#include <libfwpkg/system_error.hpp>

#include <string>

using fwpkg::Status;

BOOST_AUTO_TEST_CASE(category_describes_every_status) {
    BOOST_CHECK_EQUAL(std::string(fwpkg::errorCategory().name()), "fwpkg");
    BOOST_CHECK_EQUAL(make_error_code(Status::OK).message(), "success");
    BOOST_CHECK_EQUAL(make_error_code(Status::UNKNOWN_MAGIC).message(),
        "not a firmware package (bad magic)");
    BOOST_CHECK_EQUAL(make_error_code(Status::MALFORMED_HEADER).message(),
        "header fields are inconsistent");
    BOOST_CHECK_EQUAL(make_error_code(Status::TRUNCATED_INPUT).message(),
        "package is truncated");
    BOOST_CHECK_EQUAL(make_error_code(Status::SEGMENT_OUT_OF_BOUNDS).message(),
        "segment lies outside the package data");
    BOOST_CHECK_EQUAL(make_error_code(Status::PACKAGE_TOO_LARGE).message(),
        "package does not fit in 64-bit lengths");
    BOOST_CHECK_EQUAL(fwpkg::errorCategory().message(1000), "unknown package status 1000");
}

BOOST_AUTO_TEST_CASE(status_converts_to_error_code) {
    boost::system::error_code ec = Status::TRUNCATED_INPUT;
    BOOST_CHECK(ec == Status::TRUNCATED_INPUT);
    BOOST_CHECK(ec != Status::MALFORMED_HEADER);
    BOOST_CHECK(ec.category() == fwpkg::errorCategory());

    ec = Status::OK;
    BOOST_CHECK(!ec);
}

BOOST_AUTO_TEST_CASE(package_error_carries_offset) {
    auto e = fwpkg::PackageError{Status::TRUNCATED_INPUT, 0x50};
    BOOST_CHECK(e.code() == Status::TRUNCATED_INPUT);
    BOOST_CHECK_EQUAL(e.offset(), 0x50u);
    BOOST_CHECK(!e.segmentId());
    BOOST_CHECK(std::string(e.what()).find("0x50") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(package_error_carries_segment_id) {
    auto e = fwpkg::PackageError{Status::SEGMENT_OUT_OF_BOUNDS, 0x30, 0x201};
    BOOST_CHECK(e.code() == Status::SEGMENT_OUT_OF_BOUNDS);
    BOOST_CHECK_EQUAL(e.offset(), 0x30u);
    BOOST_REQUIRE(e.segmentId());
    BOOST_CHECK_EQUAL(*e.segmentId(), 0x201u);
    BOOST_CHECK(std::string(e.what()).find("segment 0x201") != std::string::npos);

    // Catchable as a plain system_error.
    try {
        throw e;
    }
    catch (boost::system::system_error& se) {
        BOOST_CHECK(se.code() == Status::SEGMENT_OUT_OF_BOUNDS);
    }
}
