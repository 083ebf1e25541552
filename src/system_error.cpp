#include <libfwpkg/system_error.hpp>

#include <sstream>
#include <string>

namespace fwpkg {

const char* ErrorCategory::name () const BOOST_NOEXCEPT {
    return "fwpkg";
}

std::string ErrorCategory::message (int ev) const BOOST_NOEXCEPT {
    switch (Status(ev)) {
        case Status::OK:
            return "success";
        case Status::UNKNOWN_MAGIC:
            return "not a firmware package (bad magic)";
        case Status::MALFORMED_HEADER:
            return "header fields are inconsistent";
        case Status::TRUNCATED_INPUT:
            return "package is truncated";
        case Status::SEGMENT_OUT_OF_BOUNDS:
            return "segment lies outside the package data";
        case Status::PACKAGE_TOO_LARGE:
            return "package does not fit in 64-bit lengths";
        default:
            return "unknown package status " + std::to_string(ev);
    }
}

const boost::system::error_category& errorCategory () {
    static ErrorCategory instance;
    return instance;
}

boost::system::error_code make_error_code (Status status) {
    return boost::system::error_code(static_cast<int>(status),
        errorCategory());
}

boost::system::error_condition make_error_condition (Status status) {
    return boost::system::error_condition(static_cast<int>(status),
        errorCategory());
}

namespace {

std::string describe (uint64_t offset) {
    auto ss = std::ostringstream();
    ss << "at offset 0x" << std::hex << offset;
    return ss.str();
}

std::string describe (uint64_t offset, uint64_t segmentId) {
    auto ss = std::ostringstream();
    ss << "segment 0x" << std::hex << segmentId << " at offset 0x" << offset;
    return ss.str();
}

} // <anonymous>

PackageError::PackageError (Status status, uint64_t offset)
    : boost::system::system_error(make_error_code(status), describe(offset))
    , mOffset(offset)
{}

PackageError::PackageError (Status status, uint64_t offset, uint64_t segmentId)
    : boost::system::system_error(make_error_code(status), describe(offset, segmentId))
    , mOffset(offset)
    , mSegmentId(segmentId)
{}

} // namespace fwpkg
