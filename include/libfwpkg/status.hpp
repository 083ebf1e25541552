#ifndef LIBFWPKG_STATUS_HPP
#define LIBFWPKG_STATUS_HPP

namespace fwpkg {

enum class Status {
    OK,
    UNKNOWN_MAGIC,
    MALFORMED_HEADER,
    TRUNCATED_INPUT,
    SEGMENT_OUT_OF_BOUNDS,
    PACKAGE_TOO_LARGE
};

} // namespace fwpkg

#endif
