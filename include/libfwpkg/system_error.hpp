#ifndef LIBFWPKG_SYSTEM_ERROR_HPP
#define LIBFWPKG_SYSTEM_ERROR_HPP

#include <libfwpkg/status.hpp>

#include <boost/optional.hpp>
#include <boost/system/error_code.hpp>
#include <boost/system/system_error.hpp>

#include <string>

#include <cstdint>

namespace fwpkg {

class ErrorCategory : public boost::system::error_category {
public:
    virtual const char* name () const BOOST_NOEXCEPT override;
    virtual std::string message (int ev) const BOOST_NOEXCEPT override;
};

const boost::system::error_category& errorCategory ();
boost::system::error_code make_error_code (Status status);
boost::system::error_condition make_error_condition (Status status);

// Thrown by the reader and the builder. Carries the byte offset at which
// processing stopped and, for SEGMENT_OUT_OF_BOUNDS, the offending segment id.
class PackageError : public boost::system::system_error {
public:
    PackageError (Status status, uint64_t offset);
    PackageError (Status status, uint64_t offset, uint64_t segmentId);

    uint64_t offset () const { return mOffset; }
    const boost::optional<uint64_t>& segmentId () const { return mSegmentId; }

private:
    uint64_t mOffset;
    boost::optional<uint64_t> mSegmentId;
};

} // namespace fwpkg

namespace boost {
namespace system {

template <>
struct is_error_code_enum< ::fwpkg::Status> : public std::true_type { };

} // namespace system
} // namespace boost

#endif
