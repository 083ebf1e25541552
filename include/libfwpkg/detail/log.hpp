#ifndef LIBFWPKG_DETAIL_LOG_HPP
#define LIBFWPKG_DETAIL_LOG_HPP

#include <boost/log/attributes/constant.hpp>
#include <boost/log/sources/logger.hpp>
#include <boost/log/sources/record_ostream.hpp>

#include <string>

namespace fwpkg { namespace detail {

// A plain Boost.Log source tagged with the codec stage that owns it.
inline boost::log::sources::logger makeLogger (const char* component) {
    auto lg = boost::log::sources::logger{};
    lg.add_attribute("Component", boost::log::attributes::make_constant(std::string(component)));
    return lg;
}

}} // fwpkg::detail

#endif
