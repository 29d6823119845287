#pragma once

#include <boost/format.hpp>
#include <cstdlib>
#include <cinttypes>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>


namespace ammr {

/**
 * @brief raised when a caller violates an API contract (null collaborators,
 *        malformed arguments). Expected business failures never use this.
 */
struct bad_argument: public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

#define check_not_null_arg(name) if (name == nullptr) throw ::ammr::bad_argument("can't be null: " #name);


namespace detail {

inline boost::format &strfmt_feed(boost::format &f)
{
    return f;
}

template<typename T, typename ... Args>
boost::format &strfmt_feed(boost::format &f, const T &head, const Args& ... tail)
{
    f % head;
    return strfmt_feed(f, tail...);
}

} // namespace detail


/**
 * @brief boost::format in a single call
 *
 * strfmt("pool %1% has %2% shares", addr, supply)
 */
template<typename ... Args>
std::string strfmt(const std::string &fmt, const Args& ... args)
{
    boost::format f(fmt);
    return boost::str(detail::strfmt_feed(f, args...));
}

} // namespace ammr
