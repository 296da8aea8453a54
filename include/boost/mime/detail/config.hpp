//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
// Copyright (c) 2025 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_DETAIL_CONFIG_HPP
#define BOOST_MIME_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <stdint.h>

namespace boost {

namespace mime {

//------------------------------------------------

# if (defined(BOOST_MIME_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(BOOST_MIME_STATIC_LINK)
#  if defined(BOOST_MIME_SOURCE)
#   define BOOST_MIME_DECL        BOOST_SYMBOL_EXPORT
#   define BOOST_MIME_BUILD_DLL
#  else
#   define BOOST_MIME_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  BOOST_MIME_DECL
#  define BOOST_MIME_DECL
# endif

#if defined(__MINGW32__)
    #define BOOST_MIME_SYMBOL_VISIBLE BOOST_MIME_DECL
#else
    #define BOOST_MIME_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

# if !defined(BOOST_MIME_SOURCE) && !defined(BOOST_ALL_NO_LIB) && !defined(BOOST_MIME_NO_LIB)
#  define BOOST_LIB_NAME boost_mime
#  if defined(BOOST_ALL_DYN_LINK) || defined(BOOST_MIME_DYN_LINK)
#   define BOOST_DYN_LINK
#  endif
#  include <boost/config/auto_link.hpp>
# endif

//-----------------------------------------------

// Offsets into a media type string are 16 bits wide
#ifndef BOOST_MIME_MAX_SIZE
# define BOOST_MIME_MAX_SIZE 65535
#endif

// Add source location to error codes
#ifdef BOOST_MIME_NO_SOURCE_LOCATION
# define BOOST_MIME_ERR(ev) (::boost::system::error_code(ev))
# define BOOST_MIME_RETURN_EC(ev) return (ev)
#else
# define BOOST_MIME_ERR(ev) ( \
    ::boost::system::error_code( (ev), [] { \
    static constexpr auto loc((BOOST_CURRENT_LOCATION)); \
    return &loc; }()))
# define BOOST_MIME_RETURN_EC(ev)                                  \
    do {                                                                 \
        static constexpr auto loc ## __LINE__((BOOST_CURRENT_LOCATION)); \
        return ::boost::system::error_code((ev), &loc ## __LINE__);      \
    } while(0)
#endif

} // mime

// lift grammar into our namespace
namespace urls {
namespace grammar {}
}
namespace mime {
namespace grammar = ::boost::urls::grammar;
} // mime

} // boost

#endif
