//
// Copyright (c) 2019 Vinnie Falco (vinnie.falco@gmail.com)
// Copyright (c) 2025 Mohammad Nejati
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//

#ifndef FIELDPARSE_DETAIL_CONFIG_HPP
#define FIELDPARSE_DETAIL_CONFIG_HPP

#include <boost/config.hpp>
#include <stdint.h>

//------------------------------------------------

# if (defined(FIELDPARSE_DYN_LINK) || defined(BOOST_ALL_DYN_LINK)) && !defined(FIELDPARSE_STATIC_LINK)
#  if defined(FIELDPARSE_SOURCE)
#   define FIELDPARSE_DECL        BOOST_SYMBOL_EXPORT
#   define FIELDPARSE_BUILD_DLL
#  else
#   define FIELDPARSE_DECL        BOOST_SYMBOL_IMPORT
#  endif
# endif // shared lib

# ifndef  FIELDPARSE_DECL
#  define FIELDPARSE_DECL
# endif

#if defined(__MINGW32__)
    #define FIELDPARSE_SYMBOL_VISIBLE FIELDPARSE_DECL
#else
    #define FIELDPARSE_SYMBOL_VISIBLE BOOST_SYMBOL_VISIBLE
#endif

//-----------------------------------------------

// Add source location to error codes
#ifdef FIELDPARSE_NO_SOURCE_LOCATION
# define FIELDPARSE_ERR(ev) (::boost::system::error_code(ev))
# define FIELDPARSE_RETURN_EC(ev) return (ev)
#else
# define FIELDPARSE_ERR(ev) ( \
    ::boost::system::error_code( (ev), [] { \
    static constexpr auto loc((BOOST_CURRENT_LOCATION)); \
    return &loc; }()))
# define FIELDPARSE_RETURN_EC(ev)                                  \
    do {                                                                 \
        static constexpr auto loc ## __LINE__((BOOST_CURRENT_LOCATION)); \
        return ::boost::system::error_code((ev), &loc ## __LINE__);      \
    } while(0)
#endif

// lift boost namespaces into ours
namespace boost {
namespace core {}
namespace system {}
namespace urls {
namespace grammar {}
} // urls
} // boost

namespace fieldparse {
namespace core = ::boost::core;
namespace system = ::boost::system;
namespace urls = ::boost::urls;
namespace grammar = ::boost::urls::grammar;
} // fieldparse

#endif
