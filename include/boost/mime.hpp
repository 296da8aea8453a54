//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_HPP
#define BOOST_MIME_HPP

#include <boost/mime/atoms.hpp>
#include <boost/mime/error.hpp>
#include <boost/mime/mime_type.hpp>
#include <boost/mime/names.hpp>
#include <boost/mime/param_value.hpp>
#include <boost/mime/params_view.hpp>
#include <boost/mime/parse.hpp>
#include <boost/mime/parse_options.hpp>

#include <boost/mime/rfc/media_type_rule.hpp>

#endif
