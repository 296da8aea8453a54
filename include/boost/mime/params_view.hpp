//
// Copyright (c) 2025 Vinnie Falco (vinnie.falco@gmail.com)
//
// Distributed under the Boost Software License, Version 1.0. (See accompanying
// file LICENSE_1_0.txt or copy at http://www.boost.org/LICENSE_1_0.txt)
//
// Official repository: https://github.com/cppalliance/mime
//

#ifndef BOOST_MIME_PARAMS_VIEW_HPP
#define BOOST_MIME_PARAMS_VIEW_HPP

#include <boost/mime/detail/config.hpp>
#include <boost/mime/param_value.hpp>
#include <boost/mime/detail/param_source.hpp>
#include <boost/core/detail/string_view.hpp>
#include <cstddef>
#include <iterator>

namespace boost {
namespace mime {

class mime_type;

/** A parameter of a media type.
*/
struct param
{
    /** The name, in lower case.
    */
    core::string_view name;

    /** The value.
    */
    param_value value;
};

//------------------------------------------------

/** A view of the parameters of a media type.

    The view and its iterators reference the
    @ref mime_type they were obtained from, which
    must remain valid while they are in use.
    Parameters are visited in the order they
    appear in the string.

    @par Example
    @code
    mime_type mt( "multipart/form-data; boundary=ABCDEFG" );
    for( auto p : mt.params() )
        std::cout << p.name << " = " << p.value << "\n";
    @endcode
*/
class params_view
{
    core::string_view s_;
    detail::param_source const* ps_ = nullptr;

    friend class mime_type;

    params_view(
        core::string_view s,
        detail::param_source const& ps) noexcept
        : s_(s)
        , ps_(&ps)
    {
    }

public:
    class iterator;

    using value_type = param;
    using reference = param;
    using const_reference = param;
    using size_type = std::size_t;
    using difference_type = std::ptrdiff_t;
    using const_iterator = iterator;

    params_view() = default;

    /** Return the number of parameters.

        This does not enumerate the parameters.
    */
    std::size_t
    size() const noexcept
    {
        return ps_ ? ps_->size() : 0;
    }

    /** Return true if there are no parameters.
    */
    bool
    empty() const noexcept
    {
        return size() == 0;
    }

    /** Return an iterator to the first parameter.
    */
    iterator
    begin() const noexcept;

    /** Return an iterator to one past the last parameter.
    */
    iterator
    end() const noexcept;

    /** Return the parameter at the index.

        @par Preconditions
        @code
        i < this->size()
        @endcode
    */
    BOOST_MIME_DECL
    param
    operator[](std::size_t i) const noexcept;
};

//------------------------------------------------

class params_view::iterator
{
    params_view v_;
    std::size_t i_ = 0;

    friend class params_view;

    iterator(
        params_view const& v,
        std::size_t i) noexcept
        : v_(v)
        , i_(i)
    {
    }

public:
    using value_type = param;
    using reference = param;
    using pointer = void;
    using difference_type = std::ptrdiff_t;
    using iterator_category =
        std::forward_iterator_tag;

    iterator() = default;

    reference
    operator*() const noexcept
    {
        return v_[i_];
    }

    iterator&
    operator++() noexcept
    {
        ++i_;
        return *this;
    }

    iterator
    operator++(int) noexcept
    {
        auto tmp = *this;
        ++*this;
        return tmp;
    }

    bool
    operator==(
        iterator const& other) const noexcept
    {
        return
            v_.ps_ == other.v_.ps_ &&
            i_ == other.i_;
    }

    bool
    operator!=(
        iterator const& other) const noexcept
    {
        return !(*this == other);
    }
};

inline
auto
params_view::
begin() const noexcept ->
    iterator
{
    return iterator(*this, 0);
}

inline
auto
params_view::
end() const noexcept ->
    iterator
{
    return iterator(*this, size());
}

} // mime
} // boost

#endif
