#ifndef SLIDEC_ASSERT_HPP
#define SLIDEC_ASSERT_HPP

#include "ulight/impl/assert.hpp"

namespace slidec {

using ulight::assert_fail;
using ulight::Assertion_Error;
using ulight::Assertion_Error_Type;
using ulight::assertion_handler;
using ulight::handle_assertion;

#define SLIDEC_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define SLIDEC_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define SLIDEC_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)

} // namespace slidec

#endif
