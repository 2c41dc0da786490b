#ifndef SLIDEC_FUNCTION_REF_HPP
#define SLIDEC_FUNCTION_REF_HPP

#include "ulight/function_ref.hpp"

namespace slidec {

template <typename F>
using Function_Ref = ulight::Function_Ref<F>;

} // namespace slidec

#endif
