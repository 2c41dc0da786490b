#include <cstddef>
#include <new>
#include <span>
#include <stdexcept>
#include <string_view>
#include <utility>

#include "slidec/regexp.hpp"

#include <boost/regex.hpp>
#include <boost/regex/icu.hpp>

namespace slidec {

static_assert(sizeof(Reg_Exp_Impl) == sizeof(boost::u32regex));

template <typename T>
Reg_Exp_Impl::Reg_Exp_Impl(In_Place_Tag, T&& arg) noexcept
{
    new (m_storage) boost::u32regex(std::forward<T>(arg));
}

auto& Reg_Exp_Impl::get()
{
    return *std::launder(reinterpret_cast<boost::u32regex*>(m_storage));
}

const auto& Reg_Exp_Impl::get() const
{
    return *std::launder(reinterpret_cast<const boost::u32regex*>(m_storage));
}

Reg_Exp_Impl::Reg_Exp_Impl() noexcept
{
    new (m_storage) boost::u32regex;
}

Reg_Exp_Impl::Reg_Exp_Impl(const Reg_Exp_Impl& other) noexcept
    : Reg_Exp_Impl { In_Place_Tag {}, other.get() }
{
}

Reg_Exp_Impl::Reg_Exp_Impl(Reg_Exp_Impl&& other) noexcept
    : Reg_Exp_Impl { In_Place_Tag {}, std::move(other.get()) }
{
}

// boost::regex self-assignment boils down to std::shared_ptr self-assignment.
// NOLINTNEXTLINE(bugprone-unhandled-self-assignment)
Reg_Exp_Impl& Reg_Exp_Impl::operator=(const Reg_Exp_Impl& other) noexcept
{
    get() = other.get();
    return *this;
}

Reg_Exp_Impl& Reg_Exp_Impl::operator=(Reg_Exp_Impl&& other) noexcept
{
    // boost::basic_regex has no move operations,
    // but maybe this will change in the future, so we try to std::move anyway.
    // NOLINTNEXTLINE(performance-move-const-arg)
    get() = std::move(other.get());
    return *this;
}

Reg_Exp_Impl::~Reg_Exp_Impl()
{
    get().~basic_regex();
}

[[nodiscard]]
Result<Reg_Exp, Reg_Exp_Error_Code> Reg_Exp::make(const std::u8string_view pattern)
{
    constexpr auto flags = boost::regex_constants::ECMAScript | boost::regex_constants::no_except;

    boost::u32regex result = boost::make_u32regex(pattern.begin(), pattern.end(), flags);
    if (result.status() != 0) {
        return Reg_Exp_Error_Code::bad_pattern;
    }
    return Reg_Exp { Reg_Exp_Impl { In_Place_Tag {}, std::move(result) } };
}

[[nodiscard]]
Reg_Exp_Status Reg_Exp::match(const std::u8string_view string) const
{
    try {
        const bool result
            = boost::u32regex_match(string.data(), string.data() + string.size(), m_impl.get());
        return result ? Reg_Exp_Status::matched : Reg_Exp_Status::unmatched;
    } catch (const std::runtime_error&) {
        // Boost.Regex throws when the complexity of matching exceeds its limits.
        return Reg_Exp_Status::execution_error;
    }
}

[[nodiscard]]
Reg_Exp_Status
Reg_Exp::match(const std::u8string_view string, const std::span<std::u8string_view> groups) const
{
    boost::match_results<const char8_t*> match;
    try {
        const bool found = boost::u32regex_match(
            string.data(), string.data() + string.size(), match, m_impl.get()
        );
        if (!found) {
            return Reg_Exp_Status::unmatched;
        }
    } catch (const std::runtime_error&) {
        return Reg_Exp_Status::execution_error;
    }

    for (std::size_t i = 0; i < groups.size(); ++i) {
        if (i + 1 >= match.size() || !match[int(i + 1)].matched) {
            groups[i] = {};
            continue;
        }
        const auto& group = match[int(i + 1)];
        groups[i] = { group.first, std::size_t(group.second - group.first) };
    }
    return Reg_Exp_Status::matched;
}

[[nodiscard]]
std::size_t Reg_Exp::get_group_count() const
{
    return m_impl.get().mark_count();
}

} // namespace slidec
