#ifndef SLIDEC_REGEXP_HPP
#define SLIDEC_REGEXP_HPP

#include <cstddef>
#include <span>
#include <string_view>
#include <utility>

#include "slidec/util/result.hpp"

#include "slidec/fwd.hpp"

namespace slidec {

enum struct Reg_Exp_Error_Code : Default_Underlying {
    /// @brief The given pattern is not valid.
    bad_pattern,
};

enum struct Reg_Exp_Status : Default_Underlying {
    /// @brief Execution completed; no match was found.
    unmatched,
    /// @brief Execution completed; a match was found.
    matched,
    /// @brief An error occurred while trying to execute the regular expression,
    /// such as exceeding complexity limits.
    execution_error,
};

struct In_Place_Tag { };

struct Reg_Exp_Impl {
private:
    alignas(8) unsigned char m_storage[16];

public:
    Reg_Exp_Impl() noexcept;
    Reg_Exp_Impl(const Reg_Exp_Impl&) noexcept;
    Reg_Exp_Impl(Reg_Exp_Impl&&) noexcept;

    Reg_Exp_Impl& operator=(const Reg_Exp_Impl&) noexcept;
    Reg_Exp_Impl& operator=(Reg_Exp_Impl&&) noexcept;

    ~Reg_Exp_Impl();

private:
    template <typename T>
    Reg_Exp_Impl(In_Place_Tag, T&&) noexcept;

    [[nodiscard]]
    auto& get();
    [[nodiscard]]
    const auto& get() const;

    friend Reg_Exp;
};

/// @brief Represents an ECMA-Script-flavored regular expression over UTF-8 text.
///
/// A `Reg_Exp` has shared ownership over the underlying compiled regular expression,
/// meaning that both copying and moving are relatively inexpensive.
struct Reg_Exp {
public:
    [[nodiscard]]
    static Result<Reg_Exp, Reg_Exp_Error_Code> make(std::u8string_view pattern);

private:
    Reg_Exp_Impl m_impl;

    [[nodiscard]]
    explicit Reg_Exp(const Reg_Exp_Impl& impl) noexcept
        : m_impl { impl }
    {
    }
    [[nodiscard]]
    explicit Reg_Exp(Reg_Exp_Impl&& impl) noexcept
        : m_impl { std::move(impl) }
    {
    }

public:
    /// @brief Returns `matched` if `string` matches this regex in its entirety.
    [[nodiscard]]
    Reg_Exp_Status match(std::u8string_view string) const;

    /// @brief Like `match(string)`, but additionally stores the capture groups
    /// (starting with group 1) into `groups`.
    /// Groups which did not participate in the match are stored as empty strings.
    /// Groups beyond `groups.size()` are not stored.
    /// The views in `groups` point into `string`.
    [[nodiscard]]
    Reg_Exp_Status match(std::u8string_view string, std::span<std::u8string_view> groups) const;

    /// @brief Returns the number of capture groups in the pattern, excluding the whole match.
    [[nodiscard]]
    std::size_t get_group_count() const;
};

} // namespace slidec

#endif
