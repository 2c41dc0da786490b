#ifndef SLIDEC_TEXT_SINK_HPP
#define SLIDEC_TEXT_SINK_HPP

#include <memory_resource>
#include <string_view>
#include <utility>
#include <vector>

#include "slidec/fwd.hpp"

namespace slidec {

/// @brief Receives rendered output fragments in document order.
struct Text_Sink {
    virtual void write(std::u8string_view str) = 0;

    virtual void write(char8_t c)
    {
        write(std::u8string_view { &c, 1 });
    }
};

/// @brief Text sink which redirects its output into a referenced `std::pmr::vector`.
struct Capturing_Ref_Text_Sink final : Text_Sink {
private:
    std::pmr::vector<char8_t>& m_out;

public:
    [[nodiscard]]
    explicit Capturing_Ref_Text_Sink(std::pmr::vector<char8_t>& out)
        : m_out { out }
    {
    }

    [[nodiscard]]
    std::pmr::vector<char8_t>& operator*() &
    {
        return m_out;
    }

    void write(std::u8string_view str) final
    {
        m_out.insert(m_out.end(), str.begin(), str.end());
    }

    void write(char8_t c) final
    {
        m_out.push_back(c);
    }
};

/// @brief Text sink which collects its output into an owned `std::pmr::vector`.
struct Vector_Text_Sink final : Text_Sink {
private:
    std::pmr::vector<char8_t> m_out;

public:
    [[nodiscard]]
    explicit Vector_Text_Sink(std::pmr::memory_resource* memory)
        : m_out { memory }
    {
    }

    [[nodiscard]]
    std::pmr::vector<char8_t>& operator*() &
    {
        return m_out;
    }

    [[nodiscard]]
    const std::pmr::vector<char8_t>& operator*() const&
    {
        return m_out;
    }

    [[nodiscard]]
    std::pmr::vector<char8_t>&& operator*() &&
    {
        return std::move(m_out);
    }

    [[nodiscard]]
    std::u8string_view as_string() const
    {
        return { m_out.data(), m_out.size() };
    }

    void write(std::u8string_view str) final
    {
        m_out.insert(m_out.end(), str.begin(), str.end());
    }

    void write(char8_t c) final
    {
        m_out.push_back(c);
    }
};

} // namespace slidec

#endif
