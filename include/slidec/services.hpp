#ifndef SLIDEC_SERVICES_HPP
#define SLIDEC_SERVICES_HPP

#include "slidec/util/assert.hpp"
#include "slidec/util/severity.hpp"

#include "slidec/diagnostic.hpp"
#include "slidec/fwd.hpp"

namespace slidec {

/// @brief Answers whether a code block can be run in a live playground.
/// The query is synchronous and is made once per code element during rendering.
struct Play_Service {
    [[nodiscard]]
    virtual bool is_playable(const Code& code) const
        = 0;
};

/// @brief A `Play_Service` for which no code is playable.
struct No_Support_Play_Service final : Play_Service {
    [[nodiscard]]
    bool is_playable(const Code&) const final
    {
        return false;
    }
};

inline constinit No_Support_Play_Service no_support_play_service;

struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        SLIDEC_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    constexpr virtual void operator()(Diagnostic diagnostic) = 0;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(Diagnostic) final { }
};

inline constinit Ignorant_Logger ignorant_logger { Severity::none };

} // namespace slidec

#endif
