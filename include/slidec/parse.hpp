#ifndef SLIDEC_PARSE_HPP
#define SLIDEC_PARSE_HPP

#include <cstddef>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "slidec/util/assert.hpp"
#include "slidec/util/result.hpp"
#include "slidec/util/source_position.hpp"

#include "slidec/document.hpp"
#include "slidec/fwd.hpp"
#include "slidec/lex.hpp"

namespace slidec {

/// @brief Decides what happens to a header which skips levels of nesting,
/// like `### C` directly following `# A`.
enum struct Heading_Policy : Default_Underlying {
    /// @brief The header is treated as if it had the next valid depth,
    /// i.e. it becomes a child of the deepest open section.
    forgiving,
    /// @brief The header is a parse error.
    strict,
};

struct Parse_Options {
    Lex_Options lex {};
    Heading_Policy heading_policy = Heading_Policy::forgiving;
};

enum struct Parse_State : Default_Underlying {
    /// @brief No section has been opened yet.
    top_level,
    /// @brief Within a section, but not within any element.
    in_section,
    /// @brief Within a list, which may be extended by further bullets.
    in_list,
    /// @brief Within a code fence, where all lines are taken verbatim.
    in_code_fence,
    /// @brief Within a run of prose lines.
    in_text,
};

[[nodiscard]]
std::u8string_view parse_state_name(Parse_State state);

/// @brief What the document builder does with a line, given the current state.
enum struct Parse_Action : Default_Underlying {
    /// @brief The line is ignored.
    skip,
    /// @brief The line cannot occur in the state at all,
    /// which is a bug in the code which classified the line.
    unexpected,
    /// @brief The line is content outside of any section, which is an error.
    reject,
    /// @brief Closes the element in progress, closes sections of equal or greater depth,
    /// and opens a new section.
    open_section,
    /// @brief Closes the element in progress and opens a new list.
    open_list,
    /// @brief Appends a bullet to the open list,
    /// or closes it and opens a new list if the indentation level differs.
    append_bullet,
    /// @brief Continues the last bullet if the prose is indented deeper than the list,
    /// otherwise closes the list and opens a new text.
    continue_list,
    /// @brief Closes the element in progress and emits one element for the directive.
    emit_directive,
    /// @brief Closes the element in progress and begins a code fence.
    open_fence,
    /// @brief Appends a verbatim line to the code in progress.
    append_code,
    /// @brief Emits the code in progress.
    close_fence,
    /// @brief Opens a new text.
    open_text,
    /// @brief Appends a line to the open text,
    /// or closes it and opens a new text if the line differs in being preformatted.
    append_text,
    /// @brief Closes the element in progress.
    /// Preformatted text survives blank lines if the lookahead shows it continuing.
    close_element,
};

[[nodiscard]]
std::u8string_view parse_action_name(Parse_Action action);

/// @brief The transition table of the document parser.
[[nodiscard]]
constexpr Parse_Action parse_transition(Parse_State state, Line_Kind kind)
{
    using enum Line_Kind;
    switch (state) {
    case Parse_State::top_level: {
        switch (kind) {
        case blank: return Parse_Action::skip;
        case header: return Parse_Action::open_section;
        case bullet:
        case fence:
        case directive:
        case prose: return Parse_Action::reject;
        case verbatim: return Parse_Action::unexpected;
        }
        break;
    }
    case Parse_State::in_section: {
        switch (kind) {
        case blank: return Parse_Action::skip;
        case header: return Parse_Action::open_section;
        case bullet: return Parse_Action::open_list;
        case fence: return Parse_Action::open_fence;
        case directive: return Parse_Action::emit_directive;
        case prose: return Parse_Action::open_text;
        case verbatim: return Parse_Action::unexpected;
        }
        break;
    }
    case Parse_State::in_list: {
        switch (kind) {
        case blank: return Parse_Action::close_element;
        case header: return Parse_Action::open_section;
        case bullet: return Parse_Action::append_bullet;
        case fence: return Parse_Action::open_fence;
        case directive: return Parse_Action::emit_directive;
        case prose: return Parse_Action::continue_list;
        case verbatim: return Parse_Action::unexpected;
        }
        break;
    }
    case Parse_State::in_code_fence: {
        switch (kind) {
        case fence: return Parse_Action::close_fence;
        case verbatim: return Parse_Action::append_code;
        case blank:
        case header:
        case bullet:
        case directive:
        case prose: return Parse_Action::unexpected;
        }
        break;
    }
    case Parse_State::in_text: {
        switch (kind) {
        case blank: return Parse_Action::close_element;
        case header: return Parse_Action::open_section;
        case bullet: return Parse_Action::open_list;
        case fence: return Parse_Action::open_fence;
        case directive: return Parse_Action::emit_directive;
        case prose: return Parse_Action::append_text;
        case verbatim: return Parse_Action::unexpected;
        }
        break;
    }
    }
    SLIDEC_ASSERT_UNREACHABLE(u8"Invalid parse state or line kind.");
}

enum struct Parse_Error_Kind : Default_Underlying {
    /// @brief A non-blank line appeared before the first section header.
    content_outside_section,
    /// @brief A header skipped levels while the heading policy is `strict`.
    heading_skip,
    /// @brief The input ended inside a code fence.
    fence_unterminated,
    /// @brief A directive lacks a required argument.
    directive_argument_missing,
    /// @brief A directive argument is malformed, or there are too many arguments.
    directive_argument_invalid,
};

[[nodiscard]]
std::u8string_view parse_error_kind_name(Parse_Error_Kind kind);

/// @brief A structural error which stops parsing.
struct Parse_Error {
    Parse_Error_Kind kind;
    /// @brief The span of source text responsible for the error.
    Source_Span location;
    /// @brief If the error is caused by a directive, its kind.
    std::optional<Directive_Kind> directive;
    /// @brief A human-readable reason.
    std::pmr::u8string message;

    /// @brief Returns the diagnostic id of the error, like `"parse.fence.unterminated"`.
    [[nodiscard]]
    std::u8string_view id() const;

    /// @brief Returns the one-based number of the line responsible for the error.
    [[nodiscard]]
    std::size_t line_number() const
    {
        return location.line_number();
    }
};

/// @brief Builds a `Document` from a sequence of classified lines.
/// This is the state machine of the parser,
/// which is separate from classification so that it can be driven by synthetic lines.
///
/// Lines within a code fence (i.e. while `is_in_code_fence()`) shall be classified with
/// `classify_fenced_line` using `get_fence()`, all other lines with `classify_line`.
struct Document_Builder {
private:
    Parse_Options m_options;
    std::pmr::memory_resource* m_memory;
    Document m_document;
    /// @brief The chain of open sections, from outermost to innermost.
    /// These point into `m_document`, which is only ever appended to at the innermost level,
    /// so the pointers remain valid.
    std::pmr::vector<Section*> m_open_sections;
    Parse_State m_state = Parse_State::top_level;
    /// @brief Blank lines within preformatted text which are only kept
    /// if the text continues.
    std::size_t m_pending_blank_lines = 0;
    Fence_Marker m_fence {};
    Source_Span m_fence_location {};
    std::optional<Code> m_code;
    bool m_finished = false;

public:
    [[nodiscard]]
    explicit Document_Builder(
        const Parse_Options& options,
        std::pmr::memory_resource* memory = std::pmr::get_default_resource()
    );

    Document_Builder(const Document_Builder&) = delete;
    Document_Builder& operator=(const Document_Builder&) = delete;

    [[nodiscard]]
    Parse_State get_state() const
    {
        return m_state;
    }

    [[nodiscard]]
    bool is_in_code_fence() const
    {
        return m_state == Parse_State::in_code_fence;
    }

    /// @brief Returns the marker of the open code fence.
    /// `is_in_code_fence()` shall be `true`.
    [[nodiscard]]
    const Fence_Marker& get_fence() const
    {
        SLIDEC_ASSERT(is_in_code_fence());
        return m_fence;
    }

    /// @brief Consumes one line.
    /// @param line The classified line.
    /// @param lookahead The classification of the following line, or null if there is none.
    /// This is only examined for blank lines.
    Result<void, Parse_Error> feed(const Classified_Line& line, const Classified_Line* lookahead);

    /// @brief Closes all open elements and sections and returns the document.
    /// The builder shall not be used afterwards.
    Result<Document, Parse_Error> finish();

private:
    Result<void, Parse_Error> reject_outside_section(const Classified_Line& line);
    Result<void, Parse_Error> open_section(const Classified_Line& line);
    Result<void, Parse_Error> emit_directive(const Classified_Line& line);
    void open_list(const Classified_Line& line);
    void open_text(const Classified_Line& line);
    void open_fence(const Classified_Line& line);
    void close_fence();
    void close_element();

    [[nodiscard]]
    Section& innermost_section();

    template <typename T>
    [[nodiscard]]
    T& current_element();
};

/// @brief Parses a complete document.
/// Parsing stops at the first structural error.
/// @param source The document text.
/// @param options The options for line classification and parsing.
/// @param memory The memory used for the resulting document tree.
[[nodiscard]]
Result<Document, Parse_Error> parse_document(
    std::u8string_view source,
    const Parse_Options& options = {},
    std::pmr::memory_resource* memory = std::pmr::get_default_resource()
);

/// @brief Parses the directive on `line` into an element.
/// `line.kind` shall be `Line_Kind::directive`.
[[nodiscard]]
Result<Element, Parse_Error>
parse_directive(const Classified_Line& line, std::pmr::memory_resource* memory);

} // namespace slidec

#endif
