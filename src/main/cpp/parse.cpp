#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "slidec/util/assert.hpp"
#include "slidec/util/chars.hpp"
#include "slidec/util/result.hpp"
#include "slidec/util/strings.hpp"

#include "slidec/diagnostic.hpp"
#include "slidec/directive_arguments.hpp"
#include "slidec/document.hpp"
#include "slidec/fwd.hpp"
#include "slidec/lex.hpp"
#include "slidec/parse.hpp"

namespace slidec {

std::u8string_view parse_state_name(const Parse_State state)
{
    using enum Parse_State;
    switch (state) {
        SLIDEC_ENUM_STRING_CASE8(top_level);
        SLIDEC_ENUM_STRING_CASE8(in_section);
        SLIDEC_ENUM_STRING_CASE8(in_list);
        SLIDEC_ENUM_STRING_CASE8(in_code_fence);
        SLIDEC_ENUM_STRING_CASE8(in_text);
    }
    SLIDEC_ASSERT_UNREACHABLE(u8"Invalid parse state.");
}

std::u8string_view parse_action_name(const Parse_Action action)
{
    using enum Parse_Action;
    switch (action) {
        SLIDEC_ENUM_STRING_CASE8(skip);
        SLIDEC_ENUM_STRING_CASE8(unexpected);
        SLIDEC_ENUM_STRING_CASE8(reject);
        SLIDEC_ENUM_STRING_CASE8(open_section);
        SLIDEC_ENUM_STRING_CASE8(open_list);
        SLIDEC_ENUM_STRING_CASE8(append_bullet);
        SLIDEC_ENUM_STRING_CASE8(continue_list);
        SLIDEC_ENUM_STRING_CASE8(emit_directive);
        SLIDEC_ENUM_STRING_CASE8(open_fence);
        SLIDEC_ENUM_STRING_CASE8(append_code);
        SLIDEC_ENUM_STRING_CASE8(close_fence);
        SLIDEC_ENUM_STRING_CASE8(open_text);
        SLIDEC_ENUM_STRING_CASE8(append_text);
        SLIDEC_ENUM_STRING_CASE8(close_element);
    }
    SLIDEC_ASSERT_UNREACHABLE(u8"Invalid parse action.");
}

std::u8string_view parse_error_kind_name(const Parse_Error_Kind kind)
{
    using enum Parse_Error_Kind;
    switch (kind) {
        SLIDEC_ENUM_STRING_CASE8(content_outside_section);
        SLIDEC_ENUM_STRING_CASE8(heading_skip);
        SLIDEC_ENUM_STRING_CASE8(fence_unterminated);
        SLIDEC_ENUM_STRING_CASE8(directive_argument_missing);
        SLIDEC_ENUM_STRING_CASE8(directive_argument_invalid);
    }
    SLIDEC_ASSERT_UNREACHABLE(u8"Invalid parse error kind.");
}

std::u8string_view Parse_Error::id() const
{
    using enum Parse_Error_Kind;
    switch (kind) {
    case content_outside_section: return diagnostic::section_missing;
    case heading_skip: return diagnostic::heading_skip;
    case fence_unterminated: return diagnostic::fence_unterminated;
    case directive_argument_missing: return diagnostic::directive_argument_missing;
    case directive_argument_invalid: return diagnostic::directive_argument_invalid;
    }
    SLIDEC_ASSERT_UNREACHABLE(u8"Invalid parse error kind.");
}

namespace {

struct Error_Message_Builder {
    std::pmr::u8string text;

    Error_Message_Builder& operator<<(std::u8string_view str)
    {
        text += str;
        return *this;
    }

    Error_Message_Builder& operator<<(std::size_t n)
    {
        append_integer(text, n);
        return *this;
    }
};

[[nodiscard]]
Error_Message_Builder message_builder(std::pmr::memory_resource* memory)
{
    return Error_Message_Builder { std::pmr::u8string { memory } };
}

[[nodiscard]]
Parse_Error make_directive_error(
    Parse_Error_Kind kind,
    const Source_Span& location,
    Directive_Kind directive,
    Error_Message_Builder& message
)
{
    return Parse_Error {
        .kind = kind,
        .location = location,
        .directive = directive,
        .message = std::move(message.text),
    };
}

/// @brief Returns the span of `part` within `line`,
/// where `part` is a view into `line.text`.
[[nodiscard]]
Source_Span span_within(const Classified_Line& line, std::u8string_view part)
{
    SLIDEC_DEBUG_ASSERT(part.data() >= line.text.data());
    SLIDEC_DEBUG_ASSERT(part.data() + part.size() <= line.text.data() + line.text.size());
    const auto offset = std::size_t(part.data() - line.text.data());
    return Source_Span { line.position.to_right(offset), part.size() };
}

/// @brief Applies the arguments of a code fence info string,
/// like `go -edit -numbers`.
void apply_info_string(Code& code, std::u8string_view info)
{
    bool first = true;
    while (true) {
        info = trim_ascii_blank_left(info);
        if (info.empty()) {
            break;
        }
        std::size_t length = 0;
        while (length < info.size() && !is_ascii_blank(info[length])) {
            ++length;
        }
        const std::u8string_view word = info.substr(0, length);
        info.remove_prefix(length);

        if (first && !word.starts_with(u8'-')) {
            code.language = word;
        }
        else if (word == u8"-edit") {
            code.edit = true;
        }
        else if (word == u8"-play") {
            code.play = true;
        }
        else if (word == u8"-numbers") {
            code.numbers = true;
        }
        first = false;
    }
}

struct Directive_Parser {
    const Classified_Line& line;
    std::pmr::memory_resource* memory;
    std::pmr::vector<Directive_Argument> args { memory };

    [[nodiscard]]
    Directive_Kind kind() const
    {
        return line.directive;
    }

    [[nodiscard]]
    Source_Span arguments_span() const
    {
        return span_within(line, line.content);
    }

    [[nodiscard]]
    Source_Span argument_span(const Directive_Argument& arg) const
    {
        const Source_Span content = arguments_span();
        // Quotes and escapes make the source text longer than the value,
        // so we only cite the beginning of the argument.
        return Source_Span { content.to_right(arg.offset), arg.quoted ? 1 : arg.value.size() };
    }

    [[nodiscard]]
    Error_Message_Builder message() const
    {
        auto result = message_builder(memory);
        result << u8"." << directive_kind_name(kind()) << u8": ";
        return result;
    }

    Result<void, Parse_Error> tokenize()
    {
        const Result<void, Argument_Error> result
            = split_directive_arguments(args, line.content, memory);
        if (!result) {
            const Source_Span location = arguments_span().to_right(result.error().offset);
            return make_directive_error(
                Parse_Error_Kind::directive_argument_invalid, location.with_length(1), kind(),
                message() << u8"unterminated quoted argument"
            );
        }
        return {};
    }

    /// @brief Checks that there are at least `min` and at most `max` arguments.
    Result<void, Parse_Error>
    check_count(std::size_t min, std::size_t max, std::u8string_view first_missing_name)
    {
        if (args.size() < min) {
            return make_directive_error(
                Parse_Error_Kind::directive_argument_missing, line.span(), kind(),
                message() << u8"missing required argument " << first_missing_name
            );
        }
        if (args.size() > max) {
            return make_directive_error(
                Parse_Error_Kind::directive_argument_invalid, argument_span(args[max]), kind(),
                message() << u8"too many arguments (expected at most " << max << u8", got "
                          << args.size() << u8")"
            );
        }
        return {};
    }

    /// @brief Takes the value of the required argument at `index`,
    /// which shall not be empty or the `_` placeholder.
    Result<std::pmr::u8string, Parse_Error> required(std::size_t index, std::u8string_view name)
    {
        SLIDEC_ASSERT(index < args.size());
        Directive_Argument& arg = args[index];
        if (arg.value.empty() || arg.is_placeholder()) {
            return make_directive_error(
                Parse_Error_Kind::directive_argument_missing, argument_span(arg), kind(),
                message() << u8"missing required argument " << name
            );
        }
        return std::move(arg.value);
    }

    /// @brief Parses the optional size argument at `index`,
    /// which is absent if there are not enough arguments or if it is the `_` placeholder.
    Result<std::optional<std::size_t>, Parse_Error> size(std::size_t index, std::u8string_view name)
    {
        if (index >= args.size() || args[index].is_placeholder()) {
            return std::optional<std::size_t> {};
        }
        const Directive_Argument& arg = args[index];
        const std::optional<std::size_t> value = from_characters<std::size_t>(arg.value);
        if (!value || *value == 0) {
            return make_directive_error(
                Parse_Error_Kind::directive_argument_invalid, argument_span(arg), kind(),
                message() << name << u8" must be a positive integer, but got \"" << arg.value
                          << u8"\""
            );
        }
        return value;
    }

    /// @brief Parses `.image`, `.background`, and `.iframe`, which share the same arguments.
    template <typename Media>
    Result<Element, Parse_Error> parse_media()
    {
        if (auto r = tokenize(); !r) {
            return std::move(r).error();
        }
        if (auto r = check_count(1, 3, u8"URL"); !r) {
            return std::move(r).error();
        }
        auto url = required(0, u8"URL");
        if (!url) {
            return std::move(url).error();
        }
        const auto height = size(1, u8"height");
        if (!height) {
            return height.error();
        }
        const auto width = size(2, u8"width");
        if (!width) {
            return width.error();
        }
        return Element { std::in_place_type<Media>,
                         Media {
                             .url = std::move(*url),
                             .height = *height,
                             .width = *width,
                             .position = line.position,
                         } };
    }

    Result<Element, Parse_Error> parse_video()
    {
        if (auto r = tokenize(); !r) {
            return std::move(r).error();
        }
        if (auto r = check_count(2, 4, args.empty() ? u8"URL" : u8"MIME type"); !r) {
            return std::move(r).error();
        }
        auto url = required(0, u8"URL");
        if (!url) {
            return std::move(url).error();
        }
        auto source_type = required(1, u8"MIME type");
        if (!source_type) {
            return std::move(source_type).error();
        }
        const auto height = size(2, u8"height");
        if (!height) {
            return height.error();
        }
        const auto width = size(3, u8"width");
        if (!width) {
            return width.error();
        }
        return Element { std::in_place_type<Video>,
                         Video {
                             .url = std::move(*url),
                             .source_type = std::move(*source_type),
                             .height = *height,
                             .width = *width,
                             .position = line.position,
                         } };
    }

    Result<Element, Parse_Error> parse_link()
    {
        if (auto r = tokenize(); !r) {
            return std::move(r).error();
        }
        if (auto r = check_count(1, args.size() + 1, u8"URL"); !r) {
            return std::move(r).error();
        }
        auto url = required(0, u8"URL");
        if (!url) {
            return std::move(url).error();
        }
        std::pmr::u8string label { memory };
        for (std::size_t i = 1; i < args.size(); ++i) {
            if (i != 1) {
                label += u8' ';
            }
            label += args[i].value;
        }
        return Element { std::in_place_type<Link>,
                         Link {
                             .url = std::move(*url),
                             .label = std::move(label),
                             .position = line.position,
                         } };
    }

    /// @brief Parses `.html` and `.caption`, whose payload is the rest of the line.
    Result<std::pmr::u8string, Parse_Error> raw_payload(std::u8string_view name)
    {
        if (line.content.empty()) {
            return make_directive_error(
                Parse_Error_Kind::directive_argument_missing, line.span(), kind(),
                message() << u8"missing required argument " << name
            );
        }
        return std::pmr::u8string { line.content, memory };
    }

    Result<Element, Parse_Error> operator()()
    {
        switch (kind()) {
        case Directive_Kind::image: return parse_media<Image>();
        case Directive_Kind::background: return parse_media<Background>();
        case Directive_Kind::iframe: return parse_media<Iframe>();
        case Directive_Kind::video: return parse_video();
        case Directive_Kind::link: return parse_link();
        case Directive_Kind::html: {
            auto payload = raw_payload(u8"HTML");
            if (!payload) {
                return std::move(payload).error();
            }
            return Element { std::in_place_type<HTML>,
                             HTML { .payload = std::move(*payload), .position = line.position } };
        }
        case Directive_Kind::caption: {
            auto text = raw_payload(u8"caption text");
            if (!text) {
                return std::move(text).error();
            }
            return Element { std::in_place_type<Caption>,
                             Caption {
                                 .text = std::move(*text),
                                 .text_span = span_within(line, line.content),
                                 .position = line.position,
                             } };
        }
        }
        SLIDEC_ASSERT_UNREACHABLE(u8"Invalid directive kind.");
    }
};

/// @brief Returns `true` if a prose line is preformatted,
/// which is the case for any indented prose outside of a list.
[[nodiscard]]
bool is_preformatted(const Classified_Line& line)
{
    return line.indent_level != 0;
}

} // namespace

Result<Element, Parse_Error>
parse_directive(const Classified_Line& line, std::pmr::memory_resource* const memory)
{
    SLIDEC_ASSERT(line.kind == Line_Kind::directive);
    return Directive_Parser { .line = line, .memory = memory }();
}

Document_Builder::Document_Builder(
    const Parse_Options& options,
    std::pmr::memory_resource* const memory
)
    : m_options { options }
    , m_memory { memory }
    , m_document { .sections = std::pmr::vector<Section> { memory } }
    , m_open_sections { memory }
{
}

Section& Document_Builder::innermost_section()
{
    SLIDEC_ASSERT(!m_open_sections.empty());
    return *m_open_sections.back();
}

template <typename T>
T& Document_Builder::current_element()
{
    std::pmr::vector<Element>& elements = innermost_section().elements;
    SLIDEC_ASSERT(!elements.empty());
    T* const result = std::get_if<T>(&elements.back());
    SLIDEC_ASSERT(result);
    return *result;
}

Result<void, Parse_Error>
Document_Builder::feed(const Classified_Line& line, const Classified_Line* const lookahead)
{
    SLIDEC_ASSERT(!m_finished);

    const Parse_Action action = parse_transition(m_state, line.kind);
    switch (action) {
    case Parse_Action::skip: return {};

    case Parse_Action::unexpected: {
        SLIDEC_ASSERT_UNREACHABLE(u8"Line was classified in a way that is impossible in this state.");
    }

    case Parse_Action::reject: return reject_outside_section(line);

    case Parse_Action::open_section: {
        close_element();
        return open_section(line);
    }

    case Parse_Action::open_list: {
        close_element();
        open_list(line);
        return {};
    }

    case Parse_Action::append_bullet: {
        auto& list = current_element<List>();
        if (line.indent_level == list.level) {
            list.bullets.emplace_back(line.content);
            list.bullet_spans.push_back(span_within(line, line.content));
            return {};
        }
        close_element();
        open_list(line);
        return {};
    }

    case Parse_Action::continue_list: {
        auto& list = current_element<List>();
        if (line.indent_level > list.level) {
            SLIDEC_ASSERT(!list.bullets.empty());
            std::pmr::u8string& bullet = list.bullets.back();
            bullet += u8' ';
            bullet += line.content;
            return {};
        }
        close_element();
        open_text(line);
        return {};
    }

    case Parse_Action::emit_directive: {
        close_element();
        return emit_directive(line);
    }

    case Parse_Action::open_fence: {
        close_element();
        open_fence(line);
        return {};
    }

    case Parse_Action::append_code: {
        SLIDEC_ASSERT(m_code);
        m_code->text += line.content;
        m_code->text += u8'\n';
        return {};
    }

    case Parse_Action::close_fence: {
        close_fence();
        return {};
    }

    case Parse_Action::open_text: {
        open_text(line);
        return {};
    }

    case Parse_Action::append_text: {
        auto& text = current_element<Text>();
        if (text.pre != is_preformatted(line)) {
            close_element();
            open_text(line);
            return {};
        }
        for (; m_pending_blank_lines != 0; --m_pending_blank_lines) {
            text.lines.emplace_back();
        }
        text.lines.emplace_back(text.pre ? line.text : line.content);
        return {};
    }

    case Parse_Action::close_element: {
        if (m_state == Parse_State::in_text && current_element<Text>().pre && lookahead) {
            const bool continues = lookahead->kind == Line_Kind::blank
                || (lookahead->kind == Line_Kind::prose && is_preformatted(*lookahead));
            if (continues) {
                ++m_pending_blank_lines;
                return {};
            }
        }
        close_element();
        return {};
    }
    }
    SLIDEC_ASSERT_UNREACHABLE(u8"Invalid parse action.");
}

Result<void, Parse_Error> Document_Builder::reject_outside_section(const Classified_Line& line)
{
    auto message = message_builder(m_memory);
    message << u8"content outside of a section; the first non-blank line must be a "
               u8"section header like \"# Title\"";
    return Parse_Error {
        .kind = Parse_Error_Kind::content_outside_section,
        .location = line.span(),
        .directive = {},
        .message = std::move(message.text),
    };
}

Result<void, Parse_Error> Document_Builder::open_section(const Classified_Line& line)
{
    SLIDEC_ASSERT(line.kind == Line_Kind::header);
    SLIDEC_ASSERT(line.header_depth != 0);

    std::size_t depth = line.header_depth;
    const std::size_t max_depth = m_open_sections.size() + 1;
    if (depth > max_depth) {
        if (m_options.heading_policy == Heading_Policy::strict) {
            auto message = message_builder(m_memory);
            message << u8"header of depth " << depth << u8" skips levels; expected a depth of "
                    << max_depth << u8" or less";
            return Parse_Error {
                .kind = Parse_Error_Kind::heading_skip,
                .location = line.span(),
                .directive = {},
                .message = std::move(message.text),
            };
        }
        depth = max_depth;
    }

    while (m_open_sections.size() >= depth) {
        m_open_sections.pop_back();
    }

    std::pmr::vector<Section>& siblings
        = m_open_sections.empty() ? m_document.sections : innermost_section().sections;

    Section section {
        .number = std::pmr::vector<std::size_t> { m_memory },
        .title = std::pmr::u8string { line.content, m_memory },
        .title_span = span_within(line, line.content),
        .elements = std::pmr::vector<Element> { m_memory },
        .sections = std::pmr::vector<Section> { m_memory },
        .position = line.position,
    };
    if (!m_open_sections.empty()) {
        const std::pmr::vector<std::size_t>& parent_number = innermost_section().number;
        section.number.assign(parent_number.begin(), parent_number.end());
    }
    section.number.push_back(siblings.size() + 1);

    siblings.push_back(std::move(section));
    m_open_sections.push_back(&siblings.back());
    m_state = Parse_State::in_section;

    SLIDEC_DEBUG_ASSERT(m_open_sections.size() == depth);
    return {};
}

Result<void, Parse_Error> Document_Builder::emit_directive(const Classified_Line& line)
{
    Result<Element, Parse_Error> element = parse_directive(line, m_memory);
    if (!element) {
        return std::move(element).error();
    }
    innermost_section().elements.push_back(std::move(*element));
    return {};
}

void Document_Builder::open_list(const Classified_Line& line)
{
    SLIDEC_ASSERT(line.kind == Line_Kind::bullet);

    List list {
        .level = line.indent_level,
        .bullets = std::pmr::vector<std::pmr::u8string> { m_memory },
        .bullet_spans = std::pmr::vector<Source_Span> { m_memory },
        .position = line.position,
    };
    list.bullets.emplace_back(line.content);
    list.bullet_spans.push_back(span_within(line, line.content));
    innermost_section().elements.emplace_back(std::in_place_type<List>, std::move(list));
    m_state = Parse_State::in_list;
}

void Document_Builder::open_text(const Classified_Line& line)
{
    SLIDEC_ASSERT(line.kind == Line_Kind::prose);

    const bool pre = is_preformatted(line);
    Text text {
        .pre = pre,
        .lines = std::pmr::vector<std::pmr::u8string> { m_memory },
        .position = line.position,
    };
    text.lines.emplace_back(pre ? line.text : line.content);
    innermost_section().elements.emplace_back(std::in_place_type<Text>, std::move(text));
    m_state = Parse_State::in_text;
    m_pending_blank_lines = 0;
}

void Document_Builder::open_fence(const Classified_Line& line)
{
    SLIDEC_ASSERT(line.kind == Line_Kind::fence);

    m_fence = line.fence;
    m_fence_location = line.span();
    m_code.emplace(Code {
        .text = std::pmr::u8string { m_memory },
        .language = std::pmr::u8string { m_memory },
        .edit = false,
        .play = false,
        .numbers = false,
        .position = line.position,
    });
    apply_info_string(*m_code, line.content);
    m_state = Parse_State::in_code_fence;
}

void Document_Builder::close_fence()
{
    SLIDEC_ASSERT(m_code);
    innermost_section().elements.emplace_back(std::in_place_type<Code>, std::move(*m_code));
    m_code.reset();
    m_state = Parse_State::in_section;
}

void Document_Builder::close_element()
{
    switch (m_state) {
    case Parse_State::top_level:
    case Parse_State::in_section: return;
    case Parse_State::in_list:
    case Parse_State::in_text: {
        m_state = Parse_State::in_section;
        m_pending_blank_lines = 0;
        return;
    }
    case Parse_State::in_code_fence: break;
    }
    SLIDEC_ASSERT_UNREACHABLE(u8"Code fences are only closed by a closing fence.");
}

Result<Document, Parse_Error> Document_Builder::finish()
{
    SLIDEC_ASSERT(!m_finished);
    m_finished = true;

    if (m_state == Parse_State::in_code_fence) {
        auto message = message_builder(m_memory);
        message << u8"code fence opened on line " << m_fence_location.line_number()
                << u8" is never closed";
        return Parse_Error {
            .kind = Parse_Error_Kind::fence_unterminated,
            .location = m_fence_location,
            .directive = {},
            .message = std::move(message.text),
        };
    }

    close_element();
    m_open_sections.clear();
    return std::move(m_document);
}

Result<Document, Parse_Error> parse_document(
    const std::u8string_view source,
    const Parse_Options& options,
    std::pmr::memory_resource* const memory
)
{
    Line_Reader reader { source };
    Document_Builder builder { options, memory };

    while (!reader.done()) {
        const Source_Line line = reader.next();
        const Classified_Line classified = builder.is_in_code_fence()
            ? classify_fenced_line(line.text, line.position, builder.get_fence(), options.lex)
            : classify_line(line.text, line.position, options.lex);

        std::optional<Classified_Line> lookahead;
        if (classified.kind == Line_Kind::blank) {
            if (const std::optional<Source_Line> next = reader.peek()) {
                lookahead = classify_line(next->text, next->position, options.lex);
            }
        }

        Result<void, Parse_Error> result = builder.feed(classified, lookahead ? &*lookahead : nullptr);
        if (!result) {
            return std::move(result).error();
        }
    }

    return builder.finish();
}

} // namespace slidec
