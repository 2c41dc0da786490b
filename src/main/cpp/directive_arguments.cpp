#include <cstddef>
#include <memory_resource>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "slidec/util/chars.hpp"
#include "slidec/util/result.hpp"

#include "slidec/directive_arguments.hpp"
#include "slidec/fwd.hpp"

namespace slidec {

Result<void, Argument_Error> split_directive_arguments(
    std::pmr::vector<Directive_Argument>& out,
    const std::u8string_view text,
    std::pmr::memory_resource* const memory
)
{
    std::pmr::vector<Directive_Argument> result { memory };

    std::size_t i = 0;
    while (true) {
        while (i < text.size() && is_indentation(text[i])) {
            ++i;
        }
        if (i >= text.size()) {
            break;
        }

        Directive_Argument& arg = result.emplace_back(
            Directive_Argument { .value = std::pmr::u8string { memory }, .offset = i, .quoted = false }
        );
        while (i < text.size() && !is_indentation(text[i])) {
            if (text[i] != u8'"') {
                arg.value.push_back(text[i++]);
                continue;
            }
            const std::size_t quote_offset = i++;
            arg.quoted = true;
            while (true) {
                if (i >= text.size()) {
                    return Argument_Error { Argument_Error_Kind::unterminated_quote, quote_offset };
                }
                if (text[i] == u8'"') {
                    ++i;
                    break;
                }
                if (text[i] == u8'\\' && i + 1 < text.size()
                    && (text[i + 1] == u8'"' || text[i + 1] == u8'\\')) {
                    arg.value.push_back(text[i + 1]);
                    i += 2;
                    continue;
                }
                arg.value.push_back(text[i++]);
            }
        }
    }

    for (auto& arg : result) {
        out.push_back(std::move(arg));
    }
    return {};
}

} // namespace slidec
