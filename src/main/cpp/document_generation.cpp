#include <memory_resource>
#include <string_view>

#include "slidec/util/assert.hpp"
#include "slidec/util/result.hpp"
#include "slidec/util/severity.hpp"

#include "slidec/diagnostic.hpp"
#include "slidec/document.hpp"
#include "slidec/document_generation.hpp"
#include "slidec/fwd.hpp"
#include "slidec/parse.hpp"
#include "slidec/render.hpp"

namespace slidec {

std::u8string_view generation_status_name(Generation_Status status)
{
    using enum Generation_Status;
    switch (status) {
        SLIDEC_ENUM_STRING_CASE8(ok);
        SLIDEC_ENUM_STRING_CASE8(parse_error);
        SLIDEC_ENUM_STRING_CASE8(config_error);
    }
    SLIDEC_ASSERT_UNREACHABLE(u8"Invalid generation status.");
}

Generation_Status
generate_document(Text_Sink& out, std::u8string_view source, const Generation_Options& options)
{
    SLIDEC_ASSERT(options.memory != nullptr);

    std::pmr::unsynchronized_pool_resource transient_memory { options.memory };

    const Result<Document, Parse_Error> document
        = parse_document(source, options.parse, &transient_memory);
    if (!document) {
        const Parse_Error& error = document.error();
        if (options.logger.can_log(Severity::error)) {
            options.logger(
                Diagnostic {
                    .severity = Severity::error,
                    .id = error.id(),
                    .location = error.location,
                    .message = error.message,
                }
            );
        }
        return Generation_Status::parse_error;
    }

    const Render_Context context {
        .play_service = options.play_service,
        .logger = options.logger,
        .memory = &transient_memory,
    };
    const Result<void, Render_Config_Error> result
        = render(out, *document, options.rules, context);
    if (!result) {
        if (options.logger.can_log(Severity::error)) {
            options.logger(
                Diagnostic {
                    .severity = Severity::error,
                    .id = diagnostic::render_rule_missing,
                    .location = {},
                    .message = result.error().message,
                }
            );
        }
        return Generation_Status::config_error;
    }
    return Generation_Status::ok;
}

} // namespace slidec
