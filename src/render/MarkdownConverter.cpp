#include "mdview/render/MarkdownConverter.hpp"

#include <format>
#include <limits>

#include <md4c-html.h>
#include <md4c.h>

namespace mdview::render {
namespace {

struct SinkContext {
    std::ostream* out = nullptr;
    bool failed = false;
};

void writeToSink(const MD_CHAR* text, MD_SIZE size, void* userdata) {
    auto* context = static_cast<SinkContext*>(userdata);
    if (context->failed) {
        return;
    }
    context->out->write(text, static_cast<std::streamsize>(size));
    if (!context->out->good()) {
        context->failed = true;
    }
}

}  // namespace

unsigned parserFlags(const ConvertOptions& options) {
    unsigned flags = MD_DIALECT_GITHUB;
    if (options.hardWraps) {
        flags |= MD_FLAG_HARD_SOFT_BREAKS;
    }
    if (!options.allowRawHtml) {
        flags |= MD_FLAG_NOHTML;
    }
    return flags;
}

std::expected<void, PipelineError> convertMarkdown(std::string_view markdown, std::ostream& out,
                                                   const ConvertOptions& options) {
    if (markdown.size() > std::numeric_limits<MD_SIZE>::max()) {
        return std::unexpected(PipelineError{
            ErrorKind::RenderError, std::format("Markdown input is too large ({} bytes)", markdown.size())});
    }
    if (!out.good()) {
        return std::unexpected(PipelineError{ErrorKind::RenderError, "Output sink is not writable"});
    }

    SinkContext context{.out = &out};
    const int rc = md_html(markdown.data(), static_cast<MD_SIZE>(markdown.size()), &writeToSink, &context,
                           parserFlags(options), MD_HTML_FLAG_SKIP_UTF8_BOM);

    if (context.failed) {
        return std::unexpected(PipelineError{ErrorKind::RenderError, "Failed while writing HTML to the output sink"});
    }
    if (rc != 0) {
        return std::unexpected(
            PipelineError{ErrorKind::RenderError, std::format("Markdown engine failed (code {})", rc)});
    }
    return {};
}

}  // namespace mdview::render
