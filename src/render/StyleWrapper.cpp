#include "mdview/render/StyleWrapper.hpp"

#include "mdview/common/FileIo.hpp"
#include "mdview/render/HtmlTemplate.hpp"

#include <format>
#include <utility>

namespace mdview::render {
namespace {

constexpr std::string_view kPreamble = "<html>\n"
                                       "<head>\n"
                                       "<meta charset=\"utf-8\">\n"
                                       "<style>\n"
                                       "{{css}}\n"
                                       "</style>\n"
                                       "</head>\n"
                                       "<body>\n"
                                       "<article class=\"markdown-body\">\n";

constexpr std::string_view kSuffix = "\n</article>\n"
                                     "</body>\n"
                                     "</html>";

std::expected<void, PipelineError> writeAll(std::ostream& out, std::string_view text, std::string_view what) {
    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    if (!out.good()) {
        return std::unexpected(
            PipelineError{ErrorKind::RenderError, std::format("Failed while writing {} to the output sink", what)});
    }
    return {};
}

}  // namespace

std::string_view documentPreambleTemplate() {
    return kPreamble;
}

std::string_view documentSuffix() {
    return kSuffix;
}

std::expected<std::string, PipelineError> buildPreamble(std::string_view css) {
    TemplateValues values;
    values.emplace("css", TemplateValue{SlotContext::Css, std::string(css)});
    return expandTemplate(kPreamble, values);
}

std::expected<std::string, PipelineError> loadStylesheet(const std::optional<std::filesystem::path>& path) {
    if (!path.has_value()) {
        return std::string(githubMarkdownCss());
    }

    auto css = common::readFile(*path);
    if (!css.has_value()) {
        return std::unexpected(
            PipelineError{ErrorKind::TemplateError, std::format("Cannot read stylesheet: {}", css.error())});
    }
    return std::move(*css);
}

StyleWrapper::StyleWrapper(std::string css) : css_(std::move(css)) {}

std::expected<void, PipelineError> StyleWrapper::begin(std::ostream& out) const {
    // Build fully before writing so a template failure leaves the sink untouched.
    auto preamble = buildPreamble(css_);
    if (!preamble.has_value()) {
        return std::unexpected(preamble.error());
    }
    return writeAll(out, *preamble, "document preamble");
}

std::expected<void, PipelineError> StyleWrapper::finish(std::ostream& out) const {
    return writeAll(out, kSuffix, "document suffix");
}

}  // namespace mdview::render
