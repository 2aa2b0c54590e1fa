#include "render/TemplateRenderer.hpp"
#include "project/Artifact.hpp"
#include "project/HelperRegistry.hpp"
#include "project/Project.hpp"
#include "util/files.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/tokenizer.hpp>
#include <fmt/core.h>
#include <stdexcept>

using namespace pith::render;
using namespace pith::project;

namespace fs = std::filesystem;

bool TemplateRenderer::handles(const fs::path& sourcePath) const {
    return sourcePath.extension() == EXTENSION && !sourcePath.stem().empty();
}

fs::path TemplateRenderer::outputPath(const fs::path& sourcePath) const {
    auto out = sourcePath.lexically_normal();
    out.replace_extension();
    return out;
}

std::string TemplateRenderer::render(const Context& ctx) const {
    const auto source = util::readFileToString(ctx.project.sourceRoot() / ctx.artifact.sourcePath());
    return expand(source, *ctx.project.helpers(), HelperCall{ctx.project, &ctx.artifact, {}});
}

std::string TemplateRenderer::expand(const std::string_view text,
                                     const HelperRegistry& helpers,
                                     const HelperCall& base) {
    std::string out;
    out.reserve(text.size());
    size_t pos = 0;

    while (pos < text.size()) {
        const auto open = text.find("{{", pos);
        if (open == std::string_view::npos) {
            out.append(text.substr(pos));
            break;
        }

        out.append(text.substr(pos, open - pos));

        const auto close = text.find("}}", open + 2);
        if (close == std::string_view::npos)
            throw std::runtime_error(fmt::format("Unterminated '{{{{' at offset {}", open));

        auto tokens = tokenize(std::string(text.substr(open + 2, close - open - 2)));
        if (tokens.empty()) throw std::runtime_error(fmt::format("Empty expression at offset {}", open));

        HelperCall call{base.project, base.artifact, {}};
        call.args.assign(std::make_move_iterator(tokens.begin() + 1), std::make_move_iterator(tokens.end()));
        out += helpers.call(tokens.front(), call);

        pos = close + 2;
    }

    return out;
}

std::vector<std::string> TemplateRenderer::tokenize(const std::string& expression) {
    using Separator = boost::escaped_list_separator<char>;

    std::vector<std::string> tokens;
    const auto trimmed = boost::algorithm::trim_copy(expression);
    const boost::tokenizer<Separator> tok(trimmed, Separator(std::string("\\"), std::string(" \t\r\n"), std::string("\"")));

    for (const auto& token : tok)
        if (!token.empty()) tokens.push_back(token);

    return tokens;
}
