#include "project/Attributes.hpp"

namespace fs = std::filesystem;

std::string pith::project::hrefFor(const fs::path& outputPath, const Attributes& attributes) {
    const auto path = outputPath.lexically_normal();

    if (attributes.assume_directory_index && path.filename() == "index.html") {
        const auto dir = path.parent_path();
        return dir.empty() ? "./" : dir.generic_string() + "/";
    }

    auto href = path.generic_string();
    if (attributes.assume_content_negotiation && path.extension() == ".html")
        href.resize(href.size() - path.extension().string().size());
    return href;
}
