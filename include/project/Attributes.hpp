#pragma once

#include <filesystem>
#include <string>

namespace pith::project {

struct Attributes {
    bool assume_content_negotiation = false;  // link to "about" rather than "about.html"
    bool assume_directory_index = false;      // link to "docs/" rather than "docs/index.html"
};

// Public href of an output path relative to the output root.
std::string hrefFor(const std::filesystem::path& outputPath, const Attributes& attributes);

}
