#pragma once

#include <filesystem>
#include <string>

namespace pith::util {

std::string readFileToString(const std::filesystem::path& path);

void writeFile(const std::filesystem::path& absPath, const std::string& contents);

}
