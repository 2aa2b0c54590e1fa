#include "core/Scanner.hpp"
#include "util/fsPath.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>

using namespace pith::core;
using namespace pith::util;

Scanner::Scanner(fs::path root, fs::path excluded, std::shared_ptr<spdlog::logger> log)
    : root_(std::move(root)), excluded_(std::move(excluded)), log_(std::move(log)) {}

std::vector<fs::path> Scanner::scan(const Filter& admit) const {
    std::vector<fs::path> files;

    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        log_->warn("[Scanner] Source root is not a directory: {}", root_.string());
        return files;
    }

    fs::recursive_directory_iterator it(root_, fs::directory_options::skip_permission_denied, ec);
    for (const fs::recursive_directory_iterator end{}; !ec && it != end; it.increment(ec)) {
        const auto& dirEntry = *it;

        std::error_code statEc;
        const bool isDirectory = dirEntry.is_directory(statEc);

        if (isUnder(dirEntry.path(), excluded_)) {
            if (isDirectory) it.disable_recursion_pending();
            continue;
        }

        const auto rel = dirEntry.path().lexically_relative(root_);
        if (admit && !admit(rel, isDirectory)) {
            if (isDirectory) it.disable_recursion_pending();
            continue;
        }

        if (!isDirectory && dirEntry.is_regular_file(statEc)) files.push_back(rel);
        else if (statEc) log_->warn("[Scanner] Skipping {}: {}", dirEntry.path().string(), statEc.message());
    }

    if (ec) log_->error("[Scanner] Walk of {} stopped early: {}", root_.string(), ec.message());

    std::ranges::sort(files);
    return files;
}
