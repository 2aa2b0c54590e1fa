#pragma once

#include "project/Artifact.hpp"
#include "project/Entry.hpp"
#include "project/Project.hpp"

#include <gtest/gtest.h>
#include <fmt/core.h>
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

// Fresh temporary directory per test, removed afterwards.
class SourceTreeTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        root = fs::temp_directory_path() /
               fmt::format("pith_{}_{}_{}", info->test_suite_name(), info->name(), ::getpid());
        fs::remove_all(root);
        fs::create_directories(root);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void write(const fs::path& rel, const std::string& content = "") const {
        const auto path = root / rel;
        fs::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << content;
    }

    // Rewrites a file and pushes its mtime forward so the change is visible
    // regardless of filesystem timestamp granularity.
    void touch(const fs::path& rel, const std::string& content) const {
        const auto before = fs::last_write_time(root / rel);
        write(rel, content);
        fs::last_write_time(root / rel, before + std::chrono::seconds(10));
    }

    void remove(const fs::path& rel) const { fs::remove_all(root / rel); }

    static std::string read(const fs::path& path) {
        std::ifstream in(path, std::ios::binary);
        std::stringstream buffer;
        buffer << in.rdbuf();
        return buffer.str();
    }

    static std::set<std::string> entryKeys(const pith::project::Project& project) {
        std::set<std::string> keys;
        for (const auto& entry : project.entries()) keys.insert(entry->path().generic_string());
        return keys;
    }

    static std::set<std::string> artifactKeys(const pith::project::Project& project) {
        std::set<std::string> keys;
        for (const auto& artifact : project.artifacts()) keys.insert(artifact->path().generic_string());
        return keys;
    }

    // Every registered artifact belongs to exactly one current entry.
    static void expectArtifactsOwned(const pith::project::Project& project) {
        for (const auto& artifact : project.artifacts()) {
            int owners = 0;
            for (const auto& entry : project.entries())
                if (entry->artifact() == artifact) ++owners;
            EXPECT_EQ(owners, 1) << artifact->path();
        }
    }
};
