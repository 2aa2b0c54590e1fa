#include "SourceTree.hpp"
#include "cli/Commands.hpp"

#include <nlohmann/json.hpp>

using namespace pith::cli;
using namespace pith::project;

class StatusTest : public SourceTreeTest {
protected:
    Args argsFor(const std::string& command) const {
        auto args = parseArgs({command, root.string()});
        args.output = root / "public";
        return args;
    }
};

TEST_F(StatusTest, ProjectSerializesToJson) {
    write("_pith/config.yaml", "attributes:\n  assume_content_negotiation: true\n");
    write("about.html", "about");

    Project project(root);
    project.sync();
    const nlohmann::json j = project;

    EXPECT_EQ(j.at("source_root"), project.sourceRoot().string());
    EXPECT_EQ(j.at("output_root"), project.outputRoot().string());
    EXPECT_EQ(j.at("build_generation"), 0);
    EXPECT_FALSE(j.at("has_errors").get<bool>());

    ASSERT_EQ(j.at("entries").size(), 2u);
    EXPECT_EQ(j["entries"][0]["path"], "_pith/config.yaml");
    EXPECT_TRUE(j["entries"][0]["control_file"].get<bool>());
    EXPECT_TRUE(j["entries"][0]["artifact"].is_null());
    EXPECT_EQ(j["entries"][1]["artifact"], "about.html");

    ASSERT_EQ(j.at("artifacts").size(), 1u);
    EXPECT_EQ(j["artifacts"][0]["href"], "about");
    EXPECT_EQ(j["artifacts"][0]["renderer"], "copy");
    EXPECT_TRUE(j["artifacts"][0]["error"].is_null());
    EXPECT_TRUE(j["artifacts"][0]["dependencies"].empty());
}

TEST_F(StatusTest, TextStatusListsEntries) {
    write("index.html.tmpl", "home");
    write("_pith/config.yaml", "");

    std::ostringstream out, err;
    EXPECT_EQ(runStatus(argsFor("status"), out, err), exit_code::OK);

    EXPECT_NE(out.str().find("index.html.tmpl -> index.html [template]"), std::string::npos);
    EXPECT_NE(out.str().find("_pith/config.yaml (no output)"), std::string::npos);
}

TEST_F(StatusTest, JsonStatusParses) {
    write("a.txt", "a");

    auto args = argsFor("status");
    args.json = true;
    std::ostringstream out, err;
    ASSERT_EQ(runStatus(args, out, err), exit_code::OK);

    const auto j = nlohmann::json::parse(out.str());
    EXPECT_EQ(j.at("artifacts").size(), 1u);
}

TEST_F(StatusTest, BuildReportsFailures) {
    write("ok.html", "ok");
    write("broken.html.tmpl", "{{ nope }}");

    std::ostringstream out, err;
    EXPECT_EQ(runBuild(argsFor("build"), out, err), exit_code::BUILD_FAILED);

    EXPECT_NE(err.str().find("FAILED broken.html"), std::string::npos);
    EXPECT_NE(out.str().find("Built 1 of 2 artifacts"), std::string::npos);
    EXPECT_TRUE(fs::exists(root / "public" / "ok.html"));
}

TEST_F(StatusTest, CleanBuildSucceeds) {
    write("ok.html", "ok");

    std::ostringstream out, err;
    EXPECT_EQ(runBuild(argsFor("build"), out, err), exit_code::OK);
    EXPECT_TRUE(err.str().empty());
}
