#include "SourceTree.hpp"
#include "config/Api.hpp"
#include "config/ConfigRunner.hpp"
#include "project/HelperRegistry.hpp"
#include "project/errors.hpp"

using namespace pith::config;
using namespace pith::project;

class ConfigRunnerTest : public SourceTreeTest {};

TEST_F(ConfigRunnerTest, AppliesAllSections) {
    Project project(root);
    Api api(project);

    ConfigRunner::apply(YAML::Load("ignore: '*.log'\n"
                                   "attributes:\n"
                                   "  assume_content_negotiation: true\n"
                                   "helpers:\n"
                                   "  year: '2024'\n"
                                   "  wrap: '<{0}>{1}</{0}>'\n"),
                        api);

    EXPECT_TRUE(project.ignorePatterns().contains("*.log"));
    EXPECT_TRUE(project.attributes().assume_content_negotiation);
    EXPECT_EQ(project.helpers()->call("year", HelperCall{project}), "2024");
    EXPECT_EQ(project.helpers()->call("wrap", HelperCall{project, nullptr, {"b", "bold"}}), "<b>bold</b>");
}

TEST_F(ConfigRunnerTest, EmptyDocumentIsNoOp) {
    Project project(root);
    Api api(project);
    const auto before = project.ignorePatterns().size();

    ConfigRunner::apply(YAML::Node(), api);
    ConfigRunner::apply(YAML::Load("~"), api);

    EXPECT_EQ(project.ignorePatterns().size(), before);
}

TEST_F(ConfigRunnerTest, RejectsMalformedDocuments) {
    Project project(root);
    Api api(project);

    EXPECT_THROW(ConfigRunner::apply(YAML::Load("[a, b]"), api), ConfigurationError);
    EXPECT_THROW(ConfigRunner::apply(YAML::Load("bogus: 1"), api), ConfigurationError);
    EXPECT_THROW(ConfigRunner::apply(YAML::Load("attributes: [1]"), api), ConfigurationError);
    EXPECT_THROW(ConfigRunner::apply(YAML::Load("helpers: [x]"), api), ConfigurationError);
    EXPECT_THROW(ConfigRunner::apply(YAML::Load("helpers:\n  nested: {a: 1}\n"), api), ConfigurationError);
    EXPECT_THROW(ConfigRunner::apply(YAML::Load("ignore: [[nested]]"), api), ConfigurationError);
}

TEST_F(ConfigRunnerTest, ApiSettersValidate) {
    Project project(root);
    Api api(project);

    EXPECT_TRUE(Api::recognizes("ignore"));
    EXPECT_TRUE(Api::recognizes("assume_directory_index"));
    EXPECT_FALSE(Api::recognizes("theme"));

    api.set("assume_directory_index", YAML::Node(true)).ignore("*.tmp");
    EXPECT_TRUE(project.attributes().assume_directory_index);
    EXPECT_TRUE(project.ignorePatterns().contains("*.tmp"));

    EXPECT_THROW(api.set("theme", YAML::Node("dark")), ConfigurationError);
    EXPECT_THROW(api.set("assume_directory_index", YAML::Load("[true]")), ConfigurationError);
    EXPECT_THROW(api.ignore(""), ConfigurationError);
    EXPECT_THROW(api.helper("bad name", textHelper("x")), ConfigurationError);
}

TEST_F(ConfigRunnerTest, RunWithoutControlFileRunsHooksOnly) {
    Project project(root);
    ConfigRunner runner(project);
    int runs = 0;
    runner.addHook([&runs](Api& api) {
        ++runs;
        api.helper("answer", textHelper("42"));
    });

    runner.run();

    EXPECT_EQ(runner.hookCount(), 1u);
    EXPECT_EQ(runs, 1);
    EXPECT_EQ(project.helpers()->call("answer", HelperCall{project}), "42");
}

TEST_F(ConfigRunnerTest, TextHelperReportsMissingArguments) {
    Project project(root);
    const auto helper = textHelper("{0} and {1}");
    EXPECT_THROW(helper(HelperCall{project, nullptr, {"only"}}), std::exception);
}
