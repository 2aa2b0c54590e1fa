#include "SourceTree.hpp"
#include "project/HelperRegistry.hpp"

#include <stdexcept>

using namespace pith::project;

class HelperRegistryTest : public SourceTreeTest {};

TEST_F(HelperRegistryTest, DefineAndCall) {
    const Project project(root);
    HelperRegistry registry;

    registry.define("join", [](const HelperCall& call) {
        std::string out;
        for (const auto& arg : call.args) out += arg;
        return out;
    });

    ASSERT_TRUE(registry.contains("join"));
    ASSERT_NE(registry.find("join"), nullptr);
    EXPECT_EQ(registry.call("join", HelperCall{project, nullptr, {"a", "b"}}), "ab");
}

TEST_F(HelperRegistryTest, RedefineReplaces) {
    const Project project(root);
    HelperRegistry registry;

    registry.define("x", [](const HelperCall&) { return std::string("one"); });
    registry.define("x", [](const HelperCall&) { return std::string("two"); });

    EXPECT_EQ(registry.size(), 1u);
    EXPECT_EQ(registry.call("x", HelperCall{project}), "two");
}

TEST_F(HelperRegistryTest, RemoveAndNames) {
    HelperRegistry registry;
    const auto noop = [](const HelperCall&) { return std::string(); };
    registry.define("zeta", noop);
    registry.define("alpha", noop);
    registry.define("mid", noop);

    EXPECT_EQ(registry.names(), (std::vector<std::string>{"alpha", "mid", "zeta"}));
    EXPECT_TRUE(registry.remove("mid"));
    EXPECT_FALSE(registry.remove("mid"));
    EXPECT_EQ(registry.find("mid"), nullptr);
}

TEST_F(HelperRegistryTest, RejectsBadDefinitions) {
    HelperRegistry registry;
    EXPECT_THROW(registry.define("", [](const HelperCall&) { return std::string(); }), std::invalid_argument);
    EXPECT_THROW(registry.define("two words", [](const HelperCall&) { return std::string(); }), std::invalid_argument);
    EXPECT_THROW(registry.define("empty", nullptr), std::invalid_argument);
}

TEST_F(HelperRegistryTest, UnknownHelperThrows) {
    const Project project(root);
    const HelperRegistry registry;
    EXPECT_THROW(registry.call("ghost", HelperCall{project}), std::runtime_error);
}

TEST_F(HelperRegistryTest, ProjectRegistersBuiltins) {
    const Project project(root);
    EXPECT_TRUE(project.helpers()->contains("include"));
    EXPECT_TRUE(project.helpers()->contains("href"));
    EXPECT_THROW(project.helpers()->call("href", HelperCall{project}), std::invalid_argument);
}
