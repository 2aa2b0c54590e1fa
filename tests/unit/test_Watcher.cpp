#include "SourceTree.hpp"
#include "config/Api.hpp"
#include "services/Watcher.hpp"

#include <stdexcept>
#include <thread>

using namespace pith::project;
using namespace pith::services;
using namespace std::chrono_literals;

class WatcherTest : public SourceTreeTest {};

TEST_F(WatcherTest, RejectsBadArguments) {
    EXPECT_THROW(Watcher(nullptr, 1s), std::invalid_argument);
    EXPECT_THROW(Watcher(std::make_shared<Project>(root), 0s), std::invalid_argument);
}

TEST_F(WatcherTest, BuildsFirstTickThenOnlyOnChange) {
    write("index.html", "home");

    Watcher watcher(std::make_shared<Project>(root), 5s);
    const auto t0 = Watcher::Clock::now();

    EXPECT_TRUE(watcher.tick(t0));
    EXPECT_EQ(watcher.builds(), 1u);
    EXPECT_FALSE(watcher.tick(t0 + 1s));
    EXPECT_FALSE(watcher.tick(t0 + 5s));

    write("about.html", "about");
    EXPECT_TRUE(watcher.tick(t0 + 10s));
    EXPECT_EQ(watcher.builds(), 2u);

    watcher.withProject([](Project& project) {
        EXPECT_NE(project.artifact("about.html"), nullptr);
        EXPECT_TRUE(fs::exists(project.outputRoot() / "about.html"));
        EXPECT_EQ(project.buildGeneration(), 2u);
    });
}

TEST_F(WatcherTest, RebuildsWhenIncludedPartialChanges) {
    write("_header.html", "v1");
    write("page.html.tmpl", "{{ include _header.html }}");

    auto project = std::make_shared<Project>(root);
    const auto output = project->outputRoot() / "page.html";
    Watcher watcher(project, 5s);
    const auto t0 = Watcher::Clock::now();

    ASSERT_TRUE(watcher.tick(t0));
    ASSERT_EQ(read(output), "v1");

    touch("_header.html", "v2");
    EXPECT_TRUE(watcher.tick(t0 + 10s));
    EXPECT_EQ(read(output), "v2");
    EXPECT_FALSE(watcher.tick(t0 + 20s));
}

TEST_F(WatcherTest, FailedCycleWaitsOneInterval) {
    write("index.html", "home");

    auto project = std::make_shared<Project>(root);
    int attempts = 0;
    project->onConfigure([&attempts](pith::config::Api&) {
        ++attempts;
        throw std::runtime_error("broken hook");
    });

    Watcher watcher(project, 5s);
    const auto t0 = Watcher::Clock::now();

    EXPECT_FALSE(watcher.tick(t0));
    EXPECT_FALSE(watcher.tick(t0 + 100ms));
    EXPECT_FALSE(watcher.tick(t0 + 4s));
    EXPECT_EQ(attempts, 1);

    EXPECT_FALSE(watcher.tick(t0 + 5s));
    EXPECT_EQ(attempts, 2);
}

TEST_F(WatcherTest, ConfigurationErrorSkipsCycle) {
    write("_pith/config.yaml", "bogus: true\n");

    Watcher watcher(std::make_shared<Project>(root), 1s);
    EXPECT_FALSE(watcher.tick(Watcher::Clock::now()));
    EXPECT_EQ(watcher.builds(), 0u);
}

TEST_F(WatcherTest, BackgroundLoopBuilds) {
    write("index.html", "home");

    Watcher watcher(std::make_shared<Project>(root), 1s);
    watcher.start();

    const auto deadline = std::chrono::steady_clock::now() + 5s;
    while (watcher.builds() == 0 && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(20ms);

    watcher.stop();
    EXPECT_GE(watcher.builds(), 1u);
    EXPECT_FALSE(watcher.isRunning());
}
