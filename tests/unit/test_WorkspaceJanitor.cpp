#include "workspace/WorkspaceJanitor.h"
#include "TestSupport.h"

#include <doctest/doctest.h>

using TestSupport::TempDirectory;

TEST_SUITE("WorkspaceJanitor") {

TEST_CASE("Render ids are restricted to path-safe characters") {
    CHECK(WorkspaceJanitor::isValidRenderId("0f8c2b7e-1a2b-4c3d-9e8f-001122334455"));
    CHECK(WorkspaceJanitor::isValidRenderId("render_1"));
    CHECK_FALSE(WorkspaceJanitor::isValidRenderId({}));
    CHECK_FALSE(WorkspaceJanitor::isValidRenderId("../escape"));
    CHECK_FALSE(WorkspaceJanitor::isValidRenderId("a/b"));
    CHECK_FALSE(WorkspaceJanitor::isValidRenderId(juce::String::repeatedString("a", 129)));
}

TEST_CASE("Workspaces are created empty and removed by cleanup") {
    TempDirectory root;
    WorkspaceJanitor janitor(root.getFile());

    juce::File workspace;
    REQUIRE(janitor.createWorkspace("job-1", workspace).wasOk());
    CHECK(workspace == root / "render_job-1");
    CHECK(workspace.isDirectory());

    REQUIRE(workspace.getChildFile("leftover.png").replaceWithText("x"));

    // A retry with the same id starts from scratch.
    juce::File again;
    REQUIRE(janitor.createWorkspace("job-1", again).wasOk());
    CHECK(again == workspace);
    CHECK_FALSE(again.getChildFile("leftover.png").exists());

    CHECK(janitor.cleanup("job-1"));
    CHECK_FALSE(workspace.exists());
    CHECK(janitor.cleanup("job-1"));

    CHECK(janitor.createWorkspace("../bad", workspace).failed());
}

TEST_CASE("Sweep removes only expired workspaces and spooled artifacts") {
    TempDirectory root;
    WorkspaceJanitor janitor(root.getFile());

    juce::File old, fresh;
    REQUIRE(janitor.createWorkspace("old", old).wasOk());
    REQUIRE(janitor.createWorkspace("fresh", fresh).wasOk());
    REQUIRE(old.getChildFile("clip_000.mp4").replaceWithText("x"));

    const juce::File oldArtifact = janitor.getSpooledArtifact("old-video");
    const juce::File freshArtifact = janitor.getSpooledArtifact("fresh-video");
    REQUIRE(janitor.getSpoolDirectory().createDirectory().wasOk());
    REQUIRE(oldArtifact.replaceWithText("mp4"));
    REQUIRE(freshArtifact.replaceWithText("mp4"));

    // Something that is not a workspace is never touched.
    const juce::File unrelated = root / "keep_me";
    REQUIRE(unrelated.createDirectory().wasOk());

    const juce::Time twoDaysAgo = juce::Time::getCurrentTime() - juce::RelativeTime::days(2);
    REQUIRE(old.setLastModificationTime(twoDaysAgo));
    REQUIRE(oldArtifact.setLastModificationTime(twoDaysAgo));
    REQUIRE(unrelated.setLastModificationTime(twoDaysAgo));

    CHECK(janitor.sweep(juce::RelativeTime::hours(24)) == 2);

    CHECK_FALSE(old.exists());
    CHECK(fresh.isDirectory());
    CHECK_FALSE(oldArtifact.exists());
    CHECK(freshArtifact.existsAsFile());
    CHECK(unrelated.isDirectory());
}

TEST_CASE("Sweeping a missing root is a no-op") {
    TempDirectory root;
    WorkspaceJanitor janitor(root / "does-not-exist");
    CHECK(janitor.sweep(juce::RelativeTime::hours(1)) == 0);
}

TEST_CASE("Spooled artifacts can be removed") {
    TempDirectory root;
    WorkspaceJanitor janitor(root.getFile());

    CHECK(janitor.getSpooledArtifact("../x") == juce::File());

    const juce::File artifact = janitor.getSpooledArtifact("r1");
    REQUIRE(janitor.getSpoolDirectory().createDirectory().wasOk());
    REQUIRE(artifact.replaceWithText("mp4"));

    CHECK(janitor.removeSpooledArtifact("r1"));
    CHECK_FALSE(artifact.exists());
    CHECK(janitor.removeSpooledArtifact("r1"));
}

}
