#include "rendering/FFmpegExecutor.h"
#include "TestSupport.h"

#include <doctest/doctest.h>

#include <thread>

using TestSupport::FakeEncoder;

TEST_SUITE("FFmpegExecutor") {

TEST_CASE("A non-zero exit is reported with the tail of the output") {
    FakeEncoder fake(FakeEncoder::Behaviour::fail);
    FFmpegExecutor executor(fake.getFFmpegPath(), fake.getFFprobePath());

    juce::Array<double> fractions;
    executor.setProgressCallback([&fractions](double fraction) { fractions.add(fraction); });

    const auto result = executor.execute({ "-i", "frame_000.png", "clip_000.mp4" }, 4.0);

    CHECK(result.started);
    CHECK(result.exitCode == 1);
    CHECK_FALSE(result.succeeded());
    CHECK_FALSE(result.timedOut);

    const juce::String message = result.describeFailure(executor.getFFmpegPath());
    CHECK(message.startsWith("FFmpeg exited with code 1. Log: "));
    CHECK(message.contains("Invalid data found when processing input"));
    CHECK(message.fromFirstOccurrenceOf("Log: ", false, false).length() <= FFmpegExecutor::errorTailCharacters);

    REQUIRE(fractions.size() == 1);
    CHECK(fractions[0] == doctest::Approx(0.25));

    const auto calls = fake.getCalls();
    REQUIRE(calls.size() == 1);
    CHECK(calls[0] == "-nostdin -i frame_000.png clip_000.mp4");
}

TEST_CASE("A missing binary never starts") {
    FFmpegExecutor executor("/nonexistent/musicreel/ffmpeg", "/nonexistent/musicreel/ffprobe");

    const auto result = executor.execute({ "-version" }, 0.0);

    CHECK_FALSE(result.started);
    CHECK_FALSE(result.succeeded());
    CHECK(result.describeFailure(executor.getFFmpegPath()) == "Failed to start FFmpeg: /nonexistent/musicreel/ffmpeg");
    CHECK(executor.getFileDuration(juce::File::getSpecialLocation(juce::File::currentExecutableFile)) == 0.0);
}

TEST_CASE("Commands still running at the deadline are killed") {
    FakeEncoder fake(FakeEncoder::Behaviour::hang);
    FFmpegExecutor executor(fake.getFFmpegPath(), fake.getFFprobePath());
    executor.setDeadline(juce::Time::getCurrentTime() + juce::RelativeTime::seconds(1));

    const auto startMs = juce::Time::getMillisecondCounter();
    const auto result = executor.execute({ "-i", "in.mp4", "out.mp4" }, 10.0);

    CHECK(result.started);
    CHECK(result.timedOut);
    CHECK_FALSE(result.cancelled);
    CHECK_FALSE(result.succeeded());
    CHECK((int) (juce::Time::getMillisecondCounter() - startMs) < 10000);
}

TEST_CASE("Cancelling stops a running command") {
    FakeEncoder fake(FakeEncoder::Behaviour::hang);
    FFmpegExecutor executor(fake.getFFmpegPath(), fake.getFFprobePath());

    std::thread canceller([&] {
        TestSupport::waitFor([&fake] { return fake.getCalls().size() == 1; });
        executor.cancelExecution();
    });

    const auto result = executor.execute({ "out.mp4" }, 10.0);
    canceller.join();

    CHECK(result.started);
    CHECK(result.cancelled);
    CHECK_FALSE(result.timedOut);
    CHECK_FALSE(result.succeeded());
}

TEST_CASE("A cancel that arrives before the command starts is kept") {
    FakeEncoder fake(FakeEncoder::Behaviour::succeed);
    FFmpegExecutor executor(fake.getFFmpegPath(), fake.getFFprobePath());

    executor.cancelExecution();
    const auto result = executor.execute({ "out.mp4" }, 1.0);

    CHECK_FALSE(result.started);
    CHECK(result.cancelled);
    CHECK(result.describeFailure(executor.getFFmpegPath()) == "FFmpeg was cancelled");
    CHECK(fake.getCalls().isEmpty());
}

}
