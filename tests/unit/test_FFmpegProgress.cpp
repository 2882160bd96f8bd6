#include "rendering/FFmpegProgress.h"
#include "rendering/ProgressReporter.h"
#include "TestSupport.h"

#include <doctest/doctest.h>

#include <thread>

using TestSupport::RecordingSink;

TEST_SUITE("FFmpegProgress") {

TEST_CASE("Parses the last time= stamp of a chunk") {
    CHECK(FFmpegProgress::parseTimeSeconds("frame=  75 fps=25 time=00:00:02.50 bitrate=N/A") == doctest::Approx(2.5));
    CHECK(FFmpegProgress::parseTimeSeconds("time=00:00:01.00 x\ntime=00:01:03.25 y") == doctest::Approx(63.25));
    CHECK(FFmpegProgress::parseTimeSeconds("time=01:00:00 end") == doctest::Approx(3600.0));
}

TEST_CASE("Chunks without a usable stamp report nothing") {
    CHECK(FFmpegProgress::parseTimeSeconds("time=N/A bitrate=N/A") < 0.0);
    CHECK(FFmpegProgress::parseTimeSeconds("Stream mapping:") < 0.0);
    CHECK(FFmpegProgress::parseTimeSeconds({}) < 0.0);
}

TEST_CASE("Percentages are capped below completion") {
    CHECK(FFmpegProgress::toPercent(5.0, 10.0) == 50);
    CHECK(FFmpegProgress::toPercent(9.9, 10.0) == 95);
    CHECK(FFmpegProgress::toPercent(20.0, 10.0) == 95);
    CHECK(FFmpegProgress::toPercent(3.0, 0.0) == 0);
    CHECK(FFmpegProgress::toPercent(-1.0, 10.0) == 0);
}

TEST_CASE("Bounded tail keeps the most recent characters") {
    BoundedLogTail tail(10);
    tail.append("0123456789");
    tail.append("abcdefghijklmno");

    CHECK(tail.getText() == "fghijklmno");
    CHECK(tail.getLast(3) == "mno");

    tail.clear();
    CHECK(tail.getText().isEmpty());
    CHECK(BoundedLogTail::clip("short", 10) == "short");
}

}

TEST_SUITE("ProgressReporter") {

TEST_CASE("Rising progress is written immediately and never goes back") {
    RecordingSink sink;
    juce::int64 now = 0;
    ProgressReporter reporter(sink, 1000, [&now] { return now; });

    reporter.update(10);
    reporter.update(7);
    reporter.update(25);

    CHECK(sink.getPercents() == juce::Array<int> { 10, 25 });
    CHECK(reporter.getReportedPercent() == 25);
}

TEST_CASE("Flat progress refreshes the log tail at most once per interval") {
    RecordingSink sink;
    juce::int64 now = 0;
    ProgressReporter reporter(sink, 1000, [&now] { return now; });

    reporter.update(10);
    REQUIRE(sink.getPercents().size() == 1);

    now = 200;
    reporter.appendOutput("frame=1\n");
    now = 400;
    reporter.appendOutput("frame=2\n");
    CHECK(sink.getPercents().size() == 1);

    now = 1300;
    reporter.appendOutput("frame=3\n");
    REQUIRE(sink.getPercents().size() == 2);
    CHECK(sink.getPercents()[1] == 10);
    CHECK(sink.getDeltas()[1] == "frame=1\nframe=2\nframe=3\n");

    CHECK(reporter.getTail() == "frame=1\nframe=2\nframe=3\n");
}

TEST_CASE("Flush writes pending output regardless of the interval") {
    RecordingSink sink;
    juce::int64 now = 0;
    ProgressReporter reporter(sink, 1000, [&now] { return now; });

    reporter.update(40);
    reporter.appendOutput("last words");
    CHECK(sink.getPercents().size() == 1);

    reporter.flush();
    REQUIRE(sink.getPercents().size() == 2);
    CHECK(sink.getDeltas()[1] == "last words");

    // Nothing left to write.
    reporter.flush();
    CHECK(sink.getPercents().size() == 2);
}

TEST_CASE("A slow sink does not hold up other encoders") {
    struct SlowSink : RecordingSink {
        void progress(int percent, const juce::String& logTailDelta) override {
            entered.signal();
            release.wait(5000);
            RecordingSink::progress(percent, logTailDelta);
        }

        juce::WaitableEvent entered;
        juce::WaitableEvent release;
    };

    SlowSink sink;
    ProgressReporter reporter(sink, 1000, [] { return (juce::int64) 0; });

    std::thread writer([&reporter] { reporter.update(10); });
    REQUIRE(sink.entered.wait(2000));

    // The write for 10% is still in flight; this must neither block nor be lost.
    const auto startMs = juce::Time::getMillisecondCounter();
    reporter.update(30);
    reporter.appendOutput("frame=9\n");
    CHECK((int) (juce::Time::getMillisecondCounter() - startMs) < 1000);
    CHECK(reporter.getReportedPercent() == 10);

    sink.release.signal();
    writer.join();

    reporter.flush();
    CHECK(sink.getPercents() == juce::Array<int> { 10, 30 });
    CHECK(sink.getDeltas()[1] == "frame=9\n");
}

}
