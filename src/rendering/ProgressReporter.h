#pragma once
#include <JuceHeader.h>
#include "FFmpegProgress.h"
#include "../jobs/RenderJobSink.h"

/**
 * Throttles progress and log-tail writes for one job.
 *
 * A write goes to the sink whenever the percentage rises, or at least once
 * per interval while it stays flat so the stored log tail stays fresh.
 * Reported values never go backwards. Safe to call from several encode
 * threads at once: the sink is called outside the state lock, one write at a
 * time, and a thread that finds a write in flight leaves its data buffered
 * for the next one instead of waiting.
 */
class ProgressReporter
{
public:
    static constexpr int defaultIntervalMs = 1000;
    static constexpr int maxDeltaCharacters = 1500;

    ProgressReporter(RenderJobSink& sink,
                     int intervalMs = defaultIntervalMs,
                     std::function<juce::int64()> clock = {});

    /** Offers a new percentage; lower values than already reported are ignored. */
    void update(int percent);

    /** Buffers encoder output for the next write. */
    void appendOutput(const juce::String& text);

    /** Writes anything still buffered regardless of the interval. */
    void flush();

    int getReportedPercent() const;

    /** Everything appended so far, bounded. */
    juce::String getTail() const { return tail.getText(); }

private:
    void deliver(bool force);
    void writeIfDue(bool force);

    RenderJobSink& sink;
    const int intervalMs;
    std::function<juce::int64()> clock;

    juce::CriticalSection writeLock;
    juce::CriticalSection lock;
    int reportedPercent { 0 };
    int pendingPercent { 0 };
    juce::int64 lastWriteMs { 0 };
    bool hasWritten { false };
    juce::String pendingDelta;
    BoundedLogTail tail;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ProgressReporter)
};
