#include "ProgressReporter.h"

ProgressReporter::ProgressReporter(RenderJobSink& targetSink, int interval, std::function<juce::int64()> clockSource)
    : sink(targetSink),
      intervalMs(interval),
      clock(std::move(clockSource))
{
    if (!clock)
        clock = [] { return juce::Time::currentTimeMillis(); };
}

void ProgressReporter::update(int percent)
{
    {
        juce::ScopedLock sl(lock);

        if (percent > pendingPercent)
            pendingPercent = percent;
    }

    deliver(false);
}

void ProgressReporter::appendOutput(const juce::String& text)
{
    if (text.isEmpty())
        return;

    {
        juce::ScopedLock sl(lock);
        tail.append(text);
        pendingDelta = BoundedLogTail::clip(pendingDelta + text, maxDeltaCharacters);
    }

    deliver(false);
}

void ProgressReporter::flush()
{
    deliver(true);
}

int ProgressReporter::getReportedPercent() const
{
    juce::ScopedLock sl(lock);
    return reportedPercent;
}

void ProgressReporter::deliver(bool force)
{
    if (force)
    {
        juce::ScopedLock writing(writeLock);
        writeIfDue(true);
        return;
    }

    juce::ScopedTryLock writing(writeLock);
    if (writing.isLocked())
        writeIfDue(false);
}

void ProgressReporter::writeIfDue(bool force)
{
    int percent = 0;
    juce::String delta;

    {
        juce::ScopedLock sl(lock);

        const juce::int64 now = clock();
        const bool rising = pendingPercent > reportedPercent;
        const bool intervalElapsed = !hasWritten || (now - lastWriteMs) >= intervalMs;

        if (force && !rising && pendingDelta.isEmpty())
            return;

        if (!force && !rising && !(intervalElapsed && pendingDelta.isNotEmpty()))
            return;

        reportedPercent = juce::jmax(reportedPercent, pendingPercent);
        percent = reportedPercent;
        delta = pendingDelta;

        pendingDelta.clear();
        lastWriteMs = now;
        hasWritten = true;
    }

    sink.progress(percent, delta);
}
