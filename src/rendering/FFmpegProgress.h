#pragma once
#include <JuceHeader.h>

/**
 * Helpers for turning FFmpeg's unstructured stderr into progress numbers
 * and for keeping a bounded tail of that output.
 */
namespace FFmpegProgress
{
    /** Progress never exceeds this until the process has exited cleanly. */
    constexpr int maxRunningPercent = 95;

    /**
     * Finds the last "time=HH:MM:SS.cc" timestamp in a chunk of output.
     *
     * @return the timestamp in seconds, or -1.0 when the chunk carries none
     *         (including "time=N/A" lines written before the first frame).
     */
    double parseTimeSeconds(const juce::String& output);

    /** round(seconds / total * 100) clamped to [0, maxRunningPercent]. */
    int toPercent(double seconds, double totalSeconds);
}

//==============================================================================
/**
 * Keeps only the most recent N characters of appended text.
 */
class BoundedLogTail
{
public:
    static constexpr int defaultCapacity = 12000;

    explicit BoundedLogTail(int maxCharacters = defaultCapacity);

    void append(const juce::String& text);
    void clear();

    juce::String getText() const;

    /** The last n characters only */
    juce::String getLast(int numCharacters) const;

    /** Clips text to its trailing maxCharacters */
    static juce::String clip(const juce::String& text, int maxCharacters);

private:
    int capacity;
    juce::String text;
    juce::CriticalSection lock;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(BoundedLogTail)
};
