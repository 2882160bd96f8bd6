#include "FFmpegProgress.h"

namespace FFmpegProgress
{
    namespace
    {
        bool isDigit(juce::juce_wchar c)
        {
            return c >= '0' && c <= '9';
        }

        // Accepts HH:MM:SS or HH:MM:SS.fraction at the start of text.
        double parseClock(const juce::String& text)
        {
            if (text.length() < 8)
                return -1.0;

            for (int i : { 0, 1, 3, 4, 6, 7 })
                if (!isDigit(text[i]))
                    return -1.0;

            if (text[2] != ':' || text[5] != ':')
                return -1.0;

            int end = 8;
            if (text[end] == '.')
            {
                ++end;
                while (end < text.length() && isDigit(text[end]))
                    ++end;
            }

            const double hours = text.substring(0, 2).getDoubleValue();
            const double minutes = text.substring(3, 5).getDoubleValue();
            const double seconds = text.substring(6, end).getDoubleValue();
            return hours * 3600.0 + minutes * 60.0 + seconds;
        }
    }

    double parseTimeSeconds(const juce::String& output)
    {
        double latest = -1.0;
        int searchFrom = 0;

        for (;;)
        {
            const int pos = output.indexOf(searchFrom, "time=");
            if (pos < 0)
                break;

            const double seconds = parseClock(output.substring(pos + 5).trimStart());
            if (seconds >= 0.0)
                latest = seconds;

            searchFrom = pos + 5;
        }

        return latest;
    }

    int toPercent(double seconds, double totalSeconds)
    {
        if (seconds <= 0.0 || totalSeconds <= 0.0)
            return 0;

        const int percent = juce::roundToInt(seconds / totalSeconds * 100.0);
        return juce::jlimit(0, maxRunningPercent, percent);
    }
}

//==============================================================================
BoundedLogTail::BoundedLogTail(int maxCharacters)
    : capacity(juce::jmax(1, maxCharacters))
{
}

void BoundedLogTail::append(const juce::String& newText)
{
    if (newText.isEmpty())
        return;

    juce::ScopedLock sl(lock);
    text = clip(text + newText, capacity);
}

void BoundedLogTail::clear()
{
    juce::ScopedLock sl(lock);
    text.clear();
}

juce::String BoundedLogTail::getText() const
{
    juce::ScopedLock sl(lock);
    return text;
}

juce::String BoundedLogTail::getLast(int numCharacters) const
{
    juce::ScopedLock sl(lock);
    return clip(text, numCharacters);
}

juce::String BoundedLogTail::clip(const juce::String& source, int maxCharacters)
{
    if (maxCharacters <= 0)
        return {};

    if (source.length() <= maxCharacters)
        return source;

    return source.substring(source.length() - maxCharacters);
}
