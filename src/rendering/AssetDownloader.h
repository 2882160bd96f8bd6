#pragma once
#include <JuceHeader.h>

/**
 * Fetches remote media into the job workspace with a bounded time budget.
 *
 * http(s) URLs are fetched through juce::URL; any non-2xx status, connection
 * failure, body shorter than its Content-Length or budget overrun fails the
 * download and removes the partial file.
 * file:// URLs and absolute paths are copied only when local files are
 * allowed, which is how locally generated clips are picked up in development.
 */
class AssetDownloader
{
public:
    static constexpr int defaultTimeoutSeconds = 60;

    explicit AssetDownloader(int timeoutSeconds = defaultTimeoutSeconds, bool allowLocalFiles = false);

    /** Downloads never run past this time, even if their own budget allows it. */
    void setDeadline(juce::Time deadline);

    juce::Result download(const juce::String& url, const juce::File& destination) const;

    static bool isRemoteUrl(const juce::String& url);

    /** Maps a file:// URL or absolute path onto a File, or returns a null File. */
    static juce::File localFileFor(const juce::String& url);

private:
    int effectiveTimeoutMs() const;

    int timeoutSeconds;
    bool allowLocalFiles;
    juce::Time deadline;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(AssetDownloader)
};
