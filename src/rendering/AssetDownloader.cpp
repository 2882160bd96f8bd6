#include "AssetDownloader.h"

AssetDownloader::AssetDownloader(int timeout, bool localFiles)
    : timeoutSeconds(juce::jmax(1, timeout)),
      allowLocalFiles(localFiles)
{
}

void AssetDownloader::setDeadline(juce::Time newDeadline)
{
    deadline = newDeadline;
}

bool AssetDownloader::isRemoteUrl(const juce::String& url)
{
    return url.startsWithIgnoreCase("http://") || url.startsWithIgnoreCase("https://");
}

juce::File AssetDownloader::localFileFor(const juce::String& url)
{
    if (url.startsWithIgnoreCase("file://"))
        return juce::URL(url).getLocalFile();

    if (juce::File::isAbsolutePath(url))
        return juce::File(url);

    return {};
}

int AssetDownloader::effectiveTimeoutMs() const
{
    int timeoutMs = timeoutSeconds * 1000;

    if (deadline != juce::Time())
    {
        const juce::int64 remaining = deadline.toMilliseconds() - juce::Time::currentTimeMillis();
        timeoutMs = (int) juce::jlimit((juce::int64) 0, (juce::int64) timeoutMs, remaining);
    }

    return timeoutMs;
}

juce::Result AssetDownloader::download(const juce::String& url, const juce::File& destination) const
{
    if (url.trim().isEmpty())
        return juce::Result::fail("No URL given");

    if (!isRemoteUrl(url))
    {
        if (!allowLocalFiles)
            return juce::Result::fail("Local sources are disabled: " + url);

        const juce::File source = localFileFor(url);

        if (source == juce::File() || !source.existsAsFile())
            return juce::Result::fail("Source not found: " + url);

        if (!source.copyFileTo(destination))
            return juce::Result::fail("Cannot copy " + source.getFullPathName());

        return juce::Result::ok();
    }

    const int timeoutMs = effectiveTimeoutMs();
    if (timeoutMs <= 0)
        return juce::Result::fail("No time left in the render budget");

    const juce::uint32 startMs = juce::Time::getMillisecondCounter();
    int statusCode = 0;

    auto options = juce::URL::InputStreamOptions(juce::URL::ParameterHandling::inAddress)
                       .withConnectionTimeoutMs(timeoutMs)
                       .withNumRedirectsToFollow(5)
                       .withStatusCode(&statusCode);

    std::unique_ptr<juce::InputStream> stream = juce::URL(url).createInputStream(options);

    if (stream == nullptr)
        return juce::Result::fail(statusCode > 0 ? "HTTP " + juce::String(statusCode) : juce::String("Connection failed"));

    if (statusCode < 200 || statusCode >= 300)
        return juce::Result::fail("HTTP " + juce::String(statusCode));

    destination.deleteFile();

    bool timedOut = false;
    juce::int64 totalBytes = 0;
    const juce::int64 expectedBytes = stream->getTotalLength();

    {
        juce::FileOutputStream out(destination);
        if (!out.openedOk())
            return juce::Result::fail("Cannot write " + destination.getFullPathName());

        juce::HeapBlock<char> buffer(65536);

        while (!stream->isExhausted())
        {
            if ((int) (juce::Time::getMillisecondCounter() - startMs) > timeoutMs)
            {
                timedOut = true;
                break;
            }

            const int bytesRead = stream->read(buffer.get(), 65536);
            if (bytesRead <= 0)
                break;

            out.write(buffer.get(), (size_t) bytesRead);
            totalBytes += bytesRead;
        }

        out.flush();
    }

    if (timedOut)
    {
        destination.deleteFile();
        return juce::Result::fail("Timed out after " + juce::String(timeoutMs / 1000) + "s");
    }

    if (totalBytes == 0)
    {
        destination.deleteFile();
        return juce::Result::fail("Empty response body");
    }

    // A connection dropped mid-body looks like a short read.
    if (expectedBytes >= 0 && totalBytes != expectedBytes)
    {
        destination.deleteFile();
        return juce::Result::fail("Truncated download: " + juce::String(totalBytes) + " of "
                                  + juce::String(expectedBytes) + " bytes");
    }

    return juce::Result::ok();
}
