#include "ArtifactPublisher.h"
#include "../core/SessionLogger.h"

namespace
{
    juce::String withoutTrailingSlash(const juce::String& url)
    {
        return url.trimCharactersAtEnd("/");
    }
}

//==============================================================================
HttpArtifactStorage::HttpArtifactStorage(const juce::String& uploadUrl,
                                         const juce::String& publicUrl,
                                         const juce::String& bearerToken,
                                         int timeout)
    : uploadBaseUrl(withoutTrailingSlash(uploadUrl)),
      publicBaseUrl(withoutTrailingSlash(publicUrl.isNotEmpty() ? publicUrl : uploadUrl)),
      token(bearerToken),
      timeoutSeconds(juce::jmax(1, timeout))
{
}

juce::String HttpArtifactStorage::objectKey(const juce::String& renderId)
{
    return "renders/" + renderId + ".mp4";
}

juce::Result HttpArtifactStorage::upload(const juce::String& renderId, const juce::File& file, juce::String& url)
{
    juce::MemoryBlock body;
    if (!file.loadFileAsData(body) || body.getSize() == 0)
        return juce::Result::fail("Cannot read " + file.getFullPathName());

    juce::String headers = "Content-Type: video/mp4";
    if (token.isNotEmpty())
        headers << "\r\nAuthorization: Bearer " << token;

    int statusCode = 0;
    auto options = juce::URL::InputStreamOptions(juce::URL::ParameterHandling::inPostData)
                       .withExtraHeaders(headers)
                       .withConnectionTimeoutMs(timeoutSeconds * 1000)
                       .withStatusCode(&statusCode)
                       .withHttpRequestCmd("PUT");

    const juce::URL target = juce::URL(uploadBaseUrl + "/" + objectKey(renderId)).withPOSTData(body);
    std::unique_ptr<juce::InputStream> stream = target.createInputStream(options);

    if (stream == nullptr)
        return juce::Result::fail("Storage upload connection failed");

    if (statusCode < 200 || statusCode >= 300)
        return juce::Result::fail("Storage upload returned HTTP " + juce::String(statusCode)
                                  + ": " + stream->readEntireStreamAsString().substring(0, 200));

    url = publicBaseUrl + "/" + objectKey(renderId);
    return juce::Result::ok();
}

//==============================================================================
ArtifactPublisher::ArtifactPublisher(std::unique_ptr<ArtifactStorage> artifactStorage,
                                     WorkspaceJanitor& workspaceJanitor,
                                     const juce::String& baseUrl)
    : storage(std::move(artifactStorage)),
      janitor(workspaceJanitor),
      publicBaseUrl(withoutTrailingSlash(baseUrl))
{
}

juce::String ArtifactPublisher::downloadUrlFor(const juce::String& baseUrl, const juce::String& renderId)
{
    return withoutTrailingSlash(baseUrl) + "/api/render/download?renderId=" + juce::URL::addEscapeChars(renderId, true);
}

ArtifactPublisher::Publication ArtifactPublisher::publish(const juce::String& renderId, const juce::File& file)
{
    Publication publication;

    if (!file.existsAsFile() || file.getSize() == 0)
    {
        publication.result = juce::Result::fail("Render produced no output file");
        return publication;
    }

    if (storage != nullptr)
    {
        juce::String url;
        const juce::Result uploaded = storage->upload(renderId, file, url);

        if (uploaded.wasOk())
        {
            publication.url = url;
            publication.uploaded = true;
            return publication;
        }

        publication.note = "Upload failed, served locally: " + uploaded.getErrorMessage();
        RenderLog::warn("render.publish.fallback", { { "renderId", renderId },
                                                     { "error", uploaded.getErrorMessage() } });
    }

    const juce::Result spooled = spool(renderId, file);
    if (spooled.failed())
    {
        publication.result = spooled;
        return publication;
    }

    publication.url = downloadUrlFor(publicBaseUrl, renderId);
    return publication;
}

juce::Result ArtifactPublisher::spool(const juce::String& renderId, const juce::File& file)
{
    if (!WorkspaceJanitor::isValidRenderId(renderId))
        return juce::Result::fail("Invalid render id");

    const juce::File destination = janitor.getSpooledArtifact(renderId);
    if (!destination.getParentDirectory().createDirectory())
        return juce::Result::fail("Cannot create " + destination.getParentDirectory().getFullPathName());

    destination.deleteFile();

    // The workspace and the spool usually share a volume; copy when they don't.
    if (!file.moveFileTo(destination) && !file.copyFileTo(destination))
        return juce::Result::fail("Cannot spool artifact to " + destination.getFullPathName());

    return juce::Result::ok();
}
