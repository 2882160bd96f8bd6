#pragma once
#include <JuceHeader.h>
#include "../workspace/WorkspaceJanitor.h"

//==============================================================================
/**
 * Durable home for finished videos. The render engine only needs to put a
 * file under a key and get back a URL clients can fetch.
 */
class ArtifactStorage
{
public:
    virtual ~ArtifactStorage() = default;

    /** Uploads the file under "renders/<renderId>.mp4" and returns its public URL through url. */
    virtual juce::Result upload(const juce::String& renderId, const juce::File& file, juce::String& url) = 0;
};

/**
 * Plain HTTP PUT of the artifact bytes, authorised with a bearer token.
 * Works with any object store exposing a pre-authorised upload prefix.
 */
class HttpArtifactStorage : public ArtifactStorage
{
public:
    HttpArtifactStorage(const juce::String& uploadBaseUrl,
                        const juce::String& publicBaseUrl,
                        const juce::String& token,
                        int timeoutSeconds = 120);

    juce::Result upload(const juce::String& renderId, const juce::File& file, juce::String& url) override;

    static juce::String objectKey(const juce::String& renderId);

private:
    juce::String uploadBaseUrl;
    juce::String publicBaseUrl;
    juce::String token;
    int timeoutSeconds;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(HttpArtifactStorage)
};

//==============================================================================
/**
 * Makes a finished render reachable.
 *
 * Tries durable storage first. If there is none, or the upload fails, the
 * file is moved to the local spool and served through the download endpoint
 * instead. A failed upload is never a failed render.
 */
class ArtifactPublisher
{
public:
    struct Publication
    {
        juce::Result result = juce::Result::ok();
        juce::String url;
        bool uploaded = false;
        juce::String note;
    };

    /**
     * @param storage        durable storage, or nullptr to always spool
     * @param janitor        owner of the spool directory
     * @param publicBaseUrl  base of the service that serves spooled files
     */
    ArtifactPublisher(std::unique_ptr<ArtifactStorage> storage,
                      WorkspaceJanitor& janitor,
                      const juce::String& publicBaseUrl);

    Publication publish(const juce::String& renderId, const juce::File& file);

    /** "<publicBaseUrl>/api/render/download?renderId=<id>" */
    static juce::String downloadUrlFor(const juce::String& publicBaseUrl, const juce::String& renderId);

private:
    juce::Result spool(const juce::String& renderId, const juce::File& file);

    std::unique_ptr<ArtifactStorage> storage;
    WorkspaceJanitor& janitor;
    juce::String publicBaseUrl;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(ArtifactPublisher)
};
