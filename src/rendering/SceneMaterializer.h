#pragma once
#include <JuceHeader.h>
#include "RenderTypes.h"
#include "AssetDownloader.h"
#include "../jobs/RenderPayload.h"

//==============================================================================
/**
 * One way of turning a payload's audio reference into a local file.
 * Providers are tried in order; the first one that can resolve decides.
 */
class AudioSourceProvider
{
public:
    virtual ~AudioSourceProvider() = default;

    virtual juce::String getName() const = 0;
    virtual bool canResolve(const RenderPayload& payload) const = 0;
    virtual juce::Result resolve(const RenderPayload& payload, const juce::File& workspace, juce::File& audioFile) = 0;
};

/** Fetches payload.audioUrl with the bounded-timeout downloader. */
class UrlAudioProvider : public AudioSourceProvider
{
public:
    explicit UrlAudioProvider(const AssetDownloader& downloader);

    juce::String getName() const override { return "url"; }
    bool canResolve(const RenderPayload& payload) const override;
    juce::Result resolve(const RenderPayload& payload, const juce::File& workspace, juce::File& audioFile) override;

private:
    const AssetDownloader& downloader;
};

/** Decodes payload.audioData (plain base64 or a data: URI). */
class InlineAudioProvider : public AudioSourceProvider
{
public:
    juce::String getName() const override { return "inline"; }
    bool canResolve(const RenderPayload& payload) const override;
    juce::Result resolve(const RenderPayload& payload, const juce::File& workspace, juce::File& audioFile) override;
};

/** Copies payload.audioPath from local disk. Development setups only. */
class LocalPathAudioProvider : public AudioSourceProvider
{
public:
    explicit LocalPathAudioProvider(bool enabled);

    juce::String getName() const override { return "local"; }
    bool canResolve(const RenderPayload& payload) const override;
    juce::Result resolve(const RenderPayload& payload, const juce::File& workspace, juce::File& audioFile) override;

private:
    bool enabled;
};

//==============================================================================
/**
 * Resolves a render payload into encoder-ready local files inside the job
 * workspace: one audio file and one image or video file per scene.
 *
 * Scenes whose image payload is missing or malformed are dropped with a
 * warning. Missing audio, a failed download, or no scene left at all is fatal.
 */
class SceneMaterializer
{
public:
    struct MaterializedProject
    {
        juce::File audioFile;
        juce::Array<RenderTypes::SceneSpec> scenes;
        int droppedScenes = 0;

        bool hasVideoScenes() const;
        double getTotalSceneDuration() const;
    };

    /** allowLocalMedia lets audio paths and animation clips come from local disk. */
    SceneMaterializer(const juce::File& workspace, const AssetDownloader& downloader, bool allowLocalMedia);

    juce::Result materialize(const RenderPayload& payload, MaterializedProject& project);

    /** Decodes a data:image/...;base64 URI into bytes and a file extension. */
    static bool decodeImageDataUri(const juce::String& dataUri, juce::MemoryBlock& bytes, juce::String& extension);

    void setLogCallback(std::function<void(const juce::String&)> callback);

private:
    juce::Result resolveAudio(const RenderPayload& payload, juce::File& audioFile);
    juce::Result resolveScenes(const RenderPayload& payload, MaterializedProject& project);
    void log(const juce::String& message);

    juce::File workspace;
    const AssetDownloader& downloader;
    bool allowLocalMedia;
    std::vector<std::unique_ptr<AudioSourceProvider>> audioProviders;
    std::function<void(const juce::String&)> logCallback;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(SceneMaterializer)
};
