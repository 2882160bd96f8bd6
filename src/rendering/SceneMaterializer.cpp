#include "SceneMaterializer.h"
#include "RenderPresets.h"

namespace
{
    juce::String audioExtensionForMime(const juce::String& mime)
    {
        const juce::String type = mime.fromFirstOccurrenceOf("/", false, false).toLowerCase();

        if (type == "mpeg" || type == "mp3")                   return ".mp3";
        if (type == "wav" || type == "x-wav" || type == "wave") return ".wav";
        if (type == "mp4" || type == "m4a" || type == "x-m4a" || type == "aac") return ".m4a";
        if (type == "ogg")                                     return ".ogg";
        if (type == "webm")                                    return ".webm";
        if (type == "flac")                                    return ".flac";
        return ".audio";
    }

    juce::String audioExtensionForUrl(const juce::String& url)
    {
        const juce::String path = url.upToFirstOccurrenceOf("?", false, false);
        const juce::String extension = path.fromLastOccurrenceOf(".", true, false).toLowerCase();

        if (extension.length() > 1 && extension.length() <= 5 && extension.substring(1).containsOnly("abcdefghijklmnopqrstuvwxyz0123456789"))
            return extension;

        return ".audio";
    }

    bool decodeBase64(const juce::String& encoded, juce::MemoryBlock& bytes)
    {
        juce::MemoryOutputStream decoded(bytes, false);
        const bool ok = juce::Base64::convertFromBase64(decoded, encoded.removeCharacters(" \r\n\t"));
        decoded.flush();
        return ok && bytes.getSize() > 0;
    }
}

//==============================================================================
UrlAudioProvider::UrlAudioProvider(const AssetDownloader& assetDownloader)
    : downloader(assetDownloader)
{
}

bool UrlAudioProvider::canResolve(const RenderPayload& payload) const
{
    return AssetDownloader::isRemoteUrl(payload.audioUrl);
}

juce::Result UrlAudioProvider::resolve(const RenderPayload& payload, const juce::File& workspace, juce::File& audioFile)
{
    audioFile = workspace.getChildFile("audio" + audioExtensionForUrl(payload.audioUrl));

    const juce::Result result = downloader.download(payload.audioUrl, audioFile);
    if (result.failed())
        return juce::Result::fail("Failed to download audio: " + result.getErrorMessage());

    return juce::Result::ok();
}

//==============================================================================
bool InlineAudioProvider::canResolve(const RenderPayload& payload) const
{
    return payload.audioData.isNotEmpty();
}

juce::Result InlineAudioProvider::resolve(const RenderPayload& payload, const juce::File& workspace, juce::File& audioFile)
{
    juce::String encoded = payload.audioData;
    juce::String extension = ".audio";

    if (encoded.startsWith("data:"))
    {
        const int marker = encoded.indexOf(";base64,");
        if (marker < 0)
            return juce::Result::fail("Inline audio is not base64 encoded");

        extension = audioExtensionForMime(encoded.substring(5, marker));
        encoded = encoded.substring(marker + 8);
    }

    juce::MemoryBlock bytes;
    if (!decodeBase64(encoded, bytes))
        return juce::Result::fail("Inline audio could not be decoded");

    audioFile = workspace.getChildFile("audio" + extension);
    if (!audioFile.replaceWithData(bytes.getData(), bytes.getSize()))
        return juce::Result::fail("Cannot write " + audioFile.getFullPathName());

    return juce::Result::ok();
}

//==============================================================================
LocalPathAudioProvider::LocalPathAudioProvider(bool isEnabled)
    : enabled(isEnabled)
{
}

bool LocalPathAudioProvider::canResolve(const RenderPayload& payload) const
{
    return enabled
        && juce::File::isAbsolutePath(payload.audioPath)
        && juce::File(payload.audioPath).existsAsFile();
}

juce::Result LocalPathAudioProvider::resolve(const RenderPayload& payload, const juce::File& workspace, juce::File& audioFile)
{
    const juce::File source(payload.audioPath);
    audioFile = workspace.getChildFile("audio" + source.getFileExtension());

    if (!source.copyFileTo(audioFile))
        return juce::Result::fail("Cannot copy audio from " + source.getFullPathName());

    return juce::Result::ok();
}

//==============================================================================
bool SceneMaterializer::MaterializedProject::hasVideoScenes() const
{
    for (const auto& scene : scenes)
        if (scene.isVideo)
            return true;
    return false;
}

double SceneMaterializer::MaterializedProject::getTotalSceneDuration() const
{
    double total = 0.0;
    for (const auto& scene : scenes)
        total += scene.durationSec;
    return total;
}

//==============================================================================
SceneMaterializer::SceneMaterializer(const juce::File& workspaceDirectory, const AssetDownloader& assetDownloader, bool localMedia)
    : workspace(workspaceDirectory),
      downloader(assetDownloader),
      allowLocalMedia(localMedia)
{
    audioProviders.push_back(std::make_unique<UrlAudioProvider>(downloader));
    audioProviders.push_back(std::make_unique<InlineAudioProvider>());
    audioProviders.push_back(std::make_unique<LocalPathAudioProvider>(allowLocalMedia));
}

void SceneMaterializer::setLogCallback(std::function<void(const juce::String&)> callback)
{
    logCallback = std::move(callback);
}

void SceneMaterializer::log(const juce::String& message)
{
    if (logCallback)
        logCallback(message);
    else
        juce::Logger::writeToLog(message);
}

bool SceneMaterializer::decodeImageDataUri(const juce::String& dataUri, juce::MemoryBlock& bytes, juce::String& extension)
{
    if (!dataUri.startsWith("data:image/"))
        return false;

    const int marker = dataUri.indexOf(";base64,");
    if (marker < 0)
        return false;

    const juce::String subtype = dataUri.substring(11, marker).toLowerCase();
    if (subtype.isEmpty() || subtype.containsChar(';'))
        return false;

    if (subtype == "png")
        extension = ".png";
    else if (subtype == "webp")
        extension = ".webp";
    else
        extension = ".jpg";

    bytes.reset();
    return decodeBase64(dataUri.substring(marker + 8), bytes);
}

juce::Result SceneMaterializer::materialize(const RenderPayload& payload, MaterializedProject& project)
{
    project = MaterializedProject();

    const juce::Result audio = resolveAudio(payload, project.audioFile);
    if (audio.failed())
        return audio;

    return resolveScenes(payload, project);
}

juce::Result SceneMaterializer::resolveAudio(const RenderPayload& payload, juce::File& audioFile)
{
    for (auto& provider : audioProviders)
    {
        if (!provider->canResolve(payload))
            continue;

        log("Resolving audio via " + provider->getName() + " source");

        const juce::Result result = provider->resolve(payload, workspace, audioFile);
        if (result.failed())
            return result;

        if (!audioFile.existsAsFile() || audioFile.getSize() == 0)
            return juce::Result::fail("Audio file missing");

        log("Audio ready: " + audioFile.getFileName() + " (" + juce::String(audioFile.getSize() / 1024) + " KB)");
        return juce::Result::ok();
    }

    return juce::Result::fail("Audio file missing");
}

juce::Result SceneMaterializer::resolveScenes(const RenderPayload& payload, MaterializedProject& project)
{
    juce::Array<RenderPayload::StoryboardEntry> entries;

    for (const auto& entry : payload.storyboard)
        if (payload.findAsset(entry.assetId) != nullptr)
            entries.add(entry);

    // Storyboards saved without asset ids render every asset in stored order.
    if (entries.isEmpty())
    {
        for (const auto& asset : payload.assets)
        {
            RenderPayload::StoryboardEntry entry;
            entry.assetId = asset.id;
            entries.add(entry);
        }

        if (!entries.isEmpty())
            log("Storyboard has no usable asset references; using " + juce::String(entries.size()) + " assets in order");
    }

    for (int i = 0; i < entries.size(); ++i)
    {
        const auto& entry = entries.getReference(i);
        const RenderPayload::AssetRef* asset = payload.findAsset(entry.assetId);

        RenderTypes::SceneSpec scene;
        scene.index = i;
        scene.durationSec = entry.durationSec > 0.0 ? entry.durationSec : RenderPresets::defaultSceneDurationSec;
        scene.animate = entry.animate;

        const bool hasVideo = asset != nullptr && asset->hasCompletedVideo()
                           && (AssetDownloader::isRemoteUrl(asset->videoUrl)
                               || (allowLocalMedia && AssetDownloader::localFileFor(asset->videoUrl).existsAsFile()));

        if (hasVideo)
        {
            scene.source = workspace.getChildFile(juce::String::formatted("clip_src_%03d.mp4", i));
            scene.isVideo = true;

            const juce::Result fetched = downloader.download(asset->videoUrl, scene.source);
            if (fetched.failed())
                return juce::Result::fail("Failed to download video for scene " + juce::String(i + 1) + ": " + fetched.getErrorMessage());

            project.scenes.add(scene);
            continue;
        }

        juce::MemoryBlock bytes;
        juce::String extension;

        if (asset == nullptr || !decodeImageDataUri(asset->dataUrl, bytes, extension))
        {
            log("Skipping scene " + juce::String(i + 1) + ": image payload missing or malformed");
            ++project.droppedScenes;
            continue;
        }

        scene.source = workspace.getChildFile(juce::String::formatted("frame_%03d", i) + extension);
        if (!scene.source.replaceWithData(bytes.getData(), bytes.getSize()))
            return juce::Result::fail("Cannot write " + scene.source.getFullPathName());

        project.scenes.add(scene);
    }

    if (project.scenes.isEmpty())
        return juce::Result::fail("No scenes to render");

    log("Resolved " + juce::String(project.scenes.size()) + " scenes ("
        + juce::String(project.droppedScenes) + " dropped)");
    return juce::Result::ok();
}
