#pragma once
#include <JuceHeader.h>
#include "../rendering/RenderTypes.h"

/**
 * Everything a render needs besides the job record: the audio reference,
 * the ordered storyboard and the assets it points at.
 *
 * Built from a project document for in-process renders, and exchanged as
 * JSON with the remote worker through the payload endpoint.
 */
struct RenderPayload
{
    struct StoryboardEntry
    {
        juce::String assetId;
        double durationSec = 0.0;       // <= 0 means "use the default"
        RenderTypes::AnimateKind animate = RenderTypes::AnimateKind::None;
    };

    struct AssetRef
    {
        juce::String id;
        juce::String dataUrl;            // data:image/...;base64,...
        juce::String animationStatus;    // "completed" when a video clip exists
        juce::String videoUrl;

        bool hasCompletedVideo() const;
    };

    juce::String renderId;
    juce::String projectId;
    juce::String audioUrl;
    juce::String audioData;
    juce::String audioPath;
    juce::Array<StoryboardEntry> storyboard;
    juce::Array<AssetRef> assets;
    RenderTypes::RenderOptions options;

    /**
     * Reads a project or payload document. Storyboard entries accept
     * durationSec or duration, and animate as a kind name, a boolean
     * (true means zoom-in) or animateType.
     */
    static juce::Result fromVar(const juce::var& value, RenderPayload& payload);

    juce::var toVar() const;

    const AssetRef* findAsset(const juce::String& assetId) const;
};
