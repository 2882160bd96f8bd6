#pragma once
#include <JuceHeader.h>
#include "RenderTypes.h"

//==============================================================================
/**
 * Picks how a set of materialised scenes becomes one video.
 *
 * Sequential encodes one sub-clip per scene, concatenates them and muxes the
 * audio. Crossfade renders every still image through a single filter graph
 * with xfade transitions. Video scenes always go sequential.
 */
namespace CompositionStrategySelector
{
    constexpr double minCrossfadeSec = 0.1;

    RenderTypes::CompositionStrategy select(const juce::Array<RenderTypes::SceneSpec>& scenes, bool crossfadeRequested);

    /** Limits a requested crossfade to [0.1, shortest scene / 2]. */
    double clampCrossfade(double requestedSec, const juce::Array<double>& durations);

    /**
     * Start time of each transition: offset k is the sum of the first k
     * durations minus k crossfades. There are durations.size() - 1 offsets.
     */
    juce::Array<double> crossfadeOffsets(const juce::Array<double>& durations, double crossfadeSec);

    /** Sum of the durations minus one crossfade per transition. */
    double crossfadeOutputDuration(const juce::Array<double>& durations, double crossfadeSec);
}

//==============================================================================
/**
 * Turns scenes into FFmpeg argument arrays. Nothing here touches the disk
 * except writing the concat manifest, so plans can be inspected in tests.
 */
class CompositionPlanner
{
public:
    struct Settings
    {
        RenderTypes::Resolution target;
        int fps = 30;
        RenderTypes::RenderQuality quality = RenderTypes::RenderQuality::Standard;
        bool watermark = true;
        juce::String watermarkText = "MUSICREEL DEMO";
        double crossfadeSec = 0.5;
    };

    /** Sub-clips favour encode speed over size; the concat step copies them as-is. */
    static constexpr const char* subClipPreset = "veryfast";

    explicit CompositionPlanner(const Settings& settings);

    const Settings& getSettings() const { return settings; }

    /** Zoom and pan only apply to stills; video scenes keep fades and nothing else. */
    static RenderTypes::AnimateKind effectiveAnimation(const RenderTypes::SceneSpec& scene);

    /** The -vf chain for one scene of a sequential render. */
    juce::String sceneFilter(const RenderTypes::SceneSpec& scene, bool withWatermark) const;

    static juce::File subClipFileFor(const juce::File& workspace, int index);

    juce::StringArray buildSubClipCommand(const RenderTypes::SceneSpec& scene, const juce::File& outputFile) const;

    /** One "file '<path>'" line per clip, single quotes escaped for the concat demuxer. */
    static juce::String buildConcatManifest(const juce::Array<juce::File>& clips);

    juce::StringArray buildConcatMuxCommand(const juce::File& manifestFile,
                                            const juce::File& audioFile,
                                            const juce::File& outputFile) const;

    /** The filter_complex graph for a crossfade render, ending in [vout]. */
    juce::String buildCrossfadeGraph(const juce::Array<RenderTypes::SceneSpec>& scenes) const;

    juce::StringArray buildCrossfadeCommand(const juce::Array<RenderTypes::SceneSpec>& scenes,
                                            const juce::File& audioFile,
                                            const juce::File& outputFile) const;

    /** Crossfade length actually used for these scenes. */
    double effectiveCrossfade(const juce::Array<RenderTypes::SceneSpec>& scenes) const;

    static juce::Array<double> durationsOf(const juce::Array<RenderTypes::SceneSpec>& scenes);

private:
    Settings settings;
};
