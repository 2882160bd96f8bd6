#pragma once
#include <JuceHeader.h>
#include "RenderTypes.h"

/**
 * Quality tier tables: output resolution per format and the x264/AAC settings
 * used for every encode of a job at that tier.
 */
namespace RenderPresets
{
    struct EncodingPreset
    {
        juce::String videoBitrate;   // used as -maxrate
        juce::String bufferSize;     // -bufsize, twice the bitrate
        juce::String x264Preset;
        int crf = 23;
        juce::String audioBitrate;
    };

    constexpr int defaultFps = 30;
    constexpr double defaultSceneDurationSec = 5.0;
    constexpr double defaultCrossfadeSec = 0.5;

    RenderTypes::Resolution resolutionFor(RenderTypes::RenderFormat format, RenderTypes::RenderQuality quality);

    EncodingPreset encodingFor(RenderTypes::RenderQuality quality);

    /** x264 arguments shared by sub-clip and crossfade encodes */
    juce::StringArray videoEncodeArguments(RenderTypes::RenderQuality quality, const juce::String& x264PresetOverride = {});
}
