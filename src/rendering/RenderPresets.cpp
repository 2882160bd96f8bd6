#include "RenderPresets.h"

namespace RenderPresets
{
    using namespace RenderTypes;

    Resolution resolutionFor(RenderFormat format, RenderQuality quality)
    {
        const bool hd = quality != RenderQuality::Basic;
        const int longEdge = hd ? 1920 : 1280;
        const int shortEdge = hd ? 1080 : 720;

        switch (format)
        {
            case RenderFormat::Horizontal: return { longEdge, shortEdge };
            case RenderFormat::Square:     return { shortEdge, shortEdge };
            case RenderFormat::Vertical:
            default:                       return { shortEdge, longEdge };
        }
    }

    EncodingPreset encodingFor(RenderQuality quality)
    {
        switch (quality)
        {
            case RenderQuality::Basic:    return { "2500k", "5000k", "veryfast", 24, "160k" };
            case RenderQuality::Pro:      return { "8000k", "16000k", "medium", 21, "192k" };
            case RenderQuality::Standard:
            default:                      return { "5000k", "10000k", "fast", 23, "192k" };
        }
    }

    juce::StringArray videoEncodeArguments(RenderQuality quality, const juce::String& x264PresetOverride)
    {
        const EncodingPreset preset = encodingFor(quality);

        juce::StringArray args;
        args.add("-c:v");     args.add("libx264");
        args.add("-preset");  args.add(x264PresetOverride.isNotEmpty() ? x264PresetOverride : preset.x264Preset);
        args.add("-crf");     args.add(juce::String(preset.crf));
        args.add("-maxrate"); args.add(preset.videoBitrate);
        args.add("-bufsize"); args.add(preset.bufferSize);
        args.add("-pix_fmt"); args.add("yuv420p");
        return args;
    }
}
