#include "CompositionPlanner.h"
#include "FilterChainBuilder.h"
#include "RenderPresets.h"

using namespace RenderTypes;

namespace CompositionStrategySelector
{
    CompositionStrategy select(const juce::Array<SceneSpec>& scenes, bool crossfadeRequested)
    {
        for (const auto& scene : scenes)
            if (scene.isVideo)
                return CompositionStrategy::Sequential;

        return crossfadeRequested ? CompositionStrategy::Crossfade : CompositionStrategy::Sequential;
    }

    double clampCrossfade(double requestedSec, const juce::Array<double>& durations)
    {
        if (durations.isEmpty())
            return juce::jmax(minCrossfadeSec, requestedSec);

        double shortest = durations.getFirst();
        for (auto d : durations)
            shortest = juce::jmin(shortest, d);

        const double upper = juce::jmax(minCrossfadeSec, shortest / 2.0);
        return juce::jlimit(minCrossfadeSec, upper, requestedSec);
    }

    juce::Array<double> crossfadeOffsets(const juce::Array<double>& durations, double crossfadeSec)
    {
        juce::Array<double> offsets;
        double elapsed = 0.0;

        for (int k = 1; k < durations.size(); ++k)
        {
            elapsed += durations[k - 1];
            offsets.add(elapsed - k * crossfadeSec);
        }

        return offsets;
    }

    double crossfadeOutputDuration(const juce::Array<double>& durations, double crossfadeSec)
    {
        double total = 0.0;
        for (auto d : durations)
            total += d;

        return total - juce::jmax(0, durations.size() - 1) * crossfadeSec;
    }
}

//==============================================================================
CompositionPlanner::CompositionPlanner(const Settings& planSettings)
    : settings(planSettings)
{
}

AnimateKind CompositionPlanner::effectiveAnimation(const SceneSpec& scene)
{
    if (!scene.isVideo)
        return scene.animate;

    if (scene.animate == AnimateKind::FadeIn || scene.animate == AnimateKind::FadeOut)
        return scene.animate;

    return AnimateKind::None;
}

juce::String CompositionPlanner::sceneFilter(const SceneSpec& scene, bool withWatermark) const
{
    FilterChainBuilder::FilterChainRequest request;
    request.target = settings.target;
    request.durationSec = scene.durationSec;
    request.fps = settings.fps;
    request.animate = effectiveAnimation(scene);
    request.watermarkEnabled = withWatermark;
    request.watermarkText = settings.watermarkText;
    return FilterChainBuilder::build(request);
}

juce::File CompositionPlanner::subClipFileFor(const juce::File& workspace, int index)
{
    return workspace.getChildFile(juce::String::formatted("clip_%03d.mp4", index));
}

juce::Array<double> CompositionPlanner::durationsOf(const juce::Array<SceneSpec>& scenes)
{
    juce::Array<double> durations;
    for (const auto& scene : scenes)
        durations.add(scene.durationSec);
    return durations;
}

double CompositionPlanner::effectiveCrossfade(const juce::Array<SceneSpec>& scenes) const
{
    return CompositionStrategySelector::clampCrossfade(settings.crossfadeSec, durationsOf(scenes));
}

//==============================================================================
juce::StringArray CompositionPlanner::buildSubClipCommand(const SceneSpec& scene, const juce::File& outputFile) const
{
    const juce::String fps(settings.fps);
    const juce::String duration = FilterChainBuilder::formatNumber(scene.durationSec, 3);

    juce::StringArray args;
    args.add("-y");
    args.add("-hide_banner");

    if (scene.isVideo)
    {
        // Short source clips loop until the scene length is filled.
        args.add("-stream_loop"); args.add("-1");
        args.add("-i");           args.add(scene.source.getFullPathName());
        args.add("-t");           args.add(duration);
    }
    else
    {
        args.add("-loop");        args.add("1");
        args.add("-framerate");   args.add(fps);
        args.add("-t");           args.add(duration);
        args.add("-i");           args.add(scene.source.getFullPathName());
    }

    args.add("-vf"); args.add(sceneFilter(scene, settings.watermark));
    args.add("-r");  args.add(fps);
    args.addArray(RenderPresets::videoEncodeArguments(settings.quality, subClipPreset));
    args.add("-an");
    args.add(outputFile.getFullPathName());
    return args;
}

juce::String CompositionPlanner::buildConcatManifest(const juce::Array<juce::File>& clips)
{
    juce::String manifest;

    for (const auto& clip : clips)
    {
        const juce::String path = clip.getFullPathName().replace("\\", "/").replace("'", "'\\''");
        manifest << "file '" << path << "'\n";
    }

    return manifest;
}

juce::StringArray CompositionPlanner::buildConcatMuxCommand(const juce::File& manifestFile,
                                                            const juce::File& audioFile,
                                                            const juce::File& outputFile) const
{
    const auto preset = RenderPresets::encodingFor(settings.quality);

    juce::StringArray args;
    args.add("-y");
    args.add("-hide_banner");
    args.add("-f");        args.add("concat");
    args.add("-safe");     args.add("0");
    args.add("-i");        args.add(manifestFile.getFullPathName());
    args.add("-i");        args.add(audioFile.getFullPathName());
    args.add("-map");      args.add("0:v:0");
    args.add("-map");      args.add("1:a:0");
    args.add("-c:v");      args.add("copy");
    args.add("-c:a");      args.add("aac");
    args.add("-b:a");      args.add(preset.audioBitrate);
    args.add("-shortest");
    args.add("-movflags"); args.add("+faststart");
    args.add(outputFile.getFullPathName());
    return args;
}

//==============================================================================
juce::String CompositionPlanner::buildCrossfadeGraph(const juce::Array<SceneSpec>& scenes) const
{
    const double crossfade = effectiveCrossfade(scenes);
    const auto offsets = CompositionStrategySelector::crossfadeOffsets(durationsOf(scenes), crossfade);

    juce::StringArray parts;

    for (int i = 0; i < scenes.size(); ++i)
    {
        const auto& scene = scenes.getReference(i);
        parts.add("[" + juce::String(i) + ":v]" + sceneFilter(scene, false)
                  + ",trim=duration=" + FilterChainBuilder::formatNumber(scene.durationSec, 3)
                  + ",setpts=PTS-STARTPTS[p" + juce::String(i) + "]");
    }

    juce::String previous = "[p0]";

    for (int k = 1; k < scenes.size(); ++k)
    {
        const juce::String label = "[x" + juce::String(k) + "]";
        parts.add(previous + "[p" + juce::String(k) + "]xfade=transition=fade:duration="
                  + FilterChainBuilder::formatNumber(crossfade, 3)
                  + ":offset=" + FilterChainBuilder::formatNumber(offsets[k - 1], 3) + label);
        previous = label;
    }

    juce::String tail;
    if (settings.watermark && FilterChainBuilder::escapeDrawText(settings.watermarkText).isNotEmpty())
        tail = FilterChainBuilder::WatermarkStage { settings.watermarkText, FilterChainBuilder::watermarkFontSize }.serialise() + ",";

    parts.add(previous + tail + "format=yuv420p[vout]");
    return parts.joinIntoString(";");
}

juce::StringArray CompositionPlanner::buildCrossfadeCommand(const juce::Array<SceneSpec>& scenes,
                                                            const juce::File& audioFile,
                                                            const juce::File& outputFile) const
{
    const auto preset = RenderPresets::encodingFor(settings.quality);
    const juce::String fps(settings.fps);

    juce::StringArray args;
    args.add("-y");
    args.add("-hide_banner");

    for (const auto& scene : scenes)
    {
        args.add("-loop");      args.add("1");
        args.add("-framerate"); args.add(fps);
        args.add("-t");         args.add(FilterChainBuilder::formatNumber(scene.durationSec, 3));
        args.add("-i");         args.add(scene.source.getFullPathName());
    }

    args.add("-i"); args.add(audioFile.getFullPathName());

    args.add("-filter_complex"); args.add(buildCrossfadeGraph(scenes));
    args.add("-map"); args.add("[vout]");
    args.add("-map"); args.add(juce::String(scenes.size()) + ":a:0");
    args.add("-r");   args.add(fps);
    args.addArray(RenderPresets::videoEncodeArguments(settings.quality));
    args.add("-c:a"); args.add("aac");
    args.add("-b:a"); args.add(preset.audioBitrate);
    args.add("-shortest");
    args.add("-movflags"); args.add("+faststart");
    args.add(outputFile.getFullPathName());
    return args;
}
