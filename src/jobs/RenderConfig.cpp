#include "RenderConfig.h"
#include "../rendering/RenderPresets.h"

using namespace RenderTypes;

juce::Result RenderConfig::fromVar(const juce::var& value, RenderConfig& config)
{
    if (!value.isObject())
        return juce::Result::fail("Body must be a JSON object");

    config = RenderConfig();
    config.projectId = value.getProperty("projectId", {}).toString();
    if (config.projectId.isEmpty())
        return juce::Result::fail("projectId required");

    config.aspectRatio = value.getProperty("aspectRatio", {}).toString();

    const juce::String formatText = value.getProperty("format", {}).toString();
    if (formatText.isNotEmpty())
    {
        if (!parseFormat(formatText, config.format))
            return juce::Result::fail("Unknown format: " + formatText);
    }
    else if (config.aspectRatio.isNotEmpty())
    {
        config.format = formatFromAspectRatio(config.aspectRatio);
    }

    const juce::String qualityText = value.getProperty("quality", "standard").toString();
    if (!parseQuality(qualityText, config.quality))
        return juce::Result::fail("Unknown quality: " + qualityText);

    config.duration = juce::jmax(0.0, (double) value.getProperty("duration", 0.0));
    config.scenesCount = juce::jmax(0, (int) value.getProperty("scenesCount", 0));
    return juce::Result::ok();
}

Resolution RenderConfig::getResolution() const
{
    return RenderPresets::resolutionFor(format, quality);
}

int RenderConfig::estimateCredits() const
{
    int cost = 10;

    const int blocks = (int) std::ceil(duration / 15.0);
    cost += juce::jmax(0, blocks - 1) * 5;

    if (quality == RenderQuality::Standard)
        cost += 5;
    else if (quality == RenderQuality::Pro)
        cost += 15;

    if (scenesCount > 8)
        cost += scenesCount - 8;

    return cost;
}

juce::String RenderConfig::getConfigId() const
{
    const juce::String canonical = projectId + "|" + toString(format) + "|" + toString(quality)
                                 + "|" + juce::String(duration, 3) + "|" + juce::String(scenesCount);
    const juce::MemoryBlock bytes(canonical.toRawUTF8(), canonical.getNumBytesAsUTF8());
    return "cfg_" + juce::SHA256(bytes).toHexString().substring(0, 16);
}

juce::var RenderConfig::toVar() const
{
    const Resolution resolution = getResolution();

    juce::DynamicObject::Ptr object = new juce::DynamicObject();
    object->setProperty("configId", getConfigId());
    object->setProperty("projectId", projectId);
    object->setProperty("format", toString(format));
    object->setProperty("quality", toString(quality));
    object->setProperty("duration", duration);
    object->setProperty("scenesCount", scenesCount);
    object->setProperty("width", resolution.width);
    object->setProperty("height", resolution.height);
    object->setProperty("estimatedCredits", estimateCredits());
    return juce::var(object.get());
}
