#include "RenderPayload.h"

using RenderTypes::AnimateKind;

namespace
{
    AnimateKind readAnimateKind(const juce::var& entry)
    {
        for (const char* field : { "animate", "animateType", "animation" })
        {
            const juce::var value = entry.getProperty(field, {});

            if (value.isBool())
            {
                if ((bool) value)
                    return AnimateKind::ZoomIn;
                continue;
            }

            AnimateKind kind = AnimateKind::None;
            if (value.isString() && RenderTypes::parseAnimateKind(value.toString(), kind))
                return kind;
        }

        return AnimateKind::None;
    }

    juce::String readAudioUrl(const juce::var& value)
    {
        const juce::String url = value.getProperty("audioUrl", {}).toString();
        if (url.isNotEmpty())
            return url;

        // Older project documents keep a blob URL in audioPath.
        const juce::String path = value.getProperty("audioPath", {}).toString();
        return path.startsWithIgnoreCase("http://") || path.startsWithIgnoreCase("https://") ? path : juce::String();
    }
}

//==============================================================================
bool RenderPayload::AssetRef::hasCompletedVideo() const
{
    return animationStatus == "completed" && videoUrl.isNotEmpty();
}

juce::Result RenderPayload::fromVar(const juce::var& value, RenderPayload& payload)
{
    if (!value.isObject())
        return juce::Result::fail("Payload is not a JSON object");

    payload = RenderPayload();
    payload.renderId = value.getProperty("renderId", {}).toString();
    payload.projectId = value.getProperty("projectId", value.getProperty("id", {})).toString();
    payload.audioUrl = readAudioUrl(value);
    payload.audioData = value.getProperty("audioData", {}).toString();

    const juce::String audioPath = value.getProperty("audioPath", {}).toString();
    if (audioPath.isNotEmpty() && audioPath != payload.audioUrl)
        payload.audioPath = audioPath;

    payload.options = RenderTypes::RenderOptions::fromVar(value.getProperty("renderOptions", {}));

    const juce::var storyboardValue = value.getProperty("storyboard", {});
    if (const auto* entries = storyboardValue.getArray())
    {
        for (const auto& entry : *entries)
        {
            if (!entry.isObject())
                continue;

            StoryboardEntry item;
            item.assetId = entry.getProperty("assetId", {}).toString();
            item.durationSec = (double) entry.getProperty("durationSec", entry.getProperty("duration", 0.0));
            item.animate = readAnimateKind(entry);
            payload.storyboard.add(item);
        }
    }

    const juce::var assetsValue = value.getProperty("assets", {});
    if (const auto* assets = assetsValue.getArray())
    {
        for (const auto& asset : *assets)
        {
            if (!asset.isObject())
                continue;

            AssetRef ref;
            ref.id = asset.getProperty("id", {}).toString();
            ref.dataUrl = asset.getProperty("dataUrl", {}).toString();

            const juce::var animation = asset.getProperty("animation", {});
            if (animation.isObject())
            {
                ref.animationStatus = animation.getProperty("status", {}).toString();
                ref.videoUrl = animation.getProperty("videoUrl", {}).toString();
            }

            payload.assets.add(ref);
        }
    }

    return juce::Result::ok();
}

juce::var RenderPayload::toVar() const
{
    juce::DynamicObject::Ptr object = new juce::DynamicObject();
    object->setProperty("renderId", renderId);
    object->setProperty("projectId", projectId);

    if (audioUrl.isNotEmpty())  object->setProperty("audioUrl", audioUrl);
    if (audioData.isNotEmpty()) object->setProperty("audioData", audioData);
    if (audioPath.isNotEmpty()) object->setProperty("audioPath", audioPath);

    juce::Array<juce::var> storyboardArray;
    for (const auto& entry : storyboard)
    {
        juce::DynamicObject::Ptr item = new juce::DynamicObject();
        item->setProperty("assetId", entry.assetId);
        item->setProperty("durationSec", entry.durationSec);
        item->setProperty("animate", RenderTypes::toString(entry.animate));
        storyboardArray.add(juce::var(item.get()));
    }
    object->setProperty("storyboard", storyboardArray);

    juce::Array<juce::var> assetArray;
    for (const auto& asset : assets)
    {
        juce::DynamicObject::Ptr item = new juce::DynamicObject();
        item->setProperty("id", asset.id);
        item->setProperty("dataUrl", asset.dataUrl);

        if (asset.animationStatus.isNotEmpty())
        {
            juce::DynamicObject::Ptr animation = new juce::DynamicObject();
            animation->setProperty("status", asset.animationStatus);
            animation->setProperty("videoUrl", asset.videoUrl);
            item->setProperty("animation", juce::var(animation.get()));
        }
        else
        {
            item->setProperty("animation", juce::var());
        }

        assetArray.add(juce::var(item.get()));
    }
    object->setProperty("assets", assetArray);

    object->setProperty("renderOptions", options.toVar());
    return juce::var(object.get());
}

const RenderPayload::AssetRef* RenderPayload::findAsset(const juce::String& assetId) const
{
    if (assetId.isEmpty())
        return nullptr;

    for (const auto& asset : assets)
        if (asset.id == assetId)
            return &asset;

    return nullptr;
}
