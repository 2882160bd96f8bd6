#include "RenderTypes.h"

namespace RenderTypes
{
    namespace
    {
        const char* const formatNames[]  = { "vertical", "horizontal", "square" };
        const char* const qualityNames[] = { "basic", "standard", "pro" };
        const char* const animateNames[] = { "none", "zoom-in", "zoom-out", "pan-left", "pan-right",
                                             "pan-up", "pan-down", "fade-in", "fade-out" };
        const char* const statusNames[]  = { "pending", "processing", "complete", "failed" };

        template <typename Enum, size_t N>
        bool parseName(const juce::String& text, const char* const (&names)[N], Enum& result)
        {
            const juce::String normalised = text.trim().toLowerCase().replaceCharacter('_', '-');

            for (size_t i = 0; i < N; ++i)
            {
                if (normalised == names[i])
                {
                    result = static_cast<Enum>(i);
                    return true;
                }
            }

            return false;
        }
    }

    juce::String toString(RenderFormat format)       { return formatNames[(int) format]; }
    juce::String toString(RenderQuality quality)     { return qualityNames[(int) quality]; }
    juce::String toString(AnimateKind kind)          { return animateNames[(int) kind]; }
    juce::String toString(JobStatus status)          { return statusNames[(int) status]; }

    juce::String toString(CompositionStrategy strategy)
    {
        return strategy == CompositionStrategy::Crossfade ? "crossfade" : "sequential";
    }

    bool parseFormat(const juce::String& text, RenderFormat& result)        { return parseName(text, formatNames, result); }
    bool parseQuality(const juce::String& text, RenderQuality& result)      { return parseName(text, qualityNames, result); }
    bool parseAnimateKind(const juce::String& text, AnimateKind& result)    { return parseName(text, animateNames, result); }
    bool parseJobStatus(const juce::String& text, JobStatus& result)        { return parseName(text, statusNames, result); }

    RenderFormat formatFromAspectRatio(const juce::String& aspectRatio)
    {
        const juce::String ratio = aspectRatio.trim();

        if (ratio == "9:16")
            return RenderFormat::Vertical;
        if (ratio == "1:1")
            return RenderFormat::Square;

        return RenderFormat::Horizontal;
    }

    //==========================================================================
    juce::var RenderOptions::toVar() const
    {
        juce::DynamicObject::Ptr object = new juce::DynamicObject();
        object->setProperty("format", toString(format));
        object->setProperty("quality", toString(quality));
        object->setProperty("watermark", watermark);
        object->setProperty("crossfade", crossfade);
        object->setProperty("crossfadeDuration", crossfadeDuration);
        return juce::var(object.get());
    }

    RenderOptions RenderOptions::fromVar(const juce::var& value)
    {
        RenderOptions options;

        if (!value.isObject())
            return options;

        const juce::var formatValue = value.getProperty("format", {});
        if (!formatValue.isString() || !parseFormat(formatValue.toString(), options.format))
        {
            const juce::var ratio = value.getProperty("aspectRatio", {});
            if (ratio.isString())
                options.format = formatFromAspectRatio(ratio.toString());
        }

        parseQuality(value.getProperty("quality", "standard").toString(), options.quality);

        options.watermark = (bool) value.getProperty("watermark", true);
        options.crossfade = (bool) value.getProperty("crossfade", false);

        const double fadeLength = (double) value.getProperty("crossfadeDuration", 0.5);
        if (fadeLength > 0.0)
            options.crossfadeDuration = fadeLength;

        return options;
    }
}
