#include "FilterChainBuilder.h"

using RenderTypes::AnimateKind;

namespace
{
    juce::String size(const RenderTypes::Resolution& r, char separator)
    {
        return juce::String(r.width) + juce::String::charToString(separator) + juce::String(r.height);
    }

    juce::String zoompan(const juce::String& zoom, const juce::String& x, const juce::String& y,
                         const RenderTypes::Resolution& target, int fps)
    {
        return "zoompan=z='" + zoom + "':x='" + x + "':y='" + y + "':d=1:s=" + size(target, 'x')
             + ":fps=" + juce::String(fps);
    }
}

//==============================================================================
juce::String FilterChainBuilder::formatNumber(double value, int decimals)
{
    return juce::String::formatted("%.*f", decimals, value);
}

juce::String FilterChainBuilder::escapeDrawText(const juce::String& text)
{
    // Quotes, backslashes, colons and % all have meaning to the filtergraph or
    // drawtext expansion, so only a conservative character set survives.
    const juce::String allowed = "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789 -_.!?,@#&()+";
    return text.retainCharacters(allowed).trim();
}

//==============================================================================
juce::String FilterChainBuilder::ScaleStage::serialise() const
{
    return "scale=" + size(target, ':') + ":force_original_aspect_ratio=decrease";
}

juce::String FilterChainBuilder::PadStage::serialise() const
{
    return "pad=" + size(target, ':') + ":(ow-iw)/2:(oh-ih)/2:black,setsar=1,fps=" + juce::String(fps);
}

int FilterChainBuilder::AnimationStage::frameCount() const
{
    return juce::jmax(1, juce::roundToInt(durationSec * fps));
}

juce::String FilterChainBuilder::AnimationStage::serialise() const
{
    const juce::String den = juce::String(juce::jmax(1, frameCount() - 1));
    const juce::String zoomMax = formatNumber(maxZoom);
    const juce::String zoomStep = formatNumber(maxZoom - 1.0);
    const juce::String centreX = "iw/2-(iw/zoom/2)";
    const juce::String centreY = "ih/2-(ih/zoom/2)";
    const juce::String spanX = "(iw-iw/zoom)";
    const juce::String spanY = "(ih-ih/zoom)";
    const juce::String ramp = "on/" + den;

    switch (kind)
    {
        case AnimateKind::ZoomIn:
            return zoompan("min(1+" + zoomStep + "*" + ramp + "," + zoomMax + ")", centreX, centreY, target, fps);

        case AnimateKind::ZoomOut:
            return zoompan("max(" + zoomMax + "-" + zoomStep + "*" + ramp + ",1)", centreX, centreY, target, fps);

        case AnimateKind::PanLeft:
            return zoompan(zoomMax, spanX + "*" + ramp, spanY + "/2", target, fps);

        case AnimateKind::PanRight:
            return zoompan(zoomMax, spanX + "*(1-" + ramp + ")", spanY + "/2", target, fps);

        case AnimateKind::PanUp:
            return zoompan(zoomMax, spanX + "/2", spanY + "*(1-" + ramp + ")", target, fps);

        case AnimateKind::PanDown:
            return zoompan(zoomMax, spanX + "/2", spanY + "*" + ramp, target, fps);

        case AnimateKind::FadeIn:
            return "fade=t=in:st=0:d=" + formatNumber(fadeSeconds);

        case AnimateKind::FadeOut:
            return "fade=t=out:st=" + formatNumber(juce::jmax(0.0, durationSec - fadeSeconds))
                 + ":d=" + formatNumber(fadeSeconds);

        case AnimateKind::None:
        default:
            return {};
    }
}

juce::String FilterChainBuilder::SafeguardStage::serialise() const
{
    return "scale=" + size(target, ':') + ",setsar=1";
}

juce::String FilterChainBuilder::WatermarkStage::serialise() const
{
    return "drawtext=text='" + escapeDrawText(text) + "':fontsize=" + juce::String(fontSize)
         + ":fontcolor=white@0.4:x=w-tw-20:y=h-th-20:shadowcolor=black@0.3:shadowx=2:shadowy=2";
}

//==============================================================================
juce::String FilterChainBuilder::build(const FilterChainRequest& request)
{
    juce::StringArray stages;

    stages.add(ScaleStage { request.target }.serialise());
    stages.add(PadStage { request.target, request.fps }.serialise());

    const juce::String animation = AnimationStage { request.animate, request.target,
                                                    request.durationSec, request.fps }.serialise();
    if (animation.isNotEmpty())
        stages.add(animation);

    stages.add(SafeguardStage { request.target }.serialise());

    if (request.watermarkEnabled && escapeDrawText(request.watermarkText).isNotEmpty())
        stages.add(WatermarkStage { request.watermarkText, watermarkFontSize }.serialise());

    return stages.joinIntoString(",");
}

juce::String FilterChainBuilder::build(RenderTypes::Resolution target,
                                       double durationSec,
                                       int fps,
                                       AnimateKind animate,
                                       bool watermarkEnabled,
                                       const juce::String& watermarkText)
{
    FilterChainRequest request;
    request.target = target;
    request.durationSec = durationSec;
    request.fps = fps;
    request.animate = animate;
    request.watermarkEnabled = watermarkEnabled;
    request.watermarkText = watermarkText;
    return build(request);
}
