#pragma once
#include <JuceHeader.h>
#include "RenderTypes.h"

//==============================================================================
/**
 * @file FilterChainBuilder.h
 *
 * Builds the per-scene FFmpeg video filter expression.
 *
 * Every stage is modelled as a small value type and only turned into FFmpeg
 * syntax by serialise(). The builder does no I/O, so identical requests always
 * produce byte-identical strings.
 *
 * Stage order is fixed:
 * 1. aspect-preserving scale-down
 * 2. letterbox/pillarbox pad to the exact target size (+ setsar, fps)
 * 3. animation (zoom ramp, pan sweep or 0.5s fade)
 * 4. final re-scale safeguard back to the target size
 * 5. optional bottom-right watermark text
 */
class FilterChainBuilder
{
public:
    static constexpr double maxZoom = 1.10;
    static constexpr double fadeSeconds = 0.5;
    static constexpr int watermarkFontSize = 48;

    struct ScaleStage
    {
        RenderTypes::Resolution target;
        juce::String serialise() const;
    };

    struct PadStage
    {
        RenderTypes::Resolution target;
        int fps = 30;
        juce::String serialise() const;
    };

    struct AnimationStage
    {
        RenderTypes::AnimateKind kind = RenderTypes::AnimateKind::None;
        RenderTypes::Resolution target;
        double durationSec = 0.0;
        int fps = 30;

        /** Number of frames the ramp spans, never less than one */
        int frameCount() const;

        /** Empty when kind is None */
        juce::String serialise() const;
    };

    struct SafeguardStage
    {
        RenderTypes::Resolution target;
        juce::String serialise() const;
    };

    struct WatermarkStage
    {
        juce::String text;
        int fontSize = watermarkFontSize;
        juce::String serialise() const;
    };

    struct FilterChainRequest
    {
        RenderTypes::Resolution target;
        double durationSec = 5.0;
        int fps = 30;
        RenderTypes::AnimateKind animate = RenderTypes::AnimateKind::None;
        bool watermarkEnabled = false;
        juce::String watermarkText = "MUSICREEL DEMO";
    };

    /** Returns the comma-joined -vf expression for one scene. */
    static juce::String build(const FilterChainRequest& request);

    /** Convenience overload matching the scene-level inputs. */
    static juce::String build(RenderTypes::Resolution target,
                              double durationSec,
                              int fps,
                              RenderTypes::AnimateKind animate,
                              bool watermarkEnabled,
                              const juce::String& watermarkText = "MUSICREEL DEMO");

    /** Escapes text for use inside a single-quoted drawtext value. */
    static juce::String escapeDrawText(const juce::String& text);

    /** Fixed-precision number formatting used by all stages. */
    static juce::String formatNumber(double value, int decimals = 2);
};
