#pragma once
#include <JuceHeader.h>

/**
 * Common types used across the rendering system.
 * These types are shared by the job store, the dispatcher and the render
 * pipeline so that every stage agrees on names and string forms.
 */
namespace RenderTypes
{
    /** Output frame orientation */
    enum class RenderFormat
    {
        Vertical,
        Horizontal,
        Square
    };

    /** Encode quality tier */
    enum class RenderQuality
    {
        Basic,
        Standard,
        Pro
    };

    /** Per-scene animation directive */
    enum class AnimateKind
    {
        None,
        ZoomIn,
        ZoomOut,
        PanLeft,
        PanRight,
        PanUp,
        PanDown,
        FadeIn,
        FadeOut
    };

    /** Lifecycle of a render job. Complete and Failed are terminal. */
    enum class JobStatus
    {
        Pending,
        Processing,
        Complete,
        Failed
    };

    enum class CompositionStrategy
    {
        Sequential,
        Crossfade
    };

    struct Resolution
    {
        int width = 0;
        int height = 0;

        bool operator== (const Resolution& other) const { return width == other.width && height == other.height; }
        juce::String toString() const { return juce::String(width) + "x" + juce::String(height); }
    };

    /** Options the caller picked when submitting the job */
    struct RenderOptions
    {
        RenderFormat format = RenderFormat::Vertical;
        RenderQuality quality = RenderQuality::Standard;
        bool watermark = true;
        bool crossfade = false;
        double crossfadeDuration = 0.5;

        juce::var toVar() const;
        static RenderOptions fromVar(const juce::var& value);
    };

    /** A storyboard entry resolved to a local, encoder-ready file */
    struct SceneSpec
    {
        int index = 0;
        double durationSec = 5.0;
        AnimateKind animate = AnimateKind::None;
        juce::File source;
        bool isVideo = false;
    };

    //==========================================================================
    juce::String toString(RenderFormat format);
    juce::String toString(RenderQuality quality);
    juce::String toString(AnimateKind kind);
    juce::String toString(JobStatus status);
    juce::String toString(CompositionStrategy strategy);

    bool parseFormat(const juce::String& text, RenderFormat& result);
    bool parseQuality(const juce::String& text, RenderQuality& result);
    bool parseAnimateKind(const juce::String& text, AnimateKind& result);
    bool parseJobStatus(const juce::String& text, JobStatus& result);

    /** Maps "9:16", "1:1" and "16:9" onto a format. Unknown ratios fall back to vertical. */
    RenderFormat formatFromAspectRatio(const juce::String& aspectRatio);

    inline bool isTerminal(JobStatus status)
    {
        return status == JobStatus::Complete || status == JobStatus::Failed;
    }
}
