#pragma once
#include <JuceHeader.h>
#include "../rendering/RenderTypes.h"

/**
 * Request-scoped render configuration: resolves the output resolution and
 * the credit estimate before a job exists. Nothing here is persisted except
 * the configId recorded on the job.
 */
struct RenderConfig
{
    juce::String projectId;
    RenderTypes::RenderFormat format = RenderTypes::RenderFormat::Vertical;
    RenderTypes::RenderQuality quality = RenderTypes::RenderQuality::Standard;
    double duration = 0.0;
    int scenesCount = 0;
    juce::String aspectRatio;

    /**
     * Reads {projectId, format?, aspectRatio?, quality?, duration?, scenesCount?}.
     * format wins over aspectRatio when both are present.
     */
    static juce::Result fromVar(const juce::var& value, RenderConfig& config);

    RenderTypes::Resolution getResolution() const;

    /** 10 base, +5 per 15s block past the first, +5 standard / +15 pro, +1 per scene past 8 */
    int estimateCredits() const;

    /** Stable id for identical configurations */
    juce::String getConfigId() const;

    juce::var toVar() const;
};
