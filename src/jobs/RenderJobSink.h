#pragma once
#include <JuceHeader.h>

/**
 * Destination for the state changes of a single render.
 *
 * The in-process path writes straight into the RenderJobStore; the remote
 * worker reports back over the callback endpoint instead. The orchestrator
 * only talks to this interface.
 */
class RenderJobSink
{
public:
    virtual ~RenderJobSink() = default;

    /**
     * Claims the job and moves it to processing.
     * @return false if the job is not pending (already run, running or terminal)
     */
    virtual bool begin() = 0;

    virtual void progress(int percent, const juce::String& logTailDelta) = 0;

    virtual void complete(const juce::String& outputUrl, const juce::String& note) = 0;

    virtual void fail(const juce::String& error, const juce::String& logTail) = 0;
};
