#pragma once
#include <JuceHeader.h>
#include "RenderJobSink.h"
#include "RenderJobStore.h"

//==============================================================================
/** Writes job transitions straight into the local store. */
class StoreJobSink : public RenderJobSink
{
public:
    StoreJobSink(RenderJobStore& store, const juce::String& userId, const juce::String& renderId);

    bool begin() override;
    void progress(int percent, const juce::String& logTailDelta) override;
    void complete(const juce::String& outputUrl, const juce::String& note) override;
    void fail(const juce::String& error, const juce::String& logTail) override;

private:
    RenderJobStore& store;
    juce::String userId;
    juce::String renderId;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(StoreJobSink)
};

//==============================================================================
/**
 * Reports job transitions from a remote worker back to the service's
 * callback endpoint, authenticated with the shared internal secret.
 *
 * The service already moved the job to processing when it dispatched it,
 * so begin() only announces the start.
 */
class CallbackJobSink : public RenderJobSink
{
public:
    static constexpr const char* secretHeader = "x-internal-render-secret";

    CallbackJobSink(const juce::String& callbackUrl,
                    const juce::String& internalSecret,
                    const juce::String& userId,
                    const juce::String& renderId);

    bool begin() override;
    void progress(int percent, const juce::String& logTailDelta) override;
    void complete(const juce::String& outputUrl, const juce::String& note) override;
    void fail(const juce::String& error, const juce::String& logTail) override;

    /** Callback body for one transition; exposed for tests. */
    juce::var makeBody(const juce::String& status, int percent) const;

private:
    bool send(const juce::var& body);

    juce::String callbackUrl;
    juce::String secret;
    juce::String userId;
    juce::String renderId;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(CallbackJobSink)
};
