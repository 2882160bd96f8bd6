#pragma once
#include <JuceHeader.h>
#include "RenderJobStore.h"
#include "RenderPayload.h"
#include "RenderQueue.h"
#include "../core/ServiceConfig.h"

/**
 * Routes accepted jobs to an executor.
 *
 * With a worker URL configured the job is handed to the remote encoding
 * worker, which later reports back through applyCallback(). Otherwise it is
 * queued for in-process rendering. Either way the caller has its answer
 * before any encoding starts.
 */
class WorkerDispatcher
{
public:
    static constexpr const char* secretHeader = "x-internal-render-secret";
    static constexpr int errorBodyCharacters = 500;

    struct Settings
    {
        juce::String workerUrl;
        juce::String workerToken;
        juce::String internalSecret;
        juce::String publicBaseUrl;
        int timeoutMs = 15000;

        static Settings fromConfig(const ServiceConfig& config);
    };

    /**
     * @param localQueue  in-process queue, used when no worker URL is set
     */
    WorkerDispatcher(const Settings& settings, RenderJobStore& store, RenderQueue* localQueue);

    bool usesRemoteWorker() const { return settings.workerUrl.isNotEmpty(); }

    /**
     * Starts execution of a pending job. A remote worker that cannot be
     * reached or answers non-2xx fails the job immediately.
     */
    juce::Result dispatch(const RenderJob& job);

    /** The document the worker fetches from the payload endpoint. */
    static juce::var buildPayload(const RenderJob& job, const RenderPayload& project);

    /** Body POSTed to the worker's /render endpoint. */
    juce::var makeDispatchBody(const RenderJob& job) const;

    /**
     * Applies a worker status report: processing updates progress, complete
     * and failed finalize the job.
     */
    juce::Result applyCallback(const juce::var& body);

    /** Compares secrets without an early exit on the first mismatch. */
    static bool secretMatches(const juce::String& expected, const juce::String& provided);

private:
    Settings settings;
    RenderJobStore& store;
    RenderQueue* queue;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(WorkerDispatcher)
};
