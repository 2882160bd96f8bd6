#pragma once
#include <JuceHeader.h>
#include "RenderJobStore.h"
#include "ProjectCatalog.h"
#include "../rendering/RenderOrchestrator.h"

/**
 * In-process render execution: stored jobs are rendered on a thread pool
 * sized by maxConcurrentRenders, each with its own orchestrator.
 */
class RenderQueue
{
public:
    RenderQueue(const RenderOrchestrator::Settings& settings,
                int maxConcurrentRenders,
                RenderJobStore& store,
                const ProjectCatalog& projects,
                WorkspaceJanitor& janitor,
                ArtifactPublisher& publisher);

    /** Waits for running renders; queued ones are dropped and stay pending. */
    ~RenderQueue();

    void enqueue(const juce::String& userId, const juce::String& renderId);

    /** Queued plus running renders */
    int getNumJobs() const;

    /** Blocks until the queue is empty or the timeout passes. Returns true if empty. */
    bool waitUntilIdle(int timeoutMs) const;

private:
    class StoredRenderJob;

    RenderOrchestrator::Settings settings;
    RenderJobStore& store;
    const ProjectCatalog& projects;
    WorkspaceJanitor& janitor;
    ArtifactPublisher& publisher;
    std::unique_ptr<juce::ThreadPool> pool;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RenderQueue)
};
