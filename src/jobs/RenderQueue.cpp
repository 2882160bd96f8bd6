#include "RenderQueue.h"

//==============================================================================
class RenderQueue::StoredRenderJob : public juce::ThreadPoolJob
{
public:
    StoredRenderJob(RenderQueue& renderQueue, const juce::String& user, const juce::String& render)
        : juce::ThreadPoolJob("Render " + render),
          queue(renderQueue),
          userId(user),
          renderId(render)
    {
    }

    JobStatus runJob() override
    {
        RenderOrchestrator orchestrator(queue.settings, queue.janitor, queue.publisher);
        orchestrator.runStoredJob(queue.store, queue.projects, userId, renderId);
        return jobHasFinished;
    }

private:
    RenderQueue& queue;
    juce::String userId;
    juce::String renderId;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(StoredRenderJob)
};

//==============================================================================
RenderQueue::RenderQueue(const RenderOrchestrator::Settings& renderSettings,
                         int maxConcurrentRenders,
                         RenderJobStore& jobStore,
                         const ProjectCatalog& projectCatalog,
                         WorkspaceJanitor& workspaceJanitor,
                         ArtifactPublisher& artifactPublisher)
    : settings(renderSettings),
      store(jobStore),
      projects(projectCatalog),
      janitor(workspaceJanitor),
      publisher(artifactPublisher),
      pool(std::make_unique<juce::ThreadPool>(juce::jmax(1, maxConcurrentRenders)))
{
}

RenderQueue::~RenderQueue()
{
    pool->removeAllJobs(true, 30000);
    pool.reset();
}

void RenderQueue::enqueue(const juce::String& userId, const juce::String& renderId)
{
    pool->addJob(new StoredRenderJob(*this, userId, renderId), true);
}

int RenderQueue::getNumJobs() const
{
    return pool->getNumJobs();
}

bool RenderQueue::waitUntilIdle(int timeoutMs) const
{
    const juce::uint32 start = juce::Time::getMillisecondCounter();

    while (pool->getNumJobs() > 0)
    {
        if ((int) (juce::Time::getMillisecondCounter() - start) > timeoutMs)
            return false;

        juce::Thread::sleep(20);
    }

    return true;
}
