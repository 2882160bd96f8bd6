#pragma once
#include <JuceHeader.h>
#include "HttpServerThread.h"
#include "../core/ServiceConfig.h"
#include "../rendering/RenderOrchestrator.h"
#include "../rendering/ArtifactPublisher.h"
#include "../workspace/WorkspaceJanitor.h"

/**
 * The remote encoding worker.
 *
 * Accepts dispatches from the job service on POST /render, answers 202 and
 * renders in the background: the payload is fetched from the service and
 * every transition is reported to the service's callback endpoint. The
 * worker keeps no job records of its own.
 */
class RemoteWorker : public HttpServerThread
{
public:
    struct Dispatch
    {
        juce::String userId;
        juce::String renderId;
        juce::String payloadUrl;
        juce::String callbackUrl;

        static juce::Result fromVar(const juce::var& value, Dispatch& dispatch);
    };

    RemoteWorker(const ServiceConfig& config, WorkspaceJanitor& janitor, ArtifactPublisher& publisher);
    ~RemoteWorker() override;

    /** Accepted renders that have not finished yet */
    int getNumActiveRenders() const;

    /** Blocks until no render is running or the timeout passes. Returns true if idle. */
    bool waitUntilIdle(int timeoutMs) const;

protected:
    void configureRoutes(httplib::Server& server) override;

private:
    class WorkerRenderJob;

    bool isAuthorised(const httplib::Request& req) const;

    void handleRender(const httplib::Request& req, httplib::Response& res);

    /** Fetches the payload and runs the render. Called on a pool thread. */
    void runDispatch(const Dispatch& dispatch);

    ServiceConfig config;
    RenderOrchestrator::Settings renderSettings;
    WorkspaceJanitor& janitor;
    ArtifactPublisher& publisher;
    juce::ThreadPool pool;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RemoteWorker)
};
