#pragma once
#include <JuceHeader.h>
#include "HttpServerThread.h"
#include "../core/ServiceConfig.h"
#include "../jobs/RenderJobStore.h"
#include "../jobs/ProjectCatalog.h"
#include "../jobs/WorkerDispatcher.h"
#include "../workspace/WorkspaceJanitor.h"

/**
 * The job service HTTP surface.
 *
 * Callers are identified by the x-user-id header set by the gateway in front
 * of the service. The worker endpoints are authenticated with the shared
 * internal secret instead.
 */
class RenderService : public HttpServerThread
{
public:
    RenderService(const ServiceConfig& config,
                  RenderJobStore& store,
                  const ProjectCatalog& projects,
                  WorkspaceJanitor& janitor,
                  WorkerDispatcher& dispatcher);

    ~RenderService() override;

protected:
    void configureRoutes(httplib::Server& server) override;

private:
    /** Sends 401 and returns empty when the caller is not identified. */
    juce::String requireUser(const httplib::Request& req, httplib::Response& res) const;
    bool requireSecret(const httplib::Request& req, httplib::Response& res) const;

    void handleConfig(const httplib::Request& req, httplib::Response& res);
    void handleSubmit(const httplib::Request& req, httplib::Response& res);
    void handleStatus(const httplib::Request& req, httplib::Response& res);
    void handleHistory(const httplib::Request& req, httplib::Response& res);
    void handleDownload(const httplib::Request& req, httplib::Response& res);
    void handleDelete(const httplib::Request& req, httplib::Response& res);
    void handleWorkerPayload(const httplib::Request& req, httplib::Response& res);
    void handleWorkerCallback(const httplib::Request& req, httplib::Response& res);
    void handleDiag(const httplib::Request& req, httplib::Response& res);

    ServiceConfig config;
    RenderJobStore& store;
    const ProjectCatalog& projects;
    WorkspaceJanitor& janitor;
    WorkerDispatcher& dispatcher;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RenderService)
};

/** Serves a spooled artifact, or redirects to its durable URL. Shared with the worker. */
void serveRenderArtifact(httplib::Response& res,
                         WorkspaceJanitor& janitor,
                         const juce::String& renderId,
                         const juce::String& outputUrl);
