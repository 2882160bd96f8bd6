#include "RemoteWorker.h"
#include "HttpHelpers.h"
#include "RenderService.h"
#include "../core/HttpJson.h"
#include "../core/SessionLogger.h"
#include "../jobs/RenderJobSinks.h"
#include "../jobs/WorkerDispatcher.h"

using namespace HttpHelpers;

//==============================================================================
class RemoteWorker::WorkerRenderJob : public juce::ThreadPoolJob
{
public:
    WorkerRenderJob(RemoteWorker& owner, const Dispatch& d)
        : juce::ThreadPoolJob("Worker render " + d.renderId),
          worker(owner),
          dispatch(d)
    {
    }

    JobStatus runJob() override
    {
        worker.runDispatch(dispatch);
        return jobHasFinished;
    }

private:
    RemoteWorker& worker;
    Dispatch dispatch;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(WorkerRenderJob)
};

//==============================================================================
juce::Result RemoteWorker::Dispatch::fromVar(const juce::var& value, Dispatch& dispatch)
{
    if (!value.isObject())
        return juce::Result::fail("Body must be a JSON object");

    dispatch.userId = value.getProperty("userId", {}).toString();
    dispatch.renderId = value.getProperty("renderId", {}).toString();
    dispatch.payloadUrl = value.getProperty("payloadUrl", {}).toString();
    dispatch.callbackUrl = value.getProperty("callbackUrl", {}).toString();

    if (dispatch.userId.isEmpty() || dispatch.renderId.isEmpty()
        || dispatch.payloadUrl.isEmpty() || dispatch.callbackUrl.isEmpty())
        return juce::Result::fail("userId, renderId, payloadUrl and callbackUrl required");

    if (!WorkspaceJanitor::isValidRenderId(dispatch.renderId))
        return juce::Result::fail("Invalid renderId");

    return juce::Result::ok();
}

//==============================================================================
RemoteWorker::RemoteWorker(const ServiceConfig& serviceConfig, WorkspaceJanitor& workspaceJanitor, ArtifactPublisher& artifactPublisher)
    : HttpServerThread("Render worker", serviceConfig.host, serviceConfig.port),
      config(serviceConfig),
      renderSettings(RenderOrchestrator::Settings::fromConfig(serviceConfig)),
      janitor(workspaceJanitor),
      publisher(artifactPublisher),
      pool(juce::jmax(1, serviceConfig.maxConcurrentRenders))
{
}

RemoteWorker::~RemoteWorker()
{
    stop();
    pool.removeAllJobs(true, 30000);
}

int RemoteWorker::getNumActiveRenders() const
{
    return pool.getNumJobs();
}

bool RemoteWorker::waitUntilIdle(int timeoutMs) const
{
    const juce::uint32 start = juce::Time::getMillisecondCounter();

    while (pool.getNumJobs() > 0)
    {
        if ((int) (juce::Time::getMillisecondCounter() - start) > timeoutMs)
            return false;

        juce::Thread::sleep(20);
    }

    return true;
}

void RemoteWorker::configureRoutes(httplib::Server& server)
{
    server.Post("/render", [this](const httplib::Request& req, httplib::Response& res) { handleRender(req, res); });

    server.Get("/api/render/download", [this](const httplib::Request& req, httplib::Response& res)
    {
        const juce::String renderId = param(req, "renderId");
        if (!WorkspaceJanitor::isValidRenderId(renderId))
            return sendError(res, 404, "Render not found");

        serveRenderArtifact(res, janitor, renderId, {});
    });

    server.Get("/api/health", [this](const httplib::Request&, httplib::Response& res)
    {
        juce::DynamicObject::Ptr body = new juce::DynamicObject();
        body->setProperty("status", "ok");
        body->setProperty("activeRenders", getNumActiveRenders());
        sendJson(res, 200, juce::var(body.get()));
    });
}

bool RemoteWorker::isAuthorised(const httplib::Request& req) const
{
    if (config.workerToken.isNotEmpty() && WorkerDispatcher::secretMatches(config.workerToken, bearerToken(req)))
        return true;

    return WorkerDispatcher::secretMatches(config.internalSecret, header(req, secretHeader));
}

void RemoteWorker::handleRender(const httplib::Request& req, httplib::Response& res)
{
    if (!isAuthorised(req))
        return sendError(res, 401, "Unauthorized");

    juce::var body;
    if (!parseJsonBody(req, res, body))
        return;

    Dispatch dispatch;
    const juce::Result parsed = Dispatch::fromVar(body, dispatch);
    if (parsed.failed())
        return sendError(res, 400, parsed.getErrorMessage());

    pool.addJob(new WorkerRenderJob(*this, dispatch), true);
    RenderLog::info("render.worker.accepted", { { "renderId", dispatch.renderId } });

    juce::DynamicObject::Ptr reply = new juce::DynamicObject();
    reply->setProperty("accepted", true);
    reply->setProperty("renderId", dispatch.renderId);
    sendJson(res, 202, juce::var(reply.get()));
}

void RemoteWorker::runDispatch(const Dispatch& dispatch)
{
    CallbackJobSink sink(dispatch.callbackUrl, config.internalSecret, dispatch.userId, dispatch.renderId);

    juce::DynamicObject::Ptr request = new juce::DynamicObject();
    request->setProperty("userId", dispatch.userId);
    request->setProperty("renderId", dispatch.renderId);

    juce::StringPairArray headers;
    headers.set(secretHeader, config.internalSecret);

    const auto response = HttpJson::post(dispatch.payloadUrl, juce::var(request.get()), headers);

    if (!response.isSuccess())
    {
        const juce::String error = "Payload fetch failed (HTTP " + juce::String(response.statusCode) + ")";
        RenderLog::error("render.worker.payload_failed", { { "renderId", dispatch.renderId },
                                                           { "status", response.statusCode } });
        sink.fail(error, {});
        return;
    }

    RenderOrchestrator::RenderRequest renderRequest;
    renderRequest.userId = dispatch.userId;
    renderRequest.renderId = dispatch.renderId;

    const juce::Result parsed = RenderPayload::fromVar(response.json(), renderRequest.payload);
    if (parsed.failed())
    {
        sink.fail("Invalid payload: " + parsed.getErrorMessage(), {});
        return;
    }

    renderRequest.options = renderRequest.payload.options;

    RenderOrchestrator orchestrator(renderSettings, janitor, publisher);
    orchestrator.render(renderRequest, sink);
}
