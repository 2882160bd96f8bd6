#include "RenderService.h"
#include "HttpHelpers.h"
#include "../jobs/RenderConfig.h"
#include "../rendering/FFmpegExecutor.h"
#include "../rendering/AssetDownloader.h"
#include "../core/SessionLogger.h"
#include "../core/ProcessManager.h"

using namespace RenderTypes;
using namespace HttpHelpers;

namespace
{
    juce::var jobSummary(const RenderJob& job)
    {
        juce::DynamicObject::Ptr body = new juce::DynamicObject();
        body->setProperty("renderId", job.renderId);
        body->setProperty("status", toString(job.status));
        body->setProperty("progress", job.progress);
        return juce::var(body.get());
    }
}

//==============================================================================
void serveRenderArtifact(httplib::Response& res,
                         WorkspaceJanitor& janitor,
                         const juce::String& renderId,
                         const juce::String& outputUrl)
{
    const juce::File spooled = janitor.getSpooledArtifact(renderId);

    if (spooled.existsAsFile())
    {
        serveFile(res, spooled, "video/mp4", "musicreel-" + renderId + ".mp4");
        return;
    }

    if (AssetDownloader::isRemoteUrl(outputUrl) && !outputUrl.contains("/api/render/download"))
    {
        res.set_redirect(toStd(outputUrl), 302);
        return;
    }

    sendError(res, 404, "Render output not available");
}

//==============================================================================
RenderService::RenderService(const ServiceConfig& serviceConfig,
                             RenderJobStore& jobStore,
                             const ProjectCatalog& projectCatalog,
                             WorkspaceJanitor& workspaceJanitor,
                             WorkerDispatcher& jobDispatcher)
    : HttpServerThread("Render service", serviceConfig.host, serviceConfig.port),
      config(serviceConfig),
      store(jobStore),
      projects(projectCatalog),
      janitor(workspaceJanitor),
      dispatcher(jobDispatcher)
{
}

RenderService::~RenderService()
{
    stop();
}

void RenderService::configureRoutes(httplib::Server& server)
{
    server.Post("/api/render/config",          [this](const httplib::Request& req, httplib::Response& res) { handleConfig(req, res); });
    server.Post("/api/render/jobs",            [this](const httplib::Request& req, httplib::Response& res) { handleSubmit(req, res); });
    server.Get("/api/render/status",           [this](const httplib::Request& req, httplib::Response& res) { handleStatus(req, res); });
    server.Get("/api/render/history",          [this](const httplib::Request& req, httplib::Response& res) { handleHistory(req, res); });
    server.Get("/api/render/download",         [this](const httplib::Request& req, httplib::Response& res) { handleDownload(req, res); });
    server.Delete("/api/render/download",      [this](const httplib::Request& req, httplib::Response& res) { handleDelete(req, res); });
    server.Post("/api/render/worker/payload",  [this](const httplib::Request& req, httplib::Response& res) { handleWorkerPayload(req, res); });
    server.Post("/api/render/worker/callback", [this](const httplib::Request& req, httplib::Response& res) { handleWorkerCallback(req, res); });
    server.Get("/api/render/diag",             [this](const httplib::Request& req, httplib::Response& res) { handleDiag(req, res); });

    server.Get("/api/health", [](const httplib::Request&, httplib::Response& res)
    {
        juce::DynamicObject::Ptr body = new juce::DynamicObject();
        body->setProperty("status", "ok");
        body->setProperty("time", juce::Time::getCurrentTime().toISO8601(true));
        sendJson(res, 200, juce::var(body.get()));
    });
}

juce::String RenderService::requireUser(const httplib::Request& req, httplib::Response& res) const
{
    const juce::String userId = header(req, userHeader);

    if (userId.isEmpty())
        sendError(res, 401, "Unauthorized");

    return userId;
}

bool RenderService::requireSecret(const httplib::Request& req, httplib::Response& res) const
{
    if (WorkerDispatcher::secretMatches(config.internalSecret, header(req, secretHeader)))
        return true;

    sendError(res, 401, "Unauthorized");
    return false;
}

//==============================================================================
void RenderService::handleConfig(const httplib::Request& req, httplib::Response& res)
{
    if (requireUser(req, res).isEmpty())
        return;

    juce::var body;
    if (!parseJsonBody(req, res, body))
        return;

    RenderConfig renderConfig;
    const juce::Result parsed = RenderConfig::fromVar(body, renderConfig);
    if (parsed.failed())
        return sendError(res, 400, parsed.getErrorMessage());

    if (!projects.exists(renderConfig.projectId))
        return sendError(res, 404, "Project not found");

    sendJson(res, 200, renderConfig.toVar());
}

void RenderService::handleSubmit(const httplib::Request& req, httplib::Response& res)
{
    const juce::String userId = requireUser(req, res);
    if (userId.isEmpty())
        return;

    juce::var body;
    if (!parseJsonBody(req, res, body))
        return;

    RenderJobStore::CreateRequest request;
    request.userId = userId;
    request.projectId = body.getProperty("projectId", {}).toString();
    request.configId = body.getProperty("configId", {}).toString();
    request.idempotencyKey = body.getProperty("idempotencyKey", {}).toString();
    request.options = RenderOptions::fromVar(body.getProperty("renderOptions", {}));

    if (request.idempotencyKey.isEmpty())
        request.idempotencyKey = header(req, "Idempotency-Key");

    if (request.projectId.isEmpty())
        return sendError(res, 400, "projectId required");

    // A retried submission gets its existing record even if the project has gone since.
    if (request.idempotencyKey.trim().isNotEmpty())
    {
        RenderJob existing;
        if (store.get(userId, RenderJobStore::deriveRenderId(userId, request.idempotencyKey), existing))
        {
            RenderLog::info("render.job.duplicate", { { "renderId", existing.renderId } });
            return sendJson(res, 200, jobSummary(existing));
        }
    }

    if (!ProjectCatalog::isValidProjectId(request.projectId) || !projects.exists(request.projectId))
        return sendError(res, 404, "Project not found");

    const auto created = store.create(request);
    if (created.result.failed())
        return sendError(res, 500, created.result.getErrorMessage());

    if (!created.created)
    {
        RenderLog::info("render.job.duplicate", { { "renderId", created.job.renderId } });
        return sendJson(res, 200, jobSummary(created.job));
    }

    RenderLog::info("render.job.created", { { "renderId", created.job.renderId },
                                            { "projectId", created.job.projectId },
                                            { "quality", toString(created.job.options.quality) } });

    // A failed dispatch has already failed the job; the caller sees it on the next poll.
    const juce::Result dispatched = dispatcher.dispatch(created.job);
    if (dispatched.failed())
        juce::Logger::writeToLog("Dispatch failed for " + created.job.renderId + ": " + dispatched.getErrorMessage());

    RenderJob current;
    if (!store.get(userId, created.job.renderId, current))
        current = created.job;

    sendJson(res, 202, jobSummary(current));
}

void RenderService::handleStatus(const httplib::Request& req, httplib::Response& res)
{
    const juce::String userId = requireUser(req, res);
    if (userId.isEmpty())
        return;

    const juce::String renderId = param(req, "renderId");
    if (renderId.isEmpty())
        return sendError(res, 400, "renderId required");

    RenderJob job;
    if (!store.get(userId, renderId, job))
        return sendError(res, 404, "Render not found");

    sendJson(res, 200, job.toStatusVar(true));
}

void RenderService::handleHistory(const httplib::Request& req, httplib::Response& res)
{
    const juce::String userId = requireUser(req, res);
    if (userId.isEmpty())
        return;

    const juce::String limitText = param(req, "limit");
    const int limit = limitText.isNotEmpty() ? limitText.getIntValue() : 20;

    juce::Array<juce::var> renders;
    for (const auto& job : store.list(userId, param(req, "status"), param(req, "projectId"), limit))
        renders.add(job.toStatusVar(false));

    juce::DynamicObject::Ptr body = new juce::DynamicObject();
    body->setProperty("renders", renders);
    sendJson(res, 200, juce::var(body.get()));
}

void RenderService::handleDownload(const httplib::Request& req, httplib::Response& res)
{
    const juce::String userId = requireUser(req, res);
    if (userId.isEmpty())
        return;

    const juce::String renderId = param(req, "renderId");
    if (renderId.isEmpty())
        return sendError(res, 400, "renderId required");

    RenderJob job;
    if (!store.get(userId, renderId, job) || !WorkspaceJanitor::isValidRenderId(renderId))
        return sendError(res, 404, "Render not found");

    if (job.status != JobStatus::Complete)
        return sendError(res, 404, "Render output not available");

    serveRenderArtifact(res, janitor, renderId, job.outputUrl);
}

void RenderService::handleDelete(const httplib::Request& req, httplib::Response& res)
{
    const juce::String userId = requireUser(req, res);
    if (userId.isEmpty())
        return;

    const juce::String renderId = param(req, "renderId");
    if (renderId.isEmpty())
        return sendError(res, 400, "renderId required");

    RenderJob job;
    if (!store.get(userId, renderId, job) || !WorkspaceJanitor::isValidRenderId(renderId))
        return sendError(res, 404, "Render not found");

    if (job.status == JobStatus::Processing)
        return sendError(res, 409, "Render is still processing");

    janitor.cleanup(renderId);
    janitor.removeSpooledArtifact(renderId);

    if (!store.remove(userId, renderId))
        return sendError(res, 500, "Could not delete render");

    RenderLog::info("render.job.deleted", { { "renderId", renderId } });

    juce::DynamicObject::Ptr body = new juce::DynamicObject();
    body->setProperty("deleted", true);
    body->setProperty("renderId", renderId);
    sendJson(res, 200, juce::var(body.get()));
}

//==============================================================================
void RenderService::handleWorkerPayload(const httplib::Request& req, httplib::Response& res)
{
    if (!requireSecret(req, res))
        return;

    juce::var body;
    if (!parseJsonBody(req, res, body))
        return;

    const juce::String userId = body.getProperty("userId", {}).toString();
    const juce::String renderId = body.getProperty("renderId", {}).toString();

    RenderJob job;
    if (userId.isEmpty() || renderId.isEmpty() || !store.get(userId, renderId, job))
        return sendError(res, 404, "Render not found");

    RenderPayload project;
    const juce::Result loaded = projects.load(job.projectId, project);
    if (loaded.failed())
        return sendError(res, 404, loaded.getErrorMessage());

    sendJson(res, 200, WorkerDispatcher::buildPayload(job, project));
}

void RenderService::handleWorkerCallback(const httplib::Request& req, httplib::Response& res)
{
    if (!requireSecret(req, res))
        return;

    juce::var body;
    if (!parseJsonBody(req, res, body))
        return;

    RenderJob job;
    if (!store.get(body.getProperty("userId", {}).toString(), body.getProperty("renderId", {}).toString(), job))
        return sendError(res, 404, "Render not found");

    const juce::Result applied = dispatcher.applyCallback(body);
    if (applied.failed())
        return sendError(res, 400, applied.getErrorMessage());

    juce::DynamicObject::Ptr reply = new juce::DynamicObject();
    reply->setProperty("ok", true);
    sendJson(res, 200, juce::var(reply.get()));
}

void RenderService::handleDiag(const httplib::Request&, httplib::Response& res)
{
    FFmpegExecutor executor(config.ffmpegPath, config.ffprobePath);
    const juce::String version = executor.getVersionString();

    juce::DynamicObject::Ptr body = new juce::DynamicObject();
    body->setProperty("ffmpegAvailable", version.isNotEmpty());
    body->setProperty("ffmpegPath", executor.getFFmpegPath());
    body->setProperty("ffprobePath", executor.getFFprobePath());
    body->setProperty("version", version);
    body->setProperty("remoteWorker", dispatcher.usesRemoteWorker());

    juce::Array<juce::var> encoders;
    for (const auto& description : ProcessManager::getInstance().getActiveDescriptions())
        encoders.add(description);
    body->setProperty("activeEncoders", encoders);
    sendJson(res, 200, juce::var(body.get()));
}
