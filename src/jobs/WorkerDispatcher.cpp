#include "WorkerDispatcher.h"
#include "../core/HttpJson.h"
#include "../core/SessionLogger.h"

using namespace RenderTypes;

WorkerDispatcher::Settings WorkerDispatcher::Settings::fromConfig(const ServiceConfig& config)
{
    Settings s;
    s.workerUrl = config.workerUrl;
    s.workerToken = config.workerToken;
    s.internalSecret = config.internalSecret;
    s.publicBaseUrl = config.getPublicBaseUrl();
    return s;
}

WorkerDispatcher::WorkerDispatcher(const Settings& dispatchSettings, RenderJobStore& jobStore, RenderQueue* localQueue)
    : settings(dispatchSettings),
      store(jobStore),
      queue(localQueue)
{
}

bool WorkerDispatcher::secretMatches(const juce::String& expected, const juce::String& provided)
{
    if (expected.isEmpty())
        return false;

    const char* a = expected.toRawUTF8();
    const char* b = provided.toRawUTF8();
    const size_t lengthA = expected.getNumBytesAsUTF8();
    const size_t lengthB = provided.getNumBytesAsUTF8();

    unsigned int diff = (unsigned int) (lengthA ^ lengthB);
    for (size_t i = 0; i < lengthA; ++i)
        diff |= (unsigned int) ((unsigned char) a[i] ^ (unsigned char) (i < lengthB ? b[i] : 0));

    return diff == 0;
}

juce::var WorkerDispatcher::makeDispatchBody(const RenderJob& job) const
{
    const juce::String base = settings.publicBaseUrl.trimCharactersAtEnd("/");

    juce::DynamicObject::Ptr body = new juce::DynamicObject();
    body->setProperty("userId", job.userId);
    body->setProperty("renderId", job.renderId);
    body->setProperty("payloadUrl", base + "/api/render/worker/payload");
    body->setProperty("callbackUrl", base + "/api/render/worker/callback");
    return juce::var(body.get());
}

juce::var WorkerDispatcher::buildPayload(const RenderJob& job, const RenderPayload& project)
{
    RenderPayload payload = project;
    payload.renderId = job.renderId;
    payload.projectId = job.projectId;
    payload.options = job.options;

    // Local paths mean nothing on another machine.
    payload.audioPath.clear();
    return payload.toVar();
}

juce::Result WorkerDispatcher::dispatch(const RenderJob& job)
{
    if (!usesRemoteWorker())
    {
        if (queue == nullptr)
            return juce::Result::fail("No render queue available");

        queue->enqueue(job.userId, job.renderId);
        RenderLog::info("render.dispatch.local", { { "renderId", job.renderId } });
        return juce::Result::ok();
    }

    juce::StringPairArray headers;
    if (settings.workerToken.isNotEmpty())
        headers.set("Authorization", "Bearer " + settings.workerToken);
    headers.set(secretHeader, settings.internalSecret);

    const auto response = HttpJson::post(settings.workerUrl, makeDispatchBody(job), headers, settings.timeoutMs);

    if (response.isSuccess())
    {
        store.markProcessing(job.userId, job.renderId);
        RenderLog::info("render.dispatch.remote", { { "renderId", job.renderId },
                                                    { "status", response.statusCode } });
        return juce::Result::ok();
    }

    const juce::String error = "Worker dispatch failed (HTTP " + juce::String(response.statusCode) + "): "
                             + response.body.substring(0, errorBodyCharacters);

    store.finalize(job.userId, job.renderId, JobStatus::Failed, {}, error);
    RenderLog::error("render.dispatch.failed", { { "renderId", job.renderId },
                                                 { "status", response.statusCode } });
    return juce::Result::fail(error);
}

juce::Result WorkerDispatcher::applyCallback(const juce::var& body)
{
    if (!body.isObject())
        return juce::Result::fail("Body must be a JSON object");

    const juce::String userId = body.getProperty("userId", {}).toString();
    const juce::String renderId = body.getProperty("renderId", {}).toString();
    const juce::String statusText = body.getProperty("status", {}).toString();

    if (userId.isEmpty() || renderId.isEmpty())
        return juce::Result::fail("userId and renderId required");

    JobStatus status = JobStatus::Pending;
    if (!parseJobStatus(statusText, status) || status == JobStatus::Pending)
        return juce::Result::fail("Unknown status: " + statusText);

    const juce::String logTail = body.getProperty("logTail", {}).toString();
    bool applied = false;

    if (status == JobStatus::Processing)
    {
        applied = store.updateProgress(userId, renderId, (int) body.getProperty("progress", 0), logTail);
    }
    else
    {
        applied = store.finalize(userId, renderId, status,
                                 body.getProperty("outputUrl", {}).toString(),
                                 body.getProperty("error", {}).toString(),
                                 logTail);
    }

    RenderLog::info("render.callback.applied", { { "renderId", renderId },
                                                 { "status", statusText },
                                                 { "applied", applied } });
    return juce::Result::ok();
}
