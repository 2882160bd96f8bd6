#include "RenderJobSinks.h"
#include "../core/HttpJson.h"
#include "../core/SessionLogger.h"

using RenderTypes::JobStatus;

//==============================================================================
StoreJobSink::StoreJobSink(RenderJobStore& jobStore, const juce::String& user, const juce::String& render)
    : store(jobStore),
      userId(user),
      renderId(render)
{
}

bool StoreJobSink::begin()
{
    return store.markProcessing(userId, renderId);
}

void StoreJobSink::progress(int percent, const juce::String& logTailDelta)
{
    store.updateProgress(userId, renderId, percent, logTailDelta);
}

void StoreJobSink::complete(const juce::String& outputUrl, const juce::String& note)
{
    if (!store.finalize(userId, renderId, JobStatus::Complete, outputUrl, note))
        RenderLog::warn("render.finalize.ignored", { { "renderId", renderId }, { "status", "complete" } });
}

void StoreJobSink::fail(const juce::String& error, const juce::String& logTail)
{
    if (!store.finalize(userId, renderId, JobStatus::Failed, {}, error, logTail))
        RenderLog::warn("render.finalize.ignored", { { "renderId", renderId }, { "status", "failed" } });
}

//==============================================================================
CallbackJobSink::CallbackJobSink(const juce::String& url,
                                 const juce::String& internalSecret,
                                 const juce::String& user,
                                 const juce::String& render)
    : callbackUrl(url),
      secret(internalSecret),
      userId(user),
      renderId(render)
{
}

juce::var CallbackJobSink::makeBody(const juce::String& status, int percent) const
{
    juce::DynamicObject::Ptr body = new juce::DynamicObject();
    body->setProperty("userId", userId);
    body->setProperty("renderId", renderId);
    body->setProperty("status", status);
    body->setProperty("progress", percent);
    return juce::var(body.get());
}

bool CallbackJobSink::send(const juce::var& body)
{
    juce::StringPairArray headers;
    headers.set(secretHeader, secret);

    const auto response = HttpJson::post(callbackUrl, body, headers);
    if (response.isSuccess())
        return true;

    RenderLog::warn("render.callback.failed", { { "renderId", renderId },
                                                { "status", response.statusCode },
                                                { "body", response.body.substring(0, 200) } });
    return false;
}

bool CallbackJobSink::begin()
{
    send(makeBody("processing", RenderJobStore::processingStartPercent));
    return true;
}

void CallbackJobSink::progress(int percent, const juce::String& logTailDelta)
{
    auto body = makeBody("processing", percent);
    if (logTailDelta.isNotEmpty())
        body.getDynamicObject()->setProperty("logTail", logTailDelta);
    send(body);
}

void CallbackJobSink::complete(const juce::String& outputUrl, const juce::String& note)
{
    auto body = makeBody("complete", 100);
    body.getDynamicObject()->setProperty("outputUrl", outputUrl);
    if (note.isNotEmpty())
        body.getDynamicObject()->setProperty("error", note);
    send(body);
}

void CallbackJobSink::fail(const juce::String& error, const juce::String& logTail)
{
    auto body = makeBody("failed", 0);
    body.getDynamicObject()->setProperty("error", error);
    if (logTail.isNotEmpty())
        body.getDynamicObject()->setProperty("logTail", logTail);
    send(body);
}
