#include "jobs/WorkerDispatcher.h"
#include "TestSupport.h"

#include <httplib.h>
#include <doctest/doctest.h>

#include <mutex>
#include <thread>

using namespace RenderTypes;
using TestSupport::TempDirectory;

namespace {

/** Stand-in for the remote worker's /render endpoint. */
class FakeWorker {
public:
    explicit FakeWorker(int statusToReturn) : status(statusToReturn) {
        server.Post("/render", [this](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> guard(mutex);
                ++requests;
                authorization = req.get_header_value("Authorization");
                secret = req.get_header_value(WorkerDispatcher::secretHeader);
                body = req.body;
            }

            res.status = status;
            res.set_content(status < 300 ? R"({"accepted":true})" : "worker exploded", "application/json");
        });

        port = server.bind_to_any_port("127.0.0.1");
        REQUIRE(port > 0);
        thread = std::thread([this] { server.listen_after_bind(); });
        server.wait_until_ready();
    }

    ~FakeWorker() {
        server.stop();
        if (thread.joinable())
            thread.join();
    }

    juce::String getUrl() const { return "http://127.0.0.1:" + juce::String(port) + "/render"; }

    int getRequests() const        { std::lock_guard<std::mutex> guard(mutex); return requests; }
    std::string getAuthorization() const { std::lock_guard<std::mutex> guard(mutex); return authorization; }
    std::string getSecret() const  { std::lock_guard<std::mutex> guard(mutex); return secret; }
    std::string getBody() const    { std::lock_guard<std::mutex> guard(mutex); return body; }

private:
    httplib::Server server;
    std::thread thread;
    int status;
    int port = 0;

    mutable std::mutex mutex;
    int requests = 0;
    std::string authorization;
    std::string secret;
    std::string body;
};

WorkerDispatcher::Settings remoteSettings(const juce::String& url) {
    WorkerDispatcher::Settings settings;
    settings.workerUrl = url;
    settings.workerToken = "worker-token";
    settings.internalSecret = "s3cret";
    settings.publicBaseUrl = "https://api.example.com/";
    settings.timeoutMs = 3000;
    return settings;
}

RenderJob createJob(RenderJobStore& store, const juce::String& key = "k") {
    RenderJobStore::CreateRequest request;
    request.userId = "user-a";
    request.projectId = "proj-1";
    request.idempotencyKey = key;
    auto created = store.create(request);
    REQUIRE(created.result.wasOk());
    return created.job;
}

juce::var callback(const juce::String& renderId, const juce::String& status) {
    juce::DynamicObject::Ptr body = new juce::DynamicObject();
    body->setProperty("userId", "user-a");
    body->setProperty("renderId", renderId);
    body->setProperty("status", status);
    return juce::var(body.get());
}

} // namespace

TEST_SUITE("WorkerDispatcher") {

TEST_CASE("An accepted dispatch moves the job to processing") {
    TempDirectory dir;
    RenderJobStore store(dir.getFile());
    FakeWorker worker(202);
    WorkerDispatcher dispatcher(remoteSettings(worker.getUrl()), store, nullptr);

    const auto job = createJob(store);
    REQUIRE(dispatcher.dispatch(job).wasOk());

    CHECK(worker.getRequests() == 1);
    CHECK(worker.getAuthorization() == "Bearer worker-token");
    CHECK(worker.getSecret() == "s3cret");

    juce::var sent;
    REQUIRE(juce::JSON::parse(juce::String(worker.getBody()), sent).wasOk());
    CHECK(sent["userId"].toString() == "user-a");
    CHECK(sent["renderId"].toString() == job.renderId);
    CHECK(sent["payloadUrl"].toString() == "https://api.example.com/api/render/worker/payload");
    CHECK(sent["callbackUrl"].toString() == "https://api.example.com/api/render/worker/callback");

    RenderJob current;
    REQUIRE(store.get("user-a", job.renderId, current));
    CHECK(current.status == JobStatus::Processing);
    CHECK(current.progress == RenderJobStore::processingStartPercent);
}

TEST_CASE("A rejected dispatch fails the job with the worker's status") {
    TempDirectory dir;
    RenderJobStore store(dir.getFile());
    FakeWorker worker(500);
    WorkerDispatcher dispatcher(remoteSettings(worker.getUrl()), store, nullptr);

    const auto job = createJob(store);
    const auto result = dispatcher.dispatch(job);

    CHECK(result.failed());
    CHECK(result.getErrorMessage().startsWith("Worker dispatch failed (HTTP 500)"));

    RenderJob current;
    REQUIRE(store.get("user-a", job.renderId, current));
    CHECK(current.status == JobStatus::Failed);
    CHECK(current.error.startsWith("Worker dispatch failed (HTTP 500)"));
}

TEST_CASE("Local dispatch needs a queue") {
    TempDirectory dir;
    RenderJobStore store(dir.getFile());
    WorkerDispatcher dispatcher(WorkerDispatcher::Settings(), store, nullptr);

    CHECK_FALSE(dispatcher.usesRemoteWorker());
    CHECK(dispatcher.dispatch(createJob(store)).failed());
}

TEST_CASE("Worker callbacks drive the stored job") {
    TempDirectory dir;
    RenderJobStore store(dir.getFile());
    WorkerDispatcher dispatcher(remoteSettings("http://unused"), store, nullptr);

    const auto job = createJob(store);
    REQUIRE(store.markProcessing("user-a", job.renderId));

    auto progress = callback(job.renderId, "processing");
    progress.getDynamicObject()->setProperty("progress", 42);
    progress.getDynamicObject()->setProperty("logTail", "frame=10");
    REQUIRE(dispatcher.applyCallback(progress).wasOk());

    RenderJob current;
    REQUIRE(store.get("user-a", job.renderId, current));
    CHECK(current.progress == 42);
    CHECK(current.logTail == "frame=10");

    auto done = callback(job.renderId, "complete");
    done.getDynamicObject()->setProperty("outputUrl", "https://cdn.example.com/renders/x.mp4");
    REQUIRE(dispatcher.applyCallback(done).wasOk());

    REQUIRE(store.get("user-a", job.renderId, current));
    CHECK(current.status == JobStatus::Complete);
    CHECK(current.progress == 100);
    CHECK(current.outputUrl == "https://cdn.example.com/renders/x.mp4");

    // Late reports after completion are accepted but change nothing.
    auto late = callback(job.renderId, "failed");
    late.getDynamicObject()->setProperty("error", "too late");
    CHECK(dispatcher.applyCallback(late).wasOk());
    REQUIRE(store.get("user-a", job.renderId, current));
    CHECK(current.status == JobStatus::Complete);
}

TEST_CASE("Malformed callbacks are rejected") {
    TempDirectory dir;
    RenderJobStore store(dir.getFile());
    WorkerDispatcher dispatcher(remoteSettings("http://unused"), store, nullptr);

    CHECK(dispatcher.applyCallback(callback("r", "pending")).failed());
    CHECK(dispatcher.applyCallback(callback("r", "exploded")).failed());
    CHECK(dispatcher.applyCallback(callback({}, "complete")).failed());
    CHECK(dispatcher.applyCallback(juce::var("complete")).failed());
}

TEST_CASE("Secrets must match exactly") {
    CHECK(WorkerDispatcher::secretMatches("s3cret", "s3cret"));
    CHECK_FALSE(WorkerDispatcher::secretMatches("s3cret", "s3cre"));
    CHECK_FALSE(WorkerDispatcher::secretMatches("s3cret", "s3cret!"));
    CHECK_FALSE(WorkerDispatcher::secretMatches("s3cret", {}));
    CHECK_FALSE(WorkerDispatcher::secretMatches({}, {}));
}

TEST_CASE("Worker payloads drop local paths and carry the job options") {
    RenderJob job;
    job.renderId = "r-1";
    job.projectId = "proj-1";
    job.options.quality = RenderQuality::Pro;
    job.options.crossfade = true;

    RenderPayload project;
    project.audioPath = "/home/me/song.wav";
    project.audioUrl = "https://cdn.example.com/song.mp3";

    const juce::var payload = WorkerDispatcher::buildPayload(job, project);

    RenderPayload parsed;
    REQUIRE(RenderPayload::fromVar(payload, parsed).wasOk());
    CHECK(parsed.renderId == "r-1");
    CHECK(parsed.projectId == "proj-1");
    CHECK(parsed.audioPath.isEmpty());
    CHECK(parsed.audioUrl == "https://cdn.example.com/song.mp3");
    CHECK(parsed.options.quality == RenderQuality::Pro);
    CHECK(parsed.options.crossfade);
}

}
