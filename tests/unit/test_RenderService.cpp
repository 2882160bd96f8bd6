#include "service/RenderService.h"
#include "TestSupport.h"

#include <httplib.h>
#include <doctest/doctest.h>

#include <thread>

using namespace RenderTypes;
using TestSupport::TempDirectory;

namespace {

struct ServiceFixture {
    ServiceFixture()
        : store(data / "jobs"),
          projects(data / "projects"),
          janitor(work.getFile()),
          dispatcher(WorkerDispatcher::Settings(), store, nullptr),
          service(makeConfig(), store, projects, janitor, dispatcher)
    {
        juce::var project;
        REQUIRE(juce::JSON::parse(R"({ "id": "proj-1", "audioUrl": "https://cdn.example.com/a.mp3", "storyboard": [], "assets": [] })", project).wasOk());
        REQUIRE(projects.save("proj-1", project).wasOk());

        const juce::Result started = service.start();
        REQUIRE_MESSAGE(started.wasOk(), started.getErrorMessage().toStdString());
        REQUIRE(service.getPort() > 0);
    }

    ServiceConfig makeConfig() const {
        ServiceConfig config = ServiceConfig::withDefaults();
        config.host = "127.0.0.1";
        config.port = 0;
        config.internalSecret = "s3cret";
        config.dataRoot = data.getFile();
        config.workRoot = work.getFile();
        return config;
    }

    httplib::Client client() const {
        httplib::Client c("127.0.0.1", service.getPort());
        c.set_connection_timeout(1, 0);
        c.set_read_timeout(2, 0);
        return c;
    }

    httplib::Result post(const std::string& path, const std::string& body, const httplib::Headers& headers) {
        auto c = client();
        httplib::Result response;
        for (int attempt = 0; attempt < 5 && !response; ++attempt) {
            response = c.Post(path, headers, body, "application/json");
            if (!response)
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return response;
    }

    httplib::Result get(const std::string& path, const httplib::Headers& headers) {
        auto c = client();
        httplib::Result response;
        for (int attempt = 0; attempt < 5 && !response; ++attempt) {
            response = c.Get(path, headers);
            if (!response)
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return response;
    }

    httplib::Result del(const std::string& path, const httplib::Headers& headers) {
        auto c = client();
        return c.Delete(path, headers);
    }

    juce::String submit(const std::string& key) {
        auto response = post("/api/render/jobs", R"({"projectId":"proj-1","idempotencyKey":")" + key + "\"}", asUser);
        REQUIRE(response);
        juce::var body;
        REQUIRE(juce::JSON::parse(juce::String(response->body), body).wasOk());
        return body["renderId"].toString();
    }

    TempDirectory data;
    TempDirectory work;
    RenderJobStore store;
    ProjectCatalog projects;
    WorkspaceJanitor janitor;
    WorkerDispatcher dispatcher;
    RenderService service;

    const httplib::Headers asUser { { "x-user-id", "user-a" } };
    const httplib::Headers asWorker { { "x-internal-render-secret", "s3cret" } };
};

juce::var parseBody(const httplib::Result& response) {
    juce::var body;
    REQUIRE(juce::JSON::parse(juce::String(response->body), body).wasOk());
    return body;
}

} // namespace

TEST_SUITE("RenderService") {

TEST_CASE("Health does not need a caller") {
    ServiceFixture fixture;
    auto response = fixture.get("/api/health", {});
    REQUIRE(response);
    CHECK(response->status == 200);
    CHECK(parseBody(response)["status"].toString() == "ok");
}

TEST_CASE("Submission is idempotent per key") {
    ServiceFixture fixture;

    auto first = fixture.post("/api/render/jobs", R"({"projectId":"proj-1","idempotencyKey":"abc"})", fixture.asUser);
    REQUIRE(first);
    CHECK(first->status == 202);
    const auto firstBody = parseBody(first);
    CHECK(firstBody["status"].toString() == "pending");

    auto second = fixture.post("/api/render/jobs", R"({"projectId":"proj-1","idempotencyKey":"abc"})", fixture.asUser);
    REQUIRE(second);
    CHECK(second->status == 200);
    CHECK(parseBody(second)["renderId"].toString() == firstBody["renderId"].toString());
}

TEST_CASE("A retried submission finds its job after the project is gone") {
    ServiceFixture fixture;
    const juce::String renderId = fixture.submit("retry-key");
    REQUIRE(renderId.isNotEmpty());

    REQUIRE((fixture.data / "projects").deleteRecursively());
    REQUIRE_FALSE(fixture.projects.exists("proj-1"));

    auto retried = fixture.post("/api/render/jobs", R"({"projectId":"proj-1","idempotencyKey":"retry-key"})", fixture.asUser);
    REQUIRE(retried);
    CHECK(retried->status == 200);
    CHECK(parseBody(retried)["renderId"].toString() == renderId);

    auto fresh = fixture.post("/api/render/jobs", R"({"projectId":"proj-1","idempotencyKey":"new-key"})", fixture.asUser);
    REQUIRE(fresh);
    CHECK(fresh->status == 404);
}

TEST_CASE("Submission validates the caller and the project") {
    ServiceFixture fixture;

    auto anonymous = fixture.post("/api/render/jobs", R"({"projectId":"proj-1"})", {});
    REQUIRE(anonymous);
    CHECK(anonymous->status == 401);

    auto noProject = fixture.post("/api/render/jobs", R"({})", fixture.asUser);
    REQUIRE(noProject);
    CHECK(noProject->status == 400);

    auto unknown = fixture.post("/api/render/jobs", R"({"projectId":"nope"})", fixture.asUser);
    REQUIRE(unknown);
    CHECK(unknown->status == 404);

    auto garbage = fixture.post("/api/render/jobs", "{not json", fixture.asUser);
    REQUIRE(garbage);
    CHECK(garbage->status == 400);
}

TEST_CASE("Config requests return the resolved settings") {
    ServiceFixture fixture;

    auto response = fixture.post("/api/render/config", R"({"projectId":"proj-1","duration":40,"scenesCount":10})", fixture.asUser);
    REQUIRE(response);
    CHECK(response->status == 200);

    const auto body = parseBody(response);
    CHECK(body["configId"].toString().startsWith("cfg_"));
    CHECK((int) body["estimatedCredits"] == 27);
}

TEST_CASE("Status and history are scoped to the caller") {
    ServiceFixture fixture;
    const auto renderId = fixture.submit("k1");

    auto status = fixture.get(("/api/render/status?renderId=" + renderId).toStdString(), fixture.asUser);
    REQUIRE(status);
    CHECK(status->status == 200);
    CHECK(parseBody(status)["status"].toString() == "pending");

    auto missing = fixture.get("/api/render/status?renderId=unknown", fixture.asUser);
    REQUIRE(missing);
    CHECK(missing->status == 404);

    auto foreign = fixture.get(("/api/render/status?renderId=" + renderId).toStdString(), { { "x-user-id", "user-b" } });
    REQUIRE(foreign);
    CHECK(foreign->status == 404);

    auto history = fixture.get("/api/render/history", fixture.asUser);
    REQUIRE(history);
    CHECK(history->status == 200);
    CHECK(parseBody(history)["renders"].size() == 1);
}

TEST_CASE("Worker callbacks need the shared secret") {
    ServiceFixture fixture;
    const auto renderId = fixture.submit("k2");
    REQUIRE(fixture.store.markProcessing("user-a", renderId));

    const std::string body = R"({"userId":"user-a","renderId":")" + renderId.toStdString()
                           + R"(","status":"complete","outputUrl":"https://cdn.example.com/renders/x.mp4"})";

    auto rejected = fixture.post("/api/render/worker/callback", body, { { "x-internal-render-secret", "wrong" } });
    REQUIRE(rejected);
    CHECK(rejected->status == 401);

    auto accepted = fixture.post("/api/render/worker/callback", body, fixture.asWorker);
    REQUIRE(accepted);
    CHECK(accepted->status == 200);

    RenderJob job;
    REQUIRE(fixture.store.get("user-a", renderId, job));
    CHECK(job.status == JobStatus::Complete);

    // Completed with a durable URL and nothing spooled: redirect.
    auto download = fixture.get(("/api/render/download?renderId=" + renderId).toStdString(), fixture.asUser);
    REQUIRE(download);
    CHECK(download->status == 302);
    CHECK(download->get_header_value("Location") == "https://cdn.example.com/renders/x.mp4");
}

TEST_CASE("Worker payloads are served for known jobs") {
    ServiceFixture fixture;
    const auto renderId = fixture.submit("k3");

    const std::string body = R"({"userId":"user-a","renderId":")" + renderId.toStdString() + "\"}";

    auto unauthorised = fixture.post("/api/render/worker/payload", body, {});
    REQUIRE(unauthorised);
    CHECK(unauthorised->status == 401);

    auto response = fixture.post("/api/render/worker/payload", body, fixture.asWorker);
    REQUIRE(response);
    CHECK(response->status == 200);

    const auto payload = parseBody(response);
    CHECK(payload["renderId"].toString() == renderId);
    CHECK(payload["audioUrl"].toString() == "https://cdn.example.com/a.mp3");
}

TEST_CASE("Spooled artifacts support range requests") {
    ServiceFixture fixture;
    const auto renderId = fixture.submit("k4");
    REQUIRE(fixture.store.markProcessing("user-a", renderId));
    REQUIRE(fixture.store.finalize("user-a", renderId, JobStatus::Complete, "http://127.0.0.1/api/render/download?renderId=" + renderId));

    juce::MemoryBlock bytes;
    for (int i = 0; i < 1000; ++i)
        bytes.append("x", 1);

    REQUIRE(fixture.janitor.getSpoolDirectory().createDirectory().wasOk());
    REQUIRE(fixture.janitor.getSpooledArtifact(renderId).replaceWithData(bytes.getData(), bytes.getSize()));

    httplib::Headers headers = fixture.asUser;
    headers.emplace("Range", "bytes=10-19");

    auto response = fixture.get(("/api/render/download?renderId=" + renderId).toStdString(), headers);
    REQUIRE(response);
    CHECK(response->status == 206);
    CHECK(response->body.size() == 10);
    CHECK(response->get_header_value("Content-Range") == "bytes 10-19/1000");

    auto whole = fixture.get(("/api/render/download?renderId=" + renderId).toStdString(), fixture.asUser);
    REQUIRE(whole);
    CHECK(whole->status == 200);
    CHECK(whole->body.size() == 1000);
}

TEST_CASE("Deleting a render waits for it to finish") {
    ServiceFixture fixture;
    const auto renderId = fixture.submit("k5");
    REQUIRE(fixture.store.markProcessing("user-a", renderId));

    const std::string path = ("/api/render/download?renderId=" + renderId).toStdString();

    auto busy = fixture.del(path, fixture.asUser);
    REQUIRE(busy);
    CHECK(busy->status == 409);

    REQUIRE(fixture.store.finalize("user-a", renderId, JobStatus::Failed, {}, "boom"));

    auto deleted = fixture.del(path, fixture.asUser);
    REQUIRE(deleted);
    CHECK(deleted->status == 200);
    CHECK((bool) parseBody(deleted)["deleted"]);

    RenderJob job;
    CHECK_FALSE(fixture.store.get("user-a", renderId, job));
}

}
