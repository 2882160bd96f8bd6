#include "service/RemoteWorker.h"
#include "TestSupport.h"

#include <httplib.h>
#include <doctest/doctest.h>

#include <mutex>
#include <thread>

using TestSupport::TempDirectory;

namespace {

/** Plays the job service side of the worker contract. */
class FakeJobService {
public:
    explicit FakeJobService(int payloadStatus) {
        server.Post("/api/render/worker/payload", [this, payloadStatus](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> guard(mutex);
                payloadSecret = req.get_header_value("x-internal-render-secret");
            }

            if (payloadStatus != 200) {
                res.status = payloadStatus;
                res.set_content(R"({"error":"Render not found"})", "application/json");
                return;
            }

            res.set_content(R"({"renderId":"job-1","projectId":"proj-1","storyboard":[],"assets":[]})", "application/json");
        });

        server.Post("/api/render/worker/callback", [this](const httplib::Request& req, httplib::Response& res) {
            {
                std::lock_guard<std::mutex> guard(mutex);
                callbacks.push_back(req.body);
            }
            res.set_content(R"({"ok":true})", "application/json");
        });

        port = server.bind_to_any_port("127.0.0.1");
        REQUIRE(port > 0);
        thread = std::thread([this] { server.listen_after_bind(); });
        server.wait_until_ready();
    }

    ~FakeJobService() {
        server.stop();
        if (thread.joinable())
            thread.join();
    }

    juce::String url(const juce::String& path) const { return "http://127.0.0.1:" + juce::String(port) + path; }

    std::vector<juce::var> getCallbacks() const {
        std::lock_guard<std::mutex> guard(mutex);
        std::vector<juce::var> parsed;
        for (const auto& body : callbacks)
            parsed.push_back(juce::JSON::parse(juce::String(body)));
        return parsed;
    }

    std::string getPayloadSecret() const {
        std::lock_guard<std::mutex> guard(mutex);
        return payloadSecret;
    }

private:
    httplib::Server server;
    std::thread thread;
    int port = 0;

    mutable std::mutex mutex;
    std::vector<std::string> callbacks;
    std::string payloadSecret;
};

struct WorkerFixture {
    WorkerFixture()
        : janitor(work.getFile()),
          publisher(nullptr, janitor, "http://worker"),
          worker(makeConfig(), janitor, publisher)
    {
        const juce::Result started = worker.start();
        REQUIRE_MESSAGE(started.wasOk(), started.getErrorMessage().toStdString());
    }

    ServiceConfig makeConfig() const {
        ServiceConfig config = ServiceConfig::withDefaults();
        config.host = "127.0.0.1";
        config.port = 0;
        config.internalSecret = "s3cret";
        config.workerToken = "worker-token";
        config.workRoot = work.getFile();
        return config;
    }

    httplib::Result dispatch(const std::string& body, const httplib::Headers& headers) {
        httplib::Client client("127.0.0.1", worker.getPort());
        client.set_connection_timeout(1, 0);
        client.set_read_timeout(2, 0);

        httplib::Result response;
        for (int attempt = 0; attempt < 5 && !response; ++attempt) {
            response = client.Post("/render", headers, body, "application/json");
            if (!response)
                std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
        return response;
    }

    TempDirectory work;
    WorkspaceJanitor janitor;
    ArtifactPublisher publisher;
    RemoteWorker worker;
};

std::string dispatchBody(const FakeJobService& service) {
    return R"({"userId":"user-a","renderId":"job-1","payloadUrl":")" + service.url("/api/render/worker/payload").toStdString()
         + R"(","callbackUrl":")" + service.url("/api/render/worker/callback").toStdString() + "\"}";
}

} // namespace

TEST_SUITE("RemoteWorker") {

TEST_CASE("Dispatches need the worker token and a complete body") {
    WorkerFixture fixture;
    FakeJobService service(200);

    auto anonymous = fixture.dispatch(dispatchBody(service), {});
    REQUIRE(anonymous);
    CHECK(anonymous->status == 401);

    auto incomplete = fixture.dispatch(R"({"userId":"user-a"})", { { "Authorization", "Bearer worker-token" } });
    REQUIRE(incomplete);
    CHECK(incomplete->status == 400);

    CHECK(fixture.worker.getNumActiveRenders() == 0);
}

TEST_CASE("An accepted render reports its failure through the callback") {
    WorkerFixture fixture;
    FakeJobService service(200);

    auto accepted = fixture.dispatch(dispatchBody(service), { { "Authorization", "Bearer worker-token" } });
    REQUIRE(accepted);
    CHECK(accepted->status == 202);

    REQUIRE(fixture.worker.waitUntilIdle(10000));
    CHECK(service.getPayloadSecret() == "s3cret");

    const auto callbacks = service.getCallbacks();
    REQUIRE(callbacks.size() >= 2);
    CHECK(callbacks.front()["status"].toString() == "processing");
    CHECK(callbacks.back()["status"].toString() == "failed");
    CHECK(callbacks.back()["error"].toString() == "Audio file missing");
    CHECK(callbacks.back()["renderId"].toString() == "job-1");

    CHECK_FALSE(fixture.janitor.getWorkspace("job-1").exists());
}

TEST_CASE("A failed payload fetch fails the render") {
    WorkerFixture fixture;
    FakeJobService service(404);

    auto accepted = fixture.dispatch(dispatchBody(service), { { "x-internal-render-secret", "s3cret" } });
    REQUIRE(accepted);
    CHECK(accepted->status == 202);

    REQUIRE(fixture.worker.waitUntilIdle(10000));

    const auto callbacks = service.getCallbacks();
    REQUIRE(callbacks.size() == 1);
    CHECK(callbacks.front()["status"].toString() == "failed");
    CHECK(callbacks.front()["error"].toString() == "Payload fetch failed (HTTP 404)");
}

}
