#include "rendering/AssetDownloader.h"
#include "TestSupport.h"

#include <httplib.h>
#include <doctest/doctest.h>

#include <thread>

using TestSupport::TempDirectory;

namespace {

/** Serves a full clip, a clip that drops the connection halfway, and a 404. */
class MediaServer {
public:
    static constexpr size_t clipBytes = 1000;

    MediaServer() {
        server.Get("/clip.mp4", [](const httplib::Request&, httplib::Response& res) {
            res.set_content(std::string(clipBytes, 'v'), "video/mp4");
        });

        server.Get("/truncated.mp4", [](const httplib::Request&, httplib::Response& res) {
            res.set_content_provider(clipBytes, "video/mp4", [](size_t offset, size_t, httplib::DataSink& sink) {
                if (offset > 0)
                    return false;
                const std::string half(clipBytes / 2, 'v');
                sink.write(half.data(), half.size());
                return true;
            });
        });

        port = server.bind_to_any_port("127.0.0.1");
        REQUIRE(port > 0);
        thread = std::thread([this] { server.listen_after_bind(); });
        server.wait_until_ready();
    }

    ~MediaServer() {
        server.stop();
        if (thread.joinable())
            thread.join();
    }

    juce::String url(const juce::String& path) const { return "http://127.0.0.1:" + juce::String(port) + path; }

private:
    httplib::Server server;
    std::thread thread;
    int port = 0;
};

} // namespace

TEST_SUITE("AssetDownloader") {

TEST_CASE("Complete bodies are written to the destination") {
    MediaServer media;
    TempDirectory dir;
    AssetDownloader downloader(5);

    const juce::File destination = dir / "clip.mp4";
    const auto result = downloader.download(media.url("/clip.mp4"), destination);

    REQUIRE_MESSAGE(result.wasOk(), result.getErrorMessage().toStdString());
    CHECK(destination.getSize() == (juce::int64) MediaServer::clipBytes);
}

TEST_CASE("A body cut short fails and leaves nothing behind") {
    MediaServer media;
    TempDirectory dir;
    AssetDownloader downloader(5);

    const juce::File destination = dir / "truncated.mp4";
    const auto result = downloader.download(media.url("/truncated.mp4"), destination);

    CHECK(result.failed());
    CHECK_FALSE(destination.exists());
}

TEST_CASE("HTTP errors fail the download") {
    MediaServer media;
    TempDirectory dir;
    AssetDownloader downloader(5);

    const juce::File destination = dir / "missing.mp4";
    const auto result = downloader.download(media.url("/missing.mp4"), destination);

    CHECK(result.getErrorMessage() == "HTTP 404");
    CHECK_FALSE(destination.exists());
}

TEST_CASE("Local files are copied only when allowed") {
    TempDirectory dir;
    const juce::File source = dir / "local.mp4";
    REQUIRE(source.replaceWithText("local clip"));

    AssetDownloader strict(5);
    CHECK(strict.download("file://" + source.getFullPathName(), dir / "a.mp4").failed());
    CHECK_FALSE((dir / "a.mp4").exists());

    AssetDownloader permissive(5, true);
    REQUIRE(permissive.download(source.getFullPathName(), dir / "b.mp4").wasOk());
    CHECK((dir / "b.mp4").loadFileAsString() == "local clip");
}

}
