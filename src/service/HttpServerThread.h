#pragma once
#include <JuceHeader.h>
#include <httplib.h>

/**
 * Runs a cpp-httplib server on its own juce::Thread.
 *
 * Subclasses only register their routes. Binding happens in start() on the
 * calling thread so bind errors come back as a Result; port 0 picks a free
 * ephemeral port.
 */
class HttpServerThread : private juce::Thread
{
public:
    HttpServerThread(const juce::String& threadName, const juce::String& host, int port);
    ~HttpServerThread() override;

    juce::Result start();
    void stop();

    bool isRunning() const;

    /** The bound port, once started */
    int getPort() const { return boundPort; }

    const juce::String& getHost() const { return host; }

protected:
    virtual void configureRoutes(httplib::Server& server) = 0;

private:
    void run() override;

    juce::String host;
    int requestedPort;
    int boundPort = 0;
    std::unique_ptr<httplib::Server> server;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(HttpServerThread)
};
