#include "HttpServerThread.h"

HttpServerThread::HttpServerThread(const juce::String& threadName, const juce::String& bindHost, int port)
    : juce::Thread(threadName),
      host(bindHost),
      requestedPort(port)
{
}

HttpServerThread::~HttpServerThread()
{
    // Subclasses stop the server in their own destructor, while their routes are still valid.
    stop();
}

juce::Result HttpServerThread::start()
{
    if (server != nullptr)
        return juce::Result::fail("Server already running");

    server = std::make_unique<httplib::Server>();
    configureRoutes(*server);

    const std::string bindHost = host.toStdString();

    if (requestedPort <= 0)
    {
        boundPort = server->bind_to_any_port(bindHost);
        if (boundPort <= 0)
        {
            server.reset();
            return juce::Result::fail("Failed to bind " + host);
        }
    }
    else
    {
        if (!server->bind_to_port(bindHost, requestedPort))
        {
            server.reset();
            return juce::Result::fail("Failed to bind " + host + ":" + juce::String(requestedPort));
        }

        boundPort = requestedPort;
    }

    startThread();
    server->wait_until_ready();

    juce::Logger::writeToLog(getThreadName() + " listening on " + host + ":" + juce::String(boundPort));
    return juce::Result::ok();
}

void HttpServerThread::stop()
{
    if (server == nullptr)
        return;

    server->stop();
    stopThread(5000);
    server.reset();
    boundPort = 0;
}

bool HttpServerThread::isRunning() const
{
    return server != nullptr && server->is_running();
}

void HttpServerThread::run()
{
    server->listen_after_bind();
}
