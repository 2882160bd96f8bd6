#pragma once
#include <JuceHeader.h>
#include <httplib.h>

/**
 * Glue between cpp-httplib requests/responses and JUCE strings and vars.
 */
namespace HttpHelpers
{
    constexpr const char* userHeader = "x-user-id";
    constexpr const char* secretHeader = "x-internal-render-secret";

    inline std::string toStd(const juce::String& text)     { return text.toStdString(); }
    inline juce::String fromStd(const std::string& text)   { return juce::String::fromUTF8(text.data(), (int) text.size()); }

    void sendJson(httplib::Response& res, int status, const juce::var& body);
    void sendError(httplib::Response& res, int status, const juce::String& message);

    /** Parses the request body as JSON. Sends a 400 and returns false on failure. */
    bool parseJsonBody(const httplib::Request& req, httplib::Response& res, juce::var& body);

    juce::String header(const httplib::Request& req, const char* name);
    juce::String param(const httplib::Request& req, const char* name);

    /** Token of an "Authorization: Bearer <token>" header, or empty. */
    juce::String bearerToken(const httplib::Request& req);

    /**
     * Streams a file with byte-range support (206 + Content-Range for
     * Range requests) and an inline Content-Disposition.
     */
    void serveFile(httplib::Response& res,
                   const juce::File& file,
                   const juce::String& contentType,
                   const juce::String& downloadName);
}
