#include "HttpHelpers.h"

namespace HttpHelpers
{
    void sendJson(httplib::Response& res, int status, const juce::var& body)
    {
        res.status = status;
        res.set_content(toStd(juce::JSON::toString(body, true)), "application/json");
    }

    void sendError(httplib::Response& res, int status, const juce::String& message)
    {
        juce::DynamicObject::Ptr body = new juce::DynamicObject();
        body->setProperty("error", message);
        sendJson(res, status, juce::var(body.get()));
    }

    bool parseJsonBody(const httplib::Request& req, httplib::Response& res, juce::var& body)
    {
        const juce::Result parsed = juce::JSON::parse(fromStd(req.body), body);

        if (parsed.failed() || !body.isObject())
        {
            sendError(res, 400, "Body must be a JSON object");
            return false;
        }

        return true;
    }

    juce::String header(const httplib::Request& req, const char* name)
    {
        return fromStd(req.get_header_value(name)).trim();
    }

    juce::String param(const httplib::Request& req, const char* name)
    {
        return req.has_param(name) ? fromStd(req.get_param_value(name)).trim() : juce::String();
    }

    juce::String bearerToken(const httplib::Request& req)
    {
        const juce::String authorization = header(req, "Authorization");

        if (!authorization.startsWithIgnoreCase("Bearer "))
            return {};

        return authorization.substring(7).trim();
    }

    void serveFile(httplib::Response& res,
                   const juce::File& file,
                   const juce::String& contentType,
                   const juce::String& downloadName)
    {
        const auto size = (size_t) file.getSize();

        res.set_header("Accept-Ranges", "bytes");
        res.set_header("Content-Disposition", toStd("inline; filename=\"" + downloadName + "\""));

        // httplib slices the provider for Range requests and answers 206.
        res.set_content_provider(size, toStd(contentType),
            [file](size_t offset, size_t length, httplib::DataSink& sink)
            {
                juce::FileInputStream in(file);
                if (!in.openedOk() || !in.setPosition((juce::int64) offset))
                    return false;

                char buffer[65536];
                const int chunk = (int) std::min(length, sizeof(buffer));
                const int bytesRead = in.read(buffer, chunk);

                if (bytesRead <= 0)
                    return false;

                return sink.write(buffer, (size_t) bytesRead);
            });
    }
}
