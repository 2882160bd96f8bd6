#include "RenderJobStore.h"
#include "../rendering/FFmpegProgress.h"
#include "../core/SessionLogger.h"

using RenderTypes::JobStatus;

namespace
{
    juce::String sha256Hex(const juce::String& text)
    {
        const juce::MemoryBlock utf8(text.toRawUTF8(), text.getNumBytesAsUTF8());
        return juce::SHA256(utf8).toHexString();
    }

    juce::String lockNameFor(const juce::File& root)
    {
        return "musicreel_jobs_" + sha256Hex(root.getFullPathName()).substring(0, 16);
    }

    void setOptional(juce::DynamicObject& object, const char* name, const juce::String& value)
    {
        if (value.isNotEmpty())
            object.setProperty(name, value);
    }
}

//==============================================================================
juce::var RenderJob::toVar() const
{
    juce::DynamicObject::Ptr object = new juce::DynamicObject();
    object->setProperty("userId", userId);
    object->setProperty("renderId", renderId);
    object->setProperty("projectId", projectId);
    object->setProperty("configId", configId);
    object->setProperty("status", RenderTypes::toString(status));
    object->setProperty("progress", progress);
    setOptional(*object, "outputUrl", outputUrl);
    setOptional(*object, "error", error);
    object->setProperty("logTail", logTail);
    object->setProperty("options", options.toVar());
    object->setProperty("createdAt", createdAt.toMilliseconds());
    object->setProperty("updatedAt", updatedAt.toMilliseconds());
    if (startedAt.toMilliseconds() != 0)
        object->setProperty("startedAt", startedAt.toMilliseconds());
    return juce::var(object.get());
}

bool RenderJob::fromVar(const juce::var& value, RenderJob& job)
{
    if (!value.isObject())
        return false;

    job.userId = value.getProperty("userId", {}).toString();
    job.renderId = value.getProperty("renderId", {}).toString();

    if (job.userId.isEmpty() || job.renderId.isEmpty())
        return false;

    if (!RenderTypes::parseJobStatus(value.getProperty("status", {}).toString(), job.status))
        return false;

    job.projectId = value.getProperty("projectId", {}).toString();
    job.configId = value.getProperty("configId", {}).toString();
    job.progress = juce::jlimit(0, 100, (int) value.getProperty("progress", 0));
    job.outputUrl = value.getProperty("outputUrl", {}).toString();
    job.error = value.getProperty("error", {}).toString();
    job.logTail = value.getProperty("logTail", {}).toString();
    job.options = RenderTypes::RenderOptions::fromVar(value.getProperty("options", {}));
    job.createdAt = juce::Time((juce::int64) value.getProperty("createdAt", 0));
    job.updatedAt = juce::Time((juce::int64) value.getProperty("updatedAt", 0));
    job.startedAt = juce::Time((juce::int64) value.getProperty("startedAt", 0));
    return true;
}

juce::var RenderJob::toStatusVar(bool includeLogTail) const
{
    juce::DynamicObject::Ptr object = new juce::DynamicObject();
    object->setProperty("renderId", renderId);
    object->setProperty("projectId", projectId);
    object->setProperty("status", RenderTypes::toString(status));
    object->setProperty("progress", progress);
    setOptional(*object, "outputUrl", outputUrl);
    setOptional(*object, "error", error);
    if (includeLogTail)
        setOptional(*object, "logTail", logTail);
    object->setProperty("createdAt", createdAt.toISO8601(true));
    object->setProperty("updatedAt", updatedAt.toISO8601(true));
    return juce::var(object.get());
}

//==============================================================================
RenderJobStore::RenderJobStore(const juce::File& rootDirectory)
    : root(rootDirectory),
      processLock(lockNameFor(rootDirectory))
{
}

juce::String RenderJobStore::deriveRenderId(const juce::String& userId, const juce::String& idempotencyKey)
{
    if (idempotencyKey.trim().isEmpty())
        return juce::Uuid().toDashedString();

    const juce::String hex = sha256Hex(userId + "\n" + idempotencyKey.trim());
    return hex.substring(0, 8) + "-" + hex.substring(8, 12) + "-" + hex.substring(12, 16)
         + "-" + hex.substring(16, 20) + "-" + hex.substring(20, 32);
}

juce::File RenderJobStore::getUserDirectory(const juce::String& userId) const
{
    return root.getChildFile(sha256Hex(userId).substring(0, 24));
}

juce::File RenderJobStore::getJobFile(const juce::String& userId, const juce::String& renderId) const
{
    // Ids arrive from HTTP callers; anything that could escape the user directory never matches.
    if (!renderId.containsOnly("abcdefABCDEF0123456789-") || renderId.isEmpty())
        return {};

    return getUserDirectory(userId).getChildFile(renderId + ".json");
}

bool RenderJobStore::withLocks(const std::function<void()>& fn) const
{
    juce::ScopedLock sl(lock);
    juce::InterProcessLock::ScopedLockType processScope(processLock);

    if (!processScope.isLocked())
    {
        RenderLog::error("store.lock_failed", { { "root", root.getFullPathName() } });
        return false;
    }

    fn();
    return true;
}

bool RenderJobStore::readJob(const juce::File& file, RenderJob& job) const
{
    if (file == juce::File() || !file.existsAsFile())
        return false;

    juce::var parsed;
    const juce::Result parseResult = juce::JSON::parse(file.loadFileAsString(), parsed);

    if (parseResult.failed())
    {
        RenderLog::warn("store.corrupt_record", { { "file", file.getFullPathName() },
                                                  { "error", parseResult.getErrorMessage() } });
        return false;
    }

    return RenderJob::fromVar(parsed, job);
}

juce::Result RenderJobStore::writeJob(const RenderJob& job)
{
    const juce::File file = getJobFile(job.userId, job.renderId);
    if (file == juce::File())
        return juce::Result::fail("Invalid render id: " + job.renderId);

    const juce::Result dirResult = file.getParentDirectory().createDirectory();
    if (dirResult.failed())
        return dirResult;

    juce::TemporaryFile temp(file);

    if (!temp.getFile().replaceWithText(juce::JSON::toString(job.toVar(), true)))
        return juce::Result::fail("Cannot write " + temp.getFile().getFullPathName());

    if (!temp.overwriteTargetFileWithTemporary())
        return juce::Result::fail("Cannot replace " + file.getFullPathName());

    return juce::Result::ok();
}

//==============================================================================
RenderJobStore::CreateResult RenderJobStore::create(const CreateRequest& request)
{
    CreateResult outcome;

    if (request.userId.isEmpty() || request.projectId.isEmpty())
    {
        outcome.result = juce::Result::fail("userId and projectId are required");
        return outcome;
    }

    const juce::String renderId = deriveRenderId(request.userId, request.idempotencyKey);

    const bool locked = withLocks([&]
    {
        if (readJob(getJobFile(request.userId, renderId), outcome.job))
            return;

        RenderJob job;
        job.userId = request.userId;
        job.renderId = renderId;
        job.projectId = request.projectId;
        job.configId = request.configId;
        job.options = request.options;
        job.createdAt = job.updatedAt = juce::Time::getCurrentTime();

        outcome.result = writeJob(job);
        if (outcome.result.wasOk())
        {
            outcome.job = job;
            outcome.created = true;
        }
    });

    if (!locked)
        outcome.result = juce::Result::fail("Job store is locked by another process");

    return outcome;
}

bool RenderJobStore::get(const juce::String& userId, const juce::String& renderId, RenderJob& job) const
{
    bool found = false;
    withLocks([&] { found = readJob(getJobFile(userId, renderId), job); });
    return found;
}

bool RenderJobStore::markProcessing(const juce::String& userId, const juce::String& renderId)
{
    bool applied = false;

    withLocks([&]
    {
        RenderJob job;
        if (!readJob(getJobFile(userId, renderId), job) || job.status != JobStatus::Pending)
            return;

        job.status = JobStatus::Processing;
        job.progress = juce::jmax(job.progress, processingStartPercent);
        job.startedAt = job.updatedAt = juce::Time::getCurrentTime();
        applied = writeJob(job).wasOk();
    });

    return applied;
}

bool RenderJobStore::updateProgress(const juce::String& userId, const juce::String& renderId,
                                    int progress, const juce::String& logTailDelta)
{
    bool applied = false;

    withLocks([&]
    {
        RenderJob job;
        if (!readJob(getJobFile(userId, renderId), job) || job.status != JobStatus::Processing)
            return;

        job.progress = juce::jmax(job.progress, juce::jmin(maxRunningPercent, progress));
        job.logTail = BoundedLogTail::clip(job.logTail + logTailDelta, logTailCapacity);
        job.updatedAt = juce::Time::getCurrentTime();
        applied = writeJob(job).wasOk();
    });

    return applied;
}

bool RenderJobStore::finalize(const juce::String& userId, const juce::String& renderId,
                              JobStatus status,
                              const juce::String& outputUrl,
                              const juce::String& error,
                              const juce::String& logTail)
{
    if (!RenderTypes::isTerminal(status))
        return false;

    bool applied = false;

    withLocks([&]
    {
        RenderJob job;
        if (!readJob(getJobFile(userId, renderId), job) || RenderTypes::isTerminal(job.status))
            return;

        job.status = status;

        if (status == JobStatus::Complete)
            job.progress = 100;
        else
            job.progress = juce::jmin(job.progress, maxRunningPercent);

        if (outputUrl.isNotEmpty())
            job.outputUrl = outputUrl;

        job.error = error;

        if (logTail.isNotEmpty())
            job.logTail = BoundedLogTail::clip(job.logTail + logTail, logTailCapacity);

        job.updatedAt = juce::Time::getCurrentTime();
        applied = writeJob(job).wasOk();
    });

    return applied;
}

juce::Array<RenderJob> RenderJobStore::list(const juce::String& userId,
                                            const juce::String& statusFilter,
                                            const juce::String& projectFilter,
                                            int limit) const
{
    juce::Array<RenderJob> jobs;

    withLocks([&]
    {
        const juce::File userDirectory = getUserDirectory(userId);
        if (!userDirectory.isDirectory())
            return;

        for (const auto& file : userDirectory.findChildFiles(juce::File::findFiles, false, "*.json"))
        {
            RenderJob job;
            if (!readJob(file, job) || job.userId != userId)
                continue;

            if (statusFilter.isNotEmpty() && RenderTypes::toString(job.status) != statusFilter.toLowerCase())
                continue;

            if (projectFilter.isNotEmpty() && job.projectId != projectFilter)
                continue;

            jobs.add(job);
        }
    });

    std::sort(jobs.begin(), jobs.end(), [](const RenderJob& a, const RenderJob& b)
    {
        return a.createdAt > b.createdAt;
    });

    const int maxResults = juce::jlimit(1, 100, limit);
    if (jobs.size() > maxResults)
        jobs.removeRange(maxResults, jobs.size() - maxResults);

    return jobs;
}

bool RenderJobStore::remove(const juce::String& userId, const juce::String& renderId)
{
    bool removed = false;

    withLocks([&]
    {
        const juce::File file = getJobFile(userId, renderId);
        removed = file != juce::File() && file.existsAsFile() && file.deleteFile();
    });

    return removed;
}

int RenderJobStore::failStaleJobs(juce::RelativeTime maxAge)
{
    int failed = 0;
    const juce::Time cutoff = juce::Time::getCurrentTime() - maxAge;

    withLocks([&]
    {
        if (!root.isDirectory())
            return;

        for (const auto& file : root.findChildFiles(juce::File::findFiles, true, "*.json"))
        {
            RenderJob job;
            if (!readJob(file, job) || job.status != JobStatus::Processing)
                continue;

            // Records written before startedAt existed fall back to their last update.
            const juce::Time started = job.startedAt.toMilliseconds() != 0 ? job.startedAt : job.updatedAt;
            if (started >= cutoff)
                continue;

            job.status = JobStatus::Failed;
            job.progress = juce::jmin(job.progress, maxRunningPercent);
            job.error = "Render timed out";
            job.updatedAt = juce::Time::getCurrentTime();

            if (writeJob(job).wasOk())
            {
                ++failed;
                RenderLog::warn("render.run.timed_out", { { "renderId", job.renderId } });
            }
        }
    });

    return failed;
}
