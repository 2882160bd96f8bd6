#pragma once
#include <JuceHeader.h>
#include "../rendering/RenderTypes.h"

/** Durable state of one render, keyed by (userId, renderId). */
struct RenderJob
{
    juce::String userId;
    juce::String renderId;
    juce::String projectId;
    juce::String configId;
    RenderTypes::JobStatus status = RenderTypes::JobStatus::Pending;
    int progress = 0;
    juce::String outputUrl;
    juce::String error;
    juce::String logTail;
    RenderTypes::RenderOptions options;
    juce::Time createdAt;
    juce::Time updatedAt;
    juce::Time startedAt;   // set when the job leaves pending

    juce::var toVar() const;
    static bool fromVar(const juce::var& value, RenderJob& job);

    /** Shape returned to pollers. */
    juce::var toStatusVar(bool includeLogTail = true) const;
};

//==============================================================================
/**
 * File-backed job store.
 *
 * Each job is one JSON document at "<root>/<userKey>/<renderId>.json",
 * replaced atomically on every write. A CriticalSection serialises threads of
 * this process and an InterProcessLock named after the root serialises other
 * processes (a "run" invocation updating a job created by "serve").
 */
class RenderJobStore
{
public:
    static constexpr int logTailCapacity = 12000;
    static constexpr int processingStartPercent = 5;
    static constexpr int maxRunningPercent = 99;

    struct CreateRequest
    {
        juce::String userId;
        juce::String projectId;
        juce::String configId;
        juce::String idempotencyKey;
        RenderTypes::RenderOptions options;
    };

    struct CreateResult
    {
        juce::Result result = juce::Result::ok();
        RenderJob job;
        bool created = false;
    };

    explicit RenderJobStore(const juce::File& rootDirectory);

    /**
     * Derives the render id for a submission: a UUID-shaped digest of
     * (userId, idempotencyKey), or a fresh random UUID when no key is given.
     */
    static juce::String deriveRenderId(const juce::String& userId, const juce::String& idempotencyKey);

    /**
     * Creates a pending job. If the derived id already exists the stored
     * record is returned unchanged and created is false.
     */
    CreateResult create(const CreateRequest& request);

    bool get(const juce::String& userId, const juce::String& renderId, RenderJob& job) const;

    /** pending -> processing at 5%. Returns false for any other current status. */
    bool markProcessing(const juce::String& userId, const juce::String& renderId);

    /**
     * Raises progress (capped at 99) and appends to the bounded log tail.
     * No-op unless the job is processing; progress never decreases.
     */
    bool updateProgress(const juce::String& userId, const juce::String& renderId,
                        int progress, const juce::String& logTailDelta);

    /**
     * Moves a non-terminal job to complete or failed. Complete sets progress
     * to 100. Terminal jobs are left untouched and false is returned.
     */
    bool finalize(const juce::String& userId, const juce::String& renderId,
                  RenderTypes::JobStatus status,
                  const juce::String& outputUrl = {},
                  const juce::String& error = {},
                  const juce::String& logTail = {});

    /** Newest first. An empty filter matches everything. */
    juce::Array<RenderJob> list(const juce::String& userId,
                                const juce::String& statusFilter = {},
                                const juce::String& projectFilter = {},
                                int limit = 20) const;

    bool remove(const juce::String& userId, const juce::String& renderId);

    /**
     * Fails every processing job that started more than maxAge ago, however
     * recently it reported progress. Pending jobs are still queued and are
     * left alone. Returns how many were failed.
     */
    int failStaleJobs(juce::RelativeTime maxAge);

    const juce::File& getRoot() const { return root; }

private:
    juce::File getUserDirectory(const juce::String& userId) const;
    juce::File getJobFile(const juce::String& userId, const juce::String& renderId) const;

    bool readJob(const juce::File& file, RenderJob& job) const;
    juce::Result writeJob(const RenderJob& job);

    /** Runs fn with both locks held. Returns false if the process lock could not be taken. */
    bool withLocks(const std::function<void()>& fn) const;

    juce::File root;
    juce::CriticalSection lock;
    mutable juce::InterProcessLock processLock;

    JUCE_DECLARE_NON_COPYABLE_WITH_LEAK_DETECTOR(RenderJobStore)
};
