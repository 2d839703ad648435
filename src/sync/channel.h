#ifndef CHANNEL_H
#define CHANNEL_H

#include <QString>
#include <functional>
#include "synctypes.h"

namespace Bridge {

class Repository;

/**
 * @brief Outcome of one request against a remote hub
 */
struct HubResult {
    enum class Status {
        Ok,
        RateLimited,    ///< Hub asked us to slow down, retry later
        Failed
    };

    Status status = Status::Ok;
    QString message;

    static HubResult ok() { return HubResult(); }
    static HubResult rateLimited(const QString &msg = QString()) { return HubResult{Status::RateLimited, msg}; }
    static HubResult failed(const QString &msg) { return HubResult{Status::Failed, msg}; }

    bool isOk() const { return status == Status::Ok; }
};

/**
 * @brief Lock and change-set protocol of a multi-writer repository
 *
 * Writes happen inside a channel: an exclusively locked subtree rooted at a
 * record (the repository root for loader and schema changes, a container
 * for data changes). Pushing a change set releases every lock held.
 */
class ConcurrencyControl
{
public:
    virtual ~ConcurrencyControl() = default;

    // ========== Lock State ==========

    virtual bool isBulkMode() const = 0;
    virtual void startBulkMode() = 0;
    virtual bool hasPendingRequests() const = 0;
    virtual bool hasSchemaLock() const = 0;
    virtual bool hasCodeSpecsLock() const = 0;

    /**
     * @brief Whether this process holds the lock on the current channel root
     */
    virtual bool isChannelRootLocked() const = 0;

    virtual QString channelRoot() const = 0;
    virtual void setChannelRoot(const QString &rootId) = 0;

    /**
     * @brief Channel root a record belongs to
     */
    virtual QString channelRootOf(const QString &recordId) const = 0;

    // ========== Hub Requests ==========

    virtual HubResult lockChannelRoot() = 0;

    /**
     * @brief Send pending lock and code requests collected in bulk mode
     */
    virtual HubResult request() = 0;

    virtual HubResult pullAndMergeChanges() = 0;

    /**
     * @brief Push committed change sets and release all locks
     */
    virtual HubResult pushChanges(const QString &comment, ChangesType type) = 0;
};

/**
 * @brief Retry behaviour for hub requests
 */
struct RetryPolicy {
    int baseDelayMs = 60 * 1000;
    int jitterMs = 10 * 1000;
    std::function<void(int)> sleep;     ///< Defaults to blocking the thread

    void wait(int ms) const;
};

/**
 * @brief Run a hub request until it is not rate limited
 *
 * Rate-limited attempts sleep baseDelayMs plus up to jitterMs and retry
 * without limit. Any other failure is returned immediately.
 */
HubResult retryLoop(const std::function<HubResult()> &op, const RetryPolicy &policy = RetryPolicy());

/**
 * @brief Enter the channel rooted at a record
 *
 * Does nothing for repositories without concurrency control. Otherwise
 * starts bulk mode if needed, checks there are no pending requests, no
 * schema or code-spec lock and no lock left on the previous channel root,
 * then locks the new root.
 *
 * @return false with @p error set when a check fails or locking fails
 */
bool enterChannel(Repository *repository, const QString &rootId,
                  const RetryPolicy &policy, QString *error);

/**
 * @brief Commit staged changes and push them
 *
 * Order: send pending requests, pull and merge, commit locally, push.
 * The commit comment is "<header> - <description>" with the header cut to
 * 400 characters.
 */
bool persistChanges(Repository *repository, const QString &revisionHeader,
                    const QString &description, ChangesType type,
                    const RetryPolicy &policy, QString *error);

/**
 * @brief Commit comment for a change set
 */
QString changeComment(const QString &revisionHeader, const QString &description);

} // namespace Bridge

#endif // CHANNEL_H
