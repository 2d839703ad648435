#include "channel.h"
#include "../repo/repository.h"

#include <QRandomGenerator>
#include <QThread>
#include <QDebug>

namespace Bridge {

static const int MaxRevisionHeaderLength = 400;

void RetryPolicy::wait(int ms) const
{
    if (sleep) {
        sleep(ms);
    } else {
        QThread::msleep(static_cast<unsigned long>(ms));
    }
}

HubResult retryLoop(const std::function<HubResult()> &op, const RetryPolicy &policy)
{
    while (true) {
        HubResult result = op();
        if (result.status != HubResult::Status::RateLimited) {
            return result;
        }

        const int jitter = policy.jitterMs > 0 ? QRandomGenerator::global()->bounded(policy.jitterMs) : 0;
        const int delay = policy.baseDelayMs + jitter;
        qDebug() << "[Channel] Requests are sent too frequently. Sleeping for" << delay << "ms";
        policy.wait(delay);
    }
}

bool enterChannel(Repository *repository, const QString &rootId,
                  const RetryPolicy &policy, QString *error)
{
    ConcurrencyControl *cc = repository->concurrencyControl();
    if (!cc) {
        return true;
    }

    if (!cc->isBulkMode()) {
        cc->startBulkMode();
    }

    QString violation;
    if (cc->hasPendingRequests()) {
        violation = "has pending requests";
    } else if (cc->hasSchemaLock()) {
        violation = "has schema lock";
    } else if (cc->hasCodeSpecsLock()) {
        violation = "has code spec lock";
    } else if (cc->isChannelRootLocked()) {
        violation = "holds lock on current channel root, it must be released before entering a new channel";
    }

    if (!violation.isEmpty()) {
        if (error) *error = QString("Cannot enter channel %1: %2").arg(rootId, violation);
        return false;
    }

    cc->setChannelRoot(rootId);
    HubResult result = retryLoop([cc]() { return cc->lockChannelRoot(); }, policy);
    if (!result.isOk()) {
        if (error) *error = QString("Failed to lock channel root %1: %2").arg(rootId, result.message);
        return false;
    }

    qDebug() << "[Channel] Entered channel" << rootId;
    return true;
}

QString changeComment(const QString &revisionHeader, const QString &description)
{
    return revisionHeader.left(MaxRevisionHeaderLength) + " - " + description;
}

bool persistChanges(Repository *repository, const QString &revisionHeader,
                    const QString &description, ChangesType type,
                    const RetryPolicy &policy, QString *error)
{
    const QString comment = changeComment(revisionHeader, description);
    ConcurrencyControl *cc = repository->concurrencyControl();

    if (cc) {
        HubResult result = retryLoop([cc]() { return cc->request(); }, policy);
        if (!result.isOk()) {
            if (error) *error = QString("Lock request failed: %1").arg(result.message);
            return false;
        }

        result = retryLoop([cc]() { return cc->pullAndMergeChanges(); }, policy);
        if (!result.isOk()) {
            if (error) *error = QString("Pull and merge failed: %1").arg(result.message);
            return false;
        }
    }

    if (!repository->saveChanges(comment)) {
        if (error) *error = QString("Failed to save changes: %1").arg(repository->errorString());
        return false;
    }

    if (cc) {
        HubResult result = retryLoop([cc, &comment, type]() { return cc->pushChanges(comment, type); }, policy);
        if (!result.isOk()) {
            if (error) *error = QString("Push failed: %1").arg(result.message);
            return false;
        }
    }
    return true;
}

} // namespace Bridge
