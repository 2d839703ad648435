#ifndef FAKEHUB_H
#define FAKEHUB_H

/**
 * @file fakehub.h
 * @brief In-memory hub and lock service shared by channel and engine tests
 */

#include <QQueue>
#include <QStringList>
#include "sync/channel.h"
#include "repo/localrepository.h"

using namespace Bridge;

/**
 * @brief Scripted hub: records every call, answers from queues
 */
class FakeConcurrencyControl : public ConcurrencyControl
{
public:
    bool isBulkMode() const override { return bulk; }
    void startBulkMode() override { bulk = true; log << "bulk"; }
    bool hasPendingRequests() const override { return pending; }
    bool hasSchemaLock() const override { return schemaLock; }
    bool hasCodeSpecsLock() const override { return codeSpecsLock; }
    bool isChannelRootLocked() const override { return rootLocked; }
    QString channelRoot() const override { return root; }
    void setChannelRoot(const QString &rootId) override { root = rootId; }
    QString channelRootOf(const QString &) const override { return root; }

    HubResult lockChannelRoot() override
    {
        log << "lock:" + root;
        HubResult result = next(&lockResults);
        if (result.isOk()) {
            rootLocked = true;
        }
        return result;
    }

    HubResult request() override
    {
        log << "request";
        return next(&requestResults);
    }

    HubResult pullAndMergeChanges() override
    {
        log << "pull";
        return next(&pullResults);
    }

    HubResult pushChanges(const QString &comment, ChangesType type) override
    {
        log << QString("push:%1:%2").arg(comment, type == ChangesType::Schema ? "schema" : "regular");
        HubResult result = next(&pushResults);
        if (result.isOk()) {
            rootLocked = false;
        }
        return result;
    }

    bool bulk = false;
    bool pending = false;
    bool schemaLock = false;
    bool codeSpecsLock = false;
    bool rootLocked = false;
    QString root;

    QQueue<HubResult> lockResults;
    QQueue<HubResult> requestResults;
    QQueue<HubResult> pullResults;
    QQueue<HubResult> pushResults;
    QStringList log;

private:
    static HubResult next(QQueue<HubResult> *queue)
    {
        return queue->isEmpty() ? HubResult::ok() : queue->dequeue();
    }
};

/**
 * @brief Local repository that reports a hub
 */
class HubRepository : public LocalRepository
{
public:
    explicit HubRepository(ConcurrencyControl *cc) : m_cc(cc) {}
    ConcurrencyControl *concurrencyControl() override { return m_cc; }

private:
    ConcurrencyControl *m_cc;
};

#endif // FAKEHUB_H
