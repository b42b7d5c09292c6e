#pragma once
#include "ports.h"
#include <QList>
#include <QString>
#include <functional>

// One follow-up call of a fan-out batch: the request plus the step that turns
// its (successful) response into zero or more records.
template<typename Record>
struct FanOutTask {
    UpstreamRequest request;
    std::function<Result<QList<Record>>(const UpstreamResponse&)> shape;
};

// Runs a batch of independent upstream calls concurrently and merges their
// records in task order. A task whose call or shaping fails is dropped; the
// batch itself never fails. Every task is awaited, none is cancelled.
class FanOutCoordinator {
public:
    FanOutCoordinator(IUpstreamClient& client, const QString& sourceName);

    template<typename Record>
    void run(const QList<FanOutTask<Record>>& tasks,
             std::function<void(QList<Record>)> done) const;

private:
    IUpstreamClient& m_client;
    QString m_sourceName;

    template<typename Record>
    QList<Record> merge(const QList<FanOutTask<Record>>& tasks,
                        const QList<Result<UpstreamResponse>>& responses) const;

    void reportDropped(const UpstreamRequest& request, const QString& reason) const;
    void reportBatch(int taskCount, int droppedCount) const;
};

template<typename Record>
void FanOutCoordinator::run(const QList<FanOutTask<Record>>& tasks,
                            std::function<void(QList<Record>)> done) const
{
    if (tasks.isEmpty()) {
        done({});
        return;
    }

    QList<UpstreamRequest> requests;
    requests.reserve(tasks.size());
    for (const FanOutTask<Record>& task : tasks)
        requests.append(task.request);

    m_client.executeAll(requests, [coordinator = *this, tasks, done = std::move(done)](
                                      QList<Result<UpstreamResponse>> responses) {
        done(coordinator.merge(tasks, responses));
    });
}

template<typename Record>
QList<Record> FanOutCoordinator::merge(const QList<FanOutTask<Record>>& tasks,
                                       const QList<Result<UpstreamResponse>>& responses) const
{
    QList<Record> merged;
    int dropped = 0;
    for (qsizetype i = 0; i < tasks.size(); ++i) {
        const FanOutTask<Record>& task = tasks.at(i);
        if (i >= responses.size()) {
            reportDropped(task.request, QStringLiteral("no result"));
            ++dropped;
            continue;
        }

        const Result<UpstreamResponse>& response = responses.at(i);
        if (!response) {
            reportDropped(task.request, response.error().message);
            ++dropped;
            continue;
        }
        if (!response->isSuccess()) {
            reportDropped(task.request, QStringLiteral("HTTP %1").arg(response->statusCode));
            ++dropped;
            continue;
        }

        const Result<QList<Record>> shaped = task.shape(*response);
        if (!shaped) {
            reportDropped(task.request, shaped.error().message);
            ++dropped;
            continue;
        }
        merged.append(*shaped);
    }

    reportBatch(static_cast<int>(tasks.size()), dropped);
    return merged;
}
