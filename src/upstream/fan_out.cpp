#include "fan_out.h"
#include "core/log_manager.h"

FanOutCoordinator::FanOutCoordinator(IUpstreamClient& client, const QString& sourceName)
    : m_client(client)
    , m_sourceName(sourceName)
{
}

void FanOutCoordinator::reportDropped(const UpstreamRequest& request, const QString& reason) const
{
    LOG_WARNING(QStringLiteral("FanOut[%1]: dropped %2 (%3)")
                    .arg(m_sourceName,
                         request.url.toDisplayString(QUrl::RemoveUserInfo),
                         reason));
}

void FanOutCoordinator::reportBatch(int taskCount, int droppedCount) const
{
    LOG_DEBUG(QStringLiteral("FanOut[%1]: %2 task(s), %3 dropped")
                  .arg(m_sourceName)
                  .arg(taskCount)
                  .arg(droppedCount));
}
