#pragma once
#include "ports.h"
#include <QString>

// Source-specific wording for one upstream call. An empty notFound means a
// 404 is reported like any other upstream status.
struct StatusMessages {
    QString context;
    QString notFound;
};

namespace upstream_errors {

// "Could not connect to the <source> API."
DomainFailure transportFailure(const QString& sourceName, const DomainFailure& cause);

// Maps a non-2xx response: 404 with a notFound message becomes NotFound,
// everything else an Upstream failure carrying the status and the raw body.
DomainFailure statusFailure(const UpstreamResponse& response, const StatusMessages& messages);

// Transport failure and status mapping in one step.
Result<UpstreamResponse> checked(const Result<UpstreamResponse>& result,
                                 const QString& sourceName,
                                 const StatusMessages& messages);

}
