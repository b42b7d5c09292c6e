#include "failure.h"

int DomainFailure::httpStatus() const {
    switch (kind) {
    case ErrorKind::BadRequest:        return 400;
    case ErrorKind::NotFound:          return 404;
    case ErrorKind::MethodNotAllowed:  return 405;
    case ErrorKind::Unavailable:       return 503;
    case ErrorKind::Upstream:
        // Anything that is not a valid HTTP status is reported as a bad gateway.
        if (upstreamStatus >= 100 && upstreamStatus <= 599)
            return upstreamStatus;
        return 502;
    case ErrorKind::Configuration:
    case ErrorKind::Parse:
    case ErrorKind::Internal:
    default:                           return 500;
    }
}

QJsonObject DomainFailure::toJson() const {
    QJsonObject root;
    root["detail"] = message;
    return root;
}

DomainFailure DomainFailure::configuration(const QString& setting) {
    return {ErrorKind::Configuration,
            QStringLiteral("%1 is not configured. Set it in the environment or the .env file.").arg(setting),
            0};
}

DomainFailure DomainFailure::badRequest(const QString& msg) {
    return {ErrorKind::BadRequest, msg, 0};
}

DomainFailure DomainFailure::notFound(const QString& msg) {
    return {ErrorKind::NotFound, msg, 0};
}

DomainFailure DomainFailure::methodNotAllowed() {
    return {ErrorKind::MethodNotAllowed, QStringLiteral("Method Not Allowed"), 0};
}

DomainFailure DomainFailure::upstream(int status, const QString& msg) {
    return {ErrorKind::Upstream, msg, status};
}

DomainFailure DomainFailure::unavailable(const QString& msg) {
    return {ErrorKind::Unavailable, msg, 0};
}

DomainFailure DomainFailure::parse(const QString& msg) {
    return {ErrorKind::Parse, msg, 0};
}

DomainFailure DomainFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, msg, 0};
}
