#pragma once
#include "types.h"
#include <QString>
#include <QJsonObject>

struct DomainFailure {
    ErrorKind   kind = ErrorKind::Internal;
    QString     message;
    int         upstreamStatus = 0;

    int httpStatus() const;
    QJsonObject toJson() const;

    static DomainFailure configuration(const QString& setting);
    static DomainFailure badRequest(const QString& msg);
    static DomainFailure notFound(const QString& msg);
    static DomainFailure methodNotAllowed();
    static DomainFailure upstream(int status, const QString& msg);
    static DomainFailure unavailable(const QString& msg);
    static DomainFailure parse(const QString& msg);
    static DomainFailure internal(const QString& msg);
};
