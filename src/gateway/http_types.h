#pragma once
#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <QList>
#include <QMap>
#include <QString>
#include <utility>

struct HttpRequest {
    QString method, target, httpVersion;
    // Header names are lower-cased.
    QMap<QString, QString> headers;
    QByteArray body;

    QString header(const QString& name) const { return headers.value(name.toLower()); }
    bool hasHeader(const QString& name) const { return headers.contains(name.toLower()); }
};

struct HttpResponse {
    int status = 200;
    QString contentType = QStringLiteral("application/json");
    QList<std::pair<QString, QString>> headers;
    QByteArray body;

    void setHeader(const QString& name, const QString& value)
    {
        for (auto& header : headers) {
            if (header.first.compare(name, Qt::CaseInsensitive) == 0) {
                header.second = value;
                return;
            }
        }
        headers.append({name, value});
    }

    QString header(const QString& name) const
    {
        for (const auto& header : headers) {
            if (header.first.compare(name, Qt::CaseInsensitive) == 0)
                return header.second;
        }
        return QString();
    }

    static HttpResponse json(int status, const QJsonValue& value)
    {
        HttpResponse response;
        response.status = status;
        if (value.isArray())
            response.body = QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact);
        else
            response.body = QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact);
        return response;
    }

    static HttpResponse text(int status, const QByteArray& body)
    {
        HttpResponse response;
        response.status = status;
        response.contentType = QStringLiteral("text/plain; charset=utf-8");
        response.body = body;
        return response;
    }
};
