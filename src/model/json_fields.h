#pragma once

#include "result.h"

#include <QByteArray>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QJsonValue>
#include <QList>
#include <QLocale>
#include <QString>
#include <optional>

// Field accessors for loosely-structured upstream payloads. A key that is
// missing or explicitly null counts as absent.
namespace json_fields {

inline bool isPresent(const QJsonObject& obj, const QString& key)
{
    const QJsonValue value = obj.value(key);
    return !value.isUndefined() && !value.isNull();
}

inline std::optional<QString> optionalString(const QJsonObject& obj, const QString& key)
{
    const QJsonValue value = obj.value(key);
    if (value.isString())
        return value.toString();
    if (value.isDouble()) {
        const double number = value.toDouble();
        const qint64 whole = value.toInteger();
        if (static_cast<double>(whole) == number)
            return QString::number(whole);
        return QString::number(number, 'g', QLocale::FloatingPointShortest);
    }
    return std::nullopt;
}

inline QString stringOr(const QJsonObject& obj, const QString& key, const QString& fallback)
{
    return optionalString(obj, key).value_or(fallback);
}

inline std::optional<qint64> optionalInt(const QJsonObject& obj, const QString& key)
{
    const QJsonValue value = obj.value(key);
    if (value.isDouble())
        return value.toInteger();
    if (value.isString()) {
        bool ok = false;
        const qint64 parsed = value.toString().trimmed().toLongLong(&ok);
        if (ok)
            return parsed;
    }
    return std::nullopt;
}

inline qint64 intOr(const QJsonObject& obj, const QString& key, qint64 fallback)
{
    return optionalInt(obj, key).value_or(fallback);
}

inline bool boolOr(const QJsonObject& obj, const QString& key, bool fallback)
{
    const QJsonValue value = obj.value(key);
    return value.isBool() ? value.toBool() : fallback;
}

inline DomainFailure missingField(const QString& record, const QString& key)
{
    return DomainFailure::parse(
        QStringLiteral("Unexpected %1 payload: required field '%2' is missing.").arg(record, key));
}

inline Result<qint64> requireInt(const QJsonObject& obj, const QString& key, const QString& record)
{
    const auto value = optionalInt(obj, key);
    if (!value)
        return std::unexpected(missingField(record, key));
    return *value;
}

inline Result<QString> requireString(const QJsonObject& obj, const QString& key, const QString& record)
{
    const auto value = optionalString(obj, key);
    if (!value)
        return std::unexpected(missingField(record, key));
    return *value;
}

inline QJsonValue toJson(const std::optional<QString>& value)
{
    return value ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

inline QJsonValue toJson(const std::optional<qint64>& value)
{
    return value ? QJsonValue(*value) : QJsonValue(QJsonValue::Null);
}

template<typename Record>
QJsonArray toJsonArray(const QList<Record>& records)
{
    QJsonArray array;
    for (const Record& record : records)
        array.append(record.toJson());
    return array;
}

// Shapes each element of an upstream array; the first element that fails to
// shape fails the whole list. cap < 0 keeps every element.
template<typename Record, typename Factory>
Result<QList<Record>> mapObjects(const QJsonArray& array, Factory factory, qsizetype cap = -1)
{
    QList<Record> records;
    for (const QJsonValue& value : array) {
        if (cap >= 0 && records.size() >= cap)
            break;
        Result<Record> record = factory(value.toObject());
        if (!record)
            return std::unexpected(record.error());
        records.append(std::move(*record));
    }
    return records;
}

inline Result<QJsonDocument> parseDocument(const QByteArray& body, const QString& source)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError) {
        return std::unexpected(DomainFailure::parse(
            QStringLiteral("Failed to parse %1 response JSON: %2").arg(source, err.errorString())));
    }
    return doc;
}

}
