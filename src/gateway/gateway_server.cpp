#include "gateway_server.h"
#include "gateway_dispatcher.h"
#include "core/log_manager.h"
#include <QJsonObject>
#include <QPointer>

namespace {

constexpr qsizetype kMaxHeaderBytes = 64 * 1024;
// Every route is a GET; bodies are read only to keep the connection framed.
constexpr qsizetype kMaxBodyBytes = 64 * 1024;

HttpResponse protocolError(int status, const QString& detail)
{
    QJsonObject obj;
    obj[QStringLiteral("detail")] = detail;
    return HttpResponse::json(status, obj);
}

}

// ========================================================================
// Construction / destruction
// ========================================================================

GatewayServer::GatewayServer(const GatewayDispatcher& dispatcher, QObject* parent)
    : QObject(parent)
    , m_dispatcher(dispatcher)
{
}

GatewayServer::~GatewayServer()
{
    stop();
}

// ========================================================================
// start / stop
// ========================================================================

bool GatewayServer::start(const QString& host, int port)
{
    if (m_server) {
        stop();
    }

    QHostAddress address;
    if (host == QStringLiteral("localhost")) {
        address = QHostAddress(QHostAddress::LocalHost);
    } else if (!address.setAddress(host)) {
        LOG_ERROR(QStringLiteral("GatewayServer: invalid listen address: %1").arg(host));
        return false;
    }

    m_server = new QTcpServer(this);
    connect(m_server, &QTcpServer::pendingConnectionAvailable,
            this, &GatewayServer::onNewConnection);

    if (!m_server->listen(address, static_cast<quint16>(port))) {
        LOG_ERROR(QStringLiteral("GatewayServer: failed to listen on %1:%2 - %3")
                      .arg(host)
                      .arg(port)
                      .arg(m_server->errorString()));
        delete m_server;
        m_server = nullptr;
        return false;
    }

    LOG_INFO(QStringLiteral("GatewayServer: listening on http://%1:%2")
                 .arg(host)
                 .arg(m_server->serverPort()));
    emit statusChanged(true);
    return true;
}

void GatewayServer::stop()
{
    if (!m_server) {
        return;
    }

    const QList<QTcpSocket*> sockets = m_pendingData.keys();
    for (QTcpSocket* socket : sockets) {
        socket->disconnectFromHost();
    }
    m_pendingData.clear();
    m_busySockets.clear();

    m_server->close();
    delete m_server;
    m_server = nullptr;

    LOG_INFO(QStringLiteral("GatewayServer: stopped"));
    emit statusChanged(false);
}

bool GatewayServer::isRunning() const
{
    return m_server && m_server->isListening();
}

quint16 GatewayServer::serverPort() const
{
    return m_server ? m_server->serverPort() : 0;
}

// ========================================================================
// Connection handling
// ========================================================================

void GatewayServer::onNewConnection()
{
    while (m_server && m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (!socket) {
            continue;
        }

        m_pendingData.insert(socket, QByteArray());
        connect(socket, &QTcpSocket::readyRead,
                this, &GatewayServer::onSocketReadyRead);
        connect(socket, &QTcpSocket::disconnected,
                this, &GatewayServer::onSocketDisconnected);

        LOG_DEBUG(QStringLiteral("GatewayServer: new connection from %1:%2")
                      .arg(socket->peerAddress().toString())
                      .arg(socket->peerPort()));
    }
}

void GatewayServer::onSocketReadyRead()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    // Rejected connections are closing; whatever else they send is dropped.
    if (!m_pendingData.contains(socket)) {
        socket->readAll();
        return;
    }
    m_pendingData[socket] += socket->readAll();

    // A request on this socket is still waiting for its response; the rest of
    // the buffer is picked up once it has been answered.
    if (m_busySockets.contains(socket)) {
        return;
    }
    processBuffer(socket);
}

void GatewayServer::onSocketDisconnected()
{
    auto* socket = qobject_cast<QTcpSocket*>(sender());
    if (!socket) {
        return;
    }

    m_pendingData.remove(socket);
    m_busySockets.remove(socket);
    socket->deleteLater();

    LOG_DEBUG(QStringLiteral("GatewayServer: client disconnected"));
}

void GatewayServer::processBuffer(QTcpSocket* socket)
{
    if (!m_pendingData.contains(socket) || m_busySockets.contains(socket)) {
        return;
    }

    QByteArray& buffer = m_pendingData[socket];
    const qsizetype headerEnd = buffer.indexOf("\r\n\r\n");
    if (headerEnd < 0 || headerEnd > kMaxHeaderBytes) {
        if (headerEnd > kMaxHeaderBytes || buffer.size() > kMaxHeaderBytes) {
            rejectConnection(socket, 431, QStringLiteral("Request header too large"));
        }
        return;
    }

    qsizetype contentLength = 0;
    bool hasChunkedTransfer = false;
    const QString headerBlock = QString::fromUtf8(buffer.left(headerEnd));
    const QStringList headerLines = headerBlock.split(QStringLiteral("\r\n"));
    for (const QString& line : headerLines) {
        if (line.startsWith(QStringLiteral("Content-Length:"), Qt::CaseInsensitive)) {
            bool ok = false;
            const qint64 declared = line.mid(15).trimmed().toLongLong(&ok);
            if (!ok || declared < 0) {
                rejectConnection(socket, 400, QStringLiteral("Invalid Content-Length"));
                return;
            }
            if (declared > kMaxBodyBytes) {
                rejectConnection(socket, 413, QStringLiteral("Request body too large"));
                return;
            }
            contentLength = static_cast<qsizetype>(declared);
        }
        if (line.startsWith(QStringLiteral("Transfer-Encoding:"), Qt::CaseInsensitive)
            && line.contains(QStringLiteral("chunked"), Qt::CaseInsensitive)) {
            hasChunkedTransfer = true;
        }
    }

    if (hasChunkedTransfer) {
        rejectConnection(socket, 501, QStringLiteral("Chunked request bodies are not supported"));
        return;
    }

    const qsizetype totalRequired = headerEnd + 4 + contentLength;
    if (buffer.size() < totalRequired) {
        return;
    }

    const QByteArray requestData = buffer.left(totalRequired);
    buffer.remove(0, totalRequired);

    const HttpRequest request = parseHttpRequest(requestData);
    if (request.method.isEmpty()) {
        rejectConnection(socket, 400, QStringLiteral("Malformed request line"));
        return;
    }

    // One request per connection is in flight; the response is written from
    // the completion callback, whenever its upstream calls have settled.
    const bool keepAlive = wantsKeepAlive(request);
    m_busySockets.insert(socket);
    m_dispatcher.handle(request, [self = QPointer<GatewayServer>(this),
                                  guarded = QPointer<QTcpSocket>(socket),
                                  keepAlive](HttpResponse response) {
        if (self && guarded) {
            self->finishRequest(guarded, response, keepAlive);
        }
    });
}

void GatewayServer::finishRequest(QTcpSocket* socket, const HttpResponse& response, bool keepAlive)
{
    // The client may have gone away while upstream calls were in flight.
    if (!m_busySockets.remove(socket) || socket->state() != QAbstractSocket::ConnectedState) {
        return;
    }

    sendHttpResponse(socket, response, keepAlive);
    if (!keepAlive) {
        m_pendingData.remove(socket);
        return;
    }

    // Pipelined requests: queued so a response that was ready synchronously
    // does not recurse into the next one.
    if (!m_pendingData.value(socket).isEmpty()) {
        QMetaObject::invokeMethod(this, [this, guarded = QPointer<QTcpSocket>(socket)]() {
            if (guarded) {
                processBuffer(guarded);
            }
        }, Qt::QueuedConnection);
    }
}

void GatewayServer::rejectConnection(QTcpSocket* socket, int status, const QString& detail)
{
    LOG_WARNING(QStringLiteral("GatewayServer: rejecting request from %1 with %2: %3")
                    .arg(socket->peerAddress().toString())
                    .arg(status)
                    .arg(detail));
    sendHttpResponse(socket, protocolError(status, detail), false);
    m_pendingData.remove(socket);
}

// ========================================================================
// parseHttpRequest
// ========================================================================

HttpRequest GatewayServer::parseHttpRequest(const QByteArray& data)
{
    HttpRequest req;

    const qsizetype headerEnd = data.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        return req;
    }

    const QString headerBlock = QString::fromUtf8(data.left(headerEnd));
    const QStringList lines = headerBlock.split(QStringLiteral("\r\n"));

    // Request line: "METHOD TARGET HTTP/1.1"
    if (!lines.isEmpty()) {
        const QStringList parts = lines[0].split(QLatin1Char(' '), Qt::SkipEmptyParts);
        if (parts.size() == 3 && parts[2].startsWith(QStringLiteral("HTTP/"))) {
            req.method      = parts[0].trimmed().toUpper();
            req.target      = parts[1];
            req.httpVersion = parts[2];
        }
    }

    for (qsizetype i = 1; i < lines.size(); ++i) {
        const qsizetype colon = lines[i].indexOf(QLatin1Char(':'));
        if (colon > 0) {
            const QString key   = lines[i].left(colon).trimmed().toLower();
            const QString value = lines[i].mid(colon + 1).trimmed();
            req.headers[key] = value;
        }
    }

    req.body = data.mid(headerEnd + 4);
    return req;
}

bool GatewayServer::wantsKeepAlive(const HttpRequest& request)
{
    const QString connection = request.header(QStringLiteral("connection")).toLower();
    if (request.httpVersion == QStringLiteral("HTTP/1.0")) {
        return connection.contains(QStringLiteral("keep-alive"));
    }
    return !connection.contains(QStringLiteral("close"));
}

// ========================================================================
// sendHttpResponse
// ========================================================================

QByteArray GatewayServer::serializeResponse(const HttpResponse& response, bool keepAlive)
{
    static const QMap<int, QString> statusTexts = {
        {200, QStringLiteral("OK")},
        {400, QStringLiteral("Bad Request")},
        {401, QStringLiteral("Unauthorized")},
        {403, QStringLiteral("Forbidden")},
        {404, QStringLiteral("Not Found")},
        {405, QStringLiteral("Method Not Allowed")},
        {413, QStringLiteral("Content Too Large")},
        {429, QStringLiteral("Too Many Requests")},
        {431, QStringLiteral("Request Header Fields Too Large")},
        {500, QStringLiteral("Internal Server Error")},
        {501, QStringLiteral("Not Implemented")},
        {502, QStringLiteral("Bad Gateway")},
        {503, QStringLiteral("Service Unavailable")},
        {504, QStringLiteral("Gateway Timeout")}
    };

    const QString statusText = statusTexts.value(response.status, QStringLiteral("Unknown"));

    QByteArray out;
    out.append(QStringLiteral("HTTP/1.1 %1 %2\r\n")
                   .arg(response.status)
                   .arg(statusText)
                   .toUtf8());
    out.append(QStringLiteral("Content-Type: %1\r\n")
                   .arg(response.contentType)
                   .toUtf8());
    out.append(QStringLiteral("Content-Length: %1\r\n")
                   .arg(response.body.size())
                   .toUtf8());
    for (const auto& [name, value] : response.headers) {
        out.append(QStringLiteral("%1: %2\r\n").arg(name, value).toUtf8());
    }
    out.append(keepAlive ? "Connection: keep-alive\r\n" : "Connection: close\r\n");
    out.append("\r\n");
    out.append(response.body);
    return out;
}

void GatewayServer::sendHttpResponse(QTcpSocket* socket, const HttpResponse& response, bool keepAlive)
{
    if (!socket || socket->state() != QAbstractSocket::ConnectedState) {
        return;
    }

    socket->write(serializeResponse(response, keepAlive));
    socket->flush();
    if (!keepAlive) {
        socket->disconnectFromHost();
    }
}
