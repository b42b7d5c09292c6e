#pragma once
#include "http_types.h"
#include <QHostAddress>
#include <QMap>
#include <QObject>
#include <QSet>
#include <QTcpServer>
#include <QTcpSocket>

class GatewayDispatcher;

// HTTP/1.1 listener. Requests on one connection are answered in order, one at
// a time; requests on different connections are independent, and each is
// answered as soon as its own upstream calls have settled.
class GatewayServer : public QObject {
    Q_OBJECT
public:
    explicit GatewayServer(const GatewayDispatcher& dispatcher, QObject* parent = nullptr);
    ~GatewayServer() override;

    bool start(const QString& host, int port);
    void stop();
    bool isRunning() const;
    quint16 serverPort() const;

    static HttpRequest parseHttpRequest(const QByteArray& data);
    static QByteArray serializeResponse(const HttpResponse& response, bool keepAlive);

signals:
    void statusChanged(bool running);

private slots:
    void onNewConnection();
    void onSocketReadyRead();
    void onSocketDisconnected();

private:
    void processBuffer(QTcpSocket* socket);
    void finishRequest(QTcpSocket* socket, const HttpResponse& response, bool keepAlive);
    // Answers with a protocol error and closes the connection.
    void rejectConnection(QTcpSocket* socket, int status, const QString& detail);
    void sendHttpResponse(QTcpSocket* socket, const HttpResponse& response, bool keepAlive);
    static bool wantsKeepAlive(const HttpRequest& request);

    const GatewayDispatcher& m_dispatcher;
    QTcpServer* m_server = nullptr;
    QMap<QTcpSocket*, QByteArray> m_pendingData;
    QSet<QTcpSocket*> m_busySockets;
};
