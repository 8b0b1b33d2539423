#include "mocknetwork.h"

#include <cstring>

// === MockStreamScript ===

void MockStreamScript::queueData(const QByteArray &data)
{
    ReadEvent event;
    event.type = ReadEvent::Type::Data;
    event.data = data;
    incoming.enqueue(event);
}

void MockStreamScript::queueReply(const QString &line)
{
    queueData(line.toUtf8() + "\r\n");
}

void MockStreamScript::queueTimeout()
{
    ReadEvent event;
    event.type = ReadEvent::Type::Timeout;
    incoming.enqueue(event);
}

void MockStreamScript::queueError()
{
    ReadEvent event;
    event.type = ReadEvent::Type::Error;
    incoming.enqueue(event);
}

QStringList MockStreamScript::writtenLines() const
{
    QStringList lines = QString::fromUtf8(written).split(QStringLiteral("\r\n"));
    if (!lines.isEmpty() && lines.last().isEmpty()) {
        lines.removeLast();
    }
    return lines;
}

// === MockByteStream ===

MockByteStream::MockByteStream(MockScriptPtr script)
    : script_(std::move(script))
{
}

qint64 MockByteStream::read(char *data, qint64 maxSize, int timeoutMs)
{
    Q_UNUSED(timeoutMs)

    if (script_->closed) {
        status_ = Status::Closed;
        return 0;
    }
    if (script_->incoming.isEmpty()) {
        status_ = Status::Closed;
        return 0;
    }

    MockStreamScript::ReadEvent &event = script_->incoming.head();
    switch (event.type) {
    case MockStreamScript::ReadEvent::Type::Timeout:
        script_->incoming.dequeue();
        status_ = Status::TimedOut;
        errorString_ = QStringLiteral("Mock read timed out");
        return -1;

    case MockStreamScript::ReadEvent::Type::Error:
        script_->incoming.dequeue();
        status_ = Status::Failed;
        errorString_ = QStringLiteral("Mock read failed");
        return -1;

    case MockStreamScript::ReadEvent::Type::Data:
        break;
    }

    const qint64 n = qMin<qint64>(maxSize, event.data.size());
    std::memcpy(data, event.data.constData(), static_cast<size_t>(n));
    if (n < event.data.size()) {
        event.data.remove(0, static_cast<int>(n));
    } else {
        script_->incoming.dequeue();
    }
    status_ = Status::Ok;
    return n;
}

bool MockByteStream::write(const QByteArray &data, int timeoutMs)
{
    Q_UNUSED(timeoutMs)

    if (script_->closed) {
        status_ = Status::Closed;
        errorString_ = QStringLiteral("Mock stream closed");
        return false;
    }
    if (script_->failWritesAfter >= 0 && script_->writeCount >= script_->failWritesAfter) {
        status_ = Status::Failed;
        errorString_ = QStringLiteral("Mock write failed");
        return false;
    }

    script_->written.append(data);
    ++script_->writeCount;
    status_ = Status::Ok;
    return true;
}

void MockByteStream::close()
{
    if (!script_->closed) {
        script_->closed = true;
        ++script_->closeCount;
    }
    status_ = Status::Closed;
}

// === MockDataListener ===

MockDataListener::MockDataListener(MockNetworkBackend *backend, MockListenerStatePtr state)
    : backend_(backend)
    , state_(std::move(state))
{
}

ByteStreamPtr MockDataListener::accept(int timeoutMs, FtpError *error)
{
    ++state_->acceptCalls;
    state_->lastAcceptTimeoutMs = timeoutMs;

    if (!state_->listening || backend_->incomingConnections_.isEmpty()) {
        if (error) {
            *error = FtpError(FtpError::Kind::DataConnectTimeout,
                              QStringLiteral("No incoming mock connection"));
        }
        return nullptr;
    }
    return std::make_unique<MockByteStream>(backend_->incomingConnections_.dequeue());
}

void MockDataListener::close()
{
    if (state_->listening) {
        state_->listening = false;
        ++state_->closeCount;
    }
}

// === MockNetworkBackend ===

ByteStreamPtr MockNetworkBackend::connectToHost(const QString &host, quint16 port,
                                                int timeoutMs, FtpError *error)
{
    connectRequests_.append(ConnectRequest{host, port, timeoutMs});

    if (connectOutcomes_.isEmpty()) {
        if (error) {
            *error = FtpError(FtpError::Kind::ConnectionRefused,
                              QStringLiteral("No mock connection queued"));
        }
        return nullptr;
    }

    ConnectOutcome outcome = connectOutcomes_.dequeue();
    if (!outcome.script) {
        if (error) {
            *error = FtpError(outcome.failure, QStringLiteral("Mock connect failure"));
        }
        return nullptr;
    }

    outcome.script->peerPort = port;
    return std::make_unique<MockByteStream>(outcome.script);
}

std::unique_ptr<IDataListener> MockNetworkBackend::listen(const QHostAddress &address,
                                                          quint16 port, FtpError *error)
{
    const bool busy = busyPorts_.contains(port);
    listenRequests_.append(ListenRequest{address, port, !busy});

    if (busy) {
        if (error) {
            *error = FtpError(FtpError::Kind::SocketError,
                              QString("Mock port %1 in use").arg(port));
        }
        return nullptr;
    }

    auto state = std::make_shared<MockListenerState>();
    state->port = port;
    listeners_.append(state);
    return std::make_unique<MockDataListener>(this, state);
}

MockScriptPtr MockNetworkBackend::queueConnection()
{
    ConnectOutcome outcome;
    outcome.script = std::make_shared<MockStreamScript>();
    connectOutcomes_.enqueue(outcome);
    return outcome.script;
}

void MockNetworkBackend::queueConnectFailure(FtpError::Kind kind)
{
    ConnectOutcome outcome;
    outcome.failure = kind;
    connectOutcomes_.enqueue(outcome);
}

MockScriptPtr MockNetworkBackend::queueIncomingConnection(const QByteArray &payload)
{
    auto script = std::make_shared<MockStreamScript>();
    if (!payload.isEmpty()) {
        script->queueData(payload);
    }
    incomingConnections_.enqueue(script);
    return script;
}
