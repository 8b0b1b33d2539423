/**
 * @file test_terminalsession.cpp
 * @brief Unit tests for the interactive TerminalSession loop.
 *
 * Tests verify:
 * - Banner, connection attempt and prompt text
 * - Replies are printed for typed commands
 * - Invalid commands and session errors are reported as "Error: ..."
 * - QUIT and end of input both end the loop and close the connection
 * - The loop continues in disconnected mode when the server is unreachable
 * - SIGINT during a transfer cancels it and the previous handler comes back
 */

#include <QtTest>
#include <QTemporaryDir>
#include <QTextStream>

#include <csignal>

#ifdef Q_OS_UNIX
#include <signal.h>
#endif

#include "mocks/mocknetwork.h"
#include "services/ftpsession.h"
#include "services/transferengine.h"
#include "terminalsession.h"

class TestTerminalSession : public QObject
{
    Q_OBJECT

private:
    MockNetworkBackend *backend = nullptr;
    FtpSession *session = nullptr;
    QTemporaryDir *localDir = nullptr;
    ClientConfig config;

    QString input;
    QString output;
    QTextStream *in = nullptr;
    QTextStream *out = nullptr;

    void setInput(const QString &text)
    {
        input = text;
        delete in;
        in = new QTextStream(&input, QIODevice::ReadOnly);
    }

private slots:
    void init()
    {
        backend = new MockNetworkBackend();
        localDir = new QTemporaryDir();
        QVERIFY(localDir->isValid());

        config = ClientConfig();
        config.localDirectory = localDir->path();

        session = new FtpSession(backend);
        session->configure(config);
        session->retryController()->setSleeper([](int) { return true; });

        output.clear();
        out = new QTextStream(&output, QIODevice::WriteOnly);
        setInput(QString());
    }

    void cleanup()
    {
        delete in;
        in = nullptr;
        delete out;
        out = nullptr;
        delete session;
        session = nullptr;
        delete backend;
        backend = nullptr;
        delete localDir;
        localDir = nullptr;
    }

    // === Loop ===

    void run_ScriptedSession()
    {
        MockScriptPtr control = backend->queueConnection();
        control->queueReply("220 RAX FTP server ready");
        control->queueReply("331 User alice OK. Password required");
        control->queueReply("230 Login successful");
        control->queueReply("257 \"/\" is the current directory");
        control->queueReply("221 Goodbye");

        setInput("USER alice\nPASS secret\n\nPWD\nQUIT\n");
        TerminalSession terminal(session, config, in, out);
        QCOMPARE(terminal.run(), 0);
        out->flush();

        QVERIFY(output.contains("RAX FTP Client - Interactive Session"));
        QVERIFY(output.contains("Attempting to connect to server..."));
        QVERIFY(output.contains("220 RAX FTP server ready"));
        QVERIFY(output.contains("Connected successfully! State: connected"));
        QVERIFY(output.contains("230 Login successful"));
        QVERIFY(output.contains("rax-ftp-client (authenticated)> "));
        QVERIFY(output.contains("257 \"/\" is the current directory"));
        QVERIFY(output.contains("221 Goodbye"));
        QVERIFY(output.contains("Goodbye."));
        QVERIFY(!output.contains("Closing remaining connection"));

        QCOMPARE(control->writtenLines(),
                 (QStringList{"USER alice", "PASS secret", "PWD", "QUIT"}));
        QCOMPARE(control->closeCount, 1);
    }

    void run_EndOfInputClosesConnection()
    {
        MockScriptPtr control = backend->queueConnection();
        control->queueReply("220 RAX FTP server ready");
        control->queueReply("221 Goodbye");

        TerminalSession terminal(session, config, in, out);
        QCOMPARE(terminal.run(), 0);
        out->flush();

        QVERIFY(output.contains("Closing remaining connection..."));
        QCOMPARE(control->writtenLines(), QStringList{"QUIT"});
        QCOMPARE(session->state(), FtpSession::State::Disconnected);
    }

    void run_UnreachableServerContinuesDisconnected()
    {
        setInput("PWD\nQUIT\n");
        TerminalSession terminal(session, config, in, out);
        QCOMPARE(terminal.run(), 0);
        out->flush();

        QVERIFY(output.contains("Continuing in disconnected mode..."));
        QVERIFY(output.contains("rax-ftp-client (disconnected)> "));
        QVERIFY(output.contains("Error: "));
        QVERIFY(output.contains("Goodbye."));
        QCOMPARE(backend->connectRequests().size(), config.maxRetries);
    }

    // === Single lines ===

    void handleLine_InvalidCommand()
    {
        TerminalSession terminal(session, config, in, out);
        QVERIFY(terminal.handleLine("FROB x"));
        QVERIFY(terminal.handleLine("USER"));
        out->flush();

        QVERIFY(output.contains("Error: Invalid command: Unknown command: FROB"));
        QVERIFY(output.contains("Error: Invalid command: USER requires username"));
        QVERIFY(backend->connectRequests().isEmpty());
    }

    void handleLine_Help()
    {
        TerminalSession terminal(session, config, in, out);
        QVERIFY(terminal.handleLine("help"));
        out->flush();

        QVERIFY(output.contains("Available commands:"));
        QVERIFY(output.contains("Current state: disconnected"));
        QVERIFY(output.contains("Data port range: 2122-2130"));
    }

    void handleLine_DataModeSelection()
    {
        MockScriptPtr control = backend->queueConnection();
        control->queueReply("220 RAX FTP server ready");
        control->queueReply("331 User alice OK. Password required");
        control->queueReply("230 Login successful");
        QVERIFY(session->connectToHost("127.0.0.1", 2121));
        QVERIFY(session->login("alice", "secret"));

        TerminalSession terminal(session, config, in, out);
        QVERIFY(terminal.handleLine("PORT 127.0.0.1:2122"));
        QCOMPARE(session->dataMode(), DataMode::Active);
        QVERIFY(terminal.handleLine("PASV"));
        QCOMPARE(session->dataMode(), DataMode::Passive);
        out->flush();

        QVERIFY(output.contains("Active mode (PORT) selected for data transfers, ports 2122-2130"));
        QVERIFY(output.contains("Passive mode (PASV) selected for data transfers"));
        // Mode selection does not touch the control connection
        QCOMPARE(control->writtenLines(), (QStringList{"USER alice", "PASS secret"}));
    }

    void handleLine_ServerClosedEndsSession()
    {
        MockScriptPtr control = backend->queueConnection();
        control->queueReply("220 RAX FTP server ready");
        QVERIFY(session->connectToHost("127.0.0.1", 2121));

        TerminalSession terminal(session, config, in, out);
        // No reply queued: the peer has closed
        QVERIFY(!terminal.handleLine("USER alice"));
        out->flush();

        QVERIFY(output.contains("Connection closed by server. Closing session..."));
        QCOMPARE(session->state(), FtpSession::State::Disconnected);
    }

    void handleLine_InterruptCancelsTransfer()
    {
        MockScriptPtr control = backend->queueConnection();
        control->queueReply("220 RAX FTP server ready");
        control->queueReply("331 User alice OK. Password required");
        control->queueReply("230 Login successful");
        QVERIFY(session->connectToHost("127.0.0.1", 2121));
        QVERIFY(session->login("alice", "secret"));

        control->queueReply("227 Entering Passive Mode (127,0,0,1,8,79)");
        control->queueReply("150 Opening data connection for big.bin (16384 bytes)");
        control->queueReply("426 Transfer aborted");
        MockScriptPtr data = backend->queueConnection();
        data->queueData(QByteArray(TransferEngine::ChunkSize * 2, 'x'));

#ifdef Q_OS_UNIX
        struct sigaction before = {};
        sigaction(SIGINT, nullptr, &before);
#endif

        bool raised = false;
        connect(session, &FtpSession::transferProgress, this,
                [&raised](const TransferProgress &progress) {
                    if (!raised && progress.bytesTransferred > 0) {
                        raised = true;
                        std::raise(SIGINT);
                    }
                });

        TerminalSession terminal(session, config, in, out);
        QVERIFY(terminal.handleLine("RETR big.bin"));
        out->flush();

        QVERIFY(raised);
        QCOMPARE(session->lastError().kind, FtpError::Kind::Cancelled);
        QCOMPARE(session->state(), FtpSession::State::Authenticated);
        QVERIFY(!QFile::exists(localDir->filePath("big.bin")));
        QVERIFY(output.contains("Error: "));

#ifdef Q_OS_UNIX
        struct sigaction after = {};
        sigaction(SIGINT, nullptr, &after);
        QVERIFY(after.sa_handler == before.sa_handler);
#endif
    }

    void prompt_ReflectsState()
    {
        TerminalSession terminal(session, config, in, out);
        QCOMPARE(terminal.prompt(), QString("rax-ftp-client (disconnected)> "));
    }
};

QTEST_MAIN(TestTerminalSession)
#include "test_terminalsession.moc"
