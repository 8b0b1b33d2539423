/**
 * @file test_ftpreply.cpp
 * @brief Unit tests for FtpReply and FtpReplyParser.
 *
 * Tests verify:
 * - Single-line and bare-code replies
 * - Multi-line replies terminated only by "<code> "
 * - Replies split across several reads
 * - Several replies buffered at once
 * - Malformed lines are reported and dropped
 * - Reply class classification
 */

#include <QtTest>

#include "services/ftpreply.h"

class TestFtpReply : public QObject
{
    Q_OBJECT

private:
    FtpReplyParser parser;

private slots:
    void init()
    {
        parser.reset();
    }

    // === Single-line replies ===

    void singleLine_CodeAndText()
    {
        parser.feed("220 RAX FTP server ready\r\n");

        FtpReply reply;
        QCOMPARE(parser.next(&reply), FtpReplyParser::Status::Complete);
        QCOMPARE(reply.code, 220);
        QCOMPARE(reply.message, QString("RAX FTP server ready"));
        QVERIFY(reply.isFinal);
        QVERIFY(!parser.hasPartialReply());
    }

    void singleLine_BareLfAccepted()
    {
        parser.feed("331 Password required\n");

        FtpReply reply;
        QCOMPARE(parser.next(&reply), FtpReplyParser::Status::Complete);
        QCOMPARE(reply.code, 331);
        QCOMPARE(reply.message, QString("Password required"));
    }

    void singleLine_CodeOnly()
    {
        parser.feed("200\r\n");

        FtpReply reply;
        QCOMPARE(parser.next(&reply), FtpReplyParser::Status::Complete);
        QCOMPARE(reply.code, 200);
        QVERIFY(reply.message.isEmpty());
        QCOMPARE(reply.toString(), QString("200"));
    }

    // === Multi-line replies ===

    void multiLine_FoldedIntoOneReply()
    {
        parser.feed("230-Welcome\r\n230-Enjoy your stay\r\n230 Logged in\r\n");

        FtpReply reply;
        QCOMPARE(parser.next(&reply), FtpReplyParser::Status::Complete);
        QCOMPARE(reply.code, 230);
        QCOMPARE(reply.message, QString("Welcome\nEnjoy your stay\nLogged in"));
    }

    void multiLine_ForeignCodesAreText()
    {
        parser.feed("211-Status\r\n 150 not a reply\r\n226 also text\r\n211 End\r\n");

        FtpReply reply;
        QCOMPARE(parser.next(&reply), FtpReplyParser::Status::Complete);
        QCOMPARE(reply.code, 211);
        QCOMPARE(reply.message, QString("Status\n 150 not a reply\n226 also text\nEnd"));
    }

    void multiLine_IncompleteWaitsForTerminator()
    {
        parser.feed("230-Welcome\r\n");

        FtpReply reply;
        QCOMPARE(parser.next(&reply), FtpReplyParser::Status::NeedMoreData);
        QVERIFY(parser.hasPartialReply());

        parser.feed("230 Logged in\r\n");
        QCOMPARE(parser.next(&reply), FtpReplyParser::Status::Complete);
        QCOMPARE(reply.message, QString("Welcome\nLogged in"));
    }

    // === Buffering ===

    void splitAcrossReads()
    {
        FtpReply reply;
        parser.feed("22");
        QCOMPARE(parser.next(&reply), FtpReplyParser::Status::NeedMoreData);
        parser.feed("7 Entering Passive Mode (127,0,0,1,");
        QCOMPARE(parser.next(&reply), FtpReplyParser::Status::NeedMoreData);
        parser.feed("8,79)\r");
        QCOMPARE(parser.next(&reply), FtpReplyParser::Status::NeedMoreData);
        parser.feed("\n");

        QCOMPARE(parser.next(&reply), FtpReplyParser::Status::Complete);
        QCOMPARE(reply.code, 227);
        QCOMPARE(reply.message, QString("Entering Passive Mode (127,0,0,1,8,79)"));
    }

    void severalRepliesInOneRead()
    {
        parser.feed("150 Opening data connection\r\n226 Transfer complete\r\n");

        FtpReply first;
        FtpReply second;
        QCOMPARE(parser.next(&first), FtpReplyParser::Status::Complete);
        QCOMPARE(parser.next(&second), FtpReplyParser::Status::Complete);
        QCOMPARE(first.code, 150);
        QCOMPARE(second.code, 226);

        FtpReply none;
        QCOMPARE(parser.next(&none), FtpReplyParser::Status::NeedMoreData);
    }

    // === Malformed input ===

    void malformed_NoCode()
    {
        parser.feed("hello there\r\n220 Ready\r\n");

        FtpReply reply;
        QCOMPARE(parser.next(&reply), FtpReplyParser::Status::Malformed);
        QVERIFY(parser.errorString().contains("hello there"));

        // The bad line is dropped, the next reply is still readable
        QCOMPARE(parser.next(&reply), FtpReplyParser::Status::Complete);
        QCOMPARE(reply.code, 220);
    }

    void malformed_BadSeparator()
    {
        parser.feed("220xReady\r\n");

        FtpReply reply;
        QCOMPARE(parser.next(&reply), FtpReplyParser::Status::Malformed);
    }

    void malformed_LeadingZero()
    {
        parser.feed("020 Ready\r\n");

        FtpReply reply;
        QCOMPARE(parser.next(&reply), FtpReplyParser::Status::Malformed);
    }

    // === Classification ===

    void replyClass_data()
    {
        QTest::addColumn<int>("code");
        QTest::addColumn<int>("replyClass");

        QTest::newRow("150") << 150 << int(FtpReply::ReplyClass::Preliminary);
        QTest::newRow("226") << 226 << int(FtpReply::ReplyClass::Completion);
        QTest::newRow("331") << 331 << int(FtpReply::ReplyClass::Intermediate);
        QTest::newRow("425") << 425 << int(FtpReply::ReplyClass::TransientNegative);
        QTest::newRow("530") << 530 << int(FtpReply::ReplyClass::PermanentNegative);
        QTest::newRow("600") << 600 << int(FtpReply::ReplyClass::Invalid);
    }

    void replyClass()
    {
        QFETCH(int, code);
        QFETCH(int, replyClass);

        FtpReply reply;
        reply.code = code;
        QCOMPARE(int(reply.replyClass()), replyClass);
    }

    void classPredicates()
    {
        FtpReply reply;
        reply.code = FtpReply::FileStatusOk;
        QVERIFY(reply.isPreliminary());
        QVERIFY(!reply.isSuccess());

        reply.code = FtpReply::PasswordRequired;
        QVERIFY(reply.isIntermediate());

        reply.code = FtpReply::NotLoggedIn;
        QVERIFY(reply.isFailure());
        QVERIFY(!reply.isSuccess());
    }

    void resetDiscardsPartialReply()
    {
        parser.feed("230-Welcome\r\n230-more");
        parser.reset();
        QVERIFY(!parser.hasPartialReply());

        parser.feed("220 Ready\r\n");
        FtpReply reply;
        QCOMPARE(parser.next(&reply), FtpReplyParser::Status::Complete);
        QCOMPARE(reply.code, 220);
    }
};

QTEST_MAIN(TestFtpReply)
#include "test_ftpreply.moc"
