// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QTest>

#include "core/desktoppathcodec.h"

using namespace LaunchDock;

namespace {
const QString Scratch = QStringLiteral("/home/u/.config/launchdock/scratch");
const QString UserApps = QStringLiteral("/home/u/.local/share/applications");
}

/**
 * @brief Unit tests for DesktopPathCodec
 *
 * Tests cover:
 * - Encoding of every known root
 * - Verbatim storage of unknown paths
 * - Decoding against a different home directory
 */
class TestDesktopPathCodec : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void testZip_data()
    {
        QTest::addColumn<QString>("path");
        QTest::addColumn<QString>("encoded");

        QTest::newRow("scratch window launcher")
            << Scratch + QStringLiteral("/w:1a2b.desktop") << QStringLiteral("/D@w:1a2b");
        QTest::newRow("scratch copy") << Scratch + QStringLiteral("/d:ff00.desktop") << QStringLiteral("/D@d:ff00");
        QTest::newRow("user applications")
            << UserApps + QStringLiteral("/foo.desktop") << QStringLiteral("/H@foo");
        QTest::newRow("user applications subdir")
            << UserApps + QStringLiteral("/wine/bar.desktop") << QStringLiteral("/H@wine/bar");
        QTest::newRow("system applications")
            << QStringLiteral("/usr/share/applications/org.kde.kate.desktop") << QStringLiteral("/S@org.kde.kate");
        QTest::newRow("local applications")
            << QStringLiteral("/usr/local/share/applications/tool.desktop") << QStringLiteral("/L@tool");
        QTest::newRow("unknown root")
            << QStringLiteral("/opt/app/app.desktop") << QStringLiteral("/opt/app/app.desktop");
        QTest::newRow("known root without suffix")
            << QStringLiteral("/usr/share/applications/foo") << QStringLiteral("/usr/share/applications/foo");
        QTest::newRow("scratch script")
            << Scratch + QStringLiteral("/w:1a2b.sh") << QString(Scratch + QStringLiteral("/w:1a2b.sh"));
    }

    void testZip()
    {
        QFETCH(QString, path);
        QFETCH(QString, encoded);

        DesktopPathCodec codec(Scratch, UserApps);
        QCOMPARE(codec.zip(path), encoded);
    }

    void testUnzip_restoresPath()
    {
        DesktopPathCodec codec(Scratch, UserApps);
        QCOMPARE(codec.unzip(QStringLiteral("/D@w:1a2b")), Scratch + QStringLiteral("/w:1a2b.desktop"));
        QCOMPARE(codec.unzip(QStringLiteral("/S@org.kde.kate")),
                 QStringLiteral("/usr/share/applications/org.kde.kate.desktop"));
        QCOMPARE(codec.unzip(QStringLiteral("/L@tool")), QStringLiteral("/usr/local/share/applications/tool.desktop"));
        QCOMPARE(codec.unzip(QStringLiteral("/opt/app/app.desktop")), QStringLiteral("/opt/app/app.desktop"));
    }

    void testZip_restoresSameFile_data()
    {
        QTest::addColumn<QString>("path");

        QTest::newRow("scratch launcher") << QString(Scratch + QStringLiteral("/d:ff00.desktop"));
        QTest::newRow("system launcher") << QStringLiteral("/usr/share/applications/org.kde.kate.desktop");
        QTest::newRow("system file without suffix") << QStringLiteral("/usr/share/applications/foo");
        QTest::newRow("user file without suffix") << QString(UserApps + QStringLiteral("/bar"));
        QTest::newRow("unknown root") << QStringLiteral("/opt/app/app.desktop");
    }

    void testZip_restoresSameFile()
    {
        QFETCH(QString, path);

        DesktopPathCodec codec(Scratch, UserApps);
        QCOMPARE(codec.unzip(codec.zip(path)), path);
    }

    void testUnzip_differentHome()
    {
        DesktopPathCodec oldSession(Scratch, UserApps);
        DesktopPathCodec newSession(QStringLiteral("/var/home/u/.config/launchdock/scratch"),
                                    QStringLiteral("/var/home/u/.local/share/applications"));

        const QString encoded = oldSession.zip(UserApps + QStringLiteral("/foo.desktop"));
        QCOMPARE(newSession.unzip(encoded), QStringLiteral("/var/home/u/.local/share/applications/foo.desktop"));
    }

    void testZip_scratchPreferredOverUserRoot()
    {
        // Scratch directory nested below the user applications directory
        const QString nestedScratch = UserApps + QStringLiteral("/scratch");
        DesktopPathCodec codec(nestedScratch, UserApps);
        QCOMPARE(codec.zip(nestedScratch + QStringLiteral("/w:1.desktop")), QStringLiteral("/D@w:1"));
    }
};

QTEST_MAIN(TestDesktopPathCodec)
#include "test_desktop_path_codec.moc"
