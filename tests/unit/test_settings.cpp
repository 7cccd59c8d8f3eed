// SPDX-FileCopyrightText: 2026 fuddlesworth
// SPDX-License-Identifier: GPL-3.0-or-later

#include <QSignalSpy>
#include <QStandardPaths>
#include <QTemporaryDir>
#include <QTest>

#include <KConfig>
#include <KConfigGroup>

#include "config/settings.h"
#include "core/constants.h"

using namespace LaunchDock;

/**
 * @brief Unit tests for Settings (launchdockrc [General])
 */
class TestSettings : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void initTestCase()
    {
        QStandardPaths::setTestModeEnabled(true);
    }

    void init()
    {
        m_tempDir = std::make_unique<QTemporaryDir>();
        QVERIFY(m_tempDir->isValid());
        m_configPath = m_tempDir->filePath(QStringLiteral("launchdockrc"));
    }

    void cleanup()
    {
        m_tempDir.reset();
    }

    void testDefaultScratchDirectory()
    {
        Settings settings(m_configPath);
        const QString expected = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation)
            + QStringLiteral("/launchdock/scratch");
        QCOMPARE(Settings::defaultScratchDirectory(), expected);
        QCOMPARE(settings.scratchDirectory(), expected);
        QVERIFY(settings.configuredScratchDirectory().isEmpty());
        QCOMPARE(settings.configName(), m_configPath);
    }

    void testSetScratchDirectory_emitsOnChange()
    {
        Settings settings(m_configPath);
        QSignalSpy dirSpy(&settings, &Settings::scratchDirectoryChanged);
        QSignalSpy settingsSpy(&settings, &Settings::settingsChanged);

        settings.setScratchDirectory(QStringLiteral("/tmp/dock//scratch/"));
        QCOMPARE(settings.scratchDirectory(), QStringLiteral("/tmp/dock/scratch"));
        QCOMPARE(dirSpy.count(), 1);
        QCOMPARE(settingsSpy.count(), 1);

        // Same value after cleaning
        settings.setScratchDirectory(QStringLiteral("/tmp/dock/scratch"));
        QCOMPARE(dirSpy.count(), 1);
    }

    void testSetScratchDirectory_rejectsRelativePath()
    {
        const QString scratch = m_tempDir->filePath(QStringLiteral("custom"));
        Settings settings(m_configPath);
        settings.setScratchDirectory(scratch);

        QSignalSpy settingsSpy(&settings, &Settings::settingsChanged);
        settings.setScratchDirectory(QStringLiteral("relative/scratch"));
        QCOMPARE(settingsSpy.count(), 0);
        QCOMPARE(settings.scratchDirectory(), scratch);

        // What was kept is what the next start sees
        settings.save();
        Settings reloaded(m_configPath);
        QCOMPARE(reloaded.scratchDirectory(), scratch);
    }

    void testSaveAndReload()
    {
        const QString scratch = m_tempDir->filePath(QStringLiteral("custom"));
        {
            Settings settings(m_configPath);
            settings.setScratchDirectory(scratch);
            settings.save();
        }

        Settings reloaded(m_configPath);
        QCOMPARE(reloaded.scratchDirectory(), scratch);
        QCOMPARE(reloaded.configuredScratchDirectory(), scratch);

        KConfig config(m_configPath, KConfig::SimpleConfig);
        QCOMPARE(config.group(QString(ConfigKeys::GeneralGroup))
                     .readEntry(QString(ConfigKeys::ScratchDirectory), QString()),
                 scratch);
    }

    void testSave_clearedValueRemovesEntry()
    {
        Settings settings(m_configPath);
        settings.setScratchDirectory(m_tempDir->filePath(QStringLiteral("custom")));
        settings.save();
        settings.setScratchDirectory(QString());
        settings.save();

        KConfig config(m_configPath, KConfig::SimpleConfig);
        QVERIFY(!config.group(QString(ConfigKeys::GeneralGroup)).hasKey(QString(ConfigKeys::ScratchDirectory)));
        QCOMPARE(settings.scratchDirectory(), Settings::defaultScratchDirectory());
    }

    void testLoad_ignoresRelativePath()
    {
        {
            KConfig config(m_configPath, KConfig::SimpleConfig);
            KConfigGroup general = config.group(QString(ConfigKeys::GeneralGroup));
            general.writeEntry(QString(ConfigKeys::ScratchDirectory), QStringLiteral("relative/scratch"));
            QVERIFY(config.sync());
        }

        Settings settings(m_configPath);
        QVERIFY(settings.configuredScratchDirectory().isEmpty());
        QCOMPARE(settings.scratchDirectory(), Settings::defaultScratchDirectory());
    }

    void testReset()
    {
        Settings settings(m_configPath);
        settings.setScratchDirectory(m_tempDir->filePath(QStringLiteral("custom")));
        settings.save();

        QSignalSpy settingsSpy(&settings, &Settings::settingsChanged);
        settings.reset();

        QCOMPARE(settingsSpy.count(), 1);
        QCOMPARE(settings.scratchDirectory(), Settings::defaultScratchDirectory());

        Settings reloaded(m_configPath);
        QVERIFY(reloaded.configuredScratchDirectory().isEmpty());
    }

private:
    std::unique_ptr<QTemporaryDir> m_tempDir;
    QString m_configPath;
};

QTEST_MAIN(TestSettings)
#include "test_settings.moc"
