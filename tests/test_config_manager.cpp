#include <gtest/gtest.h>
#include <QDir>
#include <QSettings>
#include "core/ConfigManager.h"
#include "TestSupport.h"

class ConfigManagerTest : public ConfigFixture
{
};

TEST_F(ConfigManagerTest, DefaultsOnEmptyFile)
{
    ConfigManager& config = ConfigManager::instance();

    EXPECT_FALSE(config.hasVideoVolume());
    EXPECT_DOUBLE_EQ(config.videoVolume(), 1.0);
    EXPECT_TRUE(config.showTrayWarning());
    EXPECT_TRUE(config.videoLibraryData().isEmpty());
    EXPECT_TRUE(config.windowGeometry().isEmpty());
}

TEST_F(ConfigManagerTest, SyncWritesToRedirectedFile)
{
    ConfigManager& config = ConfigManager::instance();
    EXPECT_EQ(config.configFilePath(), m_tempDir.filePath("config.ini"));
    EXPECT_EQ(config.configDir(), QDir(m_tempDir.path()).absolutePath());

    config.setVideoVolume(0.35);
    config.setShowTrayWarning(false);
    ASSERT_TRUE(config.sync());

    QSettings reread(config.configFilePath(), QSettings::IniFormat);
    EXPECT_DOUBLE_EQ(reread.value("videoVolume").toDouble(), 0.35);
    EXPECT_FALSE(reread.value("ui/showTrayWarning").toBool());
}

TEST_F(ConfigManagerTest, SyncRecoversAfterWriteFailure)
{
    // A directory where the file should be makes every write fail
    QString path = m_tempDir.filePath("blocked/config.ini");
    ASSERT_TRUE(QDir().mkpath(path));

    ConfigManager& config = ConfigManager::instance();
    config.setConfigFile(path);
    config.setVideoVolume(0.3);
    EXPECT_FALSE(config.sync());

    ASSERT_TRUE(QDir().rmdir(path));
    EXPECT_TRUE(config.sync());
    EXPECT_DOUBLE_EQ(config.videoVolume(), 0.3);

    QSettings reread(path, QSettings::IniFormat);
    EXPECT_DOUBLE_EQ(reread.value("videoVolume").toDouble(), 0.3);
}
