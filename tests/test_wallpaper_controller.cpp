#include <gtest/gtest.h>
#include <QJsonDocument>
#include <QJsonObject>
#include "core/SettingsStore.h"
#include "core/WallpaperEngine.h"
#include "core/WallpaperController.h"
#include "TestSupport.h"

class WallpaperControllerTest : public ConfigFixture
{
protected:
    void SetUp() override
    {
        ConfigFixture::SetUp();
        m_log = std::make_shared<SurfaceLog>();
        m_screen = makeScreen("1");
        m_displays.setScreens({m_screen});
    }

    // Builds the store and engine after the config blobs have been written
    void createController()
    {
        m_store = std::make_unique<SettingsStore>();
        m_store->load();
        m_engine = std::make_unique<WallpaperEngine>(&m_displays,
                                                     std::make_unique<FakeSurfaceFactory>(m_log),
                                                     std::make_unique<ManualScheduler>(
                                                         std::make_shared<QList<int>>(),
                                                         std::make_shared<QList<std::function<void()>>>()));
        m_controller = std::make_unique<WallpaperController>(m_store.get(), m_engine.get(), &m_displays);
    }

    void writeConfig(const QList<VideoFile>& library, const QMap<QString, ScreenSettings>& settings)
    {
        ConfigManager& config = ConfigManager::instance();
        config.setVideoLibraryData(QJsonDocument(SettingsStore::libraryToJson(library)).toJson(QJsonDocument::Compact));
        config.setScreenSettingsData(QJsonDocument(SettingsStore::screenSettingsToJson(settings)).toJson(QJsonDocument::Compact));
        config.sync();
    }

    FakeDisplayProvider m_displays;
    ScreenDescriptor m_screen;
    std::shared_ptr<SurfaceLog> m_log;
    std::unique_ptr<SettingsStore> m_store;
    std::unique_ptr<WallpaperEngine> m_engine;
    std::unique_ptr<WallpaperController> m_controller;
};

TEST_F(WallpaperControllerTest, StartupPlaysEnabledScreen)
{
    QString path = createVideo("sea.mp4");
    writeConfig({{"A", "sea.mp4", path}}, {{"screen_1", {QString("A"), true}}});
    createController();

    m_controller->applyAll();

    EXPECT_TRUE(m_engine->isRunning("screen_1"));
    EXPECT_EQ(m_engine->sourceFor("screen_1"), QUrl::fromLocalFile(path));
    EXPECT_TRUE(m_controller->isActive(m_screen));
}

TEST_F(WallpaperControllerTest, StartupSkipsDisabledOrMissing)
{
    ScreenDescriptor second = makeScreen("2", QRect(1920, 0, 1920, 1080));
    m_displays.setScreens({m_screen, second});

    QString path = createVideo("sea.mp4");
    writeConfig({{"A", "sea.mp4", path}},
                {{"screen_1", {QString("A"), false}},
                 {"screen_2", {QString("gone"), true}}});
    createController();

    m_controller->applyAll();

    EXPECT_FALSE(m_engine->isRunning("screen_1"));
    EXPECT_FALSE(m_engine->isRunning("screen_2"));
    EXPECT_EQ(m_log->created, 0);
}

TEST_F(WallpaperControllerTest, ScreensSharingSerialPlayIndependently)
{
    ScreenDescriptor left = makeScreen("0", QRect(0, 0, 1920, 1080), true, "DP-1");
    ScreenDescriptor right = makeScreen("0", QRect(1920, 0, 1920, 1080), false, "DP-2");
    m_displays.setScreens({left, right});

    QString path = createVideo("sea.mp4");
    writeConfig({{"A", "sea.mp4", path}},
                {{"screen_0_DP-1", {QString("A"), true}},
                 {"screen_0_DP-2", {QString("A"), true}}});
    createController();

    QList<ScreenDescriptor> screens = m_displays.screens();
    ASSERT_EQ(screens.size(), 2);
    EXPECT_NE(ScreenIdentity::keyFor(screens.at(0)), ScreenIdentity::keyFor(screens.at(1)));

    m_controller->applyAll();

    EXPECT_TRUE(m_engine->isRunning("screen_0_DP-1"));
    EXPECT_TRUE(m_engine->isRunning("screen_0_DP-2"));
    EXPECT_EQ(m_log->alive, 2);

    m_controller->setEnabled(screens.at(0), false);
    EXPECT_FALSE(m_engine->isRunning("screen_0_DP-1"));
    EXPECT_TRUE(m_engine->isRunning("screen_0_DP-2"));
}

TEST_F(WallpaperControllerTest, ToggleStartsAndStops)
{
    createController();
    ASSERT_EQ(m_controller->addVideos({createVideo("sea.mp4")}), 1);
    QString videoId = m_store->library().first().id;

    m_controller->selectVideo(m_screen, videoId);
    EXPECT_FALSE(m_engine->isRunning(m_screen));

    m_controller->setEnabled(m_screen, true);
    EXPECT_TRUE(m_engine->isRunning(m_screen));
    EXPECT_TRUE(m_store->getSettings("screen_1").isEnabled);

    m_controller->setEnabled(m_screen, false);
    EXPECT_FALSE(m_engine->isRunning(m_screen));
    EXPECT_FALSE(m_store->getSettings("screen_1").isEnabled);
    EXPECT_EQ(m_store->getSettings("screen_1").videoFileId, std::optional<QString>(videoId));
}

TEST_F(WallpaperControllerTest, EnableWithoutVideoStaysIdle)
{
    createController();

    m_controller->setEnabled(m_screen, true);

    EXPECT_TRUE(m_store->getSettings("screen_1").isEnabled);
    EXPECT_FALSE(m_engine->isRunning(m_screen));
    EXPECT_FALSE(m_controller->isActive(m_screen));
}

TEST_F(WallpaperControllerTest, SelectingVideoOnEnabledScreenSwitchesPlayback)
{
    createController();
    m_controller->addVideos({createVideo("a.mp4"), createVideo("b.mp4")});
    QString first = m_store->library().at(0).id;
    QString second = m_store->library().at(1).id;

    m_controller->selectVideo(m_screen, first);
    m_controller->setEnabled(m_screen, true);
    ASSERT_EQ(m_engine->sourceFor("screen_1").fileName(), QString("a.mp4"));

    m_controller->selectVideo(m_screen, second);
    EXPECT_EQ(m_engine->sourceFor("screen_1").fileName(), QString("b.mp4"));
    EXPECT_EQ(m_log->alive, 1);

    m_controller->selectVideo(m_screen, std::nullopt);
    EXPECT_FALSE(m_engine->isRunning(m_screen));
}

TEST_F(WallpaperControllerTest, AddVideosCountsOnlyNewPaths)
{
    createController();
    QString path = createVideo("sea.mp4");

    EXPECT_EQ(m_controller->addVideos({path, path}), 1);
    EXPECT_EQ(m_controller->addVideos({path}), 0);
    EXPECT_EQ(m_store->library().size(), 1);
}

TEST_F(WallpaperControllerTest, RemovingPlayingVideoStopsScreen)
{
    createController();
    m_controller->addVideos({createVideo("sea.mp4")});
    QString videoId = m_store->library().first().id;
    m_controller->selectVideo(m_screen, videoId);
    m_controller->setEnabled(m_screen, true);
    ASSERT_TRUE(m_engine->isRunning(m_screen));

    m_controller->removeVideo(videoId);

    EXPECT_FALSE(m_engine->isRunning(m_screen));
    EXPECT_EQ(m_log->alive, 0);
    EXPECT_EQ(m_store->getSettings("screen_1"), ScreenSettings());
    EXPECT_TRUE(m_store->library().isEmpty());
}

TEST_F(WallpaperControllerTest, DisableAllTurnsScreensOffForNextLaunch)
{
    ScreenDescriptor second = makeScreen("2", QRect(1920, 0, 1920, 1080));
    m_displays.setScreens({m_screen, second});

    QString path = createVideo("sea.mp4");
    writeConfig({{"A", "sea.mp4", path}},
                {{"screen_1", {QString("A"), true}},
                 {"screen_2", {QString("A"), true}}});
    createController();
    m_controller->applyAll();
    ASSERT_EQ(m_log->alive, 2);

    m_controller->disableAll();

    EXPECT_TRUE(m_engine->activeScreenKeys().isEmpty());
    EXPECT_EQ(m_log->alive, 0);
    EXPECT_FALSE(m_store->getSettings("screen_1").isEnabled);
    EXPECT_EQ(m_store->getSettings("screen_1").videoFileId, std::optional<QString>("A"));

    // A fresh start from the saved settings plays nothing
    SettingsStore reloaded;
    reloaded.load();
    EXPECT_FALSE(reloaded.getSettings("screen_1").isEnabled);
    EXPECT_FALSE(reloaded.getSettings("screen_2").isEnabled);
}
