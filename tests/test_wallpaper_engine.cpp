#include <gtest/gtest.h>
#include <QCoreApplication>
#include <QElapsedTimer>
#include <QObject>
#include <QUrl>
#include "core/WallpaperEngine.h"
#include "TestSupport.h"

class WallpaperEngineTest : public ConfigFixture
{
protected:
    void SetUp() override
    {
        ConfigFixture::SetUp();
        m_log = std::make_shared<SurfaceLog>();
        m_delays = std::make_shared<QList<int>>();
        m_tasks = std::make_shared<QList<std::function<void()>>>();
    }

    std::unique_ptr<WallpaperEngine> makeEngine(bool failingFactory = false)
    {
        return std::make_unique<WallpaperEngine>(&m_displays,
                                                 std::make_unique<FakeSurfaceFactory>(m_log, failingFactory),
                                                 std::make_unique<ManualScheduler>(m_delays, m_tasks));
    }

    static QUrl video(const QString& name)
    {
        return QUrl::fromLocalFile("/videos/" + name);
    }

    FakeDisplayProvider m_displays;
    std::shared_ptr<SurfaceLog> m_log;
    std::shared_ptr<QList<int>> m_delays;
    std::shared_ptr<QList<std::function<void()>>> m_tasks;
};

TEST_F(WallpaperEngineTest, StartRunsSurface)
{
    auto engine = makeEngine();
    ScreenDescriptor screen = makeScreen("1");

    QStringList started;
    QObject::connect(engine.get(), &WallpaperEngine::wallpaperStarted,
                     [&started](const QString& key) { started << key; });

    EXPECT_TRUE(engine->start(video("sea.mp4"), screen));
    EXPECT_TRUE(engine->isRunning(screen));
    EXPECT_TRUE(engine->isRunning("screen_1"));
    EXPECT_EQ(engine->sourceFor("screen_1"), video("sea.mp4"));
    EXPECT_EQ(m_log->events, QStringList({"play:screen_1:sea.mp4"}));
    EXPECT_EQ(started, QStringList({"screen_1"}));
}

TEST_F(WallpaperEngineTest, RestartReplacesPreviousSurface)
{
    auto engine = makeEngine();
    ScreenDescriptor screen = makeScreen("1");

    ASSERT_TRUE(engine->start(video("a.mp4"), screen));
    ASSERT_TRUE(engine->start(video("b.mp4"), screen));

    EXPECT_EQ(m_log->alive, 1);
    EXPECT_EQ(engine->activeScreenKeys(), QStringList({"screen_1"}));
    EXPECT_EQ(engine->sourceFor("screen_1"), video("b.mp4"));
    EXPECT_EQ(m_log->events, QStringList({
        "play:screen_1:a.mp4",
        "stop:screen_1",
        "destroy:screen_1",
        "play:screen_1:b.mp4"
    }));
}

TEST_F(WallpaperEngineTest, StopReleasesSurface)
{
    auto engine = makeEngine();
    ScreenDescriptor screen = makeScreen("1");
    ASSERT_TRUE(engine->start(video("sea.mp4"), screen));

    QStringList stopped;
    QObject::connect(engine.get(), &WallpaperEngine::wallpaperStopped,
                     [&stopped](const QString& key) { stopped << key; });

    engine->stop(screen);

    EXPECT_FALSE(engine->isRunning(screen));
    EXPECT_EQ(m_log->alive, 0);
    EXPECT_EQ(stopped, QStringList({"screen_1"}));
}

TEST_F(WallpaperEngineTest, StopUnknownScreenIsNoOp)
{
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(video("sea.mp4"), makeScreen("1")));

    int stopped = 0;
    QObject::connect(engine.get(), &WallpaperEngine::wallpaperStopped, [&stopped]() { ++stopped; });

    engine->stop(makeScreen("2"));
    engine->stop(QString("screen_nothing"));

    EXPECT_EQ(stopped, 0);
    EXPECT_TRUE(engine->isRunning("screen_1"));
}

TEST_F(WallpaperEngineTest, StopAllAndDestructorReleaseEverything)
{
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(video("a.mp4"), makeScreen("1")));
    ASSERT_TRUE(engine->start(video("b.mp4"), makeScreen("2", QRect(1920, 0, 1920, 1080))));
    ASSERT_EQ(m_log->alive, 2);

    engine->stopAll();
    EXPECT_TRUE(engine->activeScreenKeys().isEmpty());
    EXPECT_EQ(m_log->alive, 0);

    ASSERT_TRUE(engine->start(video("a.mp4"), makeScreen("1")));
    engine.reset();
    EXPECT_EQ(m_log->alive, 0);
}

TEST_F(WallpaperEngineTest, RejectsRemoteSource)
{
    auto engine = makeEngine();

    EXPECT_FALSE(engine->start(QUrl("https://example.com/sea.mp4"), makeScreen("1")));
    EXPECT_FALSE(engine->isRunning("screen_1"));
    EXPECT_EQ(m_log->created, 0);
}

TEST_F(WallpaperEngineTest, FactoryFailureLeavesScreenIdle)
{
    auto engine = makeEngine(true);

    int started = 0;
    QObject::connect(engine.get(), &WallpaperEngine::wallpaperStarted, [&started]() { ++started; });

    EXPECT_FALSE(engine->start(video("sea.mp4"), makeScreen("1")));
    EXPECT_FALSE(engine->isRunning("screen_1"));
    EXPECT_EQ(started, 0);
}

TEST_F(WallpaperEngineTest, PrimaryScreenFrameExcludesTopPanel)
{
    auto engine = makeEngine();
    ScreenDescriptor primary = makeScreen("1", QRect(0, 0, 1920, 1080), true);
    primary.availableGeometry = QRect(0, 32, 1920, 1048);

    ASSERT_TRUE(engine->start(video("sea.mp4"), primary));
    EXPECT_EQ(m_log->frames.value("screen_1"), QRect(0, 32, 1920, 1048));
}

TEST_F(WallpaperEngineTest, VolumeAppliesToAllAndPersists)
{
    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(video("a.mp4"), makeScreen("1")));
    ASSERT_TRUE(engine->start(video("b.mp4"), makeScreen("2", QRect(1920, 0, 1920, 1080))));

    QList<double> changes;
    QObject::connect(engine.get(), &WallpaperEngine::volumeChanged,
                     [&changes](double volume) { changes << volume; });

    engine->setVolume(0.4);

    EXPECT_DOUBLE_EQ(engine->volume(), 0.4);
    EXPECT_DOUBLE_EQ(m_log->volumes.value("screen_1"), 0.4);
    EXPECT_DOUBLE_EQ(m_log->volumes.value("screen_2"), 0.4);
    EXPECT_TRUE(ConfigManager::instance().hasVideoVolume());
    EXPECT_DOUBLE_EQ(ConfigManager::instance().videoVolume(), 0.4);

    // Same value again does not notify
    engine->setVolume(0.4);
    ASSERT_EQ(changes.size(), 1);
    EXPECT_DOUBLE_EQ(changes.first(), 0.4);
}

TEST_F(WallpaperEngineTest, VolumeIsClamped)
{
    auto engine = makeEngine();

    engine->setVolume(1.7);
    EXPECT_DOUBLE_EQ(engine->volume(), 1.0);

    engine->setVolume(-0.5);
    EXPECT_DOUBLE_EQ(engine->volume(), 0.0);
}

TEST_F(WallpaperEngineTest, NewSurfacesUseCurrentVolume)
{
    auto engine = makeEngine();
    engine->setVolume(0.25);

    ASSERT_TRUE(engine->start(video("sea.mp4"), makeScreen("1")));
    EXPECT_DOUBLE_EQ(m_log->volumes.value("screen_1"), 0.25);
}

TEST_F(WallpaperEngineTest, StoredVolumeIsRestored)
{
    EXPECT_DOUBLE_EQ(makeEngine()->volume(), 1.0);

    ConfigManager::instance().setVideoVolume(0.0);
    EXPECT_DOUBLE_EQ(makeEngine()->volume(), 0.0);

    ConfigManager::instance().setVideoVolume(0.6);
    EXPECT_DOUBLE_EQ(makeEngine()->volume(), 0.6);
}

TEST_F(WallpaperEngineTest, ScreenChangeReappliesAfterSettling)
{
    ScreenDescriptor first = makeScreen("1");
    ScreenDescriptor second = makeScreen("2", QRect(1920, 0, 1920, 1080));
    m_displays.setScreens({first, second});

    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(video("a.mp4"), first));
    ASSERT_TRUE(engine->start(video("b.mp4"), second));

    int reapplied = 0;
    QObject::connect(engine.get(), &WallpaperEngine::reapplied, [&reapplied]() { ++reapplied; });

    m_displays.setScreens({first});
    emit m_displays.screensChanged();

    // Nothing happens until the settle delay elapses
    EXPECT_EQ(*m_delays, QList<int>({WallpaperEngine::ScreenChangeSettleMs}));
    EXPECT_TRUE(engine->isRunning("screen_2"));

    runPending(*m_tasks);

    EXPECT_TRUE(engine->isRunning("screen_1"));
    EXPECT_FALSE(engine->isRunning("screen_2"));
    EXPECT_EQ(engine->sourceFor("screen_1"), video("a.mp4"));
    EXPECT_EQ(m_log->alive, 1);
    EXPECT_EQ(reapplied, 1);
}

TEST_F(WallpaperEngineTest, ResumeRebuildsEverySurface)
{
    ScreenDescriptor screen = makeScreen("1");
    m_displays.setScreens({screen});

    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(video("sea.mp4"), screen));
    ASSERT_EQ(m_log->created, 1);

    emit m_displays.systemResumed();
    EXPECT_EQ(*m_delays, QList<int>({WallpaperEngine::WakeSettleMs}));

    runPending(*m_tasks);

    EXPECT_TRUE(engine->isRunning("screen_1"));
    EXPECT_EQ(m_log->created, 2);
    EXPECT_EQ(m_log->alive, 1);
}

TEST_F(WallpaperEngineTest, ReapplyFollowsMovedScreenByHardwareId)
{
    ScreenDescriptor screen = makeScreen("1", QRect(0, 0, 1920, 1080));
    m_displays.setScreens({screen});

    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(video("sea.mp4"), screen));

    ScreenDescriptor moved = makeScreen("1", QRect(2560, 0, 1920, 1080));
    m_displays.setScreens({moved});
    engine->reapply();

    ASSERT_TRUE(engine->isRunning("screen_1"));
    EXPECT_EQ(m_log->frames.value("screen_1"), QRect(2560, 0, 1920, 1080));
}

TEST_F(WallpaperEngineTest, RepeatedNotificationsSettleToOneWallpaper)
{
    ScreenDescriptor screen = makeScreen("1");
    m_displays.setScreens({screen});

    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(video("sea.mp4"), screen));

    emit m_displays.screensChanged();
    emit m_displays.screensChanged();
    emit m_displays.systemResumed();

    EXPECT_EQ(*m_delays, QList<int>({WallpaperEngine::ScreenChangeSettleMs,
                                     WallpaperEngine::ScreenChangeSettleMs,
                                     WallpaperEngine::WakeSettleMs}));

    runPending(*m_tasks);

    EXPECT_EQ(engine->activeScreenKeys(), QStringList({"screen_1"}));
    EXPECT_EQ(engine->sourceFor("screen_1"), video("sea.mp4"));
    EXPECT_EQ(m_log->alive, 1);
    EXPECT_EQ(m_log->created, 4);
}

TEST_F(WallpaperEngineTest, GeometryKeyedScreenSurvivesUnchangedMode)
{
    ScreenDescriptor screen = makeScreen(QString(), QRect(0, 0, 1920, 1080));
    m_displays.setScreens({screen});

    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(video("sea.mp4"), screen));
    ASSERT_TRUE(engine->isRunning("1920x1080_0_0"));

    emit m_displays.screensChanged();
    runPending(*m_tasks);

    EXPECT_TRUE(engine->isRunning("1920x1080_0_0"));
    EXPECT_EQ(engine->sourceFor("1920x1080_0_0"), video("sea.mp4"));
    EXPECT_EQ(m_log->alive, 1);
}

TEST_F(WallpaperEngineTest, GeometryKeyedScreenDroppedWhenModeChanges)
{
    ScreenDescriptor screen = makeScreen(QString(), QRect(0, 0, 1920, 1080));
    m_displays.setScreens({screen});

    auto engine = makeEngine();
    ASSERT_TRUE(engine->start(video("sea.mp4"), screen));

    m_displays.setScreens({makeScreen(QString(), QRect(0, 0, 2560, 1440))});
    emit m_displays.screensChanged();
    runPending(*m_tasks);

    EXPECT_FALSE(engine->isRunning("1920x1080_0_0"));
    EXPECT_FALSE(engine->isRunning("2560x1440_0_0"));
    EXPECT_EQ(m_log->alive, 0);
}

TEST_F(WallpaperEngineTest, ScreensSharingSerialKeepTheirOwnSurfaces)
{
    m_displays.setScreens({
        makeScreen("0", QRect(0, 0, 1920, 1080), true, "DP-1"),
        makeScreen("0", QRect(1920, 0, 1920, 1080), false, "DP-2")
    });

    auto engine = makeEngine();
    QList<ScreenDescriptor> screens = m_displays.screens();
    ASSERT_TRUE(engine->start(video("a.mp4"), screens.at(0)));
    ASSERT_TRUE(engine->start(video("b.mp4"), screens.at(1)));
    ASSERT_EQ(m_log->alive, 2);

    engine->reapply();

    EXPECT_EQ(engine->sourceFor("screen_0_DP-1"), video("a.mp4"));
    EXPECT_EQ(engine->sourceFor("screen_0_DP-2"), video("b.mp4"));
    EXPECT_EQ(m_log->alive, 2);
}

TEST(QtOneShotSchedulerTest, RunsTaskOnEventLoop)
{
    QObject context;
    QtOneShotScheduler scheduler(&context);

    bool ran = false;
    scheduler.schedule(0, [&ran]() { ran = true; });
    EXPECT_FALSE(ran);

    QElapsedTimer timer;
    timer.start();
    while (!ran && timer.elapsed() < 2000) {
        QCoreApplication::processEvents(QEventLoop::AllEvents, 50);
    }
    EXPECT_TRUE(ran);
}

TEST(QtOneShotSchedulerTest, DropsTaskWhenContextIsGone)
{
    bool ran = false;
    {
        QObject context;
        QtOneShotScheduler scheduler(&context);
        scheduler.schedule(0, [&ran]() { ran = true; });
    }

    QCoreApplication::processEvents();
    EXPECT_FALSE(ran);
}
