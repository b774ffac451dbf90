#include <gtest/gtest.h>

#include <QSettings>
#include <QTemporaryDir>

#include "deconz_config.h"

using namespace deconzctl;

class ConfigTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        iniPath = dir.filePath(QStringLiteral("deconz-control.ini"));
    }

    void writeIni(const QString &url, const QString &apiKey, int timeoutMs = 10000)
    {
        QSettings s(iniPath, QSettings::IniFormat);
        s.setValue(QStringLiteral("bridge/url"), url);
        s.setValue(QStringLiteral("bridge/apiKey"), apiKey);
        s.setValue(QStringLiteral("bridge/timeoutMs"), timeoutMs);
        s.sync();
    }

    QStringList args(const QStringList &extra) const
    {
        QStringList out{QStringLiteral("deconz-control"), QStringLiteral("--config"), iniPath};
        out.append(extra);
        return out;
    }

    QTemporaryDir dir;
    QString iniPath;
    QProcessEnvironment env;
};

TEST_F(ConfigTest, MissingFileKeepsDefaults)
{
    LaunchOptions options;
    QString error;
    ASSERT_TRUE(resolveLaunchOptions(args({}), env, &options, &error)) << error.toStdString();
    EXPECT_TRUE(options.config.url.isEmpty());
    EXPECT_EQ(options.config.timeoutMs, 10000);
    EXPECT_FALSE(options.config.demo);
    EXPECT_EQ(options.configPath, iniPath);
}

TEST_F(ConfigTest, IniThenEnvironmentThenCommandLine)
{
    writeIni(QStringLiteral("http://ini-host/"), QStringLiteral("INIKEY"), 3000);
    env.insert(QStringLiteral("DECONZ_TOKEN"), QStringLiteral("ENVKEY"));

    LaunchOptions options;
    ASSERT_TRUE(resolveLaunchOptions(args({QStringLiteral("--url"), QStringLiteral("http://cli-host:8080")}),
                                     env, &options));
    EXPECT_EQ(options.config.url, QStringLiteral("http://cli-host:8080"));
    EXPECT_EQ(options.config.apiKey, QStringLiteral("ENVKEY"));
    EXPECT_EQ(options.config.timeoutMs, 3000);
}

TEST_F(ConfigTest, DemoFromEnvironment)
{
    env.insert(QStringLiteral("DECONZ_DEMO"), QStringLiteral("yes"));

    LaunchOptions options;
    ASSERT_TRUE(resolveLaunchOptions(args({}), env, &options));
    EXPECT_TRUE(options.config.demo);
    EXPECT_TRUE(validateConfig(options.config));
}

TEST_F(ConfigTest, FlagsAreRecognized)
{
    LaunchOptions options;
    ASSERT_TRUE(resolveLaunchOptions(args({QStringLiteral("--demo"),
                                           QStringLiteral("--save"),
                                           QStringLiteral("--verbose"),
                                           QStringLiteral("--timeout"),
                                           QStringLiteral("2500")}),
                                     env, &options));
    EXPECT_TRUE(options.config.demo);
    EXPECT_TRUE(options.save);
    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(options.config.timeoutMs, 2500);
    EXPECT_FALSE(options.helpRequested);
}

TEST_F(ConfigTest, BadTimeoutIsRejected)
{
    LaunchOptions options;
    QString error;
    EXPECT_FALSE(resolveLaunchOptions(args({QStringLiteral("--timeout"), QStringLiteral("soon")}),
                                      env, &options, &error));
    EXPECT_TRUE(error.contains(QStringLiteral("soon")));
}

TEST_F(ConfigTest, UnknownOptionIsRejected)
{
    LaunchOptions options;
    QString error;
    EXPECT_FALSE(resolveLaunchOptions(args({QStringLiteral("--bogus")}), env, &options, &error));
    EXPECT_FALSE(error.isEmpty());
}

TEST_F(ConfigTest, SaveRoundTripsBridgeSettings)
{
    AppConfig config;
    config.url = QStringLiteral("http://10.0.0.2/");
    config.apiKey = QStringLiteral("SAVED");
    config.timeoutMs = 4000;

    const QString nested = dir.filePath(QStringLiteral("sub/dir/deconz-control.ini"));
    QString error;
    ASSERT_TRUE(saveConfigFile(nested, config, &error)) << error.toStdString();

    AppConfig loaded;
    ASSERT_TRUE(loadConfigFile(nested, &loaded, &error));
    EXPECT_EQ(loaded.url, config.url);
    EXPECT_EQ(loaded.apiKey, config.apiKey);
    EXPECT_EQ(loaded.timeoutMs, 4000);
    EXPECT_FALSE(loaded.demo);
}

TEST_F(ConfigTest, DemoKeyAcceptsSameWordsAsEnvironment)
{
    const QStringList offWords{QStringLiteral("off"), QStringLiteral("no"),
                               QStringLiteral("false"), QStringLiteral("0")};
    for (const QString &word : offWords) {
        {
            QSettings s(iniPath, QSettings::IniFormat);
            s.setValue(QStringLiteral("app/demo"), word);
            s.sync();
        }

        AppConfig config;
        config.demo = true;
        QString error;
        ASSERT_TRUE(loadConfigFile(iniPath, &config, &error)) << error.toStdString();
        EXPECT_FALSE(config.demo) << word.toStdString();
    }

    {
        QSettings s(iniPath, QSettings::IniFormat);
        s.setValue(QStringLiteral("app/demo"), QStringLiteral("on"));
        s.sync();
    }
    AppConfig config;
    ASSERT_TRUE(loadConfigFile(iniPath, &config));
    EXPECT_TRUE(config.demo);
}

TEST_F(ConfigTest, UnrecognizedDemoValueIsRejected)
{
    {
        QSettings s(iniPath, QSettings::IniFormat);
        s.setValue(QStringLiteral("app/demo"), QStringLiteral("sometimes"));
        s.sync();
    }

    AppConfig config;
    QString error;
    EXPECT_FALSE(loadConfigFile(iniPath, &config, &error));
    EXPECT_TRUE(error.contains(QStringLiteral("app/demo")));
    EXPECT_FALSE(config.demo);
}

TEST(ConfigVerbose, DetectedBeforeParsing)
{
    EXPECT_TRUE(verboseRequested({QStringLiteral("deconz-control"),
                                  QStringLiteral("--url"),
                                  QStringLiteral("http://10.0.0.2"),
                                  QStringLiteral("--verbose")}));
    EXPECT_FALSE(verboseRequested({QStringLiteral("deconz-control"), QStringLiteral("--demo")}));
    EXPECT_FALSE(verboseRequested({QStringLiteral("--verbose")}));
    EXPECT_FALSE(verboseRequested({QStringLiteral("deconz-control"),
                                   QStringLiteral("--"),
                                   QStringLiteral("--verbose")}));
}

TEST(ConfigValidation, BridgeModeNeedsUrlAndKey)
{
    AppConfig config;
    QString error;
    EXPECT_FALSE(validateConfig(config, &error));
    EXPECT_TRUE(error.contains(QStringLiteral("URL")));

    config.url = QStringLiteral("http://10.0.0.2");
    EXPECT_FALSE(validateConfig(config, &error));
    EXPECT_TRUE(error.contains(QStringLiteral("API key")));

    config.apiKey = QStringLiteral("KEY");
    EXPECT_TRUE(validateConfig(config, &error));

    config.timeoutMs = 0;
    EXPECT_FALSE(validateConfig(config, &error));
}

TEST(ConfigValidation, BoolText)
{
    bool value = false;
    EXPECT_TRUE(parseBoolText(QStringLiteral(" ON "), &value));
    EXPECT_TRUE(value);
    EXPECT_TRUE(parseBoolText(QStringLiteral("0"), &value));
    EXPECT_FALSE(value);
    EXPECT_FALSE(parseBoolText(QStringLiteral("maybe"), &value));
}
