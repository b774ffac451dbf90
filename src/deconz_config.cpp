#include "deconz_config.h"

#include <QCommandLineOption>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QStandardPaths>

#include "deconz_log.h"

namespace deconzctl {

namespace Keys {
static const char *kBridgeUrl = "bridge/url";
static const char *kBridgeApiKey = "bridge/apiKey";
static const char *kBridgeTimeoutMs = "bridge/timeoutMs";
static const char *kAppDemo = "app/demo";
} // namespace Keys

namespace {

constexpr const char kConfigFileName[] = "deconz-control.ini";

} // namespace

QString defaultConfigPath()
{
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    if (dir.isEmpty())
        dir = QDir::homePath() + QStringLiteral("/.config/deconz-control");
    return QDir(dir).filePath(QLatin1String(kConfigFileName));
}

bool parseBoolText(const QString &text, bool *value)
{
    const QString normalized = text.trimmed().toLower();
    if (normalized == QLatin1String("1") || normalized == QLatin1String("true")
        || normalized == QLatin1String("yes") || normalized == QLatin1String("on")) {
        *value = true;
        return true;
    }
    if (normalized == QLatin1String("0") || normalized == QLatin1String("false")
        || normalized == QLatin1String("no") || normalized == QLatin1String("off")) {
        *value = false;
        return true;
    }
    return false;
}

bool loadConfigFile(const QString &path, AppConfig *config, QString *error)
{
    if (!QFileInfo::exists(path)) {
        qCDebug(appLog) << "No config file at" << path;
        return true;
    }

    QSettings s(path, QSettings::IniFormat);
    if (s.status() != QSettings::NoError) {
        if (error)
            *error = QStringLiteral("Cannot read config file %1").arg(path);
        return false;
    }

    config->url = s.value(Keys::kBridgeUrl, config->url).toString().trimmed();
    config->apiKey = s.value(Keys::kBridgeApiKey, config->apiKey).toString().trimmed();

    if (s.contains(Keys::kAppDemo)) {
        const QString demoText = s.value(Keys::kAppDemo).toString();
        if (!parseBoolText(demoText, &config->demo)) {
            if (error)
                *error = QStringLiteral("Invalid %1 in %2: %3").arg(QLatin1String(Keys::kAppDemo), path, demoText);
            return false;
        }
    }

    bool ok = false;
    const int timeoutMs = s.value(Keys::kBridgeTimeoutMs, config->timeoutMs).toInt(&ok);
    if (!ok) {
        if (error)
            *error = QStringLiteral("Invalid %1 in %2").arg(QLatin1String(Keys::kBridgeTimeoutMs), path);
        return false;
    }
    config->timeoutMs = timeoutMs;

    qCDebug(appLog) << "Loaded config file" << path;
    return true;
}

bool saveConfigFile(const QString &path, const AppConfig &config, QString *error)
{
    const QFileInfo info(path);
    if (!QDir().mkpath(info.absolutePath())) {
        if (error)
            *error = QStringLiteral("Cannot create directory %1").arg(info.absolutePath());
        return false;
    }

    QSettings s(path, QSettings::IniFormat);
    s.setValue(Keys::kBridgeUrl, config.url);
    s.setValue(Keys::kBridgeApiKey, config.apiKey);
    s.setValue(Keys::kBridgeTimeoutMs, config.timeoutMs);
    s.setValue(Keys::kAppDemo, config.demo);
    s.sync();

    if (s.status() != QSettings::NoError) {
        if (error)
            *error = QStringLiteral("Cannot write config file %1").arg(path);
        return false;
    }

    qCInfo(appLog) << "Saved bridge settings to" << path;
    return true;
}

void applyEnvironment(const QProcessEnvironment &env, AppConfig *config)
{
    const QString url = env.value(QStringLiteral("DECONZ_URL")).trimmed();
    if (!url.isEmpty())
        config->url = url;

    const QString token = env.value(QStringLiteral("DECONZ_TOKEN")).trimmed();
    if (!token.isEmpty())
        config->apiKey = token;

    if (env.contains(QStringLiteral("DECONZ_DEMO"))) {
        bool demo = false;
        if (parseBoolText(env.value(QStringLiteral("DECONZ_DEMO")), &demo))
            config->demo = demo;
        else
            qCWarning(appLog) << "Ignoring unrecognized DECONZ_DEMO value"
                              << env.value(QStringLiteral("DECONZ_DEMO"));
    }
}

bool resolveLaunchOptions(const QStringList &arguments,
                          const QProcessEnvironment &env,
                          LaunchOptions *out,
                          QString *error)
{
    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Control the lights of a deCONZ bridge."));
    const QCommandLineOption helpOption = parser.addHelpOption();
    const QCommandLineOption versionOption = parser.addVersionOption();

    const QCommandLineOption urlOption(QStringList{QStringLiteral("u"), QStringLiteral("url")},
                                       QStringLiteral("Base URL of the deCONZ REST API."),
                                       QStringLiteral("url"));
    const QCommandLineOption tokenOption(QStringList{QStringLiteral("t"), QStringLiteral("token")},
                                         QStringLiteral("API key for the bridge."),
                                         QStringLiteral("key"));
    const QCommandLineOption demoOption(QStringLiteral("demo"),
                                        QStringLiteral("Use built-in demo lights instead of a bridge."));
    const QCommandLineOption timeoutOption(QStringLiteral("timeout"),
                                           QStringLiteral("Request timeout in milliseconds."),
                                           QStringLiteral("ms"));
    const QCommandLineOption configOption(QStringList{QStringLiteral("c"), QStringLiteral("config")},
                                          QStringLiteral("Path of the INI configuration file."),
                                          QStringLiteral("file"));
    const QCommandLineOption saveOption(QStringLiteral("save"),
                                        QStringLiteral("Store the resolved bridge settings in the config file."));
    const QCommandLineOption verboseOption(QStringLiteral("verbose"), QStringLiteral("Enable debug logging."));

    parser.addOption(urlOption);
    parser.addOption(tokenOption);
    parser.addOption(demoOption);
    parser.addOption(timeoutOption);
    parser.addOption(configOption);
    parser.addOption(saveOption);
    parser.addOption(verboseOption);

    if (!parser.parse(arguments)) {
        if (error)
            *error = parser.errorText();
        return false;
    }

    LaunchOptions options;
    options.helpRequested = parser.isSet(helpOption);
    options.versionRequested = parser.isSet(versionOption);
    options.helpText = parser.helpText();
    options.save = parser.isSet(saveOption);
    options.verbose = parser.isSet(verboseOption);
    options.configPath = parser.isSet(configOption) ? parser.value(configOption) : defaultConfigPath();

    if (!loadConfigFile(options.configPath, &options.config, error))
        return false;

    applyEnvironment(env, &options.config);

    if (parser.isSet(urlOption))
        options.config.url = parser.value(urlOption).trimmed();
    if (parser.isSet(tokenOption))
        options.config.apiKey = parser.value(tokenOption).trimmed();
    if (parser.isSet(demoOption))
        options.config.demo = true;
    if (parser.isSet(timeoutOption)) {
        bool ok = false;
        options.config.timeoutMs = parser.value(timeoutOption).toInt(&ok);
        if (!ok) {
            if (error)
                *error = QStringLiteral("Invalid timeout: %1").arg(parser.value(timeoutOption));
            return false;
        }
    }

    if (out)
        *out = options;
    return true;
}

bool verboseRequested(const QStringList &arguments)
{
    for (int i = 1; i < arguments.size(); ++i) {
        const QString &arg = arguments.at(i);
        if (arg == QLatin1String("--"))
            return false;
        if (arg == QLatin1String("--verbose"))
            return true;
    }
    return false;
}

bool validateConfig(const AppConfig &config, QString *error)
{
    if (config.timeoutMs <= 0) {
        if (error)
            *error = QStringLiteral("Timeout must be positive");
        return false;
    }

    if (config.demo)
        return true;

    if (config.url.isEmpty()) {
        if (error)
            *error = QStringLiteral("Missing bridge URL (set DECONZ_URL, --url or bridge/url)");
        return false;
    }
    if (config.apiKey.isEmpty()) {
        if (error)
            *error = QStringLiteral("Missing API key (set DECONZ_TOKEN, --token or bridge/apiKey)");
        return false;
    }
    return true;
}

} // namespace deconzctl
