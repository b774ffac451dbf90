#pragma once

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

namespace deconzctl {

struct AppConfig {
    QString url;
    QString apiKey;
    bool demo = false;
    int timeoutMs = 10000;
};

struct LaunchOptions {
    AppConfig config;
    QString configPath;
    bool save = false;
    bool verbose = false;
    bool helpRequested = false;
    bool versionRequested = false;
    QString helpText;
};

QString defaultConfigPath();

// Missing keys keep the values already in *config.
bool loadConfigFile(const QString &path, AppConfig *config, QString *error = nullptr);
bool saveConfigFile(const QString &path, const AppConfig &config, QString *error = nullptr);

void applyEnvironment(const QProcessEnvironment &env, AppConfig *config);

// INI file, then environment, then command line; later sources win.
bool resolveLaunchOptions(const QStringList &arguments,
                          const QProcessEnvironment &env,
                          LaunchOptions *out,
                          QString *error = nullptr);

// Looks for --verbose ahead of full parsing so log rules apply to config loading.
bool verboseRequested(const QStringList &arguments);

bool validateConfig(const AppConfig &config, QString *error = nullptr);

bool parseBoolText(const QString &text, bool *value);

} // namespace deconzctl
