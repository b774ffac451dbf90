#include <iostream>
#include <memory>
#include <utility>

#include <QApplication>
#include <QLoggingCategory>
#include <QNetworkAccessManager>
#include <QProcessEnvironment>

#include "deconz_config.h"
#include "deconz_log.h"
#include "deconz_probe.h"
#include "deconzclient.h"
#include "demolightclient.h"
#include "lightsession.h"
#include "mainwindow.h"

namespace {

namespace dc = deconzctl;

std::unique_ptr<dc::LightClient> createClient(const dc::AppConfig &config, QString *error)
{
    if (config.demo) {
        qCInfo(appLog) << "Running in demo mode, requests are printed to stdout";
        return std::make_unique<dc::DemoLightClient>();
    }

    auto client = dc::DeconzClient::loginWithToken(config.url, config.apiKey, error);
    if (!client)
        return nullptr;
    client->setTimeoutMs(config.timeoutMs);

    QNetworkAccessManager network;
    dc::HttpClient http(&network);
    const dc::ProbeResult probe = dc::checkCredentials(http, client->settings(), config.timeoutMs);
    if (probe.ok)
        qCInfo(appLog).noquote() << probe.message;
    else
        qCWarning(appLog).noquote() << "Bridge check failed:" << probe.error;

    return client;
}

} // namespace

int main(int argc, char **argv)
{
    QApplication app(argc, argv);
    QCoreApplication::setOrganizationName(QStringLiteral("zenonet"));
    QCoreApplication::setOrganizationDomain(QStringLiteral("zenonet.de"));
    QCoreApplication::setApplicationName(QStringLiteral("deconz-control"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0.0"));

    const QStringList arguments = QCoreApplication::arguments();
    if (dc::verboseRequested(arguments))
        QLoggingCategory::setFilterRules(QStringLiteral("deconz-control.*.debug=true"));

    dc::LaunchOptions options;
    QString error;
    if (!dc::resolveLaunchOptions(arguments,
                                  QProcessEnvironment::systemEnvironment(),
                                  &options,
                                  &error)) {
        std::cerr << "deconz-control: " << error.toStdString() << '\n';
        return 1;
    }

    if (options.helpRequested) {
        std::cout << options.helpText.toStdString();
        return 0;
    }
    if (options.versionRequested) {
        std::cout << "deconz-control " << QCoreApplication::applicationVersion().toStdString() << '\n';
        return 0;
    }

    if (!dc::validateConfig(options.config, &error)) {
        std::cerr << "deconz-control: " << error.toStdString() << '\n';
        return 1;
    }

    if (options.save && !dc::saveConfigFile(options.configPath, options.config, &error)) {
        std::cerr << "deconz-control: " << error.toStdString() << '\n';
        return 1;
    }

    std::unique_ptr<dc::LightClient> client = createClient(options.config, &error);
    if (!client) {
        std::cerr << "deconz-control: " << error.toStdString() << '\n';
        return 1;
    }

    auto *session = new dc::LightSession(std::move(client));
    dc::MainWindow window(session);
    window.show();

    return app.exec();
}
