#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"
#include "services/ranker/inventory_source.h"
#include "services/ranker/ranking_service.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QTextStream>
#include <QTimer>

#include <algorithm>
#include <cstdio>
#include <optional>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

void printJson(const QJsonDocument& doc)
{
    QTextStream out(stdout);
    out << doc.toJson(QJsonDocument::Indented);
    out.flush();
}

int reportError(const st::Error& error)
{
    QTextStream err(stderr);
    err << st::errorToString(error) << '\n';
    err.flush();
    return kExitFailure;
}

std::optional<QJsonObject> readJsonObject(const QString& path, st::Error* errorOut)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        st::fail(errorOut, st::ErrorKind::Persistence, QStringLiteral("cannot read %1").arg(path));
        return std::nullopt;
    }
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        st::fail(errorOut, st::ErrorKind::InvalidPreferences,
                 QStringLiteral("%1 is not a JSON object").arg(path));
        return std::nullopt;
    }
    return doc.object();
}

QJsonObject weightsEntry(const st::WeightVector& weights, uint64_t activeVersion)
{
    QJsonObject entry = weights.weightsToJson();
    entry[QStringLiteral("version")] = static_cast<qint64>(weights.version());
    entry[QStringLiteral("createdAt")] = weights.createdAt().toString(Qt::ISODate);
    entry[QStringLiteral("source")] = weights.source();
    entry[QStringLiteral("active")] = weights.version() == activeVersion;
    return entry;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("smarttrip-ranker"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Trip recommendation ranking and weight learning"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("rank | train | rollback | active-version | history | serve"));

    const QCommandLineOption configOption(QStringLiteral("config"),
                                          QStringLiteral("Settings JSON file."),
                                          QStringLiteral("path"));
    const QCommandLineOption dbOption(QStringLiteral("db"),
                                      QStringLiteral("SQLite database path."),
                                      QStringLiteral("path"));
    const QCommandLineOption kOption(QStringLiteral("k"),
                                     QStringLiteral("Number of results to return."),
                                     QStringLiteral("n"));
    const QCommandLineOption dateOption(QStringLiteral("date"),
                                        QStringLiteral("Reference date (yyyy-MM-dd)."),
                                        QStringLiteral("date"));
    const QCommandLineOption limitOption(QStringLiteral("limit"),
                                         QStringLiteral("History entries to print."),
                                         QStringLiteral("n"),
                                         QStringLiteral("10"));
    parser.addOptions({configOption, dbOption, kOption, dateOption, limitOption});
    parser.process(app);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(kExitUsage);
    }
    const QString command = args.first();

    st::EngineSettings settings;
    const QString configPath = parser.isSet(configOption) ? parser.value(configOption)
                                                          : st::SettingsManager::settingsFilePath();
    if (auto loaded = st::SettingsManager::load(configPath)) {
        settings = *loaded;
    } else if (parser.isSet(configOption)) {
        LOG_WARN(stCore, "Using default settings; could not load %s", qUtf8Printable(configPath));
    }
    if (parser.isSet(dbOption)) {
        settings.store.databasePath = parser.value(dbOption);
    }

    st::RankingService service(settings);
    st::Error error;
    if (!service.initialize(&error)) {
        return reportError(error);
    }

    if (command == QLatin1String("rank")) {
        if (args.size() < 3) {
            QTextStream(stderr) << "usage: rank <preferences.json> <candidates.json> [--k N]\n";
            return kExitUsage;
        }
        st::RankOptions options;
        if (parser.isSet(kOption)) {
            bool ok = false;
            const int k = parser.value(kOption).toInt(&ok);
            if (!ok || k < 0) {
                QTextStream(stderr) << "--k must be a non-negative integer\n";
                return kExitUsage;
            }
            options.k = static_cast<std::size_t>(k);
        }
        options.referenceDate = parser.isSet(dateOption)
            ? QDate::fromString(parser.value(dateOption), Qt::ISODate)
            : QDate::currentDate();
        if (!options.referenceDate.isValid()) {
            QTextStream(stderr) << "--date must be yyyy-MM-dd\n";
            return kExitUsage;
        }

        const auto prefs = readJsonObject(args.at(1), &error);
        if (!prefs) {
            return reportError(error);
        }
        auto inventory = st::JsonInventorySource::load(args.at(2), options.referenceDate,
                                                       settings.filters, &error);
        if (!inventory) {
            return reportError(error);
        }
        const auto results = service.rankFromInventory(*prefs, *inventory, options, &error);
        if (!results) {
            return reportError(error);
        }
        printJson(QJsonDocument(st::RankingService::resultsToJson(*results)));
        return kExitOk;
    }

    if (command == QLatin1String("train")) {
        const auto report = service.triggerTraining(QDateTime::currentDateTimeUtc(), &error);
        if (!report) {
            return reportError(error);
        }
        printJson(QJsonDocument(report->toJson()));
        return report->promoted ? kExitOk : kExitFailure;
    }

    if (command == QLatin1String("rollback")) {
        bool ok = false;
        const qulonglong version = args.size() > 1 ? args.at(1).toULongLong(&ok) : 0;
        if (!ok) {
            QTextStream(stderr) << "usage: rollback <version>\n";
            return kExitUsage;
        }
        if (!service.rollback(static_cast<uint64_t>(version), &error)) {
            return reportError(error);
        }
        QTextStream(stdout) << service.activeWeightVersion() << '\n';
        return kExitOk;
    }

    if (command == QLatin1String("active-version")) {
        QTextStream(stdout) << service.activeWeightVersion() << '\n';
        return kExitOk;
    }

    if (command == QLatin1String("history")) {
        const int limit = std::max(1, parser.value(limitOption).toInt());
        const uint64_t active = service.activeWeightVersion();
        QJsonArray entries;
        for (const auto& weights : service.weightHistory(static_cast<std::size_t>(limit))) {
            entries.append(weightsEntry(*weights, active));
        }
        printJson(QJsonDocument(entries));
        return kExitOk;
    }

    if (command == QLatin1String("serve")) {
        const auto tick = [&service]() {
            std::optional<st::TrainingReport> report;
            if (service.maybeRunScheduledTraining(QDateTime::currentDateTimeUtc(), &report) && report) {
                LOG_INFO(stLearning, "Scheduled training finished: %s (active v%llu)",
                         qUtf8Printable(st::trainingStateToString(report->outcome)),
                         static_cast<unsigned long long>(service.activeWeightVersion()));
            }
        };
        QTimer scheduleTimer;
        QObject::connect(&scheduleTimer, &QTimer::timeout, &app, tick);
        scheduleTimer.start(60 * 1000);
        QTimer::singleShot(0, &app, tick);
        LOG_INFO(stCore, "Serving; training every %d h", settings.training.scheduleIntervalHours);
        return app.exec();
    }

    QTextStream(stderr) << "unknown command: " << command << '\n';
    return kExitUsage;
}
