#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDate>
#include <QSettings>
#include <QString>
#include <QTextStream>
#include <QUuid>

#include <memory>

#include "planner/core/AppContext.hpp"
#include "planner/core/RecurrenceSettings.hpp"
#include "planner/core/SeriesService.hpp"

namespace {

const QString kRule(70, QLatin1Char('='));

int parseCount(const QCommandLineParser &parser, const QString &name, int fallback, bool &ok)
{
    if (!parser.isSet(name)) {
        return fallback;
    }
    const int value = parser.value(name).toInt(&ok);
    ok = ok && value >= 0;
    return value;
}

int runTrim(const QCommandLineParser &parser, planner::core::AppContext &context, QTextStream &out,
            QTextStream &err)
{
    const auto &settings = context.settings();
    planner::recurrence::TrimOptions options;
    bool ok = true;
    options.horizonYears = parseCount(parser, QStringLiteral("horizon"), settings.trimHorizonYears, ok);
    if (ok) {
        options.minInstances = parseCount(parser, QStringLiteral("min-instances"), settings.trimMinInstances, ok);
    }
    if (!ok) {
        err << QObject::tr("--horizon and --min-instances take a non-negative number") << Qt::endl;
        return 2;
    }
    options.dryRun = parser.isSet(QStringLiteral("dry-run"));
    options.convertToForever = parser.isSet(QStringLiteral("convert-to-forever"));

    const QDate today = QDate::currentDate();
    out << kRule << Qt::endl << "TRIM RECURRING INSTANCES" << Qt::endl << kRule << Qt::endl;
    out << "Horizon: " << options.horizonYears << " years ("
        << today.addDays(static_cast<qint64>(options.horizonYears) * 365).toString(Qt::ISODate) << ")" << Qt::endl;
    out << "Minimum instances to process: " << options.minInstances << Qt::endl;
    out << "Convert to forever: " << (options.convertToForever ? "yes" : "no") << Qt::endl;
    out << "Dry run: " << (options.dryRun ? "yes" : "no") << Qt::endl;

    const auto report = context.seriesService().trim(options, today);

    out << kRule << Qt::endl << "Series affected: " << report.seriesAffected << Qt::endl;
    if (options.dryRun) {
        out << "Instances that would be deleted: " << report.instancesTrimmed << Qt::endl;
        if (report.seriesAffected > 0) {
            out << "Run without --dry-run to actually delete the instances." << Qt::endl;
        }
    } else {
        out << "Instances deleted: " << report.instancesTrimmed << Qt::endl;
        if (options.convertToForever) {
            out << "Series converted to forever: " << report.seriesConverted << Qt::endl;
        }
    }
    return 0;
}

int runPreview(const QCommandLineParser &parser, const QStringList &args, planner::core::AppContext &context,
               QTextStream &out, QTextStream &err)
{
    if (args.size() < 2) {
        err << QObject::tr("preview needs the id of a series") << Qt::endl;
        return 2;
    }
    const QUuid parentId(args.at(1));
    QDate after = QDate::currentDate();
    if (parser.isSet(QStringLiteral("after"))) {
        after = QDate::fromString(parser.value(QStringLiteral("after")), Qt::ISODate);
        if (!after.isValid()) {
            err << QObject::tr("--after takes a date as YYYY-MM-DD") << Qt::endl;
            return 2;
        }
    }
    bool ok = true;
    const int count = parseCount(parser, QStringLiteral("count"), 0, ok);
    if (!ok) {
        err << QObject::tr("--count takes a non-negative number") << Qt::endl;
        return 2;
    }

    auto &service = context.seriesService();
    const auto result = service.preview(parentId, after, count);
    if (!result.ok()) {
        err << result.error << Qt::endl;
        return 1;
    }
    if (const auto text = service.summary(parentId)) {
        out << *text << Qt::endl;
    }
    for (const auto &occurrence : result.occurrences) {
        out << "#" << occurrence.ordinal + 1 << "  " << occurrence.start.toString(Qt::ISODate) << " - "
            << occurrence.end.toString(Qt::ISODate) << Qt::endl;
    }
    if (result.hasMore) {
        out << "..." << Qt::endl;
    }
    return 0;
}

int runWindow(const QStringList &args, planner::core::AppContext &context, QTextStream &out, QTextStream &err)
{
    if (args.size() < 3) {
        err << QObject::tr("window needs a start and an end date") << Qt::endl;
        return 2;
    }
    const QDate from = QDate::fromString(args.at(1), Qt::ISODate);
    const QDate to = QDate::fromString(args.at(2), Qt::ISODate);
    if (!from.isValid() || !to.isValid() || to < from) {
        err << QObject::tr("window takes two dates as YYYY-MM-DD, the start first") << Qt::endl;
        return 2;
    }

    for (const auto &entry : context.seriesService().occurrencesInWindow(from, to)) {
        const auto &occurrence = entry.occurrence;
        out << occurrence.start.toString(Qt::ISODate) << "  ";
        out << (entry.isVirtual ? QStringLiteral("(virtual)")
                                : occurrence.id.toString(QUuid::WithoutBraces));
        if (entry.ordinal) {
            out << "  #" << *entry.ordinal;
        }
        out << "  " << occurrence.snapshot.businessName << Qt::endl;
    }
    return 0;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication::setOrganizationName(QStringLiteral("Series Planner"));
    QCoreApplication::setApplicationName(QStringLiteral("planner-cli"));

    QCoreApplication app(argc, argv);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Maintenance tool for recurring job series"));
    parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("command"), QObject::tr("trim, preview <series-id> or window <from> <to>"));
    parser.addOptions({
        {QStringLiteral("config"), QObject::tr("Read settings from this ini file."), QStringLiteral("file")},
        {QStringLiteral("storage"), QObject::tr("Use this calendar file."), QStringLiteral("file")},
        {QStringLiteral("horizon"), QObject::tr("trim: years of instances to keep."), QStringLiteral("years")},
        {QStringLiteral("min-instances"), QObject::tr("trim: skip series with fewer instances."), QStringLiteral("n")},
        {QStringLiteral("dry-run"), QObject::tr("trim: report without deleting anything.")},
        {QStringLiteral("convert-to-forever"), QObject::tr("trim: switch trimmed series to repeat forever.")},
        {QStringLiteral("count"), QObject::tr("preview: number of occurrences."), QStringLiteral("n")},
        {QStringLiteral("after"), QObject::tr("preview: list occurrences after this date."), QStringLiteral("date")},
    });
    parser.process(app);

    QTextStream out(stdout);
    QTextStream err(stderr);

    const QStringList args = parser.positionalArguments();
    if (args.isEmpty()) {
        parser.showHelp(2);
    }

    std::unique_ptr<QSettings> settingsStore;
    if (parser.isSet(QStringLiteral("config"))) {
        settingsStore = std::make_unique<QSettings>(parser.value(QStringLiteral("config")), QSettings::IniFormat);
    } else {
        settingsStore = std::make_unique<QSettings>();
    }
    auto settings = planner::core::RecurrenceSettings::load(*settingsStore);
    if (parser.isSet(QStringLiteral("storage"))) {
        settings.storagePath = parser.value(QStringLiteral("storage"));
    }
    settings.applyLoggingRules();

    planner::core::AppContext context(settings);

    const QString command = args.first();
    if (command == QLatin1String("trim")) {
        return runTrim(parser, context, out, err);
    }
    if (command == QLatin1String("preview")) {
        return runPreview(parser, args, context, out, err);
    }
    if (command == QLatin1String("window")) {
        return runWindow(args, context, out, err);
    }
    err << QObject::tr("Unknown command: %1").arg(command) << Qt::endl;
    return 2;
}
