#include "rag_service.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QJsonDocument>
#include <QTextStream>

namespace {

void printJson(const QJsonObject& json)
{
    QTextStream out(stdout);
    out << QJsonDocument(json).toJson(QJsonDocument::Indented);
    out.flush();
}

int fail(const QString& message)
{
    printJson(dr::RagService::errorResponse(message));
    return 1;
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("docrag"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Document ingestion and retrieval"));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("command"),
        QStringLiteral("ingest | ingest-dir | query | gate | delete | clear | status"));
    parser.addPositionalArgument(QStringLiteral("args"), QStringLiteral("Command arguments"),
                                 QStringLiteral("[args...]"));

    const QCommandLineOption configOption(QStringLiteral("config"),
        QStringLiteral("Settings file"), QStringLiteral("file"));
    const QCommandLineOption mockOption(QStringLiteral("mock-embeddings"),
        QStringLiteral("Use zero-vector embeddings instead of the provider"));
    const QCommandLineOption forceOption(QStringLiteral("force"),
        QStringLiteral("Re-ingest documents that are already indexed"));
    const QCommandLineOption kOption(QStringList{QStringLiteral("k")},
        QStringLiteral("Number of results"), QStringLiteral("n"));
    const QCommandLineOption filterOption(QStringLiteral("filter"),
        QStringLiteral("Metadata equality filter (repeatable)"), QStringLiteral("key=value"));
    const QCommandLineOption traceOption(QStringLiteral("trace"),
        QStringLiteral("Include scores, previews and timings"));
    parser.addOptions({configOption, mockOption, forceOption, kOption, filterOption, traceOption});

    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }
    const QString command = positional.first();
    const QStringList args = positional.mid(1);

    dr::RagService service(dr::RagService::resolveSettings(parser.value(configOption),
                                                           parser.isSet(mockOption)));
    QString error;
    if (!service.initialize(&error)) {
        return fail(error);
    }

    const bool force = parser.isSet(forceOption);
    QJsonObject result;

    if (command == QLatin1String("ingest")) {
        if (args.isEmpty()) {
            return fail(QStringLiteral("ingest needs at least one file"));
        }
        result = service.ingest(args, force);
    } else if (command == QLatin1String("ingest-dir")) {
        if (args.size() != 1) {
            return fail(QStringLiteral("ingest-dir needs exactly one directory"));
        }
        result = service.ingestDirectory(args.first(), force);
    } else if (command == QLatin1String("query")) {
        if (args.isEmpty()) {
            return fail(QStringLiteral("query needs text"));
        }
        std::optional<int> k;
        if (parser.isSet(kOption)) {
            bool ok = false;
            k = parser.value(kOption).toInt(&ok);
            if (!ok || *k <= 0) {
                return fail(QStringLiteral("-k expects a positive integer"));
            }
        }
        dr::MetadataFilter filter;
        if (!dr::RagService::parseFilter(parser.values(filterOption), &filter, &error)) {
            return fail(error);
        }
        result = service.query(args.join(QLatin1Char(' ')), k, filter,
                               parser.isSet(traceOption));
    } else if (command == QLatin1String("gate")) {
        if (args.isEmpty()) {
            return fail(QStringLiteral("gate needs text"));
        }
        result = service.gate(args.join(QLatin1Char(' ')));
    } else if (command == QLatin1String("delete")) {
        if (args.size() != 1) {
            return fail(QStringLiteral("delete needs exactly one filename"));
        }
        result = service.deleteDocument(args.first());
    } else if (command == QLatin1String("clear")) {
        result = service.clear();
    } else if (command == QLatin1String("status")) {
        result = service.status();
    } else {
        return fail(QStringLiteral("Unknown command '%1'").arg(command));
    }

    printJson(result);
    return result.value(QStringLiteral("status")).toString() == QLatin1String("ok") ? 0 : 1;
}
