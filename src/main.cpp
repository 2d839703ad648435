#include <QCoreApplication>
#include <QCommandLineParser>
#include <QLoggingCategory>
#include <QDir>
#include <QDebug>

#include "qdatabridge_version.h"
#include "jobconfig.h"
#include "mappingdocument.h"
#include "repo/localrepository.h"
#include "sync/syncengine.h"

using namespace Bridge;

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    // Set application metadata
    app.setApplicationName("QDataBridge");
    app.setApplicationVersion(QDATABRIDGE_VERSION_STRING);
    app.setOrganizationName("QDataBridge");

    QCommandLineParser parser;
    parser.setApplicationDescription("Synchronize an external data source into a repository");
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption mappingOption("mapping", "Connector mapping document (JSON).", "file");
    QCommandLineOption jobOption("job", "Job settings (INI).", "file");
    QCommandLineOption repositoryOption("repository", "Repository file, created when missing.", "file");
    QCommandLineOption snapshotOption("snapshot", "Write the node tree and configuration to <file>.", "file");
    parser.addOption(mappingOption);
    parser.addOption(jobOption);
    parser.addOption(repositoryOption);
    parser.addOption(snapshotOption);

    parser.process(app);

    if (!parser.isSet(mappingOption) || !parser.isSet(jobOption) || !parser.isSet(repositoryOption)) {
        qCritical().noquote() << "--mapping, --job and --repository are required";
        parser.showHelp(2);
    }

    JobConfig job;
    QString error;
    if (!job.load(parser.value(jobOption), &error)) {
        qCritical().noquote() << error;
        return 1;
    }

    if (!job.debugLogging) {
        QLoggingCategory::setFilterRules("*.debug=false");
    }

    SyncEngine engine;
    if (!MappingDocument::load(parser.value(mappingOption), &engine, &error)) {
        qCritical().noquote() << error;
        return 1;
    }

    LocalRepository *repository = new LocalRepository(parser.value(repositoryOption));
    if (!repository->load()) {
        qCritical().noquote() << repository->errorString();
        delete repository;
        return 1;
    }
    engine.setRepository(repository);

    QObject::connect(&engine, &SyncEngine::logMessage, [](const QString &message) {
        qInfo().noquote() << message;
    });

    if (parser.isSet(snapshotOption)) {
        QString snapshot = parser.value(snapshotOption);
        if (!job.outputDir.isEmpty() && QDir::isRelativePath(snapshot)) {
            snapshot = QDir(job.outputDir).filePath(snapshot);
        }
        if (!engine.save(snapshot, &error)) {
            qCritical().noquote() << error;
            return 1;
        }
    }

    const SyncResult result = engine.run(job);
    if (!result.success) {
        qCritical().noquote() << QString("Synchronization failed in %1: %2")
            .arg(runPhaseName(result.phase), result.errorMessage);
        return 1;
    }

    qInfo().noquote() << result.stats.summary();
    return 0;
}
