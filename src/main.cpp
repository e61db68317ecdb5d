#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QMutex>
#include <QStandardPaths>
#include <QTextStream>
#include <cstdio>
#include <memory>

#include "core/CancellationToken.h"
#include "core/CrashHandler.h"
#include "core/MusicData.h"
#include "core/Settings.h"
#include "core/convert/NmlToRekordboxConverter.h"
#include "core/convert/RekordboxToNmlConverter.h"
#include "core/formats/LibraryCodec.h"
#include "core/library/LibraryScanner.h"
#include "core/library/MetadataResolver.h"
#include "core/library/MigrationOrchestrator.h"

enum ExitCode {
    ExitOk = 0,
    ExitFailure = 1,
    ExitUsage = 2,
    ExitCanceled = 130
};

static bool s_quiet = false;
static QFile s_logFile;

// ── Logging ─────────────────────────────────────────────────────────
static void installLogging()
{
    QString logPath = QStandardPaths::writableLocation(QStandardPaths::TempLocation)
                      + QStringLiteral("/cratebridge-debug.log");
    s_logFile.setFileName(logPath);
    if (!s_logFile.open(QIODevice::WriteOnly | QIODevice::Truncate))
        fprintf(stderr, "Cannot open log file %s\n", qPrintable(logPath));

    qInstallMessageHandler([](QtMsgType type, const QMessageLogContext&, const QString& msg) {
        static QMutex mtx;
        QMutexLocker lock(&mtx);
        QString line = QStringLiteral("[%1] %2\n")
            .arg(QDateTime::currentDateTime().toString(QStringLiteral("HH:mm:ss.zzz")), msg);
        QByteArray utf8 = line.toUtf8();
        if (s_logFile.isOpen()) {
            s_logFile.write(utf8);
            s_logFile.flush();
        }
        if (!s_quiet || type != QtDebugMsg)
            fprintf(stderr, "%s", utf8.constData());
    });

    qDebug() << "=== CrateBridge launched ==="
             << "Log:" << logPath
             << "Crash log:" << CrashHandler::crashLogPath()
             << "PID:" << QCoreApplication::applicationPid();
}

static ProgressCallback consoleProgress()
{
    if (s_quiet)
        return ProgressCallback();
    return [](int percent, const QString& message, int current, int total) {
        QString counter = total > 0 ? QStringLiteral(" (%1/%2)").arg(current).arg(total) : QString();
        fprintf(stderr, "[%3d%%] %s%s\n", percent, qPrintable(message), qPrintable(counter));
    };
}

static int usageError(const QCommandLineParser& parser, const QString& message)
{
    fprintf(stderr, "%s\n\n%s", qPrintable(message), qPrintable(parser.helpText()));
    return ExitUsage;
}

static std::optional<LibraryFormat> resolveFormat(const QString& explicitName, const QString& path)
{
    if (!explicitName.isEmpty())
        return formatFromName(explicitName);
    return formatFromExtension(path);
}

// ── scan ────────────────────────────────────────────────────────────
static int runScan(QCommandLineParser& parser, const QStringList& args, Settings& settings,
                   CancellationToken& token)
{
    QCommandLineOption exportOpt(QStringLiteral("export"),
        QStringLiteral("Write the scanned library to <file>."), QStringLiteral("file"));
    QCommandLineOption formatOpt(QStringLiteral("format"),
        QStringLiteral("Export format: nml, rekordbox, csv or m3u."), QStringLiteral("format"));
    QCommandLineOption jsonOpt(QStringLiteral("json"),
        QStringLiteral("Print every track as JSON on stdout."));
    parser.addOptions({exportOpt, formatOpt, jsonOpt});
    parser.addPositionalArgument(QStringLiteral("folders"),
        QStringLiteral("Folders to scan."), QStringLiteral("<folder>..."));
    parser.process(args);

    const QStringList folders = parser.positionalArguments().mid(1);
    if (folders.isEmpty())
        return usageError(parser, QStringLiteral("scan: no folder given"));

    std::optional<LibraryFormat> exportFormat;
    const QString exportPath = parser.value(exportOpt);
    if (!exportPath.isEmpty()) {
        exportFormat = resolveFormat(parser.value(formatOpt), exportPath);
        if (!exportFormat)
            return usageError(parser, QStringLiteral("scan: cannot tell the export format of %1").arg(exportPath));
    }

    LibraryScanner scanner(MetadataResolver(AnalysisConfig::fromSettings(&settings)));
    for (const QString& folder : folders) {
        if (!scanner.addFolder(folder)) {
            fprintf(stderr, "Folder does not exist: %s\n", qPrintable(folder));
            return ExitFailure;
        }
        settings.addLibraryFolder(QFileInfo(folder).absoluteFilePath());
    }

    ScanResult result = scanner.scan(&token, consoleProgress());
    if (result.rejected) {
        fprintf(stderr, "Scan rejected: another scan is running\n");
        return ExitFailure;
    }
    if (result.canceled) {
        fprintf(stderr, "Scan canceled after %d of %d files\n",
                int(result.tracks.size()), result.filesDiscovered);
        return ExitCanceled;
    }

    QTextStream out(stdout);
    if (parser.isSet(jsonOpt)) {
        QJsonArray array;
        for (const Track& t : result.tracks)
            array.append(QJsonObject::fromVariantMap(t.toRecord()));
        out << QJsonDocument(array).toJson(QJsonDocument::Indented);
    } else {
        for (const Track& t : result.tracks) {
            out << t.artist << " - " << t.title
                << "  [" << formatDuration(t.duration) << ", "
                << QString::number(t.bpm, 'f', 1) << " BPM, " << t.key
                << ", energy " << t.energy << "]";
            if (t.isCorrupt)
                out << "  CORRUPT: " << t.errorMessage;
            out << "\n";
        }
    }
    out.flush();

    if (exportFormat) {
        LibraryDocument doc;
        doc.tracks = removeCorrupt(result.tracks);
        ExportResult written = LibraryCodec::write(*exportFormat, exportPath, doc);
        if (!written.ok) {
            fprintf(stderr, "Export failed: %s\n", qPrintable(written.errorMessage));
            return ExitFailure;
        }
        fprintf(stderr, "Exported %d tracks to %s\n", written.tracksWritten, qPrintable(exportPath));
    }
    return ExitOk;
}

// ── migrate ─────────────────────────────────────────────────────────
static int runMigrate(QCommandLineParser& parser, const QStringList& args, Settings& settings,
                      CancellationToken& token)
{
    QCommandLineOption fromOpt(QStringLiteral("from"),
        QStringLiteral("Source format: nml, rekordbox, csv or m3u."), QStringLiteral("format"));
    QCommandLineOption toOpt(QStringLiteral("to"),
        QStringLiteral("Target format: nml, rekordbox, csv or m3u."), QStringLiteral("format"));
    QCommandLineOption cuesOpt(QStringLiteral("cues"),
        QStringLiteral("Cue retention: all, first8 or none."), QStringLiteral("mode"));
    QCommandLineOption missingOpt(QStringLiteral("missing"),
        QStringLiteral("Missing files: skip or include."), QStringLiteral("policy"));
    QCommandLineOption locateOpt(QStringLiteral("locate"),
        QStringLiteral("Search registered folders for missing files."));
    QCommandLineOption searchOpt(QStringLiteral("search"),
        QStringLiteral("Additional folder to search for missing files."), QStringLiteral("folder"));
    QCommandLineOption firstHotCueOpt(QStringLiteral("map-first-hotcue-to-memory"),
        QStringLiteral("NML to rekordbox: also emit the first hot cue as a memory cue."));
    QCommandLineOption memoryOpt(QStringLiteral("map-memory-to-hotcue"),
        QStringLiteral("rekordbox to NML: keep memory cues as hot cues."));
    parser.addOptions({fromOpt, toOpt, cuesOpt, missingOpt, locateOpt, searchOpt,
                       firstHotCueOpt, memoryOpt});
    parser.addPositionalArgument(QStringLiteral("source"), QStringLiteral("Source library file."));
    parser.addPositionalArgument(QStringLiteral("target"), QStringLiteral("Target library file."));
    parser.process(args);

    const QStringList pos = parser.positionalArguments();
    if (pos.size() != 3)
        return usageError(parser, QStringLiteral("migrate: expected <source> <target>"));
    const QString sourcePath = pos[1];
    const QString targetPath = pos[2];

    auto sourceFormat = resolveFormat(parser.value(fromOpt), sourcePath);
    auto targetFormat = resolveFormat(parser.value(toOpt), targetPath);
    if (!sourceFormat || !targetFormat)
        return usageError(parser, QStringLiteral("migrate: cannot tell the source or target format"));

    MigrationOptions options = MigrationOptions::fromSettings(&settings);
    if (parser.isSet(cuesOpt)) {
        auto r = cueRetentionFromString(parser.value(cuesOpt));
        if (!r) return usageError(parser, QStringLiteral("--cues must be all, first8 or none"));
        options.cueRetention = *r;
    }
    if (parser.isSet(missingOpt)) {
        auto p = missingFilePolicyFromString(parser.value(missingOpt));
        if (!p) return usageError(parser, QStringLiteral("--missing must be skip or include"));
        options.missingFiles = *p;
    }
    if (parser.isSet(locateOpt))
        options.locateMissing = true;
    for (const QString& folder : parser.values(searchOpt))
        options.searchFolders.append(QFileInfo(folder).absoluteFilePath());
    if (parser.isSet(firstHotCueOpt))
        options.cueMapping.mapFirstHotCueToMemory = true;
    if (parser.isSet(memoryOpt))
        options.cueMapping.mapMemoryToHotCue = true;

    MigrationOrchestrator orchestrator;
    MigrationResult result = orchestrator.migrate(sourcePath, targetPath, *sourceFormat,
                                                  *targetFormat, options, &token, consoleProgress());
    if (result.canceled) {
        fprintf(stderr, "Migration canceled; %s was not written\n", qPrintable(targetPath));
        return ExitCanceled;
    }
    if (!result.ok) {
        fprintf(stderr, "Migration failed: %s\n", qPrintable(result.errorMessage));
        return ExitFailure;
    }

    for (const SkipRecord& s : result.skipped)
        fprintf(stderr, "skipped %s: %s\n", qPrintable(s.entry), qPrintable(s.reason));
    fprintf(stderr, "Migrated %d of %d tracks (%d skipped, %d relocated, %d missing included)\n",
            result.tracksWritten, int(result.tracks.size()), int(result.skipped.size()),
            result.relocated, result.missingIncluded);
    return ExitOk;
}

// ── convert ─────────────────────────────────────────────────────────
static int runConvert(QCommandLineParser& parser, const QStringList& args)
{
    QCommandLineOption firstHotCueOpt(QStringLiteral("map-first-hotcue-to-memory"),
        QStringLiteral("NML to rekordbox: also emit the first hot cue as a memory cue."));
    QCommandLineOption memoryOpt(QStringLiteral("map-memory-to-hotcue"),
        QStringLiteral("rekordbox to NML: keep memory cues as hot cues."));
    parser.addOptions({firstHotCueOpt, memoryOpt});
    parser.addPositionalArgument(QStringLiteral("source"), QStringLiteral("Source .nml or .xml file."));
    parser.addPositionalArgument(QStringLiteral("target"), QStringLiteral("Target file."));
    parser.process(args);

    const QStringList pos = parser.positionalArguments();
    if (pos.size() != 3)
        return usageError(parser, QStringLiteral("convert: expected <source> <target>"));

    CueMappingOptions options;
    options.mapFirstHotCueToMemory = parser.isSet(firstHotCueOpt);
    options.mapMemoryToHotCue = parser.isSet(memoryOpt);

    auto from = formatFromExtension(pos[1]);
    ConversionReport report;
    if (from == LibraryFormat::Nml)
        report = NmlToRekordboxConverter::convert(pos[1], pos[2], options);
    else if (from == LibraryFormat::RekordboxXml)
        report = RekordboxToNmlConverter::convert(pos[1], pos[2], options);
    else
        return usageError(parser, QStringLiteral("convert: source must be .nml or .xml"));

    if (!report.ok) {
        fprintf(stderr, "Conversion failed: %s\n", qPrintable(report.errorMessage));
        return ExitFailure;
    }
    fprintf(stderr, "Converted %d tracks, cues %d -> %d, %d playlist references dropped\n",
            report.tracksConverted, report.cuesIn, report.cuesOut, report.droppedReferences);
    return ExitOk;
}

int main(int argc, char* argv[]) {
    CrashHandler::install();  // must be first

    QCoreApplication app(argc, argv);
    app.setOrganizationName("CrateBridge");
    app.setApplicationName("CrateBridge");
    app.setApplicationVersion(APP_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("DJ library scanner and converter"));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption settingsOpt(QStringLiteral("settings"),
        QStringLiteral("Use <ini> instead of the default settings file."), QStringLiteral("ini"));
    QCommandLineOption quietOpt(QStringList{QStringLiteral("q"), QStringLiteral("quiet")},
        QStringLiteral("Only warnings on stderr; the log file keeps everything."));
    parser.addOption(settingsOpt);
    parser.addOption(quietOpt);
    parser.addPositionalArgument(QStringLiteral("command"),
        QStringLiteral("scan, migrate or convert"));

    // First pass only finds the command; each command adds its own options
    const QStringList args = app.arguments();
    parser.parse(args);
    s_quiet = parser.isSet(quietOpt);
    installLogging();

    const QStringList pos = parser.positionalArguments();
    const QString command = pos.isEmpty() ? QString() : pos.first();
    parser.clearPositionalArguments();
    parser.addPositionalArgument(command, QStringLiteral("Run %1.").arg(command));

    std::unique_ptr<Settings> customSettings;
    if (parser.isSet(settingsOpt))
        customSettings = std::make_unique<Settings>(parser.value(settingsOpt));
    Settings& settings = customSettings ? *customSettings : *Settings::instance();

    CancellationToken token;
    CrashHandler::setInterruptToken(&token);

    int rc = ExitUsage;
    if (command == QLatin1String("scan")) {
        rc = runScan(parser, args, settings, token);
    } else if (command == QLatin1String("migrate")) {
        rc = runMigrate(parser, args, settings, token);
    } else if (command == QLatin1String("convert")) {
        rc = runConvert(parser, args);
    } else {
        parser.process(args);   // handles --help / --version
        rc = usageError(parser, command.isEmpty()
            ? QStringLiteral("No command given")
            : QStringLiteral("Unknown command: %1").arg(command));
    }

    CrashHandler::setInterruptToken(nullptr);
    settings.sync();
    qDebug() << "=== CrateBridge exit" << rc << "===";
    return rc;
}
