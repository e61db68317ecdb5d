#include "CsvCodec.h"

#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHash>
#include <QSaveFile>
#include <QUuid>

static const char* kLog = "[CsvCodec]";

const QStringList& CsvCodec::writerHeader()
{
    static const QStringList header = {
        QStringLiteral("name"), QStringLiteral("artist"), QStringLiteral("album"),
        QStringLiteral("genre"), QStringLiteral("bpm"), QStringLiteral("key"),
        QStringLiteral("path")
    };
    return header;
}

// ── RFC 4180 ────────────────────────────────────────────────────────
QVector<QStringList> CsvCodec::parse(const QString& text)
{
    QVector<QStringList> rows;
    QStringList row;
    QString field;
    bool inQuotes = false;
    bool fieldStarted = false;

    auto endField = [&]() {
        row.append(field);
        field.clear();
        fieldStarted = false;
    };
    auto endRow = [&]() {
        endField();
        // A bare line break yields one empty field: not a record
        if (!(row.size() == 1 && row.front().isEmpty()))
            rows.append(row);
        row.clear();
    };

    for (int i = 0; i < text.size(); ++i) {
        const QChar c = text.at(i);
        if (inQuotes) {
            if (c == QLatin1Char('"')) {
                if (i + 1 < text.size() && text.at(i + 1) == QLatin1Char('"')) {
                    field += QLatin1Char('"');
                    ++i;
                } else {
                    inQuotes = false;
                }
            } else {
                field += c;
            }
            continue;
        }

        if (c == QLatin1Char('"') && !fieldStarted) {
            inQuotes = true;
            fieldStarted = true;
        } else if (c == QLatin1Char(',')) {
            endField();
        } else if (c == QLatin1Char('\r')) {
            if (i + 1 < text.size() && text.at(i + 1) == QLatin1Char('\n'))
                ++i;
            endRow();
        } else if (c == QLatin1Char('\n')) {
            endRow();
        } else {
            field += c;
            fieldStarted = true;
        }
    }
    if (fieldStarted || !field.isEmpty() || !row.isEmpty())
        endRow();
    return rows;
}

QString CsvCodec::quoteField(const QString& field)
{
    if (!field.contains(QLatin1Char(',')) && !field.contains(QLatin1Char('"'))
        && !field.contains(QLatin1Char('\n')) && !field.contains(QLatin1Char('\r')))
        return field;
    QString escaped = field;
    escaped.replace(QLatin1String("\""), QLatin1String("\"\""));
    return QLatin1Char('"') + escaped + QLatin1Char('"');
}

// ── Reading ─────────────────────────────────────────────────────────
ImportResult CsvCodec::read(const QString& filePath, const ReadOptions& options)
{
    ImportResult result;

    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        result.errorMessage = QStringLiteral("Cannot open %1: %2").arg(filePath, file.errorString());
        qWarning() << kLog << result.errorMessage;
        return result;
    }

    QString text = QString::fromUtf8(file.readAll());
    if (text.startsWith(QChar(0xFEFF)))
        text.remove(0, 1);

    const QVector<QStringList> rows = parse(text);
    if (rows.isEmpty()) {
        result.errorMessage = QStringLiteral("CSV file has no header row: %1").arg(filePath);
        qWarning() << kLog << result.errorMessage;
        return result;
    }

    // Header aliases, matched case-insensitively
    static const QHash<QString, QString> kAliases = {
        {QStringLiteral("name"), QStringLiteral("title")},
        {QStringLiteral("title"), QStringLiteral("title")},
        {QStringLiteral("path"), QStringLiteral("path")},
        {QStringLiteral("location"), QStringLiteral("path")},
        {QStringLiteral("file_path"), QStringLiteral("path")},
        {QStringLiteral("artist"), QStringLiteral("artist")},
        {QStringLiteral("album"), QStringLiteral("album")},
        {QStringLiteral("genre"), QStringLiteral("genre")},
        {QStringLiteral("bpm"), QStringLiteral("bpm")},
        {QStringLiteral("key"), QStringLiteral("key")},
        {QStringLiteral("year"), QStringLiteral("year")},
        {QStringLiteral("comment"), QStringLiteral("comment")},
        {QStringLiteral("duration"), QStringLiteral("duration")}
    };

    QHash<QString, int> column;
    const QStringList& header = rows.front();
    for (int i = 0; i < header.size(); ++i) {
        QString canonical = kAliases.value(header[i].trimmed().toLower());
        if (!canonical.isEmpty() && !column.contains(canonical))
            column.insert(canonical, i);
    }
    if (!column.contains(QStringLiteral("path")))
        qDebug() << kLog << "No path/location column in" << filePath << "- every row will be skipped";

    auto cell = [&](const QStringList& row, const QString& name) -> QString {
        int idx = column.value(name, -1);
        return (idx >= 0 && idx < row.size()) ? row[idx].trimmed() : QString();
    };

    QHash<QString, QString> idByPath;
    for (int r = 1; r < rows.size(); ++r) {
        const QStringList& row = rows[r];
        const QString entry = QStringLiteral("row %1").arg(r + 1);

        QString path = cell(row, QStringLiteral("path"));
        if (path.isEmpty()) {
            qDebug() << kLog << "Skipping" << entry << "- no path";
            result.skipped.append({entry, QStringLiteral("No path")});
            continue;
        }
        if (!QDir::isAbsolutePath(path))
            path = QFileInfo(filePath).absoluteDir().absoluteFilePath(path);
        path = QDir::cleanPath(path);

        if (idByPath.contains(path)) {
            qDebug() << kLog << "Skipping" << entry << "- duplicate path" << path;
            result.skipped.append({entry, QStringLiteral("Duplicate path: %1").arg(path)});
            continue;
        }

        Track t;
        t.id       = QUuid::createUuid().toString(QUuid::WithoutBraces);
        t.filePath = path;
        t.title    = cell(row, QStringLiteral("title"));
        t.artist   = cell(row, QStringLiteral("artist"));
        t.album    = cell(row, QStringLiteral("album"));
        t.genre    = cell(row, QStringLiteral("genre"));
        t.year     = cell(row, QStringLiteral("year"));
        t.comment  = cell(row, QStringLiteral("comment"));
        t.bpm      = cell(row, QStringLiteral("bpm")).toDouble();
        t.duration = cell(row, QStringLiteral("duration")).toDouble();
        QString key = cell(row, QStringLiteral("key"));
        if (!key.isEmpty())
            t.key = key;

        if (!LibraryCodec::admitReferencedFile(t, options, entry, result.skipped, kLog))
            continue;

        t.applyDefaults();
        idByPath.insert(path, t.id);
        result.document.tracks.append(t);
    }

    result.ok = true;
    qDebug() << kLog << "Read" << result.document.tracks.size() << "rows, skipped"
             << result.skipped.size() << "from" << filePath;
    return result;
}

// ── Writing ─────────────────────────────────────────────────────────
ExportResult CsvCodec::write(const QString& filePath, const LibraryDocument& document)
{
    ExportResult result;

    if (!document.playlists.isEmpty())
        qDebug() << kLog << "CSV has no playlists; ignoring" << document.playlists.size();

    QSaveFile file(filePath);
    if (!LibraryCodec::openForWriting(file, result, kLog))
        return result;

    QString out = writerHeader().join(QLatin1Char(',')) + QStringLiteral("\r\n");
    for (const Track& t : document.tracks) {
        const QVariantMap r = t.toRecord();
        const QStringList fields = {
            r.value(QStringLiteral("title")).toString(),
            r.value(QStringLiteral("artist")).toString(),
            r.value(QStringLiteral("album")).toString(),
            r.value(QStringLiteral("genre")).toString(),
            QString::number(r.value(QStringLiteral("bpm")).toDouble()),
            r.value(QStringLiteral("key")).toString(),
            QDir::toNativeSeparators(r.value(QStringLiteral("file_path")).toString())
        };
        QStringList quoted;
        for (const QString& f : fields)
            quoted.append(quoteField(f));
        out += quoted.join(QLatin1Char(',')) + QStringLiteral("\r\n");

        // The path is the only identity a CSV row has
        if (!t.id.isEmpty())
            result.identities.insert(t.id, t.filePath);
    }

    if (file.write(out.toUtf8()) < 0) {
        file.cancelWriting();
        result.errorMessage = QStringLiteral("Failed to write %1: %2").arg(filePath, file.errorString());
        qWarning() << kLog << result.errorMessage;
        return result;
    }
    if (!LibraryCodec::commit(file, result, kLog))
        return result;

    result.tracksWritten = document.tracks.size();
    qDebug() << kLog << "Wrote" << result.tracksWritten << "rows to" << filePath;
    return result;
}
