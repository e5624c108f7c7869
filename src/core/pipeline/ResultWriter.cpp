#include "ResultWriter.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonDocument>
#include <QtCore/QList>
#include <QtCore/QPair>
#include <QtCore/QUuid>

namespace AudioGate {

QString toString(PersistError error) {
    switch (error) {
        case PersistError::InvalidOutputBase: return "invalid output base";
        case PersistError::DirectoryUnavailable: return "output directory unavailable";
        case PersistError::WriteFailed: return "artifact write failed";
        case PersistError::CommitFailed: return "artifact commit failed";
    }
    return "unknown persistence error";
}

ResultArtifacts ResultArtifacts::forBase(const QString& outputBase) {
    ResultArtifacts artifacts;
    artifacts.transcriptPath = outputBase + ".txt";
    artifacts.analysisPath = outputBase + "_analysis.txt";
    artifacts.metadataPath = outputBase + "_security.json";
    return artifacts;
}

namespace {

QString temporaryFor(const QString& target, const QString& token) {
    const QFileInfo info(target);
    return info.absolutePath() + "/." + info.fileName() + "." + token + ".tmp";
}

bool writeFile(const QString& path, const QByteArray& content) {
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        AUDIOGATE_ERROR("ResultWriter: cannot open {}: {}", path.toStdString(), file.errorString().toStdString());
        return false;
    }
    if (file.write(content) != content.size() || !file.flush()) {
        AUDIOGATE_ERROR("ResultWriter: short write to {}", path.toStdString());
        return false;
    }
    file.close();
    return true;
}

void removeAll(const QStringList& paths) {
    for (const QString& path : paths) {
        if (QFile::exists(path) && !QFile::remove(path)) {
            AUDIOGATE_WARN("ResultWriter: could not remove {}", path.toStdString());
        }
    }
}

} // namespace

Expected<ResultArtifacts, PersistError> ResultWriter::write(const QString& outputBase,
                                                            const QString& transcript,
                                                            const QString& analysis,
                                                            const QJsonObject& metadata) const {
    if (outputBase.trimmed().isEmpty() || QFileInfo(outputBase).fileName().isEmpty()) {
        return makeUnexpected(PersistError::InvalidOutputBase);
    }

    const ResultArtifacts artifacts = ResultArtifacts::forBase(outputBase);
    if (!QDir().mkpath(QFileInfo(outputBase).absolutePath())) {
        return makeUnexpected(PersistError::DirectoryUnavailable);
    }

    // Commit order: metadata is the marker of a complete result, so it goes last
    const QList<QPair<QString, QByteArray>> contents = {
        {artifacts.transcriptPath, transcript.toUtf8()},
        {artifacts.analysisPath, analysis.toUtf8()},
        {artifacts.metadataPath, QJsonDocument(metadata).toJson(QJsonDocument::Indented)}
    };

    const QString token = QUuid::createUuid().toString(QUuid::Id128).left(8);
    QStringList temporaries;
    for (const auto& [target, content] : contents) {
        const QString temporary = temporaryFor(target, token);
        temporaries.append(temporary);
        if (!writeFile(temporary, content)) {
            removeAll(temporaries);
            return makeUnexpected(PersistError::WriteFailed);
        }
    }

    QStringList committed;
    for (int i = 0; i < contents.size(); ++i) {
        const QString& target = contents[i].first;
        if (QFile::exists(target) && !QFile::remove(target)) {
            AUDIOGATE_ERROR("ResultWriter: cannot replace existing {}", target.toStdString());
            removeAll(committed);
            removeAll(temporaries);
            return makeUnexpected(PersistError::CommitFailed);
        }
        if (!QFile::rename(temporaries[i], target)) {
            AUDIOGATE_ERROR("ResultWriter: cannot commit {}", target.toStdString());
            removeAll(committed);
            removeAll(temporaries);
            return makeUnexpected(PersistError::CommitFailed);
        }
        committed.append(target);
    }

    AUDIOGATE_INFO("ResultWriter: wrote {}", artifacts.metadataPath.toStdString());
    return artifacts;
}

} // namespace AudioGate
