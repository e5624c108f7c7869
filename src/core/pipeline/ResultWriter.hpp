#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include "core/common/Expected.hpp"

namespace AudioGate {

enum class PersistError {
    InvalidOutputBase,
    DirectoryUnavailable,
    WriteFailed,
    CommitFailed
};

QString toString(PersistError error);

struct ResultArtifacts {
    QString transcriptPath;   // <base>.txt
    QString analysisPath;     // <base>_analysis.txt
    QString metadataPath;     // <base>_security.json

    QStringList all() const { return {transcriptPath, analysisPath, metadataPath}; }
    static ResultArtifacts forBase(const QString& outputBase);
};

/**
 * @brief Writes the three result artifacts of a run, all or none.
 *
 * Content is first written to hidden temporaries beside the targets and
 * renamed afterwards, metadata last. A failing rename removes whatever was
 * already committed, so a reader sees either every artifact or none.
 */
class ResultWriter {
public:
    Expected<ResultArtifacts, PersistError> write(const QString& outputBase,
                                                  const QString& transcript,
                                                  const QString& analysis,
                                                  const QJsonObject& metadata) const;
};

} // namespace AudioGate
