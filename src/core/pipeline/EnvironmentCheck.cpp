#include "EnvironmentCheck.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QFileInfo>
#include <QtCore/QJsonArray>
#include <QtCore/QProcess>
#include <QtCore/QStandardPaths>
#include <QtCore/QTemporaryFile>

namespace AudioGate {

namespace {
constexpr int kProbeTimeoutMs = 15000;
}

bool EnvironmentReport::isReady() const {
    return tempWritable && missingTools().isEmpty();
}

QStringList EnvironmentReport::missingTools() const {
    QStringList missing;
    for (const ToolCheck& tool : tools) {
        if (!tool.available) {
            missing.append(tool.name);
        }
    }
    return missing;
}

QJsonObject EnvironmentReport::toJson() const {
    QJsonObject json;
    QJsonArray toolList;
    for (const ToolCheck& tool : tools) {
        QJsonObject entry;
        entry["name"] = tool.name;
        entry["available"] = tool.available;
        entry["version"] = tool.version;
        toolList.append(entry);
    }
    json["tools"] = toolList;
    json["temp_path"] = tempPath;
    json["temp_writable"] = tempWritable;
    json["ready"] = isReady();
    return json;
}

QStringList EnvironmentCheck::requiredTools() {
    return {"docker", "ffprobe", "whisper"};
}

ToolCheck EnvironmentCheck::probeTool(const QString& tool) {
    ToolCheck check;
    check.name = tool;

    if (QStandardPaths::findExecutable(tool).isEmpty()) {
        return check;
    }

    QProcess process;
    process.start(tool, {"--version"});
    if (!process.waitForStarted(kProbeTimeoutMs)) {
        return check;
    }
    if (!process.waitForFinished(kProbeTimeoutMs)) {
        process.kill();
        process.waitForFinished();
        return check;
    }

    check.available = process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0;
    // Some tools print their version on stderr
    QByteArray output = process.readAllStandardOutput();
    if (output.trimmed().isEmpty()) {
        output = process.readAllStandardError();
    }
    check.version = QString::fromUtf8(output).section('\n', 0, 0).trimmed();
    return check;
}

EnvironmentReport EnvironmentCheck::run(const QStringList& tools, const QString& tempPath) {
    EnvironmentReport report;
    report.tempPath = tempPath;

    for (const QString& tool : tools) {
        ToolCheck check = probeTool(tool);
        if (check.available) {
            AUDIOGATE_INFO("EnvironmentCheck: {} found ({})", tool.toStdString(), check.version.toStdString());
        } else {
            AUDIOGATE_WARN("EnvironmentCheck: {} missing or not working", tool.toStdString());
        }
        report.tools.append(check);
    }

    QTemporaryFile probe(tempPath + "/audiogate_probe_XXXXXX");
    report.tempWritable = QFileInfo(tempPath).isDir() && probe.open();
    if (!report.tempWritable) {
        AUDIOGATE_ERROR("EnvironmentCheck: {} is not writable", tempPath.toStdString());
    }
    return report;
}

} // namespace AudioGate
