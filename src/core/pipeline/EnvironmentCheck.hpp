#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QList>
#include <QtCore/QString>
#include <QtCore/QStringList>

namespace AudioGate {

struct ToolCheck {
    QString name;
    bool available = false;
    QString version;
};

struct EnvironmentReport {
    QList<ToolCheck> tools;
    bool tempWritable = false;
    QString tempPath;

    bool isReady() const;
    QStringList missingTools() const;
    QJsonObject toJson() const;
};

// Preflight of the external tools and scratch space the gateway relies on
class EnvironmentCheck {
public:
    static QStringList requiredTools();
    static EnvironmentReport run(const QStringList& tools = requiredTools(),
                                 const QString& tempPath = "/tmp");
    static ToolCheck probeTool(const QString& tool);
};

} // namespace AudioGate
