#pragma once

#include <QtCore/QByteArray>
#include <QtCore/QList>
#include <QtCore/QString>

#include "core/common/Expected.hpp"

namespace AudioGate {

enum class ProcFsError {
    NoSuchProcess,
    Malformed,
    Unsupported
};

struct ProcStat {
    qint64 pid = 0;
    qint64 ppid = 0;
    qint64 pgrp = 0;
    char state = '?';
    quint64 utimeTicks = 0;
    quint64 stimeTicks = 0;
    quint64 startTimeTicks = 0;
    qint64 rssPages = 0;

    quint64 cpuTicks() const { return utimeTicks + stimeTicks; }
    bool isZombie() const { return state == 'Z'; }
};

/**
 * @brief Thin readers over /proc used by the resource monitor and reaper.
 */
namespace ProcFs {

// Parses one /proc/<pid>/stat line; the comm field may contain spaces and parentheses
Expected<ProcStat, ProcFsError> parseStat(const QByteArray& line);
Expected<ProcStat, ProcFsError> readStat(qint64 pid);

// VmRSS from /proc/<pid>/status, in kilobytes
Expected<qint64, ProcFsError> readResidentKb(qint64 pid);
qint64 parseResidentKb(const QByteArray& statusContent);

QList<qint64> listPids();

// Root plus every transitive child, and any member of the root's process group
QList<ProcStat> processTree(qint64 rootPid);
// Live (non-zombie) members only
QList<qint64> processGroupMembers(qint64 pgid);

// Unified-hierarchy path ("0::/..." line) from /proc/<pid>/cgroup content
QString parseCgroupPath(const QByteArray& content);
// Host directory of the cgroup v2 holding pid, empty when unknown
QString cgroupDirectory(qint64 pid, const QString& rootPath = "/sys/fs/cgroup");
// Pids listed in cgroup.procs of the directory and every nested cgroup
QList<qint64> cgroupMembers(const QString& cgroupDir);
// oom_kill counter from memory.events
qint64 parseOomKillCount(const QByteArray& memoryEvents);
qint64 cgroupOomKills(const QString& cgroupDir);

bool isAlive(qint64 pid);
bool signalProcessGroup(qint64 pgid, int signal);
bool signalProcess(qint64 pid, int signal);

long clockTicksPerSecond();
long pageSizeKb();
int onlineCpuCount();

} // namespace ProcFs
} // namespace AudioGate
