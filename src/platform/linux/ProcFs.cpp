#include "ProcFs.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QHash>
#include <QtCore/QSet>

#ifdef Q_OS_LINUX
#include <sys/types.h>
#include <signal.h>
#include <unistd.h>
#include <errno.h>
#include <cstring>
#endif

namespace AudioGate {
namespace ProcFs {

namespace {

QByteArray readProcFile(const QString& path, bool* ok) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        *ok = false;
        return QByteArray();
    }
    *ok = true;
    return file.readAll();
}

} // namespace

Expected<ProcStat, ProcFsError> parseStat(const QByteArray& line) {
    const qsizetype open = line.indexOf('(');
    const qsizetype close = line.lastIndexOf(')');
    if (open <= 0 || close < open) {
        return makeUnexpected(ProcFsError::Malformed);
    }

    bool ok = false;
    ProcStat stat;
    stat.pid = line.left(open).trimmed().toLongLong(&ok);
    if (!ok) {
        return makeUnexpected(ProcFsError::Malformed);
    }

    // Fields after the comm: state ppid pgrp session tty tpgid flags minflt
    // cminflt majflt cmajflt utime stime cutime cstime priority nice threads
    // itrealvalue starttime vsize rss ...
    const QList<QByteArray> fields = line.mid(close + 1).simplified().split(' ');
    if (fields.size() < 22 || fields[0].isEmpty()) {
        return makeUnexpected(ProcFsError::Malformed);
    }

    stat.state = fields[0].at(0);
    stat.ppid = fields[1].toLongLong();
    stat.pgrp = fields[2].toLongLong();
    stat.utimeTicks = fields[11].toULongLong();
    stat.stimeTicks = fields[12].toULongLong();
    stat.startTimeTicks = fields[19].toULongLong();
    stat.rssPages = fields[21].toLongLong();
    return stat;
}

Expected<ProcStat, ProcFsError> readStat(qint64 pid) {
    bool ok = false;
    const QByteArray content = readProcFile(QString("/proc/%1/stat").arg(pid), &ok);
    if (!ok || content.isEmpty()) {
        return makeUnexpected(ProcFsError::NoSuchProcess);
    }
    return parseStat(content);
}

qint64 parseResidentKb(const QByteArray& statusContent) {
    for (const QByteArray& line : statusContent.split('\n')) {
        if (line.startsWith("VmRSS:")) {
            const QList<QByteArray> parts = line.mid(6).simplified().split(' ');
            return parts.isEmpty() ? 0 : parts.first().toLongLong();
        }
    }
    // Kernel threads and zombies carry no VmRSS line
    return 0;
}

Expected<qint64, ProcFsError> readResidentKb(qint64 pid) {
    bool ok = false;
    const QByteArray content = readProcFile(QString("/proc/%1/status").arg(pid), &ok);
    if (!ok) {
        return makeUnexpected(ProcFsError::NoSuchProcess);
    }
    return parseResidentKb(content);
}

QList<qint64> listPids() {
    QList<qint64> pids;
    const QStringList entries = QDir("/proc").entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString& entry : entries) {
        bool ok = false;
        const qint64 pid = entry.toLongLong(&ok);
        if (ok) {
            pids.append(pid);
        }
    }
    return pids;
}

QList<ProcStat> processTree(qint64 rootPid) {
    QHash<qint64, ProcStat> all;
    for (qint64 pid : listPids()) {
        auto stat = readStat(pid);
        if (stat.hasValue()) {
            all.insert(pid, stat.value());
        }
    }

    QList<ProcStat> tree;
    if (!all.contains(rootPid)) {
        return tree;
    }

    QSet<qint64> members{rootPid};
    // Children may appear before parents in pid order, iterate to a fixed point
    bool grew = true;
    while (grew) {
        grew = false;
        for (auto it = all.cbegin(); it != all.cend(); ++it) {
            const ProcStat& stat = it.value();
            if (members.contains(stat.pid)) {
                continue;
            }
            if (members.contains(stat.ppid) || stat.pgrp == rootPid) {
                members.insert(stat.pid);
                grew = true;
            }
        }
    }

    for (qint64 pid : members) {
        tree.append(all.value(pid));
    }
    return tree;
}

QList<qint64> processGroupMembers(qint64 pgid) {
    QList<qint64> members;
    for (qint64 pid : listPids()) {
        auto stat = readStat(pid);
        if (stat.hasValue() && stat.value().pgrp == pgid && !stat.value().isZombie()) {
            members.append(pid);
        }
    }
    return members;
}

QString parseCgroupPath(const QByteArray& content) {
    for (const QByteArray& line : content.split('\n')) {
        if (line.startsWith("0::")) {
            return QString::fromUtf8(line.mid(3).trimmed());
        }
    }
    return QString();
}

QString cgroupDirectory(qint64 pid, const QString& rootPath) {
    bool ok = false;
    const QString relative = parseCgroupPath(readProcFile(QString("/proc/%1/cgroup").arg(pid), &ok));
    if (!ok || relative.isEmpty()) {
        return QString();
    }
    const QString directory = QDir::cleanPath(rootPath + "/" + relative);
    return QFile::exists(directory + "/cgroup.procs") ? directory : QString();
}

QList<qint64> cgroupMembers(const QString& cgroupDir) {
    QList<qint64> pids;
    if (cgroupDir.isEmpty()) {
        return pids;
    }

    bool ok = false;
    const QByteArray content = readProcFile(cgroupDir + "/cgroup.procs", &ok);
    for (const QByteArray& line : content.split('\n')) {
        bool parsed = false;
        const qint64 pid = line.trimmed().toLongLong(&parsed);
        if (parsed && pid > 0) {
            pids.append(pid);
        }
    }

    const QStringList children = QDir(cgroupDir).entryList(QDir::Dirs | QDir::NoDotAndDotDot);
    for (const QString& child : children) {
        pids.append(cgroupMembers(cgroupDir + "/" + child));
    }
    return pids;
}

qint64 parseOomKillCount(const QByteArray& memoryEvents) {
    for (const QByteArray& line : memoryEvents.split('\n')) {
        const QList<QByteArray> parts = line.simplified().split(' ');
        if (parts.size() == 2 && parts[0] == "oom_kill") {
            return parts[1].toLongLong();
        }
    }
    return 0;
}

qint64 cgroupOomKills(const QString& cgroupDir) {
    if (cgroupDir.isEmpty()) {
        return 0;
    }
    bool ok = false;
    const QByteArray content = readProcFile(cgroupDir + "/memory.events", &ok);
    return ok ? parseOomKillCount(content) : 0;
}

bool isAlive(qint64 pid) {
#ifdef Q_OS_LINUX
    if (pid <= 0) {
        return false;
    }
    auto stat = readStat(pid);
    if (stat.hasValue()) {
        return !stat.value().isZombie();
    }
    return ::kill(static_cast<pid_t>(pid), 0) == 0;
#else
    Q_UNUSED(pid)
    return false;
#endif
}

bool signalProcessGroup(qint64 pgid, int signal) {
#ifdef Q_OS_LINUX
    if (pgid <= 1) {
        return false;
    }
    if (::kill(-static_cast<pid_t>(pgid), signal) == 0) {
        return true;
    }
    if (errno != ESRCH) {
        AUDIOGATE_WARN("ProcFs: signal {} to group {} failed: {}", signal, pgid, strerror(errno));
    }
    return false;
#else
    Q_UNUSED(pgid)
    Q_UNUSED(signal)
    return false;
#endif
}

bool signalProcess(qint64 pid, int signal) {
#ifdef Q_OS_LINUX
    if (pid <= 1) {
        return false;
    }
    return ::kill(static_cast<pid_t>(pid), signal) == 0;
#else
    Q_UNUSED(pid)
    Q_UNUSED(signal)
    return false;
#endif
}

long clockTicksPerSecond() {
#ifdef Q_OS_LINUX
    static const long ticks = sysconf(_SC_CLK_TCK);
    return ticks > 0 ? ticks : 100;
#else
    return 100;
#endif
}

long pageSizeKb() {
#ifdef Q_OS_LINUX
    static const long pageSize = sysconf(_SC_PAGESIZE);
    return pageSize > 0 ? pageSize / 1024 : 4;
#else
    return 4;
#endif
}

int onlineCpuCount() {
#ifdef Q_OS_LINUX
    const long count = sysconf(_SC_NPROCESSORS_ONLN);
    return count > 0 ? static_cast<int>(count) : 1;
#else
    return 1;
#endif
}

} // namespace ProcFs
} // namespace AudioGate
