#pragma once

#include <QtCore/QString>

#include "core/common/Expected.hpp"

namespace AudioGate {

enum class CgroupError {
    Unavailable,
    CreationFailed,
    LimitFailed,
    AttachFailed
};

/**
 * @brief One cgroup v2 leaf under <root>/audiogate/<name>.
 *
 * Used by the chroot strategy to bound memory, CPU and process count of the
 * supervised tree. Requires a delegated, writable cgroup v2 hierarchy;
 * callers treat Unavailable as "no kernel limits" and rely on rlimits.
 */
class LinuxCgroup {
public:
    explicit LinuxCgroup(QString name, QString rootPath = "/sys/fs/cgroup");
    ~LinuxCgroup();

    LinuxCgroup(const LinuxCgroup&) = delete;
    LinuxCgroup& operator=(const LinuxCgroup&) = delete;

    static bool isSupported(const QString& rootPath = "/sys/fs/cgroup");

    Expected<void, CgroupError> create();
    Expected<void, CgroupError> setMemoryLimit(quint64 bytes);
    // Percentage of one CPU, written as "<quota> 100000" into cpu.max
    Expected<void, CgroupError> setCpuLimit(quint32 percent);
    Expected<void, CgroupError> setProcessLimit(quint32 maxProcesses);
    Expected<void, CgroupError> addProcess(qint64 pid);

    // Write-only, close-on-exec descriptor on cgroup.procs; opened once, closed by destroy()
    Expected<int, CgroupError> joinDescriptor();
    // Moves the calling process into the cgroup behind fd. Async-signal-safe,
    // so a forked child can join before exec and every descendant starts inside
    static bool joinFromChild(int fd);

    // Kills remaining members and removes the directory; safe to call twice
    void destroy();

    QString path() const;
    bool isCreated() const;

private:
    Expected<void, CgroupError> writeControl(const QString& file, const QByteArray& value,
                                             CgroupError failure);

    QString name_;
    QString rootPath_;
    QString path_;
    bool created_ = false;
    int procsFd_ = -1;
};

} // namespace AudioGate
