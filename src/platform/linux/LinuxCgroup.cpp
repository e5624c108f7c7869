#include "LinuxCgroup.hpp"
#include "ProcFs.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QThread>

#ifdef Q_OS_LINUX
#include <errno.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <cstring>
#endif

namespace AudioGate {

LinuxCgroup::LinuxCgroup(QString name, QString rootPath)
    : name_(std::move(name))
    , rootPath_(std::move(rootPath))
    , path_(rootPath_ + "/audiogate/" + name_)
{
}

LinuxCgroup::~LinuxCgroup() {
    destroy();
}

bool LinuxCgroup::isSupported(const QString& rootPath) {
#ifdef Q_OS_LINUX
    QFileInfo controllers(rootPath + "/cgroup.controllers");
    QFileInfo root(rootPath);
    return controllers.exists() && controllers.isReadable() && root.isWritable();
#else
    Q_UNUSED(rootPath)
    return false;
#endif
}

Expected<void, CgroupError> LinuxCgroup::create() {
    if (created_) {
        return {};
    }
    if (!isSupported(rootPath_)) {
        return makeUnexpected(CgroupError::Unavailable);
    }

    QDir cgroupDir;
    if (!cgroupDir.mkpath(path_)) {
        AUDIOGATE_ERROR("LinuxCgroup: failed to create cgroup directory: {}", path_.toStdString());
        return makeUnexpected(CgroupError::CreationFailed);
    }

    // Controllers must be enabled on the parent before the leaf exposes them
    QFile subtree(rootPath_ + "/audiogate/cgroup.subtree_control");
    if (subtree.open(QIODevice::WriteOnly)) {
        subtree.write("+memory +cpu +pids");
        subtree.close();
    }

    created_ = true;
    AUDIOGATE_DEBUG("LinuxCgroup: created {}", path_.toStdString());
    return {};
}

Expected<void, CgroupError> LinuxCgroup::setMemoryLimit(quint64 bytes) {
    return writeControl("memory.max", QByteArray::number(bytes), CgroupError::LimitFailed);
}

Expected<void, CgroupError> LinuxCgroup::setCpuLimit(quint32 percent) {
    const quint64 quota = static_cast<quint64>(percent) * 1000; // period 100000us
    return writeControl("cpu.max", QByteArray::number(quota) + " 100000", CgroupError::LimitFailed);
}

Expected<void, CgroupError> LinuxCgroup::setProcessLimit(quint32 maxProcesses) {
    return writeControl("pids.max", QByteArray::number(maxProcesses), CgroupError::LimitFailed);
}

Expected<void, CgroupError> LinuxCgroup::addProcess(qint64 pid) {
    return writeControl("cgroup.procs", QByteArray::number(pid), CgroupError::AttachFailed);
}

Expected<int, CgroupError> LinuxCgroup::joinDescriptor() {
    if (!created_) {
        return makeUnexpected(CgroupError::Unavailable);
    }
#ifdef Q_OS_LINUX
    if (procsFd_ < 0) {
        const QByteArray procs = QFile::encodeName(path_ + "/cgroup.procs");
        procsFd_ = ::open(procs.constData(), O_WRONLY | O_CLOEXEC);
        if (procsFd_ < 0) {
            AUDIOGATE_WARN("LinuxCgroup: cannot open {}: {}", procs.toStdString(), strerror(errno));
            return makeUnexpected(CgroupError::AttachFailed);
        }
    }
    return procsFd_;
#else
    return makeUnexpected(CgroupError::Unavailable);
#endif
}

bool LinuxCgroup::joinFromChild(int fd) {
#ifdef Q_OS_LINUX
    // "0" names the writing process
    return fd >= 0 && ::write(fd, "0", 1) == 1;
#else
    Q_UNUSED(fd)
    return false;
#endif
}

void LinuxCgroup::destroy() {
#ifdef Q_OS_LINUX
    if (procsFd_ >= 0) {
        ::close(procsFd_);
        procsFd_ = -1;
    }
#endif
    if (!created_) {
        return;
    }
    created_ = false;

#ifdef Q_OS_LINUX
    // cgroup.kill exists from 5.14; older kernels need per-pid signals
    QFile killFile(path_ + "/cgroup.kill");
    if (killFile.exists() && killFile.open(QIODevice::WriteOnly)) {
        killFile.write("1");
        killFile.close();
    } else {
        QFile procs(path_ + "/cgroup.procs");
        if (procs.open(QIODevice::ReadOnly)) {
            for (const QByteArray& line : procs.readAll().split('\n')) {
                bool ok = false;
                const qint64 pid = line.trimmed().toLongLong(&ok);
                if (ok) {
                    ProcFs::signalProcess(pid, SIGKILL);
                }
            }
        }
    }
#endif

    // rmdir fails with EBUSY while members are still exiting
    QDir dir;
    for (int attempt = 0; attempt < 20; ++attempt) {
        if (dir.rmdir(path_) || !QFileInfo::exists(path_)) {
            AUDIOGATE_DEBUG("LinuxCgroup: removed {}", path_.toStdString());
            return;
        }
        QThread::msleep(50);
    }
    AUDIOGATE_WARN("LinuxCgroup: cgroup {} could not be removed", path_.toStdString());
}

QString LinuxCgroup::path() const {
    return path_;
}

bool LinuxCgroup::isCreated() const {
    return created_;
}

Expected<void, CgroupError> LinuxCgroup::writeControl(const QString& file, const QByteArray& value,
                                                      CgroupError failure) {
    if (!created_) {
        return makeUnexpected(CgroupError::Unavailable);
    }

    QFile control(path_ + "/" + file);
    if (!control.open(QIODevice::WriteOnly)) {
        AUDIOGATE_WARN("LinuxCgroup: cannot open {}: {}",
                       control.fileName().toStdString(), control.errorString().toStdString());
        return makeUnexpected(failure);
    }
    if (control.write(value) != value.size()) {
        AUDIOGATE_WARN("LinuxCgroup: write of '{}' to {} failed",
                       value.toStdString(), control.fileName().toStdString());
        return makeUnexpected(failure);
    }
    return {};
}

} // namespace AudioGate
