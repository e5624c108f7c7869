#include "ChrootSandbox.hpp"
#include "core/common/Logger.hpp"
#include "platform/linux/LinuxCgroup.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QMutexLocker>
#include <QtCore/QStandardPaths>
#include <QtCore/QUuid>

#ifdef Q_OS_LINUX
#include <grp.h>
#include <sys/resource.h>
#include <unistd.h>
#endif

namespace AudioGate {

ChrootSandbox::ChrootSandbox(QString basePath, QStringList libraries, QStringList programs)
    : basePath_(QDir::cleanPath(std::move(basePath)))
    , libraries_(std::move(libraries))
    , programs_(std::move(programs))
{
}

ChrootSandbox::~ChrootSandbox() = default;

bool ChrootSandbox::isAvailable() {
#ifdef Q_OS_LINUX
    if (::geteuid() != 0) {
        AUDIOGATE_DEBUG("ChrootSandbox: not running as root");
        return false;
    }
    for (const QString& program : programs_) {
        if (QStandardPaths::findExecutable(program).isEmpty() && !QFileInfo(program).isExecutable()) {
            AUDIOGATE_DEBUG("ChrootSandbox: program {} not found", program.toStdString());
            return false;
        }
    }
    return true;
#else
    return false;
#endif
}

Expected<SandboxHandle, SandboxError> ChrootSandbox::open(const SandboxLimits& limits) {
    SandboxHandle handle;
    handle.id = "chroot_" + QUuid::createUuid().toString(QUuid::Id128).left(12);
    handle.kind = SandboxKind::Chroot;
    handle.limits = limits;
    handle.location = basePath_ + "/" + handle.id;
    handle.workDir = handle.location + "/work";

    if (!populate(handle.location)) {
        QDir(handle.location).removeRecursively();
        return makeUnexpected(SandboxError::CreationFailed);
    }

    auto cgroup = std::make_shared<LinuxCgroup>(handle.id);
    if (LinuxCgroup::isSupported() && cgroup->create()) {
        const quint64 memoryBytes = static_cast<quint64>(limits.memoryMb) * 1024 * 1024;
        if (!cgroup->setMemoryLimit(memoryBytes) ||
            !cgroup->setCpuLimit(static_cast<quint32>(limits.cpuPercent)) ||
            !cgroup->setProcessLimit(static_cast<quint32>(limits.maxProcesses))) {
            AUDIOGATE_WARN("ChrootSandbox: cgroup limits for {} only partially applied", handle.id.toStdString());
        }
        if (!cgroup->joinDescriptor()) {
            cgroup->destroy();
            QDir(handle.location).removeRecursively();
            return makeUnexpected(SandboxError::CreationFailed);
        }
        handle.cgroupPath = cgroup->path();
        QMutexLocker locker(&mutex_);
        cgroups_.insert(handle.id, cgroup);
    } else {
        AUDIOGATE_INFO("ChrootSandbox: no delegated cgroup v2 hierarchy, relying on rlimits");
    }

    AUDIOGATE_DEBUG("ChrootSandbox: prepared {}", handle.location.toStdString());
    return handle;
}

bool ChrootSandbox::populate(const QString& root) const {
    QDir dir;
    for (const char* sub : {"/bin", "/work", "/tmp"}) {
        if (!dir.mkpath(root + sub)) {
            AUDIOGATE_ERROR("ChrootSandbox: cannot create {}{}", root.toStdString(), sub);
            return false;
        }
    }

    // The jailed process runs as nobody and must be able to write its output
    const auto openPermissions = QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner |
                                 QFileDevice::ReadGroup | QFileDevice::WriteGroup | QFileDevice::ExeGroup |
                                 QFileDevice::ReadOther | QFileDevice::WriteOther | QFileDevice::ExeOther;
    if (!QFile::setPermissions(root + "/work", openPermissions) ||
        !QFile::setPermissions(root + "/tmp", openPermissions)) {
        AUDIOGATE_ERROR("ChrootSandbox: cannot open up {} for the jailed user", root.toStdString());
        return false;
    }

    for (const QString& program : programs_) {
        QString source = QStandardPaths::findExecutable(program);
        if (source.isEmpty()) {
            source = program;
        }
        if (!copyInto(source, root + "/bin/" + QFileInfo(program).fileName())) {
            AUDIOGATE_ERROR("ChrootSandbox: cannot copy program {}", source.toStdString());
            return false;
        }
    }

    for (const QString& library : libraries_) {
        if (!QFileInfo::exists(library)) {
            AUDIOGATE_WARN("ChrootSandbox: library {} not present on host, skipped", library.toStdString());
            continue;
        }
        if (!copyInto(library, root + library)) {
            AUDIOGATE_ERROR("ChrootSandbox: cannot copy library {}", library.toStdString());
            return false;
        }
    }
    return true;
}

bool ChrootSandbox::copyInto(const QString& source, const QString& target) {
    QDir dir;
    if (!dir.mkpath(QFileInfo(target).absolutePath())) {
        return false;
    }
    // Follow symlinks so the jail holds real files
    const QString resolved = QFileInfo(source).canonicalFilePath();
    if (resolved.isEmpty() || !QFile::copy(resolved, target)) {
        return false;
    }
    return QFile::setPermissions(target, QFile::permissions(resolved));
}

Expected<LaunchSpec, SandboxError> ChrootSandbox::wrapCommand(const SandboxHandle& handle,
                                                              const QString& program,
                                                              const QStringList& arguments) {
    if (!handle.isValid() || !QFileInfo::exists(handle.location)) {
        return makeUnexpected(SandboxError::UnknownHandle);
    }

    LaunchSpec spec;
    spec.program = "/bin/" + QFileInfo(program).fileName();
    spec.arguments = arguments;

    QProcessEnvironment environment;
    environment.insert("PATH", "/bin");
    environment.insert("HOME", "/work");
    environment.insert("TMPDIR", "/tmp");
    environment.insert("LANG", "C.UTF-8");
    spec.environment = environment;

#ifdef Q_OS_LINUX
    int joinFd = -1;
    {
        QMutexLocker locker(&mutex_);
        const std::shared_ptr<LinuxCgroup> cgroup = cgroups_.value(handle.id);
        if (cgroup) {
            auto descriptor = cgroup->joinDescriptor();
            if (!descriptor) {
                return makeUnexpected(SandboxError::LaunchFailed);
            }
            joinFd = descriptor.value();
        }
    }

    const QByteArray root = QFile::encodeName(handle.location);
    const rlim_t addressSpace = static_cast<rlim_t>(handle.limits.memoryMb) * 1024 * 1024;
    spec.childSetup = [root, addressSpace, joinFd]() {
        // Join before exec so no descendant can start outside the limits
        if (joinFd >= 0 && !LinuxCgroup::joinFromChild(joinFd)) {
            ::_exit(126);
        }
        if (::chroot(root.constData()) != 0 || ::chdir("/work") != 0) {
            ::_exit(126);
        }
        struct rlimit limit;
        limit.rlim_cur = addressSpace;
        limit.rlim_max = addressSpace;
        if (::setrlimit(RLIMIT_AS, &limit) != 0) {
            ::_exit(126);
        }
        if (!dropPrivileges(kNobodyId, kNobodyId)) {
            ::_exit(126);
        }
    };
#endif
    return spec;
}

bool ChrootSandbox::dropPrivileges(int uid, int gid) {
#ifdef Q_OS_LINUX
    // Supplementary groups first, they survive setgid and setuid otherwise
    return ::setgroups(0, nullptr) == 0 &&
           ::setgid(static_cast<gid_t>(gid)) == 0 &&
           ::setuid(static_cast<uid_t>(uid)) == 0;
#else
    Q_UNUSED(uid)
    Q_UNUSED(gid)
    return false;
#endif
}

QString ChrootSandbox::sandboxPath(const SandboxHandle& handle, const QString& hostPath) const {
    const QString cleaned = QDir::cleanPath(hostPath);
    if (cleaned.startsWith(handle.location + "/")) {
        return cleaned.mid(handle.location.size());
    }
    return hostPath;
}

Expected<void, SandboxError> ChrootSandbox::close(const SandboxHandle& handle) {
    std::shared_ptr<LinuxCgroup> cgroup;
    {
        QMutexLocker locker(&mutex_);
        cgroup = cgroups_.take(handle.id);
    }
    if (cgroup) {
        // Kills anything still inside before the directory goes away
        cgroup->destroy();
    }

    const QString root = QDir::cleanPath(handle.location);
    if (handle.id.isEmpty() || !root.startsWith(basePath_ + "/")) {
        AUDIOGATE_ERROR("ChrootSandbox: refusing to remove {}", root.toStdString());
        return makeUnexpected(SandboxError::TeardownFailed);
    }
    if (QFileInfo::exists(root) && !QDir(root).removeRecursively()) {
        AUDIOGATE_ERROR("ChrootSandbox: could not remove {}", root.toStdString());
        return makeUnexpected(SandboxError::TeardownFailed);
    }
    return {};
}

} // namespace AudioGate
