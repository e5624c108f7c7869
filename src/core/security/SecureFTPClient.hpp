#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QUrl>
#include <memory>

#include "core/common/Expected.hpp"
#include "core/common/SecurityConfig.hpp"

class QIODevice;

namespace AudioGate {

enum class FetchError {
    InvalidTarget,
    HostNotAllowed,
    InsecureProtocol,
    AnonymousNotAllowed,
    ChecksumMissing,
    ChecksumMismatch,
    TransferFailed,
    IOError
};

QString toString(FetchError error);

enum class TransferError {
    ConnectFailed,
    AuthenticationFailed,
    HostKeyRejected,
    RemoteNotFound,
    Timeout,
    TooLarge,
    WriteFailed,
    ProtocolError
};

QString toString(TransferError error);

struct FetchTarget {
    QUrl url;               // sftp://host[:port]/path or ftp://host[:port]/path
    QString username;
    QString password;
    QString expectedSha256;
};

struct FetchResult {
    QString localPath;
    QString checksum;
    qint64 sizeBytes = 0;
    QString host;
    QString scheme;

    QJsonObject toJson() const;
};

struct TransferRequest {
    QUrl url;
    QString username;
    QString password;
    QString knownHostsFile;
    int connectTimeoutSeconds = 30;
    int transferTimeoutSeconds = 600;
    qint64 maxBytes = 0;
};

/**
 * @brief Moves the bytes of one remote file into a local device.
 */
class FetchTransport {
public:
    virtual ~FetchTransport() = default;
    virtual Expected<qint64, TransferError> download(const TransferRequest& request, QIODevice& sink) = 0;
};

// libcurl backed transport for sftp:// and ftp:// URLs
class CurlTransport : public FetchTransport {
public:
    Expected<qint64, TransferError> download(const TransferRequest& request, QIODevice& sink) override;
};

/**
 * @brief Policy gate around remote retrieval of candidate files.
 *
 * The allow-list, protocol and credential checks all run before the
 * transport is touched. Downloads land in "<destination>.part" and are only
 * renamed into place once the SHA-256 matches the expected value.
 */
class SecureFTPClient {
public:
    explicit SecureFTPClient(std::shared_ptr<const SecurityConfig> config,
                             std::unique_ptr<FetchTransport> transport = std::make_unique<CurlTransport>());

    Expected<FetchResult, FetchError> fetch(const FetchTarget& target, const QString& destination);

    Expected<void, FetchError> checkPolicy(const FetchTarget& target) const;

    // Exact, case-insensitive match; a trailing dot is ignored
    static bool isHostAllowed(const QString& host, const QStringList& allowList);
    static bool isAnonymous(const QString& username);

private:
    std::shared_ptr<const SecurityConfig> config_;
    std::unique_ptr<FetchTransport> transport_;
};

} // namespace AudioGate
