#include "SecureFTPClient.hpp"
#include "FileValidator.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QIODevice>
#include <curl/curl.h>
#include <string>

namespace AudioGate {

QString toString(FetchError error) {
    switch (error) {
        case FetchError::InvalidTarget: return "invalid fetch target";
        case FetchError::HostNotAllowed: return "host not in allow-list";
        case FetchError::InsecureProtocol: return "plain FTP is not permitted";
        case FetchError::AnonymousNotAllowed: return "plain FTP requires non-anonymous credentials";
        case FetchError::ChecksumMissing: return "expected checksum required but not supplied";
        case FetchError::ChecksumMismatch: return "checksum mismatch";
        case FetchError::TransferFailed: return "transfer failed";
        case FetchError::IOError: return "local I/O error";
    }
    return "unknown fetch error";
}

QString toString(TransferError error) {
    switch (error) {
        case TransferError::ConnectFailed: return "connection failed";
        case TransferError::AuthenticationFailed: return "authentication failed";
        case TransferError::HostKeyRejected: return "host key rejected";
        case TransferError::RemoteNotFound: return "remote file not found";
        case TransferError::Timeout: return "transfer timed out";
        case TransferError::TooLarge: return "remote file too large";
        case TransferError::WriteFailed: return "local write failed";
        case TransferError::ProtocolError: return "protocol error";
    }
    return "unknown transfer error";
}

QJsonObject FetchResult::toJson() const {
    QJsonObject json;
    json["local_path"] = localPath;
    json["checksum"] = checksum;
    json["size_bytes"] = sizeBytes;
    json["host"] = host;
    json["scheme"] = scheme;
    return json;
}

namespace {

struct WriteContext {
    QIODevice* sink = nullptr;
    qint64 written = 0;
    qint64 maxBytes = 0;
    bool exceeded = false;
};

size_t writeToDevice(char* data, size_t size, size_t count, void* userData) {
    auto* context = static_cast<WriteContext*>(userData);
    const qint64 length = static_cast<qint64>(size * count);
    if (context->maxBytes > 0 && context->written + length > context->maxBytes) {
        context->exceeded = true;
        return 0;
    }
    if (context->sink->write(data, length) != length) {
        return 0;
    }
    context->written += length;
    return static_cast<size_t>(length);
}

TransferError mapCurlError(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
            return TransferError::ConnectFailed;
        case CURLE_LOGIN_DENIED:
            return TransferError::AuthenticationFailed;
        case CURLE_PEER_FAILED_VERIFICATION:
            return TransferError::HostKeyRejected;
        case CURLE_REMOTE_FILE_NOT_FOUND:
            return TransferError::RemoteNotFound;
        case CURLE_OPERATION_TIMEDOUT:
            return TransferError::Timeout;
        case CURLE_FILESIZE_EXCEEDED:
            return TransferError::TooLarge;
        case CURLE_WRITE_ERROR:
            return TransferError::WriteFailed;
        default:
            return TransferError::ProtocolError;
    }
}

} // namespace

Expected<qint64, TransferError> CurlTransport::download(const TransferRequest& request, QIODevice& sink) {
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), &curl_easy_cleanup);
    if (!curl) {
        return makeUnexpected(TransferError::ProtocolError);
    }

    const std::string url = request.url.toString(QUrl::FullyEncoded).toStdString();
    const std::string username = request.username.toStdString();
    const std::string password = request.password.toStdString();
    const std::string knownHosts = request.knownHostsFile.isEmpty()
        ? (QDir::homePath() + "/.ssh/known_hosts").toStdString()
        : request.knownHostsFile.toStdString();

    WriteContext context;
    context.sink = &sink;
    context.maxBytes = request.maxBytes;

    CURL* handle = curl.get();
    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
#if LIBCURL_VERSION_NUM >= 0x075500
    curl_easy_setopt(handle, CURLOPT_PROTOCOLS_STR, "sftp,ftp");
#else
    curl_easy_setopt(handle, CURLOPT_PROTOCOLS, static_cast<long>(CURLPROTO_SFTP | CURLPROTO_FTP));
#endif
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(request.connectTimeoutSeconds));
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, static_cast<long>(request.transferTimeoutSeconds));
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, writeToDevice);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(handle, CURLOPT_SSH_KNOWNHOSTS, knownHosts.c_str());
    if (!username.empty()) {
        curl_easy_setopt(handle, CURLOPT_USERNAME, username.c_str());
    }
    if (!password.empty()) {
        curl_easy_setopt(handle, CURLOPT_PASSWORD, password.c_str());
    }
    if (request.maxBytes > 0) {
        curl_easy_setopt(handle, CURLOPT_MAXFILESIZE_LARGE, static_cast<curl_off_t>(request.maxBytes));
    }

    const CURLcode code = curl_easy_perform(handle);
    if (code != CURLE_OK) {
        AUDIOGATE_WARN("CurlTransport: {} failed: {}", request.url.toDisplayString(QUrl::RemovePassword).toStdString(),
                       curl_easy_strerror(code));
        if (context.exceeded) {
            return makeUnexpected(TransferError::TooLarge);
        }
        return makeUnexpected(mapCurlError(code));
    }
    return context.written;
}

SecureFTPClient::SecureFTPClient(std::shared_ptr<const SecurityConfig> config,
                                 std::unique_ptr<FetchTransport> transport)
    : config_(std::move(config))
    , transport_(std::move(transport))
{
}

bool SecureFTPClient::isHostAllowed(const QString& host, const QStringList& allowList) {
    QString normalized = host.trimmed().toLower();
    if (normalized.endsWith('.')) {
        normalized.chop(1);
    }
    if (normalized.isEmpty() || normalized.contains('@') || normalized.contains('/')) {
        return false;
    }
    for (QString allowed : allowList) {
        allowed = allowed.trimmed().toLower();
        if (allowed.endsWith('.')) {
            allowed.chop(1);
        }
        if (allowed == normalized) {
            return true;
        }
    }
    return false;
}

bool SecureFTPClient::isAnonymous(const QString& username) {
    const QString name = username.trimmed().toLower();
    return name.isEmpty() || name == "anonymous" || name == "ftp";
}

Expected<void, FetchError> SecureFTPClient::checkPolicy(const FetchTarget& target) const {
    const QUrl& url = target.url;
    if (!url.isValid() || url.host().isEmpty() || url.path().isEmpty()) {
        return makeUnexpected(FetchError::InvalidTarget);
    }
    // Credentials travel in the target, never inside the URL
    if (!url.userInfo().isEmpty()) {
        return makeUnexpected(FetchError::InvalidTarget);
    }

    if (!isHostAllowed(url.host(), config_->allowedFtpHosts)) {
        AUDIOGATE_WARN("SecureFTPClient: host {} is not allow-listed", url.host().toStdString());
        return makeUnexpected(FetchError::HostNotAllowed);
    }

    const QString scheme = url.scheme().toLower();
    if (scheme == "ftp") {
        if (!config_->allowPlainFtp) {
            return makeUnexpected(FetchError::InsecureProtocol);
        }
        if (isAnonymous(target.username) || target.password.isEmpty()) {
            return makeUnexpected(FetchError::AnonymousNotAllowed);
        }
    } else if (scheme != "sftp") {
        return makeUnexpected(FetchError::InvalidTarget);
    }

    if (config_->requireFileChecksum && target.expectedSha256.trimmed().isEmpty()) {
        return makeUnexpected(FetchError::ChecksumMissing);
    }
    return {};
}

Expected<FetchResult, FetchError> SecureFTPClient::fetch(const FetchTarget& target, const QString& destination) {
    auto policy = checkPolicy(target);
    if (!policy) {
        AUDIOGATE_WARN("SecureFTPClient: refused {}: {}",
                       target.url.toDisplayString(QUrl::RemoveUserInfo).toStdString(),
                       toString(policy.error()).toStdString());
        return makeUnexpected(policy.error());
    }

    QDir directory;
    if (!directory.mkpath(QFileInfo(destination).absolutePath())) {
        return makeUnexpected(FetchError::IOError);
    }

    const QString partPath = destination + ".part";
    QFile part(partPath);
    if (!part.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        AUDIOGATE_ERROR("SecureFTPClient: cannot open {}: {}", partPath.toStdString(),
                        part.errorString().toStdString());
        return makeUnexpected(FetchError::IOError);
    }

    TransferRequest request;
    request.url = target.url;
    request.username = target.username;
    request.password = target.password;
    request.knownHostsFile = config_->sftpKnownHosts;
    request.connectTimeoutSeconds = config_->ftpConnectTimeoutSeconds;
    request.transferTimeoutSeconds = config_->ftpTransferTimeoutSeconds;
    request.maxBytes = config_->maxFileSizeBytes();

    AUDIOGATE_INFO("SecureFTPClient: fetching {}", target.url.toDisplayString().toStdString());
    auto transferred = transport_->download(request, part);
    part.close();
    if (!transferred) {
        AUDIOGATE_ERROR("SecureFTPClient: transfer failed: {}", toString(transferred.error()).toStdString());
        QFile::remove(partPath);
        return makeUnexpected(FetchError::TransferFailed);
    }

    auto checksum = FileValidator::calculateChecksum(partPath);
    if (!checksum) {
        QFile::remove(partPath);
        return makeUnexpected(FetchError::IOError);
    }

    const QString expected = target.expectedSha256.trimmed().toLower();
    if (!expected.isEmpty() && checksum.value() != expected) {
        AUDIOGATE_ERROR("SecureFTPClient: checksum mismatch for {} (expected {}, got {})",
                        target.url.path().toStdString(), expected.toStdString(), checksum.value().toStdString());
        QFile::remove(partPath);
        return makeUnexpected(FetchError::ChecksumMismatch);
    }

    if (QFile::exists(destination) && !QFile::remove(destination)) {
        QFile::remove(partPath);
        return makeUnexpected(FetchError::IOError);
    }
    if (!QFile::rename(partPath, destination)) {
        QFile::remove(partPath);
        return makeUnexpected(FetchError::IOError);
    }

    FetchResult result;
    result.localPath = destination;
    result.checksum = checksum.value();
    result.sizeBytes = transferred.value();
    result.host = target.url.host();
    result.scheme = target.url.scheme().toLower();
    AUDIOGATE_INFO("SecureFTPClient: stored {} ({} bytes)", destination.toStdString(), result.sizeBytes);
    return result;
}

} // namespace AudioGate
