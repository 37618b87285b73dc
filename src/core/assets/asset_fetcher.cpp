#include "asset_fetcher.h"

#include <QCryptographicHash>
#include <QDir>
#include <QEventLoop>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QSaveFile>
#include <QUrl>

Q_LOGGING_CATEGORY(cutlineFetcher, "cutline.fetcher")

namespace cutline {

AssetFetcher::AssetFetcher(const QString& cacheDir, int transferTimeoutMs, QObject* parent)
    : QObject(parent)
    , m_cacheDir(cacheDir)
    , m_transferTimeoutMs(transferTimeoutMs)
{
}

QString AssetFetcher::cacheFileName(const QString& url)
{
    const QByteArray digest = QCryptographicHash::hash(url.toUtf8(), QCryptographicHash::Md5).toHex();
    // Extension from the path only; query strings never reach the file name
    const QString suffix = QFileInfo(QUrl(url).path()).suffix();
    return suffix.isEmpty() ? QString::fromLatin1(digest)
                            : QString("%1.%2").arg(QString::fromLatin1(digest), suffix);
}

QString AssetFetcher::cachePathFor(const QString& url) const
{
    return QDir(m_cacheDir).filePath(cacheFileName(url));
}

Result<QHash<QString, QString>, JobError> AssetFetcher::resolve(const QStringList& urls)
{
    m_aborted = false;

    if (!QDir().mkpath(m_cacheDir)) {
        return JobError::assetDownload(QString("cannot create cache directory %1").arg(m_cacheDir));
    }

    // Algorithm: Deduplicate → Reuse cached → Download missing → Map url → path
    QHash<QString, QString> resolved;
    for (const QString& url : urls) {
        if (url.isEmpty() || resolved.contains(url)) {
            continue;
        }

        const QString localPath = cachePathFor(url);
        if (QFileInfo::exists(localPath)) {
            qCDebug(cutlineFetcher, "Cache hit %s -> %s", qPrintable(url), qPrintable(localPath));
            resolved.insert(url, localPath);
            continue;
        }

        if (m_aborted) {
            return JobError::assetDownload(QStringLiteral("asset download aborted"));
        }

        if (std::optional<JobError> error = download(url, localPath)) {
            qCWarning(cutlineFetcher, "Asset resolve failed: %s", qPrintable(error->message));
            return *error;
        }
        resolved.insert(url, localPath);
    }

    qCInfo(cutlineFetcher, "Resolved %lld asset(s)", static_cast<long long>(resolved.size()));
    return resolved;
}

std::optional<JobError> AssetFetcher::download(const QString& url, const QString& targetPath)
{
    const QUrl remote(url);
    const QString scheme = remote.scheme().toLower();
    if (!remote.isValid() || (scheme != "http" && scheme != "https" && scheme != "file")) {
        return JobError::assetDownload(QString("unsupported asset URL: %1").arg(url));
    }

    QSaveFile file(targetPath);
    if (!file.open(QIODevice::WriteOnly)) {
        return JobError::assetDownload(QString("cannot write %1: %2").arg(targetPath, file.errorString()));
    }

    qCInfo(cutlineFetcher, "Downloading %s", qPrintable(url));
    emit downloadStarted(url);

    QNetworkRequest request(remote);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
    request.setTransferTimeout(m_transferTimeoutMs);

    QNetworkReply* reply = m_network.get(request);
    m_reply = reply;

    bool writeFailed = false;
    connect(reply, &QNetworkReply::readyRead, this, [reply, &file, &writeFailed]() {
        const QByteArray chunk = reply->readAll();
        if (!writeFailed && file.write(chunk) != chunk.size()) {
            writeFailed = true;
            reply->abort();
        }
    });

    QEventLoop loop;
    connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (!reply->isFinished()) {
        loop.exec();
    }

    // Bytes that arrived together with the finished signal
    const QByteArray tail = reply->readAll();
    if (!writeFailed && !tail.isEmpty() && file.write(tail) != tail.size()) {
        writeFailed = true;
    }

    const QNetworkReply::NetworkError networkError = reply->error();
    const QString networkErrorText = reply->errorString();
    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    m_reply.clear();
    reply->disconnect(this);
    reply->deleteLater();

    std::optional<JobError> failure;
    if (m_aborted) {
        failure = JobError::assetDownload(QString("download aborted: %1").arg(url));
    } else if (writeFailed) {
        failure = JobError::assetDownload(QString("write failed for %1: %2").arg(targetPath, file.errorString()));
    } else if (networkError != QNetworkReply::NoError) {
        failure = JobError::assetDownload(QString("failed to download %1: %2").arg(url, networkErrorText));
    } else if (status.isValid() && (status.toInt() < 200 || status.toInt() >= 300)) {
        failure = JobError::assetDownload(QString("failed to download %1: HTTP %2").arg(url).arg(status.toInt()));
    }

    if (failure) {
        file.cancelWriting();
        return failure;
    }

    const qint64 bytes = file.size();
    if (!file.commit()) {
        return JobError::assetDownload(QString("cannot commit %1: %2").arg(targetPath, file.errorString()));
    }

    emit downloadFinished(url, bytes);
    qCDebug(cutlineFetcher, "Stored %lld bytes at %s", static_cast<long long>(bytes), qPrintable(targetPath));
    return std::nullopt;
}

void AssetFetcher::abort()
{
    m_aborted = true;
    if (m_reply) {
        qCWarning(cutlineFetcher, "Aborting download in flight");
        m_reply->abort();
    }
}

} // namespace cutline
