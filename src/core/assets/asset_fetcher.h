#pragma once

#include "cutline/result.hpp"
#include "../models/job.h"

#include <QHash>
#include <QNetworkAccessManager>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <optional>

class QNetworkReply;

namespace cutline {

/**
 * Resolves asset URLs to files in a local, append-only cache
 *
 * Cache key is md5(url) plus the URL path's extension. Existing files are reused
 * without a request. Downloads stream into a QSaveFile so a cache entry is either
 * complete or absent. resolve() is all-or-nothing and blocks on a local event
 * loop, so timers on the calling thread (the watchdog) keep firing.
 */
class AssetFetcher : public QObject
{
    Q_OBJECT

public:
    AssetFetcher(const QString& cacheDir, int transferTimeoutMs, QObject* parent = nullptr);

    /**
     * Algorithm: Deduplicate → Reuse cached → Download missing → Map url → path
     */
    Result<QHash<QString, QString>, JobError> resolve(const QStringList& urls);

    QString cachePathFor(const QString& url) const;
    static QString cacheFileName(const QString& url);

    bool isDownloading() const { return !m_reply.isNull(); }

public slots:
    // Cancels the transfer in flight and fails the current resolve()
    void abort();

signals:
    void downloadStarted(const QString& url);
    void downloadFinished(const QString& url, qint64 bytes);

private:
    std::optional<JobError> download(const QString& url, const QString& targetPath);

    QString m_cacheDir;
    int m_transferTimeoutMs;
    QNetworkAccessManager m_network;
    QPointer<QNetworkReply> m_reply;
    bool m_aborted = false;
};

} // namespace cutline
