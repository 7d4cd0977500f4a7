#pragma once
#include "config/transport_config.h"
#include <QHash>
#include <QMutex>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>
#include <QQueue>
#include <QReadWriteLock>
#include <QSet>
#include <QUrl>
#include <memory>

// Per-destination pools of network access managers. Each destination
// (scheme://host:port) has its own bucket and lock; the bucket map is
// guarded by a read/write lock, so requests to different destinations
// never contend.
//
// The pool owns every manager it hands out. Managers still in use when the
// pool is cleared are deleted on release; the pool's destructor deletes
// all of them.
class ConnectionPool : public QObject {
    Q_OBJECT
public:
    explicit ConnectionPool(const TransportConfig& transport, int maxPerDestination = 8,
                            QObject* parent = nullptr);
    ~ConnectionPool() override;

    QNetworkAccessManager* acquire(const QUrl& destination);
    void release(QNetworkAccessManager* nam);
    // Releases nam once reply is destroyed.
    void releaseWith(QNetworkReply* reply, QNetworkAccessManager* nam);
    void clear();

    int activeCount() const;
    int idleCount() const;
    int destinationCount() const;

    static QString destinationKey(const QUrl& url);

private:
    struct Bucket {
        QMutex mutex;
        QQueue<QNetworkAccessManager*> idle;
        QSet<QNetworkAccessManager*> active;
        QSet<QNetworkAccessManager*> retiring;
    };

    Bucket* bucketFor(const QString& key);
    Bucket* findBucket(const QString& key) const;
    QNetworkAccessManager* createManager(const QString& key) const;

    TransportConfig m_transport;
    int m_maxPerDestination;
    QHash<QString, std::shared_ptr<Bucket>> m_buckets;
    mutable QReadWriteLock m_bucketsLock;
    bool m_closing = false;
};
