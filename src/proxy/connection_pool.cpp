#include "connection_pool.h"
#include "core/log_manager.h"
#include <QMutexLocker>
#include <QReadLocker>
#include <QWriteLocker>

namespace {
const char* const kDestinationProperty = "ccproxy.destination";
}

ConnectionPool::ConnectionPool(const TransportConfig& transport, int maxPerDestination,
                               QObject* parent)
    : QObject(parent)
    , m_transport(transport)
    , m_maxPerDestination(qMax(1, maxPerDestination))
{
}

ConnectionPool::~ConnectionPool()
{
    // Replies still parented to a manager die with it and must not
    // come back through release().
    m_closing = true;
    QWriteLocker locker(&m_bucketsLock);
    for (const std::shared_ptr<Bucket>& bucket : std::as_const(m_buckets)) {
        QMutexLocker bucketLocker(&bucket->mutex);
        qDeleteAll(bucket->idle);
        qDeleteAll(bucket->active);
        qDeleteAll(bucket->retiring);
    }
    m_buckets.clear();
}

QString ConnectionPool::destinationKey(const QUrl& url)
{
    const QString scheme = url.scheme().toLower();
    const int port = url.port(scheme == QLatin1String("https") ? 443 : 80);
    return QStringLiteral("%1://%2:%3").arg(scheme, url.host().toLower()).arg(port);
}

ConnectionPool::Bucket* ConnectionPool::findBucket(const QString& key) const
{
    QReadLocker locker(&m_bucketsLock);
    auto it = m_buckets.constFind(key);
    return it == m_buckets.constEnd() ? nullptr : it.value().get();
}

ConnectionPool::Bucket* ConnectionPool::bucketFor(const QString& key)
{
    if (Bucket* bucket = findBucket(key))
        return bucket;

    QWriteLocker locker(&m_bucketsLock);
    std::shared_ptr<Bucket>& slot = m_buckets[key];
    if (!slot)
        slot = std::make_shared<Bucket>();
    return slot.get();
}

QNetworkAccessManager* ConnectionPool::createManager(const QString& key) const
{
    auto* nam = new QNetworkAccessManager;
    nam->setProxyFactory(m_transport.createProxyFactory());
    nam->setProperty(kDestinationProperty, key);
    return nam;
}

QNetworkAccessManager* ConnectionPool::acquire(const QUrl& destination)
{
    const QString key = destinationKey(destination);
    Bucket* bucket = bucketFor(key);
    QMutexLocker locker(&bucket->mutex);

    // Prefer an idle manager to reuse its TCP/TLS sessions
    if (!bucket->idle.isEmpty()) {
        QNetworkAccessManager* nam = bucket->idle.dequeue();
        bucket->active.insert(nam);
        LOG_DEBUG(QStringLiteral("ConnectionPool: reused manager for %1 (active=%2, idle=%3)")
                      .arg(key)
                      .arg(bucket->active.size())
                      .arg(bucket->idle.size()));
        return nam;
    }

    if (bucket->active.size() >= m_maxPerDestination) {
        LOG_WARNING(QStringLiteral("ConnectionPool: %1 exceeds %2 managers, "
                                   "creating overflow manager (active=%3)")
                        .arg(key)
                        .arg(m_maxPerDestination)
                        .arg(bucket->active.size()));
    }

    QNetworkAccessManager* nam = createManager(key);
    bucket->active.insert(nam);
    LOG_DEBUG(QStringLiteral("ConnectionPool: created manager for %1 (active=%2, idle=%3)")
                  .arg(key)
                  .arg(bucket->active.size())
                  .arg(bucket->idle.size()));
    return nam;
}

void ConnectionPool::release(QNetworkAccessManager* nam)
{
    if (!nam || m_closing) {
        return;
    }

    const QString key = nam->property(kDestinationProperty).toString();
    Bucket* bucket = findBucket(key);
    if (!bucket) {
        LOG_WARNING(QStringLiteral("ConnectionPool: release of untracked manager, deleting"));
        nam->deleteLater();
        return;
    }

    QMutexLocker locker(&bucket->mutex);
    if (bucket->retiring.remove(nam)) {
        nam->deleteLater();
        return;
    }
    if (!bucket->active.remove(nam)) {
        LOG_WARNING(QStringLiteral("ConnectionPool: release of untracked manager, deleting"));
        nam->deleteLater();
        return;
    }

    // Over capacity: destroy instead of keeping it idle
    if (bucket->idle.size() + bucket->active.size() + 1 > m_maxPerDestination) {
        nam->deleteLater();
        return;
    }
    bucket->idle.enqueue(nam);
    LOG_DEBUG(QStringLiteral("ConnectionPool: returned manager for %1 (active=%2, idle=%3)")
                  .arg(key)
                  .arg(bucket->active.size())
                  .arg(bucket->idle.size()));
}

void ConnectionPool::releaseWith(QNetworkReply* reply, QNetworkAccessManager* nam)
{
    connect(reply, &QObject::destroyed, this, [this, nam]() { release(nam); });
}

void ConnectionPool::clear()
{
    QWriteLocker locker(&m_bucketsLock);
    for (const std::shared_ptr<Bucket>& bucket : std::as_const(m_buckets)) {
        QMutexLocker bucketLocker(&bucket->mutex);
        qDeleteAll(bucket->idle);
        bucket->idle.clear();
        // Active managers still carry live replies; they go on release.
        bucket->retiring.unite(bucket->active);
        bucket->active.clear();
    }
    LOG_DEBUG(QStringLiteral("ConnectionPool: cleared"));
}

int ConnectionPool::activeCount() const
{
    QReadLocker locker(&m_bucketsLock);
    int count = 0;
    for (const std::shared_ptr<Bucket>& bucket : m_buckets) {
        QMutexLocker bucketLocker(&bucket->mutex);
        count += bucket->active.size() + bucket->retiring.size();
    }
    return count;
}

int ConnectionPool::idleCount() const
{
    QReadLocker locker(&m_bucketsLock);
    int count = 0;
    for (const std::shared_ptr<Bucket>& bucket : m_buckets) {
        QMutexLocker bucketLocker(&bucket->mutex);
        count += bucket->idle.size();
    }
    return count;
}

int ConnectionPool::destinationCount() const
{
    QReadLocker locker(&m_bucketsLock);
    return m_buckets.size();
}
