/*
 * Copyright 2016-2017 Flatiron Institute, Simons Foundation
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "clustering.h"

#include <QDebug>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(CL, "mc.clustering")

class ClusteringPrivate {
public:
    Clustering* q;
    QVector<int> m_spike_clusters;
    QMap<int, QVector<int> > m_spikes_per_cluster; //spike ids are kept in increasing order
    int m_next_id = 0;

    void rebuild_index();
    void assign(const QVector<int>& spike_ids, int cluster_id);
    void copy_from(const ClusteringPrivate* other);
    void fail(ClusterOperationError* error, const QString& message) const;
};

QList<int> sorted_list(const QSet<int>& set)
{
    QList<int> ret = set.toList();
    qSort(ret);
    return ret;
}

Clustering::Clustering(const QVector<int>& spike_clusters)
{
    d = new ClusteringPrivate;
    d->q = this;
    d->m_spike_clusters = spike_clusters;
    d->rebuild_index();
}

Clustering::Clustering(const Clustering& other)
    : HistoryTarget()
{
    d = new ClusteringPrivate;
    d->q = this;
    d->copy_from(other.d);
}

Clustering::~Clustering()
{
    delete d;
}

void Clustering::operator=(const Clustering& other)
{
    d->copy_from(other.d);
}

QVector<int> Clustering::spikeClusters() const
{
    return d->m_spike_clusters;
}

QList<int> Clustering::clusterIds() const
{
    return d->m_spikes_per_cluster.keys();
}

int Clustering::nSpikes() const
{
    return d->m_spike_clusters.count();
}

int Clustering::nClusters() const
{
    return d->m_spikes_per_cluster.count();
}

bool Clustering::hasCluster(int cluster_id) const
{
    return d->m_spikes_per_cluster.contains(cluster_id);
}

int Clustering::clusterOf(int spike_id) const
{
    if ((spike_id < 0) || (spike_id >= d->m_spike_clusters.count()))
        return -1;
    return d->m_spike_clusters[spike_id];
}

QVector<int> Clustering::spikesInCluster(int cluster_id) const
{
    return d->m_spikes_per_cluster.value(cluster_id);
}

QVector<int> Clustering::spikesInClusters(const QList<int>& cluster_ids) const
{
    QVector<int> ret;
    foreach (int k, cluster_ids.toSet()) {
        ret += d->m_spikes_per_cluster.value(k);
    }
    qSort(ret);
    return ret;
}

QMap<int, int> Clustering::clusterCounts() const
{
    QMap<int, int> ret;
    QList<int> keys = d->m_spikes_per_cluster.keys();
    foreach (int k, keys) {
        ret[k] = d->m_spikes_per_cluster[k].count();
    }
    return ret;
}

int Clustering::newClusterId() const
{
    return d->m_next_id;
}

ClusterUpdate Clustering::merge(const QSet<int>& cluster_ids, ClusterOperationError* error)
{
    if (cluster_ids.count() < 2) {
        d->fail(error, QString("merge needs at least two distinct clusters, got %1").arg(cluster_ids.count()));
        return ClusterUpdate();
    }
    QList<int> merged = sorted_list(cluster_ids);
    foreach (int k, merged) {
        if (!hasCluster(k)) {
            d->fail(error, QString("cannot merge unknown cluster %1").arg(k));
            return ClusterUpdate();
        }
    }

    int new_id = d->m_next_id;
    d->m_next_id++;
    QVector<int> spikes = spikesInClusters(merged);
    foreach (int k, merged) {
        d->m_spikes_per_cluster.remove(k);
    }
    d->assign(spikes, new_id);

    ClusterUpdate up;
    up.description = "merge";
    up.spike_ids = spikes;
    up.deleted = merged;
    up.added << new_id;
    up.selected << new_id;
    qCDebug(CL) << "Merged clusters" << merged << "into" << new_id;
    return up;
}

ClusterUpdate Clustering::merge(const QList<int>& cluster_ids, ClusterOperationError* error)
{
    return merge(cluster_ids.toSet(), error);
}

ClusterUpdate Clustering::split(const QSet<int>& spike_ids, ClusterOperationError* error)
{
    if (spike_ids.isEmpty()) {
        d->fail(error, "split needs at least one spike");
        return ClusterUpdate();
    }
    QList<int> spikes = sorted_list(spike_ids);
    if ((spikes.first() < 0) || (spikes.last() >= nSpikes())) {
        int bad = (spikes.first() < 0) ? spikes.first() : spikes.last();
        d->fail(error, QString("cannot split unknown spike %1 (%2 spikes)").arg(bad).arg(nSpikes()));
        return ClusterUpdate();
    }

    //the clusters losing spikes, in increasing order
    QMap<int, QVector<int> > remaining;
    foreach (int i, spikes) {
        int k = d->m_spike_clusters[i];
        if (!remaining.contains(k))
            remaining[k] = QVector<int>();
    }
    QList<int> donors = remaining.keys();
    foreach (int k, donors) {
        const QVector<int>& members = d->m_spikes_per_cluster[k];
        for (int j = 0; j < members.count(); j++) {
            if (!spike_ids.contains(members[j]))
                remaining[k] << members[j];
        }
    }

    ClusterUpdate up;
    up.description = "split";
    up.deleted = donors;

    int split_id = d->m_next_id;
    d->m_next_id++;
    QVector<int> peeled = spikes.toVector();
    foreach (int k, donors) {
        d->m_spikes_per_cluster.remove(k);
    }
    d->assign(peeled, split_id);
    up.added << split_id;
    up.spike_ids = peeled;

    //a donor keeping some spikes now holds a different spike set, so it gets a new id too
    foreach (int k, donors) {
        if (remaining[k].isEmpty())
            continue;
        int new_id = d->m_next_id;
        d->m_next_id++;
        d->assign(remaining[k], new_id);
        up.added << new_id;
        up.spike_ids += remaining[k];
    }
    qSort(up.spike_ids);
    up.selected = up.added;

    qCDebug(CL) << "Split" << spikes.count() << "spikes from" << donors << "into" << up.added;
    return up;
}

ClusterUpdate Clustering::split(const QList<int>& spike_ids, ClusterOperationError* error)
{
    return split(spike_ids.toSet(), error);
}

QVariant Clustering::captureState() const
{
    return QVariant::fromValue(d->m_spike_clusters);
}

ClusterUpdate Clustering::restoreState(const QVariant& state)
{
    QVector<int> spike_clusters = state.value<QVector<int> >();
    if (spike_clusters.count() != nSpikes()) {
        qCWarning(CL) << "Ignoring restored state with" << spike_clusters.count() << "spikes, expected" << nSpikes();
        return ClusterUpdate();
    }

    QSet<int> old_ids = d->m_spikes_per_cluster.keys().toSet();
    ClusterUpdate up;
    up.description = "assign";
    for (int i = 0; i < spike_clusters.count(); i++) {
        if (spike_clusters[i] != d->m_spike_clusters[i])
            up.spike_ids << i;
    }
    d->m_spike_clusters = spike_clusters;
    d->rebuild_index();

    QSet<int> new_ids = d->m_spikes_per_cluster.keys().toSet();
    up.deleted = sorted_list(old_ids - new_ids);
    up.added = sorted_list(new_ids - old_ids);
    up.selected = up.added;
    return up;
}

void ClusteringPrivate::rebuild_index()
{
    m_spikes_per_cluster.clear();
    for (int i = 0; i < m_spike_clusters.count(); i++) {
        m_spikes_per_cluster[m_spike_clusters[i]] << i;
    }
    //ids are never handed out twice, even across restores
    if (!m_spikes_per_cluster.isEmpty()) {
        int max_id = m_spikes_per_cluster.lastKey();
        if (max_id + 1 > m_next_id)
            m_next_id = max_id + 1;
    }
}

void ClusteringPrivate::assign(const QVector<int>& spike_ids, int cluster_id)
{
    for (int j = 0; j < spike_ids.count(); j++) {
        m_spike_clusters[spike_ids[j]] = cluster_id;
    }
    QVector<int>& members = m_spikes_per_cluster[cluster_id];
    members += spike_ids;
    qSort(members);
}

void ClusteringPrivate::copy_from(const ClusteringPrivate* other)
{
    m_spike_clusters = other->m_spike_clusters;
    m_spikes_per_cluster = other->m_spikes_per_cluster;
    m_next_id = other->m_next_id;
}

void ClusteringPrivate::fail(ClusterOperationError* error, const QString& message) const
{
    qCWarning(CL) << message;
    if (error)
        error->set(ClusterOperationError::InvalidOperation, message);
}
