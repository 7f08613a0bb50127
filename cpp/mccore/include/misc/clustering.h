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

#ifndef CLUSTERING_H
#define CLUSTERING_H

#include "clusterupdate.h"
#include "globalhistory.h"

#include <QList>
#include <QMap>
#include <QSet>
#include <QVector>

/*
 * Assignment of every spike (0..nSpikes()-1) to a cluster id.
 *
 * New cluster ids come from a counter that only grows, so a cluster id
 * always denotes the same set of spikes for the lifetime of the object.
 * merge() and split() are all-or-nothing: on invalid input they return a
 * null update and leave the assignment untouched.
 */
class ClusteringPrivate;
class Clustering : public HistoryTarget {
public:
    friend class ClusteringPrivate;
    Clustering(const QVector<int>& spike_clusters = QVector<int>());
    Clustering(const Clustering& other);
    virtual ~Clustering();
    void operator=(const Clustering& other);

    QVector<int> spikeClusters() const;
    QList<int> clusterIds() const; //sorted
    int nSpikes() const;
    int nClusters() const;
    bool hasCluster(int cluster_id) const;
    int clusterOf(int spike_id) const; //-1 if out of range (cluster ids are never negative)
    QVector<int> spikesInCluster(int cluster_id) const;
    QVector<int> spikesInClusters(const QList<int>& cluster_ids) const; //sorted
    QMap<int, int> clusterCounts() const;
    int newClusterId() const; //the id the next operation will mint

    ClusterUpdate merge(const QSet<int>& cluster_ids, ClusterOperationError* error = 0);
    ClusterUpdate merge(const QList<int>& cluster_ids, ClusterOperationError* error = 0);
    ClusterUpdate split(const QSet<int>& spike_ids, ClusterOperationError* error = 0);
    ClusterUpdate split(const QList<int>& spike_ids, ClusterOperationError* error = 0);

    QVariant captureState() const Q_DECL_OVERRIDE;
    ClusterUpdate restoreState(const QVariant& state) Q_DECL_OVERRIDE;

private:
    ClusteringPrivate* d;
};

#endif // CLUSTERING_H
