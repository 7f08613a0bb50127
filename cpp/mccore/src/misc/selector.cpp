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

#include "selector.h"
#include "clustering.h"

#include <QSet>

class SelectorPrivate {
public:
    Selector* q;
    const Clustering* m_clustering;
    int m_n_spikes_max;
    QList<int> m_selected_clusters;
};

QVector<int> subsample_regular(const QVector<int>& X, int n_max)
{
    if ((n_max <= 0) || (X.count() <= n_max))
        return X;
    int step = (X.count() + n_max - 1) / n_max;
    QVector<int> ret;
    for (int i = 0; i < X.count(); i += step) {
        ret << X[i];
    }
    return ret;
}

Selector::Selector(const Clustering* clustering, int n_spikes_max)
{
    d = new SelectorPrivate;
    d->q = this;
    d->m_clustering = clustering;
    d->m_n_spikes_max = n_spikes_max;
}

Selector::~Selector()
{
    delete d;
}

int Selector::nSpikesMax() const
{
    return d->m_n_spikes_max;
}

void Selector::setNSpikesMax(int n_spikes_max)
{
    d->m_n_spikes_max = n_spikes_max;
}

const QList<int>& Selector::selectedClusters() const
{
    return d->m_selected_clusters;
}

void Selector::setSelectedClusters(const QList<int>& cluster_ids)
{
    QList<int> ks = QList<int>::fromSet(cluster_ids.toSet()); //remove duplicates
    qSort(ks);
    d->m_selected_clusters = ks;
}

QVector<int> Selector::selectedSpikes() const
{
    if ((!d->m_clustering) || (d->m_selected_clusters.isEmpty()))
        return QVector<int>();
    QVector<int> spikes = d->m_clustering->spikesInClusters(d->m_selected_clusters);
    return subsample_regular(spikes, d->m_n_spikes_max);
}
