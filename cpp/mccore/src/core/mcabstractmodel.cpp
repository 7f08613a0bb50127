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
#include "mcabstractmodel.h"

MCMemoryModel::MCMemoryModel(const QVector<int>& spike_clusters, const QMap<int, QString>& groups)
    : m_name("memory")
    , m_spike_clusters(spike_clusters)
{
    QList<int> keys = groups.keys();
    foreach (int k, keys) {
        QList<int> tmp;
        tmp << k;
        m_cluster_metadata.setGroup(tmp, groups[k]);
    }
}

MCMemoryModel::~MCMemoryModel()
{
}

void MCMemoryModel::setName(const QString& name)
{
    m_name = name;
}

QString MCMemoryModel::name() const
{
    return m_name;
}

QVector<int> MCMemoryModel::spikeClusters() const
{
    return m_spike_clusters;
}

ClusterMetadata* MCMemoryModel::clusterMetadata()
{
    return &m_cluster_metadata;
}
