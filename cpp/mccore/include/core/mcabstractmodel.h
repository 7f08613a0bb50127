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
#ifndef MCABSTRACTMODEL_H
#define MCABSTRACTMODEL_H

#include "clustermetadata.h"

#include <QString>
#include <QVector>

/*
 * The data a session is opened on: the initial spike/cluster assignment and
 * the cluster metadata, which the model owns and the session edits in place.
 */
class MCAbstractModel {
public:
    virtual ~MCAbstractModel() {}

    virtual QString name() const = 0;
    virtual QVector<int> spikeClusters() const = 0;
    virtual ClusterMetadata* clusterMetadata() = 0;
};

class MCMemoryModel : public MCAbstractModel {
public:
    MCMemoryModel(const QVector<int>& spike_clusters, const QMap<int, QString>& groups = QMap<int, QString>());
    virtual ~MCMemoryModel();

    void setName(const QString& name);

    QString name() const Q_DECL_OVERRIDE;
    QVector<int> spikeClusters() const Q_DECL_OVERRIDE;
    ClusterMetadata* clusterMetadata() Q_DECL_OVERRIDE;

private:
    QString m_name;
    QVector<int> m_spike_clusters;
    ClusterMetadata m_cluster_metadata;
};

#endif // MCABSTRACTMODEL_H
