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

#ifndef MCCLUSTERSUMMARY_H
#define MCCLUSTERSUMMARY_H

#include "mcabstractsessionobserver.h"

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QVector>

struct ClusterSummaryRow {
    int cluster_id = -1;
    int num_spikes = 0;
    QString group;
    bool selected = false;
};

///Read-only snapshot of a session for a cluster list (ids, groups, counts, selection)
class MCClusterSummaryPrivate;
class MCClusterSummary : public MCAbstractSessionObserver {
    Q_OBJECT
public:
    friend class MCClusterSummaryPrivate;
    MCClusterSummary(MCSession* session, QObject* parent = 0);
    virtual ~MCClusterSummary();

    QList<ClusterSummaryRow> rows() const;
    QList<int> clusterIds() const;
    QVector<int> selectedSpikes() const;
    int updateCount() const; //number of cluster notifications received
    QString toText() const;
    QJsonObject toJsonObject() const;

protected slots:
    void onOpen() Q_DECL_OVERRIDE;
    void onCluster(const ClusterUpdate& up, bool add_to_stack) Q_DECL_OVERRIDE;
    void onSelect() Q_DECL_OVERRIDE;

private:
    MCClusterSummaryPrivate* d;
};

#endif // MCCLUSTERSUMMARY_H
