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

#include "mcclustersummary.h"
#include "mcsession.h"

#include <QJsonArray>
#include <QSet>
#include <QStringList>

class MCClusterSummaryPrivate {
public:
    MCClusterSummary* q;
    QList<ClusterSummaryRow> m_rows;
    QVector<int> m_selected_spikes;
    int m_update_count = 0;

    void refresh_rows();
    void refresh_selection();
};

MCClusterSummary::MCClusterSummary(MCSession* session, QObject* parent)
    : MCAbstractSessionObserver(session, parent)
{
    d = new MCClusterSummaryPrivate;
    d->q = this;

    //the session may already be open
    d->refresh_rows();
    d->refresh_selection();
}

MCClusterSummary::~MCClusterSummary()
{
    delete d;
}

QList<ClusterSummaryRow> MCClusterSummary::rows() const
{
    return d->m_rows;
}

QList<int> MCClusterSummary::clusterIds() const
{
    QList<int> ret;
    foreach (const ClusterSummaryRow& row, d->m_rows) {
        ret << row.cluster_id;
    }
    return ret;
}

QVector<int> MCClusterSummary::selectedSpikes() const
{
    return d->m_selected_spikes;
}

int MCClusterSummary::updateCount() const
{
    return d->m_update_count;
}

QString MCClusterSummary::toText() const
{
    QStringList lines;
    foreach (const ClusterSummaryRow& row, d->m_rows) {
        lines << QString("%1%2\t%3\t%4").arg(row.selected ? "*" : " ").arg(row.cluster_id).arg(row.num_spikes).arg(row.group);
    }
    lines << QString("%1 clusters, %2 selected spikes").arg(d->m_rows.count()).arg(d->m_selected_spikes.count());
    return lines.join("\n");
}

QJsonObject MCClusterSummary::toJsonObject() const
{
    QJsonArray clusters;
    foreach (const ClusterSummaryRow& row, d->m_rows) {
        QJsonObject obj;
        obj["id"] = row.cluster_id;
        obj["num_spikes"] = row.num_spikes;
        obj["group"] = row.group;
        obj["selected"] = row.selected;
        clusters.append(obj);
    }
    QJsonArray spikes;
    for (int i = 0; i < d->m_selected_spikes.count(); i++) {
        spikes.append(d->m_selected_spikes[i]);
    }
    QJsonObject ret;
    ret["clusters"] = clusters;
    ret["selected_spikes"] = spikes;
    return ret;
}

void MCClusterSummary::onOpen()
{
    d->m_update_count = 0;
    d->refresh_rows();
    d->refresh_selection();
}

void MCClusterSummary::onCluster(const ClusterUpdate& up, bool add_to_stack)
{
    Q_UNUSED(up)
    Q_UNUSED(add_to_stack)
    d->m_update_count++;
    d->refresh_rows();
    d->refresh_selection();
}

void MCClusterSummary::onSelect()
{
    d->refresh_selection();
}

void MCClusterSummaryPrivate::refresh_rows()
{
    m_rows.clear();
    MCSession* s = q->session();
    if ((!s) || (!s->isOpen()))
        return;
    QMap<int, int> counts = s->clustering()->clusterCounts();
    QList<int> ids = counts.keys();
    foreach (int k, ids) {
        ClusterSummaryRow row;
        row.cluster_id = k;
        row.num_spikes = counts[k];
        row.group = s->clusterMetadata()->group(k);
        m_rows << row;
    }
}

void MCClusterSummaryPrivate::refresh_selection()
{
    m_selected_spikes.clear();
    MCSession* s = q->session();
    if ((!s) || (!s->isOpen()))
        return;
    QSet<int> selected = s->selectedClusters().toSet();
    for (int i = 0; i < m_rows.count(); i++) {
        m_rows[i].selected = selected.contains(m_rows[i].cluster_id);
    }
    m_selected_spikes = s->selectedSpikes();
}
