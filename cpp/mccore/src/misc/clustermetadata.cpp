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

#include "clustermetadata.h"

#include <QDebug>
#include <QSet>
#include <QStringList>

class ClusterMetadataPrivate {
public:
    ClusterMetadata* q;
    QMap<int, QString> m_groups;
};

ClusterMetadata::ClusterMetadata()
{
    d = new ClusterMetadataPrivate;
    d->q = this;
}

ClusterMetadata::ClusterMetadata(const ClusterMetadata& other)
    : HistoryTarget()
{
    d = new ClusterMetadataPrivate;
    d->q = this;
    d->m_groups = other.d->m_groups;
}

ClusterMetadata::~ClusterMetadata()
{
    delete d;
}

void ClusterMetadata::operator=(const ClusterMetadata& other)
{
    d->m_groups = other.d->m_groups;
}

bool ClusterMetadata::operator==(const ClusterMetadata& other) const
{
    return (d->m_groups == other.d->m_groups);
}

QString ClusterMetadata::defaultGroup()
{
    return "unsorted";
}

QString ClusterMetadata::group(int cluster_id) const
{
    return d->m_groups.value(cluster_id, defaultGroup());
}

QMap<int, QString> ClusterMetadata::groups() const
{
    return d->m_groups;
}

ClusterUpdate ClusterMetadata::setGroup(const QList<int>& cluster_ids, const QString& group)
{
    QList<int> ids = cluster_ids.toSet().toList();
    qSort(ids);
    foreach (int k, ids) {
        d->m_groups[k] = group;
    }
    ClusterUpdate up;
    up.description = "metadata_group";
    up.metadata_changed = ids;
    up.metadata_value = group;
    return up;
}

void ClusterMetadata::clear()
{
    d->m_groups.clear();
}

QJsonObject ClusterMetadata::toJsonObject() const
{
    QJsonObject ret;
    QList<int> keys = d->m_groups.keys();
    foreach (int k, keys) {
        ret[QString("%1").arg(k)] = d->m_groups[k];
    }
    return ret;
}

void ClusterMetadata::setFromJsonObject(const QJsonObject& obj)
{
    d->m_groups.clear();
    QStringList keys = obj.keys();
    foreach (QString key, keys) {
        bool ok;
        int k = key.toInt(&ok);
        if (!ok) {
            qWarning() << "Ignoring cluster group with non-integer cluster id" << key;
            continue;
        }
        d->m_groups[k] = obj[key].toString();
    }
}

QVariant ClusterMetadata::captureState() const
{
    return QVariant(toJsonObject());
}

ClusterUpdate ClusterMetadata::restoreState(const QVariant& state)
{
    QMap<int, QString> old_groups = d->m_groups;
    setFromJsonObject(state.toJsonObject());

    QSet<int> ids = old_groups.keys().toSet() + d->m_groups.keys().toSet();
    QList<int> changed;
    foreach (int k, ids) {
        if (old_groups.value(k, defaultGroup()) != group(k))
            changed << k;
    }
    qSort(changed);

    ClusterUpdate up;
    up.description = "metadata_group";
    up.metadata_changed = changed;
    //a restore can move clusters to different groups at once; report the first
    if (!changed.isEmpty())
        up.metadata_value = group(changed.first());
    return up;
}
