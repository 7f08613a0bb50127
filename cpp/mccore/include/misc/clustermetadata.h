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

#ifndef CLUSTERMETADATA_H
#define CLUSTERMETADATA_H

#include "clusterupdate.h"
#include "globalhistory.h"

#include <QJsonObject>
#include <QMap>

///Group assignment of clusters (noise, mua, good, unsorted, ...)
class ClusterMetadataPrivate;
class ClusterMetadata : public HistoryTarget {
public:
    friend class ClusterMetadataPrivate;
    ClusterMetadata();
    ClusterMetadata(const ClusterMetadata& other);
    virtual ~ClusterMetadata();
    void operator=(const ClusterMetadata& other);
    bool operator==(const ClusterMetadata& other) const;

    static QString defaultGroup();

    QString group(int cluster_id) const;
    QMap<int, QString> groups() const; //only the clusters with an explicit group
    ClusterUpdate setGroup(const QList<int>& cluster_ids, const QString& group);
    void clear();

    QJsonObject toJsonObject() const;
    void setFromJsonObject(const QJsonObject& obj);

    QVariant captureState() const Q_DECL_OVERRIDE;
    ClusterUpdate restoreState(const QVariant& state) Q_DECL_OVERRIDE;

private:
    ClusterMetadataPrivate* d;
};

#endif // CLUSTERMETADATA_H
