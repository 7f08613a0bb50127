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
#ifndef MCJSONMODEL_H
#define MCJSONMODEL_H

#include "mcabstractmodel.h"

#include <QJsonObject>

/*
 * A curation file:
 *   {"spike_clusters": [1, 1, 2, ...], "cluster_groups": {"2": "good"}}
 * spike_clusters is indexed by spike id.
 */
class MCJsonModelPrivate;
class MCJsonModel : public MCAbstractModel {
public:
    friend class MCJsonModelPrivate;
    MCJsonModel();
    virtual ~MCJsonModel();

    bool load(const QString& path, QString* error_message = 0);
    bool setFromJsonObject(const QJsonObject& obj, QString* error_message = 0);
    QString path() const;

    QString name() const Q_DECL_OVERRIDE;
    QVector<int> spikeClusters() const Q_DECL_OVERRIDE;
    ClusterMetadata* clusterMetadata() Q_DECL_OVERRIDE;

    static bool write(const QString& path, const QJsonObject& obj);

private:
    MCJsonModelPrivate* d;
};

#endif // MCJSONMODEL_H
