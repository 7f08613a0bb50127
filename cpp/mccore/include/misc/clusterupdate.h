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

#ifndef CLUSTERUPDATE_H
#define CLUSTERUPDATE_H

#include <QJsonObject>
#include <QList>
#include <QMetaType>
#include <QString>
#include <QVector>

///Describes the effect of one clustering or metadata change
struct ClusterUpdate {
    QString description; //merge, split, assign or metadata_group
    QString history; //empty, undo or redo
    QVector<int> spike_ids; //spikes whose cluster changed
    QList<int> deleted;
    QList<int> added;
    QList<int> selected; //clusters to select once the update is applied
    QList<int> metadata_changed;
    QString metadata_value;

    ///A null update is returned when nothing happened (e.g. nothing to undo)
    bool isNull() const;
    bool operator==(const ClusterUpdate& other) const;
    bool operator!=(const ClusterUpdate& other) const;
    QJsonObject toJsonObject() const;
    QString toString() const;
};

Q_DECLARE_METATYPE(ClusterUpdate)

///Error reported by a clustering operation, in the manner of QJsonParseError
struct ClusterOperationError {
    enum Error {
        NoError,
        InvalidOperation,
        NoDataset,
        ReentrantCall
    };
    ClusterOperationError(Error error0 = NoError, const QString& message0 = QString())
    {
        error = error0;
        message = message0;
    }
    void set(Error error0, const QString& message0)
    {
        error = error0;
        message = message0;
    }
    QString errorString() const;

    Error error;
    QString message;
};

#endif // CLUSTERUPDATE_H
