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

#include "clusterupdate.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QStringList>

QJsonArray intlist_to_json_array(const QList<int>& X);

bool ClusterUpdate::isNull() const
{
    return description.isEmpty();
}

bool ClusterUpdate::operator==(const ClusterUpdate& other) const
{
    return ((description == other.description) && (history == other.history)
        && (spike_ids == other.spike_ids) && (deleted == other.deleted)
        && (added == other.added) && (selected == other.selected)
        && (metadata_changed == other.metadata_changed)
        && (metadata_value == other.metadata_value));
}

bool ClusterUpdate::operator!=(const ClusterUpdate& other) const
{
    return !(*this == other);
}

QJsonObject ClusterUpdate::toJsonObject() const
{
    QJsonObject ret;
    ret["description"] = description;
    if (!history.isEmpty())
        ret["history"] = history;
    ret["deleted"] = intlist_to_json_array(deleted);
    ret["added"] = intlist_to_json_array(added);
    ret["selected"] = intlist_to_json_array(selected);
    if (!metadata_changed.isEmpty()) {
        ret["metadata_changed"] = intlist_to_json_array(metadata_changed);
        ret["metadata_value"] = metadata_value;
    }
    ret["num_spikes"] = spike_ids.count();
    return ret;
}

QString ClusterUpdate::toString() const
{
    return QString(QJsonDocument(toJsonObject()).toJson(QJsonDocument::Compact));
}

QString ClusterOperationError::errorString() const
{
    switch (error) {
    case NoError:
        return "no error";
    case InvalidOperation:
        return "invalid operation: " + message;
    case NoDataset:
        return "no dataset is open";
    case ReentrantCall:
        return "operation called from within its own notification: " + message;
    default:
        break;
    }
    return message;
}

QJsonArray intlist_to_json_array(const QList<int>& X)
{
    QJsonArray ret;
    foreach (int x, X) {
        ret << x;
    }
    return ret;
}
