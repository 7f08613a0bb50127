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
#include "mcjsonmodel.h"

#include <QDebug>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <limits>

Q_LOGGING_CATEGORY(JM, "mc.model")

class MCJsonModelPrivate {
public:
    MCJsonModel* q;
    QString m_path;
    QVector<int> m_spike_clusters;
    ClusterMetadata m_cluster_metadata;

    bool fail(QString* error_message, const QString& msg);
};

MCJsonModel::MCJsonModel()
{
    d = new MCJsonModelPrivate;
    d->q = this;
}

MCJsonModel::~MCJsonModel()
{
    delete d;
}

bool MCJsonModel::load(const QString& path, QString* error_message)
{
    QFile f(path);
    if (!f.open(QFile::ReadOnly)) {
        return d->fail(error_message, "Unable to open file for reading: " + path);
    }
    QByteArray data = f.readAll();
    f.close();

    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError) {
        return d->fail(error_message, QString("Error parsing %1: %2").arg(path).arg(err.errorString()));
    }
    if (!doc.isObject()) {
        return d->fail(error_message, "Expected a json object in " + path);
    }
    d->m_path = path;
    return setFromJsonObject(doc.object(), error_message);
}

bool MCJsonModel::setFromJsonObject(const QJsonObject& obj, QString* error_message)
{
    if (!obj.contains("spike_clusters")) {
        return d->fail(error_message, "Missing field: spike_clusters");
    }
    QJsonArray X = obj["spike_clusters"].toArray();
    QVector<int> spike_clusters(X.count());
    for (int i = 0; i < X.count(); i++) {
        if (!X[i].isDouble()) {
            return d->fail(error_message, QString("Invalid cluster id for spike %1").arg(i));
        }
        double val = X[i].toDouble();
        if (val < 0) {
            return d->fail(error_message, QString("Negative cluster id for spike %1").arg(i));
        }
        if ((val > std::numeric_limits<int>::max()) || (val != (double)(int)val)) {
            return d->fail(error_message, QString("Cluster id for spike %1 is not an integer: %2").arg(i).arg(val));
        }
        spike_clusters[i] = (int)val;
    }
    d->m_spike_clusters = spike_clusters;
    d->m_cluster_metadata.setFromJsonObject(obj["cluster_groups"].toObject());
    qCDebug(JM) << "Loaded" << spike_clusters.count() << "spikes" << d->m_cluster_metadata.groups().count() << "cluster groups";
    return true;
}

QString MCJsonModel::path() const
{
    return d->m_path;
}

QString MCJsonModel::name() const
{
    if (d->m_path.isEmpty())
        return "json";
    return QFileInfo(d->m_path).fileName();
}

QVector<int> MCJsonModel::spikeClusters() const
{
    return d->m_spike_clusters;
}

ClusterMetadata* MCJsonModel::clusterMetadata()
{
    return &d->m_cluster_metadata;
}

bool MCJsonModel::write(const QString& path, const QJsonObject& obj)
{
    QFile f(path);
    if (!f.open(QFile::WriteOnly)) {
        qCWarning(JM) << "Unable to open file for writing:" << path;
        return false;
    }
    QByteArray data = QJsonDocument(obj).toJson();
    bool ok = (f.write(data) == data.count());
    f.close();
    if (!ok)
        qCWarning(JM) << "Problem writing file:" << path;
    return ok;
}

bool MCJsonModelPrivate::fail(QString* error_message, const QString& msg)
{
    qCWarning(JM) << msg;
    if (error_message)
        *error_message = msg;
    return false;
}
