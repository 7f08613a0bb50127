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

#include "mcsession.h"

#include <QDebug>
#include <QJsonArray>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(SES, "mc.session")

//Marks the session as delivering a notification until it goes out of scope
class NotificationScope {
public:
    NotificationScope(int* depth)
        : m_depth(depth)
    {
        (*m_depth)++;
    }
    ~NotificationScope()
    {
        (*m_depth)--;
    }

private:
    int* m_depth;
};

class MCSessionPrivate {
public:
    MCSession* q;
    MCAbstractModel* m_model = 0;
    Clustering* m_clustering = 0;
    Selector* m_selector = 0;
    GlobalHistory m_history;
    ClusterUpdate m_last_update;
    int m_notification_depth = 0;

    bool fail(ClusterOperationError* error, ClusterOperationError::Error code, const QString& msg);
    bool check_can_mutate(ClusterOperationError* error, const QString& operation);
    void record_and_announce(const ClusterUpdate& up, HistoryTarget* target);
    void announce(const ClusterUpdate& up, bool add_to_stack);
    void clear();
};

MCSession::MCSession()
{
    d = new MCSessionPrivate;
    d->q = this;

    this->setOption("n_spikes_max", 100);
    this->setOption("select_after_cluster", true);

    QObject::connect(this, SIGNAL(optionChanged(QString)), this, SLOT(slot_option_changed(QString)));
}

MCSession::~MCSession()
{
    d->clear();
    delete d;
}

QJsonObject MCSession::toJsonObject() const
{
    QJsonObject ret;
    if (!isOpen())
        return ret;
    QJsonArray X;
    QVector<int> spike_clusters = d->m_clustering->spikeClusters();
    for (int i = 0; i < spike_clusters.count(); i++) {
        X.append(spike_clusters[i]);
    }
    ret["spike_clusters"] = X;
    ret["cluster_groups"] = d->m_model->clusterMetadata()->toJsonObject();
    return ret;
}

bool MCSession::open(MCAbstractModel* model, ClusterOperationError* error)
{
    if (error)
        *error = ClusterOperationError();
    if (!model) {
        return d->fail(error, ClusterOperationError::InvalidOperation, "open needs a model");
    }
    bool reopening = (model == d->m_model);
    if (d->m_notification_depth > 0) {
        if (!reopening)
            delete model;
        return d->fail(error, ClusterOperationError::ReentrantCall, "open");
    }
    QVector<int> spike_clusters = model->spikeClusters();
    for (int i = 0; i < spike_clusters.count(); i++) {
        if (spike_clusters[i] < 0) {
            if (!reopening)
                delete model;
            return d->fail(error, ClusterOperationError::InvalidOperation, QString("negative cluster id for spike %1").arg(i));
        }
    }

    //the model being reopened must survive clear()
    if (reopening)
        d->m_model = 0;
    d->clear();
    d->m_model = model;
    d->m_clustering = new Clustering(spike_clusters);
    d->m_selector = new Selector(d->m_clustering, this->option("n_spikes_max", 100).toInt());

    //baselines
    d->m_history.action(d->m_clustering);
    d->m_history.action(model->clusterMetadata());

    qCDebug(SES) << "Opened" << model->name() << "with" << d->m_clustering->nSpikes() << "spikes in" << d->m_clustering->nClusters() << "clusters";

    {
        NotificationScope scope(&d->m_notification_depth);
        emit opened();
    }
    return true;
}

bool MCSession::isOpen() const
{
    return (d->m_model != 0);
}

MCAbstractModel* MCSession::model() const
{
    return d->m_model;
}

bool MCSession::select(const QList<int>& cluster_ids, ClusterOperationError* error)
{
    if (error)
        *error = ClusterOperationError();
    if (!isOpen()) {
        return d->fail(error, ClusterOperationError::NoDataset, "select");
    }
    d->m_selector->setSelectedClusters(cluster_ids);

    {
        NotificationScope scope(&d->m_notification_depth);
        emit selectionChanged();
    }
    return true;
}

bool MCSession::merge(const QList<int>& cluster_ids, ClusterOperationError* error)
{
    if (!d->check_can_mutate(error, "merge"))
        return false;
    ClusterUpdate up = d->m_clustering->merge(cluster_ids, error);
    if (up.isNull())
        return false;
    d->record_and_announce(up, d->m_clustering);
    return true;
}

bool MCSession::split(const QList<int>& spike_ids, ClusterOperationError* error)
{
    if (!d->check_can_mutate(error, "split"))
        return false;
    ClusterUpdate up = d->m_clustering->split(spike_ids, error);
    if (up.isNull())
        return false;
    d->record_and_announce(up, d->m_clustering);
    return true;
}

bool MCSession::move(const QList<int>& cluster_ids, const QString& group, ClusterOperationError* error)
{
    if (!d->check_can_mutate(error, "move"))
        return false;
    if (cluster_ids.isEmpty()) {
        return d->fail(error, ClusterOperationError::InvalidOperation, "move needs at least one cluster");
    }
    if (group.isEmpty()) {
        return d->fail(error, ClusterOperationError::InvalidOperation, "move needs a group name");
    }
    foreach (int k, cluster_ids) {
        if (!d->m_clustering->hasCluster(k)) {
            return d->fail(error, ClusterOperationError::InvalidOperation, QString("cannot move unknown cluster %1").arg(k));
        }
    }
    ClusterMetadata* metadata = d->m_model->clusterMetadata();
    ClusterUpdate up = metadata->setGroup(cluster_ids, group);
    d->record_and_announce(up, metadata);
    return true;
}

bool MCSession::undo(ClusterOperationError* error)
{
    if (!d->check_can_mutate(error, "undo"))
        return false;
    ClusterUpdate up = d->m_history.undo();
    if (up.isNull())
        return false;
    d->announce(up, false);
    return true;
}

bool MCSession::redo(ClusterOperationError* error)
{
    if (!d->check_can_mutate(error, "redo"))
        return false;
    ClusterUpdate up = d->m_history.redo();
    if (up.isNull())
        return false;
    d->announce(up, false);
    return true;
}

const Clustering* MCSession::clustering() const
{
    return d->m_clustering;
}

const ClusterMetadata* MCSession::clusterMetadata() const
{
    if (!d->m_model)
        return 0;
    return d->m_model->clusterMetadata();
}

const Selector* MCSession::selector() const
{
    return d->m_selector;
}

const GlobalHistory* MCSession::history() const
{
    return &d->m_history;
}

QList<int> MCSession::clusterIds() const
{
    if (!d->m_clustering)
        return QList<int>();
    return d->m_clustering->clusterIds();
}

QVector<int> MCSession::spikeClusters() const
{
    if (!d->m_clustering)
        return QVector<int>();
    return d->m_clustering->spikeClusters();
}

QList<int> MCSession::selectedClusters() const
{
    if (!d->m_selector)
        return QList<int>();
    return d->m_selector->selectedClusters();
}

QVector<int> MCSession::selectedSpikes() const
{
    if (!d->m_selector)
        return QVector<int>();
    return d->m_selector->selectedSpikes();
}

ClusterUpdate MCSession::lastUpdate() const
{
    return d->m_last_update;
}

void MCSession::slot_option_changed(QString name)
{
    if (name != "n_spikes_max")
        return;
    if (!d->m_selector)
        return;
    d->m_selector->setNSpikesMax(this->option("n_spikes_max").toInt());
    NotificationScope scope(&d->m_notification_depth);
    emit selectionChanged();
}

bool MCSessionPrivate::fail(ClusterOperationError* error, ClusterOperationError::Error code, const QString& msg)
{
    ClusterOperationError err(code, msg);
    qCWarning(SES) << err.errorString();
    if (error)
        *error = err;
    return false;
}

bool MCSessionPrivate::check_can_mutate(ClusterOperationError* error, const QString& operation)
{
    if (error)
        *error = ClusterOperationError();
    if (!q->isOpen())
        return fail(error, ClusterOperationError::NoDataset, operation);
    if (m_notification_depth > 0)
        return fail(error, ClusterOperationError::ReentrantCall, operation);
    return true;
}

void MCSessionPrivate::record_and_announce(const ClusterUpdate& up, HistoryTarget* target)
{
    m_history.action(target);
    announce(up, true);
}

void MCSessionPrivate::announce(const ClusterUpdate& up, bool add_to_stack)
{
    m_last_update = up;
    qCDebug(SES) << "Cluster update" << up.toString();

    {
        NotificationScope scope(&m_notification_depth);
        emit q->clusterChanged(up, add_to_stack);
    }

    if ((q->option("select_after_cluster", true).toBool()) && (!up.selected.isEmpty())) {
        q->select(up.selected);
    }
}

void MCSessionPrivate::clear()
{
    //the history refers to the clustering and to the model's metadata
    m_history.clear();
    delete m_selector;
    m_selector = 0;
    delete m_clustering;
    m_clustering = 0;
    delete m_model;
    m_model = 0;
    m_last_update = ClusterUpdate();
}
