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

#ifndef MCSESSION_H
#define MCSESSION_H

#include "clustering.h"
#include "clustermetadata.h"
#include "clusterupdate.h"
#include "globalhistory.h"
#include "mcabstractcontext.h"
#include "mcabstractmodel.h"
#include "selector.h"

#include <QJsonObject>

/*
 * A manual clustering session on one dataset at a time.
 *
 * open() replaces everything (clustering, selector, history). merge(), split()
 * and move() are recorded in the history and announced with
 * clusterChanged(up, true); undo() and redo() replay the history and announce
 * clusterChanged(up, false) so that observers do not record them again.
 * Signals are emitted synchronously, in connection order.
 *
 * Options:
 *   n_spikes_max (int, default 100) - cap on selectedSpikes()
 *   select_after_cluster (bool, default true) - select up.selected after a change
 */
class MCSessionPrivate;
class MCSession : public MCAbstractContext {
    Q_OBJECT
public:
    friend class MCSessionPrivate;
    MCSession();
    virtual ~MCSession();

    QJsonObject toJsonObject() const Q_DECL_OVERRIDE;

    /////////////////////////////////////////////////
    ///Takes ownership of the model. Fails on negative cluster ids. Reopening
    ///the open model restarts from its spike clusters and keeps its metadata.
    bool open(MCAbstractModel* model, ClusterOperationError* error = 0);
    bool isOpen() const;
    MCAbstractModel* model() const;

    /////////////////////////////////////////////////
    bool select(const QList<int>& cluster_ids, ClusterOperationError* error = 0);
    bool merge(const QList<int>& cluster_ids, ClusterOperationError* error = 0);
    bool split(const QList<int>& spike_ids, ClusterOperationError* error = 0);
    bool move(const QList<int>& cluster_ids, const QString& group, ClusterOperationError* error = 0);
    bool undo(ClusterOperationError* error = 0); //false if there was nothing to undo
    bool redo(ClusterOperationError* error = 0); //false if there was nothing to redo

    /////////////////////////////////////////////////
    const Clustering* clustering() const;
    const ClusterMetadata* clusterMetadata() const;
    const Selector* selector() const;
    const GlobalHistory* history() const;

    QList<int> clusterIds() const;
    QVector<int> spikeClusters() const;
    QList<int> selectedClusters() const;
    QVector<int> selectedSpikes() const;
    ClusterUpdate lastUpdate() const;

signals:
    void opened();
    void clusterChanged(const ClusterUpdate& up, bool add_to_stack);
    void selectionChanged();

private slots:
    void slot_option_changed(QString name);

private:
    MCSessionPrivate* d;
};

#endif // MCSESSION_H
