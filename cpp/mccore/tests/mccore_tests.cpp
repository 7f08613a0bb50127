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

#include <QJsonArray>
#include <QSet>
#include <QStringList>
#include <QTemporaryDir>
#include <functional>
#include <iostream>
#include <stdexcept>

#include "clustering.h"
#include "clustermetadata.h"
#include "globalhistory.h"
#include "mcclustersummary.h"
#include "mccommandtable.h"
#include "mcjsonmodel.h"
#include "mcsession.h"
#include "selector.h"

namespace {

struct TestCase {
    const char* name;
    const char* intent;
    std::function<bool(void)> run;
};

QVector<int> vec(const QList<int>& X)
{
    return X.toVector();
}

QList<int> ids(int a, int b = -1, int c = -1)
{
    QList<int> ret;
    ret << a;
    if (b >= 0)
        ret << b;
    if (c >= 0)
        ret << c;
    return ret;
}

///Records every notification of a session as a line of text
class RecordingObserver : public MCAbstractSessionObserver {
public:
    RecordingObserver(MCSession* session, const QString& name, QStringList* log)
        : MCAbstractSessionObserver(session)
        , m_name(name)
        , m_log(log)
    {
    }

    QList<ClusterUpdate> updates;
    QList<bool> add_to_stack_flags;

protected:
    void onOpen() Q_DECL_OVERRIDE
    {
        *m_log << m_name + ":open";
    }
    void onCluster(const ClusterUpdate& up, bool add_to_stack) Q_DECL_OVERRIDE
    {
        updates << up;
        add_to_stack_flags << add_to_stack;
        *m_log << m_name + ":cluster:" + up.description + (up.history.isEmpty() ? "" : ":" + up.history);
    }
    void onSelect() Q_DECL_OVERRIDE
    {
        *m_log << m_name + ":select";
    }

private:
    QString m_name;
    QStringList* m_log;
};

///Tries to mutate the session from inside its own notifications
class ReentrantObserver : public MCAbstractSessionObserver {
public:
    ReentrantObserver(MCSession* session)
        : MCAbstractSessionObserver(session)
    {
    }

    bool merge_result = true;
    ClusterOperationError merge_error;
    bool select_result = false;

protected:
    void onOpen() Q_DECL_OVERRIDE {}
    void onCluster(const ClusterUpdate& up, bool add_to_stack) Q_DECL_OVERRIDE
    {
        Q_UNUSED(add_to_stack)
        merge_result = session()->merge(session()->clusterIds(), &merge_error);
        select_result = session()->select(up.added);
    }
    void onSelect() Q_DECL_OVERRIDE {}
};

///Throws from the first cluster notification it receives
class ThrowingObserver : public MCAbstractSessionObserver {
public:
    ThrowingObserver(MCSession* session)
        : MCAbstractSessionObserver(session)
    {
    }

    bool thrown = false;

protected:
    void onOpen() Q_DECL_OVERRIDE {}
    void onCluster(const ClusterUpdate& up, bool add_to_stack) Q_DECL_OVERRIDE
    {
        Q_UNUSED(up)
        Q_UNUSED(add_to_stack)
        if (!thrown) {
            thrown = true;
            throw std::runtime_error("observer failed");
        }
    }
    void onSelect() Q_DECL_OVERRIDE {}
};

MCSession* open_session(const QList<int>& spike_clusters)
{
    MCSession* session = new MCSession;
    session->open(new MCMemoryModel(vec(spike_clusters)));
    return session;
}

// Intent: merging two clusters mints a fresh id covering both.
bool test_merge_scenario()
{
    Clustering C(vec(QList<int>() << 1 << 1 << 2 << 2));
    ClusterUpdate up = C.merge(ids(1, 2));
    return !up.isNull() && up.description == "merge" && up.deleted == ids(1, 2) && up.added == ids(3) && up.selected == ids(3) && C.clusterIds() == ids(3) && C.spikeClusters() == vec(QList<int>() << 3 << 3 << 3 << 3) && up.spike_ids == vec(QList<int>() << 0 << 1 << 2 << 3);
}

// Intent: the merged cluster holds exactly the union and merged ids disappear.
bool test_merge_union_of_three_clusters()
{
    Clustering C(vec(QList<int>() << 0 << 4 << 7 << 4 << 9 << 7 << 0 << 9));
    QVector<int> expected = C.spikesInClusters(ids(0, 4, 7));
    ClusterUpdate up = C.merge(ids(7, 0, 4));
    if (up.isNull() || up.added.count() != 1)
        return false;
    int k = up.added.first();
    return k == 10 && C.spikesInCluster(k) == expected && !C.hasCluster(0) && !C.hasCluster(4) && !C.hasCluster(7) && C.clusterIds() == ids(9, 10) && C.spikesInCluster(9) == vec(QList<int>() << 4 << 7);
}

// Intent: degenerate or unknown merge arguments are rejected without side effects.
bool test_merge_rejects_invalid_arguments()
{
    Clustering C(vec(QList<int>() << 1 << 1 << 2 << 2));
    QVector<int> before = C.spikeClusters();
    ClusterOperationError e1, e2, e3, e4;
    bool rejected = C.merge(ids(1), &e1).isNull() && C.merge(QList<int>() << 2 << 2, &e2).isNull() && C.merge(ids(1, 5), &e3).isNull() && C.merge(QList<int>(), &e4).isNull();
    return rejected && e1.error == ClusterOperationError::InvalidOperation && e2.error == ClusterOperationError::InvalidOperation && e3.error == ClusterOperationError::InvalidOperation && e4.error == ClusterOperationError::InvalidOperation && C.spikeClusters() == before && C.newClusterId() == 3;
}

// Intent: splitting one spike out of a cluster leaves two disjoint clusters.
bool test_split_scenario()
{
    Clustering C(vec(QList<int>() << 1 << 1 << 1));
    ClusterUpdate up = C.split(ids(1));
    if (up.isNull())
        return false;
    int a = C.clusterOf(1);
    int b = C.clusterOf(0);
    return up.description == "split" && up.deleted == ids(1) && up.added == ids(2, 3) && up.selected == ids(2, 3) && a == 2 && b == 3 && C.clusterOf(2) == b && C.clusterIds() == ids(2, 3) && C.spikesInCluster(a) == vec(ids(1)) && C.spikesInCluster(b) == vec(ids(0, 2));
}

// Intent: a split over several donors retires emptied donors and renumbers the others.
bool test_split_across_donors()
{
    Clustering C(vec(QList<int>() << 1 << 1 << 2 << 2 << 3));
    QList<int> split_spikes = ids(0, 2, 4);
    ClusterUpdate up = C.split(split_spikes);
    if (up.isNull())
        return false;
    if ((up.deleted != ids(1, 2, 3)) || (up.added != ids(4, 5, 6)))
        return false;
    if (up.spike_ids != vec(QList<int>() << 0 << 1 << 2 << 3 << 4))
        return false;
    //every split spike lives in a cluster without any other spike
    QSet<int> split_clusters;
    foreach (int i, split_spikes) {
        split_clusters.insert(C.clusterOf(i));
    }
    for (int i = 0; i < C.nSpikes(); i++) {
        if (!split_spikes.contains(i) && split_clusters.contains(C.clusterOf(i)))
            return false;
    }
    return C.spikesInCluster(4) == vec(ids(0, 2, 4)) && C.spikesInCluster(5) == vec(ids(1)) && C.spikesInCluster(6) == vec(ids(3)) && C.clusterIds() == ids(4, 5, 6);
}

// Intent: empty or out-of-range split arguments are rejected without side effects.
bool test_split_rejects_invalid_arguments()
{
    Clustering C(vec(QList<int>() << 1 << 1 << 2));
    QVector<int> before = C.spikeClusters();
    ClusterOperationError e1, e2, e3;
    bool rejected = C.split(QList<int>(), &e1).isNull() && C.split(QList<int>() << 0 << 3, &e2).isNull() && C.split(QList<int>() << -1, &e3).isNull();
    return rejected && e1.error == ClusterOperationError::InvalidOperation && e2.error == ClusterOperationError::InvalidOperation && e3.error == ClusterOperationError::InvalidOperation && C.spikeClusters() == before && C.clusterIds() == ids(1, 2) && C.newClusterId() == 3;
}

// Intent: undo/redo restore the exact assignments through the history.
bool test_history_undo_redo_exact()
{
    Clustering C(vec(QList<int>() << 1 << 1 << 2 << 2));
    GlobalHistory H;
    H.action(&C);
    QVector<int> before = C.spikeClusters();
    QList<int> before_ids = C.clusterIds();
    C.merge(ids(1, 2));
    H.action(&C);
    QVector<int> after = C.spikeClusters();

    ClusterUpdate up_undo = H.undo();
    if (up_undo.isNull() || up_undo.history != "undo" || up_undo.deleted != ids(3) || up_undo.added != ids(1, 2))
        return false;
    if ((C.spikeClusters() != before) || (C.clusterIds() != before_ids))
        return false;
    ClusterUpdate up_redo = H.redo();
    if (up_redo.isNull() || up_redo.history != "redo" || up_redo.deleted != ids(1, 2) || up_redo.added != ids(3))
        return false;
    return C.spikeClusters() == after && C.clusterIds() == ids(3);
}

// Intent: undo past the baseline and redo past the latest entry are no-ops.
bool test_history_idempotent_at_the_ends()
{
    Clustering C(vec(QList<int>() << 1 << 1 << 2 << 2));
    GlobalHistory H;
    H.action(&C);
    if (!H.undo().isNull() || !H.redo().isNull() || H.canUndo() || H.canRedo())
        return false;
    QVector<int> before = C.spikeClusters();
    C.split(ids(0));
    H.action(&C);
    QVector<int> after = C.spikeClusters();
    if (H.undo().isNull() || C.spikeClusters() != before || C.clusterIds() != ids(1, 2))
        return false;
    if (!H.undo().isNull() || !H.undo().isNull() || C.spikeClusters() != before)
        return false;
    if (H.redo().isNull())
        return false;
    return H.redo().isNull() && H.redo().isNull() && C.spikeClusters() == after && H.undoStackSize() == 2 && H.redoStackSize() == 0;
}

// Intent: a new action after an undo drops the redo stack.
bool test_history_new_action_clears_redo()
{
    Clustering C(vec(QList<int>() << 1 << 1 << 2 << 2 << 3));
    GlobalHistory H;
    H.action(&C);
    C.merge(ids(1, 2));
    H.action(&C);
    H.undo();
    if (!H.canRedo())
        return false;
    ClusterUpdate up = C.merge(ids(2, 3));
    H.action(&C);
    //ids are never reissued, even after the merge that minted 4 was undone
    return !H.canRedo() && H.redo().isNull() && up.added == ids(5) && C.clusterIds() == ids(1, 5);
}

// Intent: history entries for different targets restore only their own target.
bool test_history_with_two_targets()
{
    Clustering C(vec(QList<int>() << 1 << 1 << 2 << 2));
    ClusterMetadata M;
    GlobalHistory H;
    H.action(&C);
    H.action(&M);
    C.merge(ids(1, 2));
    H.action(&C);
    M.setGroup(ids(3), "good");
    H.action(&M);

    ClusterUpdate up1 = H.undo();
    if (up1.metadata_changed != ids(3) || M.group(3) != ClusterMetadata::defaultGroup() || C.clusterIds() != ids(3))
        return false;
    ClusterUpdate up2 = H.undo();
    if (up2.description != "assign" || C.clusterIds() != ids(1, 2))
        return false;
    if (H.canUndo() || !H.undo().isNull())
        return false;
    H.redo();
    H.redo();
    return C.clusterIds() == ids(3) && M.group(3) == "good";
}

// Intent: selected spikes are subsampled with a regular stride, deterministically.
bool test_selector_regular_subsampling()
{
    QVector<int> spike_clusters(250, 0);
    spike_clusters[10] = 1;
    Clustering C(spike_clusters);
    Selector S(&C, 100);
    S.setSelectedClusters(QList<int>() << 0 << 1 << 0);
    QVector<int> X1 = S.selectedSpikes();
    QVector<int> X2 = S.selectedSpikes();
    if (X1 != X2 || S.selectedClusters() != ids(0, 1))
        return false;
    //250 spikes, stride 3
    if ((X1.count() != 84) || (X1[0] != 0) || (X1[1] != 3) || (X1.last() != 249))
        return false;
    S.setNSpikesMax(0);
    return S.selectedSpikes().count() == 250;
}

// Intent: empty selections and empty clusters give no spikes.
bool test_selector_empty_cases()
{
    Clustering C(vec(QList<int>() << 1 << 1 << 2));
    Selector S(&C, 100);
    if (!S.selectedSpikes().isEmpty())
        return false;
    S.setSelectedClusters(ids(7));
    if (!S.selectedSpikes().isEmpty())
        return false;
    S.setSelectedClusters(ids(2));
    return S.selectedSpikes() == vec(ids(2));
}

// Intent: the session records, announces and replays merges in order.
bool test_session_merge_undo_redo_notifications()
{
    QStringList log;
    MCSession session;
    RecordingObserver first(&session, "first", &log);
    RecordingObserver second(&session, "second", &log);
    session.open(new MCMemoryModel(vec(QList<int>() << 1 << 1 << 2 << 2)));

    if (!session.merge(ids(1, 2)) || session.clusterIds() != ids(3) || session.selectedClusters() != ids(3))
        return false;
    if (!session.undo() || session.clusterIds() != ids(1, 2) || session.spikeClusters() != vec(QList<int>() << 1 << 1 << 2 << 2))
        return false;
    if (!session.redo() || session.clusterIds() != ids(3))
        return false;

    QStringList expected;
    expected << "first:open"
             << "second:open"
             << "first:cluster:merge"
             << "second:cluster:merge"
             << "first:select"
             << "second:select"
             << "first:cluster:assign:undo"
             << "second:cluster:assign:undo"
             << "first:select"
             << "second:select"
             << "first:cluster:assign:redo"
             << "second:cluster:assign:redo"
             << "first:select"
             << "second:select";
    return log == expected && first.add_to_stack_flags == (QList<bool>() << true << false << false) && first.updates[1].added == ids(1, 2);
}

// Intent: undo and redo with nothing to replay return false and stay silent.
bool test_session_undo_nothing_is_silent()
{
    QStringList log;
    MCSession session;
    session.open(new MCMemoryModel(vec(QList<int>() << 1 << 2)));
    RecordingObserver obs(&session, "obs", &log);
    ClusterOperationError err;
    bool undone = session.undo(&err);
    bool redone = session.redo(&err);
    return !undone && !redone && err.error == ClusterOperationError::NoError && log.isEmpty();
}

// Intent: operations on an unopened session fail with NoDataset.
bool test_session_requires_dataset()
{
    MCSession session;
    ClusterOperationError e1, e2, e3;
    return !session.merge(ids(1, 2), &e1) && e1.error == ClusterOperationError::NoDataset && !session.select(ids(1), &e2) && e2.error == ClusterOperationError::NoDataset && !session.undo(&e3) && e3.error == ClusterOperationError::NoDataset && session.selectedSpikes().isEmpty() && session.toJsonObject().isEmpty();
}

// Intent: undo and redo of a split restore the exact assignments.
bool test_session_split_undo_redo()
{
    MCSession* session = open_session(QList<int>() << 1 << 1 << 1);
    QVector<int> before = session->spikeClusters();
    bool ok = session->split(ids(1));
    QVector<int> after = session->spikeClusters();
    QList<int> after_ids = session->clusterIds();
    ok = ok && after == vec(QList<int>() << 3 << 2 << 3) && after_ids == ids(2, 3);
    ok = ok && session->undo() && session->spikeClusters() == before && session->clusterIds() == ids(1);
    ok = ok && session->redo() && session->spikeClusters() == after && session->clusterIds() == after_ids;
    ok = ok && session->undo() && session->spikeClusters() == before && session->clustering()->newClusterId() == 4;
    delete session;
    return ok;
}

// Intent: an observer that throws does not leave the session locked.
bool test_session_recovers_after_observer_throws()
{
    MCSession* session = open_session(QList<int>() << 1 << 1 << 2 << 2 << 3);
    ThrowingObserver obs(session);
    bool caught = false;
    try {
        session->merge(ids(1, 2));
    }
    catch (const std::runtime_error&) {
        caught = true;
    }
    ClusterOperationError err;
    bool ok = session->merge(ids(3, 4), &err);
    bool ret = caught && obs.thrown && ok && err.error == ClusterOperationError::NoError && session->clusterIds() == ids(5) && session->undo(&err);
    delete session;
    return ret;
}

// Intent: reopening the open model restarts the session on it.
bool test_session_reopen_same_model()
{
    MCSession session;
    session.open(new MCMemoryModel(vec(QList<int>() << 1 << 1 << 2 << 2)));
    session.merge(ids(1, 2));
    ClusterOperationError err;
    bool ok = session.open(session.model(), &err);
    return ok && err.error == ClusterOperationError::NoError && session.isOpen() && session.clusterIds() == ids(1, 2) && !session.history()->canUndo() && session.merge(ids(1, 2)) && session.clusterIds() == ids(3);
}

// Intent: a dataset with negative cluster ids cannot be opened.
bool test_session_rejects_negative_cluster_ids()
{
    MCSession session;
    ClusterOperationError err;
    bool ok = session.open(new MCMemoryModel(vec(QList<int>() << 1 << -1 << 2)), &err);
    return !ok && err.error == ClusterOperationError::InvalidOperation && !session.isOpen() && session.clusterIds().isEmpty();
}

// Intent: a failed merge leaves the session and its history untouched.
bool test_session_invalid_merge_is_atomic()
{
    QStringList log;
    MCSession* session = open_session(QList<int>() << 1 << 1 << 2 << 2);
    RecordingObserver obs(session, "obs", &log);
    ClusterOperationError err;
    bool ok = session->merge(ids(1, 9), &err);
    bool ret = !ok && err.error == ClusterOperationError::InvalidOperation && session->clusterIds() == ids(1, 2) && !session->history()->canUndo() && log.isEmpty();
    delete session;
    return ret;
}

// Intent: observers may select but not mutate from inside a notification.
bool test_session_reentrant_mutation_rejected()
{
    MCSession* session = open_session(QList<int>() << 1 << 1 << 2 << 2 << 5);
    ReentrantObserver obs(session);
    bool ok = session->merge(ids(1, 2));
    bool ret = ok && !obs.merge_result && obs.merge_error.error == ClusterOperationError::ReentrantCall && obs.select_result && session->clusterIds() == ids(5, 6) && session->history()->undoStackSize() == 3;
    delete session;
    return ret;
}

// Intent: move changes cluster groups and can be undone like any other change.
bool test_session_move_undo()
{
    QMap<int, QString> groups;
    groups[2] = "noise";
    MCSession session;
    session.open(new MCMemoryModel(vec(QList<int>() << 1 << 1 << 2 << 2), groups));
    if (!session.move(ids(1), "good"))
        return false;
    if (session.clusterMetadata()->group(1) != "good" || session.lastUpdate().metadata_changed != ids(1) || session.lastUpdate().metadata_value != "good")
        return false;
    ClusterOperationError err;
    if (session.move(ids(8), "good", &err) || err.error != ClusterOperationError::InvalidOperation)
        return false;
    if (session.move(QList<int>(), "good", &err) || session.move(ids(1), "", &err))
        return false;
    if (!session.undo() || session.clusterMetadata()->group(1) != ClusterMetadata::defaultGroup() || session.clusterMetadata()->group(2) != "noise")
        return false;
    if (!session.redo())
        return false;
    return session.clusterMetadata()->group(1) == "good";
}

// Intent: reopening discards the previous clustering and history.
bool test_session_reopen_resets_state()
{
    QStringList log;
    MCSession session;
    RecordingObserver obs(&session, "obs", &log);
    session.open(new MCMemoryModel(vec(QList<int>() << 1 << 1 << 2 << 2)));
    session.merge(ids(1, 2));
    session.open(new MCMemoryModel(vec(QList<int>() << 4 << 5)));
    return session.clusterIds() == ids(4, 5) && !session.history()->canUndo() && !session.history()->canRedo() && !session.undo() && session.selectedClusters().isEmpty() && log.last() == "obs:open" && session.clustering()->newClusterId() == 6;
}

// Intent: changing n_spikes_max updates the selected spikes and notifies.
bool test_session_n_spikes_max_option()
{
    QStringList log;
    QVector<int> spike_clusters(30, 1);
    MCSession session;
    session.setOption("n_spikes_max", 10);
    session.open(new MCMemoryModel(spike_clusters));
    RecordingObserver obs(&session, "obs", &log);
    session.select(ids(1));
    if (session.selectedSpikes().count() != 10)
        return false;
    session.setOption("n_spikes_max", 0);
    return session.selectedSpikes().count() == 30 && log == (QStringList() << "obs:select"
                                                                             << "obs:select");
}

// Intent: select_after_cluster=false keeps the selection after a merge.
bool test_session_without_auto_selection()
{
    MCSession session;
    session.setOption("select_after_cluster", false);
    session.open(new MCMemoryModel(vec(QList<int>() << 1 << 2 << 3)));
    session.select(ids(3));
    session.merge(ids(1, 2));
    return session.selectedClusters() == ids(3) && session.clusterIds() == ids(3, 4);
}

// Intent: the cluster summary mirrors the session without mutating it.
bool test_cluster_summary_snapshot()
{
    QMap<int, QString> groups;
    groups[1] = "mua";
    MCSession session;
    MCClusterSummary summary(&session);
    if (!summary.rows().isEmpty())
        return false;
    session.open(new MCMemoryModel(vec(QList<int>() << 1 << 1 << 2), groups));
    if (summary.clusterIds() != ids(1, 2) || summary.rows()[0].group != "mua" || summary.rows()[0].num_spikes != 2)
        return false;
    session.split(ids(0));
    QList<ClusterSummaryRow> rows = summary.rows();
    return summary.updateCount() == 1 && summary.clusterIds() == ids(2, 3, 4) && rows[1].selected && rows[2].selected && !rows[0].selected && summary.selectedSpikes() == vec(ids(0, 1)) && rows[1].group == ClusterMetadata::defaultGroup();
}

// Intent: the command table dispatches by name and reports bad input.
bool test_command_table_dispatch()
{
    MCCommandTable table;
    if (table.commandNames() != (QStringList() << "select"
                                               << "merge"
                                               << "split"
                                               << "move"
                                               << "undo"
                                               << "redo"))
        return false;
    if (table.command("move").title != "Move clusters to a group")
        return false;
    MCSession* session = open_session(QList<int>() << 1 << 1 << 2 << 2 << 3);
    QString error;
    bool ok = table.run(session, "merge", QStringList() << "1"
                                                       << "2",
        &error);
    ok = ok && table.run(session, "move", QStringList() << "good"
                                                       << "4",
                  &error);
    ok = ok && table.run(session, "undo", QStringList(), &error) && table.run(session, "undo", QStringList(), &error) && table.run(session, "undo", QStringList(), &error);
    ok = ok && session->clusterIds() == ids(1, 2, 3);
    ok = ok && table.run(session, "split", QStringList() << "0,1", &error) && session->clusterIds() == ids(2, 3, 5);
    QString e1, e2, e3;
    bool bad1 = table.run(session, "frobnicate", QStringList(), &e1);
    bool bad2 = table.run(session, "merge", QStringList() << "x", &e2);
    bool bad3 = table.run(session, "merge", QStringList() << "2", &e3);
    delete session;
    return ok && !bad1 && !bad2 && !bad3 && e1.contains("frobnicate") && e2.contains("x") && !e3.isEmpty();
}

// Intent: a curation file round-trips through the json model and the session.
bool test_json_model_round_trip()
{
    QTemporaryDir tmp;
    if (!tmp.isValid())
        return false;
    QJsonObject obj;
    obj["spike_clusters"] = QJsonArray() << 1 << 1 << 2 << 2;
    QJsonObject groups;
    groups["2"] = "good";
    obj["cluster_groups"] = groups;
    QString path = tmp.path() + "/curation.json";
    if (!MCJsonModel::write(path, obj))
        return false;

    MCJsonModel* model = new MCJsonModel;
    QString error;
    if (!model->load(path, &error)) {
        delete model;
        return false;
    }
    MCSession session;
    session.open(model);
    if (session.clusterMetadata()->group(2) != "good" || model->name() != "curation.json")
        return false;
    session.merge(ids(1, 2));
    QJsonObject saved = session.toJsonObject();
    MCJsonModel reloaded;
    if (!reloaded.setFromJsonObject(saved))
        return false;
    return reloaded.spikeClusters() == vec(QList<int>() << 3 << 3 << 3 << 3) && reloaded.clusterMetadata()->group(2) == "good";
}

// Intent: malformed curation files are reported, not loaded.
bool test_json_model_rejects_bad_input()
{
    MCJsonModel model;
    QString e1, e2, e3, e4, e5;
    QJsonObject missing;
    QJsonObject negative;
    negative["spike_clusters"] = QJsonArray() << 1 << -2;
    QJsonObject fractional;
    fractional["spike_clusters"] = QJsonArray() << 1 << 1.5;
    QJsonObject too_large;
    too_large["spike_clusters"] = QJsonArray() << 1 << 3e10;
    bool r1 = model.setFromJsonObject(missing, &e1);
    bool r2 = model.setFromJsonObject(negative, &e2);
    bool r3 = model.load("/nonexistent/curation.json", &e3);
    bool r4 = model.setFromJsonObject(fractional, &e4);
    bool r5 = model.setFromJsonObject(too_large, &e5);
    return !r1 && !r2 && !r3 && !r4 && !r5 && !e1.isEmpty() && !e2.isEmpty() && !e3.isEmpty() && e4.contains("1.5") && !e5.isEmpty() && model.spikeClusters().isEmpty();
}

} // namespace

int main()
{
    const QList<TestCase> tests = QList<TestCase>()
        << TestCase{ "Clustering_Merge_Scenario", "merge {1,2} mints 3", test_merge_scenario }
        << TestCase{ "Clustering_Merge_Union", "merged cluster is the union", test_merge_union_of_three_clusters }
        << TestCase{ "Clustering_Merge_Invalid", "bad merges are rejected atomically", test_merge_rejects_invalid_arguments }
        << TestCase{ "Clustering_Split_Scenario", "split {1} out of {0,1,2}", test_split_scenario }
        << TestCase{ "Clustering_Split_Donors", "split over several donors", test_split_across_donors }
        << TestCase{ "Clustering_Split_Invalid", "bad splits are rejected atomically", test_split_rejects_invalid_arguments }
        << TestCase{ "History_UndoRedo_Exact", "undo/redo restore exact assignments", test_history_undo_redo_exact }
        << TestCase{ "History_Idempotent_Ends", "undo/redo past the ends are no-ops", test_history_idempotent_at_the_ends }
        << TestCase{ "History_Action_ClearsRedo", "new actions drop the redo stack", test_history_new_action_clears_redo }
        << TestCase{ "History_Two_Targets", "clustering and metadata share one history", test_history_with_two_targets }
        << TestCase{ "Selector_Stride", "regular deterministic subsampling", test_selector_regular_subsampling }
        << TestCase{ "Selector_Empty", "no selection or empty cluster gives no spikes", test_selector_empty_cases }
        << TestCase{ "Session_Notifications", "merge/undo/redo notify in order", test_session_merge_undo_redo_notifications }
        << TestCase{ "Session_Undo_Nothing", "nothing to undo is silent", test_session_undo_nothing_is_silent }
        << TestCase{ "Session_No_Dataset", "operations need an open dataset", test_session_requires_dataset }
        << TestCase{ "Session_Split_UndoRedo", "split is undone and redone exactly", test_session_split_undo_redo }
        << TestCase{ "Session_Observer_Throws", "a throwing observer does not lock the session", test_session_recovers_after_observer_throws }
        << TestCase{ "Session_Reopen_Same_Model", "reopening the open model is safe", test_session_reopen_same_model }
        << TestCase{ "Session_Negative_Ids", "negative cluster ids are rejected on open", test_session_rejects_negative_cluster_ids }
        << TestCase{ "Session_Invalid_Merge", "failed merge leaves no trace", test_session_invalid_merge_is_atomic }
        << TestCase{ "Session_Reentrant", "mutation from a notification is rejected", test_session_reentrant_mutation_rejected }
        << TestCase{ "Session_Move_Undo", "move is recorded and undoable", test_session_move_undo }
        << TestCase{ "Session_Reopen", "open discards prior state", test_session_reopen_resets_state }
        << TestCase{ "Session_NSpikesMax", "n_spikes_max option drives the selector", test_session_n_spikes_max_option }
        << TestCase{ "Session_No_AutoSelect", "select_after_cluster can be disabled", test_session_without_auto_selection }
        << TestCase{ "Summary_Snapshot", "cluster summary follows the session", test_cluster_summary_snapshot }
        << TestCase{ "CommandTable_Dispatch", "commands by name with typed handlers", test_command_table_dispatch }
        << TestCase{ "JsonModel_RoundTrip", "curation file load and save", test_json_model_round_trip }
        << TestCase{ "JsonModel_BadInput", "malformed curation files are rejected", test_json_model_rejects_bad_input };

    bool all_passed = true;
    foreach (const TestCase& test, tests) {
        const bool passed = test.run();
        std::cout << (passed ? "[PASS] " : "[FAIL] ") << test.name << " - " << test.intent << "\n";
        all_passed = all_passed && passed;
    }

    if (!all_passed) {
        std::cerr << "mccore tests failed\n";
        return 1;
    }

    std::cout << "mccore tests passed (" << tests.count() << " cases)\n";
    return 0;
}
