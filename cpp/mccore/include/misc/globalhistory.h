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

#ifndef GLOBALHISTORY_H
#define GLOBALHISTORY_H

#include "clusterupdate.h"

#include <QVariant>

///Something whose state can be recorded into and restored from a GlobalHistory
class HistoryTarget {
public:
    virtual ~HistoryTarget() {}

    virtual QVariant captureState() const = 0;
    ///Restore a previously captured state and describe what changed
    virtual ClusterUpdate restoreState(const QVariant& state) = 0;
};

/*
 * A linear undo/redo log of whole-state snapshots, shared by several targets.
 *
 * action(target) must be called right after each undoable mutation, so the
 * undo stack holds post-mutation states. The first entry recorded for a
 * target is its baseline and can not be undone. Undoing the top entry restores
 * its target to the closest earlier entry for that same target.
 *
 * Targets are not owned and must outlive the history (or call clear()).
 */
class GlobalHistoryPrivate;
class GlobalHistory {
public:
    friend class GlobalHistoryPrivate;
    GlobalHistory();
    virtual ~GlobalHistory();

    void action(HistoryTarget* target);
    ClusterUpdate undo(); //null update when there is nothing to undo
    ClusterUpdate redo(); //null update when there is nothing to redo

    bool canUndo() const;
    bool canRedo() const;
    int undoStackSize() const;
    int redoStackSize() const;
    void clear();

private:
    GlobalHistory(const GlobalHistory&);
    void operator=(const GlobalHistory&);

    GlobalHistoryPrivate* d;
};

#endif // GLOBALHISTORY_H
