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

#include "globalhistory.h"

#include <QDebug>
#include <QList>
#include <QLoggingCategory>

Q_LOGGING_CATEGORY(GH, "mc.history")

struct HistoryEntry {
    HistoryTarget* target;
    QVariant state;
};

class GlobalHistoryPrivate {
public:
    GlobalHistory* q;
    QList<HistoryEntry> m_undo_stack; //bottom to top
    QList<HistoryEntry> m_redo_stack; //last element is the next to redo

    int previous_entry_index(int index) const;
};

GlobalHistory::GlobalHistory()
{
    d = new GlobalHistoryPrivate;
    d->q = this;
}

GlobalHistory::~GlobalHistory()
{
    delete d;
}

void GlobalHistory::action(HistoryTarget* target)
{
    Q_ASSERT(target);
    HistoryEntry entry;
    entry.target = target;
    entry.state = target->captureState();
    d->m_undo_stack << entry;
    if (!d->m_redo_stack.isEmpty()) {
        qCDebug(GH) << "Dropping" << d->m_redo_stack.count() << "redo entries";
        d->m_redo_stack.clear();
    }
}

ClusterUpdate GlobalHistory::undo()
{
    if (d->m_undo_stack.isEmpty())
        return ClusterUpdate();
    int top = d->m_undo_stack.count() - 1;
    int prev = d->previous_entry_index(top);
    if (prev < 0) {
        //only the baseline of this target is left
        qCDebug(GH) << "Nothing to undo";
        return ClusterUpdate();
    }
    HistoryEntry entry = d->m_undo_stack.takeLast();
    d->m_redo_stack << entry;
    ClusterUpdate up = entry.target->restoreState(d->m_undo_stack[prev].state);
    up.history = "undo";
    qCDebug(GH) << "Undo" << up.description << up.deleted << "->" << up.added;
    return up;
}

ClusterUpdate GlobalHistory::redo()
{
    if (d->m_redo_stack.isEmpty()) {
        qCDebug(GH) << "Nothing to redo";
        return ClusterUpdate();
    }
    HistoryEntry entry = d->m_redo_stack.takeLast();
    d->m_undo_stack << entry;
    ClusterUpdate up = entry.target->restoreState(entry.state);
    up.history = "redo";
    qCDebug(GH) << "Redo" << up.description << up.deleted << "->" << up.added;
    return up;
}

bool GlobalHistory::canUndo() const
{
    if (d->m_undo_stack.isEmpty())
        return false;
    return (d->previous_entry_index(d->m_undo_stack.count() - 1) >= 0);
}

bool GlobalHistory::canRedo() const
{
    return !d->m_redo_stack.isEmpty();
}

int GlobalHistory::undoStackSize() const
{
    return d->m_undo_stack.count();
}

int GlobalHistory::redoStackSize() const
{
    return d->m_redo_stack.count();
}

void GlobalHistory::clear()
{
    d->m_undo_stack.clear();
    d->m_redo_stack.clear();
}

int GlobalHistoryPrivate::previous_entry_index(int index) const
{
    HistoryTarget* target = m_undo_stack[index].target;
    for (int i = index - 1; i >= 0; i--) {
        if (m_undo_stack[i].target == target)
            return i;
    }
    return -1;
}
