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
#include "mccommandtable.h"
#include "mcsession.h"

static bool report_session_error(bool ok, const ClusterOperationError& err, QString* error_message)
{
    if ((!ok) && (error_message))
        *error_message = err.errorString();
    return ok;
}

MCCommandTable::MCCommandTable()
{
    add("select", "Select clusters", "select <cluster> ...",
        [](MCSession* session, const QStringList& args, QString* error_message) -> bool {
            QList<int> ids;
            if (!MCCommandTable::parseIntList(args, &ids, error_message))
                return false;
            ClusterOperationError err;
            return report_session_error(session->select(ids, &err), err, error_message);
        });
    add("merge", "Merge", "merge <cluster> <cluster> ...",
        [](MCSession* session, const QStringList& args, QString* error_message) -> bool {
            QList<int> ids;
            if (!MCCommandTable::parseIntList(args, &ids, error_message))
                return false;
            ClusterOperationError err;
            return report_session_error(session->merge(ids, &err), err, error_message);
        });
    add("split", "Split", "split <spike> ...",
        [](MCSession* session, const QStringList& args, QString* error_message) -> bool {
            QList<int> spikes;
            if (!MCCommandTable::parseIntList(args, &spikes, error_message))
                return false;
            ClusterOperationError err;
            return report_session_error(session->split(spikes, &err), err, error_message);
        });
    add("move", "Move clusters to a group", "move <group> <cluster> ...",
        [](MCSession* session, const QStringList& args, QString* error_message) -> bool {
            if (args.isEmpty()) {
                if (error_message)
                    *error_message = "move needs a group name";
                return false;
            }
            QList<int> ids;
            if (!MCCommandTable::parseIntList(args.mid(1), &ids, error_message))
                return false;
            ClusterOperationError err;
            return report_session_error(session->move(ids, args[0], &err), err, error_message);
        });
    //nothing to undo or redo is not an error
    add("undo", "Undo", "undo",
        [](MCSession* session, const QStringList& args, QString* error_message) -> bool {
            Q_UNUSED(args)
            ClusterOperationError err;
            bool done = session->undo(&err);
            return report_session_error(done || (err.error == ClusterOperationError::NoError), err, error_message);
        });
    add("redo", "Redo", "redo",
        [](MCSession* session, const QStringList& args, QString* error_message) -> bool {
            Q_UNUSED(args)
            ClusterOperationError err;
            bool done = session->redo(&err);
            return report_session_error(done || (err.error == ClusterOperationError::NoError), err, error_message);
        });
}

QStringList MCCommandTable::commandNames() const
{
    QStringList ret;
    foreach (const Command& C, m_commands) {
        ret << C.name;
    }
    return ret;
}

bool MCCommandTable::contains(const QString& name) const
{
    return commandNames().contains(name);
}

MCCommandTable::Command MCCommandTable::command(const QString& name) const
{
    foreach (const Command& C, m_commands) {
        if (C.name == name)
            return C;
    }
    return Command();
}

QString MCCommandTable::helpText() const
{
    QStringList lines;
    foreach (const Command& C, m_commands) {
        lines << QString("%1 -- %2").arg(C.usage, -32).arg(C.title);
    }
    return lines.join("\n");
}

bool MCCommandTable::run(MCSession* session, const QString& name, const QStringList& args, QString* error_message) const
{
    Q_ASSERT(session);
    Command C = command(name);
    if (!C.handler) {
        if (error_message)
            *error_message = "Unknown command: " + name;
        return false;
    }
    return C.handler(session, args, error_message);
}

bool MCCommandTable::parseIntList(const QStringList& args, QList<int>* ret, QString* error_message)
{
    QList<int> list;
    foreach (QString arg, args) {
        //also accept comma-separated values
        QStringList vals = arg.split(",", QString::SkipEmptyParts);
        foreach (QString val, vals) {
            bool ok;
            int x = val.trimmed().toInt(&ok);
            if (!ok) {
                if (error_message)
                    *error_message = "Not an integer: " + val;
                return false;
            }
            list << x;
        }
    }
    *ret = list;
    return true;
}

void MCCommandTable::add(const QString& name, const QString& title, const QString& usage, Handler handler)
{
    Command C;
    C.name = name;
    C.title = title;
    C.usage = usage;
    C.handler = handler;
    m_commands << C;
}
