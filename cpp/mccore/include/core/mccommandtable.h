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
#ifndef MCCOMMANDTABLE_H
#define MCCOMMANDTABLE_H

#include <QList>
#include <QString>
#include <QStringList>
#include <functional>

class MCSession;

/*
 * The session actions by name: select, merge, split, move, undo, redo.
 * The table is filled once in the constructor.
 */
class MCCommandTable {
public:
    typedef std::function<bool(MCSession* session, const QStringList& args, QString* error_message)> Handler;
    struct Command {
        QString name;
        QString title;
        QString usage;
        Handler handler;
    };

    MCCommandTable();

    QStringList commandNames() const;
    bool contains(const QString& name) const;
    Command command(const QString& name) const;
    QString helpText() const;

    bool run(MCSession* session, const QString& name, const QStringList& args, QString* error_message = 0) const;

    static bool parseIntList(const QStringList& args, QList<int>* ret, QString* error_message = 0);

private:
    void add(const QString& name, const QString& title, const QString& usage, Handler handler);

    QList<Command> m_commands;
};

#endif // MCCOMMANDTABLE_H
