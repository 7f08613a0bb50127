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

#ifndef MCABSTRACTSESSIONOBSERVER_H
#define MCABSTRACTSESSIONOBSERVER_H

#include "clusterupdate.h"

#include <QObject>

class MCSession;

/*
 * Base class of everything that follows a session (views, summaries, loggers).
 * The callbacks are connected on construction, after the observers created
 * earlier, and disconnected automatically when the observer is destroyed.
 * Observers read the session but never mutate it from onOpen() or onCluster().
 */
class MCAbstractSessionObserverPrivate;
class MCAbstractSessionObserver : public QObject {
    Q_OBJECT
public:
    friend class MCAbstractSessionObserverPrivate;
    MCAbstractSessionObserver(MCSession* session, QObject* parent = 0);
    virtual ~MCAbstractSessionObserver();

    MCSession* session() const;

protected slots:
    virtual void onOpen() = 0;
    virtual void onCluster(const ClusterUpdate& up, bool add_to_stack) = 0;
    virtual void onSelect() = 0;

private:
    MCAbstractSessionObserverPrivate* d;
};

#endif // MCABSTRACTSESSIONOBSERVER_H
