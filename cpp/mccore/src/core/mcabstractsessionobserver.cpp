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

#include "mcabstractsessionobserver.h"
#include "mcsession.h"

#include <QPointer>

class MCAbstractSessionObserverPrivate {
public:
    MCAbstractSessionObserver* q;
    QPointer<MCSession> m_session;
};

MCAbstractSessionObserver::MCAbstractSessionObserver(MCSession* session, QObject* parent)
    : QObject(parent)
{
    d = new MCAbstractSessionObserverPrivate;
    d->q = this;
    d->m_session = session;

    Q_ASSERT(session);
    QObject::connect(session, &MCSession::opened, this, &MCAbstractSessionObserver::onOpen, Qt::DirectConnection);
    QObject::connect(session, &MCSession::clusterChanged, this, &MCAbstractSessionObserver::onCluster, Qt::DirectConnection);
    QObject::connect(session, &MCSession::selectionChanged, this, &MCAbstractSessionObserver::onSelect, Qt::DirectConnection);
}

MCAbstractSessionObserver::~MCAbstractSessionObserver()
{
    delete d;
}

MCSession* MCAbstractSessionObserver::session() const
{
    return d->m_session;
}
