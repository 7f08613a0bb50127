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
#include "mcabstractcontext.h"

#include <QDebug>
#include <QFile>
#include <QStringList>
#include <QTextStream>

class MCAbstractContextPrivate {
public:
    MCAbstractContext* q;
    QMap<QString, QVariant> m_options;
};

MCAbstractContext::MCAbstractContext()
{
    d = new MCAbstractContextPrivate;
    d->q = this;
}

MCAbstractContext::~MCAbstractContext()
{
    delete d;
}

QVariant MCAbstractContext::option(QString name, QVariant default_val) const
{
    return d->m_options.value(name, default_val);
}

void MCAbstractContext::setOption(QString name, QVariant value)
{
    if (d->m_options.contains(name) && (d->m_options[name] == value))
        return;
    d->m_options[name] = value;
    emit optionChanged(name);
}

QVariantMap MCAbstractContext::options() const
{
    return d->m_options;
}

void MCAbstractContext::setOptions(const QVariantMap& options)
{
    QStringList keys = options.keys();
    foreach (QString key, keys) {
        setOption(key, options[key]);
    }
}

void MCAbstractContext::clearOptions()
{
    d->m_options.clear();
}

bool MCAbstractContext::loadOptionsFromFile(QString path)
{
    QFile f(path);
    if (!f.open(QFile::ReadOnly | QFile::Text)) {
        return false;
    }
    QString txt = QTextStream(&f).readAll();
    f.close();
    QStringList lines = txt.split("\n");
    foreach (QString line, lines) {
        line = line.trimmed();
        if ((line.isEmpty()) || (line.startsWith("#")))
            continue;
        QStringList vals = line.split("=");
        if (vals.count() == 2) {
            setOption(vals[0].trimmed(), vals[1].trimmed());
        }
        else {
            qWarning() << "Ignoring malformed line in options file" << path << ":" << line;
        }
    }
    return true;
}
