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
#ifndef MCABSTRACTCONTEXT_H
#define MCABSTRACTCONTEXT_H

#include <QObject>
#include <QVariant>
#include <QJsonObject>

class MCAbstractContextPrivate;
class MCAbstractContext : public QObject {
    Q_OBJECT
public:
    friend class MCAbstractContextPrivate;
    MCAbstractContext();
    virtual ~MCAbstractContext();

    virtual QJsonObject toJsonObject() const = 0;

    /////////////////////////////////////////////////
    QVariant option(QString name, QVariant default_val = QVariant()) const;
    void setOption(QString name, QVariant value);
    QVariantMap options() const;
    void setOptions(const QVariantMap& options);
    void clearOptions();
    ///Read "name=value" lines, returns false if the file could not be read
    bool loadOptionsFromFile(QString path);

signals:
    void optionChanged(QString name);

private:
    MCAbstractContextPrivate* d;
};

#endif // MCABSTRACTCONTEXT_H
