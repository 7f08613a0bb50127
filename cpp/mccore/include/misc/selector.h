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

#ifndef SELECTOR_H
#define SELECTOR_H

#include <QList>
#include <QVector>

class Clustering;

/*
 * Picks the spikes shown for the selected clusters.
 *
 * selectedSpikes() returns the spikes of the selected clusters in increasing
 * order, subsampled with a regular stride when there are more than
 * nSpikesMax() of them. The result only depends on the selection and on the
 * current assignment. nSpikesMax() <= 0 disables the subsampling.
 */
class SelectorPrivate;
class Selector {
public:
    friend class SelectorPrivate;
    Selector(const Clustering* clustering, int n_spikes_max = 100);
    virtual ~Selector();

    int nSpikesMax() const;
    void setNSpikesMax(int n_spikes_max);

    const QList<int>& selectedClusters() const;
    void setSelectedClusters(const QList<int>& cluster_ids);

    QVector<int> selectedSpikes() const;

private:
    Selector(const Selector&);
    void operator=(const Selector&);

    SelectorPrivate* d;
};

#endif // SELECTOR_H
