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

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QRegExp>
#include <QStringList>
#include <QTextStream>

#include "mcclustersummary.h"
#include "mccommandtable.h"
#include "mcjsonmodel.h"
#include "mcsession.h"

/*
 * mclust curation.json
 *
 * Reads commands from stdin, one per line (merge 3 5, split 10 11 12,
 * move good 7, undo, redo, select 7, print, save out.json, quit) and prints
 * the cluster list after each change.
 */

class EventPrinter : public MCAbstractSessionObserver {
public:
    EventPrinter(MCSession* session, QTextStream* out)
        : MCAbstractSessionObserver(session)
        , m_out(out)
    {
    }

protected:
    void onOpen() Q_DECL_OVERRIDE
    {
        *m_out << "opened " << session()->model()->name() << endl;
    }
    void onCluster(const ClusterUpdate& up, bool add_to_stack) Q_DECL_OVERRIDE
    {
        Q_UNUSED(add_to_stack)
        *m_out << "cluster " << up.toString() << endl;
    }
    void onSelect() Q_DECL_OVERRIDE
    {
        QStringList ids;
        foreach (int k, session()->selectedClusters()) {
            ids << QString::number(k);
        }
        *m_out << "select " << ids.join(",") << endl;
    }

private:
    QTextStream* m_out;
};

QString get_config_fname()
{
    QString config_fname = qgetenv("MCLUST_CONFIG_FILE");
    if (config_fname.isEmpty()) {
        config_fname = QDir::homePath() + "/.mountainlab/mclust.env";
    }
    return config_fname;
}

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName("mclust");

    QCommandLineParser parser;
    parser.setApplicationDescription("Manual clustering session on a curation file. Commands are read from stdin.");
    parser.addHelpOption();
    parser.addPositionalArgument("file", "Curation file (json with spike_clusters and cluster_groups).");
    QCommandLineOption n_spikes_max_option("n-spikes-max", "Maximum number of selected spikes (0 for no limit).", "n");
    QCommandLineOption config_option("config", "Options file with name=value lines.", "path");
    QCommandLineOption output_option("output", "Write the curation to this file when done.", "path");
    QCommandLineOption quiet_option("quiet", "Do not print the cluster list after each change.");
    parser.addOption(n_spikes_max_option);
    parser.addOption(config_option);
    parser.addOption(output_option);
    parser.addOption(quiet_option);
    parser.process(app);

    QStringList args = parser.positionalArguments();
    if (args.count() != 1) {
        parser.showHelp(-1);
    }

    QTextStream out(stdout);
    QTextStream in(stdin);

    MCSession session;

    QString config_fname = parser.isSet(config_option) ? parser.value(config_option) : get_config_fname();
    if (!session.loadOptionsFromFile(config_fname)) {
        if (parser.isSet(config_option)) {
            qWarning() << "Unable to read options file:" << config_fname;
            return -1;
        }
    }
    if (parser.isSet(n_spikes_max_option)) {
        bool ok;
        int n = parser.value(n_spikes_max_option).toInt(&ok);
        if (!ok) {
            qWarning() << "Invalid value for --n-spikes-max:" << parser.value(n_spikes_max_option);
            return -1;
        }
        session.setOption("n_spikes_max", n);
    }

    EventPrinter printer(&session, &out);
    MCClusterSummary summary(&session);

    MCJsonModel* model = new MCJsonModel;
    QString error_message;
    if (!model->load(args[0], &error_message)) {
        qWarning() << error_message;
        delete model;
        return -1;
    }
    ClusterOperationError err;
    if (!session.open(model, &err)) {
        qWarning() << err.errorString();
        return -1;
    }
    out << summary.toText() << endl;

    MCCommandTable commands;
    int num_errors = 0;
    while (!in.atEnd()) {
        QString line = in.readLine().trimmed();
        if ((line.isEmpty()) || (line.startsWith("#")))
            continue;
        QStringList words = line.split(QRegExp("\\s+"), QString::SkipEmptyParts);
        QString name = words.value(0);
        QStringList cmd_args = words.mid(1);

        if ((name == "quit") || (name == "exit"))
            break;
        if (name == "help") {
            out << commands.helpText() << endl;
            out << "print" << endl
                << "save <path>" << endl
                << "quit" << endl;
            continue;
        }
        if (name == "print") {
            out << summary.toText() << endl;
            continue;
        }
        if (name == "save") {
            if (cmd_args.count() != 1) {
                qWarning() << "Usage: save <path>";
                num_errors++;
            }
            else if (!MCJsonModel::write(cmd_args[0], session.toJsonObject())) {
                num_errors++;
            }
            continue;
        }

        int update_count = summary.updateCount();
        QString error;
        if (!commands.run(&session, name, cmd_args, &error)) {
            qWarning() << error;
            num_errors++;
            continue;
        }
        if ((!parser.isSet(quiet_option)) && (summary.updateCount() != update_count)) {
            out << summary.toText() << endl;
        }
    }

    if (parser.isSet(output_option)) {
        if (!MCJsonModel::write(parser.value(output_option), session.toJsonObject()))
            return -1;
    }

    return (num_errors == 0) ? 0 : 1;
}
