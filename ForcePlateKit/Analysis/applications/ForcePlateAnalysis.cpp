/**
 * @file ForcePlateAnalysis.cpp
 *
 * \brief Interactive analysis of force-plate trials (LMJ and throwing). Reads
 * commands from the terminal, accumulates the confirmed results and exports
 * them as csv.
 *
 * Usage: ForcePlateAnalysis [config.ini]
 */
#include "AnalysisSession.h"
#include "Configuration.h"
#include "Exception.h"
#include "Utils.h"

#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>

using namespace std;
using namespace ForcePlateKit;

// terminal implementation of the start point disambiguation
static optional<double> chooseFromTerminal(const string& eventName,
                                           const vector<string>& candidates) {
    cout << "Multiple " << eventName << " candidates found. "
         << "Select the time (s) to use:" << endl;
    for (size_t i = 0; i < candidates.size(); ++i) {
        cout << "  [" << i + 1 << "] " << candidates[i] << endl;
    }
    string line;
    while (true) {
        cout << "choice (1-" << candidates.size() << ", c to cancel): "
             << flush;
        if (!getline(cin, line)) return nullopt;
        line = trim(line);
        if (line == "c" || line == "cancel") return nullopt;
        char* end;
        long k = strtol(line.c_str(), &end, 10);
        if (!line.empty() && *end == '\0' && k >= 1 &&
            k <= static_cast<long>(candidates.size())) {
            return strtod(candidates[k - 1].c_str(), nullptr);
        }
        cout << "invalid choice '" << line << "'" << endl;
    }
}

static void printHelp() {
    cout << "commands:\n"
         << "  subject <name>         set the subject name\n"
         << "  mode <LMJ|Throwing>    set the analysis mode\n"
         << "  load <file.csv>        load a force-plate export\n"
         << "  run                    detect the window and compute metrics\n"
         << "  add                    add the current result to the list\n"
         << "  discard                discard the current result\n"
         << "  list                   show the saved results\n"
         << "  export <file.csv>      write the saved results\n"
         << "  plot <file.sto>        write the analysed channel and window\n"
         << "  status                 show the session state\n"
         << "  quit                   exit" << endl;
}

static bool confirmExit(bool unsaved) {
    if (!unsaved) return true;
    cout << "There are results that have not been exported. Exit anyway? "
         << "(y/n): " << flush;
    string answer;
    if (!getline(cin, answer)) return true;
    answer = trim(answer);
    return answer == "y" || answer == "yes";
}

void run(int argc, char* argv[]) {
    EventDetector::Parameters detectorParameters;
    ForcePlateFileReader::Parameters fileParameters;
    if (argc > 1) {
        Configuration configuration(argv[1]);
        detectorParameters = configuration.getDetectorParameters();
        fileParameters = configuration.getFileParameters();
        cout << "Configuration: " << argv[1] << endl;
    }
    AnalysisSession session(detectorParameters, fileParameters);

    bool unsaved = false;
    printHelp();
    string line;
    while (true) {
        cout << "> " << flush;
        if (!getline(cin, line)) break;
        istringstream iss(trim(line));
        string command, argument;
        iss >> command;
        getline(iss, argument);
        argument = trim(argument);
        if (command.empty()) continue;

        try {
            if (command == "help") {
                printHelp();
            } else if (command == "subject") {
                session.setSubjectName(argument);
                cout << "Subject: " << argument << endl;
            } else if (command == "mode") {
                session.setMode(analysisModeFromString(argument));
                cout << "Mode: " << toString(session.getMode()) << endl;
            } else if (command == "load") {
                try {
                    session.loadFile(argument);
                } catch (FormatError&) {
                    cerr << "cannot load '" << argument << "'" << endl;
                    throw;
                }
                cout << "Loaded " << session.getSourceFileName() << endl;
            } else if (command == "run") {
                auto output = session.runAnalysis(chooseFromTerminal);
                if (output.status == EventDetector::Status::DETECTED) {
                    cout << session.getPendingResult()->summary() << endl;
                } else {
                    cout << output.message << endl;
                }
            } else if (command == "add") {
                if (session.confirmPendingResult()) {
                    unsaved = true;
                    cout << "Result added. Saved: "
                         << session.getResults().size() << endl;
                } else {
                    cout << "There is no result to add. Run the analysis "
                         << "first." << endl;
                }
            } else if (command == "discard") {
                session.discardPendingResult();
            } else if (command == "list") {
                cout << dump(ResultRecord::columnLabels(), "\t") << endl;
                for (const auto& record : session.getResults()) {
                    cout << dump(record.asRow(), "\t") << endl;
                }
            } else if (command == "export") {
                session.exportResults(argument);
                unsaved = false;
                cout << "Saved " << session.getResults().size()
                     << " results to " << argument << endl;
            } else if (command == "plot") {
                session.exportPlotData(argument);
                cout << "Plot data written to " << argument << endl;
            } else if (command == "status") {
                cout << "State: " << toString(session.getState())
                     << "\nSubject: " << session.getSubjectName()
                     << "\nMode: " << toString(session.getMode())
                     << "\nFile: " << session.getSourceFileName()
                     << "\nSaved: " << session.getResults().size() << endl;
            } else if (command == "quit" || command == "exit") {
                if (confirmExit(unsaved)) break;
            } else {
                cout << "unknown command '" << command << "'" << endl;
            }
        } catch (FormatError& e) {
            cerr << e.what() << endl;
        } catch (ValidationError& e) {
            cerr << e.what() << endl;
        } catch (ExportError& e) {
            cerr << e.what() << endl;
        }
    }
}

int main(int argc, char* argv[]) {
    try {
        run(argc, argv);
    } catch (exception& e) {
        cout << e.what() << endl;
        return -1;
    }
    return 0;
}
