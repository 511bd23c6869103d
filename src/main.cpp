#include <iostream>
#include <csignal>
#include <atomic>
#include <cstdlib>
#include <sstream>
#include <string>
#include <thread>
#include <chrono>
#include <poll.h>
#include <unistd.h>

#include "Config.hpp"
#include "IdGenerator.hpp"
#include "PeerNode.hpp"

using namespace std;
using namespace lantext;

static atomic<bool> g_running(true);

void signal_handler(int signum){
    (void)signum;
    g_running = false;
}

static void printHelp() {
    cout << "Commands:\n"
         << "  peers                      list discovered peers\n"
         << "  msg <peer_id> <text>       send a text message\n"
         << "  file <peer_id> <path>      offer a file\n"
         << "  accept <file_id> <path>    accept an offered file into <path>\n"
         << "  reject <file_id>           reject an offered file\n"
         << "  help                       show this list\n"
         << "  quit                       stop the node and exit" << endl;
}

// Waits up to timeoutMs for stdin to become readable, so the reader can notice shutdown
static bool waitForInput(int timeoutMs) {
    if (cin.rdbuf()->in_avail() > 0) return true;
    pollfd pfd{STDIN_FILENO, POLLIN, 0};
    int ready = poll(&pfd, 1, timeoutMs);
    return ready > 0;
}

static void handleCommand(PeerNode& node, const string& line) {
    istringstream in(line);
    string cmd;
    in >> cmd;
    if (cmd.empty()) return;

    if (cmd == "peers") {
        auto peers = node.getKnownPeers();
        if (peers.empty()) {
            cout << "No peers discovered yet" << endl;
            return;
        }
        for (auto& kv : peers) {
            cout << "  " << kv.first << " at " << kv.second.endpoint() << endl;
        }
    } else if (cmd == "msg") {
        string peer, text;
        in >> peer;
        getline(in >> ws, text);
        if (peer.empty() || text.empty()) {
            cout << "Usage: msg <peer_id> <text>" << endl;
            return;
        }
        if (node.sendMessage(peer, text)) cout << "Sent to " << peer << endl;
    } else if (cmd == "file") {
        string peer, path;
        in >> peer;
        getline(in >> ws, path);
        if (peer.empty() || path.empty()) {
            cout << "Usage: file <peer_id> <path>" << endl;
            return;
        }
        if (auto fileId = node.sendFile(peer, path)) {
            cout << "Offered " << path << " to " << peer << " (id " << *fileId << ")" << endl;
        }
    } else if (cmd == "accept") {
        string fileId, path;
        in >> fileId;
        getline(in >> ws, path);
        if (fileId.empty() || path.empty()) {
            cout << "Usage: accept <file_id> <path>" << endl;
            return;
        }
        if (node.acceptFile(fileId, path)) cout << "Accepted " << fileId << endl;
    } else if (cmd == "reject") {
        string fileId;
        in >> fileId;
        if (fileId.empty()) {
            cout << "Usage: reject <file_id>" << endl;
            return;
        }
        if (node.rejectFile(fileId)) cout << "Rejected " << fileId << endl;
    } else if (cmd == "help") {
        printHelp();
    } else if (cmd == "quit" || cmd == "exit") {
        g_running = false;
    } else {
        cout << "Unknown command: " << cmd << " (try help)" << endl;
    }
}

int main(int argc, char** argv) {
    NodeConfig config;

    if (argc > 3 && !loadNodeConfig(argv[3], config)) {
        cerr << "Failed to load config " << argv[3] << endl;
        return 1;
    }
    if (argc > 1) config.peerId = argv[1];
    if (argc > 2) config.messagingPort = static_cast<uint16_t>(atoi(argv[2]));

    if (!IdGenerator::initialize()) {
        cerr << "Failed to initialize libsodium." << endl;
        return 1;
    }

    PeerNode node(config);

    node.setPeerDiscoveredHandler([](const string& id, const string& address, uint16_t port) {
        cout << "[+] peer " << id << " at " << address << ":" << port << endl;
    });
    node.setMessageHandler([](const string& from, const string& text) {
        cout << "[" << from << "] " << text << endl;
    });
    node.setFileRequestHandler([](const string& from, const string& fileId, const string& filename, uint64_t filesize) {
        cout << "[file] " << from << " offers " << filename << " (" << filesize << " bytes), id " << fileId << endl;
    });
    node.setFileResponseHandler([](const string& from, const string& fileId, bool accepted, const string&) {
        cout << "[file] " << from << (accepted ? " accepted " : " rejected ") << fileId << endl;
    });
    node.setFileProgressHandler([](const string&, const string& fileId, uint64_t received, uint64_t total) {
        if (total > 0 && received == total) cout << "[file] " << fileId << " all " << total << " bytes received" << endl;
    });
    node.setFileCompleteHandler([](const string& from, const string& fileId, const string& filename) {
        cout << "[file] " << filename << " from " << from << " complete (" << fileId << ")" << endl;
    });
    node.setFileErrorHandler([](const string& from, const string& fileId, const string& error) {
        cerr << "[file] " << fileId << " with " << from << ": " << error << endl;
    });

    try {
        node.start();
    } catch (const boost::system::system_error& e) {
        cerr << "Failed to start node: " << e.what() << endl;
        return 1;
    }

    // Handle signals
    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    cout << "Peer " << node.peerId() << " listening on port " << node.port() << ". Type help for commands." << endl;

    // stdin is read on its own thread so a signal can end the main loop; the thread is
    // joined before the node goes away
    thread input([&node] {
        string line;
        while (g_running) {
            if (!waitForInput(200)) continue;
            if (!getline(cin, line)) break;
            handleCommand(node, line);
        }
        g_running = false;
    });

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    cout << "Shutting down..." << endl;
    input.join();
    node.stop();
    return 0;
}
