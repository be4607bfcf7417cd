#include "platform/linux/procfs_port_reaper.hpp"

#include <algorithm>
#include <cctype>
#include <csignal>
#include <filesystem>
#include <fstream>
#include <print>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

constexpr int kPasses = 3;
constexpr const char* kListenState = "0A";

std::string read_file(const fs::path& path) {
    std::ifstream f(path);
    if (!f.is_open()) return {};
    std::stringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

} // namespace

ProcfsPortReaper::ProcfsPortReaper(std::string proc_root, std::chrono::milliseconds pass_pause)
    : proc_root_(std::move(proc_root)), pass_pause_(pass_pause) {}

std::unordered_set<unsigned long> ProcfsPortReaper::parse_listen_inodes(const std::string& table,
                                                                        uint16_t port) {
    std::unordered_set<unsigned long> inodes;
    std::istringstream in(table);
    std::string line;
    std::getline(in, line); // header

    // sl local_address rem_address st tx_queue:rx_queue tr:tm->when retrnsmt uid timeout inode
    while (std::getline(in, line)) {
        std::istringstream fields(line);
        std::string sl, local, remote, state, queues, timer, retrans, uid, timeout;
        unsigned long inode = 0;
        if (!(fields >> sl >> local >> remote >> state >> queues >> timer >> retrans >> uid >>
              timeout >> inode)) {
            continue;
        }
        if (state != kListenState || inode == 0) continue;

        auto colon = local.rfind(':');
        if (colon == std::string::npos) continue;

        unsigned long local_port = 0;
        try {
            local_port = std::stoul(local.substr(colon + 1), nullptr, 16);
        } catch (const std::exception&) {
            continue;
        }
        if (local_port == port) inodes.insert(inode);
    }
    return inodes;
}

std::unordered_set<unsigned long> ProcfsPortReaper::listen_inodes(uint16_t port) const {
    auto inodes = parse_listen_inodes(read_file(fs::path(proc_root_) / "net" / "tcp"), port);
    auto v6 = parse_listen_inodes(read_file(fs::path(proc_root_) / "net" / "tcp6"), port);
    inodes.insert(v6.begin(), v6.end());
    return inodes;
}

std::vector<int> ProcfsPortReaper::pids_holding(const std::unordered_set<unsigned long>& inodes) const {
    std::vector<int> pids;
    if (inodes.empty()) return pids;

    std::error_code ec;
    for (auto& entry : fs::directory_iterator(proc_root_, ec)) {
        auto name = entry.path().filename().string();
        if (name.empty() || !std::ranges::all_of(name, [](unsigned char c) { return std::isdigit(c) != 0; })) continue;

        int pid = std::stoi(name);
        std::error_code fd_ec;
        for (auto& fd : fs::directory_iterator(entry.path() / "fd", fd_ec)) {
            std::error_code link_ec;
            auto target = fs::read_symlink(fd.path(), link_ec).string();
            if (link_ec || !target.starts_with("socket:[")) continue;

            unsigned long inode = 0;
            try {
                inode = std::stoul(target.substr(8));
            } catch (const std::exception&) {
                continue;
            }
            if (inodes.contains(inode)) {
                pids.push_back(pid);
                break;
            }
        }
    }
    return pids;
}

std::vector<int> ProcfsPortReaper::listeners(uint16_t port) const {
    return pids_holding(listen_inodes(port));
}

int ProcfsPortReaper::free_port(uint16_t port) {
    int killed = 0;
    int self = ::getpid();

    for (int pass = 0; pass < kPasses; ++pass) {
        auto pids = listeners(port);
        std::erase(pids, self);
        if (pids.empty()) break;

        for (int pid : pids) {
            if (::kill(pid, SIGKILL) == 0) {
                std::println(stderr, "backend: killed pid {} holding port {}", pid, port);
                ++killed;
            }
        }
        std::this_thread::sleep_for(pass_pause_);
    }
    return killed;
}
