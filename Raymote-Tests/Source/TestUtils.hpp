#pragma once
#include <chrono>
#include <cstdlib>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <string>
#include <thread>
#include <unistd.h>

// Attende che pred() diventi vero, con polling ogni 5 ms
template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return pred();
}

// Pseudo-terminale: lo slave fa da porta seriale del dispositivo,
// il master da firmware finto.
class PtyPair {
public:
    PtyPair() {
        m_master = ::posix_openpt(O_RDWR | O_NOCTTY);
        if (m_master < 0) return;
        if (::grantpt(m_master) != 0 || ::unlockpt(m_master) != 0) { closeMaster(); return; }
        char name[128];
        if (::ptsname_r(m_master, name, sizeof(name)) != 0) { closeMaster(); return; }
        m_slavePath = name;
        ::fcntl(m_master, F_SETFL, ::fcntl(m_master, F_GETFL) | O_NONBLOCK);
    }

    ~PtyPair() { closeMaster(); }

    PtyPair(const PtyPair&) = delete;
    PtyPair& operator=(const PtyPair&) = delete;

    bool valid() const { return m_master >= 0 && !m_slavePath.empty(); }
    const std::string& slavePath() const { return m_slavePath; }

    // Simula il firmware che emette byte verso l'host
    bool write(const std::string& data) {
        size_t off = 0;
        while (off < data.size()) {
            const ssize_t n = ::write(m_master, data.data() + off, data.size() - off);
            if (n < 0) return false;
            off += static_cast<size_t>(n);
        }
        return true;
    }

    // Legge ciò che l'host ha scritto, fino a want byte o timeout
    std::string read(size_t want, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
        std::string out;
        const auto deadline = std::chrono::steady_clock::now() + timeout;
        while (out.size() < want && std::chrono::steady_clock::now() < deadline) {
            pollfd p{ m_master, POLLIN, 0 };
            if (::poll(&p, 1, 10) <= 0 || !(p.revents & POLLIN)) continue;
            char buf[256];
            const ssize_t n = ::read(m_master, buf, sizeof(buf));
            if (n > 0) out.append(buf, static_cast<size_t>(n));
        }
        return out;
    }

    // true quando nessuno tiene più aperto lo slave
    bool slaveClosed(std::chrono::milliseconds timeout = std::chrono::milliseconds(1000)) {
        return WaitFor([this] {
            pollfd p{ m_master, 0, 0 };
            return ::poll(&p, 1, 0) >= 0 && (p.revents & POLLHUP);
        }, timeout);
    }

    void closeMaster() {
        if (m_master >= 0) { ::close(m_master); m_master = -1; }
    }

private:
    int m_master = -1;
    std::string m_slavePath;
};

// Directory temporanea rimossa a fine test
class TempDir {
public:
    TempDir() {
        std::string tmpl = (std::filesystem::temp_directory_path() / "raymote-test-XXXXXX").string();
        if (::mkdtemp(tmpl.data())) m_path = tmpl;
    }
    ~TempDir() {
        std::error_code ec;
        if (!m_path.empty()) std::filesystem::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return m_path; }
    std::string file(const std::string& name) const { return (m_path / name).string(); }

private:
    std::filesystem::path m_path;
};
