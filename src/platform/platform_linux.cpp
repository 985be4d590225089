#include "../platform.hpp"
#include <iostream>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <sys/time.h>

namespace morgue::platform {

    namespace {
        constexpr size_t kMaxMessage = 1 << 20;
        constexpr int kClientTimeoutSeconds = 5;

        std::string socket_path_for(const std::string& name) {
            return "/tmp/" + name;
        }

        bool fill_address(struct sockaddr_un& addr, const std::string& path) {
            memset(&addr, 0, sizeof(addr));
            addr.sun_family = AF_UNIX;
            if (path.size() >= sizeof(addr.sun_path)) return false;
            strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
            return true;
        }

        // Reads until the peer shuts down its write side
        bool read_all(int fd, std::string& out) {
            char buffer[4096];
            while (true) {
                ssize_t len = read(fd, buffer, sizeof(buffer));
                if (len == 0) return true;
                if (len < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
                out.append(buffer, static_cast<size_t>(len));
                if (out.size() > kMaxMessage) return false;
            }
        }

        bool write_all(int fd, const std::string& data) {
            size_t sent = 0;
            while (sent < data.size()) {
                ssize_t n = write(fd, data.data() + sent, data.size() - sent);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
                sent += static_cast<size_t>(n);
            }
            return true;
        }
    }

    class LinuxBridge : public Bridge {
    public:
        LinuxBridge() = default;
        ~LinuxBridge() { stop(); }

        bool listen(const std::string& name) override {
            m_socket_path = socket_path_for(name);
            unlink(m_socket_path.c_str());

            struct sockaddr_un addr;
            if (!fill_address(addr, m_socket_path)) {
                std::cerr << "[LinuxBridge] Socket path too long: " << m_socket_path << "\n";
                return false;
            }

            m_server_fd = socket(AF_UNIX, SOCK_STREAM, 0);
            if (m_server_fd < 0) {
                std::cerr << "[LinuxBridge] Failed to create socket.\n";
                return false;
            }

            if (bind(m_server_fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
                std::cerr << "[LinuxBridge] Failed to bind socket: " << strerror(errno) << "\n";
                close(m_server_fd);
                m_server_fd = -1;
                return false;
            }

            if (::listen(m_server_fd, 16) < 0) {
                std::cerr << "[LinuxBridge] Failed to listen on socket.\n";
                close(m_server_fd);
                m_server_fd = -1;
                return false;
            }

            std::cout << "[LinuxBridge] Listening on " << m_socket_path << "\n";
            return true;
        }

        void set_handler(MessageCallback handler) override {
            m_handler = handler;
        }

        void run() override {
            if (m_server_fd < 0) return;
            m_running = true;

            struct pollfd pfd = { m_server_fd, POLLIN, 0 };

            while (m_running) {
                int poll_num = poll(&pfd, 1, 500);
                if (poll_num > 0 && (pfd.revents & POLLIN)) {
                    int client_fd = accept(m_server_fd, nullptr, nullptr);
                    if (client_fd >= 0) {
                        struct timeval tv = { kClientTimeoutSeconds, 0 };
                        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));
                        setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv));
                        {
                            std::lock_guard<std::mutex> lock(m_mutex);
                            ++m_active;
                            m_reading.insert(client_fd);
                        }
                        std::thread(&LinuxBridge::handle_client, this, client_fd).detach();
                    }
                }
            }
        }

        void stop() override {
            m_running = false;
            if (m_server_fd >= 0) {
                close(m_server_fd);
                unlink(m_socket_path.c_str());
                m_server_fd = -1;
            }
            std::unique_lock<std::mutex> lock(m_mutex);
            // Clients still sending their request are cut off; handlers already running finish
            for (int fd : m_reading) shutdown(fd, SHUT_RDWR);
            m_idle.wait(lock, [this] { return m_active == 0; });
        }

    private:
        int m_server_fd = -1;
        std::string m_socket_path;
        MessageCallback m_handler;
        std::atomic<bool> m_running{false};

        std::mutex m_mutex;
        std::condition_variable m_idle;
        size_t m_active = 0;
        std::unordered_set<int> m_reading;

        void handle_client(int client_fd) {
            std::string request;
            bool complete = read_all(client_fd, request);
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_reading.erase(client_fd);
            }
            if (complete && !request.empty()) {
                std::string response = "{}";
                if (m_handler) {
                    response = m_handler(request);
                }
                if (!write_all(client_fd, response)) {
                    std::cerr << "[LinuxBridge] Failed to write response: " << strerror(errno) << "\n";
                }
            }
            close(client_fd);

            std::lock_guard<std::mutex> lock(m_mutex);
            if (--m_active == 0) m_idle.notify_all();
        }
    };

    class LinuxClient : public Client {
    public:
        bool connect(const std::string& name) override {
            m_socket_path = socket_path_for(name);

            struct sockaddr_un addr;
            if (!fill_address(addr, m_socket_path)) return false;

            m_fd = socket(AF_UNIX, SOCK_STREAM, 0);
            if (m_fd < 0) return false;

            if (::connect(m_fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
                close(m_fd);
                m_fd = -1;
                return false;
            }
            return true;
        }

        std::string send(const std::string& message) override {
            if (m_fd < 0) return "";
            if (!write_all(m_fd, message)) return "";
            shutdown(m_fd, SHUT_WR);

            std::string response;
            if (!read_all(m_fd, response)) return "";
            return response;
        }

        ~LinuxClient() {
            if (m_fd >= 0) close(m_fd);
        }

    private:
        int m_fd = -1;
        std::string m_socket_path;
    };

    std::unique_ptr<Bridge> Bridge::create() {
        return std::make_unique<LinuxBridge>();
    }

    std::unique_ptr<Client> Client::create() {
        return std::make_unique<LinuxClient>();
    }

    namespace system {
        std::filesystem::path get_config_dir() {
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) / ".config/morgue" : "";
        }
        bool is_daemon_running(const std::string& name) {
            LinuxClient probe;
            return probe.connect(name);
        }
    }

}
