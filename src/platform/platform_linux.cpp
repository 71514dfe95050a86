#include "../platform.hpp"
#include <iostream>
#include <sys/inotify.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>
#include <poll.h>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <map>

namespace quire::platform {

    namespace {
        // A client that stops sending is dropped after this long.
        constexpr int kClientTimeoutSeconds = 2;

        // MSG_NOSIGNAL: a peer that hung up yields EPIPE instead of SIGPIPE.
        bool write_all(int fd, const std::string& data) {
            size_t sent = 0;
            while (sent < data.size()) {
                ssize_t n = ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
                sent += static_cast<size_t>(n);
            }
            return true;
        }

        // Reads until EOF, or until a newline when stop_at_newline is set.
        bool read_message(int fd, std::string& out, bool stop_at_newline) {
            char buffer[4096];
            while (true) {
                ssize_t n = ::read(fd, buffer, sizeof(buffer));
                if (n < 0) {
                    if (errno == EINTR) continue;
                    return false;
                }
                if (n == 0) return true;
                out.append(buffer, static_cast<size_t>(n));
                if (stop_at_newline && out.find('\n') != std::string::npos) {
                    out.erase(out.find('\n'));
                    return true;
                }
            }
        }

        sockaddr_un make_address(const std::string& path) {
            sockaddr_un addr;
            std::memset(&addr, 0, sizeof(addr));
            addr.sun_family = AF_UNIX;
            std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);
            return addr;
        }
    }

    class LinuxSentry : public Sentry {
    public:
        LinuxSentry() {
            m_fd = inotify_init1(IN_NONBLOCK);
            if (m_fd < 0) {
                std::cerr << "[LinuxSentry] Failed to initialize inotify: " << std::strerror(errno) << "\n";
            }
        }

        ~LinuxSentry() override {
            stop();
            if (m_fd >= 0) close(m_fd);
        }

        bool add_watch(const std::filesystem::path& path) override {
            if (m_fd < 0) return false;

            std::error_code ec;
            if (!std::filesystem::is_directory(path, ec)) return false;
            return add_watch_single(path);
        }

        void set_callback(EventCallback callback) override {
            m_callback = std::move(callback);
        }

        void start() override {
            if (m_fd < 0) return;
            m_running = true;

            struct pollfd pfd = { m_fd, POLLIN, 0 };
            char buffer[4096] __attribute__ ((aligned(__alignof__(struct inotify_event))));

            while (m_running) {
                int poll_num = poll(&pfd, 1, 500);
                if (poll_num <= 0 || !(pfd.revents & POLLIN)) continue;

                ssize_t len = read(m_fd, buffer, sizeof(buffer));
                if (len <= 0) {
                    if (len < 0 && errno != EAGAIN) {
                        std::cerr << "[LinuxSentry] read error: " << std::strerror(errno) << "\n";
                    }
                    continue;
                }

                const struct inotify_event* event;
                for (char* ptr = buffer; ptr < buffer + len; ptr += sizeof(struct inotify_event) + event->len) {
                    event = reinterpret_cast<const struct inotify_event*>(ptr);
                    handle_event(event);
                }
            }
        }

        void stop() override {
            m_running = false;
        }

    private:
        int m_fd = -1;
        std::atomic<bool> m_running{false};
        std::map<int, std::filesystem::path> m_watches; // wd -> directory
        EventCallback m_callback;

        bool add_watch_single(const std::filesystem::path& path) {
            int wd = inotify_add_watch(m_fd, path.c_str(),
                                       IN_CLOSE_WRITE | IN_CREATE | IN_DELETE | IN_MOVED_FROM | IN_MOVED_TO);
            if (wd < 0) {
                std::cerr << "[LinuxSentry] Failed to watch " << path << ": " << std::strerror(errno) << "\n";
                return false;
            }
            m_watches[wd] = path;
            return true;
        }

        void handle_event(const struct inotify_event* event) {
            if (event->mask & IN_Q_OVERFLOW) {
                std::cerr << "[LinuxSentry] Event queue overflow.\n";
                return;
            }

            auto it = m_watches.find(event->wd);
            if (it == m_watches.end() || event->len == 0) return;

            if (!m_callback) return;

            FileEvent fe;
            fe.path = it->second / event->name;

            if (event->mask & IN_CREATE) fe.type = FileEvent::Type::Created;
            else if (event->mask & IN_DELETE) fe.type = FileEvent::Type::Deleted;
            else if (event->mask & IN_CLOSE_WRITE) fe.type = FileEvent::Type::Modified;
            else if (event->mask & IN_MOVED_FROM) fe.type = FileEvent::Type::MovedOut;
            else if (event->mask & IN_MOVED_TO) fe.type = FileEvent::Type::MovedIn;
            else return;

            m_callback(fe);
        }
    };

    class LinuxBridge : public Bridge {
    public:
        LinuxBridge() = default;
        ~LinuxBridge() override { stop(); }

        bool listen(const std::string& name) override {
            m_socket_path = system::socket_path(name).string();
            unlink(m_socket_path.c_str());

            m_server_fd = socket(AF_UNIX, SOCK_STREAM, 0);
            if (m_server_fd < 0) {
                std::cerr << "[LinuxBridge] Failed to create socket: " << std::strerror(errno) << "\n";
                return false;
            }

            sockaddr_un addr = make_address(m_socket_path);
            if (bind(m_server_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
                std::cerr << "[LinuxBridge] Failed to bind socket: " << std::strerror(errno) << "\n";
                close(m_server_fd);
                m_server_fd = -1;
                return false;
            }

            if (::listen(m_server_fd, 16) < 0) {
                std::cerr << "[LinuxBridge] Failed to listen on socket: " << std::strerror(errno) << "\n";
                close(m_server_fd);
                m_server_fd = -1;
                return false;
            }

            std::cout << "[LinuxBridge] Listening on " << m_socket_path << "\n";
            return true;
        }

        void set_handler(MessageCallback handler) override {
            m_handler = std::move(handler);
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
                        handle_client(client_fd);
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
        }

    private:
        int m_server_fd = -1;
        std::string m_socket_path;
        MessageCallback m_handler;
        std::atomic<bool> m_running{false};

        void handle_client(int client_fd) {
            timeval timeout{};
            timeout.tv_sec = kClientTimeoutSeconds;
            if (setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout)) < 0 ||
                setsockopt(client_fd, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout)) < 0) {
                std::cerr << "[LinuxBridge] Failed to set client timeout: " << std::strerror(errno) << "\n";
                close(client_fd);
                return;
            }

            std::string request;
            if (read_message(client_fd, request, true) && !request.empty()) {
                std::string response = m_handler ? m_handler(request) : "{}";
                if (!write_all(client_fd, response)) {
                    std::cerr << "[LinuxBridge] Failed to write reply: " << std::strerror(errno) << "\n";
                }
            }
            close(client_fd);
        }
    };

    class LinuxClient : public Client {
    public:
        ~LinuxClient() override {
            if (m_fd >= 0) close(m_fd);
        }

        bool connect(const std::string& name) override {
            m_socket_path = system::socket_path(name).string();
            m_fd = socket(AF_UNIX, SOCK_STREAM, 0);
            if (m_fd < 0) return false;

            sockaddr_un addr = make_address(m_socket_path);
            if (::connect(m_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
                close(m_fd);
                m_fd = -1;
                return false;
            }
            return true;
        }

        std::string send(const std::string& message) override {
            if (m_fd < 0) return "";
            if (!write_all(m_fd, message + "\n")) return "";
            shutdown(m_fd, SHUT_WR);

            std::string reply;
            if (!read_message(m_fd, reply, false)) return "";
            return reply;
        }

    private:
        int m_fd = -1;
        std::string m_socket_path;
    };

    std::unique_ptr<Sentry> Sentry::create() {
        return std::make_unique<LinuxSentry>();
    }

    std::unique_ptr<Bridge> Bridge::create() {
        return std::make_unique<LinuxBridge>();
    }

    std::unique_ptr<Client> Client::create() {
        return std::make_unique<LinuxClient>();
    }

    namespace system {
        std::filesystem::path get_config_dir() {
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) / ".config/quire" : "";
        }

        std::filesystem::path get_data_dir() {
            const char* home = std::getenv("HOME");
            return home ? std::filesystem::path(home) / ".local/share/quire" : "";
        }

        std::filesystem::path socket_path(const std::string& name) {
            const char* runtime = std::getenv("XDG_RUNTIME_DIR");
            return std::filesystem::path(runtime ? runtime : "/tmp") / name;
        }

        bool is_daemon_running(const std::string& name) {
            LinuxClient probe;
            return probe.connect(name);
        }
    }

}
