#pragma once

#include <string>
#include <functional>
#include <memory>
#include <filesystem>

namespace quire::platform {

    struct FileEvent {
        enum class Type {
            Modified,
            Created,
            Deleted,
            MovedIn,
            MovedOut
        };

        std::filesystem::path path;
        Type type;
    };

    /**
     * @brief Directory watcher used by the daemon to notice a republished manifest.
     */
    class Sentry {
    public:
        using EventCallback = std::function<void(const FileEvent&)>;

        virtual ~Sentry() = default;

        /**
         * @brief Watches the entries of one directory; subdirectories are not followed.
         * @return false if the directory could not be watched.
         */
        virtual bool add_watch(const std::filesystem::path& path) = 0;

        virtual void set_callback(EventCallback callback) = 0;

        /**
         * @brief Blocks, dispatching events until stop() is called.
         */
        virtual void start() = 0;

        virtual void stop() = 0;

        static std::unique_ptr<Sentry> create();
    };

    /**
     * @brief Local IPC server. One newline-terminated request per connection.
     *
     * Clients are served one at a time; a client that sends nothing for two
     * seconds is disconnected.
     */
    class Bridge {
    public:
        using MessageCallback = std::function<std::string(const std::string&)>;

        virtual ~Bridge() = default;

        /**
         * @param name Socket name, e.g. "quire.sock".
         * @return false if the endpoint could not be bound.
         */
        virtual bool listen(const std::string& name) = 0;

        virtual void set_handler(MessageCallback handler) = 0;

        virtual void run() = 0;

        virtual void stop() = 0;

        static std::unique_ptr<Bridge> create();
    };

    class Client {
    public:
        virtual ~Client() = default;

        virtual bool connect(const std::string& name) = 0;

        /**
         * @brief Sends one request and reads the reply until the server closes.
         * @return Empty string on I/O failure.
         */
        virtual std::string send(const std::string& message) = 0;

        static std::unique_ptr<Client> create();
    };

    namespace system {
        std::filesystem::path get_config_dir();
        std::filesystem::path get_data_dir();
        std::filesystem::path socket_path(const std::string& name);
        bool is_daemon_running(const std::string& name);
    }

}
