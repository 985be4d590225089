#pragma once

#include <string>
#include <functional>
#include <memory>
#include <filesystem>

namespace morgue::platform {

    /**
     * @brief Abstract base class for the IPC server (the Bridge).
     * One request and one response per connection; each connection is served on its own thread.
     */
    class Bridge {
    public:
        using MessageCallback = std::function<std::string(const std::string&)>;

        virtual ~Bridge() = default;

        /**
         * @brief Initializes the IPC endpoint.
         * @param name The name of the socket (e.g., "morgue.sock").
         * @return false if the endpoint could not be created.
         */
        virtual bool listen(const std::string& name) = 0;

        /**
         * @brief Sets the handler for incoming messages. Called concurrently.
         */
        virtual void set_handler(MessageCallback handler) = 0;

        /**
         * @brief Runs the accept loop until stop() is called.
         */
        virtual void run() = 0;

        /**
         * @brief Stops the accept loop and waits for in-flight requests.
         * Connections that have not finished sending a request are closed.
         */
        virtual void stop() = 0;

        static std::unique_ptr<Bridge> create();
    };

    /**
     * @brief Abstract base class for the IPC client.
     */
    class Client {
    public:
        virtual ~Client() = default;

        /**
         * @brief Connects to the IPC endpoint.
         * @return true if connected successfully.
         */
        virtual bool connect(const std::string& name) = 0;

        /**
         * @brief Sends a message and waits for the complete response.
         * @return The response, or an empty string on failure.
         */
        virtual std::string send(const std::string& message) = 0;

        static std::unique_ptr<Client> create();
    };

    /**
     * @brief System-level helper functions.
     */
    namespace system {
        std::filesystem::path get_config_dir();
        bool is_daemon_running(const std::string& name);
    }

}
