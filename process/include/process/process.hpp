#pragma once

#include <boost/asio/io_context.hpp>

#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief A child process with its own stdin, stdout and stderr pipes.
 *
 * The output pipes are read asynchronously on the io_context passed at construction,
 * so both can be drained while the child is still running.
 */
class Process : public std::enable_shared_from_this<Process>
{
  public:
    explicit Process(boost::asio::io_context& context);
    ~Process();

    Process(Process const&) = delete;
    Process& operator=(Process const&) = delete;
    Process(Process&&) = delete;
    Process& operator=(Process&&) = delete;

    /**
     * @brief Starts the child. Names without a slash are searched in PATH.
     *
     * @param processName Executable name or path.
     * @param arguments Arguments, not including the program name.
     * @return std::expected<void, std::string> Launch error, if any.
     */
    std::expected<void, std::string> spawn(std::string const& processName, std::vector<std::string> const& arguments);

    /**
     * @brief Registers the output handlers and starts reading both pipes until they hit EOF.
     * A handler returning false stops reading its pipe.
     */
    void startReading(std::function<bool(std::string_view)> onStdout, std::function<bool(std::string_view)> onStderr);

    void write(std::string_view data);

    /**
     * @brief Closes the parent side of stdin, the child reads EOF from then on.
     */
    void closeStdin();

    /**
     * @brief Blocks until the child has terminated.
     *
     * @return std::optional<int> The exit code, nullopt if the status could not be collected.
     */
    std::optional<int> waitForExit();

    void terminate();

    std::optional<int> exitCode() const;
    int pid() const;
    bool running() const;

  private:
    struct Implementation;
    std::unique_ptr<Implementation> impl_;
};
