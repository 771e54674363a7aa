#include <process/process.hpp>

#include <log/log.hpp>

#include <boost/asio/buffer.hpp>
#include <boost/asio/write.hpp>
#include <boost/process/args.hpp>
#include <boost/process/async_pipe.hpp>
#include <boost/process/child.hpp>
#include <boost/process/exe.hpp>
#include <boost/process/io.hpp>
#include <boost/process/search_path.hpp>

#include <system_error>

namespace bp = boost::process;

struct Process::Implementation
{
    boost::asio::io_context* context;
    std::unique_ptr<bp::child> child;
    std::optional<int> exitCode;

    std::function<bool(std::string_view)> onStdout;
    std::function<bool(std::string_view)> onStderr;

    std::vector<char> stdoutBuffer;
    std::vector<char> stderrBuffer;

    bp::async_pipe stdinPipe;
    bp::async_pipe stdoutPipe;
    bp::async_pipe stderrPipe;

    Implementation(boost::asio::io_context& context)
        : context{&context}
        , child{}
        , exitCode{}
        , onStdout{}
        , onStderr{}
        , stdoutBuffer(4096)
        , stderrBuffer(4096)
        , stdinPipe{context}
        , stdoutPipe{context}
        , stderrPipe{context}
    {}

    void read(
        std::shared_ptr<Process> proc,
        bp::async_pipe Process::Implementation::*pipe,
        std::function<bool(std::string_view)> Process::Implementation::*onRead,
        std::vector<char> Process::Implementation::*buffer)
    {
        auto& pipeRef = proc->impl_.get()->*pipe;
        pipeRef.async_read_some(
            boost::asio::buffer(proc->impl_.get()->*buffer),
            [weak = proc->weak_from_this(), pipe, onRead, buffer](
                boost::system::error_code ec, std::size_t bytesTransferred) mutable {
                auto self = weak.lock();
                if (!self)
                    return;

                auto const& buf = self->impl_.get()->*buffer;
                auto const& whenRead = self->impl_.get()->*onRead;

                if (bytesTransferred > 0 && whenRead && !whenRead(std::string_view{buf.data(), bytesTransferred}))
                    return;

                // EOF or a closed pipe ends the read loop.
                if (ec)
                    return;

                self->impl_->read(self, pipe, onRead, buffer);
            });
    }

    bool isRunning() const
    {
        if (!child)
            return false;
        std::error_code ec;
        return child->running(ec);
    }
};

Process::Process(boost::asio::io_context& context)
    : impl_{std::make_unique<Implementation>(context)}
{}
Process::~Process()
{
    if (impl_->isRunning())
    {
        Log::warn("Process {} still running on destruction, terminating it.", pid());
        terminate();
    }
}

std::expected<void, std::string>
Process::spawn(std::string const& processName, std::vector<std::string> const& arguments)
{
    if (impl_->child)
        return std::unexpected(std::string{"Process was already spawned."});

    std::string executable = processName;
    if (processName.find('/') == std::string::npos)
    {
        executable = bp::search_path(processName).string();
        if (executable.empty())
            return std::unexpected("Executable not found in PATH: " + processName);
    }

    std::error_code ec;
    auto child = std::make_unique<bp::child>(
        bp::exe = executable,
        bp::args = arguments,
        bp::std_in < impl_->stdinPipe,
        bp::std_out > impl_->stdoutPipe,
        bp::std_err > impl_->stderrPipe,
        ec);

    if (ec)
        return std::unexpected("Failed to launch '" + executable + "': " + ec.message());

    impl_->child = std::move(child);
    Log::trace("Spawned '{}' with pid {}.", executable, impl_->child->id());
    return {};
}

void Process::startReading(
    std::function<bool(std::string_view)> onStdout,
    std::function<bool(std::string_view)> onStderr)
{
    impl_->onStdout = std::move(onStdout);
    impl_->onStderr = std::move(onStderr);

    impl_->read(
        shared_from_this(),
        &Process::Implementation::stdoutPipe,
        &Process::Implementation::onStdout,
        &Process::Implementation::stdoutBuffer);

    impl_->read(
        shared_from_this(),
        &Process::Implementation::stderrPipe,
        &Process::Implementation::onStderr,
        &Process::Implementation::stderrBuffer);
}

void Process::write(std::string_view data)
{
    if (!impl_->isRunning() || !impl_->stdinPipe.is_open())
        return;

    boost::system::error_code ec;
    boost::asio::write(impl_->stdinPipe, boost::asio::buffer(data.data(), data.size()), ec);
    if (ec)
        Log::warn("Writing to stdin of process {} failed: {}", pid(), ec.message());
}

void Process::closeStdin()
{
    boost::system::error_code ec;
    impl_->stdinPipe.close(ec);
}

std::optional<int> Process::waitForExit()
{
    if (!impl_->child)
        return std::nullopt;
    if (impl_->exitCode)
        return impl_->exitCode;

    std::error_code ec;
    impl_->child->wait(ec);
    if (ec)
    {
        Log::error("Waiting for process {} failed: {}", pid(), ec.message());
        return std::nullopt;
    }
    impl_->exitCode = impl_->child->exit_code();
    return impl_->exitCode;
}

void Process::terminate()
{
    if (!impl_->isRunning())
        return;

    std::error_code ec;
    impl_->child->terminate(ec);
    if (ec)
    {
        Log::error("Terminating process {} failed: {}", pid(), ec.message());
        return;
    }
    impl_->exitCode = impl_->child->exit_code();
}

std::optional<int> Process::exitCode() const
{
    return impl_->exitCode;
}

int Process::pid() const
{
    if (!impl_->child)
        return -1;
    return impl_->child->id();
}

bool Process::running() const
{
    return impl_->isRunning();
}
