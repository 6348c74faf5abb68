#include "process.hpp"

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstring>
#include <sstream>
#include <string_view>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace rtlharvest::lib::process
{

    namespace
    {
        using Clock = std::chrono::steady_clock;

        class FileDescriptor
        {
        public:
            FileDescriptor() = default;
            explicit FileDescriptor(int fd) : fd_(fd) {}
            FileDescriptor(const FileDescriptor &) = delete;
            FileDescriptor &operator=(const FileDescriptor &) = delete;
            FileDescriptor(FileDescriptor &&other) noexcept : fd_(other.release()) {}
            FileDescriptor &operator=(FileDescriptor &&other) noexcept
            {
                if (this != &other)
                {
                    reset(other.release());
                }
                return *this;
            }
            ~FileDescriptor() { reset(); }

            int get() const noexcept { return fd_; }
            bool valid() const noexcept { return fd_ >= 0; }

            int release() noexcept
            {
                const int fd = fd_;
                fd_ = -1;
                return fd;
            }

            void reset(int fd = -1) noexcept
            {
                if (fd_ >= 0)
                {
                    ::close(fd_);
                }
                fd_ = fd;
            }

        private:
            int fd_ = -1;
        };

        struct Pipe
        {
            FileDescriptor read;
            FileDescriptor write;
        };

        bool openPipe(Pipe &pipe, std::string &error)
        {
            int fds[2];
            if (::pipe2(fds, O_CLOEXEC) != 0)
            {
                error = std::string("pipe: ") + std::strerror(errno);
                return false;
            }
            pipe.read.reset(fds[0]);
            pipe.write.reset(fds[1]);
            return true;
        }

        void killGroup(pid_t pid) noexcept
        {
            if (::kill(-pid, SIGKILL) != 0)
            {
                ::kill(pid, SIGKILL);
            }
        }

        // Only async-signal-safe calls from here on; the argument vector is
        // built by the parent before fork().
        [[noreturn]] void execChild(const char *file, char *const *argv, char *const *envp,
                                    const char *workingDirectory, int outFd, int errFd, int statusFd)
        {
            ::setpgid(0, 0);

            const int nullFd = ::open("/dev/null", O_RDONLY);
            if (nullFd >= 0)
            {
                ::dup2(nullFd, STDIN_FILENO);
                ::close(nullFd);
            }
            ::dup2(outFd, STDOUT_FILENO);
            ::dup2(errFd, STDERR_FILENO);

            if (workingDirectory == nullptr || ::chdir(workingDirectory) == 0)
            {
                if (envp != nullptr)
                {
                    ::execvpe(file, argv, envp);
                }
                else
                {
                    ::execvp(file, argv);
                }
            }

            const int code = errno;
            ssize_t written = 0;
            do
            {
                written = ::write(statusFd, &code, sizeof(code));
            } while (written < 0 && errno == EINTR);
            ::_exit(127);
        }

        void drainReady(pollfd &entry, FileDescriptor &fd, std::string &sink)
        {
            if ((entry.revents & (POLLIN | POLLHUP | POLLERR)) == 0)
            {
                return;
            }
            char buffer[4096];
            const ssize_t count = ::read(fd.get(), buffer, sizeof(buffer));
            if (count > 0)
            {
                sink.append(buffer, static_cast<std::size_t>(count));
                return;
            }
            if (count < 0 && (errno == EINTR || errno == EAGAIN))
            {
                return;
            }
            fd.reset();
        }
    } // namespace

    const char *processStatusText(ProcessStatus status) noexcept
    {
        switch (status)
        {
        case ProcessStatus::Exited:
            return "exited";
        case ProcessStatus::Signaled:
            return "signaled";
        case ProcessStatus::TimedOut:
            return "timed-out";
        case ProcessStatus::LaunchFailed:
        default:
            return "launch-failed";
        }
    }

    std::string Command::toString() const
    {
        std::ostringstream oss;
        oss << '"' << executable << '"';
        for (const auto &arg : arguments)
        {
            oss << ' ';
            if (arg.find_first_of(" \t\"") != std::string::npos)
            {
                oss << '\'' << arg << '\'';
            }
            else
            {
                oss << arg;
            }
        }
        return oss.str();
    }

    ProcessResult LocalProcessRunner::run(const Command &command)
    {
        ProcessResult result;
        if (command.executable.empty())
        {
            result.launchError = "empty executable";
            return result;
        }

        Pipe outPipe;
        Pipe errPipe;
        Pipe statusPipe;
        if (!openPipe(outPipe, result.launchError) || !openPipe(statusPipe, result.launchError))
        {
            return result;
        }
        if (!command.mergeOutput && !openPipe(errPipe, result.launchError))
        {
            return result;
        }

        std::vector<std::string> argStorage;
        argStorage.reserve(command.arguments.size() + 1);
        argStorage.push_back(command.executable);
        argStorage.insert(argStorage.end(), command.arguments.begin(), command.arguments.end());
        std::vector<char *> argv;
        argv.reserve(argStorage.size() + 1);
        for (auto &arg : argStorage)
        {
            argv.push_back(arg.data());
        }
        argv.push_back(nullptr);

        std::vector<std::string> envStorage;
        std::vector<char *> envp;
        if (!command.environment.empty())
        {
            for (char **entry = environ; entry != nullptr && *entry != nullptr; ++entry)
            {
                const std::string_view text(*entry);
                const std::string key(text.substr(0, text.find('=')));
                if (command.environment.find(key) == command.environment.end())
                {
                    envStorage.emplace_back(text);
                }
            }
            for (const auto &[key, value] : command.environment)
            {
                envStorage.push_back(key + "=" + value);
            }
            for (auto &entry : envStorage)
            {
                envp.push_back(entry.data());
            }
            envp.push_back(nullptr);
        }

        const std::string workingDirectory = command.workingDirectory.string();

        const pid_t pid = ::fork();
        if (pid < 0)
        {
            result.launchError = std::string("fork: ") + std::strerror(errno);
            return result;
        }
        if (pid == 0)
        {
            const int outFd = outPipe.write.get();
            const int errFd = command.mergeOutput ? outFd : errPipe.write.get();
            execChild(argStorage.front().c_str(), argv.data(), envp.empty() ? nullptr : envp.data(),
                      workingDirectory.empty() ? nullptr : workingDirectory.c_str(),
                      outFd, errFd, statusPipe.write.get());
        }

        outPipe.write.reset();
        errPipe.write.reset();
        statusPipe.write.reset();

        int childErrno = 0;
        ssize_t statusBytes = 0;
        do
        {
            statusBytes = ::read(statusPipe.read.get(), &childErrno, sizeof(childErrno));
        } while (statusBytes < 0 && errno == EINTR);
        statusPipe.read.reset();

        if (statusBytes > 0)
        {
            int ignored = 0;
            while (::waitpid(pid, &ignored, 0) < 0 && errno == EINTR)
            {
            }
            result.status = ProcessStatus::LaunchFailed;
            result.launchError = command.executable + ": " + std::strerror(childErrno);
            return result;
        }

        std::optional<Clock::time_point> deadline;
        if (command.timeout)
        {
            deadline = Clock::now() + *command.timeout;
        }

        bool timedOut = false;
        while (outPipe.read.valid() || errPipe.read.valid())
        {
            pollfd entries[2];
            FileDescriptor *owners[2];
            std::string *sinks[2];
            nfds_t count = 0;
            if (outPipe.read.valid())
            {
                entries[count] = pollfd{outPipe.read.get(), POLLIN, 0};
                owners[count] = &outPipe.read;
                sinks[count] = &result.output;
                ++count;
            }
            if (errPipe.read.valid())
            {
                entries[count] = pollfd{errPipe.read.get(), POLLIN, 0};
                owners[count] = &errPipe.read;
                sinks[count] = &result.errorOutput;
                ++count;
            }

            int waitMs = -1;
            if (deadline)
            {
                const auto remaining =
                    std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - Clock::now()).count();
                if (remaining <= 0)
                {
                    timedOut = true;
                    break;
                }
                waitMs = static_cast<int>(std::min<long long>(remaining, INT_MAX));
            }

            const int ready = ::poll(entries, count, waitMs);
            if (ready < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                // Output can no longer be collected; stop the child rather than block on it.
                killGroup(pid);
                break;
            }
            for (nfds_t i = 0; i < count; ++i)
            {
                drainReady(entries[i], *owners[i], *sinks[i]);
            }
        }

        if (timedOut)
        {
            killGroup(pid);
        }

        int waitStatus = 0;
        bool reaped = false;
        while (!reaped)
        {
            const pid_t waited = ::waitpid(pid, &waitStatus, timedOut ? 0 : WNOHANG);
            if (waited == pid)
            {
                reaped = true;
                break;
            }
            if (waited < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                break;
            }
            // The child closed its output but is still running.
            if (deadline && Clock::now() >= *deadline)
            {
                timedOut = true;
                killGroup(pid);
                continue;
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        if (timedOut)
        {
            result.status = ProcessStatus::TimedOut;
            return result;
        }
        if (!reaped)
        {
            result.status = ProcessStatus::Exited;
            result.exitCode = -1;
            return result;
        }
        if (WIFEXITED(waitStatus))
        {
            result.status = ProcessStatus::Exited;
            result.exitCode = WEXITSTATUS(waitStatus);
        }
        else if (WIFSIGNALED(waitStatus))
        {
            result.status = ProcessStatus::Signaled;
            result.signal = WTERMSIG(waitStatus);
        }
        return result;
    }

} // namespace rtlharvest::lib::process
