// src/Utils/Process.cpp
#include <Ember/Utils/Process.hpp>
#include <Ember/Utils/Logger.hpp>

#include <cstdlib>
#include <cstring>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#else
#include <cerrno>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace Ember::Utils {

namespace {

std::string joinForLog(const std::vector<std::string>& args) {
    std::string joined;
    for (const auto& arg : args) {
        if (!joined.empty()) joined += ' ';
        joined += arg;
    }
    return joined;
}

#ifdef _WIN32

std::string quoteArgument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) {
        return arg;
    }
    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
        } else if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
            quoted += '"';
            backslashes = 0;
        } else {
            quoted.append(backslashes, '\\');
            quoted += c;
            backslashes = 0;
        }
    }
    quoted.append(backslashes * 2, '\\');
    quoted += '"';
    return quoted;
}

std::string buildCommandLine(const std::vector<std::string>& args) {
    std::string line;
    for (const auto& arg : args) {
        if (!line.empty()) line += ' ';
        line += quoteArgument(arg);
    }
    return line;
}

#else

// Forks and execs args. On return the child is running; exec failures are reported
// back through a close-on-exec pipe and turned into exceptions here.
pid_t forkExec(const std::vector<std::string>& args, const std::filesystem::path& workingDir,
               int outputFd, bool newSession) {
    std::vector<char*> argv;
    argv.reserve(args.size() + 1);
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    const std::string wd = workingDir.string();

    int errPipe[2];
    if (pipe(errPipe) != 0) {
        throw std::runtime_error(std::string("pipe() failed: ") + std::strerror(errno));
    }
    fcntl(errPipe[1], F_SETFD, FD_CLOEXEC);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close(errPipe[0]);
        close(errPipe[1]);
        throw std::runtime_error(std::string("fork() failed: ") + std::strerror(err));
    }

    if (pid == 0) {
        close(errPipe[0]);
        if (newSession) {
            setsid();
        }
        if (outputFd >= 0) {
            dup2(outputFd, STDOUT_FILENO);
            dup2(outputFd, STDERR_FILENO);
            close(outputFd);
        }
        int devNull = open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            dup2(devNull, STDIN_FILENO);
            close(devNull);
        }
        if (!wd.empty() && chdir(wd.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = write(errPipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }
        execvp(argv[0], argv.data());
        int err = errno;
        ssize_t ignored = write(errPipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    close(errPipe[1]);
    int childErr = 0;
    ssize_t n;
    do {
        n = read(errPipe[0], &childErr, sizeof(childErr));
    } while (n < 0 && errno == EINTR);
    close(errPipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErr))) {
        int status = 0;
        waitpid(pid, &status, 0);
        throw std::runtime_error("Failed to start '" + args.front() + "': " + std::strerror(childErr));
    }
    return pid;
}

#endif

} // namespace

ProcessResult runAndCapture(const std::vector<std::string>& args, const std::filesystem::path& workingDir) {
    if (args.empty()) {
        throw std::runtime_error("runAndCapture: empty command");
    }
    CORE_LOG_TRACE("[Process] Running: {}", joinForLog(args));
    ProcessResult result;

#ifdef _WIN32
    SECURITY_ATTRIBUTES sa{};
    sa.nLength = sizeof(sa);
    sa.bInheritHandle = TRUE;
    HANDLE readPipe = nullptr;
    HANDLE writePipe = nullptr;
    if (!CreatePipe(&readPipe, &writePipe, &sa, 0)) {
        throw std::runtime_error("CreatePipe failed");
    }
    SetHandleInformation(readPipe, HANDLE_FLAG_INHERIT, 0);

    STARTUPINFOA si{};
    si.cb = sizeof(si);
    si.dwFlags = STARTF_USESTDHANDLES;
    si.hStdOutput = writePipe;
    si.hStdError = writePipe;
    si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
    PROCESS_INFORMATION pi{};

    std::string cmdLine = buildCommandLine(args);
    std::string wd = workingDir.string();
    if (!CreateProcessA(nullptr, cmdLine.data(), nullptr, nullptr, TRUE, CREATE_NO_WINDOW, nullptr,
                        wd.empty() ? nullptr : wd.c_str(), &si, &pi)) {
        CloseHandle(readPipe);
        CloseHandle(writePipe);
        throw std::runtime_error("Failed to start '" + args.front() + "' (error " + std::to_string(GetLastError()) + ")");
    }
    CloseHandle(writePipe);

    char buffer[4096];
    DWORD bytesRead = 0;
    while (ReadFile(readPipe, buffer, sizeof(buffer), &bytesRead, nullptr) && bytesRead > 0) {
        result.output.append(buffer, bytesRead);
    }
    CloseHandle(readPipe);

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD exitCode = 0;
    GetExitCodeProcess(pi.hProcess, &exitCode);
    result.exitCode = static_cast<int>(exitCode);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);
#else
    int outPipe[2];
    if (pipe(outPipe) != 0) {
        throw std::runtime_error(std::string("pipe() failed: ") + std::strerror(errno));
    }
    fcntl(outPipe[0], F_SETFD, FD_CLOEXEC);

    pid_t pid;
    try {
        pid = forkExec(args, workingDir, outPipe[1], false);
    } catch (...) {
        close(outPipe[0]);
        close(outPipe[1]);
        throw;
    }
    close(outPipe[1]);

    char buffer[4096];
    for (;;) {
        ssize_t n = read(outPipe[0], buffer, sizeof(buffer));
        if (n > 0) {
            result.output.append(buffer, static_cast<size_t>(n));
        } else if (n < 0 && errno == EINTR) {
            continue;
        } else {
            break;
        }
    }
    close(outPipe[0]);

    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    result.exitCode = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
#endif

    CORE_LOG_TRACE("[Process] '{}' exited with {}", args.front(), result.exitCode);
    return result;
}

long spawnDetached(const std::vector<std::string>& args, const std::filesystem::path& workingDir) {
    if (args.empty()) {
        throw std::runtime_error("spawnDetached: empty command");
    }
    CORE_LOG_INFO("[Process] Spawning: {}", joinForLog(args));

#ifdef _WIN32
    STARTUPINFOA si{};
    si.cb = sizeof(si);
    PROCESS_INFORMATION pi{};
    std::string cmdLine = buildCommandLine(args);
    std::string wd = workingDir.string();
    if (!CreateProcessA(nullptr, cmdLine.data(), nullptr, nullptr, FALSE,
                        DETACHED_PROCESS | CREATE_NEW_PROCESS_GROUP, nullptr,
                        wd.empty() ? nullptr : wd.c_str(), &si, &pi)) {
        throw std::runtime_error("Failed to start '" + args.front() + "' (error " + std::to_string(GetLastError()) + ")");
    }
    long pid = static_cast<long>(pi.dwProcessId);
    CloseHandle(pi.hProcess);
    CloseHandle(pi.hThread);
    return pid;
#else
    int devNull = open("/dev/null", O_WRONLY | O_CLOEXEC);
    pid_t pid;
    try {
        pid = forkExec(args, workingDir, devNull, true);
    } catch (...) {
        if (devNull >= 0) close(devNull);
        throw;
    }
    if (devNull >= 0) close(devNull);
    return static_cast<long>(pid);
#endif
}

std::filesystem::path findOnPath(const std::string& program) {
    const char* pathEnv = std::getenv("PATH");
    if (pathEnv == nullptr) {
        return {};
    }
#ifdef _WIN32
    const char separator = ';';
    const std::vector<std::string> suffixes = {"", ".exe"};
#else
    const char separator = ':';
    const std::vector<std::string> suffixes = {""};
#endif
    std::string paths = pathEnv;
    size_t start = 0;
    while (start <= paths.size()) {
        size_t end = paths.find(separator, start);
        if (end == std::string::npos) end = paths.size();
        std::string dir = paths.substr(start, end - start);
        if (!dir.empty()) {
            for (const auto& suffix : suffixes) {
                std::filesystem::path candidate = std::filesystem::path(dir) / (program + suffix);
                std::error_code ec;
                if (std::filesystem::is_regular_file(candidate, ec)) {
                    return candidate;
                }
            }
        }
        start = end + 1;
    }
    return {};
}

} // namespace Ember::Utils
