#include "excelpic/utils/ProcessRunner.hpp"
#include "excelpic/utils/ModuleLoggers.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fmt/format.h>
#include <fmt/ranges.h>

#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#ifdef ERROR
#undef ERROR
#endif
#include <iterator>
#include <utf8.h>
#else
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace excelpic {
namespace utils {

namespace {

#ifdef _WIN32
const char kPathSeparator = ';';
#else
const char kPathSeparator = ':';
#endif

std::vector<std::string> splitSearchPath(const char* value) {
    std::vector<std::string> dirs;
    if (!value) {
        return dirs;
    }
    std::string text(value);
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find(kPathSeparator, start);
        if (end == std::string::npos) {
            end = text.size();
        }
        if (end > start) {
            dirs.push_back(text.substr(start, end - start));
        }
        start = end + 1;
    }
    return dirs;
}

bool isExecutable(const core::Path& candidate) {
    if (!candidate.isFile()) {
        return false;
    }
#ifdef _WIN32
    return true;
#else
    return ::access(candidate.c_str(), X_OK) == 0;
#endif
}

std::string executableName(const std::string& name) {
#ifdef _WIN32
    const std::string filename = core::Path(name).filename();
    if (filename.find('.') == std::string::npos) {
        return name + ".exe";
    }
#endif
    return name;
}

bool hasDirectoryPart(const std::string& name) {
#ifdef _WIN32
    return name.find_first_of("/\\") != std::string::npos;
#else
    return name.find('/') != std::string::npos;
#endif
}

} // namespace

std::optional<core::Path> ProcessRunner::resolveExecutable(const std::string& name,
                                                           const std::optional<core::Path>& search_dir) {
    if (name.empty()) {
        return std::nullopt;
    }

    const std::string exe_name = executableName(name);
    if (hasDirectoryPart(exe_name)) {
        core::Path direct(exe_name);
        if (isExecutable(direct)) {
            return direct.absolute();
        }
        return std::nullopt;
    }

    if (search_dir && !search_dir->empty()) {
        core::Path candidate = *search_dir / exe_name;
        if (isExecutable(candidate)) {
            UTILS_DEBUG("Resolved {} in {}", name, search_dir->string());
            return candidate.absolute();
        }
    }

    for (const auto& dir : splitSearchPath(std::getenv("PATH"))) {
        core::Path candidate = core::Path(dir) / exe_name;
        if (isExecutable(candidate)) {
            UTILS_DEBUG("Resolved {} in PATH entry {}", name, dir);
            return candidate.absolute();
        }
    }

    UTILS_DEBUG("Executable {} not found", name);
    return std::nullopt;
}

std::string ProcessRunner::quoteArgument(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\n\v\"") == std::string::npos) {
        return arg;
    }

    // 反斜杠只在紧跟引号或位于末尾时需要转义
    std::string quoted = "\"";
    size_t backslashes = 0;
    for (char c : arg) {
        if (c == '\\') {
            ++backslashes;
            continue;
        }
        if (c == '"') {
            quoted.append(backslashes * 2 + 1, '\\');
        } else {
            quoted.append(backslashes, '\\');
        }
        backslashes = 0;
        quoted.push_back(c);
    }
    quoted.append(backslashes * 2, '\\');
    quoted.push_back('"');
    return quoted;
}

#ifdef _WIN32

core::Result<int> ProcessRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return core::makeError(core::ErrorCode::InvalidArgument, "Empty command line");
    }

    std::string command_line;
    for (size_t i = 0; i < argv.size(); ++i) {
        if (i > 0) {
            command_line.push_back(' ');
        }
        command_line += quoteArgument(argv[i]);
    }
    UTILS_DEBUG("Running: {}", command_line);

    std::wstring application = core::Path(argv[0]).getWidePath();
    std::wstring wide_command;
    utf8::utf8to16(command_line.begin(), command_line.end(), std::back_inserter(wide_command));

    STARTUPINFOW si{};
    si.cb = sizeof(si);
    si.dwFlags |= STARTF_USESHOWWINDOW;
    si.wShowWindow = SW_HIDE;

    PROCESS_INFORMATION pi{};
    BOOL ok = CreateProcessW(application.c_str(), wide_command.data(), nullptr, nullptr, FALSE,
                             CREATE_NO_WINDOW, nullptr, nullptr, &si, &pi);
    if (!ok) {
        DWORD error = GetLastError();
        UTILS_ERROR("CreateProcessW failed for {} with error {}", argv[0], error);
        return core::makeError(core::ErrorCode::InternalError,
                               fmt::format("Cannot start process (error {})", error), argv[0]);
    }

    WaitForSingleObject(pi.hProcess, INFINITE);
    DWORD exit_code = 0;
    BOOL got_code = GetExitCodeProcess(pi.hProcess, &exit_code);
    CloseHandle(pi.hThread);
    CloseHandle(pi.hProcess);

    if (!got_code) {
        return core::makeError(core::ErrorCode::InternalError,
                               fmt::format("Cannot read exit code (error {})", GetLastError()), argv[0]);
    }
    return static_cast<int>(exit_code);
}

#else

core::Result<int> ProcessRunner::run(const std::vector<std::string>& argv) {
    if (argv.empty()) {
        return core::makeError(core::ErrorCode::InvalidArgument, "Empty command line");
    }

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        args.push_back(const_cast<char*>(arg.c_str()));
    }
    args.push_back(nullptr);

    UTILS_DEBUG("Running: {}", fmt::join(argv, " "));

    pid_t child = ::fork();
    if (child < 0) {
        int err = errno;
        UTILS_ERROR("fork failed: {}", std::strerror(err));
        return core::makeError(core::ErrorCode::InternalError,
                               fmt::format("fork failed: {}", std::strerror(err)), argv[0]);
    }

    if (child == 0) {
        ::execv(args[0], args.data());
        // exec 失败时使用 shell 约定的 127
        ::_exit(127);
    }

    int status = 0;
    while (::waitpid(child, &status, 0) < 0) {
        if (errno != EINTR) {
            int err = errno;
            UTILS_ERROR("waitpid failed: {}", std::strerror(err));
            return core::makeError(core::ErrorCode::InternalError,
                                   fmt::format("waitpid failed: {}", std::strerror(err)), argv[0]);
        }
    }

    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return core::makeError(core::ErrorCode::InternalError,
                               fmt::format("Process terminated by signal {}", WTERMSIG(status)), argv[0]);
    }
    return core::makeError(core::ErrorCode::InternalError, "Process ended abnormally", argv[0]);
}

#endif

}} // namespace excelpic::utils
