#include "motionmux/transcode.h"

#include <cstdint>
#include <new>
#include <system_error>
#include <utility>

#if defined(_WIN32)
#    include <process.h>
#else
#    include <cerrno>
#    include <fcntl.h>
#    include <sys/types.h>
#    include <sys/wait.h>
#    include <unistd.h>
#endif

namespace motionmux {
namespace {

    /// Runs \p command (argv[0] is looked up on PATH); returns the exit code or -1.
    static int run_command(const std::vector<std::string>& command)
    {
#if defined(_WIN32)
        std::vector<const char*> argv;
        for (const std::string& s : command) {
            argv.push_back(s.c_str());
        }
        argv.push_back(nullptr);
        const intptr_t rc = ::_spawnvp(_P_WAIT, argv[0], argv.data());
        return rc < 0 ? -1 : static_cast<int>(rc);
#else
        // argv is prepared before fork; the child only calls exec/_exit.
        std::vector<char*> argv;
        for (const std::string& s : command) {
            argv.push_back(const_cast<char*>(s.c_str()));
        }
        argv.push_back(nullptr);

        const pid_t pid = ::fork();
        if (pid < 0) {
            return -1;
        }
        if (pid == 0) {
            // Converter chatter must not mix with our own stdout.
            const int null_fd = ::open("/dev/null", O_WRONLY);
            if (null_fd >= 0) {
                (void)::dup2(null_fd, STDOUT_FILENO);
                (void)::close(null_fd);
            }
            ::execvp(argv[0], argv.data());
            ::_exit(127);
        }

        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                return -1;
            }
        }
        if (!WIFEXITED(status)) {
            return -1;
        }
        return WEXITSTATUS(status);
#endif
    }

}  // namespace

CommandTranscoder::CommandTranscoder(std::string program,
                                     std::vector<std::string> args)
    : program_(std::move(program))
    , args_(std::move(args))
{
}


TranscodeStatus
CommandTranscoder::to_jpeg(const std::filesystem::path& source,
                           const std::filesystem::path& jpeg) noexcept
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(source, ec)) {
        return TranscodeStatus::InputNotFound;
    }
    if (std::filesystem::exists(jpeg, ec) || ec) {
        return TranscodeStatus::OutputExists;
    }

    try {
        std::vector<std::string> command;
        command.reserve(args_.size() + 3U);
        command.push_back(program_);
        command.insert(command.end(), args_.begin(), args_.end());
        command.push_back(source.string());
        command.push_back(jpeg.string());

        if (run_command(command) != 0) {
            // Drop whatever a failed converter left behind.
            std::filesystem::remove(jpeg, ec);
            return TranscodeStatus::CommandFailed;
        }
    } catch (const std::bad_alloc&) {
        return TranscodeStatus::CommandFailed;
    }

    if (!std::filesystem::is_regular_file(jpeg, ec)) {
        return TranscodeStatus::OutputMissing;
    }
    return TranscodeStatus::Ok;
}


std::filesystem::path
converted_jpeg_path(const std::filesystem::path& heic)
{
    std::filesystem::path p = heic;
    p.replace_extension(".jpg");
    return p;
}


const char*
transcode_status_name(TranscodeStatus status) noexcept
{
    switch (status) {
    case TranscodeStatus::Ok: return "ok";
    case TranscodeStatus::InputNotFound: return "input_not_found";
    case TranscodeStatus::OutputExists: return "output_exists";
    case TranscodeStatus::CommandFailed: return "command_failed";
    case TranscodeStatus::OutputMissing: return "output_missing";
    }
    return "unknown";
}

}  // namespace motionmux
