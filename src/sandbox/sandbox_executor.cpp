#include "sandbox/sandbox_executor.hpp"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <limits>
#include <sstream>
#include <system_error>
#include <thread>
#include <utility>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <boost/version.hpp>
#if BOOST_VERSION >= 108600
#include <boost/process/v1.hpp>
#include <boost/process/v1/extend.hpp>
#else
#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#endif

#include "exec/exec_error.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/utf8.hpp"

namespace codebox::sandbox {
#if BOOST_VERSION >= 108600
namespace bp = boost::process::v1;
#else
namespace bp = boost::process;
#endif
namespace fs = std::filesystem;

namespace {

constexpr const char* kTag = "engine";

// Puts the child in its own process group so a timeout can signal
// everything the interpreter started.
struct NewProcessGroup : bp::extend::handler {
    template <typename Executor>
    void on_exec_setup(Executor&) const {
        ::setpgid(0, 0);
    }
};

// Limits too large for the clock saturate to "never".
std::chrono::steady_clock::time_point DeadlineAfter(std::chrono::steady_clock::time_point started,
                                                    std::uint64_t limit_ms) {
    using Clock = std::chrono::steady_clock;
    const auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::time_point::max() - started);
    if (limit_ms >= static_cast<std::uint64_t>(headroom.count())) {
        return Clock::time_point::max();
    }
    return started + std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(limit_ms));
}

std::string ErrnoText(int error) {
    return std::string(std::strerror(error));
}

// Owns one invocation's scratch directory: artifact, stdin and captured output.
class ScratchDir {
public:
    explicit ScratchDir(const fs::path& root) {
        static std::atomic<std::uint64_t> counter{0};
        std::error_code ec;
        const auto base = root.empty() ? fs::temp_directory_path(ec) : root;
        if (ec) {
            throw exec::ExecError::Internal("IO error: no temp directory: " + ec.message());
        }
        for (int attempt = 0; attempt < 16; ++attempt) {
            const auto stamp = std::to_string(
                std::chrono::steady_clock::now().time_since_epoch().count());
            auto candidate = base / ("codebox_" + std::to_string(::getpid()) + "_" +
                                     std::to_string(counter.fetch_add(1)) + "_" + stamp);
            if (fs::create_directory(candidate, ec)) {
                path_ = std::move(candidate);
                return;
            }
            if (ec) {
                throw exec::ExecError::Internal(
                    "IO error: cannot create " + candidate.string() + ": " + ec.message());
            }
        }
        throw exec::ExecError::Internal("IO error: no unique scratch directory under " + base.string());
    }

    ~ScratchDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
        if (ec) {
            utils::Log(utils::LogLevel::kWarn, kTag,
                       "failed to remove " + path_.string() + ": " + ec.message());
        }
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

void WriteFile(const fs::path& path, const std::string& data, bool trailing_newline) {
    std::ofstream output(path, std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw exec::ExecError::Internal("IO error: cannot open " + path.string());
    }
    output << data;
    if (trailing_newline) {
        output << '\n';
    }
    output.flush();
    if (!output) {
        throw exec::ExecError::Internal("IO error: cannot write " + path.string());
    }
}

std::string ReadCaptured(const fs::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return utils::SanitizeUtf8(buffer.str());
}

bp::environment BuildEnvironment(const exec::EnvVars& extra) {
    bp::environment env = boost::this_process::environment();
    for (const auto& [key, value] : extra) {
        if (key.empty() || key.find('=') != std::string::npos) {
            utils::Log(utils::LogLevel::kWarn, kTag, "skipping malformed env name '" + key + "'");
            continue;
        }
        env[key] = value;
    }
    return env;
}

boost::filesystem::path ResolveInterpreter(const std::string& candidate) {
    if (candidate.find('/') != std::string::npos) {
        const boost::filesystem::path direct(candidate);
        return ::access(candidate.c_str(), X_OK) == 0 ? direct : boost::filesystem::path();
    }
    return bp::search_path(candidate);
}

struct Redirects {
    std::string stdout_path;
    std::string stderr_path;
    std::optional<std::string> stdin_path;
};

bp::child Spawn(const exec::LanguageProfile& profile,
                const std::vector<std::string>& argv,
                bp::environment& env,
                const Redirects& io) {
    std::vector<std::string> tried;
    for (const auto& candidate : profile.interpreters) {
        tried.push_back(candidate);
        const auto exe = ResolveInterpreter(candidate);
        if (exe.empty()) {
            utils::Log(utils::LogLevel::kWarn, kTag,
                       "interpreter '" + candidate + "' not found, trying next candidate");
            continue;
        }
        try {
            if (io.stdin_path.has_value()) {
                return bp::child(bp::exe = exe.string(),
                                 bp::args = argv,
                                 env,
                                 NewProcessGroup{},
                                 bp::std_in < *io.stdin_path,
                                 bp::std_out > io.stdout_path,
                                 bp::std_err > io.stderr_path);
            }
            return bp::child(bp::exe = exe.string(),
                             bp::args = argv,
                             env,
                             NewProcessGroup{},
                             bp::std_in < bp::null,
                             bp::std_out > io.stdout_path,
                             bp::std_err > io.stderr_path);
        } catch (const bp::process_error& ex) {
            utils::Log(utils::LogLevel::kWarn, kTag,
                       "failed to spawn '" + candidate + "': " + ex.what());
        }
    }
    throw exec::ExecError::Internal(
        "Failed to launch " + std::string(exec::ToString(profile.kind)) +
        " interpreter (tried: " + utils::Join(tried, ", ") + ")");
}

// Blocks until pid is reaped.
int ReapBlocking(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw exec::ExecError::Internal("waitpid failed: " + ErrnoText(errno));
        }
    }
    return status;
}

// SIGTERM to the group, SIGKILL after the grace period, then reap. The
// leader is only observed (WNOWAIT) until the final kill so its group id
// cannot be recycled underneath us.
void TerminateGroup(pid_t pid, std::chrono::milliseconds grace, std::chrono::milliseconds poll) {
    ::kill(-pid, SIGTERM);
    ::kill(pid, SIGTERM);
    const auto grace_deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < grace_deadline) {
        siginfo_t info{};
        if (::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOHANG | WNOWAIT) == 0 &&
            info.si_pid == pid) {
            break;
        }
        std::this_thread::sleep_for(poll);
    }
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    ReapBlocking(pid);
}

}  // namespace

SandboxExecutor::SandboxExecutor(exec::LanguageProfile profile, ExecutorOptions options)
    : profile_(std::move(profile))
    , options_(std::move(options)) {
    if (options_.poll_interval <= std::chrono::milliseconds::zero()) {
        options_.poll_interval = std::chrono::milliseconds(1);
    }
}

exec::ExecResult SandboxExecutor::Execute(const std::string& source,
                                          const std::vector<std::string>& args,
                                          const exec::EnvVars& env,
                                          const std::optional<std::string>& stdin_data,
                                          const std::optional<exec::Limits>& limits) const {
    ScratchDir scratch(options_.temp_root);
    const auto artifact = scratch / ("main." + profile_.extension);
    WriteFile(artifact, source, true);

    Redirects io{};
    io.stdout_path = (scratch / "stdout.log").string();
    io.stderr_path = (scratch / "stderr.log").string();
    if (stdin_data.has_value()) {
        const auto stdin_path = scratch / "stdin.txt";
        WriteFile(stdin_path, *stdin_data, false);
        io.stdin_path = stdin_path.string();
    }

    std::vector<std::string> argv;
    argv.reserve(args.size() + 1);
    argv.push_back(artifact.string());
    argv.insert(argv.end(), args.begin(), args.end());

    const auto started = std::chrono::steady_clock::now();
    auto child_env = BuildEnvironment(env);
    auto child = Spawn(profile_, argv, child_env, io);
    const pid_t pid = child.id();
    // The pid is reaped below with waitpid; bp::child must not touch it again.
    child.detach();

    std::optional<std::uint64_t> time_limit;
    if (limits.has_value()) {
        time_limit = limits->time_ms;
    }

    int status = 0;
    if (time_limit.has_value()) {
        const auto deadline = DeadlineAfter(started, *time_limit);
        bool finished = false;
        while (true) {
            const auto waited = ::waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                finished = true;
                break;
            }
            if (waited < 0 && errno != EINTR) {
                throw exec::ExecError::Internal("waitpid failed: " + ErrnoText(errno));
            }
            const auto now = std::chrono::steady_clock::now();
            if (now >= deadline) {
                break;
            }
            const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
            std::this_thread::sleep_for(std::min(options_.poll_interval,
                                                 std::max(remaining, std::chrono::milliseconds(1))));
        }
        if (!finished) {
            utils::Log(utils::LogLevel::kWarn, kTag,
                       "pid " + std::to_string(pid) + " exceeded " + std::to_string(*time_limit) +
                       "ms, terminating");
            TerminateGroup(pid, options_.kill_grace, options_.poll_interval);
            throw exec::ExecError::Timeout();
        }
    } else {
        status = ReapBlocking(pid);
    }
    const auto elapsed = utils::ElapsedMs(started);

    exec::ExecResult result{};
    result.run.stdout_text = ReadCaptured(io.stdout_path);
    result.run.stderr_text = ReadCaptured(io.stderr_path);
    if (WIFEXITED(status)) {
        result.run.exit_code = WEXITSTATUS(status);
    }
    result.time_ms = elapsed;
    utils::Log(utils::LogLevel::kDebug, kTag,
               "pid " + std::to_string(pid) + " finished in " + std::to_string(elapsed) + "ms");
    return result;
}

}  // namespace codebox::sandbox
