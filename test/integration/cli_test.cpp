/* Test the dyna-alloc command line tool: output and exit code of every command */

#include <boost/filesystem.hpp>

#include <iostream>
#include <fstream>
#include <string>
#include <vector>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/types.h>
#include <sys/wait.h>

namespace bfs = boost::filesystem;

static std::string cli_path;

/*
 * Runs the tool with args, stdout is collected into out, stderr is dropped
 * @return exit code, -1 if the tool could not be run
 */
static int run_cli(const std::vector<std::string>& args, std::string& out) {
    int fds[2];
    if (pipe(fds) != 0) {
        std::cerr << "ERROR: cannot create pipe: " << strerror(errno) << std::endl;
        return -1;
    }
    auto pid = fork();
    if (pid < 0) {
        std::cerr << "ERROR: fork failed: " << strerror(errno) << std::endl;
        return -1;
    }
    if (pid == 0) {
        dup2(fds[1], STDOUT_FILENO);
        auto null_fd = open("/dev/null", O_WRONLY);
        if (null_fd >= 0) {
            dup2(null_fd, STDERR_FILENO);
        }
        close(fds[0]);
        close(fds[1]);
        std::vector<char*> argv;
        argv.push_back(const_cast<char*>(cli_path.c_str()));
        for (auto& a : args) {
            argv.push_back(const_cast<char*>(a.c_str()));
        }
        argv.push_back(nullptr);
        execv(cli_path.c_str(), argv.data());
        _exit(127);
    }
    close(fds[1]);
    out.clear();
    char buf[256];
    ssize_t nr;
    while ((nr = read(fds[0], buf, sizeof(buf))) > 0) {
        out.append(buf, nr);
    }
    close(fds[0]);
    int status;
    if (waitpid(pid, &status, 0) != pid || !WIFEXITED(status)) {
        std::cerr << "ERROR: " << cli_path << " did not exit normally" << std::endl;
        return -1;
    }
    return WEXITSTATUS(status);
}

static bool check(const std::string& what, const std::vector<std::string>& args,
                  int expected_rc, const std::string* expected_out = nullptr) {
    std::string out;
    auto rc = run_cli(args, out);
    if (rc != expected_rc) {
        std::cerr << "ERROR: " << what << ": exit code " << rc << ", expected " << expected_rc << std::endl;
        return false;
    }
    if (expected_out != nullptr && out != *expected_out) {
        std::cerr << "ERROR: " << what << ": output '" << out << "', expected '" << *expected_out << "'" << std::endl;
        return false;
    }
    return true;
}

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: " << argv[0] << " <path to dyna-alloc>" << std::endl;
        return -1;
    }
    cli_path = argv[1];

    for (auto name : {"DYNA_WORKDIR", "DYNA_SUPERNET", "DYNA_MIN_UID", "DYNA_MAX_UID",
                      "DYNA_LOG_PATH", "DYNA_LOG_LEVEL"}) {
        unsetenv(name);
    }

    const auto work_dir = (bfs::temp_directory_path() / bfs::unique_path("dyna-cli-%%%%-%%%%")).string();
    bfs::create_directories(work_dir);
    const std::vector<std::string> common = {
        "-w", work_dir, "-s", "10.0.0.0/8", "-m", "0", "-M", "0", "-L", work_dir + "/dyna.log"
    };
    auto with = [&common](std::vector<std::string> args) {
        args.insert(args.begin(), common.begin(), common.end());
        return args;
    };

    const std::string reserved = "0 10.0.0.0/30\n";
    const std::string subnet = "10.0.0.0/30\n";
    const std::string empty;

    std::string out;
    if (run_cli(with({"info"}), out) != 0 ||
        out.find("available subnets: 4194304") == std::string::npos ||
        out.find("uid range:         [0, 0]") == std::string::npos) {
        std::cerr << "ERROR: info: unexpected output '" << out << "'" << std::endl;
        return -1;
    }

    if (!check("reserve", with({"reserve"}), 0, &reserved) ||
        // the single uid is taken
        !check("reserve when exhausted", with({"reserve"}), 3, &empty) ||
        !check("list", with({"list"}), 0, &reserved) ||
        !check("subnet", with({"subnet", "0"}), 0, &subnet) ||
        !check("free", with({"free", "0"}), 0, &empty) ||
        !check("double free", with({"free", "0"}), 4, &empty) ||
        !check("list after free", with({"list"}), 0, &empty)) {
        return -1;
    }

    /* Usage errors */
    if (!check("unknown command", with({"bogus"}), 1) ||
        !check("missing command", common, 1) ||
        !check("missing uid", with({"free"}), 1) ||
        !check("malformed uid", with({"free", "abc"}), 1) ||
        !check("malformed subnet uid", with({"subnet", "12x"}), 1) ||
        !check("help", {"--help"}, 1)) {
        return -1;
    }

    /* Configuration errors */
    if (!check("inverted range", {"-w", work_dir, "-m", "5", "-M", "1", "info"}, 2) ||
        !check("malformed supernet", {"-w", work_dir, "-s", "10.0.0.0", "info"}, 2) ||
        !check("range over capacity", {"-w", work_dir, "-s", "10.0.0.0/30", "-m", "0", "-M", "1", "info"}, 2)) {
        return -1;
    }

    /* Storage failure: the work dir is a regular file */
    const auto file = work_dir + "/file";
    { std::ofstream ofs(file); }
    if (!check("work dir is a file", {"-w", file, "-s", "10.0.0.0/8", "-m", "0", "-M", "0",
                                      "-L", work_dir + "/dyna.log", "reserve"}, 5)) {
        return -1;
    }

    // Clean test working directories
    boost::system::error_code ec;
    bfs::remove_all(work_dir, ec);
    if (ec) {
        std::cerr << "ERROR: cannot remove work dir: " << ec.message() << std::endl;
        return -1;
    }
    return 0;
}
