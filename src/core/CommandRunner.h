#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace lan_scan {

struct CommandResult {
    bool launched = false; // false when the executable could not be found or fork failed
    bool timed_out = false; // child was killed at the deadline; out/err hold what was captured
    int exit_code = -1;
    std::string out;
    std::string err;
    bool ok() const { return launched && !timed_out && exit_code == 0; }
};

// Seam between the discovery engine and external tools (arp-scan, nmap,
// ping, ip, iw, avahi-browse). Implementations must be callable from many
// threads at once.
class CommandRunner {
public:
    virtual ~CommandRunner() = default;
    virtual std::optional<std::string> find_executable(const std::string& name) const = 0;
    virtual CommandResult run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) const = 0;
};

// fork/execv without a shell; stdout and stderr are captured through pipes
// and the child is SIGKILLed once the deadline passes.
class PosixCommandRunner : public CommandRunner {
public:
    std::optional<std::string> find_executable(const std::string& name) const override;
    CommandResult run(const std::vector<std::string>& argv, std::chrono::milliseconds timeout) const override;
private:
    static constexpr size_t kMaxCapture = 8 * 1024 * 1024;
};

std::chrono::milliseconds seconds_to_ms(double seconds);

}
