#include <cassert>
#include <string>
#include <vector>

#include "hostprep/bootstrap/self_stager.hpp"
#include "hostprep/host/host_environment.hpp"

using hostprep::host::build_command_line;
using hostprep::host::quote_argument;

int main() {
    assert(quote_argument("winget") == "winget");
    assert(quote_argument("") == "\"\"");
    assert(quote_argument("C:\\Program Files\\Docker") == "\"C:\\Program Files\\Docker\"");
    assert(quote_argument("C:\\dir with space\\") == "\"C:\\dir with space\\\\\"");
    assert(quote_argument("say \"hi\"") == "\"say \\\"hi\\\"\"");

    assert(build_command_line("C:\\Temp\\hostprep\\hostprep.exe", {"--resumed"}) ==
           "C:\\Temp\\hostprep\\hostprep.exe --resumed");
    assert(build_command_line("C:\\Users\\A B\\hostprep.exe", {}) == "\"C:\\Users\\A B\\hostprep.exe\"");

    hostprep::bootstrap::StagedCopy staged{"C:/Temp/hostprep/hostprep.exe", "C:/Temp/hostprep/hostprep.json"};
    hostprep::bootstrap::HandoffArguments handoff{"C:/Users/Alice/Downloads/hostprep.json", {}};
    const std::vector<std::string> resumed = hostprep::bootstrap::build_handoff_arguments(staged, handoff, true);
    assert((resumed == std::vector<std::string>{"--config", "C:/Temp/hostprep/hostprep.json", "--resumed"}));

    staged.profile.clear();
    handoff.profile.clear();
    assert(hostprep::bootstrap::build_handoff_arguments(staged, handoff, false).empty());
    return 0;
}
