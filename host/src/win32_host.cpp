#include "hostprep/host/host_environment.hpp"

#include <algorithm>
#include <cwctype>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#if defined(_WIN32)
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#include <shellapi.h>
#include <TlHelp32.h>

namespace hostprep::host {

namespace {

constexpr wchar_t kRunKey[] = L"Software\\Microsoft\\Windows\\CurrentVersion\\Run";
constexpr DWORD kPipeBufferBytes = 64 * 1024;
constexpr DWORD kPollMilliseconds = 50;

class HandleGuard {
public:
    explicit HandleGuard(HANDLE handle = nullptr) : handle_(handle) {}
    ~HandleGuard() { reset(); }

    HandleGuard(const HandleGuard&) = delete;
    HandleGuard& operator=(const HandleGuard&) = delete;

    HANDLE get() const { return handle_; }
    HANDLE* out() {
        reset();
        return &handle_;
    }
    void reset(HANDLE handle = nullptr) {
        if (handle_ != nullptr && handle_ != INVALID_HANDLE_VALUE) {
            CloseHandle(handle_);
        }
        handle_ = handle;
    }

private:
    HANDLE handle_{nullptr};
};

std::wstring utf8_to_wide(const std::string& input) {
    if (input.empty()) {
        return {};
    }
    const int len = MultiByteToWideChar(CP_UTF8, 0, input.c_str(), -1, nullptr, 0);
    if (len <= 0) {
        return {};
    }
    std::wstring wide(static_cast<std::size_t>(len - 1), L'\0');
    MultiByteToWideChar(CP_UTF8, 0, input.c_str(), -1, wide.data(), len);
    return wide;
}

std::string wide_to_utf8(const std::wstring& input) {
    if (input.empty()) {
        return {};
    }
    const int len = WideCharToMultiByte(CP_UTF8, 0, input.c_str(), -1, nullptr, 0, nullptr, nullptr);
    if (len <= 0) {
        return {};
    }
    std::string narrow(static_cast<std::size_t>(len - 1), '\0');
    WideCharToMultiByte(CP_UTF8, 0, input.c_str(), -1, narrow.data(), len, nullptr, nullptr);
    return narrow;
}

std::wstring environment_variable(const wchar_t* name) {
    const DWORD size = GetEnvironmentVariableW(name, nullptr, 0);
    if (size == 0) {
        return {};
    }
    std::wstring value(size, L'\0');
    const DWORD written = GetEnvironmentVariableW(name, value.data(), size);
    value.resize(written < size ? written : 0);
    return value;
}

std::wstring to_lower(std::wstring value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](wchar_t ch) { return static_cast<wchar_t>(std::towlower(ch)); });
    return value;
}

// Reads whatever is buffered without blocking on EOF; a grandchild may keep the
// write end open after the direct child exits.
void drain_pipe(HANDLE pipe, std::string& sink) {
    if (pipe == nullptr) {
        return;
    }
    char chunk[4096];
    for (;;) {
        DWORD available = 0;
        if (!PeekNamedPipe(pipe, nullptr, 0, nullptr, &available, nullptr) || available == 0) {
            return;
        }
        DWORD read = 0;
        const DWORD wanted = std::min<DWORD>(available, static_cast<DWORD>(sizeof(chunk)));
        if (!ReadFile(pipe, chunk, wanted, &read, nullptr) || read == 0) {
            return;
        }
        sink.append(chunk, read);
    }
}

std::string win32_error(const char* what, DWORD code) {
    return std::string(what) + " failed with error " + std::to_string(code);
}

class Win32Host final : public HostEnvironment {
public:
    bool is_elevated() const override {
        HandleGuard token;
        if (!OpenProcessToken(GetCurrentProcess(), TOKEN_QUERY, token.out())) {
            return false;
        }
        TOKEN_ELEVATION elevation{};
        DWORD size = 0;
        if (!GetTokenInformation(token.get(), TokenElevation, &elevation, sizeof(elevation), &size)) {
            return false;
        }
        return elevation.TokenIsElevated != 0;
    }

    std::filesystem::path current_executable() const override {
        std::wstring buffer(MAX_PATH, L'\0');
        for (;;) {
            const DWORD written =
                GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
            if (written == 0) {
                throw std::runtime_error(win32_error("GetModuleFileNameW", GetLastError()));
            }
            if (written < buffer.size()) {
                buffer.resize(written);
                return std::filesystem::path(buffer);
            }
            buffer.resize(buffer.size() * 2);
        }
    }

    std::filesystem::path temp_directory() const override {
        return std::filesystem::temp_directory_path();
    }

    std::filesystem::path home_directory() const override {
        return std::filesystem::path(environment_variable(L"USERPROFILE"));
    }

    std::filesystem::path roaming_app_data() const override {
        return std::filesystem::path(environment_variable(L"APPDATA"));
    }

    std::string user_name() const override {
        std::wstring name = environment_variable(L"USERNAME");
        if (name.empty()) {
            wchar_t buffer[256 + 1]{};
            DWORD size = static_cast<DWORD>(sizeof(buffer) / sizeof(wchar_t));
            if (GetUserNameW(buffer, &size)) {
                name.assign(buffer);
            }
        }
        return wide_to_utf8(name);
    }

    std::optional<std::filesystem::path> find_on_path(std::string_view command) const override {
        const std::wstring name = utf8_to_wide(std::string(command));
        const DWORD needed = SearchPathW(nullptr, name.c_str(), L".exe", 0, nullptr, nullptr);
        if (needed == 0) {
            return std::nullopt;
        }
        std::wstring buffer(needed, L'\0');
        const DWORD written = SearchPathW(nullptr, name.c_str(), L".exe", needed, buffer.data(), nullptr);
        if (written == 0 || written >= needed) {
            return std::nullopt;
        }
        buffer.resize(written);
        return std::filesystem::path(buffer);
    }

    void prepend_to_path(const std::filesystem::path& directory) override {
        const std::wstring current = environment_variable(L"PATH");
        const std::wstring wanted = to_lower(directory.wstring());

        std::size_t start = 0;
        while (start <= current.size()) {
            const std::size_t end = std::min(current.find(L';', start), current.size());
            std::wstring entry = to_lower(current.substr(start, end - start));
            while (!entry.empty() && (entry.back() == L'\\' || entry.back() == L'/')) {
                entry.pop_back();
            }
            if (!entry.empty() && entry == wanted) {
                return;
            }
            start = end + 1;
        }

        const std::wstring updated = current.empty() ? directory.wstring() : directory.wstring() + L";" + current;
        SetEnvironmentVariableW(L"PATH", updated.c_str());
    }

    bool is_process_running(std::string_view image_name) const override {
        HandleGuard snapshot(CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0));
        if (snapshot.get() == INVALID_HANDLE_VALUE) {
            return false;
        }
        const std::wstring wanted = to_lower(utf8_to_wide(std::string(image_name)));

        PROCESSENTRY32W entry{};
        entry.dwSize = sizeof(entry);
        if (!Process32FirstW(snapshot.get(), &entry)) {
            return false;
        }
        do {
            if (to_lower(entry.szExeFile) == wanted) {
                return true;
            }
        } while (Process32NextW(snapshot.get(), &entry));
        return false;
    }

    CommandResult run(const Command& command, const RunOptions& options) override {
        CommandResult result{};
        const std::wstring cmd = utf8_to_wide(build_command_line(command.program, command.arguments));
        std::vector<wchar_t> cmd_buffer(cmd.begin(), cmd.end());
        cmd_buffer.push_back(L'\0');

        HandleGuard read_end;
        HandleGuard write_end;
        STARTUPINFOW si{};
        si.cb = sizeof(si);
        if (options.capture_output) {
            SECURITY_ATTRIBUTES sa{};
            sa.nLength = sizeof(sa);
            sa.bInheritHandle = TRUE;
            HANDLE read_handle = nullptr;
            HANDLE write_handle = nullptr;
            if (!CreatePipe(&read_handle, &write_handle, &sa, kPipeBufferBytes)) {
                result.error = win32_error("CreatePipe", GetLastError());
                return result;
            }
            read_end.reset(read_handle);
            write_end.reset(write_handle);
            SetHandleInformation(read_end.get(), HANDLE_FLAG_INHERIT, 0);
            si.dwFlags = STARTF_USESTDHANDLES;
            si.hStdInput = GetStdHandle(STD_INPUT_HANDLE);
            si.hStdOutput = write_end.get();
            si.hStdError = write_end.get();
        }

        const std::wstring workdir = command.working_directory.wstring();
        PROCESS_INFORMATION pi{};
        if (!CreateProcessW(nullptr, cmd_buffer.data(), nullptr, nullptr,
                            options.capture_output ? TRUE : FALSE, 0, nullptr,
                            workdir.empty() ? nullptr : workdir.c_str(), &si, &pi)) {
            result.error = win32_error("CreateProcessW", GetLastError());
            return result;
        }
        HandleGuard process(pi.hProcess);
        HandleGuard thread(pi.hThread);
        result.started = true;
        write_end.reset();

        if (!options.capture_output && !options.timeout) {
            WaitForSingleObject(process.get(), INFINITE);
        } else {
            const ULONGLONG deadline =
                options.timeout ? GetTickCount64() + static_cast<ULONGLONG>(options.timeout->count()) : 0;
            for (;;) {
                drain_pipe(read_end.get(), result.output);
                if (WaitForSingleObject(process.get(), kPollMilliseconds) == WAIT_OBJECT_0) {
                    break;
                }
                if (options.timeout && GetTickCount64() >= deadline) {
                    result.timed_out = true;
                    TerminateProcess(process.get(), ERROR_TIMEOUT);
                    WaitForSingleObject(process.get(), INFINITE);
                    break;
                }
            }
            drain_pipe(read_end.get(), result.output);
        }

        DWORD exit_code = 0;
        if (!GetExitCodeProcess(process.get(), &exit_code)) {
            result.error = win32_error("GetExitCodeProcess", GetLastError());
            return result;
        }
        result.exit_code = static_cast<int>(exit_code);
        return result;
    }

    bool spawn_detached(const Command& command, std::string& error) override {
        const std::wstring cmd = utf8_to_wide(build_command_line(command.program, command.arguments));
        std::vector<wchar_t> cmd_buffer(cmd.begin(), cmd.end());
        cmd_buffer.push_back(L'\0');
        const std::wstring workdir = command.working_directory.wstring();

        STARTUPINFOW si{};
        si.cb = sizeof(si);
        PROCESS_INFORMATION pi{};
        if (!CreateProcessW(nullptr, cmd_buffer.data(), nullptr, nullptr, FALSE,
                            DETACHED_PROCESS | CREATE_NEW_PROCESS_GROUP, nullptr,
                            workdir.empty() ? nullptr : workdir.c_str(), &si, &pi)) {
            error = win32_error("CreateProcessW", GetLastError());
            return false;
        }
        CloseHandle(pi.hThread);
        CloseHandle(pi.hProcess);
        return true;
    }

    ElevationOutcome relaunch_elevated(const std::filesystem::path& executable,
                                       const std::vector<std::string>& arguments,
                                       std::string& error) override {
        std::wstring file;
        std::wstring parameters;
        if (const auto terminal = find_on_path("wt")) {
            file = terminal->wstring();
            parameters = utf8_to_wide(build_command_line(path_to_utf8(executable), arguments));
        } else {
            file = executable.wstring();
            parameters = utf8_to_wide(join_arguments(arguments));
        }
        const std::wstring directory = executable.parent_path().wstring();

        SHELLEXECUTEINFOW info{};
        info.cbSize = sizeof(info);
        info.fMask = SEE_MASK_NOCLOSEPROCESS | SEE_MASK_NOASYNC;
        info.lpVerb = L"runas";
        info.lpFile = file.c_str();
        info.lpParameters = parameters.empty() ? nullptr : parameters.c_str();
        info.lpDirectory = directory.empty() ? nullptr : directory.c_str();
        info.nShow = SW_SHOWNORMAL;

        if (!ShellExecuteExW(&info)) {
            const DWORD code = GetLastError();
            error = win32_error("ShellExecuteExW", code);
            return code == ERROR_CANCELLED ? ElevationOutcome::Declined : ElevationOutcome::Failed;
        }
        if (info.hProcess != nullptr) {
            CloseHandle(info.hProcess);
        }
        return ElevationOutcome::Started;
    }

    bool set_run_entry(const std::string& name, const std::string& command_line, std::string& error) override {
        const std::wstring value_name = utf8_to_wide(name);
        const std::wstring data = utf8_to_wide(command_line);
        const LSTATUS status = RegSetKeyValueW(HKEY_CURRENT_USER, kRunKey, value_name.c_str(), REG_SZ,
                                               data.c_str(),
                                               static_cast<DWORD>((data.size() + 1) * sizeof(wchar_t)));
        if (status != ERROR_SUCCESS) {
            error = win32_error("RegSetKeyValueW", static_cast<DWORD>(status));
            return false;
        }
        return true;
    }

    bool remove_run_entry(const std::string& name, std::string& error) override {
        const std::wstring value_name = utf8_to_wide(name);
        const LSTATUS status = RegDeleteKeyValueW(HKEY_CURRENT_USER, kRunKey, value_name.c_str());
        if (status != ERROR_SUCCESS && status != ERROR_FILE_NOT_FOUND) {
            error = win32_error("RegDeleteKeyValueW", static_cast<DWORD>(status));
            return false;
        }
        return true;
    }

    bool has_run_entry(const std::string& name) const override {
        const std::wstring value_name = utf8_to_wide(name);
        return RegGetValueW(HKEY_CURRENT_USER, kRunKey, value_name.c_str(), RRF_RT_REG_SZ, nullptr,
                            nullptr, nullptr) == ERROR_SUCCESS;
    }

    bool request_restart(std::string& error) override {
        HandleGuard token;
        if (!OpenProcessToken(GetCurrentProcess(), TOKEN_ADJUST_PRIVILEGES | TOKEN_QUERY, token.out())) {
            error = win32_error("OpenProcessToken", GetLastError());
            return false;
        }
        TOKEN_PRIVILEGES privileges{};
        privileges.PrivilegeCount = 1;
        privileges.Privileges[0].Attributes = SE_PRIVILEGE_ENABLED;
        if (!LookupPrivilegeValueW(nullptr, SE_SHUTDOWN_NAME, &privileges.Privileges[0].Luid)) {
            error = win32_error("LookupPrivilegeValueW", GetLastError());
            return false;
        }
        AdjustTokenPrivileges(token.get(), FALSE, &privileges, 0, nullptr, nullptr);
        if (const DWORD code = GetLastError(); code != ERROR_SUCCESS) {
            error = win32_error("AdjustTokenPrivileges", code);
            return false;
        }

        std::wstring message = L"Restarting to finish enabling Windows virtualization features.";
        if (!InitiateSystemShutdownExW(nullptr, message.data(), 10, TRUE, TRUE,
                                       SHTDN_REASON_MAJOR_OPERATINGSYSTEM | SHTDN_REASON_MINOR_RECONFIG |
                                           SHTDN_REASON_FLAG_PLANNED)) {
            error = win32_error("InitiateSystemShutdownExW", GetLastError());
            return false;
        }
        return true;
    }
};

}  // namespace

std::unique_ptr<HostEnvironment> create_native_host() {
    return std::make_unique<Win32Host>();
}

}  // namespace hostprep::host

#else

namespace hostprep::host {

std::unique_ptr<HostEnvironment> create_native_host() {
    throw std::runtime_error("hostprep only runs on Windows hosts.");
}

}  // namespace hostprep::host

#endif
