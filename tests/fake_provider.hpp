#pragma once

#include "runbox/core/errors.hpp"
#include "runbox/provider/sandbox_provider.hpp"

#include <archive.h>
#include <archive_entry.h>

#include <chrono>
#include <deque>
#include <fstream>
#include <functional>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace runbox {
namespace testing {

// Splits a command into words, honouring single-quoted segments
inline std::vector<std::string> ShellWords(const std::string& command) {
    std::vector<std::string> words;
    std::string word;
    bool in_quotes = false;
    bool has_word = false;
    for (char c : command) {
        if (c == '\'') {
            in_quotes = !in_quotes;
            has_word = true;
        } else if (c == ' ' && !in_quotes) {
            if (has_word) {
                words.push_back(word);
                word.clear();
                has_word = false;
            }
        } else {
            word += c;
            has_word = true;
        }
    }
    if (has_word) {
        words.push_back(word);
    }
    return words;
}

inline std::map<std::string, std::string> UnpackZip(const std::string& bytes) {
    std::map<std::string, std::string> entries;
    archive* reader = archive_read_new();
    archive_read_support_format_zip(reader);
    if (archive_read_open_memory(reader, bytes.data(), bytes.size()) != ARCHIVE_OK) {
        archive_read_free(reader);
        return entries;
    }
    archive_entry* entry = nullptr;
    while (archive_read_next_header(reader, &entry) == ARCHIVE_OK) {
        std::string data;
        char buffer[4096];
        la_ssize_t n = 0;
        while ((n = archive_read_data(reader, buffer, sizeof(buffer))) > 0) {
            data.append(buffer, static_cast<std::size_t>(n));
        }
        entries[archive_entry_pathname(entry)] = data;
    }
    archive_read_free(reader);
    return entries;
}

/**
 * In-memory devbox backend.
 *
 * Statuses returned by Retrieve() are taken from a script (the last one
 * repeats). Remote files live in a map. Commands issued by runbox (mkdir,
 * unzip, rm, ls, cd) are emulated; anything else goes to exec_handler.
 */
class FakeProvider : public provider::SandboxProvider {
public:
    std::string devbox_id{"dbx_fake"};
    core::SandboxStatus create_status{core::SandboxStatus::PENDING};
    std::deque<core::SandboxStatus> status_script{core::SandboxStatus::RUNNING};
    std::string tunnel_url{"dbx-fake-60000.tunnel.example"};

    std::function<provider::ExecutionResult(const std::string&)> exec_handler;
    std::chrono::milliseconds call_delay{0};

    // Failure injection
    bool fail_create{false};
    bool fail_tunnel{false};
    bool fail_shutdown{false};
    bool fail_write{false};
    bool fail_read{false};
    bool fail_upload{false};
    int fail_retrieve_times{0};
    int fail_exec_times{0};
    int mkdir_exit_code{0};
    int unzip_exit_code{0};

    // Remote state
    std::map<std::string, std::string> files;
    std::set<std::string> directories;

    // Recorded calls
    std::vector<provider::CreateDevboxRequest> create_requests;
    std::vector<std::string> commands;
    std::vector<std::string> shells;
    std::vector<std::string> events;
    std::vector<std::string> shutdowns;
    std::map<std::string, int> calls;

    int Calls(const std::string& operation) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls.find(operation);
        return it == calls.end() ? 0 : it->second;
    }

    int TotalCalls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        int total = 0;
        for (const auto& item : calls) {
            total += item.second;
        }
        return total;
    }

    std::vector<std::string> Events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return events;
    }

    std::vector<std::string> Commands() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return commands;
    }

    provider::DevboxInfo Create(const provider::CreateDevboxRequest& request) override {
        Scope scope(*this, "create");
        std::lock_guard<std::mutex> lock(mutex_);
        create_requests.push_back(request);
        if (fail_create) {
            throw core::ProviderStatusError(400, "quota exceeded");
        }
        return {devbox_id, create_status, request.name};
    }

    provider::DevboxInfo Retrieve(const std::string& id) override {
        Scope scope(*this, "retrieve");
        std::lock_guard<std::mutex> lock(mutex_);
        if (id != devbox_id) {
            throw core::ProviderStatusError(404, "devbox not found");
        }
        if (fail_retrieve_times > 0) {
            --fail_retrieve_times;
            throw core::ProviderStatusError(503, "service unavailable");
        }
        auto status = status_script.front();
        if (status_script.size() > 1) {
            status_script.pop_front();
        }
        return {devbox_id, status, "fake"};
    }

    provider::ExecutionResult ExecuteSync(const std::string& id,
                                          const std::string& command,
                                          const std::string& shell_name) override {
        Scope scope(*this, "execute");
        std::function<provider::ExecutionResult(const std::string&)> handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            CheckId(id);
            commands.push_back(command);
            shells.push_back(shell_name);
            if (fail_exec_times > 0) {
                --fail_exec_times;
                throw core::ProviderStatusError(500, "execution backend error");
            }
            provider::ExecutionResult builtin;
            if (Emulate(command, builtin)) {
                return builtin;
            }
            handler = exec_handler;
        }
        if (handler) {
            return handler(command);
        }
        return {"", 0};
    }

    std::string ReadFileContents(const std::string& id, const std::string& file_path) override {
        Scope scope(*this, "read");
        std::lock_guard<std::mutex> lock(mutex_);
        CheckId(id);
        if (fail_read) {
            throw core::ProviderStatusError(500, "read failed");
        }
        auto it = files.find(file_path);
        if (it == files.end()) {
            throw core::ProviderStatusError(404, "No such file: " + file_path);
        }
        return it->second;
    }

    void WriteFileContents(const std::string& id,
                           const std::string& file_path,
                           const std::string& contents) override {
        Scope scope(*this, "write");
        std::lock_guard<std::mutex> lock(mutex_);
        CheckId(id);
        if (fail_write) {
            throw core::ProviderStatusError(403, "permission denied");
        }
        files[file_path] = contents;
    }

    void UploadFile(const std::string& id,
                    const std::filesystem::path& local_path,
                    const std::string& remote_path) override {
        Scope scope(*this, "upload");
        std::lock_guard<std::mutex> lock(mutex_);
        CheckId(id);
        if (fail_upload) {
            throw core::ProviderStatusError(500, "upload failed");
        }
        std::ifstream file(local_path, std::ios::binary);
        std::stringstream buffer;
        buffer << file.rdbuf();
        files[remote_path] = buffer.str();
    }

    provider::TunnelInfo CreateTunnel(const std::string& id, int port) override {
        Scope scope(*this, "tunnel");
        std::lock_guard<std::mutex> lock(mutex_);
        CheckId(id);
        if (fail_tunnel) {
            throw core::ProviderStatusError(409, "port not available");
        }
        return {port, tunnel_url};
    }

    void Shutdown(const std::string& id) override {
        Scope scope(*this, "shutdown");
        std::lock_guard<std::mutex> lock(mutex_);
        shutdowns.push_back(id);
        if (fail_shutdown) {
            throw core::ProviderStatusError(500, "shutdown failed");
        }
    }

private:
    mutable std::mutex mutex_;

    class Scope {
    public:
        Scope(FakeProvider& owner, const std::string& operation)
            : owner_(owner), operation_(operation) {
            {
                std::lock_guard<std::mutex> lock(owner_.mutex_);
                owner_.events.push_back("begin:" + operation_);
                ++owner_.calls[operation_];
            }
            if (owner_.call_delay.count() > 0) {
                std::this_thread::sleep_for(owner_.call_delay);
            }
        }

        ~Scope() {
            std::lock_guard<std::mutex> lock(owner_.mutex_);
            owner_.events.push_back("end:" + operation_);
        }

    private:
        FakeProvider& owner_;
        std::string operation_;
    };

    void CheckId(const std::string& id) const {
        if (id != devbox_id) {
            throw core::ProviderStatusError(404, "devbox not found");
        }
    }

    std::vector<std::string> ListDirectory(const std::string& directory) const {
        std::string prefix = directory;
        if (!prefix.empty() && prefix.back() != '/') {
            prefix += '/';
        }
        std::set<std::string> names;
        auto collect = [&](const std::string& path) {
            if (path.compare(0, prefix.size(), prefix) != 0) {
                return;
            }
            auto rest = path.substr(prefix.size());
            names.insert(rest.substr(0, rest.find('/')));
        };
        for (const auto& item : files) {
            collect(item.first);
        }
        for (const auto& directory : directories) {
            collect(directory);
        }
        return {names.begin(), names.end()};
    }

    // Handles the commands runbox issues itself; caller holds mutex_
    bool Emulate(const std::string& command, provider::ExecutionResult& result) {
        auto words = ShellWords(command);
        if (words.empty()) {
            return false;
        }

        if (words[0] == "mkdir" && words.size() >= 3 && words[1] == "-p") {
            result = {"", mkdir_exit_code};
            return true;
        }
        if (words[0] == "rm" && words.size() == 3 && words[1] == "-f") {
            files.erase(words[2]);
            result = {"", 0};
            return true;
        }
        if (words[0] == "unzip" && words.size() >= 7) {
            // unzip -o -q <archive> -d <dest> && rm -f <archive>
            const auto& archive_path = words[3];
            const auto& destination = words[5];
            auto it = files.find(archive_path);
            if (unzip_exit_code != 0 || it == files.end()) {
                result = {"unzip: cannot extract", unzip_exit_code != 0 ? unzip_exit_code : 9};
                return true;
            }
            auto entries = UnpackZip(it->second);
            if (entries.empty()) {
                result = {"warning [" + archive_path + "]:  zipfile is empty", 1};
                return true;
            }
            for (const auto& entry : entries) {
                const auto& name = entry.first;
                if (!name.empty() && name.back() == '/') {
                    directories.insert(destination + "/" + name.substr(0, name.size() - 1));
                } else {
                    files[destination + "/" + name] = entry.second;
                }
            }
            files.erase(archive_path);
            result = {"", 0};
            return true;
        }
        if (words[0] == "ls" && words.size() <= 2) {
            std::string output;
            for (const auto& name : ListDirectory(words.size() == 2 ? words[1] : "/workspace")) {
                output += name + "\n";
            }
            result = {output, 0};
            return true;
        }
        return false;
    }
};

} // namespace testing
} // namespace runbox
