#pragma once

#include "directory/idirectory_connection.hpp"

#include <algorithm>
#include <cstddef>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dirauth::testing {

/**
 * @brief Scripted directory shared by a connector and its connections
 *
 * Records every call in order so tests can assert on sequencing
 * (e.g. bind before StartTLS).
 */
struct MockDirectory {
    std::map<std::string, std::string> simple_accounts;   // bind DN -> password
    std::map<std::string, std::string> sasl_accounts;     // authcid -> password
    std::vector<DirectoryEntry> entries;                  // returned by search()

    bool connect_fails = false;
    bool server_unreachable = false;   // binds fail with TRANSPORT_FAILURE
    bool search_times_out = false;
    bool start_tls_fails = false;

    mutable std::mutex mutex;
    std::vector<std::string> calls;
    std::vector<SearchRequest> searches;
    std::vector<TransportOptions> connects;
    int open_connections = 0;

    void record(std::string call) {
        std::lock_guard<std::mutex> lock(mutex);
        calls.push_back(std::move(call));
    }

    [[nodiscard]] std::vector<std::string> call_log() const {
        std::lock_guard<std::mutex> lock(mutex);
        return calls;
    }

    [[nodiscard]] size_t count_calls(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(mutex);
        return static_cast<size_t>(std::count_if(calls.begin(), calls.end(),
            [&](const std::string& c) { return c.rfind(prefix, 0) == 0; }));
    }

    [[nodiscard]] ptrdiff_t index_of(const std::string& prefix) const {
        std::lock_guard<std::mutex> lock(mutex);
        for (size_t i = 0; i < calls.size(); ++i) {
            if (calls[i].rfind(prefix, 0) == 0) return static_cast<ptrdiff_t>(i);
        }
        return -1;
    }

    void add_person(const std::string& dn,
                    const std::string& username_attribute,
                    const std::string& username,
                    const std::string& display_name,
                    std::vector<std::string> groups = {}) {
        DirectoryEntry entry;
        entry.dn = dn;
        entry.attributes[username_attribute] = {username};
        entry.attributes["displayName"] = {display_name};
        if (!groups.empty()) {
            entry.attributes["memberOf"] = std::move(groups);
        }
        entries.push_back(std::move(entry));
    }
};

class MockDirectoryConnection : public IDirectoryConnection {
public:
    explicit MockDirectoryConnection(std::shared_ptr<MockDirectory> dir)
        : dir_(std::move(dir)) {}

    ~MockDirectoryConnection() override {
        dir_->record("unbind");
        std::lock_guard<std::mutex> lock(dir_->mutex);
        --dir_->open_connections;
    }

    [[nodiscard]] Status simple_bind(const std::string& dn, const std::string& password) override {
        dir_->record("simple_bind " + dn);
        if (dir_->server_unreachable) {
            return Status::error(AuthFailure::TRANSPORT_FAILURE, "mock: server down");
        }
        const auto it = dir_->simple_accounts.find(dn);
        if (it == dir_->simple_accounts.end() || it->second != password) {
            return Status::error(AuthFailure::BIND_FAILURE,
                std::format("mock: invalid credentials for '{}'", dn));
        }
        return Status::ok();
    }

    [[nodiscard]] Status sasl_bind(const std::string& mechanism,
                                   const std::string& authcid,
                                   const std::string& password) override {
        dir_->record("sasl_bind " + mechanism + " " + authcid);
        if (dir_->server_unreachable) {
            return Status::error(AuthFailure::TRANSPORT_FAILURE, "mock: server down");
        }
        const auto it = dir_->sasl_accounts.find(authcid);
        if (it == dir_->sasl_accounts.end() || it->second != password) {
            return Status::error(AuthFailure::BIND_FAILURE,
                std::format("mock: invalid credentials for '{}'", authcid));
        }
        return Status::ok();
    }

    [[nodiscard]] Status start_tls() override {
        dir_->record("start_tls");
        if (dir_->start_tls_fails) {
            return Status::error(AuthFailure::TRANSPORT_FAILURE, "mock: TLS negotiation failed");
        }
        return Status::ok();
    }

    [[nodiscard]] Result<std::vector<DirectoryEntry>> search(const SearchRequest& request) override {
        dir_->record("search " + request.filter);
        {
            std::lock_guard<std::mutex> lock(dir_->mutex);
            dir_->searches.push_back(request);
        }
        if (dir_->search_times_out) {
            return Result<std::vector<DirectoryEntry>>::error(
                AuthFailure::DIRECTORY_QUERY_FAILURE, "mock: search timed out");
        }
        std::vector<DirectoryEntry> result = dir_->entries;
        if (request.size_limit > 0 && result.size() > static_cast<size_t>(request.size_limit)) {
            result.resize(static_cast<size_t>(request.size_limit));
        }
        return Result<std::vector<DirectoryEntry>>::ok(std::move(result));
    }

    [[nodiscard]] std::string describe() const override { return "mock://directory"; }

private:
    std::shared_ptr<MockDirectory> dir_;
};

class MockDirectoryConnector : public IDirectoryConnector {
public:
    explicit MockDirectoryConnector(std::shared_ptr<MockDirectory> dir)
        : dir_(std::move(dir)) {}

    [[nodiscard]] Result<std::unique_ptr<IDirectoryConnection>> connect(
        const TransportOptions& options) override {
        dir_->record("connect " + options.uri);
        {
            std::lock_guard<std::mutex> lock(dir_->mutex);
            dir_->connects.push_back(options);
        }
        if (dir_->connect_fails) {
            return Result<std::unique_ptr<IDirectoryConnection>>::error(
                AuthFailure::TRANSPORT_FAILURE, "mock: name resolution failed");
        }
        {
            std::lock_guard<std::mutex> lock(dir_->mutex);
            ++dir_->open_connections;
        }
        return Result<std::unique_ptr<IDirectoryConnection>>::ok(
            std::make_unique<MockDirectoryConnection>(dir_));
    }

private:
    std::shared_ptr<MockDirectory> dir_;
};

} // namespace dirauth::testing
