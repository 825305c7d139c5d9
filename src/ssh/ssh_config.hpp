#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <istream>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct ProxySettings;

// Options gathered for one host from an ssh_config(5) file.
// Keys are lower-cased keywords; the first value seen wins.
struct SshHostOptions {
    std::map<std::string, std::string> values;
    std::vector<std::string> identity_files;   // every IdentityFile, in file order

    std::optional<std::string> get(const std::string& keyword) const;
};

// Parsed ~/.ssh/config. Supports Host blocks with glob and negated
// patterns; Match blocks are skipped; Include is not followed.
class SshConfigFile {
public:
    SshConfigFile() = default;

    static SshConfigFile parse(std::istream& in);

    // Missing file is not an error: returns an empty config.
    static Result<SshConfigFile> load(const fs::path& path);

    SshHostOptions lookup(const std::string& host) const;

    bool empty() const { return blocks_.empty(); }

private:
    struct Block {
        std::vector<std::string> patterns;
        bool is_match = false;
        std::vector<std::pair<std::string, std::string>> entries;
    };

    std::vector<Block> blocks_;
};

// True if host matches the pattern list of a Host line: at least one
// positive pattern matches and no !pattern does.
bool host_patterns_match(const std::vector<std::string>& patterns, const std::string& host);

fs::path default_ssh_config_path();

// Builds a ConnectionSpec from an alias or from explicit fields.
class SshConfigResolver {
public:
    explicit SshConfigResolver(fs::path config_path = default_ssh_config_path());

    Result<ConnectionSpec> resolve_alias(const std::string& alias) const;

    Result<ConnectionSpec> resolve_explicit(const std::string& hostname,
                                            const std::string& username,
                                            const std::optional<std::string>& key_path,
                                            int port = 22) const;

    // Alias when settings carry one, explicit fields otherwise.
    Result<ConnectionSpec> resolve(const ProxySettings& settings) const;

private:
    fs::path config_path_;
};
