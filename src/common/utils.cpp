#include "common/utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <sys/wait.h>
#include <unistd.h>
#include <openssl/evp.h>

namespace utils {

std::string toLower(const std::string& str) {
    std::string result(str);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char c) {
        return c < 0x80 ? static_cast<char>(std::tolower(c)) : static_cast<char>(c);
    });
    return result;
}

bool equalsIgnoreCase(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) {
        return false;
    }
    return toLower(a) == toLower(b);
}

std::string sanitizeName(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (unsigned char c : name) {
        if (std::isalnum(c) || c == '.' || c == '_' || c == '-') {
            result.push_back(static_cast<char>(c));
        } else {
            result.push_back('_');
        }
    }
    return result;
}

bool splitRemotePath(const std::string& path, std::string& host, std::string& remotePath) {
    if (path.size() > 2 && (path.compare(0, 2, "//") == 0 || path.compare(0, 2, "\\\\") == 0)) {
        size_t sep = path.find_first_of("/\\", 2);
        host = path.substr(2, sep == std::string::npos ? std::string::npos : sep - 2);
        remotePath = sep == std::string::npos ? "/" : path.substr(sep);
        std::replace(remotePath.begin(), remotePath.end(), '\\', '/');
        return !host.empty();
    }

    // scp-style "host:/path"; a single letter before the colon is a drive
    size_t colon = path.find(':');
    if (colon != std::string::npos && colon > 1 && colon + 1 < path.size() && path[colon + 1] == '/'
        && path.find('/') > colon) {
        host = path.substr(0, colon);
        remotePath = path.substr(colon + 1);
        return true;
    }
    return false;
}

static std::string decodeMountField(const std::string& field) {
    // /proc/mounts escapes spaces and tabs as octal sequences
    std::string result;
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size()) {
            std::string octal = field.substr(i + 1, 3);
            if (std::all_of(octal.begin(), octal.end(), [](char c) { return c >= '0' && c <= '7'; })) {
                result.push_back(static_cast<char>(std::stoi(octal, nullptr, 8)));
                i += 3;
                continue;
            }
        }
        result.push_back(field[i]);
    }
    return result;
}

std::string volumeForPath(const std::string& path) {
    if (path.size() >= 2 && std::isalpha(static_cast<unsigned char>(path[0])) && path[1] == ':') {
        return std::string(1, static_cast<char>(std::toupper(static_cast<unsigned char>(path[0])))) + ":";
    }

    std::string host;
    std::string remotePath;
    if (splitRemotePath(path, host, remotePath)) {
        std::filesystem::path remote(remotePath);
        auto it = remote.begin();
        std::string first;
        if (it != remote.end() && it->string() == "/") {
            ++it;
        }
        if (it != remote.end()) {
            first = it->string();
        }
        return host + ":/" + first;
    }

    std::string device;
    std::string mountPoint;
    if (!findMountForPath(path, device, mountPoint)) {
        return "/";
    }
    if (device.compare(0, 5, "/dev/") == 0) {
        return device;
    }
    return mountPoint;
}

bool findMountForPath(const std::string& path, std::string& device, std::string& mountPoint) {
    std::error_code ec;
    std::filesystem::path canonical = std::filesystem::weakly_canonical(path, ec);
    std::string target = ec ? path : canonical.string();

    std::ifstream mounts("/proc/mounts");
    std::string bestDevice;
    std::string bestMount;
    std::string line;
    while (std::getline(mounts, line)) {
        std::istringstream fields(line);
        std::string entryDevice;
        std::string entryMount;
        if (!(fields >> entryDevice >> entryMount)) {
            continue;
        }
        entryMount = decodeMountField(entryMount);
        if (!isPathWithin(target, entryMount)) {
            continue;
        }
        if (entryMount.size() >= bestMount.size()) {
            bestMount = entryMount;
            bestDevice = decodeMountField(entryDevice);
        }
    }

    if (bestMount.empty()) {
        return false;
    }
    device = bestDevice;
    mountPoint = bestMount;
    return true;
}

bool isPathWithin(const std::string& child, const std::string& parent) {
    std::filesystem::path childPath = std::filesystem::path(child).lexically_normal();
    std::filesystem::path parentPath = std::filesystem::path(parent).lexically_normal();

    auto childIt = childPath.begin();
    for (auto parentIt = parentPath.begin(); parentIt != parentPath.end(); ++parentIt) {
        if (parentIt->empty()) {
            // trailing separator
            continue;
        }
        if (childIt == childPath.end() || !equalsIgnoreCase(childIt->string(), parentIt->string())) {
            return false;
        }
        ++childIt;
    }
    return true;
}

std::string formatIso8601(std::chrono::system_clock::time_point time) {
    auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(time);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(time - seconds).count();
    std::time_t tt = std::chrono::system_clock::to_time_t(seconds);
    std::tm utcTm{};
    gmtime_r(&tt, &utcTm);

    std::stringstream ss;
    ss << std::put_time(&utcTm, "%Y-%m-%dT%H:%M:%S")
       << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return ss.str();
}

bool parseIso8601(const std::string& text, std::chrono::system_clock::time_point& time) {
    std::tm utcTm{};
    std::istringstream ss(text);
    ss >> std::get_time(&utcTm, "%Y-%m-%dT%H:%M:%S");
    if (ss.fail()) {
        return false;
    }

    long millis = 0;
    if (ss.peek() == '.') {
        ss.get();
        std::string fraction;
        while (std::isdigit(ss.peek())) {
            fraction.push_back(static_cast<char>(ss.get()));
        }
        fraction = (fraction + "000").substr(0, 3);
        millis = std::stol(fraction);
    }

    time = std::chrono::system_clock::from_time_t(timegm(&utcTm)) + std::chrono::milliseconds(millis);
    return true;
}

bool writeFileAtomically(const std::string& path, const std::string& content, std::string& error) {
    std::filesystem::path target(path);
    std::string tempPath = path + ".tmp." + std::to_string(::getpid());

    try {
        if (target.has_parent_path()) {
            std::filesystem::create_directories(target.parent_path());
        }

        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file.is_open()) {
                error = "cannot open " + tempPath;
                return false;
            }
            file << content;
            file.flush();
            if (!file.good()) {
                error = "short write to " + tempPath;
                file.close();
                std::error_code ec;
                std::filesystem::remove(tempPath, ec);
                return false;
            }
        }

        std::filesystem::rename(tempPath, target);
        return true;
    } catch (const std::exception& e) {
        error = e.what();
        std::error_code ec;
        std::filesystem::remove(tempPath, ec);
        return false;
    }
}

std::string sha256Hex(const std::string& data) {
    EVP_MD_CTX* ctx = EVP_MD_CTX_new();
    if (!ctx) {
        return "";
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestInit_ex(ctx, EVP_sha256(), nullptr) != 1
        || EVP_DigestUpdate(ctx, data.data(), data.size()) != 1
        || EVP_DigestFinal_ex(ctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(ctx);
        return "";
    }
    EVP_MD_CTX_free(ctx);

    std::stringstream ss;
    for (unsigned int i = 0; i < hashLen; i++) {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(hash[i]);
    }
    return ss.str();
}

std::string shellQuote(const std::string& arg) {
    std::string quoted = "'";
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted.push_back(c);
        }
    }
    quoted += "'";
    return quoted;
}

int runCommand(const std::string& command, std::string& output) {
    output.clear();
    FILE* pipe = popen(command.c_str(), "r");
    if (!pipe) {
        return -1;
    }

    char buffer[256];
    while (fgets(buffer, sizeof(buffer), pipe)) {
        output += buffer;
    }

    int status = pclose(pipe);
    if (status == -1) {
        return -1;
    }
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

} // namespace utils
