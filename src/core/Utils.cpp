#include "Utils.h"
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <unistd.h>
#include <sys/stat.h>

namespace lan_scan {
namespace utils {

std::vector<std::string> read_lines(const std::string& path){
    std::vector<std::string> out;
    std::ifstream f(path);
    if(!f) return out;
    std::string line;
    while(std::getline(f, line)) out.push_back(line);
    return out;
}

std::optional<std::string> read_file(const std::string& path, size_t max_bytes){
    std::ifstream f(path, std::ios::binary);
    if(!f) return std::nullopt;
    std::string out; out.reserve(4096);
    char buf[8192];
    while(f && out.size() < max_bytes){
        f.read(buf, static_cast<std::streamsize>(std::min(sizeof(buf), max_bytes - out.size())));
        std::streamsize got = f.gcount();
        if(got <= 0) break;
        out.append(buf, static_cast<size_t>(got));
    }
    return out;
}

std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while(b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while(e > b && std::isspace(static_cast<unsigned char>(s[e-1]))) --e;
    return s.substr(b, e-b);
}

std::vector<std::string> split_ws(const std::string& s){
    std::vector<std::string> out; std::istringstream iss(s); std::string tok;
    while(iss >> tok) out.push_back(tok);
    return out;
}

std::vector<std::string> split(const std::string& s, char delim){
    std::vector<std::string> out; std::string cur;
    for(char c : s){ if(c==delim){ out.push_back(cur); cur.clear(); } else cur.push_back(c); }
    out.push_back(cur);
    return out;
}

std::vector<std::string> split_csv(const std::string& s){
    std::vector<std::string> out; std::string cur; for(char c: s){ if(c==','){ if(!cur.empty()) out.push_back(cur); cur.clear(); } else cur.push_back(c);} if(!cur.empty()) out.push_back(cur); return out; }

std::string to_upper(std::string s){ std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::toupper(c)); }); return s; }
std::string to_lower(std::string s){ std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return static_cast<char>(std::tolower(c)); }); return s; }

bool starts_with(const std::string& s, const std::string& prefix){ return s.rfind(prefix, 0) == 0; }

static bool is_executable_file(const std::string& p){
    struct stat st{};
    if(stat(p.c_str(), &st) != 0) return false;
    if(!S_ISREG(st.st_mode)) return false;
    return access(p.c_str(), X_OK) == 0;
}

std::optional<std::string> find_in_path(const std::string& name){
    if(name.empty()) return std::nullopt;
    if(name.find('/') != std::string::npos){
        if(is_executable_file(name)) return name;
        return std::nullopt;
    }
    std::string path;
    if(const char* env = std::getenv("PATH")) path = env;
    if(!path.empty()) path += ':';
    path += "/usr/local/sbin:/usr/local/bin:/usr/sbin:/usr/bin:/sbin:/bin";
    for(const auto& dir : split(path, ':')){
        if(dir.empty()) continue;
        std::string candidate = dir + "/" + name;
        if(is_executable_file(candidate)) return candidate;
    }
    return std::nullopt;
}

std::string time_to_iso(std::chrono::system_clock::time_point tp){
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    gmtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

}
}
