#include "NameResolver.h"
#include "Utils.h"
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <climits>
#include <cstring>

namespace lan_scan {

std::optional<std::string> SystemNameResolver::reverse_lookup(const std::string& ip) const {
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    if(inet_pton(AF_INET, ip.c_str(), &sa.sin_addr) != 1) return std::nullopt;
    char host[NI_MAXHOST];
    int rc = getnameinfo(reinterpret_cast<sockaddr*>(&sa), sizeof(sa), host, sizeof(host), nullptr, 0, NI_NAMEREQD);
    if(rc != 0 || host[0] == '\0') return std::nullopt;
    return std::string(host);
}

std::optional<std::string> SystemNameResolver::local_address() const {
    char name[HOST_NAME_MAX + 1] = {};
    if(gethostname(name, sizeof(name) - 1) != 0 || name[0] == '\0') return std::nullopt;
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    if(getaddrinfo(name, nullptr, &hints, &res) != 0 || !res) return std::nullopt;
    std::optional<std::string> out;
    char buf[INET_ADDRSTRLEN];
    auto* sin = reinterpret_cast<sockaddr_in*>(res->ai_addr);
    if(inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf))) out = std::string(buf);
    freeaddrinfo(res);
    if(out && utils::starts_with(*out, "127.")) return std::nullopt;
    return out;
}

}
