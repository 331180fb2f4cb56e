#include "SsdpDiscovery.h"
#include "../core/CommandRunner.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>

namespace lan_scan {

namespace {
const char* kGroup = "239.255.255.250";
const uint16_t kPort = 1900;

class Socket {
public:
    Socket(): fd_(::socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_UDP)) {}
    ~Socket(){ if(fd_ >= 0) ::close(fd_); }
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;
    int fd() const { return fd_; }
private:
    int fd_;
};
}

const char* SsdpSource::search_request() {
    return "M-SEARCH * HTTP/1.1\r\n"
           "HOST: 239.255.255.250:1900\r\n"
           "MAN: \"ssdp:discover\"\r\n"
           "MX: 2\r\n"
           "ST: ssdp:all\r\n\r\n";
}

std::map<std::string, std::string> SsdpSource::parse_response(const std::string& packet) {
    std::map<std::string, std::string> headers;
    if(packet.empty()) return headers;
    size_t pos = 0; bool first = true;
    while(pos <= packet.size()){
        size_t end = packet.find("\r\n", pos);
        std::string line = packet.substr(pos, end == std::string::npos ? std::string::npos : end - pos);
        if(first){
            headers["_status"] = utils::trim(line);
            first = false;
        } else if(!line.empty()){
            auto colon = line.find(':');
            if(colon != std::string::npos){
                headers[utils::to_upper(utils::trim(line.substr(0, colon)))] = utils::trim(line.substr(colon + 1));
            }
        }
        if(end == std::string::npos) break;
        pos = end + 2;
    }
    return headers;
}

std::string SsdpSource::display_name(const std::map<std::string, std::string>& headers, const std::string& ip) {
    for(const char* key : {"SERVER", "ST", "USN"}){
        auto it = headers.find(key);
        if(it != headers.end() && !it->second.empty()) return it->second;
    }
    return ip;
}

void SsdpSource::add_reply(std::vector<DeviceRecord>& devices, const std::string& ip, const std::string& packet) {
    if(ip.empty()) return;
    auto headers = parse_response(packet);
    if(headers.empty()) return;
    DeviceRecord d;
    d.ip = ip;
    d.name = display_name(headers, ip);
    d.status = DeviceStatus::Online;
    d.type = "ssdp";
    for(auto& existing : devices){
        if(existing.ip == ip){ existing = std::move(d); return; }
    }
    devices.push_back(std::move(d));
}

std::vector<DeviceRecord> SsdpSource::collect() {
    Socket sock;
    if(sock.fd() < 0) throw std::runtime_error(std::string("ssdp socket: ") + std::strerror(errno));
    unsigned char ttl = 2;
    setsockopt(sock.fd(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

    sockaddr_in group{};
    group.sin_family = AF_INET;
    group.sin_port = htons(kPort);
    inet_pton(AF_INET, kGroup, &group.sin_addr);

    const char* msg = search_request();
    size_t sent_ok = 0;
    // Sent twice: a single datagram is easily lost on busy or multi-homed hosts.
    for(int i=0; i<2; ++i){
        if(sendto(sock.fd(), msg, std::strlen(msg), 0, reinterpret_cast<sockaddr*>(&group), sizeof(group)) >= 0) ++sent_ok;
    }
    if(sent_ok == 0) throw std::runtime_error(std::string("ssdp send failed: ") + std::strerror(errno));

    std::vector<DeviceRecord> devices;
    auto deadline = std::chrono::steady_clock::now() + seconds_to_ms(timeout_sec_);
    char buf[65535];
    while(true){
        auto now = std::chrono::steady_clock::now();
        if(now >= deadline) break;
        int wait_ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count());
        pollfd pfd{sock.fd(), POLLIN, 0};
        int rc = poll(&pfd, 1, wait_ms);
        if(rc < 0 && errno == EINTR) continue;
        if(rc <= 0) break;
        sockaddr_in from{}; socklen_t fromlen = sizeof(from);
        ssize_t got = recvfrom(sock.fd(), buf, sizeof(buf), 0, reinterpret_cast<sockaddr*>(&from), &fromlen);
        if(got < 0){
            if(errno == EINTR) continue;
            break;
        }
        char ipbuf[INET_ADDRSTRLEN];
        if(!inet_ntop(AF_INET, &from.sin_addr, ipbuf, sizeof(ipbuf))) continue;
        add_reply(devices, ipbuf, std::string(buf, static_cast<size_t>(got)));
    }
    Logger::instance().debug("ssdp: " + std::to_string(devices.size()) + " responders");
    return devices;
}

}
