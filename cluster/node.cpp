#include "node.hpp"
#include <cctype>
#include <algorithm>

Node::Node(const std::string& host, int port)
    : id(host + ":" + std::to_string(port)), host(host), port(port) {
}

std::optional<Node> Node::fromAddress(const std::string& address) {
    size_t colon_pos = address.rfind(':');
    if (colon_pos == std::string::npos || colon_pos == 0 || colon_pos + 1 >= address.size()) {
        return std::nullopt;
    }

    std::string host = address.substr(0, colon_pos);
    std::string port_str = address.substr(colon_pos + 1);
    if (port_str.size() > 5 ||
        !std::all_of(port_str.begin(), port_str.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }

    int port = std::stoi(port_str);
    if (port <= 0 || port > 65535) {
        return std::nullopt;
    }

    return Node(host, port);
}
