#pragma once

#include <string>

namespace hpipe {
namespace client {

// http://host[:port]/<path> split for httplib::Client
struct PipeUrl {
    std::string base;  // "http://host:port"
    std::string path;  // "/<path>"
};

// Only plain http is accepted; TLS belongs to a fronting proxy
bool parse_pipe_url(const std::string &url, PipeUrl &out, std::string &error);

}  // namespace client
}  // namespace hpipe
