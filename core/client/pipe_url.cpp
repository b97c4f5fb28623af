#include "pipe_url.hpp"

namespace hpipe {
namespace client {

bool parse_pipe_url(const std::string &url, PipeUrl &out, std::string &error) {
    const std::string scheme = "http://";
    if (url.compare(0, scheme.size(), scheme) != 0) {
        if (url.compare(0, 8, "https://") == 0) {
            error = "https is not supported (terminate TLS in a proxy): " + url;
        } else {
            error = "URL must start with http://: " + url;
        }
        return false;
    }

    size_t slash = url.find('/', scheme.size());
    if (slash == std::string::npos || slash == scheme.size()) {
        error = "URL has no pipe path: " + url;
        return false;
    }

    std::string path = url.substr(slash);
    size_t query = path.find_first_of("?#");
    if (query != std::string::npos) {
        path.erase(query);
    }

    if (path.size() < 2 || path.find('/', 1) != std::string::npos) {
        error = "Pipe path must be a single non-empty segment: " + path;
        return false;
    }

    out.base = url.substr(0, slash);
    out.path = path;
    return true;
}

}  // namespace client
}  // namespace hpipe
