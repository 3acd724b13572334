#pragma once
#include <string>
#include <vector>

struct HttpResponse {
    long status{0};
    std::string body;
};

// Throws ConnectionError when the transfer itself fails; any HTTP status is returned to the caller.
HttpResponse http_post_json(const std::string& url, const std::string& json_body, long timeout_ms = 30000,
                            const std::vector<std::string>& extra_headers = {});
