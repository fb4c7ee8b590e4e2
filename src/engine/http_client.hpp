#pragma once

#include <string>
#include <vector>

namespace plover::engine::http {

    struct Response {
        long status = 0;
        std::string body;
    };

    /**
     * @brief POSTs a JSON body and returns the raw response.
     * @throws EmbeddingError if the transfer itself fails.
     */
    Response post_json(const std::string& url, const std::string& body,
                       const std::vector<std::string>& headers = {});

}
