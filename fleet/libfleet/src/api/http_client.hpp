/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file http_client.hpp
 * @brief Blocking HTTP(S) requests over libcurl
 **/

#ifndef _FLEET_HTTP_CLIENT_HPP_
#define _FLEET_HTTP_CLIENT_HPP_

#include "fleet/fleet.h"
#include "fleet/expected.hpp"
#include "fleet/buffer.hpp"
#include "fleet/admin_api.hpp"

#include <curl/curl.h>

#include <memory>
#include <string>
#include <vector>

namespace fleet
{

struct HttpRequest {
    std::string method;
    // Absolute URL
    std::string url;
    std::vector<std::string> headers;
    MemoryView body;
    // Presigned storage URLs must not receive the api key
    bool with_api_key = true;
};

struct HttpResponse {
    long status_code = 0;
    std::string body;
};

/*
 * Every request uses its own curl easy handle, so a single client may be shared by all upload workers.
 */
class HttpClient final
{
public:
    static Expected<std::shared_ptr<HttpClient>> create(const ApiConfig &config);

    explicit HttpClient(const ApiConfig &config);

    /**
     * Performs @a request and returns the response when its HTTP status is 2xx. Other answers and transport
     * failures are mapped to statuses by status_from_http_code() and status_from_curl_code().
     */
    Expected<HttpResponse> perform(const HttpRequest &request);

    // Joins @a path (starting with '/') to the configured base url
    std::string url(const std::string &path) const;

    static fleet_status status_from_http_code(long http_code);
    static fleet_status status_from_curl_code(CURLcode curl_code);

private:
    ApiConfig m_config;
};

} /* namespace fleet */

#endif /* _FLEET_HTTP_CLIENT_HPP_ */
