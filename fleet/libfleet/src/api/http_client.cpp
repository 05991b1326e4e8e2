/**
 * Copyright (c) 2024-2025 fleetctl authors. All rights reserved.
 * Distributed under the MIT license (https://opensource.org/licenses/MIT)
 **/
/**
 * @file http_client.cpp
 * @brief Blocking HTTP(S) requests over libcurl
 **/

#include "api/http_client.hpp"

#include "common/utils.hpp"

namespace fleet
{

#define MAX_LOGGED_BODY_SIZE (512)
#define FLEET_USER_AGENT ("fleetctl/" FLEET_VERSION_STRING)

namespace
{

/* curl_global_init() is not thread safe, it runs once before the first client exists */
class CurlGlobal final
{
public:
    static CURLcode init()
    {
        static CurlGlobal instance;
        return instance.m_init_code;
    }

    ~CurlGlobal()
    {
        if (CURLE_OK == m_init_code) {
            curl_global_cleanup();
        }
    }

private:
    CurlGlobal() : m_init_code(curl_global_init(CURL_GLOBAL_DEFAULT)) {}

    CURLcode m_init_code;
};

struct CurlEasyDeleter {
    void operator()(CURL *curl) const { curl_easy_cleanup(curl); }
};
struct CurlSlistDeleter {
    void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

size_t write_callback(char *data, size_t size, size_t count, void *user_data)
{
    auto body = static_cast<std::string*>(user_data);
    body->append(data, size * count);
    return size * count;
}

std::string truncate_for_log(const std::string &body)
{
    if (body.size() <= MAX_LOGGED_BODY_SIZE) {
        return body;
    }
    return body.substr(0, MAX_LOGGED_BODY_SIZE) + "...";
}

} /* namespace */

Expected<std::shared_ptr<HttpClient>> HttpClient::create(const ApiConfig &config)
{
    CHECK_AS_EXPECTED(!config.base_url.empty(), FLEET_INVALID_ARGUMENT, "Base url must not be empty");

    const auto init_code = CurlGlobal::init();
    CHECK_AS_EXPECTED(CURLE_OK == init_code, FLEET_COMMUNICATION_FAILURE, "curl_global_init failed: {}",
        curl_easy_strerror(init_code));

    auto client = make_shared_nothrow<HttpClient>(config);
    CHECK_NOT_NULL_AS_EXPECTED(client, FLEET_OUT_OF_HOST_MEMORY);
    return client;
}

HttpClient::HttpClient(const ApiConfig &config) :
    m_config(config)
{
    while (!m_config.base_url.empty() && ('/' == m_config.base_url.back())) {
        m_config.base_url.pop_back();
    }
}

std::string HttpClient::url(const std::string &path) const
{
    return m_config.base_url + path;
}

fleet_status HttpClient::status_from_http_code(long http_code)
{
    if ((200 <= http_code) && (http_code < 300)) {
        return FLEET_SUCCESS;
    }

    switch (http_code) {
    case 401:
    case 403:
        return FLEET_UNAUTHORIZED;
    case 404:
        return FLEET_NOT_FOUND;
    case 408:
    case 429:
        return FLEET_SERVER_UNAVAILABLE;
    case 409:
    case 422:
        return FLEET_CONFLICT;
    default:
        break;
    }

    if (500 <= http_code) {
        return FLEET_SERVER_UNAVAILABLE;
    }
    if (400 <= http_code) {
        return FLEET_INVALID_REQUEST;
    }
    return FLEET_INVALID_RESPONSE;
}

fleet_status HttpClient::status_from_curl_code(CURLcode curl_code)
{
    switch (curl_code) {
    case CURLE_OK:
        return FLEET_SUCCESS;
    case CURLE_OPERATION_TIMEDOUT:
        return FLEET_TIMEOUT;
    case CURLE_OUT_OF_MEMORY:
        return FLEET_OUT_OF_HOST_MEMORY;
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
        return FLEET_INVALID_CONFIG;
    default:
        return FLEET_COMMUNICATION_FAILURE;
    }
}

Expected<HttpResponse> HttpClient::perform(const HttpRequest &request)
{
    CurlEasyPtr curl(curl_easy_init());
    CHECK_NOT_NULL_AS_EXPECTED(curl, FLEET_OUT_OF_HOST_MEMORY);

    curl_slist *raw_headers = nullptr;
    std::vector<std::string> headers = request.headers;
    if (request.with_api_key) {
        headers.emplace_back("Authorization: Bearer " + m_config.api_key);
    }
    for (const auto &header : headers) {
        auto appended = curl_slist_append(raw_headers, header.c_str());
        if (nullptr == appended) {
            curl_slist_free_all(raw_headers);
            LOGGER__ERROR("curl_slist_append failed");
            return make_unexpected(FLEET_OUT_OF_HOST_MEMORY);
        }
        raw_headers = appended;
    }
    CurlSlistPtr header_list(raw_headers);

    HttpResponse response{};
    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, FLEET_USER_AGENT);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(m_config.request_timeout.count()));
    // Signals must stay with the CLI, which uses SIGINT for cancellation
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    if (!m_config.ca_path.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_CAINFO, m_config.ca_path.c_str());
    }
    if (!request.body.empty()) {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(request.body.size()));
    }

    const auto curl_code = curl_easy_perform(curl.get());
    if (CURLE_OK != curl_code) {
        LOGGER__WARNING("{} {} failed: {}", request.method, request.url, curl_easy_strerror(curl_code));
        return make_unexpected(status_from_curl_code(curl_code));
    }

    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status_code);
    const auto status = status_from_http_code(response.status_code);
    if (FLEET_SUCCESS != status) {
        LOGGER__WARNING("{} {} answered {}: {}", request.method, request.url, response.status_code,
            truncate_for_log(response.body));
        return make_unexpected(status);
    }

    LOGGER__TRACE("{} {} answered {}", request.method, request.url, response.status_code);
    return response;
}

} /* namespace fleet */
