// ==============================================================================
// curl_transport.cpp - HTTP GET через libcurl
// ==============================================================================

#include <auditview/geo.hpp>
#include <curl/curl.h>
#include <memory>
#include <mutex>

namespace auditview::geo {

namespace {

std::once_flag g_curl_init;

struct CurlDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

using CurlHandle = std::unique_ptr<CURL, CurlDeleter>;

std::size_t write_body(char* data, std::size_t size, std::size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(data, size * nmemb);
    return size * nmemb;
}

}  // anonymous namespace

CurlTransport::CurlTransport(long timeout_ms) : timeout_ms_(timeout_ms) {
    std::call_once(g_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResult CurlTransport::get(const std::string& url) {
    HttpResult result;

    CurlHandle handle(curl_easy_init());
    if (!handle) {
        result.error = "curl_easy_init failed";
        return result;
    }

    char errbuf[CURL_ERROR_SIZE] = {0};
    curl_easy_setopt(handle.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle.get(), CURLOPT_WRITEFUNCTION, &write_body);
    curl_easy_setopt(handle.get(), CURLOPT_WRITEDATA, &result.response.body);
    curl_easy_setopt(handle.get(), CURLOPT_ERRORBUFFER, errbuf);
    curl_easy_setopt(handle.get(), CURLOPT_USERAGENT, "auditview");
    curl_easy_setopt(handle.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.get(), CURLOPT_NOSIGNAL, 1L);
    if (timeout_ms_ > 0) {
        curl_easy_setopt(handle.get(), CURLOPT_TIMEOUT_MS, timeout_ms_);
    }

    CURLcode code = curl_easy_perform(handle.get());
    if (code != CURLE_OK) {
        result.error = errbuf[0] != '\0' ? std::string(errbuf) : curl_easy_strerror(code);
        return result;
    }

    curl_easy_getinfo(handle.get(), CURLINFO_RESPONSE_CODE, &result.response.status);
    result.ok = true;
    return result;
}

}  // namespace auditview::geo
